/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * Licensed under the Apache License Version 2.0 with LLVM Exceptions
 * (the "License"); you may not use this file except in compliance with
 * the License. You may obtain a copy of the License at
 *
 *   https://llvm.org/LICENSE.txt
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#pragma once

#include <cstddef>
#include <memory>

namespace unipoll_test {

// Tracks how many allocations are outstanding in *live.
template <typename T>
struct counting_allocator {
  using value_type = T;

  explicit counting_allocator(int* counter) noexcept : live(counter) {}

  template <typename U>
  counting_allocator(const counting_allocator<U>& other) noexcept
    : live(other.live) {}

  T* allocate(std::size_t n) {
    ++*live;
    return std::allocator<T>{}.allocate(n);
  }

  void deallocate(T* p, std::size_t n) noexcept {
    --*live;
    std::allocator<T>{}.deallocate(p, n);
  }

  friend bool
  operator==(const counting_allocator& a, const counting_allocator& b) noexcept {
    return a.live == b.live;
  }
  friend bool
  operator!=(const counting_allocator& a, const counting_allocator& b) noexcept {
    return a.live != b.live;
  }

  int* live;
};

} // namespace unipoll_test
