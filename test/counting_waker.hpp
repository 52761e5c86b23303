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

#include <unipoll/waker.hpp>

#include <atomic>
#include <memory>

namespace unipoll_test {

// A wake target that records how it was woken.
struct counting_wake_target {
  std::atomic<int> wakes{0};
  std::atomic<int> localWakes{0};

  void wake() noexcept { ++wakes; }
  void wake_local() noexcept { ++localWakes; }

  int total() const noexcept { return wakes.load() + localWakes.load(); }
};

struct counting_waker {
  std::shared_ptr<counting_wake_target> target =
      std::make_shared<counting_wake_target>();
  unipoll::local_waker localWaker =
      unipoll::local_waker_from_shared(target);

  // Number of waker handles alive, localWaker included.
  long live_handles() const noexcept { return target.use_count() - 1; }
};

} // namespace unipoll_test
