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
#include <unipoll/waker.hpp>

namespace unipoll {
namespace {
raw_waker noop_clone(void*) noexcept;
void noop_wake(void*) noexcept {}
void noop_drop(void*) noexcept {}

constexpr raw_waker_vtable noop_vtable{
    &noop_clone, &noop_wake, nullptr, &noop_drop};

raw_waker noop_clone(void*) noexcept {
  return raw_waker{nullptr, &noop_vtable};
}
} // namespace

waker noop_waker() noexcept {
  return waker{raw_waker{nullptr, &noop_vtable}};
}

const local_waker& noop_local_waker() noexcept {
  static const local_waker instance = local_waker_from_nonlocal(noop_waker());
  return instance;
}

} // namespace unipoll
