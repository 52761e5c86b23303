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

#include <unipoll/future.hpp>
#include <unipoll/future_obj.hpp>
#include <unipoll/marker.hpp>
#include <unipoll/pinned_box.hpp>
#include <unipoll/spawner.hpp>
#include <unipoll/type_traits.hpp>

#include <memory>
#include <type_traits>

namespace unipoll {

namespace _spawn {
template <typename F>
inline constexpr bool is_task_v =
    is_future_v<remove_cvref_t<F>, spawner> &&
    std::is_void_v<future_output_t<remove_cvref_t<F>>>;

template <typename F>
inline constexpr bool is_transferable_task_v =
    is_task_v<F> && is_transferable_v<remove_cvref_t<F>>;
} // namespace _spawn

// Moves future into a slot from alloc, erases it and spawns it. A failed
// spawn hands the erased future back inside the error.
template <
    typename F,
    typename Allocator,
    std::enable_if_t<_spawn::is_transferable_task_v<F>, int> = 0>
spawner::spawn_obj_result
spawn_with_allocator(spawner& s, F&& future, const Allocator& alloc) {
  return s.spawn_obj(spawner::task_type{
      allocate_pinned_box<remove_cvref_t<F>>(alloc, (F &&) future)});
}

template <
    typename F,
    std::enable_if_t<_spawn::is_transferable_task_v<F>, int> = 0>
spawner::spawn_obj_result spawn(spawner& s, F&& future) {
  return spawn_with_allocator(
      s, (F &&) future, std::allocator<remove_cvref_t<F>>{});
}

// As spawn(), for futures that must stay on the executor's thread.
template <
    typename F,
    typename Allocator,
    std::enable_if_t<_spawn::is_task_v<F>, int> = 0>
local_spawner::spawn_obj_local_result spawn_local_with_allocator(
    local_spawner& s, F&& future, const Allocator& alloc) {
  return s.spawn_obj_local(local_spawner::local_task_type{
      allocate_pinned_box<remove_cvref_t<F>>(alloc, (F &&) future)});
}

template <typename F, std::enable_if_t<_spawn::is_task_v<F>, int> = 0>
local_spawner::spawn_obj_local_result spawn_local(local_spawner& s, F&& future) {
  return spawn_local_with_allocator(
      s, (F &&) future, std::allocator<remove_cvref_t<F>>{});
}

} // namespace unipoll
