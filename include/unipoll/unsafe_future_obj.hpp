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

#include <unipoll/config.hpp>
#include <unipoll/context.hpp>
#include <unipoll/future.hpp>
#include <unipoll/marker.hpp>
#include <unipoll/pin.hpp>
#include <unipoll/pinned_box.hpp>
#include <unipoll/poll_result.hpp>
#include <unipoll/detail/unipoll_fwd.hpp>

#include <memory>
#include <type_traits>

namespace unipoll {

// The hand-rolled vtable behind local_future_obj and future_obj.
//
// Specialise unsafe_future_obj<Holder, Spawner> for a type that owns or
// refers to a future, providing:
//
//   using output_type = T;
//
//   // Transfers ownership of the holder into an opaque pointer. Nothing
//   // outside the returned pointer may keep access to the future.
//   static void* into_raw(Holder&& holder);
//
//   // Polls the future behind ptr. Must be safe to call repeatedly with
//   // the result of into_raw() until drop() is called. Calls are never
//   // concurrent with each other or with drop().
//   static poll_result<T> poll(void* ptr, context<Spawner>& cx);
//
//   // Releases what into_raw() produced. Called exactly once per
//   // into_raw(), never concurrently with poll().
//   static void drop(void* ptr) noexcept;
//
// The containers are the only callers and keep to these rules.
template <typename Holder, typename Spawner>
struct unsafe_future_obj {};

template <typename Holder, typename Spawner = spawner, typename = void>
inline constexpr bool is_unsafe_future_obj_v = false;

template <typename Holder, typename Spawner>
inline constexpr bool is_unsafe_future_obj_v<
    Holder,
    Spawner,
    std::void_t<
        typename unsafe_future_obj<Holder, Spawner>::output_type,
        decltype(unsafe_future_obj<Holder, Spawner>::into_raw(
            UNIPOLL_DECLVAL(Holder&&))),
        decltype(unsafe_future_obj<Holder, Spawner>::poll(
            UNIPOLL_DECLVAL(void*), UNIPOLL_DECLVAL(context<Spawner>&))),
        decltype(unsafe_future_obj<Holder, Spawner>::drop(
            UNIPOLL_DECLVAL(void*)))>> = true;

namespace _unsafe_future_obj {
template <typename F, typename Spawner, bool IsFuture>
struct _by_ref {};

template <typename F, typename Spawner>
struct _by_ref<F, Spawner, true> {
  using output_type = future_output_t<F>;

  static void* into_raw(F& future) noexcept {
    return static_cast<void*>(std::addressof(future));
  }

  static poll_result<output_type> poll(void* ptr, context<Spawner>& cx) {
    return unipoll::poll(pin_ref<F>{*static_cast<F*>(ptr)}, cx);
  }

  static void drop(void*) noexcept {}
};

template <typename F, typename Spawner, bool IsFuture>
struct _by_pin {};

template <typename F, typename Spawner>
struct _by_pin<F, Spawner, true> {
  using output_type = future_output_t<F>;

  static void* into_raw(pin_ref<F> future) noexcept {
    return static_cast<void*>(std::addressof(future.get_unchecked()));
  }

  static poll_result<output_type> poll(void* ptr, context<Spawner>& cx) {
    return unipoll::poll(
        pin_ref<F>::new_unchecked(*static_cast<F*>(ptr)), cx);
  }

  static void drop(void*) noexcept {}
};

template <typename F, typename Allocator, typename Spawner, bool IsFuture>
struct _by_box {};

template <typename F, typename Allocator, typename Spawner>
struct _by_box<F, Allocator, Spawner, true> {
  using output_type = future_output_t<F>;

 private:
  using node_type = typename pinned_box<F, Allocator>::node_type;

 public:
  static void* into_raw(pinned_box<F, Allocator>&& box) noexcept {
    return static_cast<void*>(box.release());
  }

  static poll_result<output_type> poll(void* ptr, context<Spawner>& cx) {
    return unipoll::poll(
        pin_ref<F>::new_unchecked(static_cast<node_type*>(ptr)->value), cx);
  }

  static void drop(void* ptr) noexcept {
    node_type::destroy(static_cast<node_type*>(ptr));
  }
};
} // namespace _unsafe_future_obj

// Borrows a relocatable, non-const future. The referent must outlive the
// container; releasing does nothing.
template <typename F, typename Spawner>
struct unsafe_future_obj<F&, Spawner>
  : _unsafe_future_obj::_by_ref<
        F,
        Spawner,
        !std::is_const_v<F> && is_relocatable_v<F> &&
            is_future_v<F, Spawner>> {};

// Borrows a future that is already locked in place.
template <typename F, typename Spawner>
struct unsafe_future_obj<pin_ref<F>, Spawner>
  : _unsafe_future_obj::_by_pin<F, Spawner, is_future_v<F, Spawner>> {};

// Owns a future in a stable slot. Releasing destroys the future and
// returns the slot to the allocator it came from.
template <typename F, typename Allocator, typename Spawner>
struct unsafe_future_obj<pinned_box<F, Allocator>, Spawner>
  : _unsafe_future_obj::
        _by_box<F, Allocator, Spawner, is_future_v<F, Spawner>> {};

} // namespace unipoll
