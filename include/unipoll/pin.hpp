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
#include <unipoll/marker.hpp>
#include <unipoll/type_traits.hpp>

#include <memory>
#include <type_traits>
#include <utility>

namespace unipoll {

// A location-locked reference. Whoever hands out a pin_ref<T> promises
// that the referent stays at its address until it is destroyed, so the
// referent may keep pointers into its own storage across polls.
//
// A pin_ref over a relocatable type can be made from any T&. For other
// types use new_unchecked() or a pinned_box.
template <typename T>
class pin_ref {
  struct unchecked_tag {};

  pin_ref(T* ptr, unchecked_tag) noexcept : ptr_(ptr) {}

 public:
  using element_type = T;
  using is_relocatable = std::true_type;

  template <
      typename U = T,
      std::enable_if_t<is_relocatable_v<U>, int> = 0>
  /* implicit */ pin_ref(T& value) noexcept : ptr_(std::addressof(value)) {}

  // The caller guarantees value is not moved or reused before it is
  // destroyed, even after this pin_ref is gone.
  static pin_ref new_unchecked(T& value) noexcept {
    return pin_ref{std::addressof(value), unchecked_tag{}};
  }

  template <
      typename U = T,
      std::enable_if_t<is_relocatable_v<U>, int> = 0>
  T& get() const noexcept {
    return *ptr_;
  }

  // Mutable access. The caller must not move out of the referent.
  T& get_unchecked() const noexcept { return *ptr_; }

  const T& operator*() const noexcept { return *ptr_; }
  const T* operator->() const noexcept { return ptr_; }

  // A shorter-lived pin of the same referent, for forwarding into a
  // nested poll while keeping this one.
  pin_ref reborrow() const noexcept { return *this; }

  // Projects the pin onto a sub-object, e.g. a field of the referent.
  // The projection must return a reference into *this's referent.
  template <typename Fn>
  auto map_unchecked(Fn&& fn) const {
    using U = std::remove_reference_t<decltype(((Fn &&) fn)(*ptr_))>;
    static_assert(
        std::is_lvalue_reference_v<decltype(((Fn &&) fn)(*ptr_))>,
        "map_unchecked projection must return an lvalue reference");
    return pin_ref<U>::new_unchecked(((Fn &&) fn)(*ptr_));
  }

  friend bool operator==(pin_ref a, pin_ref b) noexcept {
    return a.ptr_ == b.ptr_;
  }
  friend bool operator!=(pin_ref a, pin_ref b) noexcept {
    return a.ptr_ != b.ptr_;
  }

 private:
  T* ptr_;
};

template <typename T>
inline constexpr bool is_pin_ref_v = instance_of_v<pin_ref, remove_cvref_t<T>>;

template <typename T>
struct enable_transferable<pin_ref<T>>
  : std::bool_constant<is_transferable_v<T>> {};

} // namespace unipoll
