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
#include <unipoll/marker.hpp>
#include <unipoll/pin.hpp>
#include <unipoll/poll_result.hpp>
#include <unipoll/type_traits.hpp>
#include <unipoll/unsafe_future_obj.hpp>
#include <unipoll/detail/unipoll_fwd.hpp>

#include <type_traits>
#include <utility>

namespace unipoll {

namespace _future_obj {
// Holders are taken by value, except plain lvalue references to futures
// which are borrowed.
template <typename Holder>
using holder_t = conditional_t<
    std::is_lvalue_reference_v<Holder> && !is_pin_ref_v<Holder>,
    Holder,
    remove_cvref_t<Holder>>;

template <typename Holder, typename Self>
inline constexpr bool is_self_v =
    std::is_same_v<remove_cvref_t<Holder>, Self>;
} // namespace _future_obj

// Owns "some future producing T" without knowing its type: an opaque
// pointer plus the poll and drop functions of the holder it was built
// from. Must stay on the thread that created it; see future_obj for the
// transferable form.
//
// The container is relocatable whatever it holds, since the future itself
// lives behind the pointer. Destroying it releases the future exactly once,
// whether or not it was ever polled to completion. A moved-from container
// is empty and releases nothing.
template <typename T, typename Spawner>
class local_future_obj {
  using poll_fn_t = poll_result<T>(void*, context<Spawner>&);
  using drop_fn_t = void(void*) noexcept;

 public:
  using output_type = T;
  using spawner_type = Spawner;
  using is_relocatable = std::true_type;
  using is_transferable = std::false_type;

  template <
      typename Holder,
      typename H = _future_obj::holder_t<Holder>,
      std::enable_if_t<
          !_future_obj::is_self_v<Holder, local_future_obj> &&
              !_future_obj::is_self_v<Holder, future_obj<T, Spawner>>,
          int> = 0,
      std::enable_if_t<is_unsafe_future_obj_v<H, Spawner>, int> = 0>
  explicit local_future_obj(Holder&& holder) noexcept(
      noexcept(unsafe_future_obj<H, Spawner>::into_raw((Holder &&) holder)))
    : ptr_(unsafe_future_obj<H, Spawner>::into_raw((Holder &&) holder))
    , pollFn_(&unsafe_future_obj<H, Spawner>::poll)
    , dropFn_(&unsafe_future_obj<H, Spawner>::drop) {
    static_assert(
        std::is_same_v<typename unsafe_future_obj<H, Spawner>::output_type, T>,
        "the erased future must produce exactly T");
  }

  // A transferable container can always be confined.
  /* implicit */ local_future_obj(future_obj<T, Spawner>&& other) noexcept
    : local_future_obj(std::move(other.inner_)) {}

  local_future_obj(local_future_obj&& other) noexcept
    : ptr_(std::exchange(other.ptr_, nullptr))
    , pollFn_(std::exchange(other.pollFn_, nullptr))
    , dropFn_(std::exchange(other.dropFn_, nullptr)) {}

  local_future_obj& operator=(local_future_obj other) noexcept {
    swap(other);
    return *this;
  }

  ~local_future_obj() { reset(); }

  void swap(local_future_obj& other) noexcept {
    std::swap(ptr_, other.ptr_);
    std::swap(pollFn_, other.pollFn_);
    std::swap(dropFn_, other.dropFn_);
  }

  friend void swap(local_future_obj& a, local_future_obj& b) noexcept {
    a.swap(b);
  }

  // Not reentrant: the future must not poll, reset or destroy its own
  // container from inside this call.
  poll_result<T> poll(context<Spawner>& cx) {
    UNIPOLL_ASSERT(pollFn_ != nullptr);
#ifndef NDEBUG
    UNIPOLL_ASSERT(!polling_);
    polling_ = true;
    _polling_guard guard{polling_};
#endif
    return pollFn_(ptr_, cx);
  }

  // Releases the future now. Afterwards the container is empty.
  void reset() noexcept {
#ifndef NDEBUG
    UNIPOLL_ASSERT(!polling_);
#endif
    if (dropFn_ != nullptr) {
      pollFn_ = nullptr;
      std::exchange(dropFn_, nullptr)(std::exchange(ptr_, nullptr));
    }
  }

  bool empty() const noexcept { return dropFn_ == nullptr; }

  explicit operator bool() const noexcept { return !empty(); }

  // The caller asserts that the holder this container was built from is
  // safe to move to, poll on and release from another thread.
  future_obj<T, Spawner> unsafe_into_future_obj() && noexcept {
    using target = future_obj<T, Spawner>;
    return target{std::move(*this), typename target::unchecked_tag{}};
  }

 private:
#ifndef NDEBUG
  struct _polling_guard {
    bool& polling;
    ~_polling_guard() { polling = false; }
  };
#endif

  void* ptr_;
  poll_fn_t* pollFn_;
  drop_fn_t* dropFn_;
#ifndef NDEBUG
  bool polling_ = false;
#endif
};

// A local_future_obj whose holder may move between threads. Built only
// from holders declared transferable (see is_transferable_v); converting
// to local_future_obj is free.
template <typename T, typename Spawner>
class future_obj {
  struct unchecked_tag {};

 public:
  using output_type = T;
  using spawner_type = Spawner;
  using is_relocatable = std::true_type;
  using is_transferable = std::true_type;

  template <
      typename Holder,
      typename H = _future_obj::holder_t<Holder>,
      std::enable_if_t<
          !_future_obj::is_self_v<Holder, future_obj> &&
              !_future_obj::is_self_v<Holder, local_future_obj<T, Spawner>>,
          int> = 0,
      std::enable_if_t<is_unsafe_future_obj_v<H, Spawner>, int> = 0,
      std::enable_if_t<is_transferable_v<H>, int> = 0>
  explicit future_obj(Holder&& holder) noexcept(
      std::is_nothrow_constructible_v<local_future_obj<T, Spawner>, Holder>)
    : inner_((Holder &&) holder) {}

  future_obj(future_obj&&) noexcept = default;
  future_obj& operator=(future_obj&&) noexcept = default;

  void swap(future_obj& other) noexcept { inner_.swap(other.inner_); }

  friend void swap(future_obj& a, future_obj& b) noexcept { a.swap(b); }

  poll_result<T> poll(context<Spawner>& cx) { return inner_.poll(cx); }

  void reset() noexcept { inner_.reset(); }

  bool empty() const noexcept { return inner_.empty(); }

  explicit operator bool() const noexcept { return !empty(); }

  local_future_obj<T, Spawner> into_local() && noexcept {
    return std::move(inner_);
  }

 private:
  friend class local_future_obj<T, Spawner>;

  future_obj(local_future_obj<T, Spawner>&& inner, unchecked_tag) noexcept
    : inner_(std::move(inner)) {}

  local_future_obj<T, Spawner> inner_;
};

} // namespace unipoll
