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
#include <unipoll/detail/unipoll_fwd.hpp>

#include <memory>
#include <type_traits>
#include <utility>

namespace unipoll {

struct raw_waker_vtable;

// A data pointer plus the table of functions that know what it points to.
// How a wake is delivered is entirely up to the vtable's owner.
struct raw_waker {
  void* data;
  const raw_waker_vtable* vtable;
};

struct raw_waker_vtable {
  // Returns a new handle to the same wake target.
  raw_waker (*clone)(void* data) noexcept;
  // Requests that the task be polled again. May be called from any
  // thread, any number of times, concurrently with anything.
  void (*wake)(void* data) noexcept;
  // Same request, made from the task's own thread through a local_waker.
  // Null means use wake.
  void (*wake_local)(void* data) noexcept;
  // Releases this handle.
  void (*drop)(void* data) noexcept;
};

// Owning, copyable handle to a wake target that may be moved to and
// invoked from any thread.
class waker {
 public:
  // Takes ownership of raw. Its vtable must satisfy the thread-safety
  // requirements documented on raw_waker_vtable.
  explicit waker(raw_waker raw) noexcept : raw_(raw) {
    UNIPOLL_ASSERT(raw.vtable != nullptr);
  }

  // Copying a moved-from waker yields another empty one.
  waker(const waker& other) noexcept
    : raw_(
          other.raw_.vtable != nullptr
              ? other.raw_.vtable->clone(other.raw_.data)
              : raw_waker{nullptr, nullptr}) {}

  waker(waker&& other) noexcept
    : raw_(std::exchange(other.raw_, raw_waker{nullptr, nullptr})) {}

  ~waker() {
    if (raw_.vtable != nullptr) {
      raw_.vtable->drop(raw_.data);
    }
  }

  waker& operator=(waker other) noexcept {
    swap(other);
    return *this;
  }

  void swap(waker& other) noexcept { std::swap(raw_, other.raw_); }

  friend void swap(waker& a, waker& b) noexcept { a.swap(b); }

  void wake() const noexcept {
    UNIPOLL_ASSERT(raw_.vtable != nullptr);
    raw_.vtable->wake(raw_.data);
  }

  // Best effort: true means both handles certainly wake the same task,
  // false means they may or may not.
  bool will_wake(const waker& other) const noexcept {
    return raw_.data == other.raw_.data && raw_.vtable == other.raw_.vtable;
  }

  const raw_waker& as_raw() const noexcept { return raw_; }

  // Gives up ownership without dropping.
  raw_waker into_raw() && noexcept {
    return std::exchange(raw_, raw_waker{nullptr, nullptr});
  }

 private:
  raw_waker raw_;
};

// A wake handle that must only be used on the thread of the task it was
// created for. It denotes the same wake target as as_waker().
class local_waker {
 public:
  using is_transferable = std::false_type;

  // The caller guarantees that raw is only cloned, woken and dropped on
  // the current thread, or that its vtable is thread-safe.
  static local_waker new_unchecked(raw_waker raw) noexcept {
    return local_waker{waker{raw}};
  }

  local_waker(const local_waker&) = default;
  local_waker(local_waker&&) noexcept = default;
  local_waker& operator=(const local_waker&) = default;
  local_waker& operator=(local_waker&&) noexcept = default;

  void wake() const noexcept {
    const raw_waker& raw = inner_.as_raw();
    UNIPOLL_ASSERT(raw.vtable != nullptr);
    if (raw.vtable->wake_local != nullptr) {
      raw.vtable->wake_local(raw.data);
    } else {
      raw.vtable->wake(raw.data);
    }
  }

  bool will_wake(const local_waker& other) const noexcept {
    return inner_.will_wake(other.inner_);
  }
  bool will_wake(const waker& other) const noexcept {
    return inner_.will_wake(other);
  }

  // The thread-safe view of this handle. The referenced object lives as
  // long as *this; clone it to retain it.
  const waker& as_waker() const noexcept { return inner_; }

  waker into_waker() && noexcept { return std::move(inner_); }

 private:
  explicit local_waker(waker inner) noexcept : inner_(std::move(inner)) {}

  waker inner_;
};

// A waker is always usable where a local one is expected.
inline local_waker local_waker_from_nonlocal(waker w) noexcept {
  return local_waker::new_unchecked(std::move(w).into_raw());
}

// A waker that does nothing when woken.
waker noop_waker() noexcept;
const local_waker& noop_local_waker() noexcept;

namespace _shared_waker {
template <typename W, typename = void>
inline constexpr bool has_wake_local_v = false;

template <typename W>
inline constexpr bool has_wake_local_v<
    W,
    std::void_t<decltype(std::declval<W&>().wake_local())>> = true;

template <typename W>
struct _vtable {
  static raw_waker clone(void* data) noexcept {
    auto* sp = static_cast<std::shared_ptr<W>*>(data);
    return raw_waker{new std::shared_ptr<W>(*sp), &table};
  }

  static void wake(void* data) noexcept {
    (*static_cast<std::shared_ptr<W>*>(data))->wake();
  }

  static void wake_local(void* data) noexcept {
    W& target = **static_cast<std::shared_ptr<W>*>(data);
    if constexpr (has_wake_local_v<W>) {
      target.wake_local();
    } else {
      target.wake();
    }
  }

  static void drop(void* data) noexcept {
    delete static_cast<std::shared_ptr<W>*>(data);
  }

  static constexpr raw_waker_vtable table{
      &clone,
      &wake,
      &wake_local,
      &drop};
};
} // namespace _shared_waker

// Wraps a shared wake target. W must provide a thread-safe
// `void wake() noexcept`.
template <typename W>
waker waker_from_shared(std::shared_ptr<W> target) {
  static_assert(
      noexcept(std::declval<W&>().wake()), "W::wake() must be noexcept");
  UNIPOLL_ASSERT(target != nullptr);
  return waker{raw_waker{
      new std::shared_ptr<W>(std::move(target)),
      &_shared_waker::_vtable<W>::table}};
}

// As waker_from_shared(), viewed as a local handle. If W also provides
// `void wake_local() noexcept`, wakes made through the local handle use it;
// W::wake_local() is then only ever called on the creating thread.
template <typename W>
local_waker local_waker_from_shared(std::shared_ptr<W> target) {
  return local_waker_from_nonlocal(waker_from_shared(std::move(target)));
}

} // namespace unipoll
