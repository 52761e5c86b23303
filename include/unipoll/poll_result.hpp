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
#include <unipoll/type_traits.hpp>

#include <optional>
#include <type_traits>
#include <utility>

namespace unipoll {

namespace _poll_result {
struct pending_t {
  explicit constexpr pending_t() noexcept = default;
};

template <typename T>
struct ready_t {
  T value;
};

template <>
struct ready_t<void> {};
} // namespace _poll_result

using _poll_result::pending_t;
using _poll_result::ready_t;

// The "not ready yet" outcome of a poll. The future has arranged to be
// woken through the context's waker before returning it.
inline constexpr pending_t pending{};

template <typename T>
ready_t<std::decay_t<T>> ready(T&& value) noexcept(
    std::is_nothrow_constructible_v<std::decay_t<T>, T>) {
  return ready_t<std::decay_t<T>>{(T &&) value};
}

inline constexpr ready_t<void> ready() noexcept {
  return {};
}

template <typename T>
class poll_result;

// Completion without a value.
template <>
class poll_result<void> {
 public:
  using value_type = void;

  constexpr poll_result(pending_t) noexcept {}
  constexpr poll_result(ready_t<void>) noexcept : ready_(true) {}

  bool is_ready() const noexcept { return ready_; }
  bool is_pending() const noexcept { return !ready_; }

  explicit operator bool() const noexcept { return ready_; }

  void value() const noexcept { UNIPOLL_ASSERT(ready_); }

  template <typename F>
  auto map(F&& f) && {
    using U = remove_cvref_t<std::invoke_result_t<F>>;
    if constexpr (std::is_void_v<U>) {
      if (ready_) {
        ((F &&) f)();
      }
      return *this;
    } else {
      if (!ready_) {
        return poll_result<U>{pending};
      }
      return poll_result<U>{ready(((F &&) f)())};
    }
  }

  friend bool operator==(poll_result a, poll_result b) noexcept {
    return a.ready_ == b.ready_;
  }
  friend bool operator!=(poll_result a, poll_result b) noexcept {
    return a.ready_ != b.ready_;
  }

 private:
  bool ready_ = false;
};

// Outcome of advancing a future by one step: either the final value or
// pending. A ready result is terminal for the future that produced it.
template <typename T>
class poll_result {
  static_assert(!std::is_reference_v<T>, "poll_result<T&> is not supported");

 public:
  using value_type = T;

  constexpr poll_result(pending_t) noexcept {}

  template <
      typename U,
      std::enable_if_t<std::is_constructible_v<T, U&&>, int> = 0>
  constexpr poll_result(ready_t<U>&& r) noexcept(
      std::is_nothrow_constructible_v<T, U&&>)
    : value_(std::in_place, std::move(r.value)) {}

  bool is_ready() const noexcept { return value_.has_value(); }
  bool is_pending() const noexcept { return !value_.has_value(); }

  explicit operator bool() const noexcept { return is_ready(); }

  T& value() & noexcept {
    UNIPOLL_ASSERT(is_ready());
    return *value_;
  }
  const T& value() const& noexcept {
    UNIPOLL_ASSERT(is_ready());
    return *value_;
  }
  T&& value() && noexcept {
    UNIPOLL_ASSERT(is_ready());
    return std::move(*value_);
  }

  // Applies f to the ready value, keeping pending as pending.
  template <typename F>
  auto map(F&& f) && {
    using U = remove_cvref_t<std::invoke_result_t<F, T&&>>;
    if constexpr (std::is_void_v<U>) {
      if (is_pending()) {
        return poll_result<void>{pending};
      }
      ((F &&) f)(std::move(*value_));
      return poll_result<void>{ready()};
    } else {
      if (is_pending()) {
        return poll_result<U>{pending};
      }
      return poll_result<U>{ready(((F &&) f)(std::move(*value_)))};
    }
  }

  template <
      typename U = T,
      std::enable_if_t<is_equality_comparable_v<U>, int> = 0>
  friend bool operator==(const poll_result& a, const poll_result& b) {
    return a.value_ == b.value_;
  }
  template <
      typename U = T,
      std::enable_if_t<is_equality_comparable_v<U>, int> = 0>
  friend bool operator!=(const poll_result& a, const poll_result& b) {
    return !(a == b);
  }

 private:
  std::optional<T> value_;
};

} // namespace unipoll
