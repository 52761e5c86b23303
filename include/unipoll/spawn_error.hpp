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

#include <ostream>
#include <optional>
#include <type_traits>
#include <utility>

namespace unipoll {

// Why an executor refused to spawn. New kinds may be added; code that
// only needs to know "spawning failed" should not switch on code().
class spawn_error_kind {
 public:
  enum class code_t : unsigned char {
    shutdown,
  };

  // Spawning is failing because the executor has been shut down.
  static constexpr spawn_error_kind shutdown() noexcept {
    return spawn_error_kind{code_t::shutdown};
  }

  constexpr bool is_shutdown() const noexcept {
    return code_ == code_t::shutdown;
  }

  constexpr code_t code() const noexcept { return code_; }

  const char* name() const noexcept;

  friend constexpr bool
  operator==(spawn_error_kind a, spawn_error_kind b) noexcept {
    return a.code_ == b.code_;
  }
  friend constexpr bool
  operator!=(spawn_error_kind a, spawn_error_kind b) noexcept {
    return a.code_ != b.code_;
  }

  friend std::ostream& operator<<(std::ostream& os, spawn_error_kind kind);

 private:
  explicit constexpr spawn_error_kind(code_t code) noexcept : code_(code) {}

  code_t code_;
};

// A failed spawn. Ownership of the future that could not be spawned is
// handed back here so the caller can retry, redirect or drop it.
template <typename Future>
struct spawn_obj_error {
  spawn_error_kind kind;
  Future future;

  friend std::ostream&
  operator<<(std::ostream& os, const spawn_obj_error& error) {
    return os << "spawn_obj_error{" << error.kind << "}";
  }
};

template <typename Future>
spawn_obj_error(spawn_error_kind, Future) -> spawn_obj_error<Future>;

namespace _spawn_result {
struct success_t {
  explicit constexpr success_t() noexcept = default;
};
} // namespace _spawn_result

// Either success, which carries nothing, or an Error.
template <typename Error>
class [[nodiscard]] spawn_result {
 public:
  using error_type = Error;

  constexpr spawn_result(_spawn_result::success_t) noexcept {}

  spawn_result(Error error) noexcept(
      std::is_nothrow_move_constructible_v<Error>)
    : error_(std::in_place, std::move(error)) {}

  static constexpr spawn_result success() noexcept {
    return spawn_result{_spawn_result::success_t{}};
  }

  bool has_value() const noexcept { return !error_.has_value(); }
  bool has_error() const noexcept { return error_.has_value(); }

  explicit operator bool() const noexcept { return has_value(); }

  Error& error() & noexcept {
    UNIPOLL_ASSERT(has_error());
    return *error_;
  }
  const Error& error() const& noexcept {
    UNIPOLL_ASSERT(has_error());
    return *error_;
  }
  Error&& error() && noexcept {
    UNIPOLL_ASSERT(has_error());
    return std::move(*error_);
  }

 private:
  std::optional<Error> error_;
};

} // namespace unipoll
