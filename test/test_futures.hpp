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

#include <unipoll/context.hpp>
#include <unipoll/future.hpp>
#include <unipoll/poll_result.hpp>
#include <unipoll/spawner.hpp>

#include <gtest/gtest.h>

#include <cstddef>
#include <string>
#include <type_traits>

namespace unipoll_test {

// Completes with its poll count after `limit` polls, asking to be woken
// again each time it is pending.
struct counter_future {
  using output_type = int;
  using is_relocatable = std::true_type;

  explicit counter_future(int limit) noexcept : limit_(limit) {}

  template <typename Spawner>
  unipoll::poll_result<int> poll(unipoll::context<Spawner>& cx) {
    ++count_;
    if (count_ >= limit_) {
      return unipoll::ready(count_);
    }
    cx.get_local_waker().wake();
    return unipoll::pending;
  }

  int count() const noexcept { return count_; }

 private:
  int limit_;
  int count_ = 0;
};

// Fails the test if polled again after it completed.
struct single_completion_future {
  using output_type = std::string;
  using is_relocatable = std::true_type;

  explicit single_completion_future(int readyAfter, std::string value)
    : readyAfter_(readyAfter)
    , value_(std::move(value)) {}

  template <typename Spawner>
  unipoll::poll_result<std::string> poll(unipoll::context<Spawner>& cx) {
    EXPECT_FALSE(completed_) << "polled after completion";
    ++polls_;
    if (polls_ < readyAfter_) {
      cx.get_local_waker().wake();
      return unipoll::pending;
    }
    completed_ = true;
    return unipoll::ready(value_);
  }

  int polls() const noexcept { return polls_; }
  bool completed() const noexcept { return completed_; }

 private:
  int readyAfter_;
  std::string value_;
  int polls_ = 0;
  bool completed_ = false;
};

// Stays pending until its gate opens; a wake before that is spurious.
struct gated_future {
  using output_type = void;
  using is_relocatable = std::true_type;

  explicit gated_future(const bool& gate) noexcept : gate_(&gate) {}

  template <typename Spawner>
  unipoll::poll_result<void> poll(unipoll::context<Spawner>&) {
    EXPECT_FALSE(done_) << "polled after completion";
    ++polls_;
    if (!*gate_) {
      return unipoll::pending;
    }
    done_ = true;
    return unipoll::ready();
  }

  int polls() const noexcept { return polls_; }
  bool done() const noexcept { return done_; }

 private:
  const bool* gate_;
  int polls_ = 0;
  bool done_ = false;
};

// A fire-and-forget task that records its tag when it runs.
struct tagged_task {
  using output_type = void;
  using is_relocatable = std::true_type;

  tagged_task(int t, int* ran) noexcept : tag(t), ranTag(ran) {}

  unipoll::poll_result<void> poll(unipoll::context<unipoll::spawner>&) {
    if (ranTag != nullptr) {
      *ranTag = tag;
    }
    return unipoll::ready();
  }

  int tag;
  int* ranTag;
};

// Keeps a pointer into its own buffer across polls, so it must not be
// moved once it has been polled.
struct self_referencing_future {
  using output_type = std::size_t;

  self_referencing_future() noexcept = default;
  self_referencing_future(const self_referencing_future&) = delete;
  self_referencing_future& operator=(const self_referencing_future&) = delete;

  template <typename Spawner>
  unipoll::poll_result<std::size_t> poll(unipoll::context<Spawner>& cx) {
    if (cursor_ == nullptr) {
      cursor_ = buffer_;
    }
    *cursor_++ = 'x';
    if (cursor_ == buffer_ + sizeof(buffer_)) {
      return unipoll::ready(static_cast<std::size_t>(cursor_ - buffer_));
    }
    cx.get_local_waker().wake();
    return unipoll::pending;
  }

 private:
  char buffer_[4] = {};
  char* cursor_ = nullptr;
};

} // namespace unipoll_test
