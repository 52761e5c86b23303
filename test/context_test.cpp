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
#include <unipoll/context.hpp>

#include "counting_waker.hpp"
#include "mock_spawner.hpp"

#include <gtest/gtest.h>

#include <type_traits>
#include <utility>

using unipoll_test::counting_waker;
using unipoll_test::shutdown_spawner;

namespace {

// Counts spawns before passing them on; the kind of wrapper a future
// installs with with_spawner() to police its children.
struct quota_spawner final : unipoll::spawner {
  explicit quota_spawner(unipoll::spawner& inner) noexcept : inner_(inner) {}

  spawn_obj_result spawn_obj(task_type future) override {
    ++spawns;
    return inner_.spawn_obj(std::move(future));
  }

  int spawns = 0;

 private:
  unipoll::spawner& inner_;
};

template <typename T, typename = void>
constexpr bool can_narrow_waker_v = false;

template <typename T>
constexpr bool can_narrow_waker_v<
    T,
    std::void_t<decltype(std::declval<unipoll::context<>&>().with_waker(
        std::declval<T>()))>> = true;

} // namespace

// A context only refers to its waker, so it must not bind to a temporary.
static_assert(std::is_constructible_v<
              unipoll::context<>,
              const unipoll::local_waker&,
              unipoll::spawner&>);
static_assert(!std::is_constructible_v<
              unipoll::context<>,
              unipoll::local_waker&&,
              unipoll::spawner&>);
static_assert(can_narrow_waker_v<const unipoll::local_waker&>);
static_assert(!can_narrow_waker_v<unipoll::local_waker&&>);

TEST(context_test, exposes_waker_and_spawner) {
  counting_waker cw;
  shutdown_spawner sp;
  unipoll::context<> cx{cw.localWaker, sp};

  EXPECT_EQ(&cw.localWaker, &cx.get_local_waker());
  EXPECT_EQ(&cw.localWaker.as_waker(), &cx.get_waker());
  EXPECT_EQ(&sp, &cx.get_spawner());
}

TEST(context_test, waker_and_local_waker_reach_same_target) {
  counting_waker cw;
  shutdown_spawner sp;
  unipoll::context<> cx{cw.localWaker, sp};

  cx.get_local_waker().wake();
  cx.get_waker().wake();
  EXPECT_EQ(1, cw.target->localWakes.load());
  EXPECT_EQ(1, cw.target->wakes.load());
}

TEST(context_test, with_waker_substitutes_only_the_waker) {
  counting_waker outer;
  counting_waker inner;
  shutdown_spawner sp;
  unipoll::context<> cx{outer.localWaker, sp};

  {
    auto sub = cx.with_waker(inner.localWaker);
    EXPECT_EQ(&inner.localWaker, &sub.get_local_waker());
    EXPECT_EQ(&sp, &sub.get_spawner());
    sub.get_local_waker().wake();
  }

  EXPECT_EQ(&outer.localWaker, &cx.get_local_waker());
  EXPECT_EQ(&sp, &cx.get_spawner());
  EXPECT_EQ(1, inner.target->total());
  EXPECT_EQ(0, outer.target->total());
}

TEST(context_test, with_spawner_substitutes_only_the_spawner) {
  counting_waker cw;
  shutdown_spawner base;
  quota_spawner quota{base};
  unipoll::context<> cx{cw.localWaker, base};

  {
    unipoll::context<quota_spawner> sub = cx.with_spawner(quota);
    EXPECT_EQ(&quota, &sub.get_spawner());
    EXPECT_EQ(&cw.localWaker, &sub.get_local_waker());
  }

  EXPECT_EQ(&base, &cx.get_spawner());
  EXPECT_EQ(&cw.localWaker, &cx.get_local_waker());
}

TEST(context_test, nested_contexts_narrow_in_turn) {
  counting_waker outer;
  counting_waker inner;
  shutdown_spawner base;
  quota_spawner quota{base};
  unipoll::context<> cx{outer.localWaker, base};

  auto sub = cx.with_spawner(quota);
  auto subsub = sub.with_waker(inner.localWaker);
  EXPECT_EQ(&quota, &subsub.get_spawner());
  EXPECT_EQ(&inner.localWaker, &subsub.get_local_waker());
  EXPECT_EQ(&outer.localWaker, &sub.get_local_waker());
  EXPECT_EQ(&base, &cx.get_spawner());
}
