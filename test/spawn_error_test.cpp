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
#include <unipoll/spawn_error.hpp>

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using unipoll::spawn_error_kind;
using unipoll::spawn_obj_error;
using unipoll::spawn_result;

TEST(spawn_error_test, shutdown_kind) {
  constexpr auto kind = spawn_error_kind::shutdown();
  static_assert(kind.is_shutdown());
  EXPECT_EQ(spawn_error_kind::code_t::shutdown, kind.code());
  EXPECT_EQ(kind, spawn_error_kind::shutdown());
  EXPECT_STREQ("shutdown", kind.name());
}

TEST(spawn_error_test, kind_streams_its_name) {
  std::ostringstream out;
  out << spawn_error_kind::shutdown();
  EXPECT_EQ("spawn_error_kind(\"shutdown\")", out.str());
}

TEST(spawn_error_test, obj_error_streams_kind_only) {
  std::ostringstream out;
  out << spawn_obj_error<std::string>{spawn_error_kind::shutdown(), "payload"};
  EXPECT_EQ("spawn_obj_error{spawn_error_kind(\"shutdown\")}", out.str());
}

TEST(spawn_error_test, success_result) {
  auto r = spawn_result<spawn_error_kind>::success();
  EXPECT_TRUE(r.has_value());
  EXPECT_FALSE(r.has_error());
  EXPECT_TRUE(r);
}

TEST(spawn_error_test, error_result_hands_back_payload) {
  spawn_result<spawn_obj_error<std::string>> r =
      spawn_obj_error<std::string>{spawn_error_kind::shutdown(), "payload"};
  ASSERT_TRUE(r.has_error());
  EXPECT_FALSE(r);
  EXPECT_TRUE(r.error().kind.is_shutdown());
  std::string back = std::move(r).error().future;
  EXPECT_EQ("payload", back);
}
