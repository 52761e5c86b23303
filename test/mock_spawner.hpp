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

#include <unipoll/spawner.hpp>

#include <gmock/gmock.h>

namespace unipoll_test {

struct mock_spawner : unipoll::spawner {
  MOCK_METHOD(spawn_obj_result, spawn_obj, (task_type), (override));
  MOCK_METHOD(
      unipoll::spawn_result<unipoll::spawn_error_kind>,
      status,
      (),
      (const, noexcept, override));
};

// Refuses every spawn and hands the future back.
struct shutdown_spawner final : unipoll::local_spawner {
  spawn_obj_result spawn_obj(task_type future) override {
    ++attempts;
    return unipoll::spawn_obj_error<task_type>{
        unipoll::spawn_error_kind::shutdown(), std::move(future)};
  }

  spawn_obj_local_result spawn_obj_local(local_task_type future) override {
    ++attempts;
    return unipoll::spawn_obj_error<local_task_type>{
        unipoll::spawn_error_kind::shutdown(), std::move(future)};
  }

  unipoll::spawn_result<unipoll::spawn_error_kind>
  status() const noexcept override {
    return unipoll::spawn_error_kind::shutdown();
  }

  int attempts = 0;
};

} // namespace unipoll_test
