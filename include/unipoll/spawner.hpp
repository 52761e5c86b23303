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

#include <unipoll/future_obj.hpp>
#include <unipoll/spawn_error.hpp>
#include <unipoll/detail/unipoll_fwd.hpp>

namespace unipoll {

// Spawns tasks onto the executor behind it. A task is a future that the
// executor polls until it completes.
class spawner {
 public:
  using task_type = future_obj<void>;
  using spawn_obj_result = spawn_result<spawn_obj_error<task_type>>;

  virtual ~spawner() = default;

  // Schedules future as a new task. On failure, because the executor has
  // shut down or cannot take more work, the error carries future back
  // untouched.
  virtual spawn_obj_result spawn_obj(task_type future) = 0;

  // Whether the executor is likely to accept a spawn right now. Neither
  // answer is a promise about the next call to spawn_obj().
  virtual spawn_result<spawn_error_kind> status() const noexcept {
    return spawn_result<spawn_error_kind>::success();
  }

 protected:
  spawner() = default;
  spawner(const spawner&) = default;
  spawner& operator=(const spawner&) = default;
};

// A spawner whose executor polls every task on one thread, and so can
// also accept thread-confined futures.
class local_spawner : public spawner {
 public:
  using local_task_type = local_future_obj<void>;
  using spawn_obj_local_result =
      spawn_result<spawn_obj_error<local_task_type>>;

  virtual spawn_obj_local_result spawn_obj_local(local_task_type future) = 0;
};

} // namespace unipoll
