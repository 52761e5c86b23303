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
#include <unipoll/waker.hpp>
#include <unipoll/detail/unipoll_fwd.hpp>

#include <memory>

namespace unipoll {

// Everything a future may use while it is being polled: the current
// task's wake handle and the spawner for new tasks.
//
// A context is built by the driver for one poll call and is never stored
// past it; a future that wants to be woken later clones the waker.
template <typename Spawner>
class context {
 public:
  using spawner_type = Spawner;

  context(const local_waker& localWaker, Spawner& spawner) noexcept
    : localWaker_(std::addressof(localWaker))
    , spawner_(std::addressof(spawner)) {}

  context(const local_waker&&, Spawner&) = delete;

  context(const context&) = delete;
  context(context&&) = delete;
  context& operator=(const context&) = delete;
  context& operator=(context&&) = delete;

  const local_waker& get_local_waker() const noexcept { return *localWaker_; }

  // Same wake target as get_local_waker(), usable from any thread.
  const waker& get_waker() const noexcept { return localWaker_->as_waker(); }

  Spawner& get_spawner() noexcept { return *spawner_; }

  // A context like this one but waking through localWaker. Used by futures
  // that multiplex several sub-futures and want to know which one woke.
  context with_waker(const local_waker& localWaker) & noexcept {
    return context{localWaker, *spawner_};
  }

  context with_waker(const local_waker&&) & = delete;

  // A context like this one but spawning through spawner, e.g. to put a
  // quota on what children may spawn.
  template <typename OtherSpawner>
  context<OtherSpawner> with_spawner(OtherSpawner& spawner) & noexcept {
    return context<OtherSpawner>{*localWaker_, spawner};
  }

 private:
  const local_waker* localWaker_;
  Spawner* spawner_;
};

} // namespace unipoll
