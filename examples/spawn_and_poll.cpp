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
#include <unipoll/future.hpp>
#include <unipoll/spawn.hpp>
#include <unipoll/spawner.hpp>
#include <unipoll/waker.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

using namespace unipoll;
using namespace std::chrono_literals;

namespace {

// A single-threaded executor. Tasks are polled on the thread that calls
// run(); wakes may arrive from any thread and put the task back on the
// run queue.
class event_loop final : public local_spawner {
  struct task_waker {
    event_loop* loop;
    std::uint64_t id;
    void wake() noexcept { loop->enqueue(id); }
  };

  struct task {
    local_task_type future;
    local_waker waker;
  };

 public:
  spawn_obj_result spawn_obj(task_type future) override {
    auto result = spawn_obj_local(std::move(future));
    if (result) {
      return spawn_obj_result::success();
    }
    // The future arrived transferable.
    auto kind = result.error().kind;
    return spawn_obj_error<task_type>{
        kind, std::move(result).error().future.unsafe_into_future_obj()};
  }

  spawn_obj_local_result spawn_obj_local(local_task_type future) override {
    std::unique_lock lock{mutex_};
    if (stop_) {
      return spawn_obj_error<local_task_type>{
          spawn_error_kind::shutdown(), std::move(future)};
    }
    auto id = nextId_++;
    tasks_.emplace(
        id,
        std::make_unique<task>(task{
            std::move(future),
            local_waker_from_shared(
                std::make_shared<task_waker>(task_waker{this, id}))}));
    queue_.push_back(id);
    cv_.notify_one();
    return spawn_obj_local_result::success();
  }

  spawn_result<spawn_error_kind> status() const noexcept override {
    std::unique_lock lock{mutex_};
    if (stop_) {
      return spawn_error_kind::shutdown();
    }
    return spawn_result<spawn_error_kind>::success();
  }

  // Runs until every spawned task has completed.
  void run() {
    std::unique_lock lock{mutex_};
    while (!tasks_.empty()) {
      while (queue_.empty()) {
        cv_.wait(lock);
      }
      auto id = queue_.front();
      queue_.pop_front();
      auto it = tasks_.find(id);
      if (it == tasks_.end()) {
        continue;
      }
      task* t = it->second.get();
      lock.unlock();
      context<spawner> cx{t->waker, *this};
      bool done = t->future.poll(cx).is_ready();
      lock.lock();
      if (done) {
        // Release outside the lock; the future may hold wakers.
        auto finished = std::move(it->second);
        tasks_.erase(it);
        lock.unlock();
        finished.reset();
        lock.lock();
      }
    }
    stop_ = true;
  }

 private:
  void enqueue(std::uint64_t id) {
    std::unique_lock lock{mutex_};
    queue_.push_back(id);
    cv_.notify_one();
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::map<std::uint64_t, std::unique_ptr<task>> tasks_;
  std::deque<std::uint64_t> queue_;
  std::uint64_t nextId_ = 0;
  bool stop_ = false;
};

// Completes after a delay; the wake comes from a helper thread.
class sleep_future {
  struct state {
    std::atomic<bool> fired{false};
  };

 public:
  using output_type = void;
  using is_relocatable = std::true_type;

  explicit sleep_future(std::chrono::milliseconds d)
    : duration_(d)
    , state_(std::make_shared<state>()) {}

  sleep_future(sleep_future&&) = default;

  ~sleep_future() {
    if (timer_.joinable()) {
      timer_.join();
    }
  }

  poll_result<void> poll(context<spawner>& cx) {
    if (state_->fired.load()) {
      return ready();
    }
    if (!timer_.joinable()) {
      timer_ = std::thread{
          [d = duration_, s = state_, w = cx.get_waker()]() {
            std::this_thread::sleep_for(d);
            s->fired.store(true);
            w.wake();
          }};
    }
    return pending;
  }

 private:
  std::chrono::milliseconds duration_;
  std::shared_ptr<state> state_;
  std::thread timer_;
};

// Sleeps, reports, and spawns the next generation until depth runs out.
struct generation_task {
  using output_type = void;
  using is_relocatable = std::true_type;

  generation_task(int g, int d)
    : generation(g)
    , depth(d)
    , sleep(std::chrono::milliseconds{10 * (g + 1)}) {}

  poll_result<void> poll(context<spawner>& cx) {
    if (poll_relocatable(sleep, cx).is_pending()) {
      return pending;
    }
    std::printf("generation %i done\n", generation);
    if (generation + 1 < depth) {
      for (int i = 0; i < 2; ++i) {
        auto result =
            spawn(cx.get_spawner(), generation_task{generation + 1, depth});
        if (!result) {
          std::printf("spawn failed: shutdown\n");
        }
      }
    }
    return ready();
  }

  int generation;
  int depth;
  sleep_future sleep;
};

} // namespace

int main() {
  event_loop loop;
  auto result = spawn(loop, generation_task{0, 3});
  if (!result) {
    std::printf("could not spawn the first task\n");
    return 1;
  }

  auto start = std::chrono::steady_clock::now();
  loop.run();
  auto end = std::chrono::steady_clock::now();

  std::printf(
      "all tasks done in %i ms\n",
      static_cast<int>(
          std::chrono::duration_cast<std::chrono::milliseconds>(end - start)
              .count()));

  auto late = spawn(loop, generation_task{0, 1});
  std::printf("spawn after run: %s\n", late ? "accepted" : "refused");
  return 0;
}
