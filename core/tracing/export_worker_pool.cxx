/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *   Copyright 2025-Present Couchbase, Inc.
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */

#include "export_worker_pool.hxx"

#include "core/logger/logger.hxx"
#include "core/utils/concurrent_fixed_queue.hxx"

#include <algorithm>
#include <condition_variable>
#include <mutex>

namespace tracepipe::core::tracing
{
struct export_worker_pool::shared_state {
  shared_state(std::size_t capacity, task_handler task_handler)
    : queue{ capacity }
    , handler{ std::move(task_handler) }
  {
  }

  auto sleep_for(std::chrono::milliseconds duration) -> bool
  {
    std::unique_lock lock(mutex);
    return !stop_requested.wait_for(lock, duration, [this] {
      return stopping;
    });
  }

  utils::concurrent_fixed_queue<task> queue;
  task_handler handler;

  std::mutex mutex{};
  std::condition_variable stop_requested{};
  bool stopping{ false };
};

export_worker_pool::export_worker_pool(std::size_t workers,
                                       std::size_t capacity,
                                       task_handler handler)
  : worker_count_{ std::max<std::size_t>(workers, 1) }
  , state_{ std::make_shared<shared_state>(capacity, std::move(handler)) }
{
}

export_worker_pool::~export_worker_pool()
{
  stop(std::chrono::steady_clock::now());
}

void
export_worker_pool::start()
{
  if (running_.exchange(true)) {
    return;
  }
  workers_.reserve(worker_count_);
  for (std::size_t i = 0; i < worker_count_; ++i) {
    workers_.emplace_back([state = state_]() {
      worker_loop(state);
    });
  }
  TP_LOG_DEBUG(
    "started {} export worker(s), queue capacity={}", worker_count_, state_->queue.capacity());
}

auto
export_worker_pool::submit(task snapshot) -> bool
{
  return state_->queue.try_emplace(std::move(snapshot));
}

auto
export_worker_pool::wait_until_drained(std::chrono::steady_clock::time_point deadline) -> bool
{
  return state_->queue.wait_until_drained(deadline);
}

auto
export_worker_pool::stop(std::chrono::steady_clock::time_point deadline) -> std::size_t
{
  {
    const std::scoped_lock lock(state_->mutex);
    if (state_->stopping) {
      return 0;
    }
    state_->stopping = true;
  }
  state_->stop_requested.notify_all();

  auto discarded = state_->queue.close();

  // once the queue is closed and drained, every worker is on its way out
  const bool drained = state_->queue.wait_until_drained(deadline);
  for (auto& worker : workers_) {
    if (!worker.joinable()) {
      continue;
    }
    if (drained) {
      worker.join();
    } else {
      worker.detach();
    }
  }
  if (!drained) {
    TP_LOG_WARNING("export workers still busy after the shutdown deadline, their exports will "
                   "complete in the background");
  }
  workers_.clear();
  running_.store(false);
  return discarded;
}

auto
export_worker_pool::queue_size() const -> std::size_t
{
  return state_->queue.size();
}

auto
export_worker_pool::dropped_count() const -> std::size_t
{
  return state_->queue.dropped_count();
}

auto
export_worker_pool::worker_count() const -> std::size_t
{
  return worker_count_;
}

void
export_worker_pool::worker_loop(const std::shared_ptr<shared_state>& state)
{
  const export_retry_controller::sleeper sleeper = [raw = state.get()](
                                                     std::chrono::milliseconds duration) {
    return raw->sleep_for(duration);
  };
  while (auto snapshot = state->queue.wait_pop()) {
    state->handler(snapshot.value(), sleeper);
    state->queue.task_done();
  }
}
} // namespace tracepipe::core::tracing
