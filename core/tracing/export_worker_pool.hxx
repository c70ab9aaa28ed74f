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

#pragma once

#include "export_retry_controller.hxx"

#include <tracepipe/trace_snapshot.hxx>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

namespace tracepipe::core::tracing
{
/**
 * Fixed set of threads consuming finished traces from a bounded queue.
 *
 * Each worker processes one task completely, retries included, before taking the next one. The
 * queue and the handler are shared with the worker threads, so a worker that is still busy when
 * the pool stops can be left to finish in the background.
 */
class export_worker_pool
{
public:
  using task = std::shared_ptr<const trace_snapshot>;
  using task_handler = std::function<void(const task&, const export_retry_controller::sleeper&)>;

  export_worker_pool(std::size_t workers, std::size_t capacity, task_handler handler);
  export_worker_pool(const export_worker_pool&) = delete;
  export_worker_pool(export_worker_pool&&) = delete;
  auto operator=(const export_worker_pool&) -> export_worker_pool& = delete;
  auto operator=(export_worker_pool&&) -> export_worker_pool& = delete;
  ~export_worker_pool();

  void start();

  /**
   * Never blocks.
   *
   * @return false if the queue is full or the pool has been stopped, the task is dropped then
   */
  auto submit(task snapshot) -> bool;

  /**
   * @return true once the queue is empty and every worker is idle, false if the deadline came first
   */
  auto wait_until_drained(std::chrono::steady_clock::time_point deadline) -> bool;

  /**
   * Interrupts pending backoff waits, discards queued tasks and waits for the workers until the
   * deadline. Workers still inside the backend after the deadline are detached, their export
   * completes in the background.
   *
   * @return number of tasks discarded from the queue
   */
  auto stop(std::chrono::steady_clock::time_point deadline) -> std::size_t;

  [[nodiscard]] auto queue_size() const -> std::size_t;
  [[nodiscard]] auto dropped_count() const -> std::size_t;
  [[nodiscard]] auto worker_count() const -> std::size_t;

private:
  struct shared_state;

  static void worker_loop(const std::shared_ptr<shared_state>& state);

  const std::size_t worker_count_;
  std::shared_ptr<shared_state> state_;
  std::vector<std::thread> workers_{};
  std::atomic<bool> running_{ false };
};
} // namespace tracepipe::core::tracing
