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

#include <tracepipe/trace_snapshot.hxx>

#include <chrono>
#include <functional>
#include <memory>

namespace tracepipe::core::tracing
{
class trace_registry;

struct timeout_supervisor_options {
  std::chrono::milliseconds trace_timeout;
  std::chrono::milliseconds check_interval{ std::chrono::seconds{ 1 } };
  std::chrono::milliseconds idle_grace{ std::chrono::seconds{ 5 } };
};

class timeout_supervisor_impl;

/**
 * Background loop which finishes traces that stay in progress longer than the trace timeout.
 *
 * The loop runs on its own thread and io_context. It is started on demand by ensure_running(), and
 * stops by itself once the registry has been empty for the idle grace period.
 */
class timeout_supervisor
{
public:
  using expired_handler = std::function<void(std::shared_ptr<const trace_snapshot>)>;

  timeout_supervisor(const timeout_supervisor_options& options,
                     std::shared_ptr<trace_registry> registry,
                     expired_handler handler);
  timeout_supervisor(const timeout_supervisor&) = delete;
  timeout_supervisor(timeout_supervisor&&) = delete;
  auto operator=(const timeout_supervisor&) -> timeout_supervisor& = delete;
  auto operator=(timeout_supervisor&&) -> timeout_supervisor& = delete;
  ~timeout_supervisor();

  /**
   * Starts the loop unless it is already running. Does nothing after stop().
   */
  void ensure_running();

  /**
   * Stops the loop and joins its thread. The supervisor cannot be restarted afterwards.
   */
  void stop();

  [[nodiscard]] auto is_running() const -> bool;

private:
  std::shared_ptr<timeout_supervisor_impl> impl_;
};
} // namespace tracepipe::core::tracing
