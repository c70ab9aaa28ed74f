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

#include <tracepipe/export_stats.hxx>
#include <tracepipe/span.hxx>
#include <tracepipe/trace_context.hxx>
#include <tracepipe/trace_snapshot.hxx>
#include <tracepipe/tracing_options.hxx>

#include <tao/json/value.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>

namespace tracepipe
{
class trace_backend;
} // namespace tracepipe

namespace tracepipe::core::tracing
{
class export_worker_pool;
class timeout_supervisor;
class trace_registry;

/**
 * Export counters, shared with the workers, which may outlive the tracer after a bounded close.
 */
struct export_counters {
  std::atomic<std::uint64_t> submitted{ 0 };
  std::atomic<std::uint64_t> exported{ 0 };
  std::atomic<std::uint64_t> dropped{ 0 };
  std::atomic<std::uint64_t> failed{ 0 };
  std::atomic<std::uint64_t> retried{ 0 };
};

/**
 * Implementation of tracepipe::tracer.
 *
 * Owns the registry of in-progress traces, the timeout supervisor and the export pipeline. Lock
 * order is context mutex, then trace mutex. Exports never run under either of them, and never on
 * the supervisor thread: in synchronous mode traces closed by the application are exported on the
 * closing thread, traces closed by the supervisor by a single background worker.
 */
class tracing_service
{
public:
  tracing_service(tracing_options options, std::shared_ptr<trace_backend> backend);
  tracing_service(const tracing_service&) = delete;
  tracing_service(tracing_service&&) = delete;
  auto operator=(const tracing_service&) -> tracing_service& = delete;
  auto operator=(tracing_service&&) -> tracing_service& = delete;
  ~tracing_service();

  auto start_span(trace_context& context, std::string name, const start_span_options& options)
    -> span;
  auto end_span(trace_context& context,
                const span& target,
                span_status status,
                std::optional<tao::json::value> outputs) -> std::error_code;

  [[nodiscard]] auto current_trace(const trace_context& context) const
    -> std::optional<trace_info>;
  auto update_current_trace(trace_context& context, const std::map<std::string, std::string>& tags)
    -> std::error_code;

  auto set_trace_tag(const std::string& trace_id, const std::string& key, const std::string& value)
    -> std::error_code;
  auto delete_trace_tag(const std::string& trace_id, const std::string& key) -> std::error_code;

  void enable();
  void disable();
  [[nodiscard]] auto is_enabled() const -> bool;

  auto flush(std::chrono::milliseconds timeout) -> bool;
  void close();

  [[nodiscard]] auto stats() const -> export_stats;
  [[nodiscard]] auto backend() const -> const std::shared_ptr<trace_backend>&;
  [[nodiscard]] auto options() const -> const tracing_options&;
  [[nodiscard]] auto supervisor_running() const -> bool;
  [[nodiscard]] auto in_progress_count() const -> std::size_t;

private:
  void finish(std::shared_ptr<const trace_snapshot> snapshot);
  void submit(std::shared_ptr<const trace_snapshot> snapshot, bool closed_by_supervisor);
  void report_queue_full(const std::string& trace_id);
  auto sleep_unless_closed(std::chrono::milliseconds duration) -> bool;

  const tracing_options options_;
  std::shared_ptr<trace_backend> backend_;
  std::shared_ptr<trace_registry> registry_;
  std::shared_ptr<const export_retry_controller> retry_controller_;
  std::shared_ptr<export_counters> counters_{ std::make_shared<export_counters>() };
  std::unique_ptr<timeout_supervisor> supervisor_{};
  std::unique_ptr<export_worker_pool> pool_{};

  std::atomic<bool> enabled_;
  std::atomic<bool> closed_{ false };
  std::mutex close_mutex_{};
  std::condition_variable close_requested_{};

  std::atomic<std::int64_t> last_drop_warning_{ 0 };
  std::atomic<std::uint64_t> drops_since_warning_{ 0 };
};
} // namespace tracepipe::core::tracing
