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

#include <tracepipe/span.hxx>
#include <tracepipe/trace_snapshot.hxx>

#include <tao/json/value.hpp>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tracepipe::core::tracing
{
enum class close_status {
  /// the span was open and is now closed
  closed,
  /// the span had been closed before
  already_closed,
  /// the trace has already left the in-progress state, nothing was changed
  trace_finished,
  unknown_span,
};

struct close_result {
  close_status status;
  /// set only for the call that finished the trace
  std::shared_ptr<const trace_snapshot> snapshot{};
};

/**
 * Mutable state of an in-progress trace.
 *
 * Span data and tags are guarded by the trace mutex. The state only moves from in_progress to a
 * final state through finish_locked(), and the snapshot is produced by the same call, so exactly
 * one of a natural root close and a timeout close wins.
 */
class live_trace
{
public:
  live_trace(std::string root_name, start_span_options::built options);

  live_trace(const live_trace&) = delete;
  live_trace(live_trace&&) = delete;
  auto operator=(const live_trace&) -> live_trace& = delete;
  auto operator=(live_trace&&) -> live_trace& = delete;
  ~live_trace() = default;

  [[nodiscard]] auto trace_id() const -> const std::string&;
  [[nodiscard]] auto root_span_id() const -> const std::string&;
  [[nodiscard]] auto state() const -> trace_state;
  [[nodiscard]] auto is_in_progress() const -> bool;
  [[nodiscard]] auto age(std::chrono::steady_clock::time_point now) const -> std::chrono::steady_clock::duration;

  /**
   * Adds a child span.
   *
   * @return identifier of the new span, or empty if the trace is no longer in progress
   */
  auto add_span(const std::string& parent_id, std::string name, start_span_options::built options)
    -> std::optional<std::string>;

  /**
   * Closes a span. Closing the root also closes every span left open (with status error) and
   * finishes the trace.
   */
  auto close_span(const std::string& span_id,
                  span_status status,
                  std::optional<tao::json::value> outputs) -> close_result;

  /**
   * Finishes the trace with status error, closing every open span at the current time.
   *
   * @return the snapshot, or null if the trace had already finished
   */
  auto force_close() -> std::shared_ptr<const trace_snapshot>;

  [[nodiscard]] auto is_span_recording(const std::string& span_id) const -> bool;
  void set_attribute(const std::string& span_id, const std::string& key, tao::json::value value);
  void set_inputs(const std::string& span_id, tao::json::value inputs);
  void set_outputs(const std::string& span_id, tao::json::value outputs);

  /**
   * Tag writes return false once the trace has finished, the caller must then forward them to the
   * backend.
   */
  auto set_tag(const std::string& key, const std::string& value) -> bool;
  auto delete_tag(const std::string& key) -> bool;
  auto merge_tags(const std::map<std::string, std::string>& tags) -> bool;

  [[nodiscard]] auto info() const -> trace_info;

private:
  auto find_open_span_locked(const std::string& span_id) -> span_data*;
  void end_span_locked(span_data& span,
                       span_status status,
                       std::chrono::system_clock::time_point now);
  auto finish_locked(trace_state final_state) -> std::shared_ptr<const trace_snapshot>;

  const std::chrono::steady_clock::time_point created_steady_{ std::chrono::steady_clock::now() };
  trace_info info_;
  std::atomic<trace_state> state_{ trace_state::in_progress };
  mutable std::mutex mutex_{};
  std::vector<span_data> spans_{};
  std::unordered_map<std::string, std::size_t> span_index_{};
};
} // namespace tracepipe::core::tracing
