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

#include "live_trace.hxx"

#include "core/logger/logger.hxx"
#include "id_generator.hxx"

#include <algorithm>

namespace tracepipe::core::tracing
{
namespace
{
auto
make_span(std::string trace_id,
          std::optional<std::string> parent_id,
          std::string name,
          start_span_options::built&& options) -> span_data
{
  span_data span{};
  span.span_id = generate_span_id();
  span.parent_id = std::move(parent_id);
  span.trace_id = std::move(trace_id);
  span.name = std::move(name);
  span.start_time = std::chrono::system_clock::now();
  span.attributes = std::move(options.attributes);
  span.inputs = std::move(options.inputs);
  return span;
}
} // namespace

live_trace::live_trace(std::string root_name, start_span_options::built options)
{
  info_.trace_id = generate_trace_id();
  info_.run_id = std::move(options.run_id);

  auto root = make_span(info_.trace_id, {}, std::move(root_name), std::move(options));
  info_.root_span_id = root.span_id;
  info_.created_at = root.start_time;
  span_index_.emplace(root.span_id, spans_.size());
  spans_.emplace_back(std::move(root));
}

auto
live_trace::trace_id() const -> const std::string&
{
  return info_.trace_id;
}

auto
live_trace::root_span_id() const -> const std::string&
{
  return info_.root_span_id;
}

auto
live_trace::state() const -> trace_state
{
  return state_.load();
}

auto
live_trace::is_in_progress() const -> bool
{
  return state_.load() == trace_state::in_progress;
}

auto
live_trace::age(std::chrono::steady_clock::time_point now) const
  -> std::chrono::steady_clock::duration
{
  return now - created_steady_;
}

auto
live_trace::add_span(const std::string& parent_id,
                     std::string name,
                     start_span_options::built options) -> std::optional<std::string>
{
  const std::scoped_lock lock(mutex_);
  if (!is_in_progress()) {
    return {};
  }
  auto span = make_span(info_.trace_id, parent_id, std::move(name), std::move(options));
  auto span_id = span.span_id;
  span_index_.emplace(span_id, spans_.size());
  spans_.emplace_back(std::move(span));
  return span_id;
}

auto
live_trace::close_span(const std::string& span_id,
                       span_status status,
                       std::optional<tao::json::value> outputs) -> close_result
{
  const std::scoped_lock lock(mutex_);
  if (!is_in_progress()) {
    return { close_status::trace_finished };
  }
  auto it = span_index_.find(span_id);
  if (it == span_index_.end()) {
    return { close_status::unknown_span };
  }
  auto& span = spans_[it->second];
  if (span.end_time) {
    return { close_status::already_closed };
  }

  const auto now = std::chrono::system_clock::now();
  if (outputs) {
    span.outputs = std::move(outputs.value());
  }
  end_span_locked(span, status, now);

  if (!span.is_root()) {
    return { close_status::closed };
  }

  // spans that are still open at this point belong to other contexts which did not finish in time
  for (auto& other : spans_) {
    if (!other.end_time) {
      TP_LOG_WARNING("span \"{}\" ({}) of trace {} is still open when the root span ends, closing "
                     "it with status ERROR",
                     other.name,
                     other.span_id,
                     info_.trace_id);
      end_span_locked(other, span_status::error, now);
    }
  }
  const bool has_errors = std::any_of(spans_.begin(), spans_.end(), [](const auto& s) {
    return s.status == span_status::error;
  });
  return { close_status::closed,
           finish_locked(has_errors ? trace_state::error : trace_state::ok) };
}

auto
live_trace::force_close() -> std::shared_ptr<const trace_snapshot>
{
  const std::scoped_lock lock(mutex_);
  if (!is_in_progress()) {
    return nullptr;
  }
  const auto now = std::chrono::system_clock::now();
  for (auto& span : spans_) {
    if (!span.end_time) {
      end_span_locked(span, span_status::error, now);
    }
  }
  return finish_locked(trace_state::error);
}

auto
live_trace::is_span_recording(const std::string& span_id) const -> bool
{
  const std::scoped_lock lock(mutex_);
  if (!is_in_progress()) {
    return false;
  }
  auto it = span_index_.find(span_id);
  return it != span_index_.end() && !spans_[it->second].end_time.has_value();
}

void
live_trace::set_attribute(const std::string& span_id, const std::string& key, tao::json::value value)
{
  const std::scoped_lock lock(mutex_);
  if (auto* span = find_open_span_locked(span_id); span != nullptr) {
    span->attributes.insert_or_assign(key, std::move(value));
  }
}

void
live_trace::set_inputs(const std::string& span_id, tao::json::value inputs)
{
  const std::scoped_lock lock(mutex_);
  if (auto* span = find_open_span_locked(span_id); span != nullptr) {
    span->inputs = std::move(inputs);
  }
}

void
live_trace::set_outputs(const std::string& span_id, tao::json::value outputs)
{
  const std::scoped_lock lock(mutex_);
  if (auto* span = find_open_span_locked(span_id); span != nullptr) {
    span->outputs = std::move(outputs);
  }
}

auto
live_trace::set_tag(const std::string& key, const std::string& value) -> bool
{
  const std::scoped_lock lock(mutex_);
  if (!is_in_progress()) {
    return false;
  }
  info_.tags.insert_or_assign(key, value);
  return true;
}

auto
live_trace::delete_tag(const std::string& key) -> bool
{
  const std::scoped_lock lock(mutex_);
  if (!is_in_progress()) {
    return false;
  }
  info_.tags.erase(key);
  return true;
}

auto
live_trace::merge_tags(const std::map<std::string, std::string>& tags) -> bool
{
  const std::scoped_lock lock(mutex_);
  if (!is_in_progress()) {
    return false;
  }
  for (const auto& [key, value] : tags) {
    info_.tags.insert_or_assign(key, value);
  }
  return true;
}

auto
live_trace::info() const -> trace_info
{
  const std::scoped_lock lock(mutex_);
  auto info = info_;
  info.state = state_.load();
  return info;
}

auto
live_trace::find_open_span_locked(const std::string& span_id) -> span_data*
{
  if (!is_in_progress()) {
    return nullptr;
  }
  if (auto it = span_index_.find(span_id); it != span_index_.end()) {
    if (auto& span = spans_[it->second]; !span.end_time) {
      return &span;
    }
  }
  return nullptr;
}

void
live_trace::end_span_locked(span_data& span,
                            span_status status,
                            std::chrono::system_clock::time_point now)
{
  // the system clock may have been adjusted while the span was open
  span.end_time = std::max(now, span.start_time);
  span.status = status;
}

auto
live_trace::finish_locked(trace_state final_state) -> std::shared_ptr<const trace_snapshot>
{
  auto expected = trace_state::in_progress;
  if (!state_.compare_exchange_strong(expected, final_state)) {
    return nullptr;
  }
  auto snapshot = std::make_shared<trace_snapshot>();
  snapshot->info = info_;
  snapshot->info.state = final_state;
  snapshot->spans = spans_;
  return snapshot;
}
} // namespace tracepipe::core::tracing
