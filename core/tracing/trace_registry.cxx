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

#include "trace_registry.hxx"

#include "live_trace.hxx"

namespace tracepipe::core::tracing
{
void
trace_registry::add(std::shared_ptr<live_trace> trace)
{
  const std::scoped_lock lock(mutex_);
  auto trace_id = trace->trace_id();
  traces_.insert_or_assign(std::move(trace_id), std::move(trace));
}

void
trace_registry::remove(const std::string& trace_id)
{
  const std::scoped_lock lock(mutex_);
  traces_.erase(trace_id);
}

auto
trace_registry::find(const std::string& trace_id) const -> std::shared_ptr<live_trace>
{
  const std::scoped_lock lock(mutex_);
  if (auto it = traces_.find(trace_id); it != traces_.end()) {
    return it->second;
  }
  return nullptr;
}

auto
trace_registry::in_progress() const -> std::vector<std::shared_ptr<live_trace>>
{
  const std::scoped_lock lock(mutex_);
  std::vector<std::shared_ptr<live_trace>> result;
  result.reserve(traces_.size());
  for (const auto& [id, trace] : traces_) {
    if (trace->is_in_progress()) {
      result.emplace_back(trace);
    }
  }
  return result;
}

auto
trace_registry::size() const -> std::size_t
{
  const std::scoped_lock lock(mutex_);
  return traces_.size();
}

auto
trace_registry::empty() const -> bool
{
  const std::scoped_lock lock(mutex_);
  return traces_.empty();
}
} // namespace tracepipe::core::tracing
