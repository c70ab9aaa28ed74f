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

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tracepipe::core::tracing
{
class live_trace;

/**
 * In-progress traces by identifier. Only touched when a trace starts or finishes, never on the span
 * hot path.
 */
class trace_registry
{
public:
  void add(std::shared_ptr<live_trace> trace);
  void remove(const std::string& trace_id);
  [[nodiscard]] auto find(const std::string& trace_id) const -> std::shared_ptr<live_trace>;
  [[nodiscard]] auto in_progress() const -> std::vector<std::shared_ptr<live_trace>>;
  [[nodiscard]] auto size() const -> std::size_t;
  [[nodiscard]] auto empty() const -> bool;

private:
  mutable std::mutex mutex_{};
  std::unordered_map<std::string, std::shared_ptr<live_trace>> traces_{};
};
} // namespace tracepipe::core::tracing
