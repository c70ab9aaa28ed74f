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

#include <tao/json/value.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tracepipe
{
enum class span_status {
    unset,
    ok,
    error,
};

/**
 * Lifecycle state of a trace. Moves only from in_progress to one of the final states.
 */
enum class trace_state {
    in_progress,
    ok,
    error,
};

[[nodiscard]] auto
to_string(span_status status) -> std::string_view;

[[nodiscard]] auto
to_string(trace_state state) -> std::string_view;

/**
 * A single unit of work inside a trace.
 *
 * Spans refer to their parent by identifier. The tree is never linked through pointers.
 */
struct span_data {
    std::string span_id;
    std::optional<std::string> parent_id{};
    std::string trace_id;
    std::string name;
    std::chrono::system_clock::time_point start_time{};
    std::optional<std::chrono::system_clock::time_point> end_time{};
    span_status status{ span_status::unset };
    std::map<std::string, tao::json::value> attributes{};
    tao::json::value inputs{ tao::json::null };
    tao::json::value outputs{ tao::json::null };

    [[nodiscard]] auto is_root() const -> bool
    {
        return !parent_id.has_value();
    }
};

/**
 * Trace level metadata.
 */
struct trace_info {
    std::string trace_id;
    std::string root_span_id;
    std::chrono::system_clock::time_point created_at{};
    std::optional<std::string> run_id{};
    std::map<std::string, std::string> tags{};
    trace_state state{ trace_state::in_progress };
};

/**
 * Immutable copy of a finished trace, handed over to the export pipeline.
 */
struct trace_snapshot {
    trace_info info;
    std::vector<span_data> spans;

    [[nodiscard]] auto find_span(std::string_view span_id) const -> const span_data*;
};

/**
 * JSON representation of the snapshot, as written by the file backend.
 */
[[nodiscard]] auto
to_json(const trace_snapshot& snapshot) -> tao::json::value;

[[nodiscard]] auto
to_string(const trace_snapshot& snapshot) -> std::string;
} // namespace tracepipe
