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

#include <tracepipe/trace_snapshot.hxx>

#include "core/chrono_utils.hxx"

#include <tao/json.hpp>
#include <tao/json/contrib/traits.hpp>

#include <algorithm>

namespace tao::json
{
template<>
struct traits<tracepipe::span_data> {
    template<template<typename...> class Traits>
    static void assign(basic_value<Traits>& v, const tracepipe::span_data& span)
    {
        v = {
            { "span_id", span.span_id },
            { "trace_id", span.trace_id },
            { "name", span.name },
            { "start_time", tracepipe::core::to_iso8601_utc(span.start_time) },
            { "status", tracepipe::to_string(span.status) },
            { "attributes", span.attributes },
            { "inputs", span.inputs },
            { "outputs", span.outputs },
        };
        if (span.parent_id) {
            v["parent_id"] = span.parent_id.value();
        } else {
            v["parent_id"] = null;
        }
        if (span.end_time) {
            v["end_time"] = tracepipe::core::to_iso8601_utc(span.end_time.value());
        } else {
            v["end_time"] = null;
        }
    }
};

template<>
struct traits<tracepipe::trace_info> {
    template<template<typename...> class Traits>
    static void assign(basic_value<Traits>& v, const tracepipe::trace_info& info)
    {
        v = {
            { "trace_id", info.trace_id },
            { "root_span_id", info.root_span_id },
            { "created_at", tracepipe::core::to_iso8601_utc(info.created_at) },
            { "state", tracepipe::to_string(info.state) },
            { "tags", info.tags },
        };
        if (info.run_id) {
            v["run_id"] = info.run_id.value();
        }
    }
};

template<>
struct traits<tracepipe::trace_snapshot> {
    template<template<typename...> class Traits>
    static void assign(basic_value<Traits>& v, const tracepipe::trace_snapshot& snapshot)
    {
        v = {
            { "info", snapshot.info },
            { "spans", snapshot.spans },
        };
    }
};
} // namespace tao::json

namespace tracepipe
{
auto
to_string(span_status status) -> std::string_view
{
    switch (status) {
        case span_status::unset:
            return "UNSET";
        case span_status::ok:
            return "OK";
        case span_status::error:
            return "ERROR";
    }
    return "UNSET";
}

auto
to_string(trace_state state) -> std::string_view
{
    switch (state) {
        case trace_state::in_progress:
            return "IN_PROGRESS";
        case trace_state::ok:
            return "OK";
        case trace_state::error:
            return "ERROR";
    }
    return "IN_PROGRESS";
}

auto
trace_snapshot::find_span(std::string_view span_id) const -> const span_data*
{
    auto it = std::find_if(spans.begin(), spans.end(), [span_id](const auto& span) {
        return span.span_id == span_id;
    });
    return it == spans.end() ? nullptr : &*it;
}

auto
to_json(const trace_snapshot& snapshot) -> tao::json::value
{
    return snapshot;
}

auto
to_string(const trace_snapshot& snapshot) -> std::string
{
    return tao::json::to_string(to_json(snapshot));
}
} // namespace tracepipe
