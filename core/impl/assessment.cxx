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

#include <tracepipe/assessment.hxx>

#include "core/chrono_utils.hxx"

#include <tao/json.hpp>
#include <tao/json/contrib/traits.hpp>

namespace tracepipe
{
auto
to_string(assessment_source_type type) -> std::string_view
{
    switch (type) {
        case assessment_source_type::human:
            return "HUMAN";
        case assessment_source_type::llm_judge:
            return "LLM_JUDGE";
        case assessment_source_type::code:
            return "CODE";
    }
    return "HUMAN";
}

auto
to_string(assessment_kind kind) -> std::string_view
{
    switch (kind) {
        case assessment_kind::expectation:
            return "expectation";
        case assessment_kind::feedback:
            return "feedback";
    }
    return "feedback";
}

void
assessment_update::apply_to(assessment& target) const
{
    if (value) {
        target.value = value.value();
        // a value replaces a previously recorded failure
        target.error.reset();
    }
    if (error) {
        target.error = error;
    }
    if (rationale) {
        target.rationale = rationale;
    }
    if (metadata) {
        target.metadata = metadata.value();
    }
    target.last_update_time = last_update_time;
}

auto
to_json(const assessment& value) -> tao::json::value
{
    tao::json::value result{
        { "assessment_id", value.assessment_id },
        { "trace_id", value.trace_id },
        { "name", value.name },
        { "kind", to_string(value.kind) },
        {
          "source",
          {
            { "source_type", to_string(value.source.source_type) },
            { "source_id", value.source.source_id },
          },
        },
        { "value", value.value },
        { "metadata", value.metadata },
        { "create_time", core::to_iso8601_utc(value.create_time) },
        { "last_update_time", core::to_iso8601_utc(value.last_update_time) },
    };
    if (value.span_id) {
        result["span_id"] = value.span_id.value();
    }
    if (value.error) {
        result["error"] = {
            { "error_code", value.error->error_code },
        };
        if (value.error->error_message) {
            result["error"]["error_message"] = value.error->error_message.value();
        }
    }
    if (value.rationale) {
        result["rationale"] = value.rationale.value();
    }
    return result;
}
} // namespace tracepipe
