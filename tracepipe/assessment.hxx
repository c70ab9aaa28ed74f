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

namespace tracepipe
{
enum class assessment_source_type {
    human,
    llm_judge,
    code,
};

enum class assessment_kind {
    expectation,
    feedback,
};

[[nodiscard]] auto
to_string(assessment_source_type type) -> std::string_view;

[[nodiscard]] auto
to_string(assessment_kind kind) -> std::string_view;

/**
 * Who produced the assessment: a person, an LLM acting as a judge, or a deterministic check.
 */
struct assessment_source {
    assessment_source_type source_type{ assessment_source_type::human };
    std::string source_id{ "default" };
};

/**
 * Describes why a feedback value could not be computed.
 */
struct assessment_error {
    std::string error_code;
    std::optional<std::string> error_message{};
};

/**
 * A label attached to a trace (and optionally to one of its spans) after the fact.
 *
 * Expectations carry the ground truth for the traced operation. Feedback carries a judgement about
 * the actual outcome, or an error explaining why the judgement is missing.
 */
struct assessment {
    std::string assessment_id;
    std::string trace_id;
    std::string name;
    assessment_kind kind{ assessment_kind::feedback };
    assessment_source source{};
    std::optional<std::string> span_id{};
    tao::json::value value{ tao::json::null };
    std::optional<assessment_error> error{};
    std::optional<std::string> rationale{};
    std::map<std::string, std::string> metadata{};
    std::chrono::system_clock::time_point create_time{};
    std::chrono::system_clock::time_point last_update_time{};
};

/**
 * Partial update of an assessment. Only the fields that are set are changed, the name never is.
 */
struct assessment_update {
    std::optional<tao::json::value> value{};
    std::optional<assessment_error> error{};
    std::optional<std::string> rationale{};
    std::optional<std::map<std::string, std::string>> metadata{};
    std::chrono::system_clock::time_point last_update_time{};

    /**
     * Applies the update to the assessment in place.
     */
    void apply_to(assessment& target) const;
};

[[nodiscard]] auto
to_json(const assessment& value) -> tao::json::value;
} // namespace tracepipe
