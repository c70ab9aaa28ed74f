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

#include <tracepipe/assessment_client.hxx>

#include "core/logger/logger.hxx"
#include "core/tracing/id_generator.hxx"

#include <tracepipe/error_codes.hxx>
#include <tracepipe/trace_backend.hxx>

#include <chrono>

namespace tracepipe
{
namespace
{
auto
validate_target(const std::string& trace_id, const std::string& assessment_id) -> std::error_code
{
    if (trace_id.empty() || assessment_id.empty()) {
        return errc::tracing::invalid_argument;
    }
    return {};
}

auto
create(trace_backend& backend, assessment&& value) -> std::pair<std::error_code, assessment>
{
    if (auto ec = backend.create_assessment(value); ec) {
        TP_LOG_DEBUG("unable to record {} \"{}\" on trace {}: {}", to_string(value.kind), value.name, value.trace_id, ec.message());
        return { ec, {} };
    }
    return { {}, std::move(value) };
}
} // namespace

assessment_client::assessment_client(std::shared_ptr<trace_backend> backend)
  : backend_{ std::move(backend) }
{
}

auto
assessment_client::log_expectation(const std::string& trace_id,
                                   const std::string& name,
                                   const tao::json::value& value,
                                   const assessment_source& source,
                                   const expectation_options& options) const -> std::pair<std::error_code, assessment>
{
    if (trace_id.empty() || name.empty() || value.is_null()) {
        return { errc::tracing::invalid_argument, {} };
    }
    auto opts = options.build();

    assessment expectation{};
    expectation.assessment_id = core::tracing::generate_assessment_id();
    expectation.trace_id = trace_id;
    expectation.name = name;
    expectation.kind = assessment_kind::expectation;
    expectation.source = source;
    expectation.span_id = std::move(opts.span_id);
    expectation.value = value;
    expectation.metadata = std::move(opts.metadata);
    expectation.create_time = std::chrono::system_clock::now();
    expectation.last_update_time = expectation.create_time;
    return create(*backend_, std::move(expectation));
}

auto
assessment_client::log_feedback(const std::string& trace_id,
                                const std::string& name,
                                const assessment_source& source,
                                const feedback_options& options) const -> std::pair<std::error_code, assessment>
{
    auto opts = options.build();
    if (trace_id.empty() || name.empty()) {
        return { errc::tracing::invalid_argument, {} };
    }
    if (!opts.value && !opts.error) {
        // feedback without a value must explain why it is missing
        return { errc::tracing::invalid_argument, {} };
    }

    assessment feedback{};
    feedback.assessment_id = core::tracing::generate_assessment_id();
    feedback.trace_id = trace_id;
    feedback.name = name;
    feedback.kind = assessment_kind::feedback;
    feedback.source = source;
    feedback.span_id = std::move(opts.span_id);
    if (opts.value) {
        feedback.value = std::move(opts.value.value());
    }
    feedback.error = std::move(opts.error);
    feedback.rationale = std::move(opts.rationale);
    feedback.metadata = std::move(opts.metadata);
    feedback.create_time = std::chrono::system_clock::now();
    feedback.last_update_time = feedback.create_time;
    return create(*backend_, std::move(feedback));
}

auto
assessment_client::update_expectation(const std::string& trace_id, const std::string& assessment_id, const tao::json::value& value) const
  -> std::pair<std::error_code, assessment>
{
    if (auto ec = validate_target(trace_id, assessment_id); ec) {
        return { ec, {} };
    }
    if (value.is_null()) {
        return { errc::tracing::invalid_argument, {} };
    }
    assessment_update update{};
    update.value = value;
    update.last_update_time = std::chrono::system_clock::now();
    return backend_->update_assessment(trace_id, assessment_id, update);
}

auto
assessment_client::update_feedback(const std::string& trace_id,
                                   const std::string& assessment_id,
                                   const feedback_update_options& options) const -> std::pair<std::error_code, assessment>
{
    if (auto ec = validate_target(trace_id, assessment_id); ec) {
        return { ec, {} };
    }
    auto opts = options.build();
    if (!opts.value && !opts.rationale && !opts.metadata) {
        return { errc::tracing::invalid_argument, {} };
    }
    assessment_update update{};
    update.value = std::move(opts.value);
    update.rationale = std::move(opts.rationale);
    update.metadata = std::move(opts.metadata);
    update.last_update_time = std::chrono::system_clock::now();
    return backend_->update_assessment(trace_id, assessment_id, update);
}

auto
assessment_client::delete_expectation(const std::string& trace_id, const std::string& assessment_id) const -> std::error_code
{
    if (auto ec = validate_target(trace_id, assessment_id); ec) {
        return ec;
    }
    return backend_->delete_assessment(trace_id, assessment_id);
}

auto
assessment_client::delete_feedback(const std::string& trace_id, const std::string& assessment_id) const -> std::error_code
{
    if (auto ec = validate_target(trace_id, assessment_id); ec) {
        return ec;
    }
    return backend_->delete_assessment(trace_id, assessment_id);
}
} // namespace tracepipe
