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

#include <tracepipe/tracer.hxx>

#include "core/tracing/tracing_service.hxx"

#include <stdexcept>

namespace tracepipe
{
tracer::tracer(tracing_options options, std::shared_ptr<trace_backend> backend)
{
    if (backend == nullptr) {
        throw std::invalid_argument("tracepipe::tracer requires a trace backend");
    }
    impl_ = std::make_shared<core::tracing::tracing_service>(std::move(options), std::move(backend));
}

tracer::~tracer()
{
    impl_->close();
}

auto
tracer::start_span(trace_context& context, std::string name, const start_span_options& options) -> span
{
    return impl_->start_span(context, std::move(name), options);
}

auto
tracer::start_span(std::string name, const start_span_options& options) -> span
{
    return impl_->start_span(*trace_context::current(), std::move(name), options);
}

auto
tracer::end_span(trace_context& context, const span& target, span_status status, std::optional<tao::json::value> outputs)
  -> std::error_code
{
    return impl_->end_span(context, target, status, std::move(outputs));
}

auto
tracer::end_span(const span& target, span_status status, std::optional<tao::json::value> outputs) -> std::error_code
{
    return impl_->end_span(*trace_context::current(), target, status, std::move(outputs));
}

auto
tracer::current_trace(const trace_context& context) const -> std::optional<trace_info>
{
    return impl_->current_trace(context);
}

auto
tracer::current_trace() const -> std::optional<trace_info>
{
    return impl_->current_trace(*trace_context::current());
}

auto
tracer::update_current_trace(trace_context& context, const std::map<std::string, std::string>& tags) -> std::error_code
{
    return impl_->update_current_trace(context, tags);
}

auto
tracer::update_current_trace(const std::map<std::string, std::string>& tags) -> std::error_code
{
    return impl_->update_current_trace(*trace_context::current(), tags);
}

auto
tracer::set_trace_tag(const std::string& trace_id, const std::string& key, const std::string& value) -> std::error_code
{
    return impl_->set_trace_tag(trace_id, key, value);
}

auto
tracer::delete_trace_tag(const std::string& trace_id, const std::string& key) -> std::error_code
{
    return impl_->delete_trace_tag(trace_id, key);
}

void
tracer::enable()
{
    impl_->enable();
}

void
tracer::disable()
{
    impl_->disable();
}

auto
tracer::is_enabled() const -> bool
{
    return impl_->is_enabled();
}

auto
tracer::flush(std::chrono::milliseconds timeout) -> bool
{
    return impl_->flush(timeout);
}

void
tracer::close()
{
    impl_->close();
}

auto
tracer::stats() const -> export_stats
{
    return impl_->stats();
}

auto
tracer::assessments() const -> assessment_client
{
    return assessment_client{ impl_->backend() };
}

auto
tracer::options() const -> const tracing_options&
{
    return impl_->options();
}
} // namespace tracepipe
