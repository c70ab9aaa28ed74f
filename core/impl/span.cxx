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

#include <tracepipe/span.hxx>

#include "core/tracing/live_trace.hxx"

namespace tracepipe
{
span::span(std::shared_ptr<core::tracing::live_trace> trace, std::string span_id)
  : trace_{ std::move(trace) }
  , trace_id_{ trace_->trace_id() }
  , span_id_{ std::move(span_id) }
{
}

void
span::set_attribute(const std::string& key, tao::json::value value)
{
    if (trace_) {
        trace_->set_attribute(span_id_, key, std::move(value));
    }
}

void
span::set_inputs(tao::json::value inputs)
{
    if (trace_) {
        trace_->set_inputs(span_id_, std::move(inputs));
    }
}

void
span::set_outputs(tao::json::value outputs)
{
    if (trace_) {
        trace_->set_outputs(span_id_, std::move(outputs));
    }
}

auto
span::is_recording() const -> bool
{
    return trace_ != nullptr && trace_->is_span_recording(span_id_);
}
} // namespace tracepipe
