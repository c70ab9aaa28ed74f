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

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace tracepipe
{
namespace core::tracing
{
class live_trace;
class tracing_service;
} // namespace core::tracing

class start_span_options
{
  public:
    auto attribute(std::string key, tao::json::value value) -> start_span_options&
    {
        attributes_.insert_or_assign(std::move(key), std::move(value));
        return *this;
    }

    auto inputs(tao::json::value inputs) -> start_span_options&
    {
        inputs_ = std::move(inputs);
        return *this;
    }

    /**
     * Associates the trace with a run. Only honoured for root spans.
     */
    auto run_id(std::string run_id) -> start_span_options&
    {
        run_id_ = std::move(run_id);
        return *this;
    }

    struct built {
        std::map<std::string, tao::json::value> attributes{};
        tao::json::value inputs{ tao::json::null };
        std::optional<std::string> run_id{};
    };

    [[nodiscard]] auto build() const -> built
    {
        return { attributes_, inputs_, run_id_ };
    }

  private:
    std::map<std::string, tao::json::value> attributes_{};
    tao::json::value inputs_{ tao::json::null };
    std::optional<std::string> run_id_{};
};

/**
 * Handle to a span started by the tracer.
 *
 * A default constructed handle, or one returned while tracing is disabled, is non-recording: every
 * write is ignored and ending it always succeeds. Writes are also ignored once the span has ended or
 * its trace has left the in-progress state.
 */
class span
{
  public:
    span() = default;

    void set_attribute(const std::string& key, tao::json::value value);
    void set_inputs(tao::json::value inputs);
    void set_outputs(tao::json::value outputs);

    [[nodiscard]] auto id() const -> const std::string&
    {
        return span_id_;
    }

    [[nodiscard]] auto trace_id() const -> const std::string&
    {
        return trace_id_;
    }

    [[nodiscard]] auto is_recording() const -> bool;

    [[nodiscard]] auto is_noop() const -> bool
    {
        return trace_ == nullptr;
    }

  private:
    friend class core::tracing::tracing_service;

    span(std::shared_ptr<core::tracing::live_trace> trace, std::string span_id);

    std::shared_ptr<core::tracing::live_trace> trace_{};
    std::string trace_id_{};
    std::string span_id_{};
};
} // namespace tracepipe
