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

#include <tracepipe/assessment_client.hxx>
#include <tracepipe/export_stats.hxx>
#include <tracepipe/span.hxx>
#include <tracepipe/trace_backend.hxx>
#include <tracepipe/trace_context.hxx>
#include <tracepipe/trace_snapshot.hxx>
#include <tracepipe/tracing_options.hxx>

#include <tao/json/value.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

namespace tracepipe
{
namespace core::tracing
{
class tracing_service;
} // namespace core::tracing

/**
 * Entry point of the library.
 *
 * The tracer records spans into traces, supervises traces that never finish, and exports finished
 * traces to the backend in the background. Every operation that needs an execution context has an
 * overload taking it explicitly, and one that uses the context attached to the calling thread
 * (see trace_context::current()).
 *
 * Export failures never reach the application, they are logged and reflected in stats().
 */
class tracer
{
  public:
    /**
     * @throws std::invalid_argument if the backend is null
     */
    tracer(tracing_options options, std::shared_ptr<trace_backend> backend);

    tracer(const tracer&) = delete;
    tracer(tracer&&) = delete;
    auto operator=(const tracer&) -> tracer& = delete;
    auto operator=(tracer&&) -> tracer& = delete;

    /**
     * Closes the tracer, see close().
     */
    ~tracer();

    /**
     * Starts a span as a child of the current span of the context. Without a current span, a new
     * trace is created with the span as its root.
     *
     * Returns a non-recording span when tracing is disabled or the tracer is closed.
     */
    auto start_span(trace_context& context, std::string name, const start_span_options& options = {}) -> span;
    auto start_span(std::string name, const start_span_options& options = {}) -> span;

    /**
     * Ends a span opened in the context.
     *
     * Still-open spans above it are closed with span_status::error. Ending the root span finishes
     * the trace and hands it to the export pipeline.
     *
     * @return errc::tracing::span_state_error if the span is not open in the context
     */
    auto end_span(trace_context& context,
                  const span& target,
                  span_status status = span_status::ok,
                  std::optional<tao::json::value> outputs = {}) -> std::error_code;
    auto end_span(const span& target, span_status status = span_status::ok, std::optional<tao::json::value> outputs = {})
      -> std::error_code;

    [[nodiscard]] auto current_trace(const trace_context& context) const -> std::optional<trace_info>;
    [[nodiscard]] auto current_trace() const -> std::optional<trace_info>;

    /**
     * Merges tags into the in-progress trace of the context.
     *
     * @return errc::tracing::trace_not_active if the context has no in-progress trace
     */
    auto update_current_trace(trace_context& context, const std::map<std::string, std::string>& tags) -> std::error_code;
    auto update_current_trace(const std::map<std::string, std::string>& tags) -> std::error_code;

    /**
     * Sets a tag on a trace. Applied in memory while the trace is in progress, written to the
     * backend once it has finished.
     */
    auto set_trace_tag(const std::string& trace_id, const std::string& key, const std::string& value) -> std::error_code;
    auto delete_trace_tag(const std::string& trace_id, const std::string& key) -> std::error_code;

    void enable();
    void disable();
    [[nodiscard]] auto is_enabled() const -> bool;

    /**
     * Waits until every finished trace has been exported or discarded.
     *
     * @return false if the timeout elapsed first
     */
    auto flush(std::chrono::milliseconds timeout) -> bool;

    /**
     * Stops the timeout supervisor, waits up to tracing_options::shutdown_flush_timeout() for the
     * pending exports, and stops the workers. Idempotent.
     */
    void close();

    [[nodiscard]] auto stats() const -> export_stats;

    [[nodiscard]] auto assessments() const -> assessment_client;

    [[nodiscard]] auto options() const -> const tracing_options&;

  private:
    std::shared_ptr<core::tracing::tracing_service> impl_;
};
} // namespace tracepipe
