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

#include <tracepipe/span.hxx>

#include <memory>
#include <mutex>
#include <vector>

namespace tracepipe
{
/**
 * Stack of the spans opened by one execution context (a thread, a task, a coroutine).
 *
 * The top of the stack is the parent of the next span started in this context. Contexts are never
 * shared implicitly: a thread that does not attach a context gets its own fresh one from current().
 */
class trace_context
{
  public:
    trace_context() = default;
    trace_context(const trace_context&) = delete;
    trace_context(trace_context&&) = delete;
    auto operator=(const trace_context&) -> trace_context& = delete;
    auto operator=(trace_context&&) -> trace_context& = delete;
    ~trace_context() = default;

    /**
     * Context attached to the calling thread, created on first use.
     */
    static auto current() -> std::shared_ptr<trace_context>;

    /**
     * Creates a context for another thread or task. Spans started in it become children of the
     * current span of this context, and belong to the same trace.
     */
    [[nodiscard]] auto propagate() const -> std::shared_ptr<trace_context>;

    /**
     * The innermost open span, or a non-recording span when the context is empty.
     */
    [[nodiscard]] auto current_span() const -> span;

    [[nodiscard]] auto depth() const -> std::size_t;

  private:
    friend class core::tracing::tracing_service;

    explicit trace_context(span parent);

    mutable std::mutex mutex_{};
    span parent_{};
    std::vector<span> stack_{};
};

/**
 * Attaches a context to the calling thread for the lifetime of the scope, restoring the previous
 * one on exit.
 */
class context_scope
{
  public:
    explicit context_scope(std::shared_ptr<trace_context> context);
    context_scope(const context_scope&) = delete;
    context_scope(context_scope&&) = delete;
    auto operator=(const context_scope&) -> context_scope& = delete;
    auto operator=(context_scope&&) -> context_scope& = delete;
    ~context_scope();

  private:
    std::shared_ptr<trace_context> previous_;
};
} // namespace tracepipe
