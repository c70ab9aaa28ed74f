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

#include <system_error>

namespace tracepipe
{
namespace core::impl
{
const std::error_category&
tracing_category() noexcept;

const std::error_category&
export_category() noexcept;
} // namespace core::impl

namespace errc
{
/**
 * Errors reported synchronously to the instrumented application.
 */
enum class tracing {
    /**
     * The span is unknown to the execution context that tries to close it: it was never started
     * there, or it has already been closed.
     */
    span_state_error = 1,

    /**
     * The operation needs an in-progress trace, but the context has none, or the trace has already
     * been finalized.
     */
    trace_not_active = 2,

    /**
     * The trace exceeded its configured lifetime and has been force-closed by the supervisor.
     *
     * Only used internally and in logs, never returned to application code.
     */
    trace_timeout = 3,

    /**
     * Arguments supplied by the caller are invalid.
     */
    invalid_argument = 4,

    /**
     * The tracer has been closed.
     */
    tracer_closed = 5,
};

/**
 * Errors produced by a trace backend. They never reach the instrumented application, and only
 * drive the retry decisions of the export workers.
 */
enum class export_failure {
    /**
     * The backend could not be reached. Retryable.
     */
    backend_unavailable = 1,

    /**
     * The backend reported an internal (5xx-like) failure. Retryable.
     */
    server_error = 2,

    /**
     * The request to the backend timed out. Retryable.
     */
    request_timeout = 3,

    /**
     * The backend rejected the payload as malformed. Not retryable.
     */
    malformed_payload = 4,

    /**
     * The backend rejected the credentials. Not retryable.
     */
    authentication_failure = 5,

    /**
     * The backend denied access to the resource. Not retryable.
     */
    permission_denied = 6,

    /**
     * The backend does not know the referenced trace or assessment. Not retryable.
     */
    resource_not_found = 7,
};

inline std::error_code
make_error_code(tracing e) noexcept
{
    return { static_cast<int>(e), core::impl::tracing_category() };
}

inline std::error_code
make_error_code(export_failure e) noexcept
{
    return { static_cast<int>(e), core::impl::export_category() };
}
} // namespace errc

/**
 * Tells whether an export failure is transient and worth retrying.
 *
 * Only backend_unavailable, server_error and request_timeout are retryable; errors of any other
 * category are treated as permanent.
 */
[[nodiscard]] auto
is_retryable(std::error_code ec) -> bool;
} // namespace tracepipe

template<>
struct std::is_error_code_enum<tracepipe::errc::tracing> : std::true_type {
};

template<>
struct std::is_error_code_enum<tracepipe::errc::export_failure> : std::true_type {
};
