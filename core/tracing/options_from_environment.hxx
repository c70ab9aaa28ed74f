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

#include <tracepipe/tracing_options.hxx>

#include <chrono>
#include <optional>
#include <string>

namespace tracepipe::core::tracing
{
/**
 * Overrides the options with the values of the environment variables that are set:
 *
 * - TRACEPIPE_TRACE_TIMEOUT_SECONDS (zero disables the timeout)
 * - TRACEPIPE_TRACE_TIMEOUT_CHECK_INTERVAL_SECONDS
 * - TRACEPIPE_ASYNC_TRACE_LOGGING_MAX_WORKERS
 * - TRACEPIPE_ASYNC_TRACE_LOGGING_MAX_QUEUE_SIZE
 * - TRACEPIPE_ASYNC_TRACE_LOGGING_RETRY_TIMEOUT
 * - TRACEPIPE_ENABLE_ASYNC_TRACE_LOGGING
 * - TRACEPIPE_SHUTDOWN_FLUSH_TIMEOUT
 *
 * Durations are seconds (fractions allowed) or duration strings like "1m30s". Values that cannot be
 * parsed are reported in the log and ignored.
 */
auto
load_options_from_environment(tracing_options base = {}) -> tracing_options;

/**
 * "2.5" is read as seconds, anything else with parse_duration().
 */
auto
parse_seconds_or_duration(const std::string& text) -> std::optional<std::chrono::milliseconds>;

auto
parse_positive_integer(const std::string& text) -> std::optional<std::size_t>;

auto
parse_boolean(const std::string& text) -> std::optional<bool>;
} // namespace tracepipe::core::tracing
