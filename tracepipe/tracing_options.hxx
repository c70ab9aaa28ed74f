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

#include <chrono>
#include <cstddef>
#include <optional>

namespace tracepipe
{
/**
 * Settings of the tracer. Every setter returns a reference to the options, so that calls can be
 * chained.
 *
 * @see core::tracing::load_options_from_environment() for the environment variables that override
 * these values.
 */
class tracing_options
{
  public:
    static constexpr std::chrono::milliseconds default_timeout_check_interval{ std::chrono::seconds{ 1 } };
    static constexpr std::size_t default_supervisor_idle_ticks{ 5 };
    static constexpr std::size_t default_max_workers{ 10 };
    static constexpr std::size_t default_max_queue_size{ 1'000 };
    static constexpr std::chrono::milliseconds default_export_retry_timeout{ std::chrono::seconds{ 500 } };
    static constexpr std::chrono::milliseconds default_backoff_base{ 100 };
    static constexpr double default_backoff_factor{ 2.0 };
    static constexpr double default_backoff_jitter{ 0.4 };
    static constexpr std::chrono::milliseconds default_shutdown_flush_timeout{ std::chrono::seconds{ 10 } };

    /**
     * Maximum lifetime of a trace. Traces that are still in progress after this time are closed
     * with status ERROR. Zero disables the timeout supervisor.
     */
    auto trace_timeout(std::chrono::milliseconds timeout) -> tracing_options&
    {
        if (timeout.count() > 0) {
            trace_timeout_ = timeout;
        } else {
            trace_timeout_.reset();
        }
        return *this;
    }

    /**
     * How often the supervisor looks for expired traces. Values below one millisecond are ignored.
     */
    auto timeout_check_interval(std::chrono::milliseconds interval) -> tracing_options&
    {
        if (interval.count() > 0) {
            timeout_check_interval_ = interval;
        }
        return *this;
    }

    /**
     * How long the supervisor keeps polling after the last in-progress trace went away. Defaults
     * to five check intervals, values below one millisecond are ignored.
     */
    auto supervisor_idle_grace(std::chrono::milliseconds grace) -> tracing_options&
    {
        if (grace.count() > 0) {
            supervisor_idle_grace_ = grace;
        }
        return *this;
    }

    auto max_workers(std::size_t workers) -> tracing_options&
    {
        max_workers_ = workers;
        return *this;
    }

    auto max_queue_size(std::size_t size) -> tracing_options&
    {
        max_queue_size_ = size;
        return *this;
    }

    /**
     * Total time a single trace may spend in retries before it is discarded.
     */
    auto export_retry_timeout(std::chrono::milliseconds timeout) -> tracing_options&
    {
        export_retry_timeout_ = timeout;
        return *this;
    }

    auto backoff_base(std::chrono::milliseconds base) -> tracing_options&
    {
        backoff_base_ = base;
        return *this;
    }

    auto backoff_factor(double factor) -> tracing_options&
    {
        backoff_factor_ = factor;
        return *this;
    }

    /**
     * Upper bound of the random part of each backoff step, as a fraction of the step.
     */
    auto backoff_jitter(double jitter) -> tracing_options&
    {
        backoff_jitter_ = jitter;
        return *this;
    }

    /**
     * When disabled, finished traces are persisted synchronously on the thread that finished them.
     */
    auto async_export(bool enabled) -> tracing_options&
    {
        async_export_ = enabled;
        return *this;
    }

    auto shutdown_flush_timeout(std::chrono::milliseconds timeout) -> tracing_options&
    {
        shutdown_flush_timeout_ = timeout;
        return *this;
    }

    /**
     * Initial state of the tracing switch.
     */
    auto enabled(bool enabled) -> tracing_options&
    {
        enabled_ = enabled;
        return *this;
    }

    [[nodiscard]] auto trace_timeout() const -> std::optional<std::chrono::milliseconds>
    {
        return trace_timeout_;
    }

    [[nodiscard]] auto timeout_check_interval() const -> std::chrono::milliseconds
    {
        return timeout_check_interval_;
    }

    [[nodiscard]] auto supervisor_idle_grace() const -> std::chrono::milliseconds
    {
        if (supervisor_idle_grace_) {
            return supervisor_idle_grace_.value();
        }
        return timeout_check_interval_ * default_supervisor_idle_ticks;
    }

    [[nodiscard]] auto max_workers() const -> std::size_t
    {
        return max_workers_;
    }

    [[nodiscard]] auto max_queue_size() const -> std::size_t
    {
        return max_queue_size_;
    }

    [[nodiscard]] auto export_retry_timeout() const -> std::chrono::milliseconds
    {
        return export_retry_timeout_;
    }

    [[nodiscard]] auto backoff_base() const -> std::chrono::milliseconds
    {
        return backoff_base_;
    }

    [[nodiscard]] auto backoff_factor() const -> double
    {
        return backoff_factor_;
    }

    [[nodiscard]] auto backoff_jitter() const -> double
    {
        return backoff_jitter_;
    }

    [[nodiscard]] auto async_export() const -> bool
    {
        return async_export_;
    }

    [[nodiscard]] auto shutdown_flush_timeout() const -> std::chrono::milliseconds
    {
        return shutdown_flush_timeout_;
    }

    [[nodiscard]] auto enabled() const -> bool
    {
        return enabled_;
    }

  private:
    std::optional<std::chrono::milliseconds> trace_timeout_{};
    std::chrono::milliseconds timeout_check_interval_{ default_timeout_check_interval };
    std::optional<std::chrono::milliseconds> supervisor_idle_grace_{};
    std::size_t max_workers_{ default_max_workers };
    std::size_t max_queue_size_{ default_max_queue_size };
    std::chrono::milliseconds export_retry_timeout_{ default_export_retry_timeout };
    std::chrono::milliseconds backoff_base_{ default_backoff_base };
    double backoff_factor_{ default_backoff_factor };
    double backoff_jitter_{ default_backoff_jitter };
    bool async_export_{ true };
    std::chrono::milliseconds shutdown_flush_timeout_{ default_shutdown_flush_timeout };
    bool enabled_{ true };
};
} // namespace tracepipe
