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

#include "backoff_calculator.hxx"

#include <tracepipe/trace_snapshot.hxx>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string_view>
#include <system_error>

namespace tracepipe
{
class trace_backend;
} // namespace tracepipe

namespace tracepipe::core::tracing
{
enum class export_outcome {
  exported,
  discarded_non_retryable,
  retry_budget_exhausted,
  /// the pool has been stopped while waiting for the next attempt
  abandoned,
};

auto
to_string(export_outcome outcome) -> std::string_view;

struct export_result {
  export_outcome outcome;
  std::size_t attempts{ 0 };
  std::error_code last_error{};

  [[nodiscard]] auto retries() const -> std::size_t
  {
    return attempts > 0 ? attempts - 1 : 0;
  }
};

/**
 * Persists one snapshot, retrying transient failures.
 *
 * The budget starts with the first attempt. A retry is abandoned as soon as the time spent so far,
 * plus the next backoff, would exceed the budget. Permanent failures are never retried.
 */
class export_retry_controller
{
public:
  /**
   * Waits for the given duration. Returns false if the wait has been interrupted.
   */
  using sleeper = std::function<bool(std::chrono::milliseconds)>;

  export_retry_controller(std::shared_ptr<trace_backend> backend,
                          std::chrono::milliseconds retry_timeout,
                          backoff_calculator backoff = default_backoff_calculator);

  auto execute(const trace_snapshot& snapshot, const sleeper& sleep) const -> export_result;

private:
  std::shared_ptr<trace_backend> backend_;
  std::chrono::milliseconds retry_timeout_;
  backoff_calculator backoff_;
};
} // namespace tracepipe::core::tracing
