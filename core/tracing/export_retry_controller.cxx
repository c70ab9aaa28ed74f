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

#include "export_retry_controller.hxx"

#include "core/logger/logger.hxx"

#include <tracepipe/error_codes.hxx>
#include <tracepipe/trace_backend.hxx>

namespace tracepipe::core::tracing
{
auto
to_string(export_outcome outcome) -> std::string_view
{
  switch (outcome) {
    case export_outcome::exported:
      return "exported";
    case export_outcome::discarded_non_retryable:
      return "discarded_non_retryable";
    case export_outcome::retry_budget_exhausted:
      return "retry_budget_exhausted";
    case export_outcome::abandoned:
      return "abandoned";
  }
  return "unknown";
}

export_retry_controller::export_retry_controller(std::shared_ptr<trace_backend> backend,
                                                 std::chrono::milliseconds retry_timeout,
                                                 backoff_calculator backoff)
  : backend_{ std::move(backend) }
  , retry_timeout_{ retry_timeout }
  , backoff_{ std::move(backoff) }
{
}

auto
export_retry_controller::execute(const trace_snapshot& snapshot, const sleeper& sleep) const
  -> export_result
{
  const auto& trace_id = snapshot.info.trace_id;
  const auto start = std::chrono::steady_clock::now();
  std::size_t attempts{ 0 };

  while (true) {
    auto ec = backend_->persist_trace(snapshot);
    ++attempts;
    if (!ec) {
      TP_LOG_TRACE("trace {} exported, attempts={}", trace_id, attempts);
      return { export_outcome::exported, attempts, {} };
    }

    if (!is_retryable(ec)) {
      TP_LOG_WARNING("unable to export trace {}, the backend rejected it with a permanent error, "
                     "discarding: {}",
                     trace_id,
                     ec.message());
      return { export_outcome::discarded_non_retryable, attempts, ec };
    }

    auto backoff = backoff_(attempts - 1);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
    if (elapsed + backoff > retry_timeout_) {
      // Retrying will exceed the budget, give up immediately instead.
      TP_LOG_WARNING("unable to export trace {} within {}ms, discarding after {} attempt(s): {}",
                     trace_id,
                     retry_timeout_.count(),
                     attempts,
                     ec.message());
      return { export_outcome::retry_budget_exhausted, attempts, ec };
    }

    TP_LOG_DEBUG("export of trace {} failed ({}), retrying in {}ms, attempt={}",
                 trace_id,
                 ec.message(),
                 backoff.count(),
                 attempts);
    if (!sleep(backoff)) {
      TP_LOG_WARNING("export of trace {} abandoned during shutdown after {} attempt(s): {}",
                     trace_id,
                     attempts,
                     ec.message());
      return { export_outcome::abandoned, attempts, ec };
    }
  }
}
} // namespace tracepipe::core::tracing
