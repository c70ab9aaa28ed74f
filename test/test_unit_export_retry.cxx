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

#include "test_helper.hxx"

#include "core/tracing/backoff_calculator.hxx"
#include "core/tracing/export_retry_controller.hxx"

#include <tracepipe/tracer.hxx>

#include <catch2/generators/catch_generators.hpp>

#include <memory>
#include <stdexcept>
#include <vector>

using namespace std::chrono_literals;

namespace
{
auto
make_snapshot() -> tracepipe::trace_snapshot
{
  tracepipe::trace_snapshot snapshot{};
  snapshot.info.trace_id = "tr-00000000000000000000000000000001";
  snapshot.info.root_span_id = "0000000000000001";
  snapshot.info.state = tracepipe::trace_state::ok;
  return snapshot;
}

auto
doubling_backoff(std::size_t retry_attempts) -> std::chrono::milliseconds
{
  return 100ms * (1U << retry_attempts);
}

class throwing_backend : public test::utils::recording_backend
{
public:
  explicit throwing_backend(bool standard)
    : standard_{ standard }
  {
  }

  auto persist_trace(const tracepipe::trace_snapshot& /* snapshot */) -> std::error_code override
  {
    if (standard_) {
      throw std::runtime_error("backend crashed");
    }
    throw 42;
  }

private:
  bool standard_;
};

struct recording_sleeper {
  std::vector<std::chrono::milliseconds> delays{};
  bool interrupted{ false };

  auto as_function() -> tracepipe::core::tracing::export_retry_controller::sleeper
  {
    return [this](std::chrono::milliseconds delay) {
      delays.push_back(delay);
      return !interrupted;
    };
  }
};
} // namespace

TEST_CASE("unit: backoff delays grow strictly", "[unit][export_retry]")
{
  auto backoff = tracepipe::core::tracing::exponential_backoff_with_bounded_jitter(100ms, 2.0, 0.4);

  for (int round = 0; round < 20; ++round) {
    auto previous = backoff(0);
    REQUIRE(previous >= 100ms);
    REQUIRE(previous < 140ms);
    for (std::size_t attempt = 1; attempt < 10; ++attempt) {
      auto delay = backoff(attempt);
      REQUIRE(delay > previous);
      previous = delay;
    }
  }

  SECTION("jitter too wide for the factor is narrowed")
  {
    auto wide = tracepipe::core::tracing::exponential_backoff_with_bounded_jitter(10ms, 1.5, 3.0);
    for (std::size_t attempt = 0; attempt < 8; ++attempt) {
      REQUIRE(wide(attempt + 1) > wide(attempt));
    }
  }

  SECTION("small base and factor")
  {
    struct parameters {
      std::chrono::milliseconds base;
      double factor;
      double jitter;
    };
    auto [base, factor, jitter] = GENERATE(parameters{ 1ms, 1.2, 0.4 },
                                           parameters{ 3ms, 1.5, 0.1 },
                                           parameters{ 7ms, 1.05, 0.0 },
                                           parameters{ 1ms, 1.01, 0.005 });
    CAPTURE(base.count(), factor, jitter);
    auto slow = tracepipe::core::tracing::exponential_backoff_with_bounded_jitter(base, factor, jitter);
    for (int round = 0; round < 20; ++round) {
      auto previous = slow(0);
      REQUIRE(previous >= base);
      for (std::size_t attempt = 1; attempt < 16; ++attempt) {
        auto delay = slow(attempt);
        REQUIRE(delay > previous);
        previous = delay;
      }
    }
  }

  SECTION("default calculator")
  {
    REQUIRE(tracepipe::core::tracing::default_backoff_calculator(0) >= 100ms);
    REQUIRE(tracepipe::core::tracing::default_backoff_calculator(3) >= 800ms);
  }
}

TEST_CASE("unit: export retry controller", "[unit][export_retry]")
{
  test::utils::init_logger();
  auto backend = std::make_shared<test::utils::recording_backend>();
  tracepipe::core::tracing::export_retry_controller controller{ backend, 1000ms, doubling_backoff };
  recording_sleeper sleeper{};
  auto snapshot = make_snapshot();

  SECTION("exports on the first attempt")
  {
    auto result = controller.execute(snapshot, sleeper.as_function());
    REQUIRE(result.outcome == tracepipe::core::tracing::export_outcome::exported);
    REQUIRE(result.attempts == 1);
    REQUIRE(result.retries() == 0);
    REQUIRE(sleeper.delays.empty());
    REQUIRE(backend->trace_count() == 1);
  }

  SECTION("retries transient failures")
  {
    backend->script_errors({
      tracepipe::errc::export_failure::backend_unavailable,
      tracepipe::errc::export_failure::request_timeout,
    });
    auto result = controller.execute(snapshot, sleeper.as_function());
    REQUIRE(result.outcome == tracepipe::core::tracing::export_outcome::exported);
    REQUIRE(result.attempts == 3);
    REQUIRE(result.retries() == 2);
    REQUIRE(sleeper.delays == std::vector<std::chrono::milliseconds>{ 100ms, 200ms });
    REQUIRE(backend->trace_count() == 1);
  }

  SECTION("gives up before the budget would be exceeded")
  {
    backend->fail_always(tracepipe::errc::export_failure::server_error);
    auto result = controller.execute(snapshot, sleeper.as_function());
    REQUIRE(result.outcome == tracepipe::core::tracing::export_outcome::retry_budget_exhausted);
    // 100 + 200 + 400 + 800 fit into one second, the next backoff of 1600ms does not
    REQUIRE(result.attempts == 5);
    REQUIRE(result.last_error == tracepipe::errc::export_failure::server_error);
    REQUIRE(sleeper.delays ==
            std::vector<std::chrono::milliseconds>{ 100ms, 200ms, 400ms, 800ms });
    REQUIRE(backend->persist_calls() == 5);
    REQUIRE(backend->trace_count() == 0);
  }

  SECTION("permanent failures are not retried")
  {
    backend->fail_always(tracepipe::errc::export_failure::malformed_payload);
    auto result = controller.execute(snapshot, sleeper.as_function());
    REQUIRE(result.outcome == tracepipe::core::tracing::export_outcome::discarded_non_retryable);
    REQUIRE(result.attempts == 1);
    REQUIRE(result.last_error == tracepipe::errc::export_failure::malformed_payload);
    REQUIRE(sleeper.delays.empty());
  }

  SECTION("interrupted wait abandons the export")
  {
    backend->fail_always(tracepipe::errc::export_failure::backend_unavailable);
    sleeper.interrupted = true;
    auto result = controller.execute(snapshot, sleeper.as_function());
    REQUIRE(result.outcome == tracepipe::core::tracing::export_outcome::abandoned);
    REQUIRE(result.attempts == 1);
    REQUIRE(sleeper.delays.size() == 1);
  }
}

TEST_CASE("unit: retryable export failures", "[unit][export_retry]")
{
  using tracepipe::errc::export_failure;

  REQUIRE(tracepipe::is_retryable(export_failure::backend_unavailable));
  REQUIRE(tracepipe::is_retryable(export_failure::server_error));
  REQUIRE(tracepipe::is_retryable(export_failure::request_timeout));
  REQUIRE_FALSE(tracepipe::is_retryable(export_failure::malformed_payload));
  REQUIRE_FALSE(tracepipe::is_retryable(export_failure::authentication_failure));
  REQUIRE_FALSE(tracepipe::is_retryable(export_failure::permission_denied));
  REQUIRE_FALSE(tracepipe::is_retryable(export_failure::resource_not_found));
  REQUIRE_FALSE(tracepipe::is_retryable(std::make_error_code(std::errc::io_error)));
  REQUIRE_FALSE(tracepipe::is_retryable(tracepipe::errc::tracing::trace_timeout));

  std::error_code ec = export_failure::server_error;
  REQUIRE(std::string(ec.category().name()) == "tracepipe.export");
  REQUIRE(ec.message() == "server_error (2)");
}

TEST_CASE("unit: tracer counts retried and failed exports", "[unit][export_retry]")
{
  test::utils::init_logger();
  auto backend = std::make_shared<test::utils::recording_backend>();
  auto async = GENERATE(true, false);
  CAPTURE(async);
  tracepipe::tracer tracer{
    tracepipe::tracing_options{}.async_export(async).backoff_base(1ms).export_retry_timeout(2s),
    backend
  };

  SECTION("eventually exported")
  {
    backend->script_errors({
      tracepipe::errc::export_failure::server_error,
      tracepipe::errc::export_failure::server_error,
    });
    auto context = std::make_shared<tracepipe::trace_context>();
    auto root = tracer.start_span(*context, "retried");
    REQUIRE_SUCCESS(tracer.end_span(*context, root));
    REQUIRE(tracer.flush(5s));

    auto stats = tracer.stats();
    REQUIRE(stats.exported == 1);
    REQUIRE(stats.retried == 2);
    REQUIRE(stats.failed == 0);
    REQUIRE(backend->trace_count() == 1);
  }

  SECTION("rejected by the backend")
  {
    backend->fail_always(tracepipe::errc::export_failure::permission_denied);
    auto context = std::make_shared<tracepipe::trace_context>();
    auto root = tracer.start_span(*context, "rejected");
    // export failures never reach the application
    REQUIRE_SUCCESS(tracer.end_span(*context, root));
    REQUIRE(tracer.flush(5s));

    auto stats = tracer.stats();
    REQUIRE(stats.exported == 0);
    REQUIRE(stats.retried == 0);
    REQUIRE(stats.failed == 1);
    REQUIRE(backend->persist_calls() == 1);
  }
}

TEST_CASE("unit: exceptions thrown by the backend are counted as failed exports", "[unit][export_retry]")
{
  test::utils::init_logger();
  auto standard = GENERATE(true, false);
  auto async = GENERATE(true, false);
  CAPTURE(standard, async);
  auto backend = std::make_shared<throwing_backend>(standard);
  tracepipe::tracer tracer{ tracepipe::tracing_options{}.async_export(async), backend };

  auto context = std::make_shared<tracepipe::trace_context>();
  auto root = tracer.start_span(*context, "crashing export");
  REQUIRE_SUCCESS(tracer.end_span(*context, root));
  REQUIRE(tracer.flush(5s));

  auto stats = tracer.stats();
  REQUIRE(stats.submitted == 1);
  REQUIRE(stats.exported == 0);
  REQUIRE(stats.failed == 1);

  // the worker survives and keeps exporting
  auto next = tracer.start_span(*context, "next");
  REQUIRE_SUCCESS(tracer.end_span(*context, next));
  REQUIRE(tracer.flush(5s));
  REQUIRE(tracer.stats().failed == 2);
  tracer.close();
}
