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

#include "core/tracing/options_from_environment.hxx"
#include "core/utils/duration_parser.hxx"

#include <tracepipe/tracing_options.hxx>

#include <cstdlib>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

using namespace std::chrono_literals;

namespace
{
/**
 * Sets environment variables for the duration of a test and unsets them afterwards.
 */
class scoped_environment
{
public:
  scoped_environment(std::initializer_list<std::pair<const char*, const char*>> variables)
  {
    for (const auto& [name, value] : variables) {
      ::setenv(name, value, 1);
      names_.emplace_back(name);
    }
  }

  scoped_environment(const scoped_environment&) = delete;
  scoped_environment(scoped_environment&&) = delete;
  auto operator=(const scoped_environment&) -> scoped_environment& = delete;
  auto operator=(scoped_environment&&) -> scoped_environment& = delete;

  ~scoped_environment()
  {
    for (const auto& name : names_) {
      ::unsetenv(name.c_str());
    }
  }

private:
  std::vector<std::string> names_{};
};
} // namespace

TEST_CASE("unit: default tracing options", "[unit][options]")
{
  tracepipe::tracing_options options{};

  REQUIRE_FALSE(options.trace_timeout().has_value());
  REQUIRE(options.timeout_check_interval() == 1s);
  REQUIRE(options.supervisor_idle_grace() == 5s);
  REQUIRE(options.max_workers() == 10);
  REQUIRE(options.max_queue_size() == 1000);
  REQUIRE(options.export_retry_timeout() == 500s);
  REQUIRE(options.shutdown_flush_timeout() == 10s);
  REQUIRE(options.async_export());
  REQUIRE(options.enabled());

  options.trace_timeout(30s).timeout_check_interval(200ms);
  REQUIRE(options.trace_timeout() == 30s);
  REQUIRE(options.supervisor_idle_grace() == 1s);

  options.trace_timeout(0s);
  REQUIRE_FALSE(options.trace_timeout().has_value());
}

TEST_CASE("unit: supervisor intervals below one millisecond are ignored", "[unit][options]")
{
  auto options = tracepipe::tracing_options{}.timeout_check_interval(50ms);

  options.timeout_check_interval(0ms);
  REQUIRE(options.timeout_check_interval() == 50ms);
  options.timeout_check_interval(-10ms);
  REQUIRE(options.timeout_check_interval() == 50ms);
  REQUIRE(options.supervisor_idle_grace() == 250ms);

  options.supervisor_idle_grace(0ms);
  REQUIRE(options.supervisor_idle_grace() == 250ms);
  options.supervisor_idle_grace(1ms);
  REQUIRE(options.supervisor_idle_grace() == 1ms);
  options.supervisor_idle_grace(-1ms);
  REQUIRE(options.supervisor_idle_grace() == 1ms);
}

TEST_CASE("unit: tracing options from the environment", "[unit][options]")
{
  test::utils::init_logger();

  SECTION("nothing set keeps the base options")
  {
    auto options =
      tracepipe::core::tracing::load_options_from_environment(tracepipe::tracing_options{}.max_workers(3));
    REQUIRE(options.max_workers() == 3);
    REQUIRE_FALSE(options.trace_timeout().has_value());
  }

  SECTION("every variable")
  {
    scoped_environment env{
      { "TRACEPIPE_TRACE_TIMEOUT_SECONDS", "2.5" },
      { "TRACEPIPE_TRACE_TIMEOUT_CHECK_INTERVAL_SECONDS", "250ms" },
      { "TRACEPIPE_ASYNC_TRACE_LOGGING_MAX_WORKERS", "4" },
      { "TRACEPIPE_ASYNC_TRACE_LOGGING_MAX_QUEUE_SIZE", "64" },
      { "TRACEPIPE_ASYNC_TRACE_LOGGING_RETRY_TIMEOUT", "1m30s" },
      { "TRACEPIPE_ENABLE_ASYNC_TRACE_LOGGING", "False" },
      { "TRACEPIPE_SHUTDOWN_FLUSH_TIMEOUT", "3" },
    };
    auto options = tracepipe::core::tracing::load_options_from_environment();
    REQUIRE(options.trace_timeout() == 2500ms);
    REQUIRE(options.timeout_check_interval() == 250ms);
    REQUIRE(options.max_workers() == 4);
    REQUIRE(options.max_queue_size() == 64);
    REQUIRE(options.export_retry_timeout() == 90s);
    REQUIRE_FALSE(options.async_export());
    REQUIRE(options.shutdown_flush_timeout() == 3s);
  }

  SECTION("zero timeout disables the supervisor")
  {
    scoped_environment env{ { "TRACEPIPE_TRACE_TIMEOUT_SECONDS", "0" } };
    auto options =
      tracepipe::core::tracing::load_options_from_environment(tracepipe::tracing_options{}.trace_timeout(10s));
    REQUIRE_FALSE(options.trace_timeout().has_value());
  }

  SECTION("invalid values are ignored")
  {
    scoped_environment env{
      { "TRACEPIPE_TRACE_TIMEOUT_SECONDS", "soon" },
      { "TRACEPIPE_TRACE_TIMEOUT_CHECK_INTERVAL_SECONDS", "0" },
      { "TRACEPIPE_ASYNC_TRACE_LOGGING_MAX_WORKERS", "-2" },
      { "TRACEPIPE_ASYNC_TRACE_LOGGING_MAX_QUEUE_SIZE", "0" },
      { "TRACEPIPE_ASYNC_TRACE_LOGGING_RETRY_TIMEOUT", "-5s" },
      { "TRACEPIPE_ENABLE_ASYNC_TRACE_LOGGING", "maybe" },
      { "TRACEPIPE_SHUTDOWN_FLUSH_TIMEOUT", "1e300" },
    };
    auto options = tracepipe::core::tracing::load_options_from_environment();
    REQUIRE_FALSE(options.trace_timeout().has_value());
    REQUIRE(options.timeout_check_interval() == 1s);
    REQUIRE(options.max_workers() == 10);
    REQUIRE(options.max_queue_size() == 1000);
    REQUIRE(options.export_retry_timeout() == 500s);
    REQUIRE(options.async_export());
    REQUIRE(options.shutdown_flush_timeout() == 10s);
  }
}

TEST_CASE("unit: value parsers", "[unit][options]")
{
  using tracepipe::core::tracing::parse_boolean;
  using tracepipe::core::tracing::parse_positive_integer;
  using tracepipe::core::tracing::parse_seconds_or_duration;

  REQUIRE(parse_seconds_or_duration("0.001") == 1ms);
  REQUIRE(parse_seconds_or_duration("2h") == 2h);
  REQUIRE_FALSE(parse_seconds_or_duration("").has_value());
  REQUIRE_FALSE(parse_seconds_or_duration("-1").has_value());
  REQUIRE(parse_seconds_or_duration("9e15") == std::chrono::milliseconds{ 9'000'000'000'000'000'000 });
  REQUIRE_FALSE(parse_seconds_or_duration("1e16").has_value());
  REQUIRE_FALSE(parse_seconds_or_duration("1e300").has_value());
  REQUIRE_FALSE(parse_seconds_or_duration("inf").has_value());

  REQUIRE(parse_positive_integer("42") == 42U);
  REQUIRE_FALSE(parse_positive_integer("4x").has_value());
  REQUIRE_FALSE(parse_positive_integer("99999999999999999999999").has_value());

  REQUIRE(parse_boolean("ON") == true);
  REQUIRE(parse_boolean("0") == false);
  REQUIRE_FALSE(parse_boolean("").has_value());
}

TEST_CASE("unit: duration parser", "[unit][options]")
{
  using tracepipe::core::utils::parse_duration;

  REQUIRE(parse_duration("0") == std::chrono::nanoseconds::zero());
  REQUIRE(parse_duration("300ms") == 300ms);
  REQUIRE(parse_duration("1.5h") == 90min);
  REQUIRE(parse_duration("2h45m") == 165min);
  REQUIRE(parse_duration("-1.5s") == -1500ms);
  REQUIRE(parse_duration("1us") == 1us);
  REQUIRE(parse_duration("1µs") == 1us);
  REQUIRE(parse_duration("12ns") == 12ns);

  REQUIRE_THROWS_AS(parse_duration(""), tracepipe::core::utils::duration_parse_error);
  REQUIRE_THROWS_AS(parse_duration("10"), tracepipe::core::utils::duration_parse_error);
  REQUIRE_THROWS_AS(parse_duration("1d"), tracepipe::core::utils::duration_parse_error);
  REQUIRE_THROWS_AS(parse_duration("s"), tracepipe::core::utils::duration_parse_error);
  REQUIRE_THROWS_AS(parse_duration("9999999999h"), tracepipe::core::utils::duration_parse_error);
}
