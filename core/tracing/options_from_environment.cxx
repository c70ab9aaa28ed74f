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

#include "options_from_environment.hxx"

#include "core/logger/logger.hxx"
#include "core/utils/duration_parser.hxx"

#include <spdlog/details/os.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>

namespace tracepipe::core::tracing
{
namespace
{
auto
lowercase(std::string text) -> std::string
{
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return text;
}

template<typename Setter>
void
apply_duration(const char* name, Setter&& setter)
{
  if (auto value = spdlog::details::os::getenv(name); !value.empty()) {
    if (auto duration = parse_seconds_or_duration(value); duration) {
      setter(duration.value());
    } else {
      TP_LOG_WARNING(R"(ignoring {}="{}": expected seconds or a duration like "1m30s")", name, value);
    }
  }
}

template<typename Setter>
void
apply_size(const char* name, Setter&& setter)
{
  if (auto value = spdlog::details::os::getenv(name); !value.empty()) {
    if (auto size = parse_positive_integer(value); size) {
      setter(size.value());
    } else {
      TP_LOG_WARNING(R"(ignoring {}="{}": expected a positive integer)", name, value);
    }
  }
}
} // namespace

auto
parse_seconds_or_duration(const std::string& text) -> std::optional<std::chrono::milliseconds>
{
  if (text.empty()) {
    return {};
  }
  const char* begin = text.c_str();
  char* end = nullptr;
  const double seconds = std::strtod(begin, &end);
  if (end == begin + text.size()) {
    if (!std::isfinite(seconds) || seconds < 0 ||
        seconds * 1000 >= static_cast<double>(std::chrono::milliseconds::max().count())) {
      return {};
    }
    return std::chrono::milliseconds{ static_cast<std::int64_t>(std::llround(seconds * 1000)) };
  }

  try {
    auto duration = utils::parse_duration(text);
    if (duration.count() < 0) {
      return {};
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration);
  } catch (const utils::duration_parse_error& e) {
    TP_LOG_DEBUG("{}", e.what());
  }
  return {};
}

auto
parse_positive_integer(const std::string& text) -> std::optional<std::size_t>
{
  if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
      })) {
    return {};
  }
  errno = 0;
  const auto value = std::strtoull(text.c_str(), nullptr, 10);
  if (errno == ERANGE || value == 0) {
    return {};
  }
  return static_cast<std::size_t>(value);
}

auto
parse_boolean(const std::string& text) -> std::optional<bool>
{
  const auto value = lowercase(text);
  if (value == "true" || value == "1" || value == "yes" || value == "on") {
    return true;
  }
  if (value == "false" || value == "0" || value == "no" || value == "off") {
    return false;
  }
  return {};
}

auto
load_options_from_environment(tracing_options base) -> tracing_options
{
  auto options = std::move(base);

  apply_duration("TRACEPIPE_TRACE_TIMEOUT_SECONDS", [&options](auto value) {
    options.trace_timeout(value);
  });
  apply_duration("TRACEPIPE_TRACE_TIMEOUT_CHECK_INTERVAL_SECONDS", [&options](auto value) {
    if (value.count() > 0) {
      options.timeout_check_interval(value);
    } else {
      TP_LOG_WARNING("ignoring zero TRACEPIPE_TRACE_TIMEOUT_CHECK_INTERVAL_SECONDS");
    }
  });
  apply_size("TRACEPIPE_ASYNC_TRACE_LOGGING_MAX_WORKERS", [&options](auto value) {
    options.max_workers(value);
  });
  apply_size("TRACEPIPE_ASYNC_TRACE_LOGGING_MAX_QUEUE_SIZE", [&options](auto value) {
    options.max_queue_size(value);
  });
  apply_duration("TRACEPIPE_ASYNC_TRACE_LOGGING_RETRY_TIMEOUT", [&options](auto value) {
    options.export_retry_timeout(value);
  });
  apply_duration("TRACEPIPE_SHUTDOWN_FLUSH_TIMEOUT", [&options](auto value) {
    options.shutdown_flush_timeout(value);
  });

  if (auto value = spdlog::details::os::getenv("TRACEPIPE_ENABLE_ASYNC_TRACE_LOGGING");
      !value.empty()) {
    if (auto enabled = parse_boolean(value); enabled) {
      options.async_export(enabled.value());
    } else {
      TP_LOG_WARNING(R"(ignoring TRACEPIPE_ENABLE_ASYNC_TRACE_LOGGING="{}": expected true or false)",
                     value);
    }
  }

  return options;
}
} // namespace tracepipe::core::tracing
