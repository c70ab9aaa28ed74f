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

/*
 *   The logger API is thread safe unless the underlying logger object is
 * replaced while other threads are logging. create_*_logger() and reset()
 * should be called before the tracer starts its background threads.
 */

#pragma once

#include "level.hxx"

#include <fmt/core.h>
#include <spdlog/fwd.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace tracepipe::core::logger
{
struct configuration;

auto
level_from_str(const std::string& str) -> level;

/**
 * Initialize the logger writing to a rotating file (and optionally to stderr).
 *
 * @param logger_settings the configuration for the logger
 * @return optional error message if something goes wrong
 */
auto
create_file_logger(const configuration& logger_settings) -> std::optional<std::string>;

/**
 * Initialize the logger with the blackhole logger object
 *
 * Intended for unit tests which don't need any output.
 */
void
create_blackhole_logger();

/**
 * Initialize the logger with the logger which logs to the console
 */
void
create_console_logger();

/**
 * Get the underlying logger object, or null if none of the create_*_logger() functions has been
 * called.
 */
auto
get() -> spdlog::logger*;

void
reset();

/**
 * Set the log level of all registered spdlog loggers
 */
void
set_log_levels(level lvl);

/**
 * Checks whether a specific level should be logged based on the current configuration.
 */
auto
should_log(level lvl) -> bool;

namespace detail
{
void
log(const char* file, int line, const char* function, level lvl, std::string_view msg);
} // namespace detail

template<typename String, typename... Args>
inline void
log(const char* file, int line, const char* function, level lvl, const String& msg, Args&&... args)
{
  detail::log(file, line, function, lvl, fmt::format(msg, std::forward<Args>(args)...));
}

/**
 * Tell the logger to flush its buffers
 */
void
flush();

/**
 * Tell the logger to shut down (flush buffers) and release _ALL_ loggers
 */
void
shutdown();

auto
is_initialized() -> bool;
} // namespace tracepipe::core::logger

#if defined(__GNUC__) || defined(__clang__)
#define TRACEPIPE_LOGGER_FUNCTION __PRETTY_FUNCTION__
#else
#define TRACEPIPE_LOGGER_FUNCTION __FUNCTION__
#endif

/**
 * Avoids evaluating the arguments of messages which will not be logged due to their severity.
 */
#define TRACEPIPE_LOG(file, line, function, severity, ...)                                         \
  do {                                                                                             \
    if (tracepipe::core::logger::should_log(severity)) {                                           \
      tracepipe::core::logger::log(file, line, function, severity, __VA_ARGS__);                   \
    }                                                                                              \
  } while (false)

#define TP_LOG_TRACE(...)                                                                          \
  TRACEPIPE_LOG(__FILE__,                                                                          \
                __LINE__,                                                                          \
                TRACEPIPE_LOGGER_FUNCTION,                                                         \
                tracepipe::core::logger::level::trace,                                             \
                __VA_ARGS__)
#define TP_LOG_DEBUG(...)                                                                          \
  TRACEPIPE_LOG(__FILE__,                                                                          \
                __LINE__,                                                                          \
                TRACEPIPE_LOGGER_FUNCTION,                                                         \
                tracepipe::core::logger::level::debug,                                             \
                __VA_ARGS__)
#define TP_LOG_INFO(...)                                                                           \
  TRACEPIPE_LOG(__FILE__,                                                                          \
                __LINE__,                                                                          \
                TRACEPIPE_LOGGER_FUNCTION,                                                         \
                tracepipe::core::logger::level::info,                                              \
                __VA_ARGS__)
#define TP_LOG_WARNING(...)                                                                        \
  TRACEPIPE_LOG(__FILE__,                                                                          \
                __LINE__,                                                                          \
                TRACEPIPE_LOGGER_FUNCTION,                                                         \
                tracepipe::core::logger::level::warn,                                              \
                __VA_ARGS__)
#define TP_LOG_ERROR(...)                                                                          \
  TRACEPIPE_LOG(__FILE__,                                                                          \
                __LINE__,                                                                          \
                TRACEPIPE_LOGGER_FUNCTION,                                                         \
                tracepipe::core::logger::level::err,                                               \
                __VA_ARGS__)
#define TP_LOG_CRITICAL(...)                                                                       \
  TRACEPIPE_LOG(__FILE__,                                                                          \
                __LINE__,                                                                          \
                TRACEPIPE_LOGGER_FUNCTION,                                                         \
                tracepipe::core::logger::level::critical,                                          \
                __VA_ARGS__)
