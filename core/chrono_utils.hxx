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
#include <string>

namespace tracepipe::core
{
auto
to_iso8601_utc(std::time_t time_in_seconds, std::int64_t microseconds = 0) -> std::string;

auto
to_iso8601_utc(const std::chrono::system_clock::time_point& time_point) -> std::string;

/**
 * Converts a duration to fractional seconds, as used in configuration and log messages.
 */
auto
to_seconds(std::chrono::nanoseconds duration) -> double;
} // namespace tracepipe::core
