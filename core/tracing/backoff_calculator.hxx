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
#include <functional>

namespace tracepipe::core::tracing
{
using backoff_calculator = std::function<std::chrono::milliseconds(std::size_t retry_attempts)>;

/**
 * Exponential backoff with a random addition bounded by a fraction of the step.
 *
 * The n-th delay lies in [base * factor^n, base * factor^n * (1 + jitter)), rounded down to
 * milliseconds. Where rounding makes two steps overlap, the later range is shifted up, so every
 * delay is at least one millisecond longer than the previous one. Out of range arguments are
 * replaced: base with 100ms, factor with 2, and jitter with (factor - 1) / 2.
 */
auto
exponential_backoff_with_bounded_jitter(std::chrono::milliseconds base,
                                        double factor,
                                        double jitter) -> backoff_calculator;

auto
default_backoff_calculator(std::size_t retry_attempts) -> std::chrono::milliseconds;
} // namespace tracepipe::core::tracing
