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

#include "backoff_calculator.hxx"

#include <tracepipe/tracing_options.hxx>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <random>

namespace tracepipe::core::tracing
{
auto
exponential_backoff_with_bounded_jitter(std::chrono::milliseconds base,
                                        double factor,
                                        double jitter) -> backoff_calculator
{
  double min = 100; // 100 milliseconds
  double growth = 2;

  if (base > std::chrono::milliseconds::zero()) {
    min = static_cast<double>(base.count());
  }
  if (factor > 1) {
    growth = factor;
  }
  double spread = jitter;
  if (!(spread >= 0) || spread >= growth - 1) {
    spread = (growth - 1) / 2;
  }

  return [min, growth, spread](std::size_t retry_attempts) -> std::chrono::milliseconds {
    constexpr auto limit = static_cast<double>(std::numeric_limits<std::int32_t>::max());

    // [lower, upper) in whole milliseconds. Every range starts where the previous one ends, so the
    // delays grow by at least one millisecond even when flooring merges the exponential steps.
    double lower = std::floor(min);
    double upper = std::max(lower + 1, std::floor(std::min(limit, min * (1 + spread))));
    for (std::size_t n = 1; n <= retry_attempts && upper < limit; ++n) {
      const double low = std::min(limit, min * std::pow(growth, static_cast<double>(n)));
      lower = std::max(std::floor(low), upper);
      upper = std::max(lower + 1, std::floor(std::min(limit, low * (1 + spread))));
    }

    thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<std::int64_t> distrib(static_cast<std::int64_t>(lower),
                                                        static_cast<std::int64_t>(upper) - 1);
    return std::chrono::milliseconds(distrib(gen));
  };
}

auto
default_backoff_calculator(std::size_t retry_attempts) -> std::chrono::milliseconds
{
  static const auto calculator =
    exponential_backoff_with_bounded_jitter(tracing_options::default_backoff_base,
                                            tracing_options::default_backoff_factor,
                                            tracing_options::default_backoff_jitter);
  return calculator(retry_attempts);
}
} // namespace tracepipe::core::tracing
