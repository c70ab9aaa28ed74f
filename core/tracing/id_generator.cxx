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

#include "id_generator.hxx"

#include <fmt/core.h>

#include <cstdint>
#include <random>

namespace tracepipe::core::tracing
{
namespace
{
auto
random_uint64() -> std::uint64_t
{
  thread_local std::mt19937_64 gen(std::random_device{}());
  std::uniform_int_distribution<std::uint64_t> dis;
  return dis(gen);
}
} // namespace

auto
generate_trace_id() -> std::string
{
  return fmt::format("tr-{:016x}{:016x}", random_uint64(), random_uint64());
}

auto
generate_span_id() -> std::string
{
  return fmt::format("{:016x}", random_uint64());
}

auto
generate_assessment_id() -> std::string
{
  return fmt::format("a-{:016x}{:016x}", random_uint64(), random_uint64());
}
} // namespace tracepipe::core::tracing
