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

#include <cstdint>

namespace tracepipe
{
/**
 * Counters of the export pipeline since the tracer was created.
 */
struct export_stats {
    /**
     * Finished traces handed to the export pipeline (including the ones dropped on a full queue).
     */
    std::uint64_t submitted{ 0 };

    /**
     * Traces persisted by the backend.
     */
    std::uint64_t exported{ 0 };

    /**
     * Traces rejected because the export queue was full.
     */
    std::uint64_t dropped{ 0 };

    /**
     * Traces discarded after a permanent failure, an exhausted retry budget, or a shutdown during
     * backoff.
     */
    std::uint64_t failed{ 0 };

    /**
     * Number of retry attempts across all traces.
     */
    std::uint64_t retried{ 0 };
};
} // namespace tracepipe
