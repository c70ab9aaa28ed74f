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

#include <tracepipe/assessment.hxx>
#include <tracepipe/trace_snapshot.hxx>

#include <string>
#include <system_error>
#include <utility>

namespace tracepipe
{
/**
 * The store receiving finished traces, tags written after export, and assessments.
 *
 * Implementations are called from export worker threads as well as from application threads, and
 * must be thread safe. Failures are reported with codes from errc::export_failure; any other error
 * category is treated as a permanent failure.
 */
class trace_backend
{
  public:
    virtual ~trace_backend() = default;

    /**
     * Persists a finished trace. May be called more than once for the same trace only if a previous
     * call failed.
     */
    virtual auto persist_trace(const trace_snapshot& snapshot) -> std::error_code = 0;

    virtual auto set_trace_tag(const std::string& trace_id, const std::string& key, const std::string& value) -> std::error_code = 0;

    virtual auto delete_trace_tag(const std::string& trace_id, const std::string& key) -> std::error_code = 0;

    virtual auto create_assessment(const assessment& value) -> std::error_code = 0;

    /**
     * Applies the update to a stored assessment and returns the updated version.
     */
    virtual auto update_assessment(const std::string& trace_id, const std::string& assessment_id, const assessment_update& update)
      -> std::pair<std::error_code, assessment> = 0;

    virtual auto delete_assessment(const std::string& trace_id, const std::string& assessment_id) -> std::error_code = 0;
};
} // namespace tracepipe
