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

#include <tracepipe/trace_backend.hxx>

#include <cstdio>
#include <memory>

namespace tracepipe
{
class file_trace_backend_impl;

/**
 * Backend writing one JSON document per line to a stream, for example stdout or a log file.
 *
 * Every record carries a "type" field ("trace", "set_trace_tag", "delete_trace_tag",
 * "create_assessment", "update_assessment" or "delete_assessment"). Assessments are also kept in
 * memory, so that updates can be applied and reported with the full resulting assessment.
 *
 * The stream is not owned and must outlive the backend.
 */
class file_trace_backend : public trace_backend
{
  public:
    explicit file_trace_backend(FILE* output);

    auto persist_trace(const trace_snapshot& snapshot) -> std::error_code override;
    auto set_trace_tag(const std::string& trace_id, const std::string& key, const std::string& value) -> std::error_code override;
    auto delete_trace_tag(const std::string& trace_id, const std::string& key) -> std::error_code override;
    auto create_assessment(const assessment& value) -> std::error_code override;
    auto update_assessment(const std::string& trace_id, const std::string& assessment_id, const assessment_update& update)
      -> std::pair<std::error_code, assessment> override;
    auto delete_assessment(const std::string& trace_id, const std::string& assessment_id) -> std::error_code override;

  private:
    std::shared_ptr<file_trace_backend_impl> impl_;
};
} // namespace tracepipe
