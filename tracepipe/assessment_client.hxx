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

#include <tao/json/value.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace tracepipe
{
class trace_backend;

class expectation_options
{
  public:
    auto metadata(std::map<std::string, std::string> metadata) -> expectation_options&
    {
        metadata_ = std::move(metadata);
        return *this;
    }

    auto span_id(std::string span_id) -> expectation_options&
    {
        span_id_ = std::move(span_id);
        return *this;
    }

    struct built {
        std::map<std::string, std::string> metadata;
        std::optional<std::string> span_id;
    };

    [[nodiscard]] auto build() const -> built
    {
        return { metadata_, span_id_ };
    }

  private:
    std::map<std::string, std::string> metadata_{};
    std::optional<std::string> span_id_{};
};

class feedback_options
{
  public:
    auto value(tao::json::value value) -> feedback_options&
    {
        value_ = std::move(value);
        return *this;
    }

    auto error(std::string error_code, std::optional<std::string> error_message = {}) -> feedback_options&
    {
        error_ = assessment_error{ std::move(error_code), std::move(error_message) };
        return *this;
    }

    auto rationale(std::string rationale) -> feedback_options&
    {
        rationale_ = std::move(rationale);
        return *this;
    }

    auto metadata(std::map<std::string, std::string> metadata) -> feedback_options&
    {
        metadata_ = std::move(metadata);
        return *this;
    }

    auto span_id(std::string span_id) -> feedback_options&
    {
        span_id_ = std::move(span_id);
        return *this;
    }

    struct built {
        std::optional<tao::json::value> value;
        std::optional<assessment_error> error;
        std::optional<std::string> rationale;
        std::map<std::string, std::string> metadata;
        std::optional<std::string> span_id;
    };

    [[nodiscard]] auto build() const -> built
    {
        return { value_, error_, rationale_, metadata_, span_id_ };
    }

  private:
    std::optional<tao::json::value> value_{};
    std::optional<assessment_error> error_{};
    std::optional<std::string> rationale_{};
    std::map<std::string, std::string> metadata_{};
    std::optional<std::string> span_id_{};
};

class feedback_update_options
{
  public:
    auto value(tao::json::value value) -> feedback_update_options&
    {
        value_ = std::move(value);
        return *this;
    }

    auto rationale(std::string rationale) -> feedback_update_options&
    {
        rationale_ = std::move(rationale);
        return *this;
    }

    auto metadata(std::map<std::string, std::string> metadata) -> feedback_update_options&
    {
        metadata_ = std::move(metadata);
        return *this;
    }

    struct built {
        std::optional<tao::json::value> value;
        std::optional<std::string> rationale;
        std::optional<std::map<std::string, std::string>> metadata;
    };

    [[nodiscard]] auto build() const -> built
    {
        return { value_, rationale_, metadata_ };
    }

  private:
    std::optional<tao::json::value> value_{};
    std::optional<std::string> rationale_{};
    std::optional<std::map<std::string, std::string>> metadata_{};
};

/**
 * Records expectations and feedback on traces.
 *
 * The writes go straight to the backend and do not pass through the export queue, so the trace may
 * be still in progress or exported long ago. Validation failures are reported as
 * errc::tracing::invalid_argument, backend failures with the code returned by the backend.
 */
class assessment_client
{
  public:
    explicit assessment_client(std::shared_ptr<trace_backend> backend);

    /**
     * Records the expected outcome of a traced operation. The value must not be null.
     */
    auto log_expectation(const std::string& trace_id,
                         const std::string& name,
                         const tao::json::value& value,
                         const assessment_source& source,
                         const expectation_options& options = {}) const -> std::pair<std::error_code, assessment>;

    /**
     * Records a judgement about a traced operation. Either a value or an error must be given.
     */
    auto log_feedback(const std::string& trace_id,
                      const std::string& name,
                      const assessment_source& source,
                      const feedback_options& options) const -> std::pair<std::error_code, assessment>;

    auto update_expectation(const std::string& trace_id, const std::string& assessment_id, const tao::json::value& value) const
      -> std::pair<std::error_code, assessment>;

    auto update_feedback(const std::string& trace_id, const std::string& assessment_id, const feedback_update_options& options) const
      -> std::pair<std::error_code, assessment>;

    auto delete_expectation(const std::string& trace_id, const std::string& assessment_id) const -> std::error_code;

    auto delete_feedback(const std::string& trace_id, const std::string& assessment_id) const -> std::error_code;

  private:
    std::shared_ptr<trace_backend> backend_;
};
} // namespace tracepipe
