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

#include <tracepipe/file_trace_backend.hxx>

#include "core/logger/logger.hxx"
#include "core/utils/json.hxx"

#include <tracepipe/error_codes.hxx>

#include <fmt/core.h>
#include <tao/json/value.hpp>

#include <map>
#include <mutex>
#include <system_error>
#include <utility>

namespace tracepipe
{
class file_trace_backend_impl
{
  public:
    explicit file_trace_backend_impl(FILE* output)
      : output_{ output }
    {
    }

    file_trace_backend_impl(const file_trace_backend_impl&) = delete;
    file_trace_backend_impl(file_trace_backend_impl&&) = delete;
    auto operator=(const file_trace_backend_impl&) -> file_trace_backend_impl& = delete;
    auto operator=(file_trace_backend_impl&&) -> file_trace_backend_impl& = delete;
    ~file_trace_backend_impl()
    {
        if (output_ != nullptr) {
            std::fflush(output_);
        }
    }

    auto write(const char* type, tao::json::value record) -> std::error_code
    {
        if (output_ == nullptr) {
            return errc::export_failure::backend_unavailable;
        }
        record["type"] = type;
        auto line = core::utils::json::generate(record);

        const std::scoped_lock lock(output_mutex_);
        try {
            fmt::print(output_, "{}\n", line);
        } catch (const std::system_error& e) {
            std::clearerr(output_);
            TP_LOG_DEBUG("unable to write {} record to the output stream: {}", type, e.what());
            return errc::export_failure::backend_unavailable;
        }
        if (std::fflush(output_) != 0 || std::ferror(output_) != 0) {
            std::clearerr(output_);
            TP_LOG_DEBUG("unable to write {} record to the output stream", type);
            return errc::export_failure::backend_unavailable;
        }
        return {};
    }

    auto create_assessment(const assessment& value) -> std::error_code
    {
        if (auto ec = write("create_assessment", to_json(value)); ec) {
            return ec;
        }
        const std::scoped_lock lock(assessments_mutex_);
        assessments_.insert_or_assign({ value.trace_id, value.assessment_id }, value);
        return {};
    }

    auto update_assessment(const std::string& trace_id, const std::string& assessment_id, const assessment_update& update)
      -> std::pair<std::error_code, assessment>
    {
        // the stored assessment only changes once the record has been written
        const std::scoped_lock lock(assessments_mutex_);
        auto it = assessments_.find({ trace_id, assessment_id });
        if (it == assessments_.end()) {
            return { errc::export_failure::resource_not_found, {} };
        }
        auto updated = it->second;
        update.apply_to(updated);
        if (auto ec = write("update_assessment", to_json(updated)); ec) {
            return { ec, {} };
        }
        it->second = updated;
        return { {}, std::move(updated) };
    }

    auto delete_assessment(const std::string& trace_id, const std::string& assessment_id) -> std::error_code
    {
        const std::scoped_lock lock(assessments_mutex_);
        auto it = assessments_.find({ trace_id, assessment_id });
        if (it == assessments_.end()) {
            return errc::export_failure::resource_not_found;
        }
        if (auto ec = write("delete_assessment",
                            tao::json::value{
                              { "trace_id", trace_id },
                              { "assessment_id", assessment_id },
                            });
            ec) {
            return ec;
        }
        assessments_.erase(it);
        return {};
    }

  private:
    FILE* output_;
    std::mutex output_mutex_{};
    std::mutex assessments_mutex_{};
    std::map<std::pair<std::string, std::string>, assessment> assessments_{};
};

file_trace_backend::file_trace_backend(FILE* output)
  : impl_{ std::make_shared<file_trace_backend_impl>(output) }
{
}

auto
file_trace_backend::persist_trace(const trace_snapshot& snapshot) -> std::error_code
{
    return impl_->write("trace", to_json(snapshot));
}

auto
file_trace_backend::set_trace_tag(const std::string& trace_id, const std::string& key, const std::string& value) -> std::error_code
{
    return impl_->write("set_trace_tag",
                        tao::json::value{
                          { "trace_id", trace_id },
                          { "key", key },
                          { "value", value },
                        });
}

auto
file_trace_backend::delete_trace_tag(const std::string& trace_id, const std::string& key) -> std::error_code
{
    return impl_->write("delete_trace_tag",
                        tao::json::value{
                          { "trace_id", trace_id },
                          { "key", key },
                        });
}

auto
file_trace_backend::create_assessment(const assessment& value) -> std::error_code
{
    return impl_->create_assessment(value);
}

auto
file_trace_backend::update_assessment(const std::string& trace_id, const std::string& assessment_id, const assessment_update& update)
  -> std::pair<std::error_code, assessment>
{
    return impl_->update_assessment(trace_id, assessment_id, update);
}

auto
file_trace_backend::delete_assessment(const std::string& trace_id, const std::string& assessment_id) -> std::error_code
{
    return impl_->delete_assessment(trace_id, assessment_id);
}
} // namespace tracepipe
