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

#include <tracepipe/error_codes.hxx>

#include <string>

namespace tracepipe::core::impl
{
struct tracing_error_category : std::error_category {
    [[nodiscard]] const char* name() const noexcept override
    {
        return "tracepipe.tracing";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override
    {
        switch (static_cast<errc::tracing>(ev)) {
            case errc::tracing::span_state_error:
                return "span_state_error (1)";
            case errc::tracing::trace_not_active:
                return "trace_not_active (2)";
            case errc::tracing::trace_timeout:
                return "trace_timeout (3)";
            case errc::tracing::invalid_argument:
                return "invalid_argument (4)";
            case errc::tracing::tracer_closed:
                return "tracer_closed (5)";
        }
        return "FIXME: unknown error code (recompile with newer library): tracepipe.tracing." + std::to_string(ev);
    }
};

const inline static tracing_error_category tracing_category_instance;

const std::error_category&
tracing_category() noexcept
{
    return tracing_category_instance;
}
} // namespace tracepipe::core::impl
