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

namespace tracepipe
{
namespace core::impl
{
struct export_error_category : std::error_category {
    [[nodiscard]] const char* name() const noexcept override
    {
        return "tracepipe.export";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override
    {
        switch (static_cast<errc::export_failure>(ev)) {
            case errc::export_failure::backend_unavailable:
                return "backend_unavailable (1)";
            case errc::export_failure::server_error:
                return "server_error (2)";
            case errc::export_failure::request_timeout:
                return "request_timeout (3)";
            case errc::export_failure::malformed_payload:
                return "malformed_payload (4)";
            case errc::export_failure::authentication_failure:
                return "authentication_failure (5)";
            case errc::export_failure::permission_denied:
                return "permission_denied (6)";
            case errc::export_failure::resource_not_found:
                return "resource_not_found (7)";
        }
        return "FIXME: unknown error code (recompile with newer library): tracepipe.export." + std::to_string(ev);
    }
};

const inline static export_error_category export_category_instance;

const std::error_category&
export_category() noexcept
{
    return export_category_instance;
}
} // namespace core::impl

auto
is_retryable(std::error_code ec) -> bool
{
    return ec == errc::export_failure::backend_unavailable || ec == errc::export_failure::server_error ||
           ec == errc::export_failure::request_timeout;
}
} // namespace tracepipe
