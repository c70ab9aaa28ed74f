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

#include "duration_parser.hxx"

#include <fmt/core.h>

#include <cstdint>
#include <limits>
#include <string_view>

namespace tracepipe::core::utils
{
namespace
{
auto
unit_in_nanoseconds(std::string_view unit) -> std::uint64_t
{
    if (unit == "ns") {
        return 1;
    }
    if (unit == "us" || unit == "µs" /* U+00B5 micro */ || unit == "μs" /* U+03BC Greek mu */) {
        return 1'000;
    }
    if (unit == "ms") {
        return 1'000'000;
    }
    if (unit == "s") {
        return 1'000'000'000;
    }
    if (unit == "m") {
        return 60ULL * 1'000'000'000;
    }
    if (unit == "h") {
        return 60ULL * 60 * 1'000'000'000;
    }
    return 0;
}

constexpr auto
is_digit(char c) -> bool
{
    return c >= '0' && c <= '9';
}
} // namespace

std::chrono::nanoseconds
parse_duration(const std::string& text)
{
    std::string_view s{ text };
    const auto original = text;

    bool negative = false;
    if (!s.empty() && (s.front() == '-' || s.front() == '+')) {
        negative = s.front() == '-';
        s.remove_prefix(1);
    }
    if (s == "0") {
        return std::chrono::nanoseconds::zero();
    }
    if (s.empty()) {
        throw duration_parse_error(fmt::format(R"(invalid duration "{}")", original));
    }

    constexpr auto max_value = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    std::uint64_t total = 0;
    while (!s.empty()) {
        std::uint64_t whole = 0;
        std::size_t consumed = 0;
        while (consumed < s.size() && is_digit(s[consumed])) {
            if (whole > (max_value - 9) / 10) {
                throw duration_parse_error(fmt::format(R"(invalid duration "{}": overflow)", original));
            }
            whole = whole * 10 + static_cast<std::uint64_t>(s[consumed] - '0');
            ++consumed;
        }
        const bool has_whole = consumed > 0;
        s.remove_prefix(consumed);

        std::uint64_t fraction = 0;
        double fraction_scale = 1;
        bool has_fraction = false;
        if (!s.empty() && s.front() == '.') {
            s.remove_prefix(1);
            consumed = 0;
            while (consumed < s.size() && is_digit(s[consumed])) {
                // digits beyond nanosecond precision do not change the result
                if (fraction < max_value / 10) {
                    fraction = fraction * 10 + static_cast<std::uint64_t>(s[consumed] - '0');
                    fraction_scale *= 10;
                }
                ++consumed;
            }
            has_fraction = consumed > 0;
            s.remove_prefix(consumed);
        }
        if (!has_whole && !has_fraction) {
            throw duration_parse_error(fmt::format(R"(invalid duration "{}")", original));
        }

        consumed = 0;
        while (consumed < s.size() && s[consumed] != '.' && !is_digit(s[consumed])) {
            ++consumed;
        }
        if (consumed == 0) {
            throw duration_parse_error(fmt::format(R"(missing unit in duration "{}")", original));
        }
        const auto unit_name = s.substr(0, consumed);
        const auto unit = unit_in_nanoseconds(unit_name);
        if (unit == 0) {
            throw duration_parse_error(fmt::format(R"(unknown unit "{}" in duration "{}")", unit_name, original));
        }
        s.remove_prefix(consumed);

        if (whole > max_value / unit) {
            throw duration_parse_error(fmt::format(R"(invalid duration "{}": overflow)", original));
        }
        auto value = whole * unit;
        if (fraction > 0) {
            value += static_cast<std::uint64_t>(static_cast<double>(fraction) * (static_cast<double>(unit) / fraction_scale));
        }
        if (value > max_value - total) {
            throw duration_parse_error(fmt::format(R"(invalid duration "{}": overflow)", original));
        }
        total += value;
    }

    auto result = static_cast<std::int64_t>(total);
    return std::chrono::nanoseconds{ negative ? -result : result };
}
} // namespace tracepipe::core::utils
