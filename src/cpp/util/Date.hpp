/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <fmt/format.h>

#include <chrono>
#include <optional>
#include <string>

//-------------------------------------------------------------------------

namespace glpost
{

using Date = std::chrono::year_month_day;

}  // namespace glpost

//-------------------------------------------------------------------------

namespace glpost::util
{

// ISO 8601 calendar date, e.g. 2024-01-15.
[[nodiscard]] std::string formatDate(Date date);

[[nodiscard]] Date parseDate(const std::string& str);
// Empty string yields nullopt.
[[nodiscard]] std::optional<Date> parseOptionalDate(const std::string& str);

[[nodiscard]] inline constexpr Date makeDate(int y, unsigned m, unsigned d) noexcept
{
    return Date{std::chrono::year{y}, std::chrono::month{m}, std::chrono::day{d}};
}

}  // namespace glpost::util

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<glpost::Date>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(glpost::Date date, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", glpost::util::formatDate(date));
    }
};

//-------------------------------------------------------------------------
