/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "Date.hpp"

#include <date/date.h>

#include <source_location>
#include <sstream>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace glpost::util
{

//-------------------------------------------------------------------------

std::string formatDate(Date date)
{
    if (!date.ok()) {
        throw std::invalid_argument{fmt::format(
            "{}: Invalid calendar date", std::source_location::current().function_name())};
    }
    return date::format("%F", std::chrono::sys_days{date});
}

//-------------------------------------------------------------------------

Date parseDate(const std::string& str)
{
    date::sys_days parsed;
    std::istringstream in{str};
    in >> date::parse("%F", parsed);
    if (in.fail()) {
        throw std::invalid_argument{fmt::format(
            "{}: Unable to parse date from '{}', expected YYYY-MM-DD",
            std::source_location::current().function_name(),
            str)};
    }
    return Date{std::chrono::sys_days{std::chrono::days{parsed.time_since_epoch().count()}}};
}

//-------------------------------------------------------------------------

std::optional<Date> parseOptionalDate(const std::string& str)
{
    if (str.empty()) return std::nullopt;
    return parseDate(str);
}

//-------------------------------------------------------------------------

}  // namespace glpost::util

//-------------------------------------------------------------------------
