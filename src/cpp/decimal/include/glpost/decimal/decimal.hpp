/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <bdldfp_decimal.h>
#include <bdldfp_decimalconvertutil.h>
#include <bdldfp_decimalutil.h>
#include <fmt/format.h>

#include <bit>
#include <iomanip>
#include <optional>
#include <spanstream>
#include <sstream>
#include <string>

//-------------------------------------------------------------------------

#define DEC(lit) BDLDFP_DECIMAL_DD(lit)

//-------------------------------------------------------------------------

namespace glpost
{

using decimal_t = BloombergLP::bdldfp::Decimal64;

}  // namespace glpost

//-------------------------------------------------------------------------

namespace glpost::util
{

inline constexpr uint32_t kDefaultDecimalPlaces = 2;

// Half away from zero.
[[nodiscard]] inline decimal_t round(
    decimal_t val, uint32_t decimalPlaces = kDefaultDecimalPlaces)
{
    return BloombergLP::bdldfp::DecimalUtil::round(val, decimalPlaces);
}

// Smallest representable amount at the given number of decimal places.
[[nodiscard]] inline decimal_t minUnit(uint32_t decimalPlaces)
{
    return BloombergLP::bdldfp::DecimalUtil::multiplyByPowerOf10(
        decimal_t{1}, -static_cast<int>(decimalPlaces));
}

[[nodiscard]] inline uint64_t packDecimal(decimal_t val)
{
    uint64_t packed;
    BloombergLP::bdldfp::DecimalConvertUtil::decimalToDPD(
        std::bit_cast<uint8_t*>(&packed), val);
    return packed;
}

[[nodiscard]] inline decimal_t unpackDecimal(uint64_t val)
{
    decimal_t unpacked;
    BloombergLP::bdldfp::DecimalConvertUtil::decimalFromDPD(
        &unpacked, std::bit_cast<uint8_t*>(&val));
    return unpacked;
}

[[nodiscard]] inline std::optional<decimal_t> parseDecimal(const std::string& str) noexcept
{
    decimal_t parsed;
    if (BloombergLP::bdldfp::DecimalUtil::parseDecimal64(&parsed, str.c_str()) != 0) {
        return std::nullopt;
    }
    return parsed;
}

[[nodiscard]] inline decimal_t abs(decimal_t val) noexcept
{
    return val < decimal_t{} ? -val : val;
}

[[nodiscard]] inline bool isZero(decimal_t val, uint32_t decimalPlaces) noexcept
{
    return round(val, decimalPlaces) == decimal_t{};
}

// Fixed notation with exactly decimalPlaces digits, for messages and logs.
[[nodiscard]] inline std::string formatAmount(decimal_t val, uint32_t decimalPlaces)
{
    decimal_t rounded = round(val, decimalPlaces);
    if (rounded == decimal_t{}) {
        rounded = decimal_t{};
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(static_cast<int>(decimalPlaces)) << rounded;
    return oss.str();
}

}  // namespace glpost::util

//-------------------------------------------------------------------------

namespace glpost::literals
{

[[nodiscard]] constexpr decimal_t operator"" _dec(unsigned long long int val)
{
    return decimal_t{val};
}

}  // namespace glpost::literals

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<glpost::decimal_t>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(glpost::decimal_t val, FormatContext& ctx) const
    {
        using namespace glpost::literals;
        char buf[32]{};
        std::ospanstream oss{buf};
        if (val == 0_dec) [[unlikely]] {
            oss << "0.0";
        } else {
            oss << val;
        }
        return fmt::format_to(ctx.out(), "{}", buf);
    }
};

//-------------------------------------------------------------------------
