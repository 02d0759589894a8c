/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <fmt/format.h>

#include <compare>
#include <string>

//-------------------------------------------------------------------------

namespace glpost::ledger
{

//-------------------------------------------------------------------------

struct VoucherRef
{
    std::string voucherType;
    std::string voucherNo;

    [[nodiscard]] bool empty() const noexcept { return voucherType.empty() && voucherNo.empty(); }

    auto operator<=>(const VoucherRef&) const = default;
};

//-------------------------------------------------------------------------

}  // namespace glpost::ledger

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<glpost::ledger::VoucherRef>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const glpost::ledger::VoucherRef& ref, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{} #{}", ref.voucherType, ref.voucherNo);
    }
};

//-------------------------------------------------------------------------
