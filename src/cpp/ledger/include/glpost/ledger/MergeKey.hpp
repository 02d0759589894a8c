/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "glpost/ledger/Entry.hpp"

//-------------------------------------------------------------------------

namespace glpost::ledger
{

//-------------------------------------------------------------------------

// Identity of a ledger position: entries sharing a key collapse into one
// when merged. An empty field and an absent field compare equal.
struct MergeKey
{
    std::string account;
    std::string costCenter;
    std::string party;
    std::string partyType;
    std::string voucherDetailNo;
    std::string againstVoucher;
    std::string againstVoucherType;
    std::string project;
    std::string financeBook;
    std::string voucherNo;

    [[nodiscard]] std::string toString() const;

    [[nodiscard]] static MergeKey of(const Entry& entry);

    auto operator<=>(const MergeKey&) const = default;
};

//-------------------------------------------------------------------------

}  // namespace glpost::ledger

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<glpost::ledger::MergeKey>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const glpost::ledger::MergeKey& key, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", key.toString());
    }
};

//-------------------------------------------------------------------------
