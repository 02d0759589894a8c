/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "common.hpp"
#include "glpost/ledger/VoucherRef.hpp"

#include <array>

//-------------------------------------------------------------------------

namespace glpost::ledger
{

//-------------------------------------------------------------------------

struct DebitCredit
{
    decimal_t debit{};
    decimal_t credit{};

    [[nodiscard]] decimal_t net() const noexcept { return debit - credit; }
    [[nodiscard]] DebitCredit swapped() const noexcept { return {.debit = credit, .credit = debit}; }
    [[nodiscard]] bool isZero(uint32_t decimalPlaces) const noexcept;

    DebitCredit& operator+=(const DebitCredit& other) noexcept;

    bool operator==(const DebitCredit&) const noexcept = default;
};

//-------------------------------------------------------------------------

enum class CurrencyView : uint32_t
{
    COMPANY,
    ACCOUNT,
    TRANSACTION
};

inline constexpr auto kCurrencyViewCount = magic_enum::enum_count<CurrencyView>();

//-------------------------------------------------------------------------

struct Entry
{
    std::string name;

    Date postingDate{};
    std::optional<Date> transactionDate;
    std::optional<Date> dueDate;

    std::string company;
    std::string fiscalYear;

    std::string voucherType;
    std::string voucherNo;
    std::string voucherSubtype;
    std::string voucherDetailNo;

    std::string account;
    std::string accountCurrency;

    std::string partyType;
    std::string party;

    std::string againstVoucherType;
    std::string againstVoucher;

    std::string costCenter;
    std::string project;
    std::string financeBook;

    // Company (reporting) currency.
    DebitCredit amounts;
    DebitCredit accountAmounts;
    DebitCredit transactionAmounts;
    std::string transactionCurrency;
    decimal_t exchangeRate{1};

    bool isOpening{};
    bool isAdvance{};
    bool isCancelled{};

    std::string remarks;

    [[nodiscard]] decimal_t debit() const noexcept { return amounts.debit; }
    [[nodiscard]] decimal_t credit() const noexcept { return amounts.credit; }
    [[nodiscard]] VoucherRef voucher() const { return {voucherType, voucherNo}; }
    [[nodiscard]] bool hasParty() const noexcept { return !partyType.empty() && !party.empty(); }

    [[nodiscard]] DebitCredit& view(CurrencyView which) noexcept;
    [[nodiscard]] const DebitCredit& view(CurrencyView which) const noexcept;

    void forEachView(std::function<void(DebitCredit&)> fn);

    // Debit and credit exchanged on every currency view.
    [[nodiscard]] Entry reversed() const;

    void clearPartyReferences() noexcept;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;

    [[nodiscard]] static Entry fromJson(const rapidjson::Value& json);

    bool operator==(const Entry&) const = default;
};

//-------------------------------------------------------------------------

}  // namespace glpost::ledger

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<glpost::ledger::Entry>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const glpost::ledger::Entry& entry, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "{} [{}] Dr {} Cr {}",
            entry.account,
            entry.voucher(),
            entry.amounts.debit,
            entry.amounts.credit);
    }
};

//-------------------------------------------------------------------------
