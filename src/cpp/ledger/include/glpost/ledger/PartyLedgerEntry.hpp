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

// Receivable/payable projection of a party-bearing entry. Positive amounts
// increase what the party owes (debit), negative amounts decrease it.
struct PartyLedgerEntry
{
    std::string name;

    Date postingDate{};
    std::optional<Date> dueDate;
    std::string company;
    std::string account;
    std::string accountCurrency;

    std::string partyType;
    std::string party;

    std::string voucherType;
    std::string voucherNo;
    std::string voucherDetailNo;

    std::string againstVoucherType;
    std::string againstVoucherNo;

    decimal_t amount{};
    decimal_t amountInAccountCurrency{};

    std::string financeBook;
    bool delinked{};

    [[nodiscard]] VoucherRef voucher() const { return {voucherType, voucherNo}; }
    [[nodiscard]] VoucherRef againstVoucher() const { return {againstVoucherType, againstVoucherNo}; }

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;

    // Precondition: entry.hasParty().
    [[nodiscard]] static PartyLedgerEntry fromEntry(const Entry& entry);

    bool operator==(const PartyLedgerEntry&) const = default;
};

//-------------------------------------------------------------------------

}  // namespace glpost::ledger

//-------------------------------------------------------------------------
