/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "glpost/ledger/PartyLedgerEntry.hpp"
#include "glpost/ports/PostingError.hpp"

//-------------------------------------------------------------------------

namespace glpost::ports
{

//-------------------------------------------------------------------------

struct PartyLedgerStore
{
    virtual ~PartyLedgerStore() noexcept = default;

    [[nodiscard]] virtual PostResult save(const ledger::PartyLedgerEntry& entry) = 0;
    [[nodiscard]] virtual PostResult saveBatch(std::span<const ledger::PartyLedgerEntry> entries) = 0;
    [[nodiscard]] virtual Expected<std::vector<ledger::PartyLedgerEntry>> getByVoucher(
        const ledger::VoucherRef& voucher) const = 0;
    // Flags every entry originating from the voucher as delinked.
    [[nodiscard]] virtual PostResult delink(const ledger::VoucherRef& voucher) = 0;
};

//-------------------------------------------------------------------------

}  // namespace glpost::ports

//-------------------------------------------------------------------------
