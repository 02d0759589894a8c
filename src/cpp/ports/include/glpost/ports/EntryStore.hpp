/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "glpost/ledger/Batch.hpp"
#include "glpost/ports/PostingError.hpp"

//-------------------------------------------------------------------------

namespace glpost::ports
{

//-------------------------------------------------------------------------

struct EntryStore
{
    virtual ~EntryStore() noexcept = default;

    [[nodiscard]] virtual PostResult save(const ledger::Entry& entry) = 0;
    // All or nothing.
    [[nodiscard]] virtual PostResult saveBatch(const ledger::Batch& batch) = 0;
    // Every stored entry of the voucher, cancelled ones included, in insertion order.
    [[nodiscard]] virtual Expected<ledger::Batch> getByVoucher(const ledger::VoucherRef& voucher) const = 0;
    [[nodiscard]] virtual PostResult markCancelled(const ledger::VoucherRef& voucher) = 0;
    // Marks the voucher's entries cancelled and stores the reversal as one unit.
    [[nodiscard]] virtual PostResult cancelAndSave(
        const ledger::VoucherRef& voucher, const ledger::Batch& reversal) = 0;
};

//-------------------------------------------------------------------------

}  // namespace glpost::ports

//-------------------------------------------------------------------------
