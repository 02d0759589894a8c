/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "glpost/ledger/Batch.hpp"
#include "glpost/ports/PostingError.hpp"
#include "glpost/posting/PostingConfig.hpp"

//-------------------------------------------------------------------------

namespace glpost::posting
{

//-------------------------------------------------------------------------

struct RoundOffTarget
{
    AccountId account;
    std::string costCenter;
    std::string accountCurrency;
};

//-------------------------------------------------------------------------

// Total debit minus total credit at the configured precision.
[[nodiscard]] decimal_t debitCreditDifference(const ledger::Batch& batch, const PostingConfig& config);

// The difference when it is within the voucher type's allowance,
// DEBIT_CREDIT_MISMATCH otherwise.
[[nodiscard]] ports::Expected<decimal_t> checkDebitCreditDifference(
    const ledger::Batch& batch, const PostingConfig& config);

// True iff minUnit <= |difference| <= allowance.
[[nodiscard]] bool needsRoundOff(
    decimal_t difference, const std::string& voucherType, const PostingConfig& config);

// Copy of the first entry moved to the round-off account, stripped of party
// references, carrying exactly the amount that cancels the difference.
[[nodiscard]] ledger::Entry makeRoundOffEntry(
    const ledger::Batch& batch,
    decimal_t difference,
    const RoundOffTarget& target,
    const PostingConfig& config);

//-------------------------------------------------------------------------

}  // namespace glpost::posting

//-------------------------------------------------------------------------
