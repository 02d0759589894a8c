/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "glpost/ledger/Batch.hpp"
#include "glpost/ports/CostCenterAllocationProvider.hpp"
#include "glpost/ports/DimensionProvider.hpp"
#include "glpost/posting/PostingConfig.hpp"
#include "glpost/posting/PostingOptions.hpp"

//-------------------------------------------------------------------------

namespace glpost::posting
{

//-------------------------------------------------------------------------

using AllocationSource =
    std::function<ports::Expected<ports::CostCenterAllocation>(const ledger::Entry&)>;

//-------------------------------------------------------------------------

// Splits every entry whose cost center has an allocation into one entry per
// target cost center. Amounts are scaled by share and rounded; the last
// split absorbs the residue so the parts add up to the original exactly.
[[nodiscard]] ports::Expected<ledger::Batch> distributeByCostCenter(
    const ledger::Batch& batch, const AllocationSource& allocationOf, const PostingConfig& config);

// Collapses entries sharing a merge key, summing every currency view into
// the first occurrence. Entries that round to zero on the company view are
// dropped unless the config keeps them.
[[nodiscard]] ledger::Batch mergeSimilarEntries(
    const ledger::Batch& batch, const PostingConfig& config);

[[nodiscard]] ledger::DebitCredit normalized(ledger::DebitCredit amounts) noexcept;

// Moves negative debits to credit and negative credits to debit on every
// currency view.
[[nodiscard]] ledger::Batch normalizeNegativeAmounts(const ledger::Batch& batch);

// For every entry and dimension, an entry on the dimension's offsetting
// account with debit and credit swapped and split evenly across dimensions.
[[nodiscard]] std::vector<ledger::Entry> makeOffsettingEntries(
    const ledger::Batch& batch,
    std::span<const ports::AccountingDimension> dimensions,
    const PostingConfig& config);

// Debit and credit swapped on every view, remarks prefixed, flagged cancelled.
[[nodiscard]] ledger::Batch makeReversal(const ledger::Batch& batch, const PostingConfig& config);

// Distribution (unless closing voucher), merge (when enabled and not a
// closing voucher), then normalization.
[[nodiscard]] ports::Expected<ledger::Batch> processBatch(
    const ledger::Batch& batch,
    const PostingOptions& options,
    const PostingConfig& config,
    const AllocationSource& allocationOf = {});

//-------------------------------------------------------------------------

}  // namespace glpost::posting

//-------------------------------------------------------------------------
