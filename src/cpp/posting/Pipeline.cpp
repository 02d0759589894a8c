/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "glpost/posting/Pipeline.hpp"

#include "glpost/ledger/MergeKey.hpp"

//-------------------------------------------------------------------------

namespace glpost::posting
{

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] ledger::DebitCredit scaled(
    const ledger::DebitCredit& amounts, decimal_t share, uint32_t precision)
{
    return {
        .debit = util::round(amounts.debit * share / 100_dec, precision),
        .credit = util::round(amounts.credit * share / 100_dec, precision)
    };
}

[[nodiscard]] ledger::DebitCredit residue(
    const ledger::DebitCredit& total, const ledger::DebitCredit& allocated)
{
    return {.debit = total.debit - allocated.debit, .credit = total.credit - allocated.credit};
}

}  // namespace

//-------------------------------------------------------------------------

ports::Expected<ledger::Batch> distributeByCostCenter(
    const ledger::Batch& batch, const AllocationSource& allocationOf, const PostingConfig& config)
{
    if (!allocationOf || batch.empty() || config.isClosingVoucher(batch.voucher().voucherType)) {
        return batch;
    }

    ledger::Batch::ContainerType distributed;
    distributed.reserve(batch.size());

    for (const auto& entry : batch) {
        if (entry.costCenter.empty()) {
            distributed.push_back(entry);
            continue;
        }
        auto allocation = allocationOf(entry);
        if (!allocation) {
            return std::unexpected{std::move(allocation).error()};
        }
        if (allocation->empty()) {
            distributed.push_back(entry);
            continue;
        }

        const auto totalShare = ranges::accumulate(*allocation | views::values, 0_dec);
        if (totalShare != 100_dec) {
            return std::unexpected{ports::PostingError::collaboratorFailure(
                "CostCenterAllocationProvider::getAllocation",
                fmt::format(
                    "Allocation for cost center '{}' sums to {}, expected 100",
                    entry.costCenter,
                    totalShare))};
        }

        std::array<ledger::DebitCredit, ledger::kCurrencyViewCount> allocated{};
        size_t splitIdx{};
        for (const auto& [costCenter, share] : *allocation) {
            const bool last = ++splitIdx == allocation->size();
            ledger::Entry split = entry;
            split.name.clear();
            split.costCenter = costCenter;
            for (auto which : magic_enum::enum_values<ledger::CurrencyView>()) {
                auto& sum = allocated[std::to_underlying(which)];
                split.view(which) = last
                    ? residue(entry.view(which), sum)
                    : scaled(entry.view(which), share, config.precision);
                sum += split.view(which);
            }
            distributed.push_back(std::move(split));
        }
    }

    return ledger::Batch{std::move(distributed)};
}

//-------------------------------------------------------------------------

ledger::Batch mergeSimilarEntries(const ledger::Batch& batch, const PostingConfig& config)
{
    ledger::Batch::ContainerType merged;
    merged.reserve(batch.size());
    std::map<ledger::MergeKey, size_t> keyIndex;

    for (const auto& entry : batch) {
        auto [it, inserted] = keyIndex.try_emplace(ledger::MergeKey::of(entry), merged.size());
        if (inserted) {
            merged.push_back(entry);
            continue;
        }
        auto& head = merged[it->second];
        for (auto which : magic_enum::enum_values<ledger::CurrencyView>()) {
            head.view(which) += entry.view(which);
        }
    }

    return ledger::Batch{
        merged
        | views::filter([&](const ledger::Entry& e) {
            return !e.amounts.isZero(config.precision) || config.keepsZeroEntry(e);
        })
        | ranges::to<std::vector>()};
}

//-------------------------------------------------------------------------

ledger::DebitCredit normalized(ledger::DebitCredit amounts) noexcept
{
    auto& [debit, credit] = amounts;
    if (debit < 0_dec && credit < 0_dec && debit == credit) {
        debit = -debit;
        credit = -credit;
    }
    if (debit < 0_dec) {
        credit -= debit;
        debit = 0_dec;
    }
    if (credit < 0_dec) {
        debit -= credit;
        credit = 0_dec;
    }
    return amounts;
}

//-------------------------------------------------------------------------

ledger::Batch normalizeNegativeAmounts(const ledger::Batch& batch)
{
    ledger::Batch result = batch;
    for (auto& entry : result) {
        entry.forEachView([](ledger::DebitCredit& dc) { dc = normalized(dc); });
    }
    return result;
}

//-------------------------------------------------------------------------

std::vector<ledger::Entry> makeOffsettingEntries(
    const ledger::Batch& batch,
    std::span<const ports::AccountingDimension> dimensions,
    const PostingConfig& config)
{
    if (dimensions.empty()) return {};

    const decimal_t count{static_cast<uint64_t>(dimensions.size())};
    std::vector<ledger::Entry> offsetting;
    offsetting.reserve(batch.size() * dimensions.size());

    for (const auto& entry : batch) {
        const ledger::DebitCredit amounts{
            .debit = util::round(entry.amounts.credit, config.precision) / count,
            .credit = util::round(entry.amounts.debit, config.precision) / count
        };
        const ledger::DebitCredit transactionAmounts{
            .debit = util::round(entry.transactionAmounts.credit, config.precision) / count,
            .credit = util::round(entry.transactionAmounts.debit, config.precision) / count
        };
        for (const auto& dimension : dimensions) {
            ledger::Entry offset = entry;
            offset.name.clear();
            offset.account = dimension.offsettingAccount;
            offset.accountCurrency = dimension.accountCurrency;
            offset.amounts = amounts;
            offset.accountAmounts = amounts;
            offset.transactionAmounts = transactionAmounts;
            offset.remarks = config.offsettingRemarkPrefix + dimension.name;
            offset.clearPartyReferences();
            offsetting.push_back(std::move(offset));
        }
    }

    return offsetting;
}

//-------------------------------------------------------------------------

ledger::Batch makeReversal(const ledger::Batch& batch, const PostingConfig& config)
{
    return ledger::Batch{
        batch.entries()
        | views::transform([&](const ledger::Entry& entry) {
            ledger::Entry rev = entry.reversed();
            rev.name.clear();
            rev.remarks = config.reversalRemarkPrefix + entry.remarks;
            rev.isCancelled = true;
            return rev;
        })
        | ranges::to<std::vector>()};
}

//-------------------------------------------------------------------------

ports::Expected<ledger::Batch> processBatch(
    const ledger::Batch& batch,
    const PostingOptions& options,
    const PostingConfig& config,
    const AllocationSource& allocationOf)
{
    if (batch.empty()) return batch;

    const bool closing = config.isClosingVoucher(batch.voucher().voucherType);

    return distributeByCostCenter(batch, allocationOf, config)
        .transform([&](ledger::Batch distributed) {
            return options.mergeEntries && !closing
                ? mergeSimilarEntries(distributed, config)
                : std::move(distributed);
        })
        .transform(normalizeNegativeAmounts);
}

//-------------------------------------------------------------------------

}  // namespace glpost::posting

//-------------------------------------------------------------------------
