/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "glpost/ports/AccountLookup.hpp"
#include "glpost/ports/AccountingPeriodChecker.hpp"
#include "glpost/ports/BudgetValidator.hpp"
#include "glpost/ports/CompanySettings.hpp"
#include "glpost/ports/CostCenterAllocationProvider.hpp"
#include "glpost/ports/DimensionProvider.hpp"
#include "glpost/ports/EntryStore.hpp"
#include "glpost/ports/FiscalYearLookup.hpp"
#include "glpost/ports/PartyLedgerStore.hpp"
#include "glpost/posting/Pipeline.hpp"
#include "glpost/posting/PostingConfig.hpp"
#include "glpost/posting/PostingOptions.hpp"
#include "glpost/posting/PostingSignals.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace glpost::posting
{

//-------------------------------------------------------------------------

// Non-owning. A null collaborator disables the steps that depend on it.
struct Collaborators
{
    ports::AccountLookup* accounts{};
    ports::CompanySettings* company{};
    ports::AccountingPeriodChecker* periods{};
    ports::FiscalYearLookup* fiscalYears{};
    ports::EntryStore* entryStore{};
    ports::PartyLedgerStore* partyLedgerStore{};
    ports::BudgetValidator* budget{};
    ports::DimensionProvider* dimensions{};
    ports::CostCenterAllocationProvider* costCenterAllocation{};
};

//-------------------------------------------------------------------------

class PostingEngine
{
public:
    static constexpr size_t kMinEntryCount = 2;

    explicit PostingEngine(
        Collaborators collaborators,
        PostingConfig config = {},
        std::shared_ptr<spdlog::logger> logger = {});

    // Validates, processes, reconciles and persists the batch, or reverses
    // the stored voucher of the batch when options.cancel is set.
    [[nodiscard]] ports::PostResult post(
        const ledger::Batch& batch, const PostingOptions& options = {});
    [[nodiscard]] ports::PostResult cancel(
        const ledger::VoucherRef& voucher, const PostingOptions& options = {});

    [[nodiscard]] const Collaborators& collaborators() const noexcept { return m_collaborators; }
    [[nodiscard]] const PostingConfig& config() const noexcept { return m_config; }
    [[nodiscard]] PostingSignals& signals() noexcept { return m_signals; }
    [[nodiscard]] const std::shared_ptr<spdlog::logger>& logger() const noexcept { return m_logger; }

private:
    [[nodiscard]] ports::PostResult postBatch(const ledger::Batch& input, const PostingOptions& options);
    [[nodiscard]] ports::PostResult cancelVoucher(
        const ledger::VoucherRef& voucher, const PostingOptions& options);
    void reject(const ledger::VoucherRef& voucher, const ports::PostingError& error);

    [[nodiscard]] ports::PostResult validateBudget(const ledger::Batch& batch) const;
    [[nodiscard]] ports::Expected<ledger::Batch> appendOffsettingEntries(const ledger::Batch& batch) const;
    [[nodiscard]] ports::PostResult validateAccountingPeriod(const ledger::Batch& batch) const;
    [[nodiscard]] ports::PostResult validateDisabledAccounts(const ledger::Batch& batch) const;
    [[nodiscard]] ports::Expected<ledger::Batch> validateAccounts(
        ledger::Batch batch, const PostingOptions& options) const;
    [[nodiscard]] ports::Expected<ledger::Batch> resolveFiscalYears(ledger::Batch batch) const;
    [[nodiscard]] ports::PostResult validateVoucherNotPosted(
        const ledger::VoucherRef& voucher, const PostingOptions& options) const;
    [[nodiscard]] AllocationSource allocationSource() const;
    [[nodiscard]] ports::Expected<ledger::Batch> reconcile(ledger::Batch batch) const;
    [[nodiscard]] ports::PostResult checkPostingDate(
        const CompanyId& company, Date postingDate, const PostingOptions& options) const;
    [[nodiscard]] ports::PostResult savePartyLedger(const ledger::Batch& batch);
    // Undoes savePartyLedger when the entries that follow it fail to save.
    void revertPartyLedger(const ledger::VoucherRef& voucher, const ports::PostingError& cause);
    [[nodiscard]] ports::PostResult saveEntries(const ledger::Batch& batch);

    Collaborators m_collaborators;
    PostingConfig m_config;
    std::shared_ptr<spdlog::logger> m_logger;
    PostingSignals m_signals;
};

//-------------------------------------------------------------------------

}  // namespace glpost::posting

//-------------------------------------------------------------------------
