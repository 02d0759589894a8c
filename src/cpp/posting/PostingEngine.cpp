/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "glpost/posting/PostingEngine.hpp"

#include "glpost/posting/Reconciliation.hpp"

#include <spdlog/sinks/null_sink.h>

//-------------------------------------------------------------------------

namespace glpost::posting
{

//-------------------------------------------------------------------------

namespace
{

// Collaborators report through their return value; anything they throw is
// surfaced as COLLABORATOR_FAILURE naming the operation.
template<typename F>
[[nodiscard]] std::invoke_result_t<F> callCollaborator(std::string_view operation, F&& fn)
{
    try {
        return std::invoke(std::forward<F>(fn));
    }
    catch (const std::exception& exc) {
        return std::unexpected{ports::PostingError::collaboratorFailure(operation, exc.what())};
    }
}

[[nodiscard]] std::vector<AccountId> distinctAccounts(const ledger::Batch& batch)
{
    std::vector<AccountId> accounts;
    std::set<AccountId> seen;
    for (const auto& entry : batch) {
        if (entry.account.empty() || !seen.insert(entry.account).second) continue;
        accounts.push_back(entry.account);
    }
    return accounts;
}

[[nodiscard]] bool sameAmounts(
    const ledger::DebitCredit& lhs, const ledger::DebitCredit& rhs, uint32_t decimalPlaces)
{
    return util::round(lhs.debit, decimalPlaces) == util::round(rhs.debit, decimalPlaces)
        && util::round(lhs.credit, decimalPlaces) == util::round(rhs.credit, decimalPlaces);
}

[[nodiscard]] std::shared_ptr<spdlog::logger> makeNullLogger()
{
    return std::make_shared<spdlog::logger>(
        "glpost.posting", std::make_shared<spdlog::sinks::null_sink_st>());
}

}  // namespace

//-------------------------------------------------------------------------

PostingEngine::PostingEngine(
    Collaborators collaborators, PostingConfig config, std::shared_ptr<spdlog::logger> logger)
    : m_collaborators{collaborators},
      m_config{std::move(config)},
      m_logger{logger ? std::move(logger) : makeNullLogger()}
{
    m_config.validate();
}

//-------------------------------------------------------------------------

ports::PostResult PostingEngine::post(const ledger::Batch& batch, const PostingOptions& options)
{
    if (batch.empty()) {
        m_logger->debug("Empty batch, nothing to post");
        return {};
    }
    if (options.cancel) {
        return cancel(batch.voucher(), options);
    }
    auto result = postBatch(batch, options);
    if (!result) {
        reject(batch.voucher(), result.error());
    }
    return result;
}

//-------------------------------------------------------------------------

ports::PostResult PostingEngine::cancel(
    const ledger::VoucherRef& voucher, const PostingOptions& options)
{
    auto result = cancelVoucher(voucher, options);
    if (!result) {
        reject(voucher, result.error());
    }
    return result;
}

//-------------------------------------------------------------------------

ports::PostResult PostingEngine::postBatch(
    const ledger::Batch& input, const PostingOptions& options)
{
    const auto voucher = input.voucher();
    const bool closing = m_config.isClosingVoucher(voucher.voucherType);
    m_logger->debug("{}: Posting {} entries", voucher, input.size());

    ledger::Batch batch = input;

    if (!closing) {
        if (auto res = validateBudget(batch); !res) return res;
        auto withOffsets = appendOffsettingEntries(batch);
        if (!withOffsets) return std::unexpected{std::move(withOffsets).error()};
        batch = std::move(*withOffsets);
    }

    if (auto res = validateAccountingPeriod(batch); !res) return res;
    if (auto res = validateDisabledAccounts(batch); !res) return res;

    auto validated = validateAccounts(std::move(batch), options)
        .and_then([this](ledger::Batch b) { return resolveFiscalYears(std::move(b)); });
    if (!validated) return std::unexpected{std::move(validated).error()};

    if (auto res = validateVoucherNotPosted(voucher, options); !res) return res;

    auto processed = processBatch(*validated, options, m_config, allocationSource());
    if (!processed) return std::unexpected{std::move(processed).error()};
    m_logger->debug("{}: {} entries after processing", voucher, processed->size());

    if (processed->size() < kMinEntryCount) {
        return std::unexpected{
            ports::PostingError::insufficientEntries(kMinEntryCount, processed->size())};
    }

    auto reconciled = reconcile(std::move(*processed));
    if (!reconciled) return std::unexpected{std::move(reconciled).error()};
    const ledger::Batch& posted = *reconciled;
    if (m_logger->should_log(spdlog::level::trace)) {
        m_logger->trace("{}: {}", voucher, json::jsonSerializable2str(posted));
    }

    if (auto res = checkPostingDate(posted.company(), posted.postingDate(), options); !res) {
        return res;
    }

    const bool partyLedgerSaved = !closing && !posted.partyEntries().empty();
    if (!closing) {
        if (auto res = savePartyLedger(posted); !res) return res;
    }
    if (auto res = saveEntries(posted); !res) {
        if (partyLedgerSaved) {
            revertPartyLedger(voucher, res.error());
        }
        return res;
    }

    m_logger->info(
        "{}: Posted {} entries, debit {} credit {}",
        voucher,
        posted.size(),
        util::formatAmount(posted.totalDebit(), m_config.precision),
        util::formatAmount(posted.totalCredit(), m_config.precision));
    m_signals.posted(posted);
    return {};
}

//-------------------------------------------------------------------------

ports::PostResult PostingEngine::cancelVoucher(
    const ledger::VoucherRef& voucher, const PostingOptions& options)
{
    auto* store = m_collaborators.entryStore;
    if (store == nullptr) {
        m_logger->warn("{}: No entry store configured, nothing to cancel", voucher);
        return {};
    }
    m_logger->debug("{}: Cancelling", voucher);

    auto stored = callCollaborator(
        "EntryStore::getByVoucher", [&] { return store->getByVoucher(voucher); });
    if (!stored) return std::unexpected{std::move(stored).error()};

    const ledger::Batch active{
        stored->entries()
        | views::filter([](const ledger::Entry& e) { return !e.isCancelled; })
        | ranges::to<std::vector>()};
    if (active.empty()) {
        return std::unexpected{ports::PostingError::voucherNotFound(voucher)};
    }

    if (auto res = checkPostingDate(active.company(), active.postingDate(), options); !res) {
        return res;
    }

    const auto reversal = makeReversal(active, m_config);
    if (auto res = callCollaborator(
            "EntryStore::cancelAndSave", [&] { return store->cancelAndSave(voucher, reversal); });
        !res) {
        return res;
    }
    m_logger->info("{}: Reversed {} entries", voucher, reversal.size());
    m_signals.cancelled(voucher, reversal);

    if (auto* partyStore = m_collaborators.partyLedgerStore) {
        auto res = callCollaborator(
            "PartyLedgerStore::delink", [&] { return partyStore->delink(voucher); });
        if (!res) {
            m_logger->error(
                "{}: Reversal committed but party ledger delink failed: {}", voucher, res.error());
            return res;
        }
    }
    return {};
}

//-------------------------------------------------------------------------

void PostingEngine::reject(const ledger::VoucherRef& voucher, const ports::PostingError& error)
{
    m_logger->warn("{}: Rejected: {}", voucher, error);
    m_signals.rejected(voucher, error);
}

//-------------------------------------------------------------------------

ports::PostResult PostingEngine::validateBudget(const ledger::Batch& batch) const
{
    auto* budget = m_collaborators.budget;
    if (budget == nullptr) return {};

    auto violation = callCollaborator(
        "BudgetValidator::validate", [&] { return budget->validate(batch); });
    if (!violation) return std::unexpected{std::move(violation).error()};
    if (*violation) {
        return std::unexpected{ports::PostingError::budgetExceeded(std::move(**violation))};
    }
    return {};
}

//-------------------------------------------------------------------------

ports::Expected<ledger::Batch> PostingEngine::appendOffsettingEntries(
    const ledger::Batch& batch) const
{
    auto* provider = m_collaborators.dimensions;
    if (provider == nullptr) return batch;

    auto dimensions = callCollaborator(
        "DimensionProvider::getDimensionsForOffsetting",
        [&] { return provider->getDimensionsForOffsetting(batch, batch.company()); });
    if (!dimensions) return std::unexpected{std::move(dimensions).error()};
    if (dimensions->empty()) return batch;

    m_logger->debug("{}: Offsetting {} dimension(s)", batch.voucher(), dimensions->size());
    return batch.withAppended(makeOffsettingEntries(batch, *dimensions, m_config));
}

//-------------------------------------------------------------------------

ports::PostResult PostingEngine::validateAccountingPeriod(const ledger::Batch& batch) const
{
    auto* periods = m_collaborators.periods;
    if (periods == nullptr) return {};

    const auto& company = batch.company();
    const auto documentType = batch.voucher().voucherType;
    const auto postingDate = batch.postingDate();

    auto closed = callCollaborator("AccountingPeriodChecker::isDocumentTypeClosed", [&] {
        return periods->isDocumentTypeClosed(company, documentType, postingDate);
    });
    if (!closed) return std::unexpected{std::move(closed).error()};
    if (!*closed) return {};

    auto periodName = callCollaborator("AccountingPeriodChecker::getClosedPeriodName", [&] {
        return periods->getClosedPeriodName(company, documentType, postingDate);
    });
    if (!periodName) return std::unexpected{std::move(periodName).error()};

    return std::unexpected{ports::PostingError::periodClosed({
        .company = company,
        .documentType = documentType,
        .postingDate = postingDate,
        .periodName = std::move(*periodName)
    })};
}

//-------------------------------------------------------------------------

ports::PostResult PostingEngine::validateDisabledAccounts(const ledger::Batch& batch) const
{
    auto* accounts = m_collaborators.accounts;
    if (accounts == nullptr) return {};

    std::vector<AccountId> disabled;
    for (const auto& account : distinctAccounts(batch)) {
        auto isDisabled = callCollaborator(
            "AccountLookup::isDisabled", [&] { return accounts->isDisabled(account); });
        if (!isDisabled) return std::unexpected{std::move(isDisabled).error()};
        if (*isDisabled) {
            disabled.push_back(account);
        }
    }
    if (!disabled.empty()) {
        return std::unexpected{ports::PostingError::disabledAccounts(std::move(disabled))};
    }
    return {};
}

//-------------------------------------------------------------------------

ports::Expected<ledger::Batch> PostingEngine::validateAccounts(
    ledger::Batch batch, const PostingOptions& options) const
{
    auto* accounts = m_collaborators.accounts;
    if (accounts == nullptr) return batch;

    const auto names = distinctAccounts(batch);
    std::map<AccountId, ports::Account> master;
    for (const auto& name : names) {
        auto account = callCollaborator(
            "AccountLookup::getAccount", [&] { return accounts->getAccount(name); });
        if (!account) return std::unexpected{std::move(account).error()};
        master.emplace(name, std::move(*account));
    }

    auto offending = [&](auto&& pred) {
        return names
            | views::filter([&](const AccountId& name) { return pred(master.at(name)); })
            | ranges::to<std::vector>();
    };

    if (auto groups = offending([](const ports::Account& acc) { return acc.isGroup; });
        !groups.empty()) {
        return std::unexpected{ports::PostingError::groupAccounts(std::move(groups))};
    }
    if (!options.advanceAdjustment) {
        if (auto frozen = offending([](const ports::Account& acc) { return acc.frozen; });
            !frozen.empty()) {
            return std::unexpected{ports::PostingError::frozenAccounts(std::move(frozen))};
        }
    }

    std::optional<std::string> companyCurrency;
    if (auto* company = m_collaborators.company) {
        auto currency = callCollaborator("CompanySettings::getDefaultCurrency", [&] {
            return company->getDefaultCurrency(batch.company());
        });
        if (!currency) return std::unexpected{std::move(currency).error()};
        companyCurrency = std::move(*currency);
    }

    for (auto& entry : batch) {
        if (entry.account.empty()) continue;
        const auto& account = master.at(entry.account);
        if (account.accountCurrency.empty()) continue;

        if (entry.accountCurrency.empty()) {
            entry.accountCurrency = account.accountCurrency;
        } else if (entry.accountCurrency != account.accountCurrency) {
            return std::unexpected{ports::PostingError::invalidAccountCurrency(
                entry.account, account.accountCurrency, entry.accountCurrency)};
        }

        if (!companyCurrency || entry.accountCurrency != *companyCurrency) continue;
        if (entry.accountAmounts == ledger::DebitCredit{}) {
            entry.accountAmounts = entry.amounts;
        } else if (!sameAmounts(entry.accountAmounts, entry.amounts, m_config.precision)) {
            return std::unexpected{ports::PostingError::currencyMismatch(
                entry.account,
                fmt::format(
                    "Account currency {} is the company currency but account amounts "
                    "Dr {} Cr {} differ from Dr {} Cr {}",
                    entry.accountCurrency,
                    util::formatAmount(entry.accountAmounts.debit, m_config.precision),
                    util::formatAmount(entry.accountAmounts.credit, m_config.precision),
                    util::formatAmount(entry.amounts.debit, m_config.precision),
                    util::formatAmount(entry.amounts.credit, m_config.precision)))};
        }
    }

    return batch;
}

//-------------------------------------------------------------------------

ports::Expected<ledger::Batch> PostingEngine::resolveFiscalYears(ledger::Batch batch) const
{
    auto* fiscalYears = m_collaborators.fiscalYears;
    if (fiscalYears == nullptr) return batch;

    std::map<std::pair<Date, CompanyId>, std::string> resolved;
    for (auto& entry : batch) {
        if (!entry.fiscalYear.empty()) {
            auto year = callCollaborator("FiscalYearLookup::getFiscalYearByName", [&] {
                return fiscalYears->getFiscalYearByName(entry.fiscalYear, entry.company);
            });
            if (!year) return std::unexpected{std::move(year).error()};
            if (!year->contains(entry.postingDate)) {
                return std::unexpected{ports::PostingError::fiscalYearNotFound(fmt::format(
                    "Posting date {} is not within Fiscal Year '{}' ({} to {})",
                    entry.postingDate,
                    year->name,
                    year->start,
                    year->end))};
            }
            continue;
        }

        const auto key = std::make_pair(entry.postingDate, entry.company);
        if (auto it = resolved.find(key); it != resolved.end()) {
            entry.fiscalYear = it->second;
            continue;
        }
        auto year = callCollaborator("FiscalYearLookup::getFiscalYear", [&] {
            return fiscalYears->getFiscalYear(entry.postingDate, entry.company);
        });
        if (!year) return std::unexpected{std::move(year).error()};
        entry.fiscalYear = year->name;
        resolved.emplace(key, year->name);
    }

    return batch;
}

//-------------------------------------------------------------------------

ports::PostResult PostingEngine::validateVoucherNotPosted(
    const ledger::VoucherRef& voucher, const PostingOptions& options) const
{
    auto* store = m_collaborators.entryStore;
    if (store == nullptr || options.fromRepost) return {};

    auto existing = callCollaborator(
        "EntryStore::getByVoucher", [&] { return store->getByVoucher(voucher); });
    if (!existing) return std::unexpected{std::move(existing).error()};
    if (ranges::any_of(existing->entries(), [](const ledger::Entry& e) { return !e.isCancelled; })) {
        return std::unexpected{ports::PostingError::voucherAlreadyPosted(voucher)};
    }
    return {};
}

//-------------------------------------------------------------------------

AllocationSource PostingEngine::allocationSource() const
{
    auto* provider = m_collaborators.costCenterAllocation;
    if (provider == nullptr) return {};

    return [provider](const ledger::Entry& entry) {
        return callCollaborator("CostCenterAllocationProvider::getAllocation", [&] {
            return provider->getAllocation(entry.company, entry.costCenter, entry.postingDate);
        });
    };
}

//-------------------------------------------------------------------------

ports::Expected<ledger::Batch> PostingEngine::reconcile(ledger::Batch batch) const
{
    auto difference = checkDebitCreditDifference(batch, m_config);
    if (!difference) return std::unexpected{std::move(difference).error()};

    const auto voucher = batch.voucher();
    if (!needsRoundOff(*difference, voucher.voucherType, m_config)) return batch;

    auto* company = m_collaborators.company;
    if (company == nullptr) {
        m_logger->debug("{}: No company settings, difference {} left as is", voucher, *difference);
        return batch;
    }

    auto account = callCollaborator(
        "CompanySettings::getRoundOffAccount",
        [&] { return company->getRoundOffAccount(batch.company()); });
    if (!account) return std::unexpected{std::move(account).error()};
    if (account->empty()) {
        m_logger->debug(
            "{}: No round-off account for '{}', difference {} left as is",
            voucher,
            batch.company(),
            *difference);
        return batch;
    }

    auto costCenter = callCollaborator(
        "CompanySettings::getRoundOffCostCenter",
        [&] { return company->getRoundOffCostCenter(batch.company()); });
    if (!costCenter) return std::unexpected{std::move(costCenter).error()};

    auto currency = callCollaborator(
        "CompanySettings::getDefaultCurrency",
        [&] { return company->getDefaultCurrency(batch.company()); });
    if (!currency) return std::unexpected{std::move(currency).error()};

    batch.append(makeRoundOffEntry(
        batch,
        *difference,
        {.account = *account, .costCenter = *costCenter, .accountCurrency = *currency},
        m_config));
    m_logger->debug("{}: Difference {} posted to {}", voucher, *difference, *account);
    return batch;
}

//-------------------------------------------------------------------------

ports::PostResult PostingEngine::checkPostingDate(
    const CompanyId& companyName, Date postingDate, const PostingOptions& options) const
{
    auto* company = m_collaborators.company;
    if (company == nullptr) return {};

    if (!options.advanceAdjustment) {
        auto frozenTill = callCollaborator(
            "CompanySettings::getAccountsFrozenTillDate",
            [&] { return company->getAccountsFrozenTillDate(companyName); });
        if (!frozenTill) return std::unexpected{std::move(frozenTill).error()};
        if (*frozenTill && postingDate < **frozenTill) {
            return std::unexpected{ports::PostingError::accountsFrozenTill(**frozenTill, postingDate)};
        }
    }

    auto closedTill = callCollaborator(
        "CompanySettings::getBooksClosedTillDate",
        [&] { return company->getBooksClosedTillDate(companyName); });
    if (!closedTill) return std::unexpected{std::move(closedTill).error()};
    if (*closedTill && postingDate <= **closedTill) {
        return std::unexpected{ports::PostingError::booksClosedTill(**closedTill, postingDate)};
    }
    return {};
}

//-------------------------------------------------------------------------

ports::PostResult PostingEngine::savePartyLedger(const ledger::Batch& batch)
{
    auto* store = m_collaborators.partyLedgerStore;
    if (store == nullptr) return {};

    const auto entries = batch.partyEntries();
    if (entries.empty()) return {};
    return callCollaborator(
        "PartyLedgerStore::saveBatch", [&] { return store->saveBatch(entries); });
}

//-------------------------------------------------------------------------

void PostingEngine::revertPartyLedger(
    const ledger::VoucherRef& voucher, const ports::PostingError& cause)
{
    auto* store = m_collaborators.partyLedgerStore;
    if (store == nullptr) return;

    m_logger->warn("{}: Delinking party ledger after failed save: {}", voucher, cause);
    auto res = callCollaborator(
        "PartyLedgerStore::delink", [&] { return store->delink(voucher); });
    if (!res) {
        m_logger->error(
            "{}: Party ledger left linked after failed save: {}", voucher, res.error());
    }
}

//-------------------------------------------------------------------------

ports::PostResult PostingEngine::saveEntries(const ledger::Batch& batch)
{
    auto* store = m_collaborators.entryStore;
    if (store == nullptr) {
        m_logger->debug("{}: No entry store configured, batch not persisted", batch.voucher());
        return {};
    }
    return callCollaborator("EntryStore::saveBatch", [&] { return store->saveBatch(batch); });
}

//-------------------------------------------------------------------------

}  // namespace glpost::posting

//-------------------------------------------------------------------------
