/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include <benchmark/benchmark.h>
#include <fmt/format.h>

#include "glpost/memory/AccountRegistry.hpp"
#include "glpost/memory/AccountingPeriodCalendar.hpp"
#include "glpost/memory/CompanyRegistry.hpp"
#include "glpost/memory/FiscalYearCalendar.hpp"
#include "glpost/memory/InMemoryEntryStore.hpp"
#include "glpost/memory/InMemoryPartyLedgerStore.hpp"
#include "glpost/posting/PostingEngine.hpp"

//-------------------------------------------------------------------------

using namespace glpost;
using namespace glpost::literals;

//-------------------------------------------------------------------------

static const fs::path kTestDataPath{
    fs::path{__FILE__}.parent_path().parent_path() / "test" / "cpp-tests" / "data"};

static const Date kPostingDate = util::makeDate(2024, 3, 15);

// One receivable line against lineCount revenue lines spread over
// distinctAccounts accounts, so merging collapses most of them.
static ledger::Batch makeBatch(int64_t lineCount, int64_t distinctAccounts, const std::string& voucherNo)
{
    auto makeEntry = [&](const AccountId& account, decimal_t debit, decimal_t credit) {
        const ledger::DebitCredit amounts{.debit = debit, .credit = credit};
        return ledger::Entry{
            .postingDate = kPostingDate,
            .company = "Acme Ltd",
            .voucherType = "Sales Invoice",
            .voucherNo = voucherNo,
            .account = account,
            .amounts = amounts,
            .accountAmounts = amounts,
            .transactionAmounts = amounts,
            .transactionCurrency = "USD"
        };
    };

    static const AccountId kRevenueAccounts[]{"Sales", "CGST Payable", "SGST Payable"};

    std::vector<ledger::Entry> entries;
    entries.reserve(lineCount + 1);
    entries.push_back(makeEntry("Debtors", decimal_t{static_cast<int>(lineCount)} * DEC(10.01), 0_dec));
    for (int64_t i = 0; i < lineCount; ++i) {
        const auto& account = kRevenueAccounts[i % std::min<int64_t>(distinctAccounts, 3)];
        entries.push_back(makeEntry(account, 0_dec, DEC(10.01)));
    }
    return ledger::Batch{std::move(entries)};
}

//-------------------------------------------------------------------------

struct EngineFixture : benchmark::Fixture
{
    void SetUp(benchmark::State&) override
    {
        pugi::xml_document doc;
        if (!doc.load_file((kTestDataPath / "Ledger.xml").c_str())) {
            throw std::runtime_error{fmt::format("Unable to load {}", (kTestDataPath / "Ledger.xml").string())};
        }
        const auto root = doc.child("Ledger");

        accounts = memory::AccountRegistry::fromXML(root.child("Accounts"));
        companies = memory::CompanyRegistry::fromXML(root.child("Companies"));
        fiscalYears = memory::FiscalYearCalendar::fromXML(root.child("FiscalYears"));
        periods = memory::AccountingPeriodCalendar::fromXML(root.child("AccountingPeriods"));
        entryStore = std::make_unique<memory::InMemoryEntryStore>();
        partyLedgerStore = std::make_unique<memory::InMemoryPartyLedgerStore>();

        engine = std::make_unique<posting::PostingEngine>(posting::Collaborators{
            .accounts = accounts.get(),
            .company = companies.get(),
            .periods = periods.get(),
            .fiscalYears = fiscalYears.get(),
            .entryStore = entryStore.get(),
            .partyLedgerStore = partyLedgerStore.get()
        });
    }

    void TearDown(benchmark::State&) override
    {
        engine.reset();
    }

    std::unique_ptr<memory::AccountRegistry> accounts;
    std::unique_ptr<memory::CompanyRegistry> companies;
    std::unique_ptr<memory::FiscalYearCalendar> fiscalYears;
    std::unique_ptr<memory::AccountingPeriodCalendar> periods;
    std::unique_ptr<memory::InMemoryEntryStore> entryStore;
    std::unique_ptr<memory::InMemoryPartyLedgerStore> partyLedgerStore;
    std::unique_ptr<posting::PostingEngine> engine;
};

//-------------------------------------------------------------------------

static void ProcessBatch(benchmark::State& state)
{
    const auto batch = makeBatch(state.range(0), state.range(1), "SINV-0001");
    const posting::PostingConfig config;

    for (auto _ : state) {
        auto processed = posting::processBatch(batch, {}, config);
        benchmark::DoNotOptimize(processed);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(ProcessBatch)->Args({10, 3})->Args({1'000, 3})->Args({1'000, 1});

//-------------------------------------------------------------------------

BENCHMARK_DEFINE_F(EngineFixture, PostAndCancel)(benchmark::State& state)
{
    int64_t voucherCount{};
    for (auto _ : state) {
        const auto batch = makeBatch(state.range(0), 3, fmt::format("SINV-{:06}", voucherCount++));
        auto posted = engine->post(batch);
        if (!posted) {
            state.SkipWithError(posted.error().message().c_str());
            break;
        }
        auto cancelled = engine->cancel(batch.voucher());
        if (!cancelled) {
            state.SkipWithError(cancelled.error().message().c_str());
            break;
        }
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK_REGISTER_F(EngineFixture, PostAndCancel)->Arg(10)->Arg(100);

//-------------------------------------------------------------------------
