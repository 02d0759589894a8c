/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "glpost/memory/InMemoryPartyLedgerStore.hpp"
#include "glpost/posting/PostingEngine.hpp"

#include "EngineFixture.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace glpost;
using namespace glpost::literals;

using namespace testing;

using PostingEngineTest = test::EngineTest;

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] ports::Account ledgerAccount(const AccountId& name)
{
    return {.name = name, .company = test::kCompany, .accountCurrency = test::kCurrency};
}

MATCHER_P(HasCode, code, "")
{
    return !arg.has_value() && arg.error().code() == code;
}

}  // namespace

//-------------------------------------------------------------------------

TEST_F(PostingEngineTest, PostsValidInvoice)
{
    EXPECT_CALL(partyLedgerStore, saveBatch(SizeIs(1))).Times(1);
    EXPECT_CALL(entryStore, saveBatch(SizeIs(4))).Times(1);

    const auto result = engine->post(test::makeInvoiceBatch());

    ASSERT_TRUE(result.has_value()) << result.error().message();
    ASSERT_THAT(posted, SizeIs(1));
    EXPECT_TRUE(posted[0].isBalanced());
    for (const auto& entry : posted[0]) {
        EXPECT_EQ(entry.fiscalYear, "2024");
        EXPECT_EQ(entry.accountCurrency, test::kCurrency);
    }
    EXPECT_THAT(rejected, IsEmpty());
}

TEST_F(PostingEngineTest, StepsRunInOrder)
{
    {
        InSequence seq;
        EXPECT_CALL(budget, validate(_));
        EXPECT_CALL(dimensions, getDimensionsForOffsetting(_, test::kCompany));
        EXPECT_CALL(periods, isDocumentTypeClosed(test::kCompany, "Sales Invoice", test::kPostingDate));
        EXPECT_CALL(accounts, isDisabled(_)).Times(4);
        EXPECT_CALL(accounts, getAccount(_)).Times(4);
        EXPECT_CALL(company, getDefaultCurrency(test::kCompany));
        EXPECT_CALL(fiscalYears, getFiscalYear(test::kPostingDate, test::kCompany)).Times(1);
        EXPECT_CALL(entryStore, getByVoucher(ledger::VoucherRef{"Sales Invoice", "SINV-0001"}));
        EXPECT_CALL(company, getAccountsFrozenTillDate(test::kCompany));
        EXPECT_CALL(company, getBooksClosedTillDate(test::kCompany));
        EXPECT_CALL(partyLedgerStore, saveBatch(_));
        EXPECT_CALL(entryStore, saveBatch(_));
    }

    EXPECT_TRUE(engine->post(test::makeInvoiceBatch()).has_value());
}

TEST_F(PostingEngineTest, EmptyBatchIsNoop)
{
    EXPECT_CALL(budget, validate(_)).Times(0);
    EXPECT_CALL(entryStore, saveBatch(_)).Times(0);

    EXPECT_TRUE(engine->post(ledger::Batch{}).has_value());
    EXPECT_THAT(posted, IsEmpty());
}

TEST_F(PostingEngineTest, NoCollaboratorsStillReconciles)
{
    posting::PostingEngine bare{posting::Collaborators{}};

    EXPECT_TRUE(bare.post(test::makeInvoiceBatch()).has_value());

    const ledger::Batch unbalanced{
        test::makeEntry("Debtors", 101_dec, 0_dec),
        test::makeEntry("Sales", 0_dec, 100_dec)
    };
    EXPECT_THAT(bare.post(unbalanced), HasCode(ports::PostingErrorCode::DEBIT_CREDIT_MISMATCH));
}

TEST_F(PostingEngineTest, InvalidConfigThrows)
{
    posting::PostingConfig config;
    config.precision = 0;
    EXPECT_THROW(posting::PostingEngine(posting::Collaborators{}, config), std::invalid_argument);
}

//-------------------------------------------------------------------------

TEST_F(PostingEngineTest, BudgetViolationShortCircuits)
{
    const ports::BudgetViolation violation{
        .account = "Sales", .costCenter = "Main", .budget = 5'000_dec, .actual = 10'000_dec, .variance = 5'000_dec};
    EXPECT_CALL(budget, validate(_))
        .WillOnce(Return(ports::Expected<std::optional<ports::BudgetViolation>>{violation}));
    EXPECT_CALL(dimensions, getDimensionsForOffsetting(_, _)).Times(0);
    EXPECT_CALL(periods, isDocumentTypeClosed(_, _, _)).Times(0);
    EXPECT_CALL(accounts, isDisabled(_)).Times(0);
    EXPECT_CALL(entryStore, saveBatch(_)).Times(0);

    const auto result = engine->post(test::makeInvoiceBatch());

    ASSERT_THAT(result, HasCode(ports::PostingErrorCode::BUDGET_EXCEEDED));
    EXPECT_EQ(*result.error().contextAs<ports::BudgetViolation>(), violation);
    ASSERT_THAT(rejected, SizeIs(1));
    EXPECT_EQ(rejected[0], result.error());
    EXPECT_THAT(posted, IsEmpty());
}

TEST_F(PostingEngineTest, BudgetCheckFailurePropagates)
{
    const auto error = ports::PostingError::collaboratorFailure("BudgetValidator::validate", "offline");
    EXPECT_CALL(budget, validate(_)).WillOnce(Return(std::unexpected{error}));

    const auto result = engine->post(test::makeInvoiceBatch());

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), error);
}

TEST_F(PostingEngineTest, ClosingVoucherSkipsBudgetOffsettingAndPartyLedger)
{
    EXPECT_CALL(budget, validate(_)).Times(0);
    EXPECT_CALL(dimensions, getDimensionsForOffsetting(_, _)).Times(0);
    EXPECT_CALL(partyLedgerStore, saveBatch(_)).Times(0);
    EXPECT_CALL(entryStore, saveBatch(SizeIs(3))).Times(1);
    const ledger::Batch batch{
        test::makeEntry("Sales", 600_dec, 0_dec, posting::kPeriodClosingVoucher, "PCV-0001"),
        test::makeEntry("Sales", 400_dec, 0_dec, posting::kPeriodClosingVoucher, "PCV-0001"),
        test::makeEntry("Retained Earnings", 0_dec, 1'000_dec, posting::kPeriodClosingVoucher, "PCV-0001")
    };

    EXPECT_TRUE(engine->post(batch).has_value());
}

TEST_F(PostingEngineTest, OffsettingEntriesArePosted)
{
    const std::vector dims{ports::AccountingDimension{
        .fieldname = "branch", .name = "Branch", .offsettingAccount = "Branch Clearing", .accountCurrency = "USD"}};
    EXPECT_CALL(dimensions, getDimensionsForOffsetting(_, test::kCompany))
        .WillOnce(Return(ports::Expected<std::vector<ports::AccountingDimension>>{dims}));
    EXPECT_CALL(accounts, isDisabled(_)).Times(AnyNumber());
    EXPECT_CALL(accounts, isDisabled("Branch Clearing")).Times(1);

    ASSERT_TRUE(engine->post(test::makeInvoiceBatch()).has_value());

    ASSERT_THAT(posted, SizeIs(1));
    const auto& batch = posted[0];
    ASSERT_EQ(batch.size(), 5u);
    EXPECT_EQ(batch[4].account, "Branch Clearing");
    EXPECT_EQ(batch[4].amounts, (ledger::DebitCredit{.debit = 11'800_dec, .credit = 11'800_dec}));
    EXPECT_TRUE(batch.isBalanced());
}

//-------------------------------------------------------------------------

TEST_F(PostingEngineTest, ClosedPeriodIsRejected)
{
    EXPECT_CALL(periods, isDocumentTypeClosed(test::kCompany, "Sales Invoice", test::kPostingDate))
        .WillOnce(Return(ports::Expected<bool>{true}));
    EXPECT_CALL(periods, getClosedPeriodName(test::kCompany, "Sales Invoice", test::kPostingDate))
        .WillOnce(Return(ports::Expected<std::string>{"Mar 2024"}));
    EXPECT_CALL(accounts, isDisabled(_)).Times(0);

    const auto result = engine->post(test::makeInvoiceBatch());

    ASSERT_THAT(result, HasCode(ports::PostingErrorCode::PERIOD_CLOSED));
    const auto* period = result.error().contextAs<ports::PeriodClosed>();
    ASSERT_NE(period, nullptr);
    EXPECT_EQ(period->periodName, "Mar 2024");
    EXPECT_EQ(period->documentType, "Sales Invoice");
}

TEST_F(PostingEngineTest, DisabledAccountIsNamedExactly)
{
    ON_CALL(accounts, isDisabled("CGST Payable")).WillByDefault(Return(ports::Expected<bool>{true}));
    EXPECT_CALL(accounts, getAccount(_)).Times(0);

    const auto result = engine->post(test::makeInvoiceBatch());

    ASSERT_THAT(result, HasCode(ports::PostingErrorCode::ACCOUNT_DISABLED));
    EXPECT_THAT(result.error().contextAs<ports::AccountList>()->accounts, ElementsAre("CGST Payable"));
}

TEST_F(PostingEngineTest, DisabledAccountsInFirstAppearanceOrder)
{
    ON_CALL(accounts, isDisabled(AnyOf("SGST Payable", "Debtors"))).WillByDefault(Return(ports::Expected<bool>{true}));

    const auto result = engine->post(test::makeInvoiceBatch());

    ASSERT_THAT(result, HasCode(ports::PostingErrorCode::ACCOUNT_DISABLED));
    EXPECT_THAT(
        result.error().contextAs<ports::AccountList>()->accounts, ElementsAre("Debtors", "SGST Payable"));
}

TEST_F(PostingEngineTest, GroupAccountIsRejectedBeforeFrozen)
{
    ON_CALL(accounts, getAccount("Sales")).WillByDefault([](const AccountId& name) {
        auto account = ledgerAccount(name);
        account.frozen = true;
        return ports::Expected<ports::Account>{account};
    });
    ON_CALL(accounts, getAccount("Debtors")).WillByDefault([](const AccountId& name) {
        auto account = ledgerAccount(name);
        account.isGroup = true;
        return ports::Expected<ports::Account>{account};
    });

    const auto result = engine->post(test::makeInvoiceBatch());

    ASSERT_THAT(result, HasCode(ports::PostingErrorCode::ACCOUNT_IS_GROUP));
    EXPECT_THAT(result.error().contextAs<ports::AccountList>()->accounts, ElementsAre("Debtors"));
}

TEST_F(PostingEngineTest, FrozenAccountUnlessAdvanceAdjustment)
{
    ON_CALL(accounts, getAccount("Sales")).WillByDefault([](const AccountId& name) {
        auto account = ledgerAccount(name);
        account.frozen = true;
        return ports::Expected<ports::Account>{account};
    });

    EXPECT_THAT(
        engine->post(test::makeInvoiceBatch()), HasCode(ports::PostingErrorCode::ACCOUNT_FROZEN));
    EXPECT_TRUE(engine->post(test::makeInvoiceBatch(), {.advanceAdjustment = true}).has_value());
}

TEST_F(PostingEngineTest, UnknownAccount)
{
    ON_CALL(accounts, getAccount("Sales")).WillByDefault(
        Return(ports::Expected<ports::Account>{std::unexpect, ports::PostingError::accountNotFound("Sales")}));

    EXPECT_THAT(
        engine->post(test::makeInvoiceBatch()), HasCode(ports::PostingErrorCode::ACCOUNT_NOT_FOUND));
}

TEST_F(PostingEngineTest, EntryCurrencyMustMatchAccount)
{
    auto batch = test::makeInvoiceBatch();
    batch[1].accountCurrency = "EUR";

    const auto result = engine->post(batch);

    ASSERT_THAT(result, HasCode(ports::PostingErrorCode::INVALID_ACCOUNT_CURRENCY));
    EXPECT_THAT(result.error().contextAs<ports::AccountList>()->accounts, ElementsAre("Sales"));
}

TEST_F(PostingEngineTest, CompanyCurrencyAccountAmountsMustMatch)
{
    auto batch = test::makeInvoiceBatch();
    batch[1].accountAmounts = {.debit = 0_dec, .credit = 9'000_dec};

    EXPECT_THAT(engine->post(batch), HasCode(ports::PostingErrorCode::CURRENCY_MISMATCH));
}

TEST_F(PostingEngineTest, MissingAccountAmountsAreFilledFromCompanyAmounts)
{
    auto batch = test::makeInvoiceBatch();
    batch[1].accountAmounts = {};

    ASSERT_TRUE(engine->post(batch).has_value());

    ASSERT_THAT(posted, SizeIs(1));
    EXPECT_EQ(posted[0][1].accountAmounts, posted[0][1].amounts);
}

TEST_F(PostingEngineTest, ForeignCurrencyAccountKeepsItsAmounts)
{
    ON_CALL(accounts, getAccount("Debtors")).WillByDefault([](const AccountId& name) {
        auto account = ledgerAccount(name);
        account.accountCurrency = "EUR";
        return ports::Expected<ports::Account>{account};
    });
    auto batch = test::makeInvoiceBatch();
    batch[0].accountAmounts = {.debit = 10'900_dec, .credit = 0_dec};

    ASSERT_TRUE(engine->post(batch).has_value());

    ASSERT_THAT(posted, SizeIs(1));
    EXPECT_EQ(posted[0][0].accountCurrency, "EUR");
    EXPECT_EQ(posted[0][0].accountAmounts.debit, 10'900_dec);
}

//-------------------------------------------------------------------------

TEST_F(PostingEngineTest, FiscalYearNotFound)
{
    EXPECT_CALL(fiscalYears, getFiscalYear(_, _)).WillOnce(
        Return(ports::Expected<ports::FiscalYear>{
            std::unexpect, ports::PostingError::fiscalYearNotFound("No fiscal year")}));
    EXPECT_CALL(entryStore, getByVoucher(_)).Times(0);

    EXPECT_THAT(
        engine->post(test::makeInvoiceBatch()), HasCode(ports::PostingErrorCode::FISCAL_YEAR_NOT_FOUND));
}

TEST_F(PostingEngineTest, ExplicitFiscalYearMustContainPostingDate)
{
    EXPECT_CALL(fiscalYears, getFiscalYearByName("2023", test::kCompany)).WillOnce(Return(
        ports::Expected<ports::FiscalYear>{ports::FiscalYear{
            .name = "2023", .start = util::makeDate(2023, 1, 1), .end = util::makeDate(2023, 12, 31)}}));
    auto batch = test::makeInvoiceBatch();
    batch[0].fiscalYear = "2023";

    const auto result = engine->post(batch);

    ASSERT_THAT(result, HasCode(ports::PostingErrorCode::FISCAL_YEAR_NOT_FOUND));
    EXPECT_THAT(result.error().detail(), HasSubstr("2023"));
}

TEST_F(PostingEngineTest, VoucherAlreadyPosted)
{
    auto stored = test::makeInvoiceBatch();
    ON_CALL(entryStore, getByVoucher(_)).WillByDefault(Return(ports::Expected<ledger::Batch>{stored}));
    EXPECT_CALL(entryStore, saveBatch(_)).Times(0);

    EXPECT_THAT(
        engine->post(test::makeInvoiceBatch()), HasCode(ports::PostingErrorCode::VOUCHER_ALREADY_POSTED));
}

TEST_F(PostingEngineTest, RepostAndCancelledEntriesBypassAlreadyPosted)
{
    auto stored = test::makeInvoiceBatch();
    ON_CALL(entryStore, getByVoucher(_)).WillByDefault(Return(ports::Expected<ledger::Batch>{stored}));

    EXPECT_TRUE(engine->post(test::makeInvoiceBatch(), {.fromRepost = true}).has_value());

    for (auto& entry : stored) {
        entry.isCancelled = true;
    }
    ON_CALL(entryStore, getByVoucher(_)).WillByDefault(Return(ports::Expected<ledger::Batch>{stored}));

    EXPECT_TRUE(engine->post(test::makeInvoiceBatch()).has_value());
}

TEST_F(PostingEngineTest, TooFewEntriesAfterMerge)
{
    const ledger::Batch batch{
        test::makeEntry("Bank", 100_dec, 0_dec, "Journal Entry", "JV-0001"),
        test::makeEntry("Bank", 0_dec, 100_dec, "Journal Entry", "JV-0001")
    };
    EXPECT_CALL(entryStore, saveBatch(_)).Times(0);

    const auto result = engine->post(batch);

    ASSERT_THAT(result, HasCode(ports::PostingErrorCode::INSUFFICIENT_ENTRY_COUNT));
    EXPECT_EQ(*result.error().contextAs<ports::EntryCount>(), (ports::EntryCount{.expected = 2, .actual = 1}));
    EXPECT_TRUE(engine->post(batch, {.mergeEntries = false}).has_value());
}

//-------------------------------------------------------------------------

TEST_F(PostingEngineTest, RoundOffEntryIsAppended)
{
    const ledger::Batch batch{
        test::withParty(test::makeEntry("Debtors", DEC(100.02), 0_dec), "Customer", "Globex"),
        test::makeEntry("Sales", 0_dec, 100_dec)
    };

    ASSERT_TRUE(engine->post(batch).has_value());

    ASSERT_THAT(posted, SizeIs(1));
    ASSERT_EQ(posted[0].size(), 3u);
    const auto& roundOff = posted[0][2];
    EXPECT_EQ(roundOff.account, "Round Off");
    EXPECT_EQ(roundOff.costCenter, "Main");
    EXPECT_EQ(roundOff.amounts, (ledger::DebitCredit{.debit = 0_dec, .credit = DEC(0.02)}));
    EXPECT_FALSE(roundOff.hasParty());
    EXPECT_TRUE(posted[0].isBalanced());
}

TEST_F(PostingEngineTest, NoRoundOffAccountLeavesDifference)
{
    ON_CALL(company, getRoundOffAccount(_)).WillByDefault(Return(ports::Expected<AccountId>{""}));
    const ledger::Batch batch{
        test::makeEntry("Debtors", DEC(100.02), 0_dec),
        test::makeEntry("Sales", 0_dec, 100_dec)
    };

    ASSERT_TRUE(engine->post(batch).has_value());

    ASSERT_THAT(posted, SizeIs(1));
    EXPECT_EQ(posted[0].size(), 2u);
}

TEST_F(PostingEngineTest, RoundOffLookupFailurePropagates)
{
    ON_CALL(company, getRoundOffAccount(_)).WillByDefault(Return(ports::Expected<AccountId>{
        std::unexpect, ports::PostingError::collaboratorFailure("CompanySettings", "unavailable")}));
    const ledger::Batch batch{
        test::makeEntry("Debtors", DEC(100.02), 0_dec),
        test::makeEntry("Sales", 0_dec, 100_dec)
    };

    EXPECT_THAT(engine->post(batch), HasCode(ports::PostingErrorCode::COLLABORATOR_FAILURE));
}

TEST_F(PostingEngineTest, MismatchAboveAllowanceSavesNothing)
{
    EXPECT_CALL(partyLedgerStore, saveBatch(_)).Times(0);
    EXPECT_CALL(entryStore, saveBatch(_)).Times(0);
    const ledger::Batch batch{
        test::withParty(test::makeEntry("Debtors", DEC(101.00), 0_dec), "Customer", "Globex"),
        test::makeEntry("Sales", 0_dec, 100_dec)
    };

    EXPECT_THAT(engine->post(batch), HasCode(ports::PostingErrorCode::DEBIT_CREDIT_MISMATCH));
}

//-------------------------------------------------------------------------

TEST_F(PostingEngineTest, AccountsFrozenTillDate)
{
    ON_CALL(company, getAccountsFrozenTillDate(_))
        .WillByDefault(Return(ports::Expected<std::optional<Date>>{util::makeDate(2024, 3, 31)}));
    EXPECT_CALL(partyLedgerStore, saveBatch(_)).Times(1);

    EXPECT_THAT(
        engine->post(test::makeInvoiceBatch()),
        HasCode(ports::PostingErrorCode::ACCOUNTS_FROZEN_TILL_DATE));
    EXPECT_TRUE(engine->post(test::makeInvoiceBatch(), {.advanceAdjustment = true}).has_value());
}

TEST_F(PostingEngineTest, BooksClosedTillDateIsInclusive)
{
    ON_CALL(company, getBooksClosedTillDate(_))
        .WillByDefault(Return(ports::Expected<std::optional<Date>>{test::kPostingDate}));
    EXPECT_CALL(entryStore, saveBatch(_)).Times(0);

    EXPECT_THAT(
        engine->post(test::makeInvoiceBatch(), {.advanceAdjustment = true}),
        HasCode(ports::PostingErrorCode::BOOKS_CLOSED_TILL_DATE));
}

//-------------------------------------------------------------------------

TEST_F(PostingEngineTest, ThrowingStoreBecomesCollaboratorFailure)
{
    EXPECT_CALL(entryStore, saveBatch(_)).WillOnce(Throw(std::runtime_error{"disk full"}));

    const auto result = engine->post(test::makeInvoiceBatch());

    ASSERT_THAT(result, HasCode(ports::PostingErrorCode::COLLABORATOR_FAILURE));
    EXPECT_EQ(result.error().detail(), "EntryStore::saveBatch failed: disk full");
    EXPECT_THAT(posted, IsEmpty());
    EXPECT_THAT(rejected, SizeIs(1));
}

TEST_F(PostingEngineTest, PartyLedgerFailureSkipsEntries)
{
    EXPECT_CALL(partyLedgerStore, saveBatch(_))
        .WillOnce(Return(ports::PostResult{
            std::unexpect, ports::PostingError::collaboratorFailure("PartyLedgerStore", "locked")}));
    EXPECT_CALL(entryStore, saveBatch(_)).Times(0);

    EXPECT_THAT(
        engine->post(test::makeInvoiceBatch()), HasCode(ports::PostingErrorCode::COLLABORATOR_FAILURE));
}

TEST_F(PostingEngineTest, FailedEntrySaveDelinksPartyLedger)
{
    const auto invoice = test::makeInvoiceBatch();
    EXPECT_CALL(partyLedgerStore, saveBatch(SizeIs(1))).Times(1);
    EXPECT_CALL(entryStore, saveBatch(_)).WillOnce(Throw(std::runtime_error{"disk full"}));
    EXPECT_CALL(partyLedgerStore, delink(invoice.voucher())).Times(1);

    const auto result = engine->post(invoice);

    ASSERT_THAT(result, HasCode(ports::PostingErrorCode::COLLABORATOR_FAILURE));
    EXPECT_EQ(result.error().detail(), "EntryStore::saveBatch failed: disk full");
}

TEST_F(PostingEngineTest, FailedEntrySaveKeepsOriginalErrorWhenDelinkFails)
{
    EXPECT_CALL(entryStore, saveBatch(_))
        .WillOnce(Return(ports::PostResult{
            std::unexpect, ports::PostingError::collaboratorFailure("EntryStore", "locked")}));
    EXPECT_CALL(partyLedgerStore, delink(_))
        .WillOnce(Return(ports::PostResult{
            std::unexpect, ports::PostingError::collaboratorFailure("PartyLedgerStore", "offline")}));

    const auto result = engine->post(test::makeInvoiceBatch());

    ASSERT_THAT(result, HasCode(ports::PostingErrorCode::COLLABORATOR_FAILURE));
    EXPECT_EQ(result.error().detail(), "EntryStore failed: locked");
}

TEST_F(PostingEngineTest, FailedEntrySaveWithoutPartiesSkipsDelink)
{
    EXPECT_CALL(entryStore, saveBatch(_)).WillOnce(Throw(std::runtime_error{"disk full"}));
    EXPECT_CALL(partyLedgerStore, delink(_)).Times(0);

    const ledger::Batch batch{
        test::makeEntry("Bank", 100_dec, 0_dec, "Journal Entry", "JV-0001"),
        test::makeEntry("Sales", 0_dec, 100_dec, "Journal Entry", "JV-0001")
    };

    EXPECT_THAT(engine->post(batch), HasCode(ports::PostingErrorCode::COLLABORATOR_FAILURE));
}

TEST_F(PostingEngineTest, RetryAfterFailedEntrySaveCountsPartyOnce)
{
    memory::InMemoryPartyLedgerStore partyStore;
    posting::PostingEngine withPartyStore{posting::Collaborators{
        .entryStore = &entryStore,
        .partyLedgerStore = &partyStore
    }};
    EXPECT_CALL(entryStore, saveBatch(_))
        .WillOnce(Throw(std::runtime_error{"disk full"}))
        .WillOnce(Return(ports::PostResult{}));
    const auto invoice = test::makeInvoiceBatch();

    ASSERT_THAT(
        withPartyStore.post(invoice), HasCode(ports::PostingErrorCode::COLLABORATOR_FAILURE));
    EXPECT_EQ(partyStore.outstanding("Customer", "Globex", "Debtors"), 0_dec);

    ASSERT_TRUE(withPartyStore.post(invoice).has_value());
    EXPECT_EQ(partyStore.outstanding("Customer", "Globex", "Debtors"), 11'800_dec);
}

//-------------------------------------------------------------------------
