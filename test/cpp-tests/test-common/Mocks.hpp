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

#include <gmock/gmock.h>

//-------------------------------------------------------------------------

namespace glpost::test
{

//-------------------------------------------------------------------------

struct MockAccountLookup : ports::AccountLookup
{
    MOCK_METHOD(ports::Expected<ports::Account>, getAccount, (const AccountId&), (const, override));
    MOCK_METHOD(ports::Expected<bool>, isDisabled, (const AccountId&), (const, override));
};

struct MockCompanySettings : ports::CompanySettings
{
    MOCK_METHOD(ports::Expected<std::string>, getDefaultCurrency, (const CompanyId&), (const, override));
    MOCK_METHOD(ports::Expected<AccountId>, getRoundOffAccount, (const CompanyId&), (const, override));
    MOCK_METHOD(ports::Expected<std::string>, getRoundOffCostCenter, (const CompanyId&), (const, override));
    MOCK_METHOD(
        ports::Expected<std::optional<Date>>, getAccountsFrozenTillDate, (const CompanyId&), (const, override));
    MOCK_METHOD(
        ports::Expected<std::optional<Date>>, getBooksClosedTillDate, (const CompanyId&), (const, override));
};

struct MockAccountingPeriodChecker : ports::AccountingPeriodChecker
{
    MOCK_METHOD(
        ports::Expected<bool>,
        isDocumentTypeClosed,
        (const CompanyId&, const std::string&, Date),
        (const, override));
    MOCK_METHOD(
        ports::Expected<std::string>,
        getClosedPeriodName,
        (const CompanyId&, const std::string&, Date),
        (const, override));
};

struct MockFiscalYearLookup : ports::FiscalYearLookup
{
    MOCK_METHOD(ports::Expected<ports::FiscalYear>, getFiscalYear, (Date, const CompanyId&), (const, override));
    MOCK_METHOD(
        ports::Expected<ports::FiscalYear>,
        getFiscalYearByName,
        (const std::string&, const CompanyId&),
        (const, override));
};

struct MockEntryStore : ports::EntryStore
{
    MOCK_METHOD(ports::PostResult, save, (const ledger::Entry&), (override));
    MOCK_METHOD(ports::PostResult, saveBatch, (const ledger::Batch&), (override));
    MOCK_METHOD(ports::Expected<ledger::Batch>, getByVoucher, (const ledger::VoucherRef&), (const, override));
    MOCK_METHOD(ports::PostResult, markCancelled, (const ledger::VoucherRef&), (override));
    MOCK_METHOD(
        ports::PostResult, cancelAndSave, (const ledger::VoucherRef&, const ledger::Batch&), (override));
};

struct MockPartyLedgerStore : ports::PartyLedgerStore
{
    MOCK_METHOD(ports::PostResult, save, (const ledger::PartyLedgerEntry&), (override));
    MOCK_METHOD(ports::PostResult, saveBatch, (std::span<const ledger::PartyLedgerEntry>), (override));
    MOCK_METHOD(
        ports::Expected<std::vector<ledger::PartyLedgerEntry>>,
        getByVoucher,
        (const ledger::VoucherRef&),
        (const, override));
    MOCK_METHOD(ports::PostResult, delink, (const ledger::VoucherRef&), (override));
};

struct MockBudgetValidator : ports::BudgetValidator
{
    MOCK_METHOD(
        ports::Expected<std::optional<ports::BudgetViolation>>, validate, (const ledger::Batch&), (const, override));
};

struct MockDimensionProvider : ports::DimensionProvider
{
    MOCK_METHOD(
        ports::Expected<std::vector<ports::AccountingDimension>>,
        getDimensionsForOffsetting,
        (const ledger::Batch&, const CompanyId&),
        (const, override));
};

struct MockCostCenterAllocationProvider : ports::CostCenterAllocationProvider
{
    MOCK_METHOD(
        ports::Expected<ports::CostCenterAllocation>,
        getAllocation,
        (const CompanyId&, const std::string&, Date),
        (const, override));
};

//-------------------------------------------------------------------------

}  // namespace glpost::test

//-------------------------------------------------------------------------
