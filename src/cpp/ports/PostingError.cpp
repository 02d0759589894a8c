/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "glpost/ports/PostingError.hpp"

#include <fmt/ranges.h>

//-------------------------------------------------------------------------

namespace glpost::ports
{

//-------------------------------------------------------------------------

PostingError::PostingError(
    PostingErrorCode code, std::string detail, ErrorContext context) noexcept
    : m_code{code}, m_detail{std::move(detail)}, m_context{std::move(context)}
{}

//-------------------------------------------------------------------------

std::string PostingError::message() const
{
    return fmt::format("{}: {}", m_code, m_detail);
}

//-------------------------------------------------------------------------

PostingError PostingError::disabledAccounts(std::vector<std::string> accounts)
{
    auto detail = fmt::format(
        "Cannot create accounting entries against disabled accounts: {}",
        fmt::join(accounts, ", "));
    return {
        PostingErrorCode::ACCOUNT_DISABLED,
        std::move(detail),
        AccountList{.accounts = std::move(accounts)}};
}

//-------------------------------------------------------------------------

PostingError PostingError::groupAccounts(std::vector<std::string> accounts)
{
    auto detail = fmt::format(
        "Cannot post to group accounts, select a ledger account instead: {}",
        fmt::join(accounts, ", "));
    return {
        PostingErrorCode::ACCOUNT_IS_GROUP,
        std::move(detail),
        AccountList{.accounts = std::move(accounts)}};
}

//-------------------------------------------------------------------------

PostingError PostingError::frozenAccounts(std::vector<std::string> accounts)
{
    auto detail = fmt::format(
        "Accounts are frozen for posting: {}", fmt::join(accounts, ", "));
    return {
        PostingErrorCode::ACCOUNT_FROZEN,
        std::move(detail),
        AccountList{.accounts = std::move(accounts)}};
}

//-------------------------------------------------------------------------

PostingError PostingError::accountNotFound(const std::string& account)
{
    return {
        PostingErrorCode::ACCOUNT_NOT_FOUND,
        fmt::format("Account '{}' does not exist", account),
        AccountList{.accounts = {account}}};
}

//-------------------------------------------------------------------------

PostingError PostingError::debitCreditMismatch(BalanceMismatch mismatch)
{
    auto detail = fmt::format(
        "Debit and Credit not equal for {} #{}. Difference is {} (allowed {})",
        mismatch.voucherType,
        mismatch.voucherNo,
        util::formatAmount(mismatch.difference, mismatch.decimalPlaces),
        util::formatAmount(mismatch.allowance, mismatch.decimalPlaces));
    return {PostingErrorCode::DEBIT_CREDIT_MISMATCH, std::move(detail), std::move(mismatch)};
}

//-------------------------------------------------------------------------

PostingError PostingError::insufficientEntries(size_t expected, size_t actual)
{
    return {
        PostingErrorCode::INSUFFICIENT_ENTRY_COUNT,
        fmt::format(
            "Incorrect number of General Ledger Entries found ({}, at least {} required). "
            "You might have selected a wrong Account in the transaction.",
            actual,
            expected),
        EntryCount{.expected = expected, .actual = actual}};
}

//-------------------------------------------------------------------------

PostingError PostingError::periodClosed(PeriodClosed period)
{
    auto detail = fmt::format(
        "Accounting period is closed for {} in {} on {} (Period: {})",
        period.documentType,
        period.company,
        period.postingDate,
        period.periodName);
    return {PostingErrorCode::PERIOD_CLOSED, std::move(detail), std::move(period)};
}

//-------------------------------------------------------------------------

PostingError PostingError::fiscalYearNotFound(std::string detail)
{
    return {PostingErrorCode::FISCAL_YEAR_NOT_FOUND, std::move(detail)};
}

//-------------------------------------------------------------------------

PostingError PostingError::accountsFrozenTill(Date frozenTill, Date postingDate)
{
    return {
        PostingErrorCode::ACCOUNTS_FROZEN_TILL_DATE,
        fmt::format(
            "Accounts are frozen till {}, cannot post on {}", frozenTill, postingDate)};
}

//-------------------------------------------------------------------------

PostingError PostingError::booksClosedTill(Date closedTill, Date postingDate)
{
    return {
        PostingErrorCode::BOOKS_CLOSED_TILL_DATE,
        fmt::format(
            "Books have been closed till the period ending on {}, cannot post on {}",
            closedTill,
            postingDate)};
}

//-------------------------------------------------------------------------

PostingError PostingError::budgetExceeded(BudgetViolation violation)
{
    auto detail = fmt::format(
        "Budget exceeded for {} in {}: budget {}, actual {}, over by {}",
        violation.account,
        violation.costCenter,
        util::formatAmount(violation.budget, util::kDefaultDecimalPlaces),
        util::formatAmount(violation.actual, util::kDefaultDecimalPlaces),
        util::formatAmount(violation.variance, util::kDefaultDecimalPlaces));
    return {PostingErrorCode::BUDGET_EXCEEDED, std::move(detail), std::move(violation)};
}

//-------------------------------------------------------------------------

PostingError PostingError::invalidAccountCurrency(
    const std::string& account, const std::string& expected, const std::string& actual)
{
    return {
        PostingErrorCode::INVALID_ACCOUNT_CURRENCY,
        fmt::format(
            "Account {} can only be posted in {}, entry uses {}", account, expected, actual),
        AccountList{.accounts = {account}}};
}

//-------------------------------------------------------------------------

PostingError PostingError::currencyMismatch(const std::string& account, std::string detail)
{
    return {
        PostingErrorCode::CURRENCY_MISMATCH,
        fmt::format("{}: {}", account, detail),
        AccountList{.accounts = {account}}};
}

//-------------------------------------------------------------------------

PostingError PostingError::voucherNotFound(const ledger::VoucherRef& voucher)
{
    return {
        PostingErrorCode::VOUCHER_NOT_FOUND,
        fmt::format("No ledger entries found for {}", voucher)};
}

//-------------------------------------------------------------------------

PostingError PostingError::voucherAlreadyPosted(const ledger::VoucherRef& voucher)
{
    return {
        PostingErrorCode::VOUCHER_ALREADY_POSTED,
        fmt::format("{} already has ledger entries", voucher)};
}

//-------------------------------------------------------------------------

PostingError PostingError::collaboratorFailure(std::string_view operation, std::string_view what)
{
    return {
        PostingErrorCode::COLLABORATOR_FAILURE,
        fmt::format("{} failed: {}", operation, what)};
}

//-------------------------------------------------------------------------

}  // namespace glpost::ports

//-------------------------------------------------------------------------
