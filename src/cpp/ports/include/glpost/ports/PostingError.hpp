/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "glpost/ledger/VoucherRef.hpp"

//-------------------------------------------------------------------------

namespace glpost::ports
{

//-------------------------------------------------------------------------

enum class PostingErrorCode : uint32_t
{
    ACCOUNT_DISABLED,
    ACCOUNT_FROZEN,
    ACCOUNT_IS_GROUP,
    ACCOUNT_NOT_FOUND,
    DEBIT_CREDIT_MISMATCH,
    INSUFFICIENT_ENTRY_COUNT,
    PERIOD_CLOSED,
    FISCAL_YEAR_NOT_FOUND,
    ACCOUNTS_FROZEN_TILL_DATE,
    BOOKS_CLOSED_TILL_DATE,
    BUDGET_EXCEEDED,
    INVALID_ACCOUNT_CURRENCY,
    CURRENCY_MISMATCH,
    VOUCHER_NOT_FOUND,
    VOUCHER_ALREADY_POSTED,
    COLLABORATOR_FAILURE
};

[[nodiscard]] constexpr std::string_view PostingErrorCode2StrView(PostingErrorCode ec) noexcept
{
    return magic_enum::enum_name(ec);
}

//-------------------------------------------------------------------------

struct AccountList
{
    std::vector<std::string> accounts;

    bool operator==(const AccountList&) const = default;
};

struct PeriodClosed
{
    std::string company;
    std::string documentType;
    Date postingDate;
    std::string periodName;

    bool operator==(const PeriodClosed&) const = default;
};

struct BudgetViolation
{
    std::string account;
    std::string costCenter;
    decimal_t budget{};
    decimal_t actual{};
    decimal_t variance{};

    bool operator==(const BudgetViolation&) const = default;
};

struct BalanceMismatch
{
    std::string voucherType;
    std::string voucherNo;
    decimal_t difference{};
    decimal_t allowance{};
    uint32_t decimalPlaces{util::kDefaultDecimalPlaces};

    bool operator==(const BalanceMismatch&) const = default;
};

struct EntryCount
{
    size_t expected{};
    size_t actual{};

    bool operator==(const EntryCount&) const = default;
};

using ErrorContext = std::variant<
    std::monostate, AccountList, PeriodClosed, BudgetViolation, BalanceMismatch, EntryCount>;

//-------------------------------------------------------------------------

class PostingError
{
public:
    PostingError(PostingErrorCode code, std::string detail, ErrorContext context = {}) noexcept;

    [[nodiscard]] PostingErrorCode code() const noexcept { return m_code; }
    [[nodiscard]] const std::string& detail() const noexcept { return m_detail; }
    [[nodiscard]] const ErrorContext& context() const noexcept { return m_context; }
    [[nodiscard]] std::string message() const;

    template<typename T>
    [[nodiscard]] const T* contextAs() const noexcept { return std::get_if<T>(&m_context); }

    [[nodiscard]] static PostingError disabledAccounts(std::vector<std::string> accounts);
    [[nodiscard]] static PostingError groupAccounts(std::vector<std::string> accounts);
    [[nodiscard]] static PostingError frozenAccounts(std::vector<std::string> accounts);
    [[nodiscard]] static PostingError accountNotFound(const std::string& account);
    [[nodiscard]] static PostingError debitCreditMismatch(BalanceMismatch mismatch);
    [[nodiscard]] static PostingError insufficientEntries(size_t expected, size_t actual);
    [[nodiscard]] static PostingError periodClosed(PeriodClosed period);
    [[nodiscard]] static PostingError fiscalYearNotFound(std::string detail);
    [[nodiscard]] static PostingError accountsFrozenTill(Date frozenTill, Date postingDate);
    [[nodiscard]] static PostingError booksClosedTill(Date closedTill, Date postingDate);
    [[nodiscard]] static PostingError budgetExceeded(BudgetViolation violation);
    [[nodiscard]] static PostingError invalidAccountCurrency(
        const std::string& account, const std::string& expected, const std::string& actual);
    [[nodiscard]] static PostingError currencyMismatch(const std::string& account, std::string detail);
    [[nodiscard]] static PostingError voucherNotFound(const ledger::VoucherRef& voucher);
    [[nodiscard]] static PostingError voucherAlreadyPosted(const ledger::VoucherRef& voucher);
    [[nodiscard]] static PostingError collaboratorFailure(std::string_view operation, std::string_view what);

    bool operator==(const PostingError&) const = default;

private:
    PostingErrorCode m_code;
    std::string m_detail;
    ErrorContext m_context;
};

//-------------------------------------------------------------------------

using PostResult = std::expected<void, PostingError>;

template<typename T>
using Expected = std::expected<T, PostingError>;

//-------------------------------------------------------------------------

}  // namespace glpost::ports

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<glpost::ports::PostingErrorCode>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(glpost::ports::PostingErrorCode ec, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", glpost::ports::PostingErrorCode2StrView(ec));
    }
};

template<>
struct fmt::formatter<glpost::ports::PostingError>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const glpost::ports::PostingError& err, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", err.message());
    }
};

//-------------------------------------------------------------------------
