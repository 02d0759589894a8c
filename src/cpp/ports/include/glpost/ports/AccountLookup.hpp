/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "glpost/ports/PostingError.hpp"

//-------------------------------------------------------------------------

namespace glpost::ports
{

//-------------------------------------------------------------------------

enum class BalanceMustBe : uint32_t
{
    ANY,
    DEBIT,
    CREDIT
};

enum class RootType : uint32_t
{
    ASSET,
    LIABILITY,
    EQUITY,
    INCOME,
    EXPENSE
};

//-------------------------------------------------------------------------

struct Account
{
    AccountId name;
    CompanyId company;
    std::string accountCurrency;
    RootType rootType{RootType::ASSET};
    BalanceMustBe balanceMustBe{BalanceMustBe::ANY};
    bool isGroup{};
    bool disabled{};
    bool frozen{};

    bool operator==(const Account&) const = default;
};

//-------------------------------------------------------------------------

struct AccountLookup
{
    virtual ~AccountLookup() noexcept = default;

    // Unknown accounts yield ACCOUNT_NOT_FOUND.
    [[nodiscard]] virtual Expected<Account> getAccount(const AccountId& account) const = 0;

    [[nodiscard]] virtual Expected<std::string> getAccountCurrency(const AccountId& account) const
    {
        return getAccount(account).transform([](const Account& acc) { return acc.accountCurrency; });
    }

    [[nodiscard]] virtual Expected<bool> isGroup(const AccountId& account) const
    {
        return getAccount(account).transform([](const Account& acc) { return acc.isGroup; });
    }

    [[nodiscard]] virtual Expected<bool> isFrozen(const AccountId& account) const
    {
        return getAccount(account).transform([](const Account& acc) { return acc.frozen; });
    }

    [[nodiscard]] virtual Expected<bool> isDisabled(const AccountId& account) const
    {
        return getAccount(account).transform([](const Account& acc) { return acc.disabled; });
    }

    [[nodiscard]] virtual Expected<BalanceMustBe> getBalanceMustBe(const AccountId& account) const
    {
        return getAccount(account).transform([](const Account& acc) { return acc.balanceMustBe; });
    }
};

//-------------------------------------------------------------------------

}  // namespace glpost::ports

//-------------------------------------------------------------------------
