/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "glpost/ledger/Batch.hpp"
#include "glpost/ports/PostingError.hpp"

//-------------------------------------------------------------------------

namespace glpost::ports
{

//-------------------------------------------------------------------------

struct AccountingDimension
{
    std::string fieldname;
    std::string name;
    AccountId offsettingAccount;
    std::string accountCurrency;

    bool operator==(const AccountingDimension&) const = default;
};

//-------------------------------------------------------------------------

struct DimensionProvider
{
    virtual ~DimensionProvider() noexcept = default;

    // Dimensions of the batch that carry an offsetting account.
    [[nodiscard]] virtual Expected<std::vector<AccountingDimension>> getDimensionsForOffsetting(
        const ledger::Batch& batch, const CompanyId& company) const = 0;
};

//-------------------------------------------------------------------------

}  // namespace glpost::ports

//-------------------------------------------------------------------------
