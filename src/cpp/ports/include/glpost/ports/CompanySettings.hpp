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

struct CompanySettings
{
    virtual ~CompanySettings() noexcept = default;

    [[nodiscard]] virtual Expected<std::string> getDefaultCurrency(const CompanyId& company) const = 0;
    // Empty when no round-off account is configured.
    [[nodiscard]] virtual Expected<AccountId> getRoundOffAccount(const CompanyId& company) const = 0;
    [[nodiscard]] virtual Expected<std::string> getRoundOffCostCenter(const CompanyId& company) const = 0;
    [[nodiscard]] virtual Expected<std::optional<Date>> getAccountsFrozenTillDate(
        const CompanyId& company) const = 0;
    [[nodiscard]] virtual Expected<std::optional<Date>> getBooksClosedTillDate(
        const CompanyId& company) const = 0;
};

//-------------------------------------------------------------------------

}  // namespace glpost::ports

//-------------------------------------------------------------------------
