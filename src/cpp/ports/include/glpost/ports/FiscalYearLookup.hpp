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

struct FiscalYear
{
    std::string name;
    Date start{};
    Date end{};

    [[nodiscard]] bool contains(Date date) const noexcept { return start <= date && date <= end; }

    bool operator==(const FiscalYear&) const = default;
};

//-------------------------------------------------------------------------

struct FiscalYearLookup
{
    virtual ~FiscalYearLookup() noexcept = default;

    // FISCAL_YEAR_NOT_FOUND when no year of the company covers the date.
    [[nodiscard]] virtual Expected<FiscalYear> getFiscalYear(
        Date date, const CompanyId& company) const = 0;
    [[nodiscard]] virtual Expected<FiscalYear> getFiscalYearByName(
        const std::string& name, const CompanyId& company) const = 0;
};

//-------------------------------------------------------------------------

}  // namespace glpost::ports

//-------------------------------------------------------------------------
