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

// Target cost center to percentage share. Shares add up to 100.
using CostCenterAllocation = std::map<std::string, decimal_t>;

struct CostCenterAllocationProvider
{
    virtual ~CostCenterAllocationProvider() noexcept = default;

    // Empty when the cost center has no allocation in effect on the date.
    [[nodiscard]] virtual Expected<CostCenterAllocation> getAllocation(
        const CompanyId& company, const std::string& costCenter, Date postingDate) const = 0;
};

//-------------------------------------------------------------------------

}  // namespace glpost::ports

//-------------------------------------------------------------------------
