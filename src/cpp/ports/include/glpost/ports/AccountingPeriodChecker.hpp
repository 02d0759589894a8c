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

struct AccountingPeriodChecker
{
    virtual ~AccountingPeriodChecker() noexcept = default;

    [[nodiscard]] virtual Expected<bool> isDocumentTypeClosed(
        const CompanyId& company, const std::string& documentType, Date postingDate) const = 0;
    // Name of the closed period covering the date, empty if none.
    [[nodiscard]] virtual Expected<std::string> getClosedPeriodName(
        const CompanyId& company, const std::string& documentType, Date postingDate) const = 0;
};

//-------------------------------------------------------------------------

}  // namespace glpost::ports

//-------------------------------------------------------------------------
