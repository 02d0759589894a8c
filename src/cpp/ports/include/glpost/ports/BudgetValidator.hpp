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

struct BudgetValidator
{
    virtual ~BudgetValidator() noexcept = default;

    // A value holding a violation means the batch exceeds a budget; an
    // error means the check itself could not run.
    [[nodiscard]] virtual Expected<std::optional<BudgetViolation>> validate(
        const ledger::Batch& batch) const = 0;
};

//-------------------------------------------------------------------------

}  // namespace glpost::ports

//-------------------------------------------------------------------------
