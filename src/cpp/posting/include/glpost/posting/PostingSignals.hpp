/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "glpost/ledger/Batch.hpp"
#include "glpost/ports/PostingError.hpp"

//-------------------------------------------------------------------------

namespace glpost::posting
{

//-------------------------------------------------------------------------

struct PostingSignals
{
    // Final batch, after processing and reconciliation.
    UnsyncSignal<void(const ledger::Batch&)> posted;
    UnsyncSignal<void(const ledger::VoucherRef&, const ledger::Batch&)> cancelled;
    UnsyncSignal<void(const ledger::VoucherRef&, const ports::PostingError&)> rejected;
};

//-------------------------------------------------------------------------

}  // namespace glpost::posting

//-------------------------------------------------------------------------
