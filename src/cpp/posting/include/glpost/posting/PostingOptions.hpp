/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

//-------------------------------------------------------------------------

namespace glpost::posting
{

//-------------------------------------------------------------------------

struct PostingOptions
{
    bool cancel{};
    bool mergeEntries{true};
    // Bypasses the frozen-account and frozen-till checks.
    bool advanceAdjustment{};
    // Re-derivation of an already posted voucher.
    bool fromRepost{};
};

//-------------------------------------------------------------------------

}  // namespace glpost::posting

//-------------------------------------------------------------------------
