/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "glpost/ledger/MergeKey.hpp"

//-------------------------------------------------------------------------

namespace glpost::ledger
{

//-------------------------------------------------------------------------

std::string MergeKey::toString() const
{
    return fmt::format(
        "{}|{}|{}|{}|{}|{}|{}|{}|{}|{}",
        account,
        costCenter,
        party,
        partyType,
        voucherDetailNo,
        againstVoucher,
        againstVoucherType,
        project,
        financeBook,
        voucherNo);
}

//-------------------------------------------------------------------------

MergeKey MergeKey::of(const Entry& entry)
{
    return {
        .account = entry.account,
        .costCenter = entry.costCenter,
        .party = entry.party,
        .partyType = entry.partyType,
        .voucherDetailNo = entry.voucherDetailNo,
        .againstVoucher = entry.againstVoucher,
        .againstVoucherType = entry.againstVoucherType,
        .project = entry.project,
        .financeBook = entry.financeBook,
        .voucherNo = entry.voucherNo
    };
}

//-------------------------------------------------------------------------

}  // namespace glpost::ledger

//-------------------------------------------------------------------------
