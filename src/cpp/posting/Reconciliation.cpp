/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "glpost/posting/Reconciliation.hpp"

//-------------------------------------------------------------------------

namespace glpost::posting
{

//-------------------------------------------------------------------------

decimal_t debitCreditDifference(const ledger::Batch& batch, const PostingConfig& config)
{
    return batch.difference(config.precision);
}

//-------------------------------------------------------------------------

ports::Expected<decimal_t> checkDebitCreditDifference(
    const ledger::Batch& batch, const PostingConfig& config)
{
    if (batch.empty()) return 0_dec;

    const auto voucher = batch.voucher();
    const auto difference = debitCreditDifference(batch, config);
    const auto allowance = config.allowanceFor(voucher.voucherType);
    if (util::abs(difference) > allowance) {
        return std::unexpected{ports::PostingError::debitCreditMismatch({
            .voucherType = voucher.voucherType,
            .voucherNo = voucher.voucherNo,
            .difference = difference,
            .allowance = allowance,
            .decimalPlaces = config.precision
        })};
    }
    return difference;
}

//-------------------------------------------------------------------------

bool needsRoundOff(decimal_t difference, const std::string& voucherType, const PostingConfig& config)
{
    const auto magnitude = util::abs(difference);
    return util::minUnit(config.precision) <= magnitude
        && magnitude <= config.allowanceFor(voucherType);
}

//-------------------------------------------------------------------------

ledger::Entry makeRoundOffEntry(
    const ledger::Batch& batch,
    decimal_t difference,
    const RoundOffTarget& target,
    const PostingConfig& config)
{
    ledger::Entry entry = batch.front();
    entry.name.clear();
    entry.account = target.account;
    entry.costCenter = target.costCenter;
    entry.accountCurrency = target.accountCurrency;
    entry.remarks = config.roundOffRemark;
    entry.clearPartyReferences();

    const auto amount = util::round(util::abs(difference), config.precision);
    const ledger::DebitCredit amounts = difference > 0_dec
        ? ledger::DebitCredit{.debit = 0_dec, .credit = amount}
        : ledger::DebitCredit{.debit = amount, .credit = 0_dec};
    entry.amounts = amounts;
    entry.accountAmounts = amounts;
    entry.transactionAmounts = {};
    return entry;
}

//-------------------------------------------------------------------------

}  // namespace glpost::posting

//-------------------------------------------------------------------------
