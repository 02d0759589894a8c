/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "glpost/ledger/Entry.hpp"

//-------------------------------------------------------------------------

namespace glpost::ledger
{

//-------------------------------------------------------------------------

bool DebitCredit::isZero(uint32_t decimalPlaces) const noexcept
{
    return util::isZero(debit, decimalPlaces) && util::isZero(credit, decimalPlaces);
}

//-------------------------------------------------------------------------

DebitCredit& DebitCredit::operator+=(const DebitCredit& other) noexcept
{
    debit += other.debit;
    credit += other.credit;
    return *this;
}

//-------------------------------------------------------------------------

DebitCredit& Entry::view(CurrencyView which) noexcept
{
    switch (which) {
        case CurrencyView::ACCOUNT: return accountAmounts;
        case CurrencyView::TRANSACTION: return transactionAmounts;
        default: return amounts;
    }
}

//-------------------------------------------------------------------------

const DebitCredit& Entry::view(CurrencyView which) const noexcept
{
    switch (which) {
        case CurrencyView::ACCOUNT: return accountAmounts;
        case CurrencyView::TRANSACTION: return transactionAmounts;
        default: return amounts;
    }
}

//-------------------------------------------------------------------------

void Entry::forEachView(std::function<void(DebitCredit&)> fn)
{
    for (auto which : magic_enum::enum_values<CurrencyView>()) {
        fn(view(which));
    }
}

//-------------------------------------------------------------------------

Entry Entry::reversed() const
{
    Entry rev = *this;
    rev.forEachView([](DebitCredit& dc) { dc = dc.swapped(); });
    return rev;
}

//-------------------------------------------------------------------------

void Entry::clearPartyReferences() noexcept
{
    partyType.clear();
    party.clear();
    againstVoucherType.clear();
    againstVoucher.clear();
}

//-------------------------------------------------------------------------

void Entry::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        json::setStringMember(json, "name", name);
        json::setDateMember(json, "postingDate", postingDate);
        json::setDateMember(json, "transactionDate", transactionDate);
        json::setDateMember(json, "dueDate", dueDate);
        json::setStringMember(json, "company", company);
        json::setStringMember(json, "fiscalYear", fiscalYear);
        json::setStringMember(json, "voucherType", voucherType);
        json::setStringMember(json, "voucherNo", voucherNo);
        json::setStringMember(json, "voucherSubtype", voucherSubtype);
        json::setStringMember(json, "voucherDetailNo", voucherDetailNo);
        json::setStringMember(json, "account", account);
        json::setStringMember(json, "accountCurrency", accountCurrency);
        json::setStringMember(json, "partyType", partyType);
        json::setStringMember(json, "party", party);
        json::setStringMember(json, "againstVoucherType", againstVoucherType);
        json::setStringMember(json, "againstVoucher", againstVoucher);
        json::setStringMember(json, "costCenter", costCenter);
        json::setStringMember(json, "project", project);
        json::setStringMember(json, "financeBook", financeBook);
        json::setDecimalMember(json, "debit", amounts.debit);
        json::setDecimalMember(json, "credit", amounts.credit);
        json::setDecimalMember(json, "debitInAccountCurrency", accountAmounts.debit);
        json::setDecimalMember(json, "creditInAccountCurrency", accountAmounts.credit);
        json::setDecimalMember(json, "debitInTransactionCurrency", transactionAmounts.debit);
        json::setDecimalMember(json, "creditInTransactionCurrency", transactionAmounts.credit);
        json::setStringMember(json, "transactionCurrency", transactionCurrency);
        json::setDecimalMember(json, "exchangeRate", exchangeRate);
        json::setBoolMember(json, "isOpening", isOpening);
        json::setBoolMember(json, "isAdvance", isAdvance);
        json::setBoolMember(json, "isCancelled", isCancelled);
        json::setStringMember(json, "remarks", remarks);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

Entry Entry::fromJson(const rapidjson::Value& json)
{
    if (!json.IsObject()) {
        throw std::invalid_argument{fmt::format(
            "{}: Entry must be a Json object, was {}",
            std::source_location::current().function_name(),
            json::json2str(json))};
    }
    const auto postingDate = json::getOptionalDateMember(json, "postingDate");
    if (!postingDate) {
        throw std::invalid_argument{fmt::format(
            "{}: Entry '{}' has no 'postingDate'",
            std::source_location::current().function_name(),
            json::getStringMember(json, "name"))};
    }
    return {
        .name = json::getStringMember(json, "name"),
        .postingDate = *postingDate,
        .transactionDate = json::getOptionalDateMember(json, "transactionDate"),
        .dueDate = json::getOptionalDateMember(json, "dueDate"),
        .company = json::getStringMember(json, "company"),
        .fiscalYear = json::getStringMember(json, "fiscalYear"),
        .voucherType = json::getStringMember(json, "voucherType"),
        .voucherNo = json::getStringMember(json, "voucherNo"),
        .voucherSubtype = json::getStringMember(json, "voucherSubtype"),
        .voucherDetailNo = json::getStringMember(json, "voucherDetailNo"),
        .account = json::getStringMember(json, "account"),
        .accountCurrency = json::getStringMember(json, "accountCurrency"),
        .partyType = json::getStringMember(json, "partyType"),
        .party = json::getStringMember(json, "party"),
        .againstVoucherType = json::getStringMember(json, "againstVoucherType"),
        .againstVoucher = json::getStringMember(json, "againstVoucher"),
        .costCenter = json::getStringMember(json, "costCenter"),
        .project = json::getStringMember(json, "project"),
        .financeBook = json::getStringMember(json, "financeBook"),
        .amounts = {
            .debit = json::getDecimalMember(json, "debit"),
            .credit = json::getDecimalMember(json, "credit")
        },
        .accountAmounts = {
            .debit = json::getDecimalMember(json, "debitInAccountCurrency"),
            .credit = json::getDecimalMember(json, "creditInAccountCurrency")
        },
        .transactionAmounts = {
            .debit = json::getDecimalMember(json, "debitInTransactionCurrency"),
            .credit = json::getDecimalMember(json, "creditInTransactionCurrency")
        },
        .transactionCurrency = json::getStringMember(json, "transactionCurrency"),
        .exchangeRate = json::getDecimalMember(json, "exchangeRate", 1_dec),
        .isOpening = json::getBoolMember(json, "isOpening"),
        .isAdvance = json::getBoolMember(json, "isAdvance"),
        .isCancelled = json::getBoolMember(json, "isCancelled"),
        .remarks = json::getStringMember(json, "remarks")
    };
}

//-------------------------------------------------------------------------

}  // namespace glpost::ledger

//-------------------------------------------------------------------------
