/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "glpost/ledger/PartyLedgerEntry.hpp"

//-------------------------------------------------------------------------

namespace glpost::ledger
{

//-------------------------------------------------------------------------

void PartyLedgerEntry::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        json::setStringMember(json, "name", name);
        json::setDateMember(json, "postingDate", postingDate);
        json::setDateMember(json, "dueDate", dueDate);
        json::setStringMember(json, "company", company);
        json::setStringMember(json, "account", account);
        json::setStringMember(json, "accountCurrency", accountCurrency);
        json::setStringMember(json, "partyType", partyType);
        json::setStringMember(json, "party", party);
        json::setStringMember(json, "voucherType", voucherType);
        json::setStringMember(json, "voucherNo", voucherNo);
        json::setStringMember(json, "voucherDetailNo", voucherDetailNo);
        json::setStringMember(json, "againstVoucherType", againstVoucherType);
        json::setStringMember(json, "againstVoucherNo", againstVoucherNo);
        json::setDecimalMember(json, "amount", amount);
        json::setDecimalMember(json, "amountInAccountCurrency", amountInAccountCurrency);
        json::setStringMember(json, "financeBook", financeBook);
        json::setBoolMember(json, "delinked", delinked);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

PartyLedgerEntry PartyLedgerEntry::fromEntry(const Entry& entry)
{
    if (!entry.hasParty()) {
        throw std::invalid_argument{fmt::format(
            "{}: Entry '{}' on {} carries no party",
            std::source_location::current().function_name(),
            entry.name,
            entry.account)};
    }
    return {
        .name = entry.name,
        .postingDate = entry.postingDate,
        .dueDate = entry.dueDate,
        .company = entry.company,
        .account = entry.account,
        .accountCurrency = entry.accountCurrency,
        .partyType = entry.partyType,
        .party = entry.party,
        .voucherType = entry.voucherType,
        .voucherNo = entry.voucherNo,
        .voucherDetailNo = entry.voucherDetailNo,
        .againstVoucherType = entry.againstVoucherType,
        .againstVoucherNo = entry.againstVoucher,
        .amount = entry.amounts.net(),
        .amountInAccountCurrency = entry.accountAmounts.net(),
        .financeBook = entry.financeBook
    };
}

//-------------------------------------------------------------------------

}  // namespace glpost::ledger

//-------------------------------------------------------------------------
