/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "glpost/memory/InMemoryPartyLedgerStore.hpp"

//-------------------------------------------------------------------------

namespace glpost::memory
{

//-------------------------------------------------------------------------

ports::PostResult InMemoryPartyLedgerStore::save(const ledger::PartyLedgerEntry& entry)
{
    m_entries.push_back(entry);
    return {};
}

//-------------------------------------------------------------------------

ports::PostResult InMemoryPartyLedgerStore::saveBatch(
    std::span<const ledger::PartyLedgerEntry> entries)
{
    m_entries.insert(m_entries.end(), entries.begin(), entries.end());
    return {};
}

//-------------------------------------------------------------------------

ports::Expected<std::vector<ledger::PartyLedgerEntry>> InMemoryPartyLedgerStore::getByVoucher(
    const ledger::VoucherRef& voucher) const
{
    return m_entries
        | views::filter([&](const ledger::PartyLedgerEntry& e) { return e.voucher() == voucher; })
        | ranges::to<std::vector>();
}

//-------------------------------------------------------------------------

ports::PostResult InMemoryPartyLedgerStore::delink(const ledger::VoucherRef& voucher)
{
    for (auto& entry : m_entries) {
        if (entry.voucher() == voucher || entry.againstVoucher() == voucher) {
            entry.delinked = true;
        }
    }
    return {};
}

//-------------------------------------------------------------------------

decimal_t InMemoryPartyLedgerStore::outstanding(
    const std::string& partyType, const std::string& party, const AccountId& account) const
{
    return ranges::accumulate(
        m_entries
        | views::filter([&](const ledger::PartyLedgerEntry& e) {
            return !e.delinked
                && e.partyType == partyType
                && e.party == party
                && e.account == account;
        })
        | views::transform([](const ledger::PartyLedgerEntry& e) { return e.amount; }),
        0_dec);
}

//-------------------------------------------------------------------------

void InMemoryPartyLedgerStore::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetArray();
        auto& allocator = json.GetAllocator();
        for (const auto& entry : m_entries) {
            rapidjson::Document entryJson{&allocator};
            entry.jsonSerialize(entryJson);
            json.PushBack(entryJson, allocator);
        }
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace glpost::memory

//-------------------------------------------------------------------------
