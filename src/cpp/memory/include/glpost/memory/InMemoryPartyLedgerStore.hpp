/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "glpost/ports/PartyLedgerStore.hpp"

//-------------------------------------------------------------------------

namespace glpost::memory
{

//-------------------------------------------------------------------------

class InMemoryPartyLedgerStore : public ports::PartyLedgerStore
{
public:
    [[nodiscard]] virtual ports::PostResult save(const ledger::PartyLedgerEntry& entry) override;
    [[nodiscard]] virtual ports::PostResult saveBatch(
        std::span<const ledger::PartyLedgerEntry> entries) override;
    [[nodiscard]] virtual ports::Expected<std::vector<ledger::PartyLedgerEntry>> getByVoucher(
        const ledger::VoucherRef& voucher) const override;
    [[nodiscard]] virtual ports::PostResult delink(const ledger::VoucherRef& voucher) override;

    [[nodiscard]] const std::vector<ledger::PartyLedgerEntry>& entries() const noexcept
    {
        return m_entries;
    }
    // Net amount the party owes on the account, delinked entries excluded.
    [[nodiscard]] decimal_t outstanding(
        const std::string& partyType, const std::string& party, const AccountId& account) const;
    void clear() noexcept { m_entries.clear(); }

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;

private:
    std::vector<ledger::PartyLedgerEntry> m_entries;
};

//-------------------------------------------------------------------------

}  // namespace glpost::memory

//-------------------------------------------------------------------------
