/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "glpost/ledger/Entry.hpp"
#include "glpost/ledger/PartyLedgerEntry.hpp"

//-------------------------------------------------------------------------

namespace glpost::ledger
{

//-------------------------------------------------------------------------

// Ordered entries of one transaction. Transforms produce a new Batch and
// never touch the entries a caller still holds.
class Batch
{
public:
    using ContainerType = std::vector<Entry>;
    using value_type = ContainerType::value_type;
    using size_type = ContainerType::size_type;

    Batch() noexcept = default;
    explicit Batch(ContainerType entries) noexcept;
    Batch(std::initializer_list<Entry> entries);

    [[nodiscard]] decltype(auto) begin(this auto&& self) { return self.m_entries.begin(); }
    [[nodiscard]] decltype(auto) end(this auto&& self) { return self.m_entries.end(); }
    [[nodiscard]] decltype(auto) operator[](this auto&& self, size_t idx) { return self.m_entries[idx]; }

    [[nodiscard]] size_t size() const noexcept { return m_entries.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_entries.empty(); }
    [[nodiscard]] const ContainerType& entries() const noexcept { return m_entries; }

    // Transaction-level attributes, taken from the first entry.
    [[nodiscard]] const Entry& front() const;
    [[nodiscard]] VoucherRef voucher() const;
    [[nodiscard]] const std::string& company() const;
    [[nodiscard]] Date postingDate() const;

    [[nodiscard]] decimal_t totalDebit() const;
    [[nodiscard]] decimal_t totalCredit() const;

    // Sum of per-entry rounded debit minus rounded credit, rounded.
    [[nodiscard]] decimal_t difference(uint32_t decimalPlaces = util::kDefaultDecimalPlaces) const;
    // Rounds the batch totals, not the lines, so it can disagree with difference().
    [[nodiscard]] bool isBalanced(uint32_t decimalPlaces = util::kDefaultDecimalPlaces) const;

    [[nodiscard]] Batch withAppended(std::span<const Entry> entries) const;
    [[nodiscard]] std::vector<PartyLedgerEntry> partyEntries() const;

    void append(Entry entry);

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;

    [[nodiscard]] static Batch fromJson(const rapidjson::Value& json);

    bool operator==(const Batch&) const = default;

private:
    ContainerType m_entries;
};

//-------------------------------------------------------------------------

}  // namespace glpost::ledger

//-------------------------------------------------------------------------
