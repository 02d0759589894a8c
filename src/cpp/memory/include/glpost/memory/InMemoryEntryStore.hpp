/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "glpost/ports/EntryStore.hpp"

//-------------------------------------------------------------------------

namespace glpost::memory
{

//-------------------------------------------------------------------------

class InMemoryEntryStore : public ports::EntryStore
{
public:
    [[nodiscard]] virtual ports::PostResult save(const ledger::Entry& entry) override;
    [[nodiscard]] virtual ports::PostResult saveBatch(const ledger::Batch& batch) override;
    [[nodiscard]] virtual ports::Expected<ledger::Batch> getByVoucher(
        const ledger::VoucherRef& voucher) const override;
    [[nodiscard]] virtual ports::PostResult markCancelled(const ledger::VoucherRef& voucher) override;
    [[nodiscard]] virtual ports::PostResult cancelAndSave(
        const ledger::VoucherRef& voucher, const ledger::Batch& reversal) override;

    [[nodiscard]] const std::vector<ledger::Entry>& entries() const noexcept { return m_entries; }
    [[nodiscard]] size_t size() const noexcept { return m_entries.size(); }
    void clear() noexcept;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
    // Entries keep their names; the naming counter resumes past the loaded count.
    [[nodiscard]] static std::unique_ptr<InMemoryEntryStore> fromJson(const rapidjson::Value& json);

private:
    [[nodiscard]] ledger::Entry named(ledger::Entry entry);
    [[nodiscard]] bool holds(const ledger::VoucherRef& voucher) const noexcept;

    std::vector<ledger::Entry> m_entries;
    uint64_t m_nameCounter{};
};

//-------------------------------------------------------------------------

}  // namespace glpost::memory

//-------------------------------------------------------------------------
