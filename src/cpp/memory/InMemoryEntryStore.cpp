/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "glpost/memory/InMemoryEntryStore.hpp"

//-------------------------------------------------------------------------

namespace glpost::memory
{

//-------------------------------------------------------------------------

ports::PostResult InMemoryEntryStore::save(const ledger::Entry& entry)
{
    m_entries.push_back(named(entry));
    return {};
}

//-------------------------------------------------------------------------

ports::PostResult InMemoryEntryStore::saveBatch(const ledger::Batch& batch)
{
    m_entries.reserve(m_entries.size() + batch.size());
    for (const auto& entry : batch) {
        m_entries.push_back(named(entry));
    }
    return {};
}

//-------------------------------------------------------------------------

ports::Expected<ledger::Batch> InMemoryEntryStore::getByVoucher(
    const ledger::VoucherRef& voucher) const
{
    return ledger::Batch{
        m_entries
        | views::filter([&](const ledger::Entry& e) { return e.voucher() == voucher; })
        | ranges::to<std::vector>()};
}

//-------------------------------------------------------------------------

ports::PostResult InMemoryEntryStore::markCancelled(const ledger::VoucherRef& voucher)
{
    if (!holds(voucher)) {
        return std::unexpected{ports::PostingError::voucherNotFound(voucher)};
    }
    for (auto& entry : m_entries) {
        if (entry.voucher() == voucher) {
            entry.isCancelled = true;
        }
    }
    return {};
}

//-------------------------------------------------------------------------

ports::PostResult InMemoryEntryStore::cancelAndSave(
    const ledger::VoucherRef& voucher, const ledger::Batch& reversal)
{
    if (auto marked = markCancelled(voucher); !marked) {
        return marked;
    }
    return saveBatch(reversal);
}

//-------------------------------------------------------------------------

void InMemoryEntryStore::clear() noexcept
{
    m_entries.clear();
    m_nameCounter = 0;
}

//-------------------------------------------------------------------------

void InMemoryEntryStore::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    ledger::Batch{m_entries}.jsonSerialize(json, key);
}

//-------------------------------------------------------------------------

std::unique_ptr<InMemoryEntryStore> InMemoryEntryStore::fromJson(const rapidjson::Value& json)
{
    auto store = std::make_unique<InMemoryEntryStore>();
    store->m_entries = ledger::Batch::fromJson(json).entries();
    store->m_nameCounter = store->m_entries.size();
    return store;
}

//-------------------------------------------------------------------------

ledger::Entry InMemoryEntryStore::named(ledger::Entry entry)
{
    ++m_nameCounter;
    if (entry.name.empty()) {
        entry.name = fmt::format("GLE-{:05}", m_nameCounter);
    }
    return entry;
}

//-------------------------------------------------------------------------

bool InMemoryEntryStore::holds(const ledger::VoucherRef& voucher) const noexcept
{
    return ranges::any_of(
        m_entries, [&](const ledger::Entry& e) { return e.voucher() == voucher; });
}

//-------------------------------------------------------------------------

}  // namespace glpost::memory

//-------------------------------------------------------------------------
