/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "glpost/ledger/Batch.hpp"

//-------------------------------------------------------------------------

namespace glpost::ledger
{

//-------------------------------------------------------------------------

Batch::Batch(ContainerType entries) noexcept
    : m_entries{std::move(entries)}
{}

//-------------------------------------------------------------------------

Batch::Batch(std::initializer_list<Entry> entries)
    : m_entries{entries}
{}

//-------------------------------------------------------------------------

const Entry& Batch::front() const
{
    if (m_entries.empty()) {
        throw std::logic_error{fmt::format(
            "{}: Empty batch has no transaction attributes",
            std::source_location::current().function_name())};
    }
    return m_entries.front();
}

//-------------------------------------------------------------------------

VoucherRef Batch::voucher() const
{
    return front().voucher();
}

//-------------------------------------------------------------------------

const std::string& Batch::company() const
{
    return front().company;
}

//-------------------------------------------------------------------------

Date Batch::postingDate() const
{
    return front().postingDate;
}

//-------------------------------------------------------------------------

decimal_t Batch::totalDebit() const
{
    return ranges::accumulate(
        m_entries | views::transform([](const Entry& e) { return e.amounts.debit; }), 0_dec);
}

//-------------------------------------------------------------------------

decimal_t Batch::totalCredit() const
{
    return ranges::accumulate(
        m_entries | views::transform([](const Entry& e) { return e.amounts.credit; }), 0_dec);
}

//-------------------------------------------------------------------------

decimal_t Batch::difference(uint32_t decimalPlaces) const
{
    const auto diff = ranges::accumulate(
        m_entries | views::transform([decimalPlaces](const Entry& e) {
            return util::round(e.amounts.debit, decimalPlaces)
                - util::round(e.amounts.credit, decimalPlaces);
        }),
        0_dec);
    return util::round(diff, decimalPlaces);
}

//-------------------------------------------------------------------------

bool Batch::isBalanced(uint32_t decimalPlaces) const
{
    return util::isZero(totalDebit() - totalCredit(), decimalPlaces);
}

//-------------------------------------------------------------------------

Batch Batch::withAppended(std::span<const Entry> entries) const
{
    ContainerType combined;
    combined.reserve(m_entries.size() + entries.size());
    combined.insert(combined.end(), m_entries.begin(), m_entries.end());
    combined.insert(combined.end(), entries.begin(), entries.end());
    return Batch{std::move(combined)};
}

//-------------------------------------------------------------------------

std::vector<PartyLedgerEntry> Batch::partyEntries() const
{
    return m_entries
        | views::filter([](const Entry& e) { return e.hasParty(); })
        | views::transform(&PartyLedgerEntry::fromEntry)
        | ranges::to<std::vector>();
}

//-------------------------------------------------------------------------

void Batch::append(Entry entry)
{
    m_entries.push_back(std::move(entry));
}

//-------------------------------------------------------------------------

void Batch::jsonSerialize(rapidjson::Document& json, const std::string& key) const
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

Batch Batch::fromJson(const rapidjson::Value& json)
{
    if (!json.IsArray()) {
        throw std::invalid_argument{fmt::format(
            "{}: Batch must be a Json array of entries, was {}",
            std::source_location::current().function_name(),
            json::json2str(json))};
    }
    ContainerType entries;
    entries.reserve(json.Size());
    for (const auto& entryJson : json.GetArray()) {
        entries.push_back(Entry::fromJson(entryJson));
    }
    return Batch{std::move(entries)};
}

//-------------------------------------------------------------------------

}  // namespace glpost::ledger

//-------------------------------------------------------------------------
