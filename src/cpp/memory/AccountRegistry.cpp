/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "glpost/memory/AccountRegistry.hpp"

//-------------------------------------------------------------------------

namespace glpost::memory
{

//-------------------------------------------------------------------------

namespace
{

template<typename E>
[[nodiscard]] E enumAttribute(pugi::xml_node node, const char* name, E fallback)
{
    const std::string_view str = node.attribute(name).as_string();
    if (str.empty()) return fallback;
    const auto parsed = magic_enum::enum_cast<E>(str, magic_enum::case_insensitive);
    if (!parsed) {
        throw std::invalid_argument{fmt::format(
            "{}: Unknown value '{}' for attribute '{}' of account '{}'",
            std::source_location::current().function_name(),
            str,
            name,
            node.attribute("name").as_string())};
    }
    return *parsed;
}

}  // namespace

//-------------------------------------------------------------------------

AccountRegistry::AccountRegistry(std::vector<ports::Account> accounts)
{
    for (auto& account : accounts) {
        add(std::move(account));
    }
}

//-------------------------------------------------------------------------

void AccountRegistry::add(ports::Account account)
{
    if (account.name.empty()) {
        throw std::invalid_argument{fmt::format(
            "{}: Account name cannot be empty", std::source_location::current().function_name())};
    }
    auto name = account.name;
    m_underlying.insert_or_assign(std::move(name), std::move(account));
}

//-------------------------------------------------------------------------

bool AccountRegistry::contains(const AccountId& account) const noexcept
{
    return m_underlying.contains(account);
}

//-------------------------------------------------------------------------

ports::Expected<ports::Account> AccountRegistry::getAccount(const AccountId& account) const
{
    auto it = m_underlying.find(account);
    if (it == m_underlying.end()) {
        return std::unexpected{ports::PostingError::accountNotFound(account)};
    }
    return it->second;
}

//-------------------------------------------------------------------------

std::unique_ptr<AccountRegistry> AccountRegistry::fromXML(pugi::xml_node node)
{
    auto registry = std::make_unique<AccountRegistry>();
    for (pugi::xml_node accountNode : node.children("Account")) {
        registry->add(ports::Account{
            .name = accountNode.attribute("name").as_string(),
            .company = accountNode.attribute("company").as_string(),
            .accountCurrency = accountNode.attribute("currency").as_string(),
            .rootType = enumAttribute(accountNode, "rootType", ports::RootType::ASSET),
            .balanceMustBe = enumAttribute(accountNode, "balanceMustBe", ports::BalanceMustBe::ANY),
            .isGroup = accountNode.attribute("isGroup").as_bool(),
            .disabled = accountNode.attribute("disabled").as_bool(),
            .frozen = accountNode.attribute("frozen").as_bool()
        });
    }
    return registry;
}

//-------------------------------------------------------------------------

}  // namespace glpost::memory

//-------------------------------------------------------------------------
