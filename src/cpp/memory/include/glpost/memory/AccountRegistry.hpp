/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "glpost/ports/AccountLookup.hpp"

//-------------------------------------------------------------------------

namespace glpost::memory
{

//-------------------------------------------------------------------------

class AccountRegistry : public ports::AccountLookup
{
public:
    using ContainerType = std::map<AccountId, ports::Account>;

    AccountRegistry() noexcept = default;
    explicit AccountRegistry(std::vector<ports::Account> accounts);

    [[nodiscard]] decltype(auto) begin(this auto&& self) { return self.m_underlying.begin(); }
    [[nodiscard]] decltype(auto) end(this auto&& self) { return self.m_underlying.end(); }

    // Replaces any account registered under the same name.
    void add(ports::Account account);
    [[nodiscard]] bool contains(const AccountId& account) const noexcept;
    [[nodiscard]] const ContainerType& accounts() const noexcept { return m_underlying; }

    [[nodiscard]] virtual ports::Expected<ports::Account> getAccount(
        const AccountId& account) const override;

    // <Accounts><Account name="..." company="..." currency="..." rootType="Asset"
    //   balanceMustBe="Debit" isGroup="false" disabled="false" frozen="false"/></Accounts>
    [[nodiscard]] static std::unique_ptr<AccountRegistry> fromXML(pugi::xml_node node);

private:
    ContainerType m_underlying;
};

//-------------------------------------------------------------------------

}  // namespace glpost::memory

//-------------------------------------------------------------------------
