/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "glpost/ports/CompanySettings.hpp"

//-------------------------------------------------------------------------

namespace glpost::memory
{

//-------------------------------------------------------------------------

struct Company
{
    CompanyId name;
    std::string defaultCurrency;
    AccountId roundOffAccount;
    std::string roundOffCostCenter;
    std::optional<Date> accountsFrozenTill;
    std::optional<Date> booksClosedTill;

    bool operator==(const Company&) const = default;
};

//-------------------------------------------------------------------------

class CompanyRegistry : public ports::CompanySettings
{
public:
    CompanyRegistry() noexcept = default;
    explicit CompanyRegistry(std::vector<Company> companies);

    void add(Company company);
    [[nodiscard]] bool contains(const CompanyId& company) const noexcept;
    [[nodiscard]] ports::Expected<Company> get(const CompanyId& company) const;

    [[nodiscard]] virtual ports::Expected<std::string> getDefaultCurrency(
        const CompanyId& company) const override;
    [[nodiscard]] virtual ports::Expected<AccountId> getRoundOffAccount(
        const CompanyId& company) const override;
    [[nodiscard]] virtual ports::Expected<std::string> getRoundOffCostCenter(
        const CompanyId& company) const override;
    [[nodiscard]] virtual ports::Expected<std::optional<Date>> getAccountsFrozenTillDate(
        const CompanyId& company) const override;
    [[nodiscard]] virtual ports::Expected<std::optional<Date>> getBooksClosedTillDate(
        const CompanyId& company) const override;

    // <Companies><Company name="..." defaultCurrency="USD" roundOffAccount="..."
    //   roundOffCostCenter="..." accountsFrozenTill="2024-01-31"
    //   booksClosedTill="2023-12-31"/></Companies>
    [[nodiscard]] static std::unique_ptr<CompanyRegistry> fromXML(pugi::xml_node node);

private:
    std::map<CompanyId, Company> m_companies;
};

//-------------------------------------------------------------------------

}  // namespace glpost::memory

//-------------------------------------------------------------------------
