/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "glpost/memory/CompanyRegistry.hpp"

//-------------------------------------------------------------------------

namespace glpost::memory
{

//-------------------------------------------------------------------------

CompanyRegistry::CompanyRegistry(std::vector<Company> companies)
{
    for (auto& company : companies) {
        add(std::move(company));
    }
}

//-------------------------------------------------------------------------

void CompanyRegistry::add(Company company)
{
    if (company.name.empty()) {
        throw std::invalid_argument{fmt::format(
            "{}: Company name cannot be empty", std::source_location::current().function_name())};
    }
    auto name = company.name;
    m_companies.insert_or_assign(std::move(name), std::move(company));
}

//-------------------------------------------------------------------------

bool CompanyRegistry::contains(const CompanyId& company) const noexcept
{
    return m_companies.contains(company);
}

//-------------------------------------------------------------------------

ports::Expected<Company> CompanyRegistry::get(const CompanyId& company) const
{
    auto it = m_companies.find(company);
    if (it == m_companies.end()) {
        return std::unexpected{ports::PostingError::collaboratorFailure(
            "CompanySettings", fmt::format("Company '{}' does not exist", company))};
    }
    return it->second;
}

//-------------------------------------------------------------------------

ports::Expected<std::string> CompanyRegistry::getDefaultCurrency(const CompanyId& company) const
{
    return get(company).transform([](const Company& c) { return c.defaultCurrency; });
}

//-------------------------------------------------------------------------

ports::Expected<AccountId> CompanyRegistry::getRoundOffAccount(const CompanyId& company) const
{
    return get(company).transform([](const Company& c) { return c.roundOffAccount; });
}

//-------------------------------------------------------------------------

ports::Expected<std::string> CompanyRegistry::getRoundOffCostCenter(const CompanyId& company) const
{
    return get(company).transform([](const Company& c) { return c.roundOffCostCenter; });
}

//-------------------------------------------------------------------------

ports::Expected<std::optional<Date>> CompanyRegistry::getAccountsFrozenTillDate(
    const CompanyId& company) const
{
    return get(company).transform([](const Company& c) { return c.accountsFrozenTill; });
}

//-------------------------------------------------------------------------

ports::Expected<std::optional<Date>> CompanyRegistry::getBooksClosedTillDate(
    const CompanyId& company) const
{
    return get(company).transform([](const Company& c) { return c.booksClosedTill; });
}

//-------------------------------------------------------------------------

std::unique_ptr<CompanyRegistry> CompanyRegistry::fromXML(pugi::xml_node node)
{
    auto registry = std::make_unique<CompanyRegistry>();
    for (pugi::xml_node companyNode : node.children("Company")) {
        Company company{
            .name = companyNode.attribute("name").as_string(),
            .defaultCurrency = companyNode.attribute("defaultCurrency").as_string(),
            .roundOffAccount = companyNode.attribute("roundOffAccount").as_string(),
            .roundOffCostCenter = companyNode.attribute("roundOffCostCenter").as_string(),
            .accountsFrozenTill =
                util::parseOptionalDate(companyNode.attribute("accountsFrozenTill").as_string()),
            .booksClosedTill =
                util::parseOptionalDate(companyNode.attribute("booksClosedTill").as_string())
        };
        if (company.defaultCurrency.empty()) {
            throw std::invalid_argument{fmt::format(
                "{}: Company '{}' must declare a defaultCurrency",
                std::source_location::current().function_name(),
                company.name)};
        }
        registry->add(std::move(company));
    }
    return registry;
}

//-------------------------------------------------------------------------

}  // namespace glpost::memory

//-------------------------------------------------------------------------
