/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "glpost/ports/FiscalYearLookup.hpp"

//-------------------------------------------------------------------------

namespace glpost::memory
{

//-------------------------------------------------------------------------

class FiscalYearCalendar : public ports::FiscalYearLookup
{
public:
    // An empty company list makes the year apply to every company.
    void add(ports::FiscalYear year, std::set<CompanyId> companies = {});

    [[nodiscard]] size_t size() const noexcept { return m_years.size(); }

    [[nodiscard]] virtual ports::Expected<ports::FiscalYear> getFiscalYear(
        Date date, const CompanyId& company) const override;
    [[nodiscard]] virtual ports::Expected<ports::FiscalYear> getFiscalYearByName(
        const std::string& name, const CompanyId& company) const override;

    // <FiscalYears><FiscalYear name="2024" start="2024-01-01" end="2024-12-31">
    //   <Company name="..."/></FiscalYear></FiscalYears>
    [[nodiscard]] static std::unique_ptr<FiscalYearCalendar> fromXML(pugi::xml_node node);

private:
    struct Registered
    {
        ports::FiscalYear year;
        std::set<CompanyId> companies;

        [[nodiscard]] bool appliesTo(const CompanyId& company) const noexcept
        {
            return companies.empty() || companies.contains(company);
        }
    };

    std::vector<Registered> m_years;
};

//-------------------------------------------------------------------------

}  // namespace glpost::memory

//-------------------------------------------------------------------------
