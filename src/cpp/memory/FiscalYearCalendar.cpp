/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "glpost/memory/FiscalYearCalendar.hpp"

//-------------------------------------------------------------------------

namespace glpost::memory
{

//-------------------------------------------------------------------------

void FiscalYearCalendar::add(ports::FiscalYear year, std::set<CompanyId> companies)
{
    if (!year.start.ok() || !year.end.ok() || year.end < year.start) {
        throw std::invalid_argument{fmt::format(
            "{}: Fiscal year '{}' has an invalid date range",
            std::source_location::current().function_name(),
            year.name)};
    }
    m_years.push_back({.year = std::move(year), .companies = std::move(companies)});
}

//-------------------------------------------------------------------------

ports::Expected<ports::FiscalYear> FiscalYearCalendar::getFiscalYear(
    Date date, const CompanyId& company) const
{
    auto it = ranges::find_if(m_years, [&](const Registered& reg) {
        return reg.appliesTo(company) && reg.year.contains(date);
    });
    if (it == m_years.end()) {
        return std::unexpected{ports::PostingError::fiscalYearNotFound(fmt::format(
            "Date {} is not in any active Fiscal Year for company '{}'", date, company))};
    }
    return it->year;
}

//-------------------------------------------------------------------------

ports::Expected<ports::FiscalYear> FiscalYearCalendar::getFiscalYearByName(
    const std::string& name, const CompanyId& company) const
{
    auto it = ranges::find_if(m_years, [&](const Registered& reg) {
        return reg.appliesTo(company) && reg.year.name == name;
    });
    if (it == m_years.end()) {
        return std::unexpected{ports::PostingError::fiscalYearNotFound(fmt::format(
            "Fiscal Year '{}' does not exist for company '{}'", name, company))};
    }
    return it->year;
}

//-------------------------------------------------------------------------

std::unique_ptr<FiscalYearCalendar> FiscalYearCalendar::fromXML(pugi::xml_node node)
{
    auto calendar = std::make_unique<FiscalYearCalendar>();
    for (pugi::xml_node yearNode : node.children("FiscalYear")) {
        std::set<CompanyId> companies;
        for (pugi::xml_node companyNode : yearNode.children("Company")) {
            companies.insert(companyNode.attribute("name").as_string());
        }
        calendar->add(
            ports::FiscalYear{
                .name = yearNode.attribute("name").as_string(),
                .start = util::parseDate(yearNode.attribute("start").as_string()),
                .end = util::parseDate(yearNode.attribute("end").as_string())
            },
            std::move(companies));
    }
    return calendar;
}

//-------------------------------------------------------------------------

}  // namespace glpost::memory

//-------------------------------------------------------------------------
