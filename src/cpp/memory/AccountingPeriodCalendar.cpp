/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "glpost/memory/AccountingPeriodCalendar.hpp"

//-------------------------------------------------------------------------

namespace glpost::memory
{

//-------------------------------------------------------------------------

bool AccountingPeriod::closes(
    const CompanyId& company, const std::string& documentType, Date date) const noexcept
{
    return this->company == company
        && start <= date && date <= end
        && closedDocuments.contains(documentType);
}

//-------------------------------------------------------------------------

void AccountingPeriodCalendar::add(AccountingPeriod period)
{
    if (period.end < period.start) {
        throw std::invalid_argument{fmt::format(
            "{}: Accounting period '{}' ends before it starts",
            std::source_location::current().function_name(),
            period.name)};
    }
    m_periods.push_back(std::move(period));
}

//-------------------------------------------------------------------------

ports::Expected<bool> AccountingPeriodCalendar::isDocumentTypeClosed(
    const CompanyId& company, const std::string& documentType, Date postingDate) const
{
    return findClosing(company, documentType, postingDate) != nullptr;
}

//-------------------------------------------------------------------------

ports::Expected<std::string> AccountingPeriodCalendar::getClosedPeriodName(
    const CompanyId& company, const std::string& documentType, Date postingDate) const
{
    const auto period = findClosing(company, documentType, postingDate);
    return period != nullptr ? period->name : std::string{};
}

//-------------------------------------------------------------------------

std::unique_ptr<AccountingPeriodCalendar> AccountingPeriodCalendar::fromXML(pugi::xml_node node)
{
    auto calendar = std::make_unique<AccountingPeriodCalendar>();
    for (pugi::xml_node periodNode : node.children("Period")) {
        AccountingPeriod period{
            .name = periodNode.attribute("name").as_string(),
            .company = periodNode.attribute("company").as_string(),
            .start = util::parseDate(periodNode.attribute("start").as_string()),
            .end = util::parseDate(periodNode.attribute("end").as_string())
        };
        for (pugi::xml_node docNode : periodNode.children("ClosedDocument")) {
            period.closedDocuments.insert(docNode.attribute("type").as_string());
        }
        calendar->add(std::move(period));
    }
    return calendar;
}

//-------------------------------------------------------------------------

const AccountingPeriod* AccountingPeriodCalendar::findClosing(
    const CompanyId& company, const std::string& documentType, Date date) const noexcept
{
    auto it = ranges::find_if(m_periods, [&](const AccountingPeriod& period) {
        return period.closes(company, documentType, date);
    });
    return it != m_periods.end() ? &*it : nullptr;
}

//-------------------------------------------------------------------------

}  // namespace glpost::memory

//-------------------------------------------------------------------------
