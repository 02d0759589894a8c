/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "glpost/ports/AccountingPeriodChecker.hpp"

//-------------------------------------------------------------------------

namespace glpost::memory
{

//-------------------------------------------------------------------------

struct AccountingPeriod
{
    std::string name;
    CompanyId company;
    Date start{};
    Date end{};
    std::set<std::string> closedDocuments;

    [[nodiscard]] bool closes(
        const CompanyId& company, const std::string& documentType, Date date) const noexcept;
};

//-------------------------------------------------------------------------

class AccountingPeriodCalendar : public ports::AccountingPeriodChecker
{
public:
    void add(AccountingPeriod period);

    [[nodiscard]] const std::vector<AccountingPeriod>& periods() const noexcept { return m_periods; }

    [[nodiscard]] virtual ports::Expected<bool> isDocumentTypeClosed(
        const CompanyId& company, const std::string& documentType, Date postingDate) const override;
    [[nodiscard]] virtual ports::Expected<std::string> getClosedPeriodName(
        const CompanyId& company, const std::string& documentType, Date postingDate) const override;

    // <AccountingPeriods><Period name="..." company="..." start="..." end="...">
    //   <ClosedDocument type="Sales Invoice"/></Period></AccountingPeriods>
    [[nodiscard]] static std::unique_ptr<AccountingPeriodCalendar> fromXML(pugi::xml_node node);

private:
    [[nodiscard]] const AccountingPeriod* findClosing(
        const CompanyId& company, const std::string& documentType, Date date) const noexcept;

    std::vector<AccountingPeriod> m_periods;
};

//-------------------------------------------------------------------------

}  // namespace glpost::memory

//-------------------------------------------------------------------------
