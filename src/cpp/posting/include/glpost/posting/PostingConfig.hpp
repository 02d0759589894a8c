/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "glpost/ledger/Entry.hpp"

//-------------------------------------------------------------------------

namespace glpost::posting
{

//-------------------------------------------------------------------------

inline const std::string kPeriodClosingVoucher = "Period Closing Voucher";
inline const std::string kJournalEntry = "Journal Entry";
inline const std::string kPaymentEntry = "Payment Entry";

//-------------------------------------------------------------------------

struct PostingConfig
{
    uint32_t precision{util::kDefaultDecimalPlaces};
    decimal_t defaultAllowance{DEC(0.5)};
    // Overrides per voucher type. Journal and payment entries otherwise get
    // five units of the last decimal place.
    std::map<std::string, decimal_t> allowances;
    std::set<std::string> closingVoucherTypes{kPeriodClosingVoucher};
    std::set<AccountId> exchangeGainLossAccounts;
    std::string exchangeGainLossSubtype{"Exchange Gain Or Loss"};
    std::string reversalRemarkPrefix{"Cancelled: "};
    std::string roundOffRemark{"Round Off"};
    std::string offsettingRemarkPrefix{"Offsetting for Accounting Dimension - "};

    [[nodiscard]] decimal_t allowanceFor(const std::string& voucherType) const;
    [[nodiscard]] bool isClosingVoucher(const std::string& voucherType) const noexcept;
    // Whether a merged entry that rounds to zero is still posted.
    [[nodiscard]] bool keepsZeroEntry(const ledger::Entry& entry) const noexcept;

    void validate() const;
};

//-------------------------------------------------------------------------

[[nodiscard]] PostingConfig makePostingConfig(pugi::xml_node node);

//-------------------------------------------------------------------------

}  // namespace glpost::posting

//-------------------------------------------------------------------------
