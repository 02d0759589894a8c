/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "glpost/posting/PostingSignals.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace glpost::posting
{

//-------------------------------------------------------------------------

// CSV journal of every persisted entry and every rejected voucher.
class PostingLogger
{
public:
    static constexpr std::string_view kHeader =
        "event,voucherType,voucherNo,postingDate,account,costCenter,party,debit,credit,detail";

    PostingLogger(
        const fs::path& filepath,
        PostingSignals& signals,
        uint32_t decimalPlaces = util::kDefaultDecimalPlaces);

    [[nodiscard]] const fs::path& filepath() const noexcept { return m_filepath; }

    void logPosted(const ledger::Batch& batch) const;
    void logCancelled(const ledger::VoucherRef& voucher, const ledger::Batch& reversal) const;
    void logRejected(const ledger::VoucherRef& voucher, const ports::PostingError& error) const;

private:
    void logEntries(std::string_view event, const ledger::Batch& batch) const;

    std::unique_ptr<spdlog::logger> m_logger;
    fs::path m_filepath;
    uint32_t m_decimalPlaces;
    bs2::scoped_connection m_postedFeed;
    bs2::scoped_connection m_cancelledFeed;
    bs2::scoped_connection m_rejectedFeed;
};

//-------------------------------------------------------------------------

}  // namespace glpost::posting

//-------------------------------------------------------------------------
