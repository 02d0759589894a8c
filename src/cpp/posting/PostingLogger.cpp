/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "glpost/posting/PostingLogger.hpp"

#include <spdlog/sinks/basic_file_sink.h>

//-------------------------------------------------------------------------

namespace glpost::posting
{

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] std::string csvField(std::string_view field)
{
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string{field};
    }
    std::string quoted{"\""};
    for (char c : field) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

}  // namespace

//-------------------------------------------------------------------------

PostingLogger::PostingLogger(
    const fs::path& filepath, PostingSignals& signals, uint32_t decimalPlaces)
    : m_filepath{filepath}, m_decimalPlaces{decimalPlaces}
{
    m_logger = std::make_unique<spdlog::logger>(
        "PostingLogger",
        std::make_unique<spdlog::sinks::basic_file_sink_st>(m_filepath.string(), true));
    m_logger->set_level(spdlog::level::trace);
    m_logger->set_pattern("%v");

    m_postedFeed = signals.posted.connect(
        [this](const ledger::Batch& batch) { logPosted(batch); });
    m_cancelledFeed = signals.cancelled.connect(
        [this](const ledger::VoucherRef& voucher, const ledger::Batch& reversal) {
            logCancelled(voucher, reversal);
        });
    m_rejectedFeed = signals.rejected.connect(
        [this](const ledger::VoucherRef& voucher, const ports::PostingError& error) {
            logRejected(voucher, error);
        });

    m_logger->trace(kHeader);
    m_logger->flush();
}

//-------------------------------------------------------------------------

void PostingLogger::logPosted(const ledger::Batch& batch) const
{
    logEntries("posted", batch);
}

//-------------------------------------------------------------------------

void PostingLogger::logCancelled(
    [[maybe_unused]] const ledger::VoucherRef& voucher, const ledger::Batch& reversal) const
{
    logEntries("cancelled", reversal);
}

//-------------------------------------------------------------------------

void PostingLogger::logRejected(
    const ledger::VoucherRef& voucher, const ports::PostingError& error) const
{
    m_logger->trace(
        "rejected,{},{},,,,,,,{}",
        csvField(voucher.voucherType),
        csvField(voucher.voucherNo),
        csvField(error.message()));
    m_logger->flush();
}

//-------------------------------------------------------------------------

void PostingLogger::logEntries(std::string_view event, const ledger::Batch& batch) const
{
    for (const auto& entry : batch) {
        m_logger->trace(
            "{},{},{},{},{},{},{},{},{},{}",
            event,
            csvField(entry.voucherType),
            csvField(entry.voucherNo),
            entry.postingDate,
            csvField(entry.account),
            csvField(entry.costCenter),
            csvField(entry.party),
            util::formatAmount(entry.amounts.debit, m_decimalPlaces),
            util::formatAmount(entry.amounts.credit, m_decimalPlaces),
            csvField(entry.remarks));
    }
    m_logger->flush();
}

//-------------------------------------------------------------------------

}  // namespace glpost::posting

//-------------------------------------------------------------------------
