/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "glpost/posting/PostingConfig.hpp"

//-------------------------------------------------------------------------

namespace glpost::posting
{

//-------------------------------------------------------------------------

namespace
{

inline constexpr uint32_t kMaxPrecision = 9;

[[nodiscard]] decimal_t parseAmountAttribute(
    pugi::xml_attribute attr, decimal_t fallback, std::source_location sl)
{
    if (attr.empty()) return fallback;
    const auto parsed = util::parseDecimal(attr.as_string());
    if (!parsed) {
        throw std::invalid_argument{fmt::format(
            "{}: Attribute '{}' must be a decimal number, was '{}'",
            sl.function_name(),
            attr.name(),
            attr.as_string())};
    }
    return *parsed;
}

}  // namespace

//-------------------------------------------------------------------------

decimal_t PostingConfig::allowanceFor(const std::string& voucherType) const
{
    if (auto it = allowances.find(voucherType); it != allowances.end()) {
        return it->second;
    }
    if (voucherType == kJournalEntry || voucherType == kPaymentEntry) {
        return 5_dec * util::minUnit(precision);
    }
    return defaultAllowance;
}

//-------------------------------------------------------------------------

bool PostingConfig::isClosingVoucher(const std::string& voucherType) const noexcept
{
    return closingVoucherTypes.contains(voucherType);
}

//-------------------------------------------------------------------------

bool PostingConfig::keepsZeroEntry(const ledger::Entry& entry) const noexcept
{
    return exchangeGainLossAccounts.contains(entry.account)
        || (!exchangeGainLossSubtype.empty() && entry.voucherSubtype == exchangeGainLossSubtype);
}

//-------------------------------------------------------------------------

void PostingConfig::validate() const
{
    static constexpr auto sl = std::source_location::current();

    if (precision == 0 || precision > kMaxPrecision) {
        throw std::invalid_argument{fmt::format(
            "{}: 'precision' should be in [1, {}], was {}", sl.function_name(), kMaxPrecision, precision)};
    }
    if (defaultAllowance < 0_dec) {
        throw std::invalid_argument{fmt::format(
            "{}: 'defaultAllowance' cannot be negative, was {}", sl.function_name(), defaultAllowance)};
    }
    for (const auto& [voucherType, allowance] : allowances) {
        if (allowance < 0_dec) {
            throw std::invalid_argument{fmt::format(
                "{}: Allowance for '{}' cannot be negative, was {}",
                sl.function_name(),
                voucherType,
                allowance)};
        }
    }
}

//-------------------------------------------------------------------------

PostingConfig makePostingConfig(pugi::xml_node node)
{
    static constexpr auto sl = std::source_location::current();

    PostingConfig config;
    if (pugi::xml_attribute attr = node.attribute("precision")) {
        config.precision = attr.as_uint();
    }
    config.defaultAllowance =
        parseAmountAttribute(node.attribute("defaultAllowance"), config.defaultAllowance, sl);

    for (pugi::xml_node allowanceNode : node.children("Allowance")) {
        const std::string voucherType = allowanceNode.attribute("voucherType").as_string();
        if (voucherType.empty()) {
            throw std::invalid_argument{fmt::format(
                "{}: Allowance requires a 'voucherType' attribute", sl.function_name())};
        }
        config.allowances[voucherType] =
            parseAmountAttribute(allowanceNode.attribute("value"), config.defaultAllowance, sl);
    }

    if (node.child("ClosingVoucher")) {
        config.closingVoucherTypes.clear();
        for (pugi::xml_node closingNode : node.children("ClosingVoucher")) {
            config.closingVoucherTypes.insert(closingNode.attribute("type").as_string());
        }
    }

    for (pugi::xml_node fxNode : node.children("ExchangeGainLoss")) {
        config.exchangeGainLossAccounts.insert(fxNode.attribute("account").as_string());
    }
    if (pugi::xml_attribute attr = node.attribute("exchangeGainLossSubtype")) {
        config.exchangeGainLossSubtype = attr.as_string();
    }

    if (pugi::xml_attribute attr = node.attribute("reversalRemarkPrefix")) {
        config.reversalRemarkPrefix = attr.as_string();
    }
    if (pugi::xml_attribute attr = node.attribute("roundOffRemark")) {
        config.roundOffRemark = attr.as_string();
    }
    if (pugi::xml_attribute attr = node.attribute("offsettingRemarkPrefix")) {
        config.offsettingRemarkPrefix = attr.as_string();
    }

    config.validate();
    return config;
}

//-------------------------------------------------------------------------

}  // namespace glpost::posting

//-------------------------------------------------------------------------
