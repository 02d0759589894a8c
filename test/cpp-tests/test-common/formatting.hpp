/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "glpost/decimal/decimal.hpp"
#include "glpost/ledger/Entry.hpp"
#include "glpost/ports/PostingError.hpp"

#include <ostream>

//-------------------------------------------------------------------------

namespace BloombergLP::bdldfp
{

inline void PrintTo(const Decimal64& val, std::ostream* os)
{
    *os << fmt::format("{}", val);
}

}  // namespace BloombergLP::bdldfp

//-------------------------------------------------------------------------

namespace glpost::ledger
{

inline void PrintTo(const DebitCredit& amounts, std::ostream* os)
{
    *os << fmt::format("{{.debit = {}, .credit = {}}}", amounts.debit, amounts.credit);
}

inline void PrintTo(const Entry& entry, std::ostream* os)
{
    *os << fmt::format("{}", entry);
}

}  // namespace glpost::ledger

//-------------------------------------------------------------------------

namespace glpost::ports
{

inline void PrintTo(const PostingError& error, std::ostream* os)
{
    *os << error.message();
}

}  // namespace glpost::ports

//-------------------------------------------------------------------------
