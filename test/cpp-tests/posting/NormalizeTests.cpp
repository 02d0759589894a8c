/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "glpost/posting/Pipeline.hpp"

#include "builders.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace glpost;
using namespace glpost::literals;

using namespace testing;

//-------------------------------------------------------------------------

struct NormalizeTestParams
{
    ledger::DebitCredit input;
    ledger::DebitCredit refOutput;
};

void PrintTo(const NormalizeTestParams& params, std::ostream* os)
{
    *os << fmt::format(
        "{{.input = Dr {} Cr {}, .refOutput = Dr {} Cr {}}}",
        params.input.debit,
        params.input.credit,
        params.refOutput.debit,
        params.refOutput.credit);
}

struct NormalizeTest : TestWithParam<NormalizeTestParams> {};

TEST_P(NormalizeTest, NoNegativeSideRemains)
{
    const auto [input, refOutput] = GetParam();

    const auto output = posting::normalized(input);

    EXPECT_EQ(output, refOutput);
    EXPECT_GE(output.debit, 0_dec);
    EXPECT_GE(output.credit, 0_dec);
    EXPECT_EQ(output.net(), input.net());
}

INSTANTIATE_TEST_SUITE_P(
    PipelineTest,
    NormalizeTest,
    Values(
        NormalizeTestParams{
            .input = {.debit = -100_dec, .credit = 0_dec},
            .refOutput = {.debit = 0_dec, .credit = 100_dec}
        },
        NormalizeTestParams{
            .input = {.debit = 0_dec, .credit = -100_dec},
            .refOutput = {.debit = 100_dec, .credit = 0_dec}
        },
        NormalizeTestParams{
            .input = {.debit = -50_dec, .credit = 100_dec},
            .refOutput = {.debit = 0_dec, .credit = 150_dec}
        },
        NormalizeTestParams{
            .input = {.debit = 30_dec, .credit = -20_dec},
            .refOutput = {.debit = 50_dec, .credit = 0_dec}
        },
        NormalizeTestParams{
            .input = {.debit = 70_dec, .credit = 20_dec},
            .refOutput = {.debit = 70_dec, .credit = 20_dec}
        }
    ));

//-------------------------------------------------------------------------

TEST(NormalizeAmountsTest, EqualNegativesFlipBoth)
{
    const ledger::DebitCredit amounts{.debit = -25_dec, .credit = -25_dec};

    EXPECT_EQ(posting::normalized(amounts), (ledger::DebitCredit{.debit = 25_dec, .credit = 25_dec}));
}

TEST(NormalizeAmountsTest, AppliesToEveryView)
{
    auto entry = test::makeEntry("Sales", -100_dec, 0_dec);
    entry.accountAmounts = {.debit = -90_dec, .credit = 0_dec};
    entry.transactionAmounts = {.debit = 0_dec, .credit = -110_dec};

    const auto batch = posting::normalizeNegativeAmounts(ledger::Batch{entry});

    EXPECT_EQ(batch[0].amounts, (ledger::DebitCredit{.debit = 0_dec, .credit = 100_dec}));
    EXPECT_EQ(batch[0].accountAmounts, (ledger::DebitCredit{.debit = 0_dec, .credit = 90_dec}));
    EXPECT_EQ(batch[0].transactionAmounts, (ledger::DebitCredit{.debit = 110_dec, .credit = 0_dec}));
    EXPECT_EQ(entry.amounts.debit, -100_dec);
}

//-------------------------------------------------------------------------
