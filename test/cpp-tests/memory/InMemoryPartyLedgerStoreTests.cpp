/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "glpost/memory/InMemoryPartyLedgerStore.hpp"

#include "builders.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace glpost;
using namespace glpost::literals;

using namespace testing;

//-------------------------------------------------------------------------

class InMemoryPartyLedgerStoreTest : public Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(store.saveBatch(test::makeInvoiceBatch("SINV-0001").partyEntries()).has_value());

        // Payment against the invoice.
        auto payment = test::withParty(
            test::makeEntry("Debtors", 0_dec, 5'000_dec, "Payment Entry", "PAY-0001"),
            "Customer",
            "Globex");
        payment.againstVoucherType = "Sales Invoice";
        payment.againstVoucher = "SINV-0001";
        ASSERT_TRUE(store.save(ledger::PartyLedgerEntry::fromEntry(payment)).has_value());

        ASSERT_TRUE(store.saveBatch(test::makeInvoiceBatch("SINV-0002").partyEntries()).has_value());
    }

    memory::InMemoryPartyLedgerStore store;
};

//-------------------------------------------------------------------------

TEST_F(InMemoryPartyLedgerStoreTest, OutstandingNetsInvoicesAndPayments)
{
    EXPECT_EQ(store.outstanding("Customer", "Globex", "Debtors"), DEC(18600.00));
    EXPECT_EQ(store.outstanding("Customer", "Initech", "Debtors"), 0_dec);
}

TEST_F(InMemoryPartyLedgerStoreTest, GetByVoucher)
{
    const auto entries = store.getByVoucher({"Payment Entry", "PAY-0001"});

    ASSERT_TRUE(entries.has_value());
    ASSERT_THAT(*entries, SizeIs(1));
    EXPECT_EQ(entries->front().amount, DEC(-5000.00));
    EXPECT_EQ(entries->front().againstVoucher(), (ledger::VoucherRef{"Sales Invoice", "SINV-0001"}));
}

TEST_F(InMemoryPartyLedgerStoreTest, DelinkCoversVoucherAndReferences)
{
    ASSERT_TRUE(store.delink({"Sales Invoice", "SINV-0001"}).has_value());

    EXPECT_THAT(
        store.entries() | views::transform(&ledger::PartyLedgerEntry::delinked) | ranges::to<std::vector>(),
        ElementsAre(true, true, false));
    EXPECT_EQ(store.outstanding("Customer", "Globex", "Debtors"), DEC(11800.00));
}

TEST_F(InMemoryPartyLedgerStoreTest, DelinkUnknownVoucherIsNoop)
{
    ASSERT_TRUE(store.delink({"Sales Invoice", "SINV-0404"}).has_value());
    EXPECT_TRUE(ranges::none_of(store.entries(), &ledger::PartyLedgerEntry::delinked));
}

TEST_F(InMemoryPartyLedgerStoreTest, JsonArray)
{
    rapidjson::Document json;
    store.jsonSerialize(json);

    ASSERT_TRUE(json.IsArray());
    EXPECT_EQ(json.Size(), 3u);
    EXPECT_STREQ(json[1]["voucherNo"].GetString(), "PAY-0001");
}

//-------------------------------------------------------------------------
