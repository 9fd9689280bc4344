/**
 * @file LedgerJsonMapperTest.cpp
 * @brief Unit tests for JSON rendering of entries and reports
 */

#include "../mocks/LedgerTestFixture.hpp"
#include "adapters/primary/LedgerJsonMapper.hpp"
#include <nlohmann/json.hpp>

using namespace ledger;
using namespace ledger::tests;
using adapters::primary::LedgerJsonMapper;

class LedgerJsonMapperTest : public LedgerTestFixture {};

// ============================================================================
// REQUEST PARSING
// ============================================================================

TEST(LedgerJsonMapperRequestTest, ParsesEntryRequest) {
    auto request = LedgerJsonMapper::entryRequestFromJson(R"({
        "voucher_type_id": 1,
        "date": "2024-01-15",
        "reference": "INV-9",
        "description": "Sale",
        "fiscal_period_id": 1,
        "third_party_id": 900,
        "exchange_rate": "4012.5",
        "lines": [
            {"account_id": 1, "debit": "100.10", "description": "cash"},
            {"account_id": 2, "credit": 100.1}
        ]
    })");

    EXPECT_FALSE(request.entryNumber.has_value());
    EXPECT_EQ(request.voucherTypeId, 1);
    EXPECT_EQ(request.date.toString(), "2024-01-15");
    EXPECT_EQ(request.reference, "INV-9");
    ASSERT_TRUE(request.thirdPartyId.has_value());
    EXPECT_EQ(*request.thirdPartyId, 900);
    EXPECT_FALSE(request.currencyId.has_value());
    EXPECT_EQ(request.exchangeRate.toString(), "4012.500000");

    ASSERT_EQ(request.lines.size(), 2u);
    EXPECT_EQ(request.lines[0].debitAmount.cents(), 10010);
    EXPECT_TRUE(request.lines[0].creditAmount.isZero());
    EXPECT_EQ(request.lines[0].description, "cash");
    EXPECT_EQ(request.lines[1].creditAmount.cents(), 10010);
}

TEST(LedgerJsonMapperRequestTest, BadInputIsValidationError) {
    EXPECT_THROW(LedgerJsonMapper::entryRequestFromJson("{not json"), domain::ValidationError);
    EXPECT_THROW(LedgerJsonMapper::entryRequestFromJson(R"({"date": "2024-13-01"})"), domain::ValidationError);
    EXPECT_THROW(LedgerJsonMapper::entryRequestFromJson(
                     R"({"date": "2024-01-01", "lines": [{"account_id": 1, "debit": "abc"}]})"),
                 domain::ValidationError);
}

// ============================================================================
// REPORTS
// ============================================================================

TEST_F(LedgerJsonMapperTest, EntryUsesStringAmounts) {
    auto entry = postTwoLine(CASH, REVENUE, "1234.5");

    auto j = LedgerJsonMapper::toJson(entry);

    EXPECT_EQ(j["entry_number"], "CD-000001");
    EXPECT_EQ(j["status"], "posted");
    EXPECT_EQ(j["total_debit"], "1234.50");
    EXPECT_EQ(j["posted_by"], ACTOR);
    EXPECT_TRUE(j["reversal_of_entry_id"].is_null());
    ASSERT_EQ(j["lines"].size(), 2u);
    EXPECT_EQ(j["lines"][0]["debit"], "1234.50");
    EXPECT_EQ(j["lines"][0]["credit"], "0.00");
    EXPECT_EQ(j["lines"][1]["order_number"], 2);
}

TEST_F(LedgerJsonMapperTest, EntryListCarriesLinesAndTotalCount) {
    entryStore_->createEntry(twoLineRequest(CASH, REVENUE, "10"), ACTOR);
    postTwoLine(CASH, REVENUE, "20");

    domain::EntryFilter filter;
    filter.limit = 1;
    auto j = LedgerJsonMapper::toJson(entryStore_->listEntries(filter));

    EXPECT_EQ(j["total_count"], 2);
    ASSERT_EQ(j["entries"].size(), 1u);
    EXPECT_EQ(j["entries"][0]["status"], "draft");
    EXPECT_EQ(j["entries"][0]["lines"].size(), 2u);
}

TEST_F(LedgerJsonMapperTest, LedgerReport) {
    postTwoLine(CASH, REVENUE, "100", "2024-01-05");
    postTwoLine(REVENUE, CASH, "40", "2024-01-10");

    auto j = LedgerJsonMapper::toJson(balanceEngine_->ledgerFor(CASH, domain::DateRange{}, std::nullopt));

    EXPECT_EQ(j["account"]["code"], "1105");
    EXPECT_EQ(j["opening_balance"], "0.00");
    ASSERT_EQ(j["movements"].size(), 2u);
    EXPECT_EQ(j["movements"][1]["running_balance"], "60.00");
    EXPECT_EQ(j["closing_balance"], "60.00");
}

TEST_F(LedgerJsonMapperTest, TrialBalanceReport) {
    postTwoLine(CASH, REVENUE, "100", "2024-01-05");
    postTwoLine(REVENUE, CASH, "40", "2024-01-10");

    auto j = LedgerJsonMapper::toJson(trialBalance_->build(domain::DateRange{}, std::nullopt));

    ASSERT_EQ(j["accounts"].size(), 2u);
    EXPECT_EQ(j["accounts"][1]["creditor_balance"], "60.00");
    EXPECT_EQ(j["totals"]["total_debit"], "140.00");
    EXPECT_EQ(j["balance_check"]["balanced"], true);
}

TEST_F(LedgerJsonMapperTest, JournalBookReport) {
    postTwoLine(EXPENSES, SUPPLIERS, "20");

    auto j = LedgerJsonMapper::toJson(journalBook_->getLibroDiario(domain::JournalFilter{}));

    EXPECT_EQ(j["total_count"], 1);
    ASSERT_EQ(j["entries"].size(), 1u);
    EXPECT_FALSE(j["entries"][0].contains("lines"));
    EXPECT_EQ(j["entries"][0]["details"][0]["account_code"], "5105");
    EXPECT_EQ(j["entries"][0]["details"][1]["account_name"], "Proveedores");
}

// ============================================================================
// ERRORS
// ============================================================================

TEST(LedgerJsonMapperErrorTest, ErrorTypes) {
    EXPECT_EQ(LedgerJsonMapper::errorToJson(domain::ValidationError("x"))["type"], "validation");
    EXPECT_EQ(LedgerJsonMapper::errorToJson(domain::NotFoundError("x"))["type"], "not_found");
    EXPECT_EQ(LedgerJsonMapper::errorToJson(domain::InvalidStateError("x"))["type"], "invalid_state");
    EXPECT_EQ(LedgerJsonMapper::errorToJson(std::runtime_error("boom"))["type"], "internal");

    auto conflict = LedgerJsonMapper::errorToJson(domain::ConflictError("blocked", {3, 5}));
    EXPECT_EQ(conflict["type"], "conflict");
    EXPECT_EQ(conflict["error"], "blocked");
    EXPECT_EQ(conflict["blocking_entry_ids"], nlohmann::json::array({3, 5}));
}
