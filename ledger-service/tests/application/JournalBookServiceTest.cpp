/**
 * @file JournalBookServiceTest.cpp
 * @brief Unit tests for Libro Diario
 */

#include "../mocks/LedgerTestFixture.hpp"

using namespace ledger;
using namespace ledger::tests;

class JournalBookServiceTest : public LedgerTestFixture {
protected:
    void SetUp() override {
        LedgerTestFixture::SetUp();

        postTwoLine(CASH, REVENUE, "30", "2024-01-20");
        postTwoLine(CASH, REVENUE, "10", "2024-01-05");
        postTwoLine(EXPENSES, SUPPLIERS, "20", "2024-01-12");
        entryStore_->createEntry(twoLineRequest(CASH, REVENUE, "99", "2024-01-07"), ACTOR);
    }
};

// ============================================================================
// LISTING
// ============================================================================

TEST_F(JournalBookServiceTest, CommittedEntriesByDate) {
    auto book = journalBook_->getLibroDiario(domain::JournalFilter{});

    EXPECT_EQ(book.totalCount, 3);
    ASSERT_EQ(book.entries.size(), 3u);
    EXPECT_EQ(book.entries[0].entry.date.toString(), "2024-01-05");
    EXPECT_EQ(book.entries[1].entry.date.toString(), "2024-01-12");
    EXPECT_EQ(book.entries[2].entry.date.toString(), "2024-01-20");
}

TEST_F(JournalBookServiceTest, SameDayNumbersOrderNumericallyWithMirrorAfterOriginal) {
    for (const char* number : {"CD-1000000", "CD-999999"}) {
        auto request = twoLineRequest(CASH, REVENUE, "5", "2024-01-25");
        request.entryNumber = std::string(number);
        auto entry = entryStore_->createEntry(request, ACTOR);
        entryStore_->postEntry(entry.id, ACTOR);
    }
    auto first = journalBook_->getLibroDiario(domain::JournalFilter{}).entries[2].entry;
    ASSERT_EQ(first.entryNumber, "CD-000001");
    entryStore_->reverseEntry(first.id, domain::ReverseRequest{}, ACTOR);

    auto book = journalBook_->getLibroDiario(domain::JournalFilter{});

    ASSERT_EQ(book.entries.size(), 6u);
    EXPECT_EQ(book.entries[2].entry.entryNumber, "CD-000001");
    EXPECT_EQ(book.entries[3].entry.entryNumber, "CANC-CD-000001");
    EXPECT_EQ(book.entries[4].entry.entryNumber, "CD-999999");
    EXPECT_EQ(book.entries[5].entry.entryNumber, "CD-1000000");
}

TEST_F(JournalBookServiceTest, DetailsCarryAccountCodeAndName) {
    auto book = journalBook_->getLibroDiario(domain::JournalFilter{});

    ASSERT_FALSE(book.entries.empty());
    const auto& details = book.entries[1].details;
    ASSERT_EQ(details.size(), 2u);
    EXPECT_EQ(details[0].accountCode, "5105");
    EXPECT_EQ(details[0].accountName, "Gastos");
    EXPECT_EQ(details[0].line.debitAmount.toString(), "20.00");
    EXPECT_EQ(details[1].accountCode, "2205");
    EXPECT_EQ(details[1].line.creditAmount.toString(), "20.00");
}

TEST_F(JournalBookServiceTest, PaginationKeepsTotalCount) {
    domain::JournalFilter filter;
    filter.limit = 2;
    filter.offset = 1;

    auto book = journalBook_->getLibroDiario(filter);

    EXPECT_EQ(book.totalCount, 3);
    ASSERT_EQ(book.entries.size(), 2u);
    EXPECT_EQ(book.entries[0].entry.date.toString(), "2024-01-12");

    filter.offset = 10;
    EXPECT_TRUE(journalBook_->getLibroDiario(filter).entries.empty());
}

// ============================================================================
// FILTERS
// ============================================================================

TEST_F(JournalBookServiceTest, DateRangeFilter) {
    domain::JournalFilter filter;
    filter.range = domain::DateRange::between(date("2024-01-06"), date("2024-01-15"));

    auto book = journalBook_->getLibroDiario(filter);

    EXPECT_EQ(book.totalCount, 1);
    ASSERT_EQ(book.entries.size(), 1u);
    EXPECT_EQ(book.entries[0].entry.entryNumber, "CD-000003");
}

TEST_F(JournalBookServiceTest, StatusFilterSeparatesReversedEntries) {
    auto book = journalBook_->getLibroDiario(domain::JournalFilter{});
    entryStore_->reverseEntry(book.entries[0].entry.id, domain::ReverseRequest{}, ACTOR);

    domain::JournalFilter reversed;
    reversed.status = domain::EntryStatus::REVERSED;
    auto onlyReversed = journalBook_->getLibroDiario(reversed);
    ASSERT_EQ(onlyReversed.entries.size(), 1u);
    EXPECT_EQ(onlyReversed.entries[0].entry.entryNumber, "CD-000002");

    domain::JournalFilter posted;
    posted.status = domain::EntryStatus::POSTED;
    EXPECT_EQ(journalBook_->getLibroDiario(posted).totalCount, 3);  // два исходных + зеркальная

    EXPECT_EQ(journalBook_->getLibroDiario(domain::JournalFilter{}).totalCount, 4);
}

TEST_F(JournalBookServiceTest, EntryNumberPrefixFilter) {
    auto book = journalBook_->getLibroDiario(domain::JournalFilter{});
    entryStore_->reverseEntry(book.entries[0].entry.id, domain::ReverseRequest{}, ACTOR);

    domain::JournalFilter filter;
    filter.entryNumberPrefix = "CANC-";
    auto reversals = journalBook_->getLibroDiario(filter);

    ASSERT_EQ(reversals.entries.size(), 1u);
    EXPECT_EQ(reversals.entries[0].entry.entryNumber, "CANC-CD-000002");
}

TEST_F(JournalBookServiceTest, ThirdPartyAndPeriodFilters) {
    auto request = twoLineRequest(CASH, REVENUE, "5", "2024-02-02", FEBRUARY);
    request.thirdPartyId = 555;
    auto entry = entryStore_->createEntry(request, ACTOR);
    entryStore_->postEntry(entry.id, ACTOR);

    domain::JournalFilter byThirdParty;
    byThirdParty.thirdPartyId = 555;
    auto book = journalBook_->getLibroDiario(byThirdParty);
    ASSERT_EQ(book.entries.size(), 1u);
    ASSERT_TRUE(book.entries[0].details[0].line.thirdPartyId.has_value());
    EXPECT_EQ(*book.entries[0].details[0].line.thirdPartyId, 555);

    domain::JournalFilter byPeriod;
    byPeriod.fiscalPeriodId = JANUARY;
    EXPECT_EQ(journalBook_->getLibroDiario(byPeriod).totalCount, 3);
}

// ============================================================================
// ERRORS
// ============================================================================

TEST_F(JournalBookServiceTest, NonCommittedStatusIsValidationError) {
    domain::JournalFilter filter;
    filter.status = domain::EntryStatus::DRAFT;
    EXPECT_THROW(journalBook_->getLibroDiario(filter), domain::ValidationError);

    filter.status = domain::EntryStatus::CANCELLED;
    EXPECT_THROW(journalBook_->getLibroDiario(filter), domain::ValidationError);
}

TEST_F(JournalBookServiceTest, InvertedRangeIsValidationError) {
    domain::JournalFilter filter;
    filter.range = domain::DateRange::between(date("2024-01-31"), date("2024-01-01"));
    EXPECT_THROW(journalBook_->getLibroDiario(filter), domain::ValidationError);
}
