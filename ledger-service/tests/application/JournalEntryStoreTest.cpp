/**
 * @file JournalEntryStoreTest.cpp
 * @brief Unit tests for JournalEntryStore: balance invariant, state machine, reversal
 */

#include "../mocks/LedgerTestFixture.hpp"

using namespace ledger;
using namespace ledger::tests;

class JournalEntryStoreTest : public LedgerTestFixture {};

// ============================================================================
// CREATE
// ============================================================================

TEST_F(JournalEntryStoreTest, Create_StoresBalancedDraft) {
    auto entry = entryStore_->createEntry(twoLineRequest(CASH, REVENUE, "100"), ACTOR);

    EXPECT_GT(entry.id, 0);
    EXPECT_EQ(entry.status, domain::EntryStatus::DRAFT);
    EXPECT_EQ(entry.entryNumber, "CD-000001");
    EXPECT_EQ(entry.totalDebit().toString(), "100.00");
    EXPECT_EQ(entry.totalCredit().toString(), "100.00");
    EXPECT_EQ(entry.createdBy, ACTOR);

    ASSERT_EQ(entry.lines().size(), 2u);
    EXPECT_EQ(entry.lines()[0].entryId, entry.id);
    EXPECT_GT(entry.lines()[0].id, 0);
    EXPECT_NE(entry.lines()[0].id, entry.lines()[1].id);

    auto stored = entryStore_->getEntry(entry.id);
    EXPECT_EQ(stored.entryNumber, entry.entryNumber);
}

TEST_F(JournalEntryStoreTest, Create_UnbalancedIsValidationError) {
    auto request = twoLineRequest(CASH, REVENUE, "50");
    request.lines[1] = domain::JournalLine::credit(REVENUE, money("40"));

    try {
        entryStore_->createEntry(request, ACTOR);
        FAIL() << "Expected ValidationError";
    } catch (const domain::ValidationError& e) {
        EXPECT_NE(std::string(e.what()).find("difference 10.00"), std::string::npos) << e.what();
    }
    EXPECT_EQ(store_->entryCount(), 0u);
}

TEST_F(JournalEntryStoreTest, Create_OneCentOffIsRejected) {
    auto request = twoLineRequest(CASH, REVENUE, "100");
    request.lines[1] = domain::JournalLine::credit(REVENUE, money("99.99"));

    EXPECT_THROW(entryStore_->createEntry(request, ACTOR), domain::ValidationError);
}

TEST_F(JournalEntryStoreTest, Create_EmptyLinesIsValidationError) {
    auto request = twoLineRequest(CASH, REVENUE, "10");
    request.lines.clear();

    EXPECT_THROW(entryStore_->createEntry(request, ACTOR), domain::ValidationError);
}

TEST_F(JournalEntryStoreTest, Create_LineWithBothSidesIsValidationError) {
    auto request = twoLineRequest(CASH, REVENUE, "10");
    request.lines[0].creditAmount = money("10");
    request.lines[1].debitAmount = money("10");

    EXPECT_THROW(entryStore_->createEntry(request, ACTOR), domain::ValidationError);
}

TEST_F(JournalEntryStoreTest, Create_AccountRules) {
    EXPECT_THROW(entryStore_->createEntry(twoLineRequest(GROUP_ACCOUNT, REVENUE, "10"), ACTOR),
                 domain::ValidationError);
    EXPECT_THROW(entryStore_->createEntry(twoLineRequest(INACTIVE_ACCOUNT, REVENUE, "10"), ACTOR),
                 domain::ValidationError);
    EXPECT_THROW(entryStore_->createEntry(twoLineRequest(999, REVENUE, "10"), ACTOR),
                 domain::NotFoundError);
}

TEST_F(JournalEntryStoreTest, Create_PeriodRules) {
    EXPECT_THROW(entryStore_->createEntry(twoLineRequest(CASH, REVENUE, "10", "2023-12-15", CLOSED_DECEMBER), ACTOR),
                 domain::ValidationError);
    EXPECT_THROW(entryStore_->createEntry(twoLineRequest(CASH, REVENUE, "10", "2024-02-01", JANUARY), ACTOR),
                 domain::ValidationError);
    EXPECT_THROW(entryStore_->createEntry(twoLineRequest(CASH, REVENUE, "10", "2024-01-15", 999), ACTOR),
                 domain::NotFoundError);
    EXPECT_EQ(store_->entryCount(), 0u);
}

TEST_F(JournalEntryStoreTest, Create_NonPositiveExchangeRateIsValidationError) {
    auto request = twoLineRequest(CASH, REVENUE, "10");
    request.exchangeRate = domain::ExchangeRate::fromString("0");

    EXPECT_THROW(entryStore_->createEntry(request, ACTOR), domain::ValidationError);
}

TEST_F(JournalEntryStoreTest, Create_ManualNumberMustBeUniquePerType) {
    auto request = twoLineRequest(CASH, REVENUE, "10");
    request.entryNumber = "MANUAL-1";
    auto first = entryStore_->createEntry(request, ACTOR);
    EXPECT_EQ(first.entryNumber, "MANUAL-1");

    EXPECT_THROW(entryStore_->createEntry(request, ACTOR), domain::ConflictError);

    // Другой тип - другое пространство номеров
    request.voucherTypeId = CE;
    EXPECT_NO_THROW(entryStore_->createEntry(request, ACTOR));

    // Ручной номер не расходует счётчик
    EXPECT_EQ(store_->findVoucherType(CD)->lastNumber, 0);
}

TEST_F(JournalEntryStoreTest, Create_AutoNumberSkipsManuallyTakenCounter) {
    auto request = twoLineRequest(CASH, REVENUE, "10");
    request.entryNumber = "CD-000001";
    entryStore_->createEntry(request, ACTOR);

    auto second = entryStore_->createEntry(twoLineRequest(CASH, REVENUE, "20"), ACTOR);
    auto third = entryStore_->createEntry(twoLineRequest(CASH, REVENUE, "30"), ACTOR);

    EXPECT_EQ(second.entryNumber, "CD-000002");
    EXPECT_EQ(third.entryNumber, "CD-000003");
    EXPECT_EQ(store_->findVoucherType(CD)->lastNumber, 3);
    EXPECT_EQ(store_->entryCount(), 3u);
}

TEST_F(JournalEntryStoreTest, Create_UnknownVoucherTypeIsNotFound) {
    auto request = twoLineRequest(CASH, REVENUE, "10");
    request.voucherTypeId = 999;

    EXPECT_THROW(entryStore_->createEntry(request, ACTOR), domain::NotFoundError);
}

// ============================================================================
// UPDATE / DELETE
// ============================================================================

TEST_F(JournalEntryStoreTest, Update_ReplacesLinesAndRecomputesTotals) {
    auto entry = entryStore_->createEntry(twoLineRequest(CASH, REVENUE, "100"), ACTOR);

    auto request = twoLineRequest(EXPENSES, SUPPLIERS, "250", "2024-01-20");
    request.description = "Edited";
    auto updated = entryStore_->updateEntry(entry.id, request, ACTOR);

    EXPECT_EQ(updated.id, entry.id);
    EXPECT_EQ(updated.entryNumber, entry.entryNumber);
    EXPECT_EQ(updated.description, "Edited");
    EXPECT_EQ(updated.date.toString(), "2024-01-20");
    EXPECT_EQ(updated.totalDebit().toString(), "250.00");
    ASSERT_EQ(updated.lines().size(), 2u);
    EXPECT_EQ(updated.lines()[0].accountId, EXPENSES);
}

TEST_F(JournalEntryStoreTest, Update_UnbalancedLeavesEntryUntouched) {
    auto entry = entryStore_->createEntry(twoLineRequest(CASH, REVENUE, "100"), ACTOR);

    auto request = twoLineRequest(CASH, REVENUE, "100");
    request.lines[1] = domain::JournalLine::credit(REVENUE, money("90"));
    EXPECT_THROW(entryStore_->updateEntry(entry.id, request, ACTOR), domain::ValidationError);

    auto stored = entryStore_->getEntry(entry.id);
    EXPECT_EQ(stored.totalCredit().toString(), "100.00");
}

TEST_F(JournalEntryStoreTest, Update_CannotChangeVoucherType) {
    auto entry = entryStore_->createEntry(twoLineRequest(CASH, REVENUE, "100"), ACTOR);

    auto request = twoLineRequest(CASH, REVENUE, "100");
    request.voucherTypeId = CE;
    EXPECT_THROW(entryStore_->updateEntry(entry.id, request, ACTOR), domain::ValidationError);
}

TEST_F(JournalEntryStoreTest, Update_RenumberToTakenNumberIsConflict) {
    auto first = entryStore_->createEntry(twoLineRequest(CASH, REVENUE, "10"), ACTOR);
    auto second = entryStore_->createEntry(twoLineRequest(CASH, REVENUE, "20"), ACTOR);

    auto request = twoLineRequest(CASH, REVENUE, "20");
    request.entryNumber = first.entryNumber;
    EXPECT_THROW(entryStore_->updateEntry(second.id, request, ACTOR), domain::ConflictError);
}

TEST_F(JournalEntryStoreTest, Update_EmptyNumberKeepsCurrentNumber) {
    auto entry = entryStore_->createEntry(twoLineRequest(CASH, REVENUE, "10"), ACTOR);

    auto request = twoLineRequest(CASH, REVENUE, "15");
    request.entryNumber = std::string();
    auto updated = entryStore_->updateEntry(entry.id, request, ACTOR);

    EXPECT_EQ(updated.entryNumber, "CD-000001");
    EXPECT_EQ(entryStore_->getEntry(entry.id).entryNumber, "CD-000001");
    EXPECT_EQ(updated.totalDebit().toString(), "15.00");
}

TEST_F(JournalEntryStoreTest, PostedEntryIsImmutable) {
    auto posted = postTwoLine(CASH, REVENUE, "100");

    EXPECT_THROW(entryStore_->updateEntry(posted.id, twoLineRequest(CASH, REVENUE, "5"), ACTOR),
                 domain::InvalidStateError);
    EXPECT_THROW(entryStore_->deleteEntry(posted.id, ACTOR), domain::InvalidStateError);
    EXPECT_EQ(entryStore_->getEntry(posted.id).totalDebit().toString(), "100.00");
}

TEST_F(JournalEntryStoreTest, Delete_RemovesDraft) {
    auto entry = entryStore_->createEntry(twoLineRequest(CASH, REVENUE, "10"), ACTOR);

    entryStore_->deleteEntry(entry.id, ACTOR);

    EXPECT_THROW(entryStore_->getEntry(entry.id), domain::NotFoundError);
    EXPECT_EQ(store_->entryCount(), 0u);
}

TEST_F(JournalEntryStoreTest, MissingEntryIsNotFound) {
    EXPECT_THROW(entryStore_->getEntry(404), domain::NotFoundError);
    EXPECT_THROW(entryStore_->postEntry(404, ACTOR), domain::NotFoundError);
    EXPECT_THROW(entryStore_->deleteEntry(404, ACTOR), domain::NotFoundError);
    EXPECT_THROW(entryStore_->reverseEntry(404, domain::ReverseRequest{}, ACTOR), domain::NotFoundError);
}

// ============================================================================
// POST
// ============================================================================

TEST_F(JournalEntryStoreTest, Post_StampsActorAndTime) {
    auto entry = entryStore_->createEntry(twoLineRequest(CASH, REVENUE, "100"), ACTOR);

    auto posted = entryStore_->postEntry(entry.id, 7);

    EXPECT_EQ(posted.status, domain::EntryStatus::POSTED);
    ASSERT_TRUE(posted.postedBy.has_value());
    EXPECT_EQ(*posted.postedBy, 7);
    EXPECT_TRUE(posted.postedAt.has_value());
    EXPECT_EQ(entryStore_->getEntry(entry.id).status, domain::EntryStatus::POSTED);
}

TEST_F(JournalEntryStoreTest, Post_TwiceIsInvalidState) {
    auto posted = postTwoLine(CASH, REVENUE, "100");

    EXPECT_THROW(entryStore_->postEntry(posted.id, ACTOR), domain::InvalidStateError);
}

TEST_F(JournalEntryStoreTest, Post_RevalidatesPeriod) {
    auto entry = entryStore_->createEntry(twoLineRequest(CASH, REVENUE, "100"), ACTOR);

    // Период закрыли между созданием и проведением
    addPeriod(JANUARY, "2024-01", date("2024-01-01"), date("2024-01-31"), true);

    EXPECT_THROW(entryStore_->postEntry(entry.id, ACTOR), domain::ValidationError);
    EXPECT_EQ(entryStore_->getEntry(entry.id).status, domain::EntryStatus::DRAFT);
}

TEST_F(JournalEntryStoreTest, Post_RevalidatesAccounts) {
    auto entry = entryStore_->createEntry(twoLineRequest(CASH, REVENUE, "100"), ACTOR);

    addAccount(CASH, "1105", "Caja", domain::NormalBalance::DEBIT, true, false);

    EXPECT_THROW(entryStore_->postEntry(entry.id, ACTOR), domain::ValidationError);
}

// ============================================================================
// REVERSE
// ============================================================================

TEST_F(JournalEntryStoreTest, Reverse_CreatesPostedMirrorAndLinksBoth) {
    auto posted = postTwoLine(CASH, REVENUE, "100");

    domain::ReverseRequest request;
    request.reason = "Wrong customer";
    auto original = entryStore_->reverseEntry(posted.id, request, ACTOR);

    EXPECT_EQ(original.status, domain::EntryStatus::REVERSED);
    ASSERT_TRUE(original.reversedByEntryId.has_value());

    auto mirror = entryStore_->getEntry(*original.reversedByEntryId);
    EXPECT_EQ(mirror.entryNumber, "CANC-CD-000001");
    EXPECT_EQ(mirror.status, domain::EntryStatus::POSTED);
    ASSERT_TRUE(mirror.reversalOfEntryId.has_value());
    EXPECT_EQ(*mirror.reversalOfEntryId, posted.id);
    EXPECT_EQ(mirror.description, "Wrong customer");
    EXPECT_TRUE(mirror.isAdjustment);
    EXPECT_EQ(mirror.date, posted.date);

    ASSERT_EQ(mirror.lines().size(), 2u);
    EXPECT_EQ(mirror.lines()[0].accountId, CASH);
    EXPECT_EQ(mirror.lines()[0].creditAmount.toString(), "100.00");
    EXPECT_TRUE(mirror.lines()[0].debitAmount.isZero());
    EXPECT_EQ(mirror.lines()[1].accountId, REVENUE);
    EXPECT_EQ(mirror.lines()[1].debitAmount.toString(), "100.00");

    // Нумерация типа не тронута
    EXPECT_EQ(store_->findVoucherType(CD)->lastNumber, 1);
}

TEST_F(JournalEntryStoreTest, Reverse_NetsAccountToZero) {
    auto posted = postTwoLine(CASH, REVENUE, "100");
    entryStore_->reverseEntry(posted.id, domain::ReverseRequest{}, ACTOR);

    auto ledger = balanceEngine_->ledgerFor(CASH, domain::DateRange{}, std::nullopt);

    EXPECT_EQ(ledger.movements.size(), 2u);
    EXPECT_TRUE(ledger.closingBalance.isZero());
}

TEST_F(JournalEntryStoreTest, Reverse_OnlyPostedEntries) {
    auto draft = entryStore_->createEntry(twoLineRequest(CASH, REVENUE, "10"), ACTOR);
    EXPECT_THROW(entryStore_->reverseEntry(draft.id, domain::ReverseRequest{}, ACTOR), domain::InvalidStateError);

    auto posted = postTwoLine(CASH, REVENUE, "10");
    entryStore_->reverseEntry(posted.id, domain::ReverseRequest{}, ACTOR);
    EXPECT_THROW(entryStore_->reverseEntry(posted.id, domain::ReverseRequest{}, ACTOR), domain::InvalidStateError);
}

TEST_F(JournalEntryStoreTest, Reverse_IntoClosedPeriodLeavesOriginalPosted) {
    auto posted = postTwoLine(CASH, REVENUE, "100");

    domain::ReverseRequest request;
    request.date = date("2023-12-31");
    request.fiscalPeriodId = CLOSED_DECEMBER;
    EXPECT_THROW(entryStore_->reverseEntry(posted.id, request, ACTOR), domain::ValidationError);

    EXPECT_EQ(entryStore_->getEntry(posted.id).status, domain::EntryStatus::POSTED);
    EXPECT_EQ(store_->entryCount(), 1u);
}

TEST_F(JournalEntryStoreTest, Reverse_InAnotherPeriod) {
    auto posted = postTwoLine(CASH, REVENUE, "100");

    domain::ReverseRequest request;
    request.date = date("2024-02-10");
    request.fiscalPeriodId = FEBRUARY;
    auto original = entryStore_->reverseEntry(posted.id, request, ACTOR);

    auto mirror = entryStore_->getEntry(*original.reversedByEntryId);
    EXPECT_EQ(mirror.fiscalPeriodId, FEBRUARY);
    EXPECT_EQ(mirror.date.toString(), "2024-02-10");
    EXPECT_EQ(mirror.description, "Reversal of entry CD-000001");
}

// ============================================================================
// LIST
// ============================================================================

TEST_F(JournalEntryStoreTest, List_IncludesDraftsInEveryStatus) {
    auto draft = entryStore_->createEntry(twoLineRequest(CASH, REVENUE, "10", "2024-01-20"), ACTOR);
    auto posted = postTwoLine(CASH, REVENUE, "20", "2024-01-05");

    auto page = entryStore_->listEntries(domain::EntryFilter{});

    EXPECT_EQ(page.totalCount, 2);
    ASSERT_EQ(page.entries.size(), 2u);
    EXPECT_EQ(page.entries[0].id, posted.id);
    EXPECT_EQ(page.entries[1].id, draft.id);
    EXPECT_EQ(page.entries[1].status, domain::EntryStatus::DRAFT);
    EXPECT_EQ(page.entries[1].lines().size(), 2u);
}

TEST_F(JournalEntryStoreTest, List_FiltersByStatusTypeAndPrefix) {
    entryStore_->createEntry(twoLineRequest(CASH, REVENUE, "10"), ACTOR);
    auto posted = postTwoLine(CASH, REVENUE, "20");
    auto request = twoLineRequest(CASH, REVENUE, "30");
    request.voucherTypeId = CE;
    auto egreso = entryStore_->createEntry(request, ACTOR);

    domain::EntryFilter drafts;
    drafts.status = domain::EntryStatus::DRAFT;
    EXPECT_EQ(entryStore_->listEntries(drafts).totalCount, 2);

    domain::EntryFilter byType;
    byType.voucherTypeId = CE;
    auto page = entryStore_->listEntries(byType);
    ASSERT_EQ(page.entries.size(), 1u);
    EXPECT_EQ(page.entries[0].id, egreso.id);

    domain::EntryFilter byPrefix;
    byPrefix.entryNumberPrefix = "CD-";
    byPrefix.status = domain::EntryStatus::POSTED;
    page = entryStore_->listEntries(byPrefix);
    ASSERT_EQ(page.entries.size(), 1u);
    EXPECT_EQ(page.entries[0].id, posted.id);
}

TEST_F(JournalEntryStoreTest, List_PaginationKeepsTotalCount) {
    for (const char* day : {"2024-01-03", "2024-01-01", "2024-01-02"}) {
        entryStore_->createEntry(twoLineRequest(CASH, REVENUE, "10", day), ACTOR);
    }

    domain::EntryFilter filter;
    filter.limit = 1;
    filter.offset = 1;
    auto page = entryStore_->listEntries(filter);

    EXPECT_EQ(page.totalCount, 3);
    ASSERT_EQ(page.entries.size(), 1u);
    EXPECT_EQ(page.entries[0].date.toString(), "2024-01-02");
}

TEST_F(JournalEntryStoreTest, List_InvertedRangeIsValidationError) {
    domain::EntryFilter filter;
    filter.range = domain::DateRange::between(date("2024-01-31"), date("2024-01-01"));

    EXPECT_THROW(entryStore_->listEntries(filter), domain::ValidationError);
}
