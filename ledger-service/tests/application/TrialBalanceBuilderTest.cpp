/**
 * @file TrialBalanceBuilderTest.cpp
 * @brief Unit tests for Balance de Comprobación
 */

#include "../mocks/LedgerTestFixture.hpp"
#include "../mocks/MockLedgerQueryRepository.hpp"
#include <gmock/gmock.h>

using namespace ledger;
using namespace ledger::tests;
using ::testing::_;
using ::testing::Return;

class TrialBalanceBuilderTest : public LedgerTestFixture {
protected:
    static domain::DateRange january() {
        return domain::DateRange::between(date("2024-01-01"), date("2024-01-31"));
    }

    void postScenario() {
        postTwoLine(CASH, REVENUE, "100", "2024-01-05");
        postTwoLine(REVENUE, CASH, "40", "2024-01-10");
    }

    static const domain::TrialBalanceRow* rowFor(const domain::TrialBalance& balance, const std::string& code) {
        for (const auto& row : balance.accounts) {
            if (row.account.code == code) {
                return &row;
            }
        }
        return nullptr;
    }
};

// ============================================================================
// BUILD
// ============================================================================

TEST_F(TrialBalanceBuilderTest, TwoEntryScenarioIsBalanced) {
    postScenario();

    auto balance = trialBalance_->build(january(), JANUARY);

    EXPECT_EQ(balance.totals.totalDebit.toString(), "140.00");
    EXPECT_EQ(balance.totals.totalCredit.toString(), "140.00");
    EXPECT_EQ(balance.totals.debtorSum.toString(), "60.00");
    EXPECT_EQ(balance.totals.creditorSum.toString(), "60.00");
    EXPECT_TRUE(balance.balanceCheck.balanced);
    EXPECT_TRUE(balance.balanceCheck.debitCreditDifference.isZero());
    EXPECT_TRUE(balance.balanceCheck.balanceDifference.isZero());
}

TEST_F(TrialBalanceBuilderTest, RowsSplitBalanceByNormalSide) {
    postScenario();

    auto balance = trialBalance_->build(january(), std::nullopt);

    ASSERT_EQ(balance.accounts.size(), 2u);

    auto cash = rowFor(balance, "1105");
    ASSERT_NE(cash, nullptr);
    EXPECT_EQ(cash->totalDebit.toString(), "100.00");
    EXPECT_EQ(cash->totalCredit.toString(), "40.00");
    EXPECT_EQ(cash->difference.toString(), "60.00");
    EXPECT_EQ(cash->debtorBalance.toString(), "60.00");
    EXPECT_TRUE(cash->creditorBalance.isZero());

    auto revenue = rowFor(balance, "4135");
    ASSERT_NE(revenue, nullptr);
    EXPECT_EQ(revenue->difference.toString(), "-60.00");
    EXPECT_TRUE(revenue->debtorBalance.isZero());
    EXPECT_EQ(revenue->creditorBalance.toString(), "60.00");
}

TEST_F(TrialBalanceBuilderTest, RowsOrderedByAccountCode) {
    postTwoLine(EXPENSES, SUPPLIERS, "10");
    postTwoLine(CASH, REVENUE, "10");

    auto balance = trialBalance_->build(january(), std::nullopt);

    ASSERT_EQ(balance.accounts.size(), 4u);
    EXPECT_EQ(balance.accounts[0].account.code, "1105");
    EXPECT_EQ(balance.accounts[1].account.code, "2205");
    EXPECT_EQ(balance.accounts[2].account.code, "4135");
    EXPECT_EQ(balance.accounts[3].account.code, "5105");
}

TEST_F(TrialBalanceBuilderTest, ZeroRowsOnlyOnRequest) {
    postScenario();

    auto withZero = trialBalance_->getBalanceComprobacion(january(), std::nullopt, true);

    // Все активные листовые счета; группа и неактивный не попадают
    ASSERT_EQ(withZero.accounts.size(), 4u);
    EXPECT_EQ(rowFor(withZero, "11"), nullptr);
    EXPECT_EQ(rowFor(withZero, "1110"), nullptr);
    ASSERT_NE(rowFor(withZero, "5105"), nullptr);
    EXPECT_TRUE(rowFor(withZero, "5105")->totalDebit.isZero());
    EXPECT_TRUE(withZero.balanceCheck.balanced);
}

TEST_F(TrialBalanceBuilderTest, DraftsAndOtherPeriodsExcluded) {
    postScenario();
    entryStore_->createEntry(twoLineRequest(EXPENSES, CASH, "500"), ACTOR);
    postTwoLine(EXPENSES, CASH, "70", "2024-02-05", FEBRUARY);

    auto balance = trialBalance_->build(domain::DateRange{}, JANUARY);

    EXPECT_EQ(balance.totals.totalDebit.toString(), "140.00");
    EXPECT_EQ(rowFor(balance, "5105"), nullptr);
}

TEST_F(TrialBalanceBuilderTest, ReversedPairStaysInBalance) {
    auto posted = postTwoLine(CASH, REVENUE, "100");
    entryStore_->reverseEntry(posted.id, domain::ReverseRequest{}, ACTOR);

    auto balance = trialBalance_->build(january(), std::nullopt);

    EXPECT_EQ(balance.totals.totalDebit.toString(), "200.00");
    EXPECT_EQ(balance.totals.totalCredit.toString(), "200.00");
    EXPECT_TRUE(balance.totals.debtorSum.isZero());
    EXPECT_TRUE(balance.totals.creditorSum.isZero());
    EXPECT_TRUE(balance.balanceCheck.balanced);
}

TEST_F(TrialBalanceBuilderTest, RepeatedCallsAreIdentical) {
    postScenario();
    postTwoLine(EXPENSES, SUPPLIERS, "12.34");

    auto first = trialBalance_->build(january(), JANUARY, true);
    auto second = trialBalance_->build(january(), JANUARY, true);

    ASSERT_EQ(first.accounts.size(), second.accounts.size());
    for (size_t i = 0; i < first.accounts.size(); ++i) {
        EXPECT_EQ(first.accounts[i].account.id, second.accounts[i].account.id);
        EXPECT_EQ(first.accounts[i].totalDebit, second.accounts[i].totalDebit);
        EXPECT_EQ(first.accounts[i].totalCredit, second.accounts[i].totalCredit);
        EXPECT_EQ(first.accounts[i].debtorBalance, second.accounts[i].debtorBalance);
        EXPECT_EQ(first.accounts[i].creditorBalance, second.accounts[i].creditorBalance);
    }
    EXPECT_EQ(first.totals.totalDebit, second.totals.totalDebit);
    EXPECT_EQ(first.balanceCheck.balanced, second.balanceCheck.balanced);
}

TEST_F(TrialBalanceBuilderTest, InvertedRangeIsValidationError) {
    auto inverted = domain::DateRange::between(date("2024-02-01"), date("2024-01-01"));
    EXPECT_THROW(trialBalance_->build(inverted, std::nullopt), domain::ValidationError);
}

// ============================================================================
// ROW SPLIT & CHECK
// ============================================================================

TEST_F(TrialBalanceBuilderTest, MakeRow_NegativeBalanceGoesToOppositeColumn) {
    auto cash = *accounts_->findById(CASH);
    auto row = application::TrialBalanceBuilder::makeRow(cash, domain::AmountTotals{money("10"), money("30")});

    EXPECT_TRUE(row.debtorBalance.isZero());
    EXPECT_EQ(row.creditorBalance.toString(), "20.00");

    auto suppliers = *accounts_->findById(SUPPLIERS);
    row = application::TrialBalanceBuilder::makeRow(suppliers, domain::AmountTotals{money("50"), money("20")});

    EXPECT_EQ(row.debtorBalance.toString(), "30.00");
    EXPECT_TRUE(row.creditorBalance.isZero());
}

TEST(BalanceCheckTest, BothDifferencesMustVanish) {
    domain::TrialBalanceTotals totals;
    totals.totalDebit = domain::Money::fromString("100");
    totals.totalCredit = domain::Money::fromString("100");
    totals.debtorSum = domain::Money::fromString("60");
    totals.creditorSum = domain::Money::fromString("55");

    auto check = application::TrialBalanceBuilder::evaluateBalanceCheck(totals);
    EXPECT_FALSE(check.balanced);
    EXPECT_TRUE(check.debitCreditDifference.isZero());
    EXPECT_EQ(check.balanceDifference.toString(), "5.00");

    totals.creditorSum = domain::Money::fromString("60");
    totals.totalCredit = domain::Money::fromString("99.99");
    check = application::TrialBalanceBuilder::evaluateBalanceCheck(totals);
    EXPECT_FALSE(check.balanced);
    EXPECT_EQ(check.debitCreditDifference.toString(), "0.01");

    totals.totalCredit = domain::Money::fromString("100");
    EXPECT_TRUE(application::TrialBalanceBuilder::evaluateBalanceCheck(totals).balanced);
}

TEST_F(TrialBalanceBuilderTest, CorruptedMovementsReportNotBalanced) {
    auto queries = std::make_shared<MockLedgerQueryRepository>();
    application::TrialBalanceBuilder builder(accounts_, queries);

    std::map<int64_t, domain::AmountTotals> movements;
    movements[CASH] = domain::AmountTotals{money("100"), money("0")};
    movements[REVENUE] = domain::AmountTotals{money("0"), money("90")};
    EXPECT_CALL(*queries, aggregateCommittedByAccount(_, _))
        .WillOnce(Return(movements));

    auto balance = builder.build(january(), std::nullopt);

    EXPECT_FALSE(balance.balanceCheck.balanced);
    EXPECT_EQ(balance.balanceCheck.debitCreditDifference.toString(), "10.00");
    EXPECT_EQ(balance.balanceCheck.balanceDifference.toString(), "10.00");
}

TEST_F(TrialBalanceBuilderTest, PassesFiltersToQueries) {
    auto queries = std::make_shared<MockLedgerQueryRepository>();
    application::TrialBalanceBuilder builder(accounts_, queries);

    EXPECT_CALL(*queries, aggregateCommittedByAccount(_, std::optional<int64_t>(FEBRUARY)))
        .WillOnce(Return(std::map<int64_t, domain::AmountTotals>{}));

    auto balance = builder.getBalanceComprobacion(domain::DateRange{}, FEBRUARY, false);

    EXPECT_TRUE(balance.accounts.empty());
    EXPECT_TRUE(balance.balanceCheck.balanced);
}
