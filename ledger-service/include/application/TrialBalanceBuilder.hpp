#pragma once

#include "ports/input/ITrialBalanceService.hpp"
#include "ports/output/IChartOfAccountsGateway.hpp"
#include "ports/output/ILedgerQueryRepository.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include <algorithm>
#include <iostream>
#include <memory>

namespace ledger::application {

/**
 * @brief Balance de Comprobación по всем активным счетам, принимающим проводки
 *
 * Сальдо каждой строки делится на дебетовое и кредитовое по нормальному
 * сальдо счёта. Результат сбалансирован, только если сходятся и обороты,
 * и сальдо (обе проверки независимы, см. evaluateBalanceCheck).
 */
class TrialBalanceBuilder : public ports::input::ITrialBalanceService {
public:
    TrialBalanceBuilder(
        std::shared_ptr<ports::output::IChartOfAccountsGateway> accounts,
        std::shared_ptr<ports::output::ILedgerQueryRepository> queries
    ) : accounts_(std::move(accounts))
      , queries_(std::move(queries))
    {
        std::cout << "[TrialBalanceBuilder] Created" << std::endl;
    }

    domain::TrialBalance getBalanceComprobacion(
        const domain::DateRange& range,
        std::optional<int64_t> fiscalPeriodId,
        bool includeZeroBalances) override
    {
        return build(range, fiscalPeriodId, includeZeroBalances);
    }

    domain::TrialBalance build(
        const domain::DateRange& range,
        std::optional<int64_t> fiscalPeriodId,
        bool includeZeroBalances = false)
    {
        if (range.isInverted()) {
            throw domain::ValidationError("Date range is inverted: " + range.from->toString() +
                                          " > " + range.to->toString());
        }

        std::vector<domain::Account> postable;
        for (auto& account : accounts_->findAll()) {
            if (account.isPostable()) {
                postable.push_back(std::move(account));
            }
        }
        std::sort(postable.begin(), postable.end(), [](const domain::Account& a, const domain::Account& b) {
            return a.code < b.code;
        });

        auto movements = queries_->aggregateCommittedByAccount(range, fiscalPeriodId);

        domain::TrialBalance result;
        for (const auto& account : postable) {
            domain::AmountTotals amounts;
            auto it = movements.find(account.id);
            if (it != movements.end()) {
                amounts = it->second;
            }

            if (!includeZeroBalances && (amounts.debit + amounts.credit).isZero()) {
                continue;
            }

            auto row = makeRow(account, amounts);
            result.totals.totalDebit += row.totalDebit;
            result.totals.totalCredit += row.totalCredit;
            result.totals.debtorSum += row.debtorBalance;
            result.totals.creditorSum += row.creditorBalance;
            result.accounts.push_back(std::move(row));
        }

        result.balanceCheck = evaluateBalanceCheck(result.totals);

        std::cout << "[TrialBalanceBuilder] " << result.accounts.size() << " accounts, debit "
                  << result.totals.totalDebit.toString() << ", credit "
                  << result.totals.totalCredit.toString()
                  << (result.balanceCheck.balanced ? ", balanced" : ", NOT balanced") << std::endl;
        return result;
    }

    /**
     * @brief Строка баланса для счёта
     *
     * Сальдо считается в сторону нормального сальдо счёта: положительное
     * попадает в свою колонку, отрицательное (по модулю) - в противоположную.
     */
    static domain::TrialBalanceRow makeRow(const domain::Account& account, const domain::AmountTotals& amounts) {
        domain::TrialBalanceRow row;
        row.account = account;
        row.totalDebit = amounts.debit;
        row.totalCredit = amounts.credit;
        row.difference = amounts.debit - amounts.credit;

        domain::Money balance = domain::signedDelta(account.normalBalance, amounts.debit, amounts.credit);
        domain::Money& natural = account.normalBalance == domain::NormalBalance::DEBIT
            ? row.debtorBalance : row.creditorBalance;
        domain::Money& opposite = account.normalBalance == domain::NormalBalance::DEBIT
            ? row.creditorBalance : row.debtorBalance;

        if (balance.isPositive()) {
            natural = balance;
        } else if (balance.isNegative()) {
            opposite = balance.abs();
        }
        return row;
    }

    static domain::BalanceCheck evaluateBalanceCheck(const domain::TrialBalanceTotals& totals) {
        domain::BalanceCheck check;
        check.debitCreditDifference = totals.debitCreditDifference();
        check.balanceDifference = totals.balanceDifference();
        check.balanced =
            domain::Money::nearlyEqual(totals.totalDebit, totals.totalCredit) &&
            domain::Money::nearlyEqual(totals.debtorSum, totals.creditorSum);
        return check;
    }

private:
    std::shared_ptr<ports::output::IChartOfAccountsGateway> accounts_;
    std::shared_ptr<ports::output::ILedgerQueryRepository> queries_;
};

} // namespace ledger::application
