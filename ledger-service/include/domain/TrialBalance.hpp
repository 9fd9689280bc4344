#pragma once

#include "domain/Account.hpp"
#include "domain/Money.hpp"
#include <vector>

namespace ledger::domain {

/**
 * @brief Строка Balance de Comprobación
 */
struct TrialBalanceRow {
    Account account;
    Money totalDebit;
    Money totalCredit;
    Money difference;       ///< totalDebit - totalCredit
    Money debtorBalance;    ///< saldo deudor
    Money creditorBalance;  ///< saldo acreedor
};

struct TrialBalanceTotals {
    Money totalDebit;
    Money totalCredit;
    Money debtorSum;
    Money creditorSum;

    Money debitCreditDifference() const { return totalDebit - totalCredit; }
    Money balanceDifference() const { return debtorSum - creditorSum; }
};

/**
 * @brief Результат проверки: обе разницы должны быть меньше 0.01
 */
struct BalanceCheck {
    bool balanced = false;
    Money debitCreditDifference;
    Money balanceDifference;
};

struct TrialBalance {
    std::vector<TrialBalanceRow> accounts;
    TrialBalanceTotals totals;
    BalanceCheck balanceCheck;
};

} // namespace ledger::domain
