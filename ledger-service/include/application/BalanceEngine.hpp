#pragma once

#include "ports/input/IBalanceService.hpp"
#include "ports/output/IChartOfAccountsGateway.hpp"
#include "ports/output/ILedgerQueryRepository.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include "domain/EntryNumberOrder.hpp"
#include <algorithm>
#include <iostream>
#include <memory>

namespace ledger::application {

/**
 * @brief Libro Mayor: начальное сальдо, движения с накопленным сальдо, конечное сальдо
 *
 * Читает только проведённые проводки (posted, reversed).
 */
class BalanceEngine : public ports::input::IBalanceService {
public:
    BalanceEngine(
        std::shared_ptr<ports::output::IChartOfAccountsGateway> accounts,
        std::shared_ptr<ports::output::ILedgerQueryRepository> queries
    ) : accounts_(std::move(accounts))
      , queries_(std::move(queries))
    {
        std::cout << "[BalanceEngine] Created" << std::endl;
    }

    domain::AccountLedger getLibroMayor(
        int64_t accountId,
        const domain::DateRange& range,
        std::optional<int64_t> fiscalPeriodId) override
    {
        return ledgerFor(accountId, range, fiscalPeriodId);
    }

    domain::AccountLedger ledgerFor(
        int64_t accountId,
        const domain::DateRange& range,
        std::optional<int64_t> fiscalPeriodId)
    {
        if (range.isInverted()) {
            throw domain::ValidationError("Date range is inverted: " + range.from->toString() +
                                          " > " + range.to->toString());
        }

        auto account = accounts_->findById(accountId);
        if (!account) {
            throw domain::NotFoundError("Account " + std::to_string(accountId) + " not found");
        }
        if (!account->isActive) {
            throw domain::ValidationError("Account " + account->code + " is inactive");
        }

        domain::AccountLedger ledger;
        ledger.account = *account;

        if (range.from) {
            auto before = queries_->sumCommittedBefore(accountId, *range.from);
            ledger.openingBalance = domain::signedDelta(account->normalBalance, before.debit, before.credit);
        }

        auto lines = queries_->findCommittedLines(accountId, range, fiscalPeriodId);
        std::stable_sort(lines.begin(), lines.end(), [](const domain::PostedLine& a, const domain::PostedLine& b) {
            if (a.date != b.date) {
                return a.date < b.date;
            }
            if (a.entryNumber != b.entryNumber) {
                return domain::entryNumberLess(a.entryNumber, b.entryNumber);
            }
            return a.line.orderNumber < b.line.orderNumber;
        });

        domain::Money running = ledger.openingBalance;
        ledger.movements.reserve(lines.size());
        for (auto& posted : lines) {
            running += domain::signedDelta(account->normalBalance,
                                           posted.line.debitAmount, posted.line.creditAmount);
            ledger.totalDebit += posted.line.debitAmount;
            ledger.totalCredit += posted.line.creditAmount;
            ledger.movements.push_back(domain::LedgerMovement{std::move(posted), running});
        }
        ledger.closingBalance = running;

        std::cout << "[BalanceEngine] Ledger for account " << account->code << ": "
                  << ledger.movements.size() << " movements, closing "
                  << ledger.closingBalance.toString() << std::endl;
        return ledger;
    }

private:
    std::shared_ptr<ports::output::IChartOfAccountsGateway> accounts_;
    std::shared_ptr<ports::output::ILedgerQueryRepository> queries_;
};

} // namespace ledger::application
