#pragma once

#include "ports/output/IChartOfAccountsGateway.hpp"
#include "ports/output/IFiscalPeriodGateway.hpp"
#include "domain/JournalEntry.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include <memory>
#include <set>
#include <string>

namespace ledger::application {

/**
 * @brief Правила, которые проводка обязана выполнять при записи и при проведении
 *
 * Порядок проверок: строки, баланс, курс, счета, период.
 */
class EntryValidator {
public:
    EntryValidator(
        std::shared_ptr<ports::output::IChartOfAccountsGateway> accounts,
        std::shared_ptr<ports::output::IFiscalPeriodGateway> periods
    ) : accounts_(std::move(accounts))
      , periods_(std::move(periods))
    {}

    void validate(const domain::JournalEntry& entry) {
        validateLines(entry.lines());
        validateBalance(entry);

        if (!entry.exchangeRate.isPositive()) {
            throw domain::ValidationError("Exchange rate must be positive, got " + entry.exchangeRate.toString());
        }

        validateAccounts(entry.lines());
        validatePeriod(entry.fiscalPeriodId, entry.date);
    }

    /**
     * @brief Период существует, открыт и содержит дату
     */
    void validatePeriod(int64_t fiscalPeriodId, const domain::CalendarDate& date) {
        auto period = periods_->findById(fiscalPeriodId);
        if (!period) {
            throw domain::NotFoundError("Fiscal period " + std::to_string(fiscalPeriodId) + " not found");
        }
        if (period->isClosed) {
            throw domain::ValidationError("Fiscal period " + std::to_string(fiscalPeriodId) + " is closed");
        }
        if (!period->contains(date)) {
            throw domain::ValidationError("Date " + date.toString() + " is outside fiscal period " +
                                          std::to_string(fiscalPeriodId) + " [" +
                                          period->startDate.toString() + ", " +
                                          period->endDate.toString() + "]");
        }
    }

    static void validateLines(const std::vector<domain::JournalLine>& lines) {
        if (lines.empty()) {
            throw domain::ValidationError("Journal entry must have at least one line");
        }
        for (size_t i = 0; i < lines.size(); ++i) {
            if (!lines[i].isWellFormed()) {
                throw domain::ValidationError(
                    "Line " + std::to_string(i + 1) +
                    " must carry exactly one non-negative debit or credit amount (debit=" +
                    lines[i].debitAmount.toString() + ", credit=" + lines[i].creditAmount.toString() + ")");
            }
        }
    }

    static void validateBalance(const domain::JournalEntry& entry) {
        if (!entry.isBalanced()) {
            throw domain::ValidationError(
                "Journal entry is unbalanced: debit " + entry.totalDebit().toString() +
                " != credit " + entry.totalCredit().toString() +
                " (difference " + entry.imbalance().abs().toString() + ")");
        }
    }

private:
    std::shared_ptr<ports::output::IChartOfAccountsGateway> accounts_;
    std::shared_ptr<ports::output::IFiscalPeriodGateway> periods_;

    void validateAccounts(const std::vector<domain::JournalLine>& lines) {
        std::set<int64_t> checked;
        for (const auto& line : lines) {
            if (!checked.insert(line.accountId).second) {
                continue;
            }
            auto account = accounts_->findById(line.accountId);
            if (!account) {
                throw domain::NotFoundError("Account " + std::to_string(line.accountId) + " not found");
            }
            if (!account->isActive) {
                throw domain::ValidationError("Account " + account->code + " is inactive");
            }
            if (!account->allowsEntries) {
                throw domain::ValidationError("Account " + account->code + " does not allow entries");
            }
        }
    }
};

} // namespace ledger::application
