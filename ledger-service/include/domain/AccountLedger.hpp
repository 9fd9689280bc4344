#pragma once

#include "domain/Account.hpp"
#include "domain/Money.hpp"
#include "domain/CalendarDate.hpp"
#include "domain/JournalLine.hpp"
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Строка проведённой проводки вместе с реквизитами заголовка
 */
struct PostedLine {
    int64_t entryId = 0;
    std::string entryNumber;
    CalendarDate date;
    std::string reference;
    JournalLine line;
};

/**
 * @brief Суммы дебета и кредита
 */
struct AmountTotals {
    Money debit;
    Money credit;

    AmountTotals& operator+=(const AmountTotals& other) {
        debit += other.debit;
        credit += other.credit;
        return *this;
    }
};

/**
 * @brief Движение Libro Mayor с накопленным сальдо
 */
struct LedgerMovement {
    PostedLine posted;
    Money runningBalance;
};

/**
 * @brief Libro Mayor по одному счёту
 */
struct AccountLedger {
    Account account;
    Money openingBalance;
    std::vector<LedgerMovement> movements;
    Money totalDebit;
    Money totalCredit;
    Money closingBalance;
};

} // namespace ledger::domain
