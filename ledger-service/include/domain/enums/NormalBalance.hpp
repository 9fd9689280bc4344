#pragma once

#include "domain/Money.hpp"
#include <string>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Нормальное сальдо счёта (balance_type)
 */
enum class NormalBalance {
    DEBIT,
    CREDIT
};

inline std::string toString(NormalBalance balance) {
    switch (balance) {
        case NormalBalance::DEBIT:  return "debit";
        case NormalBalance::CREDIT: return "credit";
    }
    return "unknown";
}

inline NormalBalance normalBalanceFromString(const std::string& str) {
    if (str == "debit")  return NormalBalance::DEBIT;
    if (str == "credit") return NormalBalance::CREDIT;
    throw std::invalid_argument("Unknown NormalBalance: " + str);
}

/**
 * @brief Знаковое изменение сальдо: delta = debit - credit,
 * для кредитовых счетов знак инвертируется
 */
inline Money signedDelta(NormalBalance balance, const Money& debit, const Money& credit) {
    Money delta = debit - credit;
    return balance == NormalBalance::DEBIT ? delta : -delta;
}

} // namespace ledger::domain
