#pragma once

#include "domain/Money.hpp"
#include <optional>
#include <string>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Строка проводки: движение по одному счёту
 *
 * Ровно одна из сумм debitAmount/creditAmount ненулевая.
 */
struct JournalLine {
    int64_t id = 0;
    int64_t entryId = 0;
    int orderNumber = 0;     ///< 1..n, задаёт порядок внутри проводки
    int64_t accountId = 0;
    std::string description;
    Money debitAmount;
    Money creditAmount;
    std::optional<int64_t> thirdPartyId;

    JournalLine() = default;

    JournalLine(int64_t account, Money debit, Money credit, std::string desc = "")
        : accountId(account)
        , description(std::move(desc))
        , debitAmount(debit)
        , creditAmount(credit) {}

    static JournalLine debit(int64_t account, Money amount, std::string desc = "") {
        return JournalLine(account, amount, Money::zero(), std::move(desc));
    }

    static JournalLine credit(int64_t account, Money amount, std::string desc = "") {
        return JournalLine(account, Money::zero(), amount, std::move(desc));
    }

    bool isWellFormed() const {
        if (debitAmount.isNegative() || creditAmount.isNegative()) {
            return false;
        }
        return debitAmount.isZero() != creditAmount.isZero();
    }
};

} // namespace ledger::domain
