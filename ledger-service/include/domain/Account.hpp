#pragma once

#include "domain/enums/NormalBalance.hpp"
#include <string>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Счёт плана счетов (справочник внешний, ядро только читает)
 */
struct Account {
    int64_t id = 0;
    std::string code;        ///< Иерархический код, например "110505"
    std::string name;
    NormalBalance normalBalance = NormalBalance::DEBIT;
    bool allowsEntries = false;  ///< Только листовые счета принимают строки
    bool isActive = true;

    /**
     * @brief Можно ли проводить строки по счёту
     */
    bool isPostable() const { return allowsEntries && isActive; }
};

} // namespace ledger::domain
