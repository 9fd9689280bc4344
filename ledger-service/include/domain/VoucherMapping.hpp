#pragma once

#include "domain/JournalLine.hpp"
#include <string>
#include <vector>

namespace ledger::domain {

/**
 * @brief Результат бизнес-маппинга документа в строки проводки
 */
struct VoucherMapping {
    std::vector<JournalLine> lines;
    bool postImmediately = false;
    std::string description;  ///< пусто - описание по умолчанию
};

} // namespace ledger::domain
