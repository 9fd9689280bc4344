#pragma once

#include "domain/JournalEntry.hpp"
#include "domain/DateRange.hpp"
#include "domain/enums/EntryStatus.hpp"
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Фильтр Libro Diario
 *
 * status допускает только проведённые статусы; без него берутся оба.
 */
struct JournalFilter {
    DateRange range;
    std::optional<EntryStatus> status;
    std::optional<int64_t> thirdPartyId;
    std::optional<int64_t> fiscalPeriodId;
    std::string entryNumberPrefix;
    std::optional<size_t> limit;
    size_t offset = 0;
};

struct JournalBookLine {
    JournalLine line;
    std::string accountCode;
    std::string accountName;
};

struct JournalBookEntry {
    JournalEntry entry;
    std::vector<JournalBookLine> details;
};

/**
 * @brief Страница Libro Diario; totalCount - без учёта пагинации
 */
struct JournalBook {
    std::vector<JournalBookEntry> entries;
    int64_t totalCount = 0;
};

} // namespace ledger::domain
