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
 * @brief Фильтр рабочего списка проводок (любой статус, включая черновики)
 */
struct EntryFilter {
    DateRange range;
    std::optional<EntryStatus> status;
    std::optional<int64_t> voucherTypeId;
    std::optional<int64_t> fiscalPeriodId;
    std::optional<int64_t> thirdPartyId;
    std::string entryNumberPrefix;
    std::optional<size_t> limit;
    size_t offset = 0;

    bool matches(const JournalEntry& entry) const {
        return range.contains(entry.date) &&
               (!status || entry.status == *status) &&
               (!voucherTypeId || entry.voucherTypeId == *voucherTypeId) &&
               (!fiscalPeriodId || entry.fiscalPeriodId == *fiscalPeriodId) &&
               (!thirdPartyId || entry.thirdPartyId == thirdPartyId) &&
               entry.entryNumber.compare(0, entryNumberPrefix.size(), entryNumberPrefix) == 0;
    }
};

/**
 * @brief Страница списка; totalCount - без учёта пагинации
 */
struct EntryPage {
    std::vector<JournalEntry> entries;
    int64_t totalCount = 0;
};

} // namespace ledger::domain
