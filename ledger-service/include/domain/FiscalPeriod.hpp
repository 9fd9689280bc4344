#pragma once

#include "domain/CalendarDate.hpp"
#include <string>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Фискальный период
 */
struct FiscalPeriod {
    int64_t id = 0;
    std::string name;
    CalendarDate startDate;
    CalendarDate endDate;
    bool isClosed = false;

    bool contains(const CalendarDate& date) const {
        return startDate <= date && date <= endDate;
    }

    bool acceptsPostingOn(const CalendarDate& date) const {
        return !isClosed && contains(date);
    }
};

} // namespace ledger::domain
