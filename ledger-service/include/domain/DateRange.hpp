#pragma once

#include "domain/CalendarDate.hpp"
#include <optional>

namespace ledger::domain {

/**
 * @brief Диапазон дат [from, to], любая граница может отсутствовать
 */
struct DateRange {
    std::optional<CalendarDate> from;
    std::optional<CalendarDate> to;

    DateRange() = default;
    DateRange(std::optional<CalendarDate> f, std::optional<CalendarDate> t)
        : from(std::move(f)), to(std::move(t)) {}

    static DateRange between(const CalendarDate& f, const CalendarDate& t) {
        return DateRange(f, t);
    }

    bool contains(const CalendarDate& date) const {
        return (!from || *from <= date) && (!to || date <= *to);
    }

    bool isInverted() const {
        return from && to && *to < *from;
    }
};

} // namespace ledger::domain
