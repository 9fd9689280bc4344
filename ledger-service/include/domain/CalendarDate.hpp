#pragma once

#include <string>
#include <tuple>

namespace ledger::domain {

/**
 * @brief Календарная дата без времени суток (YYYY-MM-DD)
 */
class CalendarDate {
public:
    CalendarDate() = default;

    /// @throws std::invalid_argument для несуществующей даты
    CalendarDate(int year, int month, int day);

    /**
     * @brief Разобрать строку "2024-01-31"
     * @throws std::invalid_argument если формат или дата неверны
     */
    static CalendarDate fromString(const std::string& iso);

    /**
     * @brief Сегодняшняя дата (UTC)
     */
    static CalendarDate today();

    static bool isValid(int year, int month, int day);

    std::string toString() const;

    int year() const { return year_; }
    int month() const { return month_; }
    int day() const { return day_; }

    bool operator==(const CalendarDate& other) const { return key() == other.key(); }
    bool operator!=(const CalendarDate& other) const { return key() != other.key(); }
    bool operator<(const CalendarDate& other) const { return key() < other.key(); }
    bool operator>(const CalendarDate& other) const { return key() > other.key(); }
    bool operator<=(const CalendarDate& other) const { return key() <= other.key(); }
    bool operator>=(const CalendarDate& other) const { return key() >= other.key(); }

private:
    int year_ = 1970;
    int month_ = 1;
    int day_ = 1;

    std::tuple<int, int, int> key() const { return std::make_tuple(year_, month_, day_); }
};

} // namespace ledger::domain
