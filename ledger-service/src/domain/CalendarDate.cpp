#include "domain/CalendarDate.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace ledger::domain {

namespace {

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return month == 2 && isLeapYear(year) ? 29 : kDays[month - 1];
}

} // namespace

CalendarDate::CalendarDate(int year, int month, int day)
    : year_(year), month_(month), day_(day)
{
    if (!isValid(year, month, day)) {
        throw std::invalid_argument("Invalid calendar date: " + std::to_string(year) + "-" +
                                    std::to_string(month) + "-" + std::to_string(day));
    }
}

bool CalendarDate::isValid(int year, int month, int day) {
    if (year < 1 || year > 9999 || month < 1 || month > 12 || day < 1) {
        return false;
    }
    return day <= daysInMonth(year, month);
}

CalendarDate CalendarDate::fromString(const std::string& iso) {
    // Postgres может вернуть DATE/TIMESTAMP, берём только дату
    std::string datePart = iso.substr(0, 10);
    if (datePart.size() != 10 || datePart[4] != '-' || datePart[7] != '-') {
        throw std::invalid_argument("Invalid date format (expected YYYY-MM-DD): " + iso);
    }
    for (size_t i : {0u, 1u, 2u, 3u, 5u, 6u, 8u, 9u}) {
        if (datePart[i] < '0' || datePart[i] > '9') {
            throw std::invalid_argument("Invalid date format (expected YYYY-MM-DD): " + iso);
        }
    }

    return CalendarDate(std::stoi(datePart.substr(0, 4)),
                        std::stoi(datePart.substr(5, 2)),
                        std::stoi(datePart.substr(8, 2)));
}

CalendarDate CalendarDate::today() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm = *std::gmtime(&now);
    return CalendarDate(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
}

std::string CalendarDate::toString() const {
    char buffer[11];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year_, month_, day_);
    return std::string(buffer);
}

} // namespace ledger::domain
