#pragma once

#include <string>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>

namespace ledger::domain {

/**
 * @brief Момент аудита (created_at, posted_at, cancelled_at) в UTC
 */
struct Timestamp {
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    /**
     * @brief Разобрать "2024-01-05T10:30:00" или "2024-01-05 10:30:00" (формат Postgres)
     */
    static Timestamp fromString(const std::string& text) {
        std::string normalized = text;
        if (normalized.size() > 10 && normalized[10] == ' ') {
            normalized[10] = 'T';
        }

        std::tm tm = {};
        std::istringstream ss(normalized);
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");

        if (ss.fail()) {
            return Timestamp::now();
        }

        return Timestamp(std::chrono::system_clock::from_time_t(timegm(&tm)));
    }

    /**
     * @brief ISO 8601: "2024-01-05T10:30:00Z"
     */
    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = *std::gmtime(&time_t_val);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
    bool operator<(const Timestamp& other) const { return value < other.value; }
};

} // namespace ledger::domain
