#pragma once

#include "domain/ScaledDecimal.hpp"
#include <string>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Курс пересчёта в базовую валюту (6 знаков после запятой)
 *
 * Хранится как множитель; переоценка по курсу не выполняется.
 */
class ExchangeRate {
public:
    static constexpr int kScale = 6;
    static constexpr int64_t kOne = 1000000;

    ExchangeRate() = default;

    static ExchangeRate fromMicros(int64_t micros) {
        ExchangeRate rate;
        rate.micros_ = micros;
        return rate;
    }

    /// @throws std::invalid_argument
    static ExchangeRate fromString(const std::string& value) {
        return fromMicros(parseScaledDecimal(value, kScale));
    }

    int64_t micros() const { return micros_; }
    bool isPositive() const { return micros_ > 0; }
    std::string toString() const { return formatScaledDecimal(micros_, kScale); }

    bool operator==(const ExchangeRate& other) const { return micros_ == other.micros_; }
    bool operator!=(const ExchangeRate& other) const { return micros_ != other.micros_; }

private:
    int64_t micros_ = kOne;
};

} // namespace ledger::domain
