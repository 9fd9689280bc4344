#pragma once

#include <string>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Денежная сумма с фиксированной точкой (2 знака после запятой)
 *
 * Хранит значение в минорных единицах (центы) в int64_t.
 * Двоичная плавающая точка не используется ни в расчётах, ни при разборе.
 */
class Money {
public:
    static constexpr int kScale = 2;
    static constexpr int64_t kCentsPerUnit = 100;
    /// Допуск сравнения сумм: |a - b| < 0.01
    static constexpr int64_t kToleranceCents = 1;

    Money() = default;

    static Money fromCents(int64_t cents) {
        Money m;
        m.cents_ = cents;
        return m;
    }

    static Money zero() { return Money{}; }

    /**
     * @brief Разобрать десятичную строку ("1234.5", "-0.75", "100")
     *
     * Лишние знаки после запятой округляются half-up.
     * @throws std::invalid_argument если строка не является числом
     */
    static Money fromString(const std::string& value);

    /**
     * @brief Строка вида "-1234.50"
     */
    std::string toString() const;

    int64_t cents() const { return cents_; }

    bool isZero() const { return cents_ == 0; }
    bool isPositive() const { return cents_ > 0; }
    bool isNegative() const { return cents_ < 0; }

    Money abs() const { return fromCents(cents_ < 0 ? -cents_ : cents_); }

    /**
     * @brief Равенство с допуском округления 0.01
     */
    static bool nearlyEqual(const Money& a, const Money& b) {
        return (a - b).abs().cents_ < kToleranceCents;
    }

    Money operator+(const Money& other) const { return fromCents(cents_ + other.cents_); }
    Money operator-(const Money& other) const { return fromCents(cents_ - other.cents_); }
    Money operator-() const { return fromCents(-cents_); }

    Money& operator+=(const Money& other) {
        cents_ += other.cents_;
        return *this;
    }

    Money& operator-=(const Money& other) {
        cents_ -= other.cents_;
        return *this;
    }

    bool operator==(const Money& other) const { return cents_ == other.cents_; }
    bool operator!=(const Money& other) const { return cents_ != other.cents_; }
    bool operator<(const Money& other) const { return cents_ < other.cents_; }
    bool operator>(const Money& other) const { return cents_ > other.cents_; }
    bool operator<=(const Money& other) const { return cents_ <= other.cents_; }
    bool operator>=(const Money& other) const { return cents_ >= other.cents_; }

private:
    int64_t cents_ = 0;
};

} // namespace ledger::domain
