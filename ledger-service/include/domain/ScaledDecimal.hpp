#pragma once

#include <string>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Разбор десятичной строки в целое число минорных единиц
 *
 * parseScaledDecimal("12.345", 2) == 1235 (half-up по первому отброшенному знаку).
 * @throws std::invalid_argument если строка не является числом
 */
int64_t parseScaledDecimal(const std::string& value, int scale);

/**
 * @brief Обратное преобразование: formatScaledDecimal(-1235, 2) == "-12.35"
 */
std::string formatScaledDecimal(int64_t scaled, int scale);

} // namespace ledger::domain
