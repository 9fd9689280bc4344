#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Базовое исключение бизнес-правил леджера
 *
 * Ни одна ошибка не повторяется автоматически: вызывающий получает её как есть,
 * а незавершённая единица работы откатывается.
 */
class LedgerException : public std::runtime_error {
public:
    explicit LedgerException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Несбалансированная проводка, пустые строки, неверная строка, дата или период
 */
class ValidationError : public LedgerException {
public:
    explicit ValidationError(const std::string& message)
        : LedgerException(message) {}
};

/**
 * @brief Отсутствует проводка, счёт, период, тип или документ
 */
class NotFoundError : public LedgerException {
public:
    explicit NotFoundError(const std::string& message)
        : LedgerException(message) {}
};

/**
 * @brief Переход, которого нет в таблице состояний (устаревшее представление клиента)
 */
class InvalidStateError : public LedgerException {
public:
    explicit InvalidStateError(const std::string& message)
        : LedgerException(message) {}
};

/**
 * @brief Конфликт с существующими данными
 *
 * blockingEntryIds() перечисляет проводки, из-за которых операция невозможна.
 */
class ConflictError : public LedgerException {
public:
    explicit ConflictError(const std::string& message, std::vector<int64_t> blockingEntryIds = {})
        : LedgerException(message)
        , blockingEntryIds_(std::move(blockingEntryIds)) {}

    const std::vector<int64_t>& blockingEntryIds() const { return blockingEntryIds_; }

private:
    std::vector<int64_t> blockingEntryIds_;
};

} // namespace ledger::domain
