#pragma once

#include "domain/JournalEntry.hpp"
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace ledger::ports::output {

/**
 * @brief Запись проводок внутри единицы работы
 *
 * Методы *ForUpdate блокируют строки до commit/rollback.
 */
class IJournalEntryRepository {
public:
    virtual ~IJournalEntryRepository() = default;

    virtual std::optional<domain::JournalEntry> findByIdForUpdate(int64_t entryId) = 0;

    /**
     * @brief Все проводки документа (любого типа), заблокированные на запись
     */
    virtual std::vector<domain::JournalEntry> findByDocumentForUpdate(
        int64_t documentTypeId, int64_t documentId) = 0;

    virtual bool existsByNumber(int64_t voucherTypeId, const std::string& entryNumber) = 0;

    virtual bool existsForDocument(
        int64_t documentTypeId, int64_t documentId, int64_t voucherTypeId) = 0;

    /**
     * @brief Вставить заголовок и все строки
     * @return id новой проводки
     */
    virtual int64_t insert(const domain::JournalEntry& entry) = 0;

    /**
     * @brief Обновить заголовок и заменить строки
     */
    virtual void update(const domain::JournalEntry& entry) = 0;

    /**
     * @brief Обновить только заголовок (статус, аудит); строки не трогаются
     */
    virtual void updateHeader(const domain::JournalEntry& entry) = 0;

    virtual void remove(int64_t entryId) = 0;
};

} // namespace ledger::ports::output
