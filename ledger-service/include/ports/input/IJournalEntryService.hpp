#pragma once

#include "domain/JournalEntry.hpp"
#include "domain/EntryListing.hpp"
#include <cstdint>

namespace ledger::ports::input {

/**
 * @brief Жизненный цикл проводок
 *
 * Каждая операция возвращает проводку со строками или бросает
 * ValidationError / NotFoundError / InvalidStateError / ConflictError.
 */
class IJournalEntryService {
public:
    virtual ~IJournalEntryService() = default;

    virtual domain::JournalEntry createEntry(const domain::JournalEntryRequest& request, int64_t actorId) = 0;

    /**
     * @brief Заменить заголовок и строки черновика
     */
    virtual domain::JournalEntry updateEntry(
        int64_t entryId, const domain::JournalEntryRequest& request, int64_t actorId) = 0;

    virtual domain::JournalEntry postEntry(int64_t entryId, int64_t actorId) = 0;

    /**
     * @brief Сторнировать проведённую проводку зеркальной
     * @return оригинал в статусе reversed (reversedByEntryId - id зеркальной)
     */
    virtual domain::JournalEntry reverseEntry(
        int64_t entryId, const domain::ReverseRequest& request, int64_t actorId) = 0;

    virtual void deleteEntry(int64_t entryId, int64_t actorId) = 0;

    virtual domain::JournalEntry getEntry(int64_t entryId) = 0;

    /**
     * @brief Найти проводки в любом статусе (черновики к проведению, удалению)
     * @throws ValidationError при перевёрнутом диапазоне дат
     */
    virtual domain::EntryPage listEntries(const domain::EntryFilter& filter) = 0;
};

} // namespace ledger::ports::input
