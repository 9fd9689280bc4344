#pragma once

#include "domain/JournalEntry.hpp"
#include "domain/JournalBook.hpp"
#include "domain/EntryListing.hpp"
#include "domain/AccountLedger.hpp"
#include "domain/DateRange.hpp"
#include <map>
#include <optional>
#include <vector>
#include <cstdint>

namespace ledger::ports::output {

/**
 * @brief Чтение для отчётов (вне транзакции)
 *
 * Все выборки, кроме findEntryById и findEntries/countEntries, видят
 * только проведённые статусы (posted, reversed).
 *
 * Номера внутри дня упорядочены по domain::entryNumberLess: счётчик
 * численно, зеркальная CANC- сразу за оригиналом.
 */
class ILedgerQueryRepository {
public:
    virtual ~ILedgerQueryRepository() = default;

    /**
     * @brief Проводка в любом статусе (для getEntry)
     */
    virtual std::optional<domain::JournalEntry> findEntryById(int64_t entryId) = 0;

    /**
     * @brief Рабочий список в любом статусе: date ASC, номер, с учётом limit/offset
     */
    virtual std::vector<domain::JournalEntry> findEntries(const domain::EntryFilter& filter) = 0;

    virtual int64_t countEntries(const domain::EntryFilter& filter) = 0;

    /**
     * @brief Проводки Libro Diario: date ASC, entryNumber ASC, с учётом limit/offset
     */
    virtual std::vector<domain::JournalEntry> findCommittedEntries(const domain::JournalFilter& filter) = 0;

    virtual int64_t countCommittedEntries(const domain::JournalFilter& filter) = 0;

    /**
     * @brief Обороты по счёту строго до даты
     */
    virtual domain::AmountTotals sumCommittedBefore(int64_t accountId, const domain::CalendarDate& before) = 0;

    /**
     * @brief Строки счёта в диапазоне: date ASC, entryNumber ASC, orderNumber ASC
     */
    virtual std::vector<domain::PostedLine> findCommittedLines(
        int64_t accountId,
        const domain::DateRange& range,
        std::optional<int64_t> fiscalPeriodId) = 0;

    /**
     * @brief Обороты по всем счетам в диапазоне
     */
    virtual std::map<int64_t, domain::AmountTotals> aggregateCommittedByAccount(
        const domain::DateRange& range,
        std::optional<int64_t> fiscalPeriodId) = 0;
};

} // namespace ledger::ports::output
