#pragma once

#include "ports/output/ILedgerQueryRepository.hpp"
#include "adapters/secondary/persistence/InMemoryLedgerStore.hpp"
#include "domain/EntryNumberOrder.hpp"
#include <algorithm>
#include <memory>

namespace ledger::adapters::secondary {

/**
 * @brief Отчётные выборки по зафиксированному снимку хранилища
 */
class InMemoryLedgerQueryRepository : public ports::output::ILedgerQueryRepository {
public:
    explicit InMemoryLedgerQueryRepository(std::shared_ptr<InMemoryLedgerStore> store)
        : store_(std::move(store)) {}

    std::optional<domain::JournalEntry> findEntryById(int64_t entryId) override {
        auto state = store_->snapshot();
        auto it = state.entries.find(entryId);
        return it != state.entries.end() ? std::optional(it->second) : std::nullopt;
    }

    std::vector<domain::JournalEntry> findEntries(const domain::EntryFilter& filter) override {
        std::vector<domain::JournalEntry> matching;
        auto state = store_->snapshot();
        for (const auto& [id, entry] : state.entries) {
            if (filter.matches(entry)) {
                matching.push_back(entry);
            }
        }
        return page(std::move(matching), filter.limit, filter.offset);
    }

    int64_t countEntries(const domain::EntryFilter& filter) override {
        auto state = store_->snapshot();
        return static_cast<int64_t>(std::count_if(state.entries.begin(), state.entries.end(),
            [&](const auto& item) { return filter.matches(item.second); }));
    }

    std::vector<domain::JournalEntry> findCommittedEntries(const domain::JournalFilter& filter) override {
        return page(filterEntries(filter), filter.limit, filter.offset);
    }

    int64_t countCommittedEntries(const domain::JournalFilter& filter) override {
        return static_cast<int64_t>(filterEntries(filter).size());
    }

    domain::AmountTotals sumCommittedBefore(int64_t accountId, const domain::CalendarDate& before) override {
        domain::AmountTotals totals;
        auto state = store_->snapshot();
        for (const auto& [id, entry] : state.entries) {
            if (!domain::isCommittedStatus(entry.status) || !(entry.date < before)) {
                continue;
            }
            for (const auto& line : entry.lines()) {
                if (line.accountId == accountId) {
                    totals.debit += line.debitAmount;
                    totals.credit += line.creditAmount;
                }
            }
        }
        return totals;
    }

    std::vector<domain::PostedLine> findCommittedLines(
        int64_t accountId,
        const domain::DateRange& range,
        std::optional<int64_t> fiscalPeriodId) override
    {
        std::vector<domain::PostedLine> result;
        auto state = store_->snapshot();
        for (const auto& [id, entry] : state.entries) {
            if (!inReport(entry, range, fiscalPeriodId)) {
                continue;
            }
            for (const auto& line : entry.lines()) {
                if (line.accountId == accountId) {
                    result.push_back(domain::PostedLine{entry.id, entry.entryNumber, entry.date, entry.reference, line});
                }
            }
        }
        std::sort(result.begin(), result.end(), [](const domain::PostedLine& a, const domain::PostedLine& b) {
            if (a.date != b.date) {
                return a.date < b.date;
            }
            if (a.entryNumber != b.entryNumber) {
                return domain::entryNumberLess(a.entryNumber, b.entryNumber);
            }
            return a.line.orderNumber < b.line.orderNumber;
        });
        return result;
    }

    std::map<int64_t, domain::AmountTotals> aggregateCommittedByAccount(
        const domain::DateRange& range,
        std::optional<int64_t> fiscalPeriodId) override
    {
        std::map<int64_t, domain::AmountTotals> result;
        auto state = store_->snapshot();
        for (const auto& [id, entry] : state.entries) {
            if (!inReport(entry, range, fiscalPeriodId)) {
                continue;
            }
            for (const auto& line : entry.lines()) {
                result[line.accountId] += domain::AmountTotals{line.debitAmount, line.creditAmount};
            }
        }
        return result;
    }

private:
    std::shared_ptr<InMemoryLedgerStore> store_;

    // date ASC, номер (entryNumberLess), id
    static std::vector<domain::JournalEntry> page(
        std::vector<domain::JournalEntry> entries, std::optional<size_t> limit, size_t offset)
    {
        std::sort(entries.begin(), entries.end(), [](const domain::JournalEntry& a, const domain::JournalEntry& b) {
            if (a.date != b.date) {
                return a.date < b.date;
            }
            if (a.entryNumber != b.entryNumber) {
                return domain::entryNumberLess(a.entryNumber, b.entryNumber);
            }
            return a.id < b.id;
        });

        size_t begin = std::min(offset, entries.size());
        size_t end = limit ? std::min(begin + *limit, entries.size()) : entries.size();
        return std::vector<domain::JournalEntry>(entries.begin() + begin, entries.begin() + end);
    }

    static bool inReport(
        const domain::JournalEntry& entry,
        const domain::DateRange& range,
        std::optional<int64_t> fiscalPeriodId)
    {
        return domain::isCommittedStatus(entry.status) &&
               range.contains(entry.date) &&
               (!fiscalPeriodId || entry.fiscalPeriodId == *fiscalPeriodId);
    }

    std::vector<domain::JournalEntry> filterEntries(const domain::JournalFilter& filter) {
        std::vector<domain::JournalEntry> result;
        auto state = store_->snapshot();
        for (const auto& [id, entry] : state.entries) {
            if (!inReport(entry, filter.range, filter.fiscalPeriodId)) {
                continue;
            }
            if (filter.status && entry.status != *filter.status) {
                continue;
            }
            if (filter.thirdPartyId && entry.thirdPartyId != filter.thirdPartyId) {
                continue;
            }
            if (entry.entryNumber.compare(0, filter.entryNumberPrefix.size(), filter.entryNumberPrefix) != 0) {
                continue;
            }
            result.push_back(entry);
        }
        return result;
    }
};

} // namespace ledger::adapters::secondary
