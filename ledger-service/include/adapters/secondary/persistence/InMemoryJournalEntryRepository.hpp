#pragma once

#include "ports/output/IJournalEntryRepository.hpp"
#include "adapters/secondary/persistence/InMemoryLedgerStore.hpp"
#include "domain/errors/LedgerErrors.hpp"

namespace ledger::adapters::secondary {

/**
 * @brief Проводки в рабочей копии единицы работы
 *
 * Уникальность (voucherTypeId, entryNumber) проверяется и здесь,
 * как уникальный индекс в БД.
 */
class InMemoryJournalEntryRepository : public ports::output::IJournalEntryRepository {
public:
    explicit InMemoryJournalEntryRepository(LedgerState& state) : state_(state) {}

    std::optional<domain::JournalEntry> findByIdForUpdate(int64_t entryId) override {
        auto it = state_.entries.find(entryId);
        return it != state_.entries.end() ? std::optional(it->second) : std::nullopt;
    }

    std::vector<domain::JournalEntry> findByDocumentForUpdate(int64_t documentTypeId, int64_t documentId) override {
        std::vector<domain::JournalEntry> result;
        for (const auto& [id, entry] : state_.entries) {
            if (entry.documentTypeId == documentTypeId && entry.documentId == documentId) {
                result.push_back(entry);
            }
        }
        return result;
    }

    bool existsByNumber(int64_t voucherTypeId, const std::string& entryNumber) override {
        for (const auto& [id, entry] : state_.entries) {
            if (entry.voucherTypeId == voucherTypeId && entry.entryNumber == entryNumber) {
                return true;
            }
        }
        return false;
    }

    bool existsForDocument(int64_t documentTypeId, int64_t documentId, int64_t voucherTypeId) override {
        for (const auto& [id, entry] : state_.entries) {
            if (entry.documentTypeId == documentTypeId && entry.documentId == documentId &&
                entry.voucherTypeId == voucherTypeId) {
                return true;
            }
        }
        return false;
    }

    int64_t insert(const domain::JournalEntry& entry) override {
        if (existsByNumber(entry.voucherTypeId, entry.entryNumber)) {
            throw domain::ConflictError("Duplicate entry number " + entry.entryNumber);
        }

        domain::JournalEntry stored = entry;
        stored.assignId(++state_.lastEntryId);
        assignLineIds(stored);
        state_.entries[stored.id] = stored;
        return stored.id;
    }

    void update(const domain::JournalEntry& entry) override {
        auto it = requireEntry(entry.id);
        for (const auto& [id, other] : state_.entries) {
            if (id != entry.id && other.voucherTypeId == entry.voucherTypeId &&
                other.entryNumber == entry.entryNumber) {
                throw domain::ConflictError("Duplicate entry number " + entry.entryNumber);
            }
        }

        domain::JournalEntry stored = entry;
        stored.assignId(entry.id);
        assignLineIds(stored);
        it->second = stored;
    }

    void updateHeader(const domain::JournalEntry& entry) override {
        auto it = requireEntry(entry.id);
        domain::JournalEntry stored = entry;
        stored.setLines(it->second.lines());
        it->second = stored;
    }

    void remove(int64_t entryId) override {
        state_.entries.erase(requireEntry(entryId));
    }

private:
    LedgerState& state_;

    std::map<int64_t, domain::JournalEntry>::iterator requireEntry(int64_t entryId) {
        auto it = state_.entries.find(entryId);
        if (it == state_.entries.end()) {
            throw domain::NotFoundError("Journal entry " + std::to_string(entryId) + " not found");
        }
        return it;
    }

    void assignLineIds(domain::JournalEntry& entry) {
        for (size_t i = 0; i < entry.lines().size(); ++i) {
            entry.assignLineId(i, ++state_.lastLineId);
        }
    }
};

} // namespace ledger::adapters::secondary
