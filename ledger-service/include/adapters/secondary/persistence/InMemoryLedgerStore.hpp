#pragma once

#include "domain/JournalEntry.hpp"
#include "domain/VoucherType.hpp"
#include "domain/LegalDocument.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <vector>
#include <cstdint>

namespace ledger::adapters::secondary {

/**
 * @brief Всё изменяемое состояние леджера (копируется целиком в единицу работы)
 */
struct LedgerState {
    std::map<int64_t, domain::JournalEntry> entries;
    std::map<int64_t, domain::VoucherType> voucherTypes;
    std::map<int64_t, domain::LegalDocument> documents;
    std::vector<domain::DocumentStatusChange> documentHistory;
    int64_t lastEntryId = 0;
    int64_t lastLineId = 0;
};

/**
 * @brief In-memory хранилище проводок, счётчиков и документов
 *
 * Единицы работы сериализуются на mutex_ (аналог блокировок строк):
 * InMemoryUnitOfWork держит его от begin() до деструктора.
 */
class InMemoryLedgerStore {
public:
    void addVoucherType(const domain::VoucherType& type) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.voucherTypes[type.id] = type;
    }

    void addDocument(const domain::LegalDocument& document) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.documents[document.id] = document;
    }

    /**
     * @brief Согласованная копия зафиксированного состояния
     */
    LedgerState snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    std::optional<domain::VoucherType> findVoucherType(int64_t id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = state_.voucherTypes.find(id);
        return it != state_.voucherTypes.end() ? std::optional(it->second) : std::nullopt;
    }

    std::optional<domain::LegalDocument> findDocument(int64_t id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = state_.documents.find(id);
        return it != state_.documents.end() ? std::optional(it->second) : std::nullopt;
    }

    std::vector<domain::DocumentStatusChange> documentHistory(int64_t documentId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::DocumentStatusChange> result;
        for (const auto& change : state_.documentHistory) {
            if (change.documentId == documentId) {
                result.push_back(change);
            }
        }
        return result;
    }

    size_t entryCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_.entries.size();
    }

    std::unique_lock<std::mutex> acquire() {
        return std::unique_lock<std::mutex>(mutex_);
    }

    /**
     * @brief Прямой доступ; вызывающий обязан держать acquire()
     */
    LedgerState& stateUnsafe() { return state_; }

private:
    mutable std::mutex mutex_;
    LedgerState state_;
};

} // namespace ledger::adapters::secondary
