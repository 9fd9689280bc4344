#pragma once

#include "ports/output/ILegalDocumentRepository.hpp"
#include "adapters/secondary/persistence/InMemoryLedgerStore.hpp"
#include "domain/errors/LedgerErrors.hpp"

namespace ledger::adapters::secondary {

class InMemoryLegalDocumentRepository : public ports::output::ILegalDocumentRepository {
public:
    explicit InMemoryLegalDocumentRepository(LedgerState& state) : state_(state) {}

    std::optional<domain::LegalDocument> findByIdForUpdate(int64_t documentId) override {
        auto it = state_.documents.find(documentId);
        return it != state_.documents.end() ? std::optional(it->second) : std::nullopt;
    }

    void update(const domain::LegalDocument& document) override {
        auto it = state_.documents.find(document.id);
        if (it == state_.documents.end()) {
            throw domain::NotFoundError("Document " + std::to_string(document.id) + " not found");
        }
        it->second = document;
    }

    void appendStatusChange(const domain::DocumentStatusChange& change) override {
        state_.documentHistory.push_back(change);
    }

private:
    LedgerState& state_;
};

} // namespace ledger::adapters::secondary
