#pragma once

#include "domain/LegalDocument.hpp"
#include <optional>
#include <cstdint>

namespace ledger::ports::output {

class ILegalDocumentRepository {
public:
    virtual ~ILegalDocumentRepository() = default;

    virtual std::optional<domain::LegalDocument> findByIdForUpdate(int64_t documentId) = 0;

    /**
     * @brief Сохранить статус и реквизиты аннулирования
     */
    virtual void update(const domain::LegalDocument& document) = 0;

    virtual void appendStatusChange(const domain::DocumentStatusChange& change) = 0;
};

} // namespace ledger::ports::output
