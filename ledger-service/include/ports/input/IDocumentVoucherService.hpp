#pragma once

#include "domain/JournalEntry.hpp"
#include <string>
#include <cstdint>

namespace ledger::ports::input {

/**
 * @brief Связь юридических документов и проводок
 */
class IDocumentVoucherService {
public:
    virtual ~IDocumentVoucherService() = default;

    /**
     * @brief Сгенерировать проводку из утверждённого документа
     * @throws ConflictError если проводка этого типа для документа уже есть
     */
    virtual domain::JournalEntry generateVoucherFromDocument(
        int64_t documentId, int64_t voucherTypeId, int64_t actorId) = 0;

    /**
     * @brief Аннулировать документ и его непроведённые проводки
     * @throws ConflictError если у документа есть проведённые проводки
     */
    virtual void cancelDocument(int64_t documentId, const std::string& reason, int64_t actorId) = 0;
};

} // namespace ledger::ports::input
