#pragma once

#include "domain/Money.hpp"
#include "domain/ExchangeRate.hpp"
#include "domain/CalendarDate.hpp"
#include "domain/Timestamp.hpp"
#include "domain/enums/DocumentStatus.hpp"
#include <optional>
#include <string>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Юридический документ - источник проводок
 */
struct LegalDocument {
    int64_t id = 0;
    int64_t documentTypeId = 0;
    std::string documentNumber;
    std::string reference;
    DocumentStatus status = DocumentStatus::DRAFT;
    CalendarDate date;
    Money totalAmount;
    std::optional<int64_t> currencyId;
    ExchangeRate exchangeRate;
    int64_t fiscalPeriodId = 0;
    std::optional<int64_t> thirdPartyId;
    std::string cancellationReason;
    std::optional<int64_t> cancelledBy;
};

/**
 * @brief Запись истории статусов документа
 */
struct DocumentStatusChange {
    int64_t documentId = 0;
    DocumentStatus previousStatus = DocumentStatus::DRAFT;
    DocumentStatus newStatus = DocumentStatus::DRAFT;
    int64_t actorId = 0;
    std::string comment;
    Timestamp changedAt;
};

} // namespace ledger::domain
