#pragma once

#include <string>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Статус юридического документа
 */
enum class DocumentStatus {
    DRAFT,
    APPROVED,
    CANCELLED
};

inline std::string toString(DocumentStatus status) {
    switch (status) {
        case DocumentStatus::DRAFT:     return "draft";
        case DocumentStatus::APPROVED:  return "approved";
        case DocumentStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

inline DocumentStatus documentStatusFromString(const std::string& str) {
    if (str == "draft")     return DocumentStatus::DRAFT;
    if (str == "approved")  return DocumentStatus::APPROVED;
    if (str == "cancelled") return DocumentStatus::CANCELLED;
    throw std::invalid_argument("Unknown DocumentStatus: " + str);
}

} // namespace ledger::domain
