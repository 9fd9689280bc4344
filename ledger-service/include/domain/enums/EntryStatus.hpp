#pragma once

#include <string>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Статус проводки (journal entry)
 */
enum class EntryStatus {
    DRAFT,      ///< Черновик, единственный изменяемый статус
    POSTED,     ///< Проведена, влияет на сальдо
    REVERSED,   ///< Сторнирована зеркальной проводкой
    CANCELLED   ///< Аннулирована каскадом от документа (не была проведена)
};

inline std::string toString(EntryStatus status) {
    switch (status) {
        case EntryStatus::DRAFT:     return "draft";
        case EntryStatus::POSTED:    return "posted";
        case EntryStatus::REVERSED:  return "reversed";
        case EntryStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline EntryStatus entryStatusFromString(const std::string& str) {
    if (str == "draft")     return EntryStatus::DRAFT;
    if (str == "posted")    return EntryStatus::POSTED;
    if (str == "reversed")  return EntryStatus::REVERSED;
    if (str == "cancelled") return EntryStatus::CANCELLED;
    throw std::invalid_argument("Unknown EntryStatus: " + str);
}

/**
 * @brief Попадает ли проводка в отчёты и сальдо
 *
 * Сторнированная проводка остаётся в книгах: её обнуляет зеркальная проводка.
 */
inline bool isCommittedStatus(EntryStatus status) {
    return status == EntryStatus::POSTED || status == EntryStatus::REVERSED;
}

} // namespace ledger::domain
