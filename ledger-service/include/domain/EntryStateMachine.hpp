#pragma once

#include "domain/enums/EntryStatus.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include <array>
#include <optional>
#include <string>

namespace ledger::domain {

/**
 * @brief Действие над проводкой
 */
enum class EntryAction {
    UPDATE,
    POST,
    REVERSE,
    DELETE,
    CANCEL
};

inline std::string toString(EntryAction action) {
    switch (action) {
        case EntryAction::UPDATE:  return "update";
        case EntryAction::POST:    return "post";
        case EntryAction::REVERSE: return "reverse";
        case EntryAction::DELETE:  return "delete";
        case EntryAction::CANCEL:  return "cancel";
    }
    return "unknown";
}

/**
 * @brief Таблица переходов статусов проводки
 *
 *   draft  --update-->  draft
 *   draft  --post---->  posted
 *   draft  --delete-->  (удалена)
 *   draft  --cancel-->  cancelled
 *   posted --reverse->  reversed
 *
 * Всё остальное - InvalidStateError. В draft вернуться нельзя.
 */
class EntryStateMachine {
public:
    struct Transition {
        EntryStatus from;
        EntryAction action;
        std::optional<EntryStatus> to;  ///< nullopt - проводка удаляется
    };

    static bool isAllowed(EntryStatus from, EntryAction action) {
        return find(from, action) != nullptr;
    }

    /**
     * @brief Целевой статус перехода (nullopt для delete)
     * @throws InvalidStateError если перехода нет в таблице
     */
    static std::optional<EntryStatus> apply(EntryStatus from, EntryAction action) {
        const Transition* transition = find(from, action);
        if (!transition) {
            throw InvalidStateError("Cannot " + toString(action) + " an entry in status '" +
                                    toString(from) + "'");
        }
        return transition->to;
    }

private:
    static const std::array<Transition, 5>& table() {
        static const std::array<Transition, 5> kTable = {{
            {EntryStatus::DRAFT,  EntryAction::UPDATE,  EntryStatus::DRAFT},
            {EntryStatus::DRAFT,  EntryAction::POST,    EntryStatus::POSTED},
            {EntryStatus::DRAFT,  EntryAction::DELETE,  std::nullopt},
            {EntryStatus::DRAFT,  EntryAction::CANCEL,  EntryStatus::CANCELLED},
            {EntryStatus::POSTED, EntryAction::REVERSE, EntryStatus::REVERSED},
        }};
        return kTable;
    }

    static const Transition* find(EntryStatus from, EntryAction action) {
        for (const auto& transition : table()) {
            if (transition.from == from && transition.action == action) {
                return &transition;
            }
        }
        return nullptr;
    }
};

} // namespace ledger::domain
