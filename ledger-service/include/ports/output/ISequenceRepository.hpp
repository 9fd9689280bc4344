#pragma once

#include "domain/VoucherType.hpp"
#include <optional>
#include <cstdint>

namespace ledger::ports::output {

/**
 * @brief Счётчики номеров по типам проводок
 */
class ISequenceRepository {
public:
    virtual ~ISequenceRepository() = default;

    /**
     * @brief Прочитать тип с блокировкой строки счётчика
     *
     * Параллельные единицы работы для того же типа ждут здесь до commit/rollback.
     */
    virtual std::optional<domain::VoucherType> findForUpdate(int64_t voucherTypeId) = 0;

    virtual void saveLastNumber(int64_t voucherTypeId, int64_t lastNumber) = 0;
};

} // namespace ledger::ports::output
