#pragma once

#include "domain/AccountLedger.hpp"
#include "domain/DateRange.hpp"
#include <optional>
#include <cstdint>

namespace ledger::ports::input {

/**
 * @brief Libro Mayor: сальдо и движения по счёту
 */
class IBalanceService {
public:
    virtual ~IBalanceService() = default;

    virtual domain::AccountLedger getLibroMayor(
        int64_t accountId,
        const domain::DateRange& range,
        std::optional<int64_t> fiscalPeriodId) = 0;
};

} // namespace ledger::ports::input
