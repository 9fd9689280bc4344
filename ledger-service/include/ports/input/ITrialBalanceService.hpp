#pragma once

#include "domain/TrialBalance.hpp"
#include "domain/DateRange.hpp"
#include <optional>
#include <cstdint>

namespace ledger::ports::input {

/**
 * @brief Balance de Comprobación
 */
class ITrialBalanceService {
public:
    virtual ~ITrialBalanceService() = default;

    virtual domain::TrialBalance getBalanceComprobacion(
        const domain::DateRange& range,
        std::optional<int64_t> fiscalPeriodId,
        bool includeZeroBalances) = 0;
};

} // namespace ledger::ports::input
