#pragma once

#include "domain/FiscalPeriod.hpp"
#include <optional>
#include <cstdint>

namespace ledger::ports::output {

class IFiscalPeriodGateway {
public:
    virtual ~IFiscalPeriodGateway() = default;
    virtual std::optional<domain::FiscalPeriod> findById(int64_t periodId) = 0;
};

} // namespace ledger::ports::output
