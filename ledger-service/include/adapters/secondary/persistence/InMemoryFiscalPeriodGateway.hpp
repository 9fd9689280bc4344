#pragma once

#include "ports/output/IFiscalPeriodGateway.hpp"
#include <ThreadSafeMap.hpp>

namespace ledger::adapters::secondary {

class InMemoryFiscalPeriodGateway : public ports::output::IFiscalPeriodGateway {
public:
    void save(const domain::FiscalPeriod& period) {
        periods_.insert(period.id, std::make_shared<domain::FiscalPeriod>(period));
    }

    std::optional<domain::FiscalPeriod> findById(int64_t periodId) override {
        auto period = periods_.find(periodId);
        return period ? std::optional(*period) : std::nullopt;
    }

private:
    ThreadSafeMap<int64_t, domain::FiscalPeriod> periods_;
};

} // namespace ledger::adapters::secondary
