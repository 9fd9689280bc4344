#pragma once

#include "ports/output/ISequenceRepository.hpp"
#include "adapters/secondary/persistence/InMemoryLedgerStore.hpp"
#include "domain/errors/LedgerErrors.hpp"

namespace ledger::adapters::secondary {

/**
 * @brief Счётчики номеров; блокировку даёт mutex хранилища, который держит единица работы
 */
class InMemorySequenceRepository : public ports::output::ISequenceRepository {
public:
    explicit InMemorySequenceRepository(LedgerState& state) : state_(state) {}

    std::optional<domain::VoucherType> findForUpdate(int64_t voucherTypeId) override {
        auto it = state_.voucherTypes.find(voucherTypeId);
        return it != state_.voucherTypes.end() ? std::optional(it->second) : std::nullopt;
    }

    void saveLastNumber(int64_t voucherTypeId, int64_t lastNumber) override {
        auto it = state_.voucherTypes.find(voucherTypeId);
        if (it == state_.voucherTypes.end()) {
            throw domain::NotFoundError("Voucher type " + std::to_string(voucherTypeId) + " not found");
        }
        it->second.lastNumber = lastNumber;
    }

private:
    LedgerState& state_;
};

} // namespace ledger::adapters::secondary
