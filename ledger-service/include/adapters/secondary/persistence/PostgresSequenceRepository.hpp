#pragma once

#include "ports/output/ISequenceRepository.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include <pqxx/pqxx>

namespace ledger::adapters::secondary {

/**
 * @brief Счётчики voucher_types.last_number под SELECT ... FOR UPDATE
 */
class PostgresSequenceRepository : public ports::output::ISequenceRepository {
public:
    explicit PostgresSequenceRepository(pqxx::work& txn) : txn_(txn) {}

    std::optional<domain::VoucherType> findForUpdate(int64_t voucherTypeId) override {
        auto result = txn_.exec_params(
            "SELECT id, code, name, padding, last_number FROM voucher_types WHERE id = $1 FOR UPDATE",
            voucherTypeId
        );
        if (result.empty()) {
            return std::nullopt;
        }

        const auto& row = result[0];
        domain::VoucherType type;
        type.id = row["id"].as<int64_t>();
        type.code = row["code"].as<std::string>();
        type.name = row["name"].as<std::string>();
        type.padding = row["padding"].as<int>();
        type.lastNumber = row["last_number"].as<int64_t>();
        return type;
    }

    void saveLastNumber(int64_t voucherTypeId, int64_t lastNumber) override {
        auto result = txn_.exec_params(
            "UPDATE voucher_types SET last_number = $2 WHERE id = $1",
            voucherTypeId,
            lastNumber
        );
        if (result.affected_rows() == 0) {
            throw domain::NotFoundError("Voucher type " + std::to_string(voucherTypeId) + " not found");
        }
    }

private:
    pqxx::work& txn_;
};

} // namespace ledger::adapters::secondary
