#pragma once

#include <string>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Тип документа-проводки (voucher type) и его счётчик номеров
 *
 * lastNumber - единственное изменяемое состояние нумерации.
 */
struct VoucherType {
    int64_t id = 0;
    std::string code;     ///< Префикс номера: "CD" -> "CD-000001"
    std::string name;
    int padding = 6;
    int64_t lastNumber = 0;
};

} // namespace ledger::domain
