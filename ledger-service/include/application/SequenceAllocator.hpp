#pragma once

#include "ports/output/IUnitOfWork.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include <iostream>
#include <string>
#include <cstdint>

namespace ledger::application {

/**
 * @brief Выдача номеров проводок по типу без пропусков и повторов
 *
 * Счётчик читается с блокировкой строки типа в той же единице работы,
 * что вставляет заголовок. Откат единицы возвращает номер: следующий
 * вызывающий получит его же.
 */
class SequenceAllocator {
public:
    SequenceAllocator() {
        std::cout << "[SequenceAllocator] Created" << std::endl;
    }

    /**
     * @brief Следующий номер для типа
     * @throws NotFoundError если тип не настроен
     */
    std::string nextNumber(ports::output::IUnitOfWork& uow, int64_t voucherTypeId) {
        auto type = uow.sequences().findForUpdate(voucherTypeId);
        if (!type) {
            throw domain::NotFoundError("Voucher type " + std::to_string(voucherTypeId) + " not found");
        }

        // Ручной номер мог занять очередное значение счётчика: пропускаем его
        int64_t next = type->lastNumber + 1;
        std::string number = format(type->code, type->padding, next);
        while (uow.entries().existsByNumber(voucherTypeId, number)) {
            number = format(type->code, type->padding, ++next);
        }

        uow.sequences().saveLastNumber(voucherTypeId, next);
        return number;
    }

    /**
     * @brief "CD" + 6 + 42 -> "CD-000042"
     */
    static std::string format(const std::string& code, int padding, int64_t counter) {
        std::string digits = std::to_string(counter);
        if (static_cast<int>(digits.size()) < padding) {
            digits.insert(0, padding - digits.size(), '0');
        }
        return code.empty() ? digits : code + "-" + digits;
    }
};

} // namespace ledger::application
