#pragma once

#include <functional>
#include <string>
#include <tuple>

namespace ledger::domain {

/// Префикс номера зеркальной проводки сторно
inline constexpr const char* kReversalPrefix = "CANC-";

/**
 * @brief Ключ сортировки номера проводки
 *
 * "CANC-CD-000042" -> stem "CD-", counter "42", reversal = true.
 * Счётчик сравнивается численно (CD-999999 < CD-1000000), зеркальная
 * проводка идёт сразу за оригиналом.
 */
struct EntryNumberKey {
    std::string stem;
    bool hasCounter = false;
    std::string counter;  // без ведущих нулей
    bool isReversal = false;

    static EntryNumberKey of(const std::string& entryNumber) {
        EntryNumberKey key;
        const std::string prefix(kReversalPrefix);
        std::string base = entryNumber;
        if (base.compare(0, prefix.size(), prefix) == 0) {
            key.isReversal = true;
            base.erase(0, prefix.size());
        }

        size_t digitsBegin = base.size();
        while (digitsBegin > 0 && base[digitsBegin - 1] >= '0' && base[digitsBegin - 1] <= '9') {
            --digitsBegin;
        }
        key.stem = base.substr(0, digitsBegin);
        key.hasCounter = digitsBegin < base.size();

        size_t significant = base.find_first_not_of('0', digitsBegin);
        key.counter = significant == std::string::npos ? std::string() : base.substr(significant);
        return key;
    }

    bool operator<(const EntryNumberKey& other) const {
        return std::make_tuple(std::cref(stem), hasCounter, counter.size(), std::cref(counter), isReversal) <
               std::make_tuple(std::cref(other.stem), other.hasCounter, other.counter.size(),
                               std::cref(other.counter), other.isReversal);
    }
};

/**
 * @brief Порядок номеров в отчётах; при равных ключах - побайтовое сравнение
 */
inline bool entryNumberLess(const std::string& a, const std::string& b) {
    auto keyA = EntryNumberKey::of(a);
    auto keyB = EntryNumberKey::of(b);
    if (keyA < keyB) {
        return true;
    }
    if (keyB < keyA) {
        return false;
    }
    return a < b;
}

} // namespace ledger::domain
