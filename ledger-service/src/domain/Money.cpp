#include "domain/Money.hpp"
#include "domain/ScaledDecimal.hpp"

namespace ledger::domain {

Money Money::fromString(const std::string& value) {
    return fromCents(parseScaledDecimal(value, kScale));
}

std::string Money::toString() const {
    return formatScaledDecimal(cents_, kScale);
}

} // namespace ledger::domain
