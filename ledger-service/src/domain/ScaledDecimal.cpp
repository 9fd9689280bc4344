#include "domain/ScaledDecimal.hpp"
#include <cctype>
#include <stdexcept>

namespace ledger::domain {

namespace {

bool isDigits(const std::string& s) {
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

int64_t pow10(int scale) {
    int64_t result = 1;
    for (int i = 0; i < scale; ++i) {
        result *= 10;
    }
    return result;
}

} // namespace

int64_t parseScaledDecimal(const std::string& value, int scale) {
    if (value.empty()) {
        throw std::invalid_argument("Empty decimal value");
    }

    bool negative = false;
    size_t pos = 0;
    if (value[0] == '-' || value[0] == '+') {
        negative = value[0] == '-';
        pos = 1;
    }

    std::string body = value.substr(pos);
    auto dot = body.find('.');
    std::string integral = dot == std::string::npos ? body : body.substr(0, dot);
    std::string fraction = dot == std::string::npos ? "" : body.substr(dot + 1);

    if ((integral.empty() && fraction.empty()) || !isDigits(integral) || !isDigits(fraction)) {
        throw std::invalid_argument("Invalid decimal value: " + value);
    }
    if (integral.size() + static_cast<size_t>(scale) > 17) {
        throw std::invalid_argument("Decimal value out of range: " + value);
    }

    int64_t units = integral.empty() ? 0 : std::stoll(integral);
    int64_t minor = 0;
    for (int i = 0; i < scale; ++i) {
        minor = minor * 10 + (i < static_cast<int>(fraction.size()) ? fraction[i] - '0' : 0);
    }
    if (static_cast<int>(fraction.size()) > scale && fraction[scale] >= '5') {
        ++minor;
    }

    int64_t total = units * pow10(scale) + minor;
    return negative ? -total : total;
}

std::string formatScaledDecimal(int64_t scaled, int scale) {
    int64_t factor = pow10(scale);
    int64_t absolute = scaled < 0 ? -scaled : scaled;

    std::string result = (scaled < 0 ? "-" : "") + std::to_string(absolute / factor);
    if (scale > 0) {
        std::string fraction = std::to_string(absolute % factor);
        fraction.insert(0, scale - fraction.size(), '0');
        result += "." + fraction;
    }
    return result;
}

} // namespace ledger::domain
