#pragma once

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace ledger::settings {

/**
 * @brief Подключение к PostgreSQL
 *
 * Читает из ENV:
 * - LEDGER_DB_HOST (default: ledger-postgres)
 * - LEDGER_DB_PORT (1..65535, default: 5432)
 * - LEDGER_DB_NAME (default: ledger_db)
 * - LEDGER_DB_USER (default: ledger_user)
 * - LEDGER_DB_PASSWORD
 * - LEDGER_DB_CONNECT_TIMEOUT (секунды, default: 10)
 */
class DbSettings {
public:
    DbSettings() {
        host_ = requireNonEmpty("LEDGER_DB_HOST", getEnvOrDefault("LEDGER_DB_HOST", "ledger-postgres"));
        port_ = parseBounded("LEDGER_DB_PORT", getEnvOrDefault("LEDGER_DB_PORT", "5432"), 1, 65535);
        name_ = requireNonEmpty("LEDGER_DB_NAME", getEnvOrDefault("LEDGER_DB_NAME", "ledger_db"));
        user_ = requireNonEmpty("LEDGER_DB_USER", getEnvOrDefault("LEDGER_DB_USER", "ledger_user"));
        password_ = getEnvOrDefault("LEDGER_DB_PASSWORD", "ledger_secret_password");
        connectTimeout_ = parseBounded(
            "LEDGER_DB_CONNECT_TIMEOUT", getEnvOrDefault("LEDGER_DB_CONNECT_TIMEOUT", "10"), 1, 3600);
    }

    const std::string& getHost() const { return host_; }
    int getPort() const { return port_; }
    const std::string& getName() const { return name_; }
    const std::string& getUser() const { return user_; }
    int getConnectTimeout() const { return connectTimeout_; }

    /**
     * @brief Строка подключения libpq; значения в кавычках
     */
    std::string getConnectionString() const {
        return "host=" + quote(host_) +
               " port=" + std::to_string(port_) +
               " dbname=" + quote(name_) +
               " user=" + quote(user_) +
               " password=" + quote(password_) +
               " connect_timeout=" + std::to_string(connectTimeout_);
    }

private:
    std::string host_;
    int port_ = 5432;
    std::string name_;
    std::string user_;
    std::string password_;
    int connectTimeout_ = 10;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }

    static std::string requireNonEmpty(const char* name, std::string value) {
        if (value.empty()) {
            throw std::invalid_argument(std::string(name) + " must not be empty");
        }
        return value;
    }

    static int parseBounded(const char* name, const std::string& value, int min, int max) {
        size_t parsed = 0;
        int number = 0;
        try {
            number = std::stoi(value, &parsed);
        } catch (const std::exception&) {
            throw std::invalid_argument(std::string(name) + " must be a number, got '" + value + "'");
        }
        if (parsed != value.size() || number < min || number > max) {
            throw std::invalid_argument(std::string(name) + " must be in " + std::to_string(min) + ".." +
                                        std::to_string(max) + ", got '" + value + "'");
        }
        return number;
    }

    // libpq: 'value' с экранированием \ и '
    static std::string quote(const std::string& value) {
        std::string quoted = "'";
        for (char c : value) {
            if (c == '\\' || c == '\'') {
                quoted.push_back('\\');
            }
            quoted.push_back(c);
        }
        quoted.push_back('\'');
        return quoted;
    }
};

} // namespace ledger::settings
