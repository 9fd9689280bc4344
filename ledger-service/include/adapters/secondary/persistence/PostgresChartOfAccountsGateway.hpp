#pragma once

#include "ports/output/IChartOfAccountsGateway.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>
#include <mutex>

namespace ledger::adapters::secondary {

/**
 * @brief План счетов из chart_of_accounts (только чтение)
 */
class PostgresChartOfAccountsGateway : public ports::output::IChartOfAccountsGateway {
public:
    explicit PostgresChartOfAccountsGateway(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresChartOfAccountsGateway] Connecting..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresChartOfAccountsGateway] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresChartOfAccountsGateway] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresChartOfAccountsGateway() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    std::optional<domain::Account> findById(int64_t accountId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                R"(SELECT id, code, name, balance_type, allows_entries, is_active
                   FROM chart_of_accounts WHERE id = $1)",
                accountId
            );
            txn.commit();

            if (result.empty()) return std::nullopt;
            return rowToAccount(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresChartOfAccountsGateway] findById() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::Account> findAll() override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec(
                R"(SELECT id, code, name, balance_type, allows_entries, is_active
                   FROM chart_of_accounts ORDER BY code)"
            );
            txn.commit();

            std::vector<domain::Account> accounts;
            accounts.reserve(result.size());
            for (const auto& row : result) {
                accounts.push_back(rowToAccount(row));
            }
            return accounts;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresChartOfAccountsGateway] findAll() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    static domain::Account rowToAccount(const pqxx::row& row) {
        domain::Account account;
        account.id = row["id"].as<int64_t>();
        account.code = row["code"].as<std::string>();
        account.name = row["name"].as<std::string>();
        account.normalBalance = domain::normalBalanceFromString(row["balance_type"].as<std::string>());
        account.allowsEntries = row["allows_entries"].as<bool>();
        account.isActive = row["is_active"].as<bool>();
        return account;
    }
};

} // namespace ledger::adapters::secondary
