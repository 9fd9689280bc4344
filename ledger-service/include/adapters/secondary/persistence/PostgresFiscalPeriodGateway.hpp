#pragma once

#include "ports/output/IFiscalPeriodGateway.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>
#include <mutex>

namespace ledger::adapters::secondary {

class PostgresFiscalPeriodGateway : public ports::output::IFiscalPeriodGateway {
public:
    explicit PostgresFiscalPeriodGateway(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresFiscalPeriodGateway] Connecting..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresFiscalPeriodGateway] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresFiscalPeriodGateway] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresFiscalPeriodGateway() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    std::optional<domain::FiscalPeriod> findById(int64_t periodId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                "SELECT id, name, start_date, end_date, is_closed FROM fiscal_periods WHERE id = $1",
                periodId
            );
            txn.commit();

            if (result.empty()) return std::nullopt;

            const auto& row = result[0];
            domain::FiscalPeriod period;
            period.id = row["id"].as<int64_t>();
            period.name = row["name"].as<std::string>();
            period.startDate = domain::CalendarDate::fromString(row["start_date"].as<std::string>());
            period.endDate = domain::CalendarDate::fromString(row["end_date"].as<std::string>());
            period.isClosed = row["is_closed"].as<bool>();
            return period;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresFiscalPeriodGateway] findById() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;
};

} // namespace ledger::adapters::secondary
