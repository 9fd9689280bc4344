#pragma once

#include "domain/CalendarDate.hpp"
#include "domain/DateRange.hpp"
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>

namespace ledger::settings {

/**
 * @brief Какой отчёт строит ledger-service и с какими параметрами
 *
 * Читает из ENV:
 * - LEDGER_REPORT (trial-balance | ledger | journal, default: trial-balance)
 * - LEDGER_DATE_FROM / LEDGER_DATE_TO (YYYY-MM-DD, default: без границы)
 * - LEDGER_FISCAL_PERIOD_ID
 * - LEDGER_ACCOUNT_ID (обязателен для ledger)
 * - LEDGER_INCLUDE_ZERO (true/false, default: false)
 * - LEDGER_PAGE_LIMIT (default: без ограничения)
 * - LEDGER_OUTPUT_FILE (default: stdout; диагностика тогда уходит в stderr)
 */
class ReportSettings {
public:
    ReportSettings() {
        if (const char* val = std::getenv("LEDGER_REPORT")) {
            report_ = val;
        }
        if (report_ != "trial-balance" && report_ != "ledger" && report_ != "journal") {
            throw std::invalid_argument("LEDGER_REPORT must be trial-balance, ledger or journal, got " + report_);
        }
        if (const char* val = std::getenv("LEDGER_DATE_FROM")) {
            range_.from = domain::CalendarDate::fromString(val);
        }
        if (const char* val = std::getenv("LEDGER_DATE_TO")) {
            range_.to = domain::CalendarDate::fromString(val);
        }
        if (const char* val = std::getenv("LEDGER_FISCAL_PERIOD_ID")) {
            fiscalPeriodId_ = std::stoll(val);
        }
        if (const char* val = std::getenv("LEDGER_ACCOUNT_ID")) {
            accountId_ = std::stoll(val);
        }
        if (const char* val = std::getenv("LEDGER_INCLUDE_ZERO")) {
            includeZero_ = std::string(val) == "true" || std::string(val) == "1";
        }
        if (const char* val = std::getenv("LEDGER_PAGE_LIMIT")) {
            pageLimit_ = static_cast<size_t>(std::stoul(val));
        }
        outputFile_ = outputFileFromEnvironment();
    }

    /**
     * @brief LEDGER_OUTPUT_FILE; пустая строка - результат в stdout
     */
    static std::string outputFileFromEnvironment() {
        const char* val = std::getenv("LEDGER_OUTPUT_FILE");
        return val ? std::string(val) : std::string();
    }

    const std::string& getReport() const { return report_; }
    const domain::DateRange& getRange() const { return range_; }
    std::optional<int64_t> getFiscalPeriodId() const { return fiscalPeriodId_; }
    std::optional<int64_t> getAccountId() const { return accountId_; }
    bool getIncludeZero() const { return includeZero_; }
    std::optional<size_t> getPageLimit() const { return pageLimit_; }
    const std::string& getOutputFile() const { return outputFile_; }

private:
    std::string report_ = "trial-balance";
    domain::DateRange range_;
    std::optional<int64_t> fiscalPeriodId_;
    std::optional<int64_t> accountId_;
    bool includeZero_ = false;
    std::optional<size_t> pageLimit_;
    std::string outputFile_;
};

} // namespace ledger::settings
