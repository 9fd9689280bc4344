#pragma once

#include "domain/CalendarDate.hpp"
#include "domain/enums/EntryStatus.hpp"
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>

namespace ledger::settings {

/**
 * @brief Какую операцию выполняет ledger-service за один запуск
 *
 * Читает из ENV:
 * - LEDGER_COMMAND (default: report)
 * - LEDGER_ACTOR_ID (default: 0)
 * - LEDGER_ENTRY_ID, LEDGER_DOCUMENT_ID, LEDGER_VOUCHER_TYPE_ID
 * - LEDGER_INPUT_FILE - JSON проводки для create-entry / update-entry
 * - LEDGER_REASON - причина сторно или аннулирования
 * - LEDGER_REVERSAL_DATE, LEDGER_REVERSAL_PERIOD_ID
 * - LEDGER_STATUS, LEDGER_ENTRY_NUMBER_PREFIX, LEDGER_THIRD_PARTY_ID,
 *   LEDGER_PAGE_OFFSET - фильтр list-entries (даты, период и лимит - из ReportSettings)
 * - LEDGER_MAPPING_DOCUMENT_TYPE_ID, LEDGER_MAPPING_DEBIT_ACCOUNT_ID,
 *   LEDGER_MAPPING_CREDIT_ACCOUNT_ID, LEDGER_MAPPING_POST_IMMEDIATELY -
 *   двухстрочный маппинг документа для generate-voucher
 */
class CommandSettings {
public:
    CommandSettings() {
        static const std::set<std::string> kCommands = {
            "report", "get-entry", "list-entries", "create-entry", "update-entry", "post-entry",
            "reverse-entry", "delete-entry", "generate-voucher", "cancel-document"
        };

        if (const char* val = std::getenv("LEDGER_COMMAND")) {
            command_ = val;
        }
        if (kCommands.count(command_) == 0) {
            throw std::invalid_argument("Unknown LEDGER_COMMAND: " + command_);
        }

        actorId_ = std::stoll(getEnvOrDefault("LEDGER_ACTOR_ID", "0"));
        entryId_ = optionalId("LEDGER_ENTRY_ID");
        documentId_ = optionalId("LEDGER_DOCUMENT_ID");
        voucherTypeId_ = optionalId("LEDGER_VOUCHER_TYPE_ID");
        inputFile_ = getEnvOrDefault("LEDGER_INPUT_FILE", "");
        reason_ = getEnvOrDefault("LEDGER_REASON", "");

        if (const char* val = std::getenv("LEDGER_REVERSAL_DATE")) {
            reversalDate_ = domain::CalendarDate::fromString(val);
        }
        reversalPeriodId_ = optionalId("LEDGER_REVERSAL_PERIOD_ID");

        if (const char* val = std::getenv("LEDGER_STATUS")) {
            if (*val) {
                status_ = domain::entryStatusFromString(val);
            }
        }
        entryNumberPrefix_ = getEnvOrDefault("LEDGER_ENTRY_NUMBER_PREFIX", "");
        thirdPartyId_ = optionalId("LEDGER_THIRD_PARTY_ID");
        pageOffset_ = static_cast<size_t>(std::stoul(getEnvOrDefault("LEDGER_PAGE_OFFSET", "0")));

        mappingDocumentTypeId_ = optionalId("LEDGER_MAPPING_DOCUMENT_TYPE_ID");
        mappingDebitAccountId_ = optionalId("LEDGER_MAPPING_DEBIT_ACCOUNT_ID");
        mappingCreditAccountId_ = optionalId("LEDGER_MAPPING_CREDIT_ACCOUNT_ID");
        std::string post = getEnvOrDefault("LEDGER_MAPPING_POST_IMMEDIATELY", "false");
        mappingPostImmediately_ = post == "true" || post == "1";
    }

    const std::string& getCommand() const { return command_; }
    bool isReport() const { return command_ == "report"; }
    int64_t getActorId() const { return actorId_; }
    std::optional<int64_t> getEntryId() const { return entryId_; }
    std::optional<int64_t> getDocumentId() const { return documentId_; }
    std::optional<int64_t> getVoucherTypeId() const { return voucherTypeId_; }
    const std::string& getInputFile() const { return inputFile_; }
    const std::string& getReason() const { return reason_; }
    std::optional<domain::CalendarDate> getReversalDate() const { return reversalDate_; }
    std::optional<int64_t> getReversalPeriodId() const { return reversalPeriodId_; }

    std::optional<domain::EntryStatus> getStatus() const { return status_; }
    const std::string& getEntryNumberPrefix() const { return entryNumberPrefix_; }
    std::optional<int64_t> getThirdPartyId() const { return thirdPartyId_; }
    size_t getPageOffset() const { return pageOffset_; }

    /**
     * @brief Маппинг задан, только если указаны тип документа и оба счёта
     */
    bool hasMapping() const {
        return mappingDocumentTypeId_ && mappingDebitAccountId_ && mappingCreditAccountId_;
    }
    int64_t getMappingDocumentTypeId() const { return mappingDocumentTypeId_.value_or(0); }
    int64_t getMappingDebitAccountId() const { return mappingDebitAccountId_.value_or(0); }
    int64_t getMappingCreditAccountId() const { return mappingCreditAccountId_.value_or(0); }
    bool getMappingPostImmediately() const { return mappingPostImmediately_; }

private:
    std::string command_ = "report";
    int64_t actorId_ = 0;
    std::optional<int64_t> entryId_;
    std::optional<int64_t> documentId_;
    std::optional<int64_t> voucherTypeId_;
    std::string inputFile_;
    std::string reason_;
    std::optional<domain::CalendarDate> reversalDate_;
    std::optional<int64_t> reversalPeriodId_;
    std::optional<domain::EntryStatus> status_;
    std::string entryNumberPrefix_;
    std::optional<int64_t> thirdPartyId_;
    size_t pageOffset_ = 0;
    std::optional<int64_t> mappingDocumentTypeId_;
    std::optional<int64_t> mappingDebitAccountId_;
    std::optional<int64_t> mappingCreditAccountId_;
    bool mappingPostImmediately_ = false;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }

    static std::optional<int64_t> optionalId(const char* name) {
        const char* value = std::getenv(name);
        if (!value || !*value) {
            return std::nullopt;
        }
        return std::stoll(value);
    }
};

} // namespace ledger::settings
