#pragma once

#include "domain/JournalEntry.hpp"
#include "domain/JournalBook.hpp"
#include "domain/EntryListing.hpp"
#include "domain/AccountLedger.hpp"
#include "domain/TrialBalance.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace ledger::adapters::primary {

/**
 * @brief JSON-представление проводок и отчётов
 *
 * Суммы выводятся строками ("1234.50"), чтобы потребитель не терял точность.
 */
class LedgerJsonMapper {
public:
    static nlohmann::json toJson(const domain::JournalLine& line) {
        nlohmann::json j;
        j["id"] = line.id;
        j["order_number"] = line.orderNumber;
        j["account_id"] = line.accountId;
        j["description"] = line.description;
        j["debit"] = line.debitAmount.toString();
        j["credit"] = line.creditAmount.toString();
        j["third_party_id"] = optionalToJson(line.thirdPartyId);
        return j;
    }

    static nlohmann::json toJson(const domain::JournalEntry& entry) {
        nlohmann::json j;
        j["id"] = entry.id;
        j["entry_number"] = entry.entryNumber;
        j["voucher_type_id"] = entry.voucherTypeId;
        j["date"] = entry.date.toString();
        j["reference"] = entry.reference;
        j["description"] = entry.description;
        j["currency_id"] = optionalToJson(entry.currencyId);
        j["exchange_rate"] = entry.exchangeRate.toString();
        j["fiscal_period_id"] = entry.fiscalPeriodId;
        j["third_party_id"] = optionalToJson(entry.thirdPartyId);
        j["status"] = domain::toString(entry.status);
        j["total_debit"] = entry.totalDebit().toString();
        j["total_credit"] = entry.totalCredit().toString();
        j["document_type_id"] = optionalToJson(entry.documentTypeId);
        j["document_id"] = optionalToJson(entry.documentId);
        j["is_adjustment"] = entry.isAdjustment;
        j["created_by"] = entry.createdBy;
        j["created_at"] = entry.createdAt.toString();
        j["posted_by"] = optionalToJson(entry.postedBy);
        j["posted_at"] = entry.postedAt ? nlohmann::json(entry.postedAt->toString()) : nlohmann::json();
        j["reversal_of_entry_id"] = optionalToJson(entry.reversalOfEntryId);
        j["reversed_by_entry_id"] = optionalToJson(entry.reversedByEntryId);

        nlohmann::json lines = nlohmann::json::array();
        for (const auto& line : entry.lines()) {
            lines.push_back(toJson(line));
        }
        j["lines"] = lines;
        return j;
    }

    static nlohmann::json toJson(const domain::EntryPage& page) {
        nlohmann::json entries = nlohmann::json::array();
        for (const auto& entry : page.entries) {
            entries.push_back(toJson(entry));
        }

        nlohmann::json j;
        j["entries"] = entries;
        j["total_count"] = page.totalCount;
        return j;
    }

    static nlohmann::json toJson(const domain::JournalBook& book) {
        nlohmann::json entries = nlohmann::json::array();
        for (const auto& bookEntry : book.entries) {
            auto j = toJson(bookEntry.entry);
            j.erase("lines");

            nlohmann::json details = nlohmann::json::array();
            for (const auto& detail : bookEntry.details) {
                auto line = toJson(detail.line);
                line["account_code"] = detail.accountCode;
                line["account_name"] = detail.accountName;
                details.push_back(line);
            }
            j["details"] = details;
            entries.push_back(j);
        }

        nlohmann::json j;
        j["entries"] = entries;
        j["total_count"] = book.totalCount;
        return j;
    }

    static nlohmann::json toJson(const domain::AccountLedger& ledger) {
        nlohmann::json movements = nlohmann::json::array();
        for (const auto& movement : ledger.movements) {
            nlohmann::json m;
            m["entry_id"] = movement.posted.entryId;
            m["entry_number"] = movement.posted.entryNumber;
            m["date"] = movement.posted.date.toString();
            m["reference"] = movement.posted.reference;
            m["description"] = movement.posted.line.description;
            m["debit"] = movement.posted.line.debitAmount.toString();
            m["credit"] = movement.posted.line.creditAmount.toString();
            m["running_balance"] = movement.runningBalance.toString();
            movements.push_back(m);
        }

        nlohmann::json j;
        j["account"] = accountToJson(ledger.account);
        j["opening_balance"] = ledger.openingBalance.toString();
        j["movements"] = movements;
        j["total_debit"] = ledger.totalDebit.toString();
        j["total_credit"] = ledger.totalCredit.toString();
        j["closing_balance"] = ledger.closingBalance.toString();
        return j;
    }

    static nlohmann::json toJson(const domain::TrialBalance& balance) {
        nlohmann::json accounts = nlohmann::json::array();
        for (const auto& row : balance.accounts) {
            auto a = accountToJson(row.account);
            a["total_debit"] = row.totalDebit.toString();
            a["total_credit"] = row.totalCredit.toString();
            a["difference"] = row.difference.toString();
            a["debtor_balance"] = row.debtorBalance.toString();
            a["creditor_balance"] = row.creditorBalance.toString();
            accounts.push_back(a);
        }

        nlohmann::json j;
        j["accounts"] = accounts;
        j["totals"] = {
            {"total_debit", balance.totals.totalDebit.toString()},
            {"total_credit", balance.totals.totalCredit.toString()},
            {"debtor_sum", balance.totals.debtorSum.toString()},
            {"creditor_sum", balance.totals.creditorSum.toString()}
        };
        j["balance_check"] = {
            {"balanced", balance.balanceCheck.balanced},
            {"debit_credit_difference", balance.balanceCheck.debitCreditDifference.toString()},
            {"balance_difference", balance.balanceCheck.balanceDifference.toString()}
        };
        return j;
    }

    /**
     * @brief {"error": ..., "type": ...}; для ConflictError ещё blocking_entry_ids
     */
    static nlohmann::json errorToJson(const std::exception& error) {
        nlohmann::json j;
        j["error"] = error.what();
        j["type"] = errorType(error);
        if (const auto* conflict = dynamic_cast<const domain::ConflictError*>(&error)) {
            j["blocking_entry_ids"] = conflict->blockingEntryIds();
        }
        return j;
    }

    /**
     * @brief Разобрать запрос на создание/изменение проводки
     * @throws ValidationError при неверном JSON, дате или сумме
     */
    static domain::JournalEntryRequest entryRequestFromJson(const std::string& body) {
        try {
            auto j = nlohmann::json::parse(body);

            domain::JournalEntryRequest request;
            if (j.contains("entry_number") && !j["entry_number"].is_null()) {
                request.entryNumber = j["entry_number"].get<std::string>();
            }
            request.voucherTypeId = j.value("voucher_type_id", int64_t{0});
            request.date = domain::CalendarDate::fromString(j.value("date", std::string()));
            request.reference = j.value("reference", std::string());
            request.description = j.value("description", std::string());
            request.currencyId = optionalId(j, "currency_id");
            if (j.contains("exchange_rate")) {
                request.exchangeRate = domain::ExchangeRate::fromString(decimalText(j["exchange_rate"]));
            }
            request.fiscalPeriodId = j.value("fiscal_period_id", int64_t{0});
            request.thirdPartyId = optionalId(j, "third_party_id");
            request.isAdjustment = j.value("is_adjustment", false);
            request.documentTypeId = optionalId(j, "document_type_id");
            request.documentId = optionalId(j, "document_id");

            for (const auto& item : j.value("lines", nlohmann::json::array())) {
                domain::JournalLine line;
                line.accountId = item.value("account_id", int64_t{0});
                line.description = item.value("description", std::string());
                line.debitAmount = domain::Money::fromString(decimalText(item.value("debit", nlohmann::json("0"))));
                line.creditAmount = domain::Money::fromString(decimalText(item.value("credit", nlohmann::json("0"))));
                line.thirdPartyId = optionalId(item, "third_party_id");
                request.lines.push_back(line);
            }
            return request;

        } catch (const nlohmann::json::exception& e) {
            throw domain::ValidationError(std::string("Invalid JSON: ") + e.what());
        } catch (const std::invalid_argument& e) {
            throw domain::ValidationError(e.what());
        }
    }

private:
    template <typename T>
    static nlohmann::json optionalToJson(const std::optional<T>& value) {
        return value ? nlohmann::json(*value) : nlohmann::json();
    }

    static nlohmann::json accountToJson(const domain::Account& account) {
        nlohmann::json j;
        j["account_id"] = account.id;
        j["code"] = account.code;
        j["name"] = account.name;
        j["normal_balance"] = domain::toString(account.normalBalance);
        return j;
    }

    static std::string errorType(const std::exception& error) {
        if (dynamic_cast<const domain::ValidationError*>(&error)) return "validation";
        if (dynamic_cast<const domain::NotFoundError*>(&error)) return "not_found";
        if (dynamic_cast<const domain::InvalidStateError*>(&error)) return "invalid_state";
        if (dynamic_cast<const domain::ConflictError*>(&error)) return "conflict";
        return "internal";
    }

    static std::optional<int64_t> optionalId(const nlohmann::json& j, const char* key) {
        if (!j.contains(key) || j[key].is_null()) {
            return std::nullopt;
        }
        return j[key].get<int64_t>();
    }

    /**
     * @brief Суммы принимаются строкой или числом; число берётся в текстовом виде
     */
    static std::string decimalText(const nlohmann::json& value) {
        return value.is_string() ? value.get<std::string>() : value.dump();
    }
};

} // namespace ledger::adapters::primary
