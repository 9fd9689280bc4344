#pragma once

#include "domain/JournalEntry.hpp"
#include "domain/enums/EntryStatus.hpp"
#include <pqxx/pqxx>
#include <optional>
#include <string>
#include <vector>

namespace ledger::adapters::secondary {

/**
 * @brief Общие колонки и преобразования строк результата для журналов
 */
class PostgresLedgerRows {
public:
    static constexpr const char* kEntryColumns = R"(
        e.id, e.entry_number, e.voucher_type_id, e.entry_date, e.reference, e.description,
        e.currency_id, e.exchange_rate_micros, e.fiscal_period_id, e.third_party_id, e.status,
        e.document_type_id, e.document_id, e.is_adjustment, e.created_by, e.created_at,
        e.posted_by, e.posted_at, e.cancelled_by, e.cancellation_reason,
        e.reversal_of_entry_id, e.reversed_by_entry_id
    )";

    /**
     * @brief ORDER BY номера, как domain::entryNumberLess (префикс CANC- снимается,
     *        хвостовой счётчик сравнивается численно)
     */
    static constexpr const char* kEntryNumberOrder = R"(
        regexp_replace(regexp_replace(e.entry_number, '^CANC-', ''), '[0-9]+$', '') COLLATE "C" ASC,
        substring(regexp_replace(e.entry_number, '^CANC-', '') from '[0-9]+$')::numeric ASC NULLS FIRST,
        (e.entry_number LIKE 'CANC-%') ASC,
        e.entry_number COLLATE "C" ASC
    )";

    /**
     * @brief Заголовок без строк (строки догружаются loadLines)
     */
    static domain::JournalEntry rowToEntryHeader(const pqxx::row& row) {
        domain::JournalEntry entry;
        entry.id = row["id"].as<int64_t>();
        entry.entryNumber = row["entry_number"].as<std::string>();
        entry.voucherTypeId = row["voucher_type_id"].as<int64_t>();
        entry.date = domain::CalendarDate::fromString(row["entry_date"].as<std::string>());
        entry.reference = row["reference"].as<std::string>();
        entry.description = row["description"].as<std::string>();
        entry.currencyId = optionalId(row["currency_id"]);
        entry.exchangeRate = domain::ExchangeRate::fromMicros(row["exchange_rate_micros"].as<int64_t>());
        entry.fiscalPeriodId = row["fiscal_period_id"].as<int64_t>();
        entry.thirdPartyId = optionalId(row["third_party_id"]);
        entry.status = domain::entryStatusFromString(row["status"].as<std::string>());
        entry.documentTypeId = optionalId(row["document_type_id"]);
        entry.documentId = optionalId(row["document_id"]);
        entry.isAdjustment = row["is_adjustment"].as<bool>();
        entry.createdBy = row["created_by"].as<int64_t>();
        entry.createdAt = domain::Timestamp::fromString(row["created_at"].as<std::string>());
        entry.postedBy = optionalId(row["posted_by"]);
        if (!row["posted_at"].is_null()) {
            entry.postedAt = domain::Timestamp::fromString(row["posted_at"].as<std::string>());
        }
        entry.cancelledBy = optionalId(row["cancelled_by"]);
        entry.cancellationReason = row["cancellation_reason"].as<std::string>();
        entry.reversalOfEntryId = optionalId(row["reversal_of_entry_id"]);
        entry.reversedByEntryId = optionalId(row["reversed_by_entry_id"]);
        return entry;
    }

    static domain::JournalLine rowToLine(const pqxx::row& row) {
        domain::JournalLine line;
        line.id = row["id"].as<int64_t>();
        line.entryId = row["entry_id"].as<int64_t>();
        line.orderNumber = row["order_number"].as<int>();
        line.accountId = row["account_id"].as<int64_t>();
        line.description = row["description"].as<std::string>();
        line.debitAmount = domain::Money::fromCents(row["debit_amount"].as<int64_t>());
        line.creditAmount = domain::Money::fromCents(row["credit_amount"].as<int64_t>());
        line.thirdPartyId = optionalId(row["third_party_id"]);
        return line;
    }

    static std::vector<domain::JournalLine> loadLines(pqxx::transaction_base& txn, int64_t entryId) {
        auto result = txn.exec_params(
            R"(
                SELECT id, entry_id, order_number, account_id, description,
                       debit_amount, credit_amount, third_party_id
                FROM journal_entry_lines
                WHERE entry_id = $1
                ORDER BY order_number
            )",
            entryId
        );

        std::vector<domain::JournalLine> lines;
        lines.reserve(result.size());
        for (const auto& row : result) {
            lines.push_back(rowToLine(row));
        }
        return lines;
    }

    /**
     * @brief Заголовок + строки
     */
    static domain::JournalEntry loadEntry(pqxx::transaction_base& txn, const pqxx::row& row) {
        auto entry = rowToEntryHeader(row);
        entry.setLines(loadLines(txn, entry.id));
        return entry;
    }

    static std::optional<int64_t> optionalId(const pqxx::field& field) {
        if (field.is_null()) {
            return std::nullopt;
        }
        return field.as<int64_t>();
    }

    static std::optional<std::string> optionalTimestamp(const std::optional<domain::Timestamp>& ts) {
        if (!ts) {
            return std::nullopt;
        }
        return ts->toString();
    }
};

} // namespace ledger::adapters::secondary
