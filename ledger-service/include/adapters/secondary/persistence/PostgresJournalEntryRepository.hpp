#pragma once

#include "ports/output/IJournalEntryRepository.hpp"
#include "adapters/secondary/persistence/PostgresLedgerRows.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include <pqxx/pqxx>
#include <iostream>

namespace ledger::adapters::secondary {

/**
 * @brief Проводки внутри транзакции единицы работы
 *
 * Транзакцией владеет PostgresUnitOfWork; репозиторий её не фиксирует.
 */
class PostgresJournalEntryRepository : public ports::output::IJournalEntryRepository {
public:
    explicit PostgresJournalEntryRepository(pqxx::work& txn) : txn_(txn) {}

    std::optional<domain::JournalEntry> findByIdForUpdate(int64_t entryId) override {
        auto result = txn_.exec_params(
            std::string("SELECT ") + PostgresLedgerRows::kEntryColumns +
            " FROM journal_entries e WHERE e.id = $1 FOR UPDATE",
            entryId
        );
        if (result.empty()) {
            return std::nullopt;
        }
        return PostgresLedgerRows::loadEntry(txn_, result[0]);
    }

    std::vector<domain::JournalEntry> findByDocumentForUpdate(int64_t documentTypeId, int64_t documentId) override {
        auto result = txn_.exec_params(
            std::string("SELECT ") + PostgresLedgerRows::kEntryColumns +
            " FROM journal_entries e WHERE e.document_type_id = $1 AND e.document_id = $2"
            " ORDER BY e.id FOR UPDATE",
            documentTypeId,
            documentId
        );

        std::vector<domain::JournalEntry> entries;
        for (const auto& row : result) {
            entries.push_back(PostgresLedgerRows::loadEntry(txn_, row));
        }
        return entries;
    }

    bool existsByNumber(int64_t voucherTypeId, const std::string& entryNumber) override {
        auto result = txn_.exec_params(
            "SELECT 1 FROM journal_entries WHERE voucher_type_id = $1 AND entry_number = $2",
            voucherTypeId,
            entryNumber
        );
        return !result.empty();
    }

    bool existsForDocument(int64_t documentTypeId, int64_t documentId, int64_t voucherTypeId) override {
        auto result = txn_.exec_params(
            R"(
                SELECT 1 FROM journal_entries
                WHERE document_type_id = $1 AND document_id = $2 AND voucher_type_id = $3
            )",
            documentTypeId,
            documentId,
            voucherTypeId
        );
        return !result.empty();
    }

    int64_t insert(const domain::JournalEntry& entry) override {
        try {
            auto row = txn_.exec_params1(
                R"(
                    INSERT INTO journal_entries (
                        entry_number, voucher_type_id, entry_date, reference, description,
                        currency_id, exchange_rate_micros, fiscal_period_id, third_party_id, status,
                        total_debit, total_credit, document_type_id, document_id, is_adjustment,
                        created_by, created_at, posted_by, posted_at, cancelled_by,
                        cancellation_reason, reversal_of_entry_id, reversed_by_entry_id
                    )
                    VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15,
                            $16, $17, $18, $19, $20, $21, $22, $23)
                    RETURNING id
                )",
                entry.entryNumber,
                entry.voucherTypeId,
                entry.date.toString(),
                entry.reference,
                entry.description,
                entry.currencyId,
                entry.exchangeRate.micros(),
                entry.fiscalPeriodId,
                entry.thirdPartyId,
                domain::toString(entry.status),
                entry.totalDebit().cents(),
                entry.totalCredit().cents(),
                entry.documentTypeId,
                entry.documentId,
                entry.isAdjustment,
                entry.createdBy,
                entry.createdAt.toString(),
                entry.postedBy,
                PostgresLedgerRows::optionalTimestamp(entry.postedAt),
                entry.cancelledBy,
                entry.cancellationReason,
                entry.reversalOfEntryId,
                entry.reversedByEntryId
            );

            int64_t id = row[0].as<int64_t>();
            insertLines(id, entry.lines());
            return id;

        } catch (const pqxx::unique_violation& e) {
            std::cerr << "[PostgresJournalEntryRepository] insert() conflict: " << e.what() << std::endl;
            throw domain::ConflictError("Entry " + entry.entryNumber + " conflicts with an existing entry");
        }
    }

    void update(const domain::JournalEntry& entry) override {
        try {
            updateHeader(entry);
            txn_.exec_params("DELETE FROM journal_entry_lines WHERE entry_id = $1", entry.id);
            insertLines(entry.id, entry.lines());

        } catch (const pqxx::unique_violation& e) {
            std::cerr << "[PostgresJournalEntryRepository] update() conflict: " << e.what() << std::endl;
            throw domain::ConflictError("Entry " + entry.entryNumber + " conflicts with an existing entry");
        }
    }

    void updateHeader(const domain::JournalEntry& entry) override {
        auto result = txn_.exec_params(
            R"(
                UPDATE journal_entries SET
                    entry_number = $2, entry_date = $3, reference = $4, description = $5,
                    currency_id = $6, exchange_rate_micros = $7, fiscal_period_id = $8,
                    third_party_id = $9, status = $10, total_debit = $11, total_credit = $12,
                    is_adjustment = $13, posted_by = $14, posted_at = $15, cancelled_by = $16,
                    cancellation_reason = $17, reversed_by_entry_id = $18
                WHERE id = $1
            )",
            entry.id,
            entry.entryNumber,
            entry.date.toString(),
            entry.reference,
            entry.description,
            entry.currencyId,
            entry.exchangeRate.micros(),
            entry.fiscalPeriodId,
            entry.thirdPartyId,
            domain::toString(entry.status),
            entry.totalDebit().cents(),
            entry.totalCredit().cents(),
            entry.isAdjustment,
            entry.postedBy,
            PostgresLedgerRows::optionalTimestamp(entry.postedAt),
            entry.cancelledBy,
            entry.cancellationReason,
            entry.reversedByEntryId
        );

        if (result.affected_rows() == 0) {
            throw domain::NotFoundError("Journal entry " + std::to_string(entry.id) + " not found");
        }
    }

    void remove(int64_t entryId) override {
        // Строки удаляются каскадом
        auto result = txn_.exec_params("DELETE FROM journal_entries WHERE id = $1", entryId);
        if (result.affected_rows() == 0) {
            throw domain::NotFoundError("Journal entry " + std::to_string(entryId) + " not found");
        }
    }

private:
    pqxx::work& txn_;

    void insertLines(int64_t entryId, const std::vector<domain::JournalLine>& lines) {
        for (const auto& line : lines) {
            txn_.exec_params(
                R"(
                    INSERT INTO journal_entry_lines (
                        entry_id, order_number, account_id, description,
                        debit_amount, credit_amount, third_party_id
                    )
                    VALUES ($1, $2, $3, $4, $5, $6, $7)
                )",
                entryId,
                line.orderNumber,
                line.accountId,
                line.description,
                line.debitAmount.cents(),
                line.creditAmount.cents(),
                line.thirdPartyId
            );
        }
    }
};

} // namespace ledger::adapters::secondary
