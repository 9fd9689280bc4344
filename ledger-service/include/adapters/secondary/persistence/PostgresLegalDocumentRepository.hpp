#pragma once

#include "ports/output/ILegalDocumentRepository.hpp"
#include "adapters/secondary/persistence/PostgresLedgerRows.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include <pqxx/pqxx>

namespace ledger::adapters::secondary {

class PostgresLegalDocumentRepository : public ports::output::ILegalDocumentRepository {
public:
    explicit PostgresLegalDocumentRepository(pqxx::work& txn) : txn_(txn) {}

    std::optional<domain::LegalDocument> findByIdForUpdate(int64_t documentId) override {
        auto result = txn_.exec_params(
            R"(
                SELECT id, document_type_id, document_number, reference, status, document_date,
                       total_amount, currency_id, exchange_rate_micros, fiscal_period_id,
                       third_party_id, cancellation_reason, cancelled_by
                FROM legal_documents WHERE id = $1 FOR UPDATE
            )",
            documentId
        );
        if (result.empty()) {
            return std::nullopt;
        }
        return rowToDocument(result[0]);
    }

    void update(const domain::LegalDocument& document) override {
        auto result = txn_.exec_params(
            R"(
                UPDATE legal_documents SET
                    status = $2,
                    cancellation_reason = $3,
                    cancelled_by = $4,
                    cancelled_at = CASE WHEN $2 = 'cancelled' THEN (NOW() AT TIME ZONE 'UTC') ELSE cancelled_at END
                WHERE id = $1
            )",
            document.id,
            domain::toString(document.status),
            document.cancellationReason,
            document.cancelledBy
        );
        if (result.affected_rows() == 0) {
            throw domain::NotFoundError("Document " + std::to_string(document.id) + " not found");
        }
    }

    void appendStatusChange(const domain::DocumentStatusChange& change) override {
        txn_.exec_params(
            R"(
                INSERT INTO legal_document_status_history
                    (document_id, previous_status, new_status, actor_id, comment, changed_at)
                VALUES ($1, $2, $3, $4, $5, $6)
            )",
            change.documentId,
            domain::toString(change.previousStatus),
            domain::toString(change.newStatus),
            change.actorId,
            change.comment,
            change.changedAt.toString()
        );
    }

private:
    pqxx::work& txn_;

    static domain::LegalDocument rowToDocument(const pqxx::row& row) {
        domain::LegalDocument document;
        document.id = row["id"].as<int64_t>();
        document.documentTypeId = row["document_type_id"].as<int64_t>();
        document.documentNumber = row["document_number"].as<std::string>();
        document.reference = row["reference"].as<std::string>();
        document.status = domain::documentStatusFromString(row["status"].as<std::string>());
        document.date = domain::CalendarDate::fromString(row["document_date"].as<std::string>());
        document.totalAmount = domain::Money::fromCents(row["total_amount"].as<int64_t>());
        document.currencyId = PostgresLedgerRows::optionalId(row["currency_id"]);
        document.exchangeRate = domain::ExchangeRate::fromMicros(row["exchange_rate_micros"].as<int64_t>());
        document.fiscalPeriodId = row["fiscal_period_id"].as<int64_t>();
        document.thirdPartyId = PostgresLedgerRows::optionalId(row["third_party_id"]);
        document.cancellationReason = row["cancellation_reason"].as<std::string>();
        document.cancelledBy = PostgresLedgerRows::optionalId(row["cancelled_by"]);
        return document;
    }
};

} // namespace ledger::adapters::secondary
