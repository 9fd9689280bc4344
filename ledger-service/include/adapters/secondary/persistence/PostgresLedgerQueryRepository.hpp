#pragma once

#include "ports/output/ILedgerQueryRepository.hpp"
#include "adapters/secondary/persistence/PostgresLedgerRows.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>
#include <mutex>

namespace ledger::adapters::secondary {

/**
 * @brief Отчётные выборки PostgreSQL (Libro Diario, Libro Mayor, Balance de Comprobación)
 *
 * Необязательные фильтры передаются NULL-параметрами:
 * ($n::type IS NULL OR column = $n).
 */
class PostgresLedgerQueryRepository : public ports::output::ILedgerQueryRepository {
public:
    explicit PostgresLedgerQueryRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresLedgerQueryRepository] Connecting..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresLedgerQueryRepository] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerQueryRepository] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresLedgerQueryRepository() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    std::optional<domain::JournalEntry> findEntryById(int64_t entryId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                std::string("SELECT ") + PostgresLedgerRows::kEntryColumns +
                " FROM journal_entries e WHERE e.id = $1",
                entryId
            );
            if (result.empty()) {
                txn.commit();
                return std::nullopt;
            }
            auto entry = PostgresLedgerRows::loadEntry(txn, result[0]);
            txn.commit();
            return entry;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerQueryRepository] findEntryById() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::JournalEntry> findEntries(const domain::EntryFilter& filter) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            std::optional<int64_t> limit;
            if (filter.limit) {
                limit = static_cast<int64_t>(*filter.limit);
            }

            auto result = txn.exec_params(
                std::string("SELECT ") + PostgresLedgerRows::kEntryColumns +
                " FROM journal_entries e WHERE " + kEntryFilter +
                " ORDER BY e.entry_date ASC, " + PostgresLedgerRows::kEntryNumberOrder + ", e.id ASC"
                " LIMIT $9::bigint OFFSET $10::bigint",
                dateParam(filter.range.from),
                dateParam(filter.range.to),
                statusParam(filter.status),
                filter.voucherTypeId,
                filter.fiscalPeriodId,
                filter.thirdPartyId,
                likePrefix(filter.entryNumberPrefix),
                filter.entryNumberPrefix.empty(),
                limit,
                static_cast<int64_t>(filter.offset)
            );

            std::vector<domain::JournalEntry> entries;
            entries.reserve(result.size());
            for (const auto& row : result) {
                entries.push_back(PostgresLedgerRows::loadEntry(txn, row));
            }
            txn.commit();
            return entries;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerQueryRepository] findEntries() failed: " << e.what() << std::endl;
            throw;
        }
    }

    int64_t countEntries(const domain::EntryFilter& filter) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto row = txn.exec_params1(
                std::string("SELECT COUNT(*) FROM journal_entries e WHERE ") + kEntryFilter,
                dateParam(filter.range.from),
                dateParam(filter.range.to),
                statusParam(filter.status),
                filter.voucherTypeId,
                filter.fiscalPeriodId,
                filter.thirdPartyId,
                likePrefix(filter.entryNumberPrefix),
                filter.entryNumberPrefix.empty()
            );
            txn.commit();
            return row[0].as<int64_t>();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerQueryRepository] countEntries() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::JournalEntry> findCommittedEntries(const domain::JournalFilter& filter) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            std::optional<int64_t> limit;
            if (filter.limit) {
                limit = static_cast<int64_t>(*filter.limit);
            }

            auto result = txn.exec_params(
                std::string("SELECT ") + PostgresLedgerRows::kEntryColumns +
                " FROM journal_entries e WHERE " + kJournalFilter +
                " ORDER BY e.entry_date ASC, " + PostgresLedgerRows::kEntryNumberOrder + ", e.id ASC"
                " LIMIT $8::bigint OFFSET $9::bigint",
                dateParam(filter.range.from),
                dateParam(filter.range.to),
                statusParam(filter.status),
                filter.thirdPartyId,
                filter.fiscalPeriodId,
                likePrefix(filter.entryNumberPrefix),
                filter.entryNumberPrefix.empty(),
                limit,
                static_cast<int64_t>(filter.offset)
            );

            std::vector<domain::JournalEntry> entries;
            entries.reserve(result.size());
            for (const auto& row : result) {
                entries.push_back(PostgresLedgerRows::loadEntry(txn, row));
            }
            txn.commit();
            return entries;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerQueryRepository] findCommittedEntries() failed: " << e.what() << std::endl;
            throw;
        }
    }

    int64_t countCommittedEntries(const domain::JournalFilter& filter) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto row = txn.exec_params1(
                std::string("SELECT COUNT(*) FROM journal_entries e WHERE ") + kJournalFilter,
                dateParam(filter.range.from),
                dateParam(filter.range.to),
                statusParam(filter.status),
                filter.thirdPartyId,
                filter.fiscalPeriodId,
                likePrefix(filter.entryNumberPrefix),
                filter.entryNumberPrefix.empty()
            );
            txn.commit();
            return row[0].as<int64_t>();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerQueryRepository] countCommittedEntries() failed: " << e.what() << std::endl;
            throw;
        }
    }

    domain::AmountTotals sumCommittedBefore(int64_t accountId, const domain::CalendarDate& before) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto row = txn.exec_params1(
                R"(
                    SELECT COALESCE(SUM(l.debit_amount), 0) AS debit,
                           COALESCE(SUM(l.credit_amount), 0) AS credit
                    FROM journal_entry_lines l
                    JOIN journal_entries e ON e.id = l.entry_id
                    WHERE l.account_id = $1
                      AND e.status IN ('posted', 'reversed')
                      AND e.entry_date < $2::date
                )",
                accountId,
                before.toString()
            );
            txn.commit();

            domain::AmountTotals totals;
            totals.debit = domain::Money::fromCents(row["debit"].as<int64_t>());
            totals.credit = domain::Money::fromCents(row["credit"].as<int64_t>());
            return totals;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerQueryRepository] sumCommittedBefore() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::PostedLine> findCommittedLines(
        int64_t accountId,
        const domain::DateRange& range,
        std::optional<int64_t> fiscalPeriodId) override
    {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                std::string(R"(
                    SELECT e.entry_number, e.entry_date, e.reference,
                           l.id, l.entry_id, l.order_number, l.account_id, l.description,
                           l.debit_amount, l.credit_amount, l.third_party_id
                    FROM journal_entry_lines l
                    JOIN journal_entries e ON e.id = l.entry_id
                    WHERE l.account_id = $1
                      AND e.status IN ('posted', 'reversed')
                      AND ($2::date IS NULL OR e.entry_date >= $2::date)
                      AND ($3::date IS NULL OR e.entry_date <= $3::date)
                      AND ($4::bigint IS NULL OR e.fiscal_period_id = $4::bigint)
                    ORDER BY e.entry_date ASC, )") + PostgresLedgerRows::kEntryNumberOrder +
                ", l.order_number ASC",
                accountId,
                dateParam(range.from),
                dateParam(range.to),
                fiscalPeriodId
            );
            txn.commit();

            std::vector<domain::PostedLine> lines;
            lines.reserve(result.size());
            for (const auto& row : result) {
                domain::PostedLine posted;
                posted.entryId = row["entry_id"].as<int64_t>();
                posted.entryNumber = row["entry_number"].as<std::string>();
                posted.date = domain::CalendarDate::fromString(row["entry_date"].as<std::string>());
                posted.reference = row["reference"].as<std::string>();
                posted.line = PostgresLedgerRows::rowToLine(row);
                lines.push_back(std::move(posted));
            }
            return lines;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerQueryRepository] findCommittedLines() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::map<int64_t, domain::AmountTotals> aggregateCommittedByAccount(
        const domain::DateRange& range,
        std::optional<int64_t> fiscalPeriodId) override
    {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                R"(
                    SELECT l.account_id,
                           COALESCE(SUM(l.debit_amount), 0) AS debit,
                           COALESCE(SUM(l.credit_amount), 0) AS credit
                    FROM journal_entry_lines l
                    JOIN journal_entries e ON e.id = l.entry_id
                    WHERE e.status IN ('posted', 'reversed')
                      AND ($1::date IS NULL OR e.entry_date >= $1::date)
                      AND ($2::date IS NULL OR e.entry_date <= $2::date)
                      AND ($3::bigint IS NULL OR e.fiscal_period_id = $3::bigint)
                    GROUP BY l.account_id
                )",
                dateParam(range.from),
                dateParam(range.to),
                fiscalPeriodId
            );
            txn.commit();

            std::map<int64_t, domain::AmountTotals> totals;
            for (const auto& row : result) {
                auto& amounts = totals[row["account_id"].as<int64_t>()];
                amounts.debit = domain::Money::fromCents(row["debit"].as<int64_t>());
                amounts.credit = domain::Money::fromCents(row["credit"].as<int64_t>());
            }
            return totals;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerQueryRepository] aggregateCommittedByAccount() failed: "
                      << e.what() << std::endl;
            throw;
        }
    }

private:
    // $1 from, $2 to, $3 status, $4 third party, $5 period, $6 LIKE pattern, $7 no prefix
    static constexpr const char* kJournalFilter = R"(
        e.status IN ('posted', 'reversed')
        AND ($1::date IS NULL OR e.entry_date >= $1::date)
        AND ($2::date IS NULL OR e.entry_date <= $2::date)
        AND ($3::text IS NULL OR e.status = $3::text)
        AND ($4::bigint IS NULL OR e.third_party_id = $4::bigint)
        AND ($5::bigint IS NULL OR e.fiscal_period_id = $5::bigint)
        AND ($7::boolean OR e.entry_number LIKE $6::text ESCAPE '\')
    )";

    // $1 from, $2 to, $3 status, $4 voucher type, $5 period, $6 third party, $7 LIKE pattern, $8 no prefix
    static constexpr const char* kEntryFilter = R"(
        ($1::date IS NULL OR e.entry_date >= $1::date)
        AND ($2::date IS NULL OR e.entry_date <= $2::date)
        AND ($3::text IS NULL OR e.status = $3::text)
        AND ($4::bigint IS NULL OR e.voucher_type_id = $4::bigint)
        AND ($5::bigint IS NULL OR e.fiscal_period_id = $5::bigint)
        AND ($6::bigint IS NULL OR e.third_party_id = $6::bigint)
        AND ($8::boolean OR e.entry_number LIKE $7::text ESCAPE '\')
    )";

    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    static std::optional<std::string> dateParam(const std::optional<domain::CalendarDate>& date) {
        if (!date) {
            return std::nullopt;
        }
        return date->toString();
    }

    static std::optional<std::string> statusParam(const std::optional<domain::EntryStatus>& status) {
        if (!status) {
            return std::nullopt;
        }
        return domain::toString(*status);
    }

    /**
     * @brief "CD-0" -> "CD-0%" с экранированием % _ и обратной косой
     */
    static std::string likePrefix(const std::string& prefix) {
        std::string pattern;
        pattern.reserve(prefix.size() + 1);
        for (char c : prefix) {
            if (c == '%' || c == '_' || c == '\\') {
                pattern.push_back('\\');
            }
            pattern.push_back(c);
        }
        pattern.push_back('%');
        return pattern;
    }
};

} // namespace ledger::adapters::secondary
