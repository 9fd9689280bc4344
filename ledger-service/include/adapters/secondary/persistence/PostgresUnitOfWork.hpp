#pragma once

#include "ports/output/IUnitOfWork.hpp"
#include "adapters/secondary/persistence/PostgresJournalEntryRepository.hpp"
#include "adapters/secondary/persistence/PostgresSequenceRepository.hpp"
#include "adapters/secondary/persistence/PostgresLegalDocumentRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace ledger::adapters::secondary {

/**
 * @brief Одна транзакция PostgreSQL на единицу работы
 *
 * Деструктор pqxx::work без commit() выполняет ROLLBACK.
 * Порядок полей важен: соединение живёт дольше транзакции.
 */
class PostgresUnitOfWork : public ports::output::IUnitOfWork {
public:
    explicit PostgresUnitOfWork(const std::string& connectionString)
        : connection_(connectionString)
        , txn_(connection_)
        , entries_(txn_)
        , sequences_(txn_)
        , documents_(txn_)
    {}

    ports::output::IJournalEntryRepository& entries() override { return entries_; }
    ports::output::ISequenceRepository& sequences() override { return sequences_; }
    ports::output::ILegalDocumentRepository& documents() override { return documents_; }

    void commit() override {
        try {
            txn_.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresUnitOfWork] commit() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    pqxx::connection connection_;
    pqxx::work txn_;
    PostgresJournalEntryRepository entries_;
    PostgresSequenceRepository sequences_;
    PostgresLegalDocumentRepository documents_;
};

class PostgresUnitOfWorkFactory : public ports::output::IUnitOfWorkFactory {
public:
    explicit PostgresUnitOfWorkFactory(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresUnitOfWorkFactory] Using " << settings_->getHost() << ":"
                  << settings_->getPort() << "/" << settings_->getName() << std::endl;
    }

    std::unique_ptr<ports::output::IUnitOfWork> begin() override {
        try {
            return std::make_unique<PostgresUnitOfWork>(settings_->getConnectionString());
        } catch (const std::exception& e) {
            std::cerr << "[PostgresUnitOfWorkFactory] begin() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace ledger::adapters::secondary
