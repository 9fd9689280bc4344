#pragma once

#include "ports/output/IUnitOfWork.hpp"
#include "adapters/secondary/persistence/InMemoryLedgerStore.hpp"
#include "adapters/secondary/persistence/InMemoryJournalEntryRepository.hpp"
#include "adapters/secondary/persistence/InMemorySequenceRepository.hpp"
#include "adapters/secondary/persistence/InMemoryLegalDocumentRepository.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include <memory>
#include <mutex>

namespace ledger::adapters::secondary {

/**
 * @brief Единица работы над рабочей копией состояния
 *
 * commit() подменяет зафиксированное состояние копией; без commit()
 * копия просто выбрасывается. Порядок полей важен: lock_ захватывается
 * до копирования состояния.
 */
class InMemoryUnitOfWork : public ports::output::IUnitOfWork {
public:
    explicit InMemoryUnitOfWork(InMemoryLedgerStore& store)
        : lock_(store.acquire())
        , store_(store)
        , working_(store.stateUnsafe())
        , entries_(working_)
        , sequences_(working_)
        , documents_(working_)
    {}

    ports::output::IJournalEntryRepository& entries() override { return entries_; }
    ports::output::ISequenceRepository& sequences() override { return sequences_; }
    ports::output::ILegalDocumentRepository& documents() override { return documents_; }

    void commit() override {
        if (committed_) {
            throw domain::InvalidStateError("Unit of work already committed");
        }
        store_.stateUnsafe() = working_;
        committed_ = true;
    }

private:
    std::unique_lock<std::mutex> lock_;
    InMemoryLedgerStore& store_;
    LedgerState working_;
    InMemoryJournalEntryRepository entries_;
    InMemorySequenceRepository sequences_;
    InMemoryLegalDocumentRepository documents_;
    bool committed_ = false;
};

class InMemoryUnitOfWorkFactory : public ports::output::IUnitOfWorkFactory {
public:
    explicit InMemoryUnitOfWorkFactory(std::shared_ptr<InMemoryLedgerStore> store)
        : store_(std::move(store)) {}

    std::unique_ptr<ports::output::IUnitOfWork> begin() override {
        return std::make_unique<InMemoryUnitOfWork>(*store_);
    }

private:
    std::shared_ptr<InMemoryLedgerStore> store_;
};

} // namespace ledger::adapters::secondary
