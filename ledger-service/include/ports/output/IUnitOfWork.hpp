#pragma once

#include "ports/output/IJournalEntryRepository.hpp"
#include "ports/output/ISequenceRepository.hpp"
#include "ports/output/ILegalDocumentRepository.hpp"
#include <memory>

namespace ledger::ports::output {

/**
 * @brief Атомарная единица работы (одна транзакция хранилища)
 *
 * Всё, что сделано через репозитории единицы, фиксируется только в commit().
 * Деструктор без commit() откатывает изменения.
 */
class IUnitOfWork {
public:
    virtual ~IUnitOfWork() = default;

    virtual IJournalEntryRepository& entries() = 0;
    virtual ISequenceRepository& sequences() = 0;
    virtual ILegalDocumentRepository& documents() = 0;

    virtual void commit() = 0;
};

class IUnitOfWorkFactory {
public:
    virtual ~IUnitOfWorkFactory() = default;
    virtual std::unique_ptr<IUnitOfWork> begin() = 0;
};

} // namespace ledger::ports::output
