#pragma once

#include "ports/input/IJournalEntryService.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "ports/output/ILedgerQueryRepository.hpp"
#include "application/EntryValidator.hpp"
#include "application/SequenceAllocator.hpp"
#include "domain/EntryStateMachine.hpp"
#include "domain/EntryNumberOrder.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include <memory>
#include <iostream>
#include <string>

namespace ledger::application {

/**
 * @brief Хранилище проводок: инвариант баланса и машина состояний
 *
 * Каждая публичная операция - одна единица работы. Методы *Within
 * выполняются внутри чужой единицы (ими пользуется DocumentVoucherBridge).
 *
 * Сторно: зеркальная проводка CANC-<номер> со взаимно переставленными
 * дебетом и кредитом создаётся сразу проведённой, оригинал получает
 * статус reversed. Обе остаются в книгах.
 */
class JournalEntryStore : public ports::input::IJournalEntryService {
public:
    JournalEntryStore(
        std::shared_ptr<ports::output::IUnitOfWorkFactory> unitOfWork,
        std::shared_ptr<ports::output::ILedgerQueryRepository> queries,
        std::shared_ptr<EntryValidator> validator,
        std::shared_ptr<SequenceAllocator> sequences
    ) : unitOfWork_(std::move(unitOfWork))
      , queries_(std::move(queries))
      , validator_(std::move(validator))
      , sequences_(std::move(sequences))
    {
        std::cout << "[JournalEntryStore] Created" << std::endl;
    }

    domain::JournalEntry createEntry(const domain::JournalEntryRequest& request, int64_t actorId) override {
        auto uow = unitOfWork_->begin();
        auto entry = createWithin(*uow, request, actorId);
        uow->commit();

        std::cout << "[JournalEntryStore] Created entry " << entry.entryNumber
                  << " (id=" << entry.id << ")" << std::endl;
        return entry;
    }

    domain::JournalEntry updateEntry(
        int64_t entryId, const domain::JournalEntryRequest& request, int64_t actorId) override
    {
        auto uow = unitOfWork_->begin();
        auto existing = lockEntry(*uow, entryId);
        domain::EntryStateMachine::apply(existing.status, domain::EntryAction::UPDATE);

        if (request.voucherTypeId != 0 && request.voucherTypeId != existing.voucherTypeId) {
            throw domain::ValidationError("Voucher type of entry " + existing.entryNumber + " cannot change");
        }

        domain::JournalEntry updated = existing;
        updated.date = request.date;
        updated.reference = request.reference;
        updated.description = request.description;
        updated.currencyId = request.currencyId;
        updated.exchangeRate = request.exchangeRate;
        updated.fiscalPeriodId = request.fiscalPeriodId;
        updated.thirdPartyId = request.thirdPartyId;
        updated.isAdjustment = request.isAdjustment;
        updated.setLines(request.lines);

        validator_->validate(updated);

        if (request.entryNumber && !request.entryNumber->empty() &&
            *request.entryNumber != existing.entryNumber) {
            uow->sequences().findForUpdate(existing.voucherTypeId);
            ensureNumberIsFree(*uow, existing.voucherTypeId, *request.entryNumber);
            updated.entryNumber = *request.entryNumber;
        }

        uow->entries().update(updated);
        auto result = lockEntry(*uow, entryId);
        uow->commit();

        std::cout << "[JournalEntryStore] Updated entry " << result.entryNumber
                  << " by actor " << actorId << std::endl;
        return result;
    }

    domain::JournalEntry postEntry(int64_t entryId, int64_t actorId) override {
        auto uow = unitOfWork_->begin();
        auto entry = postWithin(*uow, entryId, actorId);
        uow->commit();

        std::cout << "[JournalEntryStore] Posted entry " << entry.entryNumber << std::endl;
        return entry;
    }

    domain::JournalEntry reverseEntry(
        int64_t entryId, const domain::ReverseRequest& request, int64_t actorId) override
    {
        auto uow = unitOfWork_->begin();
        auto original = lockEntry(*uow, entryId);
        auto next = domain::EntryStateMachine::apply(original.status, domain::EntryAction::REVERSE);

        auto mirror = buildMirror(original, request, actorId);
        validator_->validate(mirror);
        ensureNumberIsFree(*uow, mirror.voucherTypeId, mirror.entryNumber);

        int64_t mirrorId = uow->entries().insert(mirror);

        original.status = *next;
        original.reversedByEntryId = mirrorId;
        uow->entries().updateHeader(original);

        auto result = lockEntry(*uow, entryId);
        uow->commit();

        std::cout << "[JournalEntryStore] Reversed entry " << original.entryNumber
                  << " with " << mirror.entryNumber << " (id=" << mirrorId << ")" << std::endl;
        return result;
    }

    void deleteEntry(int64_t entryId, int64_t actorId) override {
        auto uow = unitOfWork_->begin();
        auto entry = lockEntry(*uow, entryId);
        domain::EntryStateMachine::apply(entry.status, domain::EntryAction::DELETE);

        uow->entries().remove(entryId);
        uow->commit();

        std::cout << "[JournalEntryStore] Deleted draft " << entry.entryNumber
                  << " by actor " << actorId << std::endl;
    }

    domain::JournalEntry getEntry(int64_t entryId) override {
        auto entry = queries_->findEntryById(entryId);
        if (!entry) {
            throw domain::NotFoundError("Journal entry " + std::to_string(entryId) + " not found");
        }
        return *entry;
    }

    domain::EntryPage listEntries(const domain::EntryFilter& filter) override {
        if (filter.range.isInverted()) {
            throw domain::ValidationError("Date range is inverted: " + filter.range.from->toString() +
                                          " > " + filter.range.to->toString());
        }

        domain::EntryPage page;
        page.totalCount = queries_->countEntries(filter);
        page.entries = queries_->findEntries(filter);

        std::cout << "[JournalEntryStore] Listed " << page.entries.size() << " of "
                  << page.totalCount << " entries" << std::endl;
        return page;
    }

    // ------------------------------------------------------------------
    // Операции внутри чужой единицы работы
    // ------------------------------------------------------------------

    /**
     * @brief Создать черновик; номер выделяется после всех проверок
     */
    domain::JournalEntry createWithin(
        ports::output::IUnitOfWork& uow, const domain::JournalEntryRequest& request, int64_t actorId)
    {
        domain::JournalEntry entry;
        entry.voucherTypeId = request.voucherTypeId;
        entry.date = request.date;
        entry.reference = request.reference;
        entry.description = request.description;
        entry.currencyId = request.currencyId;
        entry.exchangeRate = request.exchangeRate;
        entry.fiscalPeriodId = request.fiscalPeriodId;
        entry.thirdPartyId = request.thirdPartyId;
        entry.isAdjustment = request.isAdjustment;
        entry.documentTypeId = request.documentTypeId;
        entry.documentId = request.documentId;
        entry.status = domain::EntryStatus::DRAFT;
        entry.createdBy = actorId;
        entry.createdAt = domain::Timestamp::now();
        entry.setLines(request.lines);

        validator_->validate(entry);

        if (request.entryNumber && !request.entryNumber->empty()) {
            // Блокировка типа сериализует проверку уникальности ручных номеров
            if (!uow.sequences().findForUpdate(entry.voucherTypeId)) {
                throw domain::NotFoundError("Voucher type " + std::to_string(entry.voucherTypeId) + " not found");
            }
            ensureNumberIsFree(uow, entry.voucherTypeId, *request.entryNumber);
            entry.entryNumber = *request.entryNumber;
        } else {
            entry.entryNumber = sequences_->nextNumber(uow, entry.voucherTypeId);
        }

        int64_t id = uow.entries().insert(entry);
        return lockEntry(uow, id);
    }

    /**
     * @brief draft -> posted с повторной проверкой баланса, счетов и периода
     */
    domain::JournalEntry postWithin(ports::output::IUnitOfWork& uow, int64_t entryId, int64_t actorId) {
        auto entry = lockEntry(uow, entryId);
        auto next = domain::EntryStateMachine::apply(entry.status, domain::EntryAction::POST);

        validator_->validate(entry);

        entry.status = *next;
        entry.postedBy = actorId;
        entry.postedAt = domain::Timestamp::now();
        uow.entries().updateHeader(entry);
        return entry;
    }

    /**
     * @brief draft -> cancelled (каскад от аннулирования документа)
     */
    void cancelWithin(
        ports::output::IUnitOfWork& uow, domain::JournalEntry& entry,
        const std::string& reason, int64_t actorId)
    {
        auto next = domain::EntryStateMachine::apply(entry.status, domain::EntryAction::CANCEL);

        entry.status = *next;
        entry.cancelledBy = actorId;
        entry.cancellationReason = reason;
        uow.entries().updateHeader(entry);
    }

private:
    std::shared_ptr<ports::output::IUnitOfWorkFactory> unitOfWork_;
    std::shared_ptr<ports::output::ILedgerQueryRepository> queries_;
    std::shared_ptr<EntryValidator> validator_;
    std::shared_ptr<SequenceAllocator> sequences_;

    static domain::JournalEntry lockEntry(ports::output::IUnitOfWork& uow, int64_t entryId) {
        auto entry = uow.entries().findByIdForUpdate(entryId);
        if (!entry) {
            throw domain::NotFoundError("Journal entry " + std::to_string(entryId) + " not found");
        }
        return *entry;
    }

    static void ensureNumberIsFree(
        ports::output::IUnitOfWork& uow, int64_t voucherTypeId, const std::string& entryNumber)
    {
        if (uow.entries().existsByNumber(voucherTypeId, entryNumber)) {
            throw domain::ConflictError("Entry number " + entryNumber + " already exists for voucher type " +
                                        std::to_string(voucherTypeId));
        }
    }

    static domain::JournalEntry buildMirror(
        const domain::JournalEntry& original, const domain::ReverseRequest& request, int64_t actorId)
    {
        domain::JournalEntry mirror;
        mirror.entryNumber = domain::kReversalPrefix + original.entryNumber;
        mirror.voucherTypeId = original.voucherTypeId;
        mirror.date = request.date.value_or(original.date);
        mirror.fiscalPeriodId = request.fiscalPeriodId.value_or(original.fiscalPeriodId);
        mirror.reference = "Reversal of " + original.entryNumber;
        mirror.description = request.reason.empty()
            ? "Reversal of entry " + original.entryNumber
            : request.reason;
        mirror.currencyId = original.currencyId;
        mirror.exchangeRate = original.exchangeRate;
        mirror.thirdPartyId = original.thirdPartyId;
        mirror.isAdjustment = true;
        mirror.reversalOfEntryId = original.id;
        mirror.status = domain::EntryStatus::POSTED;
        mirror.createdBy = actorId;
        mirror.createdAt = domain::Timestamp::now();
        mirror.postedBy = actorId;
        mirror.postedAt = mirror.createdAt;

        std::vector<domain::JournalLine> lines;
        lines.reserve(original.lines().size());
        for (const auto& line : original.lines()) {
            domain::JournalLine swapped;
            swapped.accountId = line.accountId;
            swapped.description = "Reversal: " + line.description;
            swapped.debitAmount = line.creditAmount;
            swapped.creditAmount = line.debitAmount;
            swapped.thirdPartyId = line.thirdPartyId;
            lines.push_back(swapped);
        }
        mirror.setLines(std::move(lines));
        return mirror;
    }
};

} // namespace ledger::application
