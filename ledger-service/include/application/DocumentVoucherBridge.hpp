#pragma once

#include "ports/input/IDocumentVoucherService.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "application/JournalEntryStore.hpp"
#include "application/VoucherMappingRegistry.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace ledger::application {

/**
 * @brief Координатор состояний документа и его проводок
 *
 * Генерация: документ должен быть утверждён, проводки этого типа для него
 * ещё нет. Строки строит маппинг, зарегистрированный для типа документа.
 *
 * Аннулирование: проведённая проводка блокирует документ; черновики
 * аннулируются каскадом. Сторнированные проводки уже обнулены зеркальными
 * и остаются как есть.
 *
 * Документ и все его проводки блокируются до проверок, поэтому параллельный
 * postEntry либо успевает раньше (ConflictError), либо ждёт и получает
 * InvalidStateError.
 */
class DocumentVoucherBridge : public ports::input::IDocumentVoucherService {
public:
    DocumentVoucherBridge(
        std::shared_ptr<ports::output::IUnitOfWorkFactory> unitOfWork,
        std::shared_ptr<JournalEntryStore> entries,
        std::shared_ptr<VoucherMappingRegistry> mappings
    ) : unitOfWork_(std::move(unitOfWork))
      , entries_(std::move(entries))
      , mappings_(std::move(mappings))
    {
        std::cout << "[DocumentVoucherBridge] Created" << std::endl;
    }

    domain::JournalEntry generateVoucherFromDocument(
        int64_t documentId, int64_t voucherTypeId, int64_t actorId) override
    {
        auto uow = unitOfWork_->begin();
        auto document = lockDocument(*uow, documentId);

        if (document.status != domain::DocumentStatus::APPROVED) {
            throw domain::InvalidStateError("Document " + document.documentNumber + " is '" +
                                            domain::toString(document.status) +
                                            "', only approved documents generate vouchers");
        }
        if (uow->entries().existsForDocument(document.documentTypeId, document.id, voucherTypeId)) {
            throw domain::ConflictError("Document " + document.documentNumber +
                                        " already has a voucher of type " + std::to_string(voucherTypeId));
        }

        auto builder = mappings_->find(document.documentTypeId);
        if (!builder) {
            throw domain::NotFoundError("No voucher mapping for document type " +
                                        std::to_string(document.documentTypeId));
        }
        auto mapping = (*builder)(document, voucherTypeId);

        domain::JournalEntryRequest request;
        request.voucherTypeId = voucherTypeId;
        request.date = document.date;
        request.reference = document.documentNumber;
        request.description = mapping.description.empty()
            ? "Voucher generated from document " + document.documentNumber
            : mapping.description;
        request.currencyId = document.currencyId;
        request.exchangeRate = document.exchangeRate;
        request.fiscalPeriodId = document.fiscalPeriodId;
        request.thirdPartyId = document.thirdPartyId;
        request.documentTypeId = document.documentTypeId;
        request.documentId = document.id;
        request.lines = std::move(mapping.lines);

        auto entry = entries_->createWithin(*uow, request, actorId);
        if (mapping.postImmediately) {
            entry = entries_->postWithin(*uow, entry.id, actorId);
        }
        uow->commit();

        std::cout << "[DocumentVoucherBridge] Document " << document.documentNumber
                  << " -> voucher " << entry.entryNumber << " (" << domain::toString(entry.status) << ")"
                  << std::endl;
        return entry;
    }

    void cancelDocument(int64_t documentId, const std::string& reason, int64_t actorId) override {
        if (reason.find_first_not_of(" \t\r\n") == std::string::npos) {
            throw domain::ValidationError("Cancellation reason is required");
        }

        auto uow = unitOfWork_->begin();
        auto document = lockDocument(*uow, documentId);

        if (document.status == domain::DocumentStatus::CANCELLED) {
            throw domain::InvalidStateError("Document " + document.documentNumber + " is already cancelled");
        }

        auto linked = uow->entries().findByDocumentForUpdate(document.documentTypeId, document.id);

        std::vector<int64_t> blocking;
        for (const auto& entry : linked) {
            if (entry.status == domain::EntryStatus::POSTED) {
                blocking.push_back(entry.id);
            }
        }
        if (!blocking.empty()) {
            throw domain::ConflictError("Document " + document.documentNumber + " has " +
                                        std::to_string(blocking.size()) +
                                        " posted voucher(s); reverse them first", blocking);
        }

        const std::string note = "Automatic cancellation due to cancellation of document " +
                                 std::to_string(document.id);
        int cancelled = 0;
        for (auto& entry : linked) {
            if (entry.status == domain::EntryStatus::DRAFT) {
                entries_->cancelWithin(*uow, entry, note, actorId);
                ++cancelled;
            }
        }

        domain::DocumentStatusChange change;
        change.documentId = document.id;
        change.previousStatus = document.status;
        change.newStatus = domain::DocumentStatus::CANCELLED;
        change.actorId = actorId;
        change.comment = reason;
        change.changedAt = domain::Timestamp::now();

        document.status = domain::DocumentStatus::CANCELLED;
        document.cancellationReason = reason;
        document.cancelledBy = actorId;
        uow->documents().update(document);
        uow->documents().appendStatusChange(change);
        uow->commit();

        std::cout << "[DocumentVoucherBridge] Cancelled document " << document.documentNumber
                  << " and " << cancelled << " draft voucher(s)" << std::endl;
    }

private:
    std::shared_ptr<ports::output::IUnitOfWorkFactory> unitOfWork_;
    std::shared_ptr<JournalEntryStore> entries_;
    std::shared_ptr<VoucherMappingRegistry> mappings_;

    static domain::LegalDocument lockDocument(ports::output::IUnitOfWork& uow, int64_t documentId) {
        auto document = uow.documents().findByIdForUpdate(documentId);
        if (!document) {
            throw domain::NotFoundError("Document " + std::to_string(documentId) + " not found");
        }
        return *document;
    }
};

} // namespace ledger::application
