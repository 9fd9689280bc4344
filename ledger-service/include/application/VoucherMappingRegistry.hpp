#pragma once

#include "domain/LegalDocument.hpp"
#include "domain/VoucherMapping.hpp"
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>

namespace ledger::application {

/**
 * @brief Построитель строк проводки для документа (document, voucherTypeId)
 */
using VoucherLineBuilder = std::function<domain::VoucherMapping(const domain::LegalDocument&, int64_t)>;

/**
 * @brief Реестр бизнес-маппингов по типу документа
 */
class VoucherMappingRegistry {
public:
    void registerBuilder(int64_t documentTypeId, VoucherLineBuilder builder) {
        std::lock_guard<std::mutex> lock(mutex_);
        builders_[documentTypeId] = std::move(builder);
        std::cout << "[VoucherMappingRegistry] Registered builder for document type "
                  << documentTypeId << std::endl;
    }

    std::optional<VoucherLineBuilder> find(int64_t documentTypeId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = builders_.find(documentTypeId);
        if (it == builders_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /**
     * @brief Простой маппинг: вся сумма документа в дебет одного счёта и кредит другого
     */
    static VoucherLineBuilder twoLegBuilder(int64_t debitAccountId, int64_t creditAccountId, bool postImmediately) {
        return [=](const domain::LegalDocument& document, int64_t) {
            domain::VoucherMapping mapping;
            mapping.postImmediately = postImmediately;
            mapping.lines.push_back(domain::JournalLine::debit(
                debitAccountId, document.totalAmount, "Document " + document.documentNumber));
            mapping.lines.push_back(domain::JournalLine::credit(
                creditAccountId, document.totalAmount, "Document " + document.documentNumber));
            return mapping;
        };
    }

private:
    mutable std::mutex mutex_;
    std::map<int64_t, VoucherLineBuilder> builders_;
};

} // namespace ledger::application
