#pragma once

#include "domain/JournalLine.hpp"
#include "domain/CalendarDate.hpp"
#include "domain/ExchangeRate.hpp"
#include "domain/Timestamp.hpp"
#include "domain/enums/EntryStatus.hpp"
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Бухгалтерская проводка (voucher): заголовок + строки
 *
 * totalDebit/totalCredit - кэш, пересчитываемый при каждой замене строк;
 * напрямую не устанавливается.
 */
class JournalEntry {
public:
    int64_t id = 0;
    std::string entryNumber;
    int64_t voucherTypeId = 0;
    CalendarDate date;
    std::string reference;
    std::string description;
    std::optional<int64_t> currencyId;
    ExchangeRate exchangeRate;
    int64_t fiscalPeriodId = 0;
    std::optional<int64_t> thirdPartyId;
    EntryStatus status = EntryStatus::DRAFT;

    // Связь с исходным документом
    std::optional<int64_t> documentTypeId;
    std::optional<int64_t> documentId;

    bool isAdjustment = false;
    int64_t createdBy = 0;
    Timestamp createdAt;
    std::optional<int64_t> postedBy;
    std::optional<Timestamp> postedAt;
    std::optional<int64_t> cancelledBy;
    std::string cancellationReason;

    // Сторно: зеркальная проводка ссылается на оригинал и наоборот
    std::optional<int64_t> reversalOfEntryId;
    std::optional<int64_t> reversedByEntryId;

    const std::vector<JournalLine>& lines() const { return lines_; }
    const Money& totalDebit() const { return totalDebit_; }
    const Money& totalCredit() const { return totalCredit_; }

    /**
     * @brief Заменить строки целиком
     *
     * Нумерует строки 1..n, проставляет entryId, наследует thirdPartyId
     * заголовка и пересчитывает итоги.
     */
    void setLines(std::vector<JournalLine> lines) {
        lines_ = std::move(lines);
        int order = 0;
        for (auto& line : lines_) {
            line.entryId = id;
            line.orderNumber = ++order;
            if (!line.thirdPartyId) {
                line.thirdPartyId = thirdPartyId;
            }
        }
        recomputeTotals();
    }

    /**
     * @brief Присвоить id после вставки (строки получают тот же entryId)
     */
    void assignId(int64_t newId) {
        id = newId;
        for (auto& line : lines_) {
            line.entryId = newId;
        }
    }

    /**
     * @brief Присвоить id строкам (id строк выдаёт хранилище)
     */
    void assignLineId(size_t index, int64_t lineId) {
        lines_.at(index).id = lineId;
    }

    Money imbalance() const { return totalDebit_ - totalCredit_; }

    bool isBalanced() const { return Money::nearlyEqual(totalDebit_, totalCredit_); }

    bool hasSourceDocument() const { return documentTypeId.has_value() && documentId.has_value(); }

private:
    std::vector<JournalLine> lines_;
    Money totalDebit_;
    Money totalCredit_;

    void recomputeTotals() {
        totalDebit_ = Money::zero();
        totalCredit_ = Money::zero();
        for (const auto& line : lines_) {
            totalDebit_ += line.debitAmount;
            totalCredit_ += line.creditAmount;
        }
    }
};

/**
 * @brief Данные для создания/изменения проводки
 *
 * entryNumber пустой - номер выделяет SequenceAllocator.
 */
struct JournalEntryRequest {
    std::optional<std::string> entryNumber;
    int64_t voucherTypeId = 0;
    CalendarDate date;
    std::string reference;
    std::string description;
    std::optional<int64_t> currencyId;
    ExchangeRate exchangeRate;
    int64_t fiscalPeriodId = 0;
    std::optional<int64_t> thirdPartyId;
    bool isAdjustment = false;
    std::optional<int64_t> documentTypeId;
    std::optional<int64_t> documentId;
    std::vector<JournalLine> lines;
};

/**
 * @brief Параметры сторно; дата и период по умолчанию берутся из оригинала
 */
struct ReverseRequest {
    std::string reason;
    std::optional<CalendarDate> date;
    std::optional<int64_t> fiscalPeriodId;
};

} // namespace ledger::domain
