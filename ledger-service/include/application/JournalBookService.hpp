#pragma once

#include "ports/input/IJournalBookService.hpp"
#include "ports/output/IChartOfAccountsGateway.hpp"
#include "ports/output/ILedgerQueryRepository.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include <iostream>
#include <map>
#include <memory>

namespace ledger::application {

/**
 * @brief Libro Diario: проведённые проводки по дате с расшифровкой строк
 */
class JournalBookService : public ports::input::IJournalBookService {
public:
    JournalBookService(
        std::shared_ptr<ports::output::IChartOfAccountsGateway> accounts,
        std::shared_ptr<ports::output::ILedgerQueryRepository> queries
    ) : accounts_(std::move(accounts))
      , queries_(std::move(queries))
    {
        std::cout << "[JournalBookService] Created" << std::endl;
    }

    domain::JournalBook getLibroDiario(const domain::JournalFilter& filter) override {
        if (filter.range.isInverted()) {
            throw domain::ValidationError("Date range is inverted: " + filter.range.from->toString() +
                                          " > " + filter.range.to->toString());
        }
        if (filter.status && !domain::isCommittedStatus(*filter.status)) {
            throw domain::ValidationError("Libro Diario lists only posted or reversed entries, got '" +
                                          domain::toString(*filter.status) + "'");
        }

        domain::JournalBook book;
        book.totalCount = queries_->countCommittedEntries(filter);

        // Кэш счетов на время запроса
        std::map<int64_t, std::optional<domain::Account>> accountCache;
        auto lookup = [&](int64_t accountId) -> const std::optional<domain::Account>& {
            auto it = accountCache.find(accountId);
            if (it == accountCache.end()) {
                it = accountCache.emplace(accountId, accounts_->findById(accountId)).first;
            }
            return it->second;
        };

        for (auto& entry : queries_->findCommittedEntries(filter)) {
            domain::JournalBookEntry bookEntry;
            for (const auto& line : entry.lines()) {
                domain::JournalBookLine detail;
                detail.line = line;
                const auto& account = lookup(line.accountId);
                if (account) {
                    detail.accountCode = account->code;
                    detail.accountName = account->name;
                }
                bookEntry.details.push_back(std::move(detail));
            }
            bookEntry.entry = std::move(entry);
            book.entries.push_back(std::move(bookEntry));
        }

        std::cout << "[JournalBookService] " << book.entries.size() << " of "
                  << book.totalCount << " entries" << std::endl;
        return book;
    }

private:
    std::shared_ptr<ports::output::IChartOfAccountsGateway> accounts_;
    std::shared_ptr<ports::output::ILedgerQueryRepository> queries_;
};

} // namespace ledger::application
