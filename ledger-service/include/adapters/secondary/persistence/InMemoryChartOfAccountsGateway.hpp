#pragma once

#include "ports/output/IChartOfAccountsGateway.hpp"
#include <ThreadSafeMap.hpp>

namespace ledger::adapters::secondary {

/**
 * @brief In-memory план счетов
 */
class InMemoryChartOfAccountsGateway : public ports::output::IChartOfAccountsGateway {
public:
    void save(const domain::Account& account) {
        accounts_.insert(account.id, std::make_shared<domain::Account>(account));
    }

    std::optional<domain::Account> findById(int64_t accountId) override {
        auto account = accounts_.find(accountId);
        return account ? std::optional(*account) : std::nullopt;
    }

    std::vector<domain::Account> findAll() override {
        std::vector<domain::Account> result;
        for (const auto& account : accounts_.getAll()) {
            result.push_back(*account);
        }
        return result;
    }

private:
    ThreadSafeMap<int64_t, domain::Account> accounts_;
};

} // namespace ledger::adapters::secondary
