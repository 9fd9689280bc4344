#pragma once

#include "domain/Account.hpp"
#include <optional>
#include <vector>
#include <cstdint>

namespace ledger::ports::output {

/**
 * @brief План счетов (внешний справочник, только чтение)
 */
class IChartOfAccountsGateway {
public:
    virtual ~IChartOfAccountsGateway() = default;

    virtual std::optional<domain::Account> findById(int64_t accountId) = 0;

    /**
     * @brief Все счета плана (включая неактивные и групповые)
     */
    virtual std::vector<domain::Account> findAll() = 0;
};

} // namespace ledger::ports::output
