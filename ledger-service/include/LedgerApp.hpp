#pragma once

#include <nlohmann/json.hpp>
#include <memory>
#include <ostream>

// Forward declarations - Ports
namespace ledger::ports::input {
    class IBalanceService;
    class ITrialBalanceService;
    class IJournalBookService;
    class IJournalEntryService;
    class IDocumentVoucherService;
}

namespace ledger::application {
    class VoucherMappingRegistry;
}

namespace ledger::settings {
    class ReportSettings;
    class CommandSettings;
}

namespace ledger {

/**
 * @class LedgerApp
 * @brief Приложение леджера: одна операция или один отчёт за запуск
 *
 * Template Method:
 * 1. loadEnvironment() - чтение настроек из ENV
 * 2. configureInjection() - Boost.DI: PostgreSQL адаптеры и сервисы
 * 3. start() - выполнение команды и вывод JSON
 *
 * Архитектура: Hexagonal (Ports & Adapters)
 * - Secondary Adapters: Postgres*
 * - Application: JournalEntryStore, DocumentVoucherBridge,
 *   BalanceEngine, TrialBalanceBuilder, JournalBookService
 */
class LedgerApp
{
public:
    /**
     * @param resultOut куда писать JSON, если LEDGER_OUTPUT_FILE не задан
     */
    explicit LedgerApp(std::ostream& resultOut);
    ~LedgerApp();

    /**
     * @brief Запустить полный цикл
     * @return код выхода процесса (2 - бизнес-ошибка)
     */
    int run(int argc, char* argv[]);

protected:
    void loadEnvironment(int argc, char* argv[]);
    void configureInjection();
    int start();

private:
    std::ostream& resultOut_;
    std::shared_ptr<settings::ReportSettings> reportSettings_;
    std::shared_ptr<settings::CommandSettings> commandSettings_;

    std::shared_ptr<ports::input::IBalanceService> balanceService_;
    std::shared_ptr<ports::input::ITrialBalanceService> trialBalanceService_;
    std::shared_ptr<ports::input::IJournalBookService> journalBookService_;
    std::shared_ptr<ports::input::IJournalEntryService> journalEntryService_;
    std::shared_ptr<ports::input::IDocumentVoucherService> documentVoucherService_;
    std::shared_ptr<application::VoucherMappingRegistry> mappings_;

    nlohmann::json execute();
    nlohmann::json buildReport();
    nlohmann::json runCommand();
    void registerMappings();
    std::string readInputFile() const;
    void writeOutput(const nlohmann::json& result);
    void printStartupBanner();
};

} // namespace ledger
