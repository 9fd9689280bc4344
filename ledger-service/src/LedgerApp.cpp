#include "LedgerApp.hpp"

// Application Services
#include "application/BalanceEngine.hpp"
#include "application/TrialBalanceBuilder.hpp"
#include "application/JournalBookService.hpp"
#include "application/JournalEntryStore.hpp"
#include "application/DocumentVoucherBridge.hpp"
#include "application/VoucherMappingRegistry.hpp"

// Secondary Adapters
#include "adapters/secondary/persistence/PostgresChartOfAccountsGateway.hpp"
#include "adapters/secondary/persistence/PostgresFiscalPeriodGateway.hpp"
#include "adapters/secondary/persistence/PostgresLedgerQueryRepository.hpp"
#include "adapters/secondary/persistence/PostgresUnitOfWork.hpp"

// Primary Adapters
#include "adapters/primary/LedgerJsonMapper.hpp"

// Settings
#include "settings/DbSettings.hpp"
#include "settings/ReportSettings.hpp"
#include "settings/CommandSettings.hpp"

#include <boost/di.hpp>
#include <fstream>
#include <iostream>
#include <sstream>

namespace di = boost::di;

namespace ledger {

// ============================================================================
// LedgerApp Implementation
// ============================================================================

LedgerApp::LedgerApp(std::ostream& resultOut)
    : resultOut_(resultOut)
{
    std::cout << "[LedgerApp] Application created" << std::endl;
}

LedgerApp::~LedgerApp()
{
    std::cout << "[LedgerApp] Application destroyed" << std::endl;
}

int LedgerApp::run(int argc, char* argv[])
{
    loadEnvironment(argc, argv);
    configureInjection();
    return start();
}

void LedgerApp::loadEnvironment(int /*argc*/, char* /*argv*/[])
{
    std::cout << "[LedgerApp] Loading environment..." << std::endl;

    reportSettings_ = std::make_shared<settings::ReportSettings>();
    commandSettings_ = std::make_shared<settings::CommandSettings>();

    std::cout << "[LedgerApp] Command: " << commandSettings_->getCommand() << std::endl;
}

void LedgerApp::configureInjection()
{
    printStartupBanner();

    std::cout << "[LedgerApp] Configuring Boost.DI injection..." << std::endl;

    auto injector = di::make_injector(

        // ====================================================================
        // Layer 1: Settings
        // ====================================================================
        di::bind<settings::DbSettings>().in(di::singleton),

        // ====================================================================
        // Layer 2: Secondary Adapters (Output Ports implementations)
        // ====================================================================
        di::bind<ports::output::IChartOfAccountsGateway>()
            .to<adapters::secondary::PostgresChartOfAccountsGateway>()
            .in(di::singleton),

        di::bind<ports::output::IFiscalPeriodGateway>()
            .to<adapters::secondary::PostgresFiscalPeriodGateway>()
            .in(di::singleton),

        di::bind<ports::output::ILedgerQueryRepository>()
            .to<adapters::secondary::PostgresLedgerQueryRepository>()
            .in(di::singleton),

        di::bind<ports::output::IUnitOfWorkFactory>()
            .to<adapters::secondary::PostgresUnitOfWorkFactory>()
            .in(di::singleton),

        // ====================================================================
        // Layer 3: Application Services (Input Ports implementations)
        // ====================================================================
        di::bind<application::EntryValidator>().in(di::singleton),
        di::bind<application::SequenceAllocator>().in(di::singleton),
        di::bind<application::VoucherMappingRegistry>().in(di::singleton),

        di::bind<ports::input::IJournalEntryService, application::JournalEntryStore>()
            .to<application::JournalEntryStore>()
            .in(di::singleton),

        di::bind<ports::input::IDocumentVoucherService>()
            .to<application::DocumentVoucherBridge>()
            .in(di::singleton),

        di::bind<ports::input::IBalanceService>()
            .to<application::BalanceEngine>()
            .in(di::singleton),

        di::bind<ports::input::ITrialBalanceService>()
            .to<application::TrialBalanceBuilder>()
            .in(di::singleton),

        di::bind<ports::input::IJournalBookService>()
            .to<application::JournalBookService>()
            .in(di::singleton)
    );

    balanceService_ = injector.create<std::shared_ptr<ports::input::IBalanceService>>();
    trialBalanceService_ = injector.create<std::shared_ptr<ports::input::ITrialBalanceService>>();
    journalBookService_ = injector.create<std::shared_ptr<ports::input::IJournalBookService>>();
    journalEntryService_ = injector.create<std::shared_ptr<ports::input::IJournalEntryService>>();
    documentVoucherService_ = injector.create<std::shared_ptr<ports::input::IDocumentVoucherService>>();
    mappings_ = injector.create<std::shared_ptr<application::VoucherMappingRegistry>>();

    registerMappings();

    std::cout << "[LedgerApp] Injection configured" << std::endl;
}

int LedgerApp::start()
{
    try {
        writeOutput(execute());
        return 0;
    } catch (const domain::LedgerException& e) {
        std::cerr << "[LedgerApp] " << commandSettings_->getCommand() << " failed: " << e.what() << std::endl;
        writeOutput(adapters::primary::LedgerJsonMapper::errorToJson(e));
        return 2;
    }
}

nlohmann::json LedgerApp::execute()
{
    return commandSettings_->isReport() ? buildReport() : runCommand();
}

nlohmann::json LedgerApp::buildReport()
{
    const auto& report = reportSettings_->getReport();
    const auto& range = reportSettings_->getRange();
    auto periodId = reportSettings_->getFiscalPeriodId();

    if (report == "ledger") {
        auto accountId = reportSettings_->getAccountId();
        if (!accountId) {
            throw domain::ValidationError("LEDGER_ACCOUNT_ID is required for the ledger report");
        }
        return adapters::primary::LedgerJsonMapper::toJson(
            balanceService_->getLibroMayor(*accountId, range, periodId));
    }

    if (report == "journal") {
        domain::JournalFilter filter;
        filter.range = range;
        filter.fiscalPeriodId = periodId;
        filter.limit = reportSettings_->getPageLimit();
        return adapters::primary::LedgerJsonMapper::toJson(
            journalBookService_->getLibroDiario(filter));
    }

    return adapters::primary::LedgerJsonMapper::toJson(
        trialBalanceService_->getBalanceComprobacion(range, periodId, reportSettings_->getIncludeZero()));
}

nlohmann::json LedgerApp::runCommand()
{
    const auto& command = commandSettings_->getCommand();
    const int64_t actorId = commandSettings_->getActorId();

    auto requireId = [](const std::optional<int64_t>& id, const char* name) {
        if (!id) {
            throw domain::ValidationError(std::string(name) + " is required");
        }
        return *id;
    };

    if (command == "create-entry") {
        auto request = adapters::primary::LedgerJsonMapper::entryRequestFromJson(readInputFile());
        return adapters::primary::LedgerJsonMapper::toJson(journalEntryService_->createEntry(request, actorId));
    }

    if (command == "update-entry") {
        auto entryId = requireId(commandSettings_->getEntryId(), "LEDGER_ENTRY_ID");
        auto request = adapters::primary::LedgerJsonMapper::entryRequestFromJson(readInputFile());
        return adapters::primary::LedgerJsonMapper::toJson(
            journalEntryService_->updateEntry(entryId, request, actorId));
    }

    if (command == "get-entry") {
        auto entryId = requireId(commandSettings_->getEntryId(), "LEDGER_ENTRY_ID");
        return adapters::primary::LedgerJsonMapper::toJson(journalEntryService_->getEntry(entryId));
    }

    if (command == "list-entries") {
        domain::EntryFilter filter;
        filter.range = reportSettings_->getRange();
        filter.fiscalPeriodId = reportSettings_->getFiscalPeriodId();
        filter.limit = reportSettings_->getPageLimit();
        filter.status = commandSettings_->getStatus();
        filter.voucherTypeId = commandSettings_->getVoucherTypeId();
        filter.thirdPartyId = commandSettings_->getThirdPartyId();
        filter.entryNumberPrefix = commandSettings_->getEntryNumberPrefix();
        filter.offset = commandSettings_->getPageOffset();
        return adapters::primary::LedgerJsonMapper::toJson(journalEntryService_->listEntries(filter));
    }

    if (command == "post-entry") {
        auto entryId = requireId(commandSettings_->getEntryId(), "LEDGER_ENTRY_ID");
        return adapters::primary::LedgerJsonMapper::toJson(journalEntryService_->postEntry(entryId, actorId));
    }

    if (command == "reverse-entry") {
        domain::ReverseRequest request;
        request.reason = commandSettings_->getReason();
        request.date = commandSettings_->getReversalDate();
        request.fiscalPeriodId = commandSettings_->getReversalPeriodId();
        auto entryId = requireId(commandSettings_->getEntryId(), "LEDGER_ENTRY_ID");
        return adapters::primary::LedgerJsonMapper::toJson(
            journalEntryService_->reverseEntry(entryId, request, actorId));
    }

    if (command == "delete-entry") {
        auto entryId = requireId(commandSettings_->getEntryId(), "LEDGER_ENTRY_ID");
        journalEntryService_->deleteEntry(entryId, actorId);
        return nlohmann::json{{"deleted_entry_id", entryId}};
    }

    if (command == "generate-voucher") {
        auto documentId = requireId(commandSettings_->getDocumentId(), "LEDGER_DOCUMENT_ID");
        auto voucherTypeId = requireId(commandSettings_->getVoucherTypeId(), "LEDGER_VOUCHER_TYPE_ID");
        return adapters::primary::LedgerJsonMapper::toJson(
            documentVoucherService_->generateVoucherFromDocument(documentId, voucherTypeId, actorId));
    }

    // cancel-document
    auto documentId = requireId(commandSettings_->getDocumentId(), "LEDGER_DOCUMENT_ID");
    documentVoucherService_->cancelDocument(documentId, commandSettings_->getReason(), actorId);
    return nlohmann::json{{"cancelled_document_id", documentId}};
}

void LedgerApp::registerMappings()
{
    if (!commandSettings_->hasMapping()) {
        return;
    }
    mappings_->registerBuilder(
        commandSettings_->getMappingDocumentTypeId(),
        application::VoucherMappingRegistry::twoLegBuilder(
            commandSettings_->getMappingDebitAccountId(),
            commandSettings_->getMappingCreditAccountId(),
            commandSettings_->getMappingPostImmediately()));
}

std::string LedgerApp::readInputFile() const
{
    const auto& path = commandSettings_->getInputFile();
    if (path.empty()) {
        throw domain::ValidationError("LEDGER_INPUT_FILE is required for " + commandSettings_->getCommand());
    }

    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open input file " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void LedgerApp::writeOutput(const nlohmann::json& result)
{
    const auto& path = reportSettings_->getOutputFile();
    if (path.empty()) {
        resultOut_ << result.dump(2) << std::endl;
        return;
    }

    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot open output file " + path);
    }
    out << result.dump(2) << std::endl;
    std::cout << "[LedgerApp] Result written to " << path << std::endl;
}

void LedgerApp::printStartupBanner()
{
    std::cout << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "  Ledger Service" << std::endl;
    std::cout << "  Command: " << commandSettings_->getCommand() << std::endl;
    if (commandSettings_->isReport()) {
        std::cout << "  Report: " << reportSettings_->getReport() << std::endl;
    }
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;
}

} // namespace ledger
