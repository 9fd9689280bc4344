#include "LedgerApp.hpp"
#include "StdoutReservation.hpp"
#include "settings/ReportSettings.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    ledger::StdoutReservation stdoutReservation(ledger::settings::ReportSettings::outputFileFromEnvironment().empty());

    try {
        ledger::LedgerApp app(stdoutReservation.result());

        std::cout << "========================================" << std::endl;
        std::cout << "  Ledger Service v1.0.0 Starting" << std::endl;
        std::cout << "========================================" << std::endl;

        // Template Method вызывает:
        // 1. loadEnvironment()
        // 2. configureInjection()
        // 3. start()
        int code = app.run(argc, argv);

        std::cout << "[main] Ledger Service finished with code " << code << std::endl;
        return code;

    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
