#include "LedgerApp.hpp"
#include <iostream>
#include <csignal>

namespace {

ledger::LedgerApp* g_app = nullptr;

void signalHandler(int signal) {
    std::cout << "\n[main] Received signal " << signal << ", stopping ledger..." << std::endl;
    if (g_app) {
        g_app->stop();
    }
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        ledger::LedgerApp app;
        g_app = &app;

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        std::cout << "========================================" << std::endl;
        std::cout << "  Ledger Service v1.0.0" << std::endl;
        std::cout << "  Storage: LEDGER_STORAGE (postgres|memory)" << std::endl;
        std::cout << "========================================" << std::endl;

        app.run(argc, argv);

        g_app = nullptr;
        std::cout << "[main] Ledger Service stopped" << std::endl;
        return 0;

    } catch (const std::invalid_argument& e) {
        // LedgerSettings / Amount::parse на значениях из ENV
        std::cerr << "[main] Invalid configuration: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
