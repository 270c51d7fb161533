// include/LedgerApp.hpp
#pragma once

#include <BoostBeastApplication.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/LedgerSettings.hpp"

// Ports
#include "ports/input/ITransactionService.hpp"
#include "ports/input/IWalletService.hpp"
#include "ports/output/IAssetTypeRepository.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/ILedgerRepository.hpp"
#include "ports/output/ITransactionRepository.hpp"
#include "ports/output/IUnitOfWork.hpp"

// Application
#include "application/TransactionEngine.hpp"
#include "application/WalletService.hpp"
#include "application/LedgerBootstrap.hpp"

// Secondary Adapters
#include "adapters/secondary/InMemoryLedgerStore.hpp"
#include "adapters/secondary/PostgresSchema.hpp"
#include "adapters/secondary/PostgresAssetTypeRepository.hpp"
#include "adapters/secondary/PostgresAccountRepository.hpp"
#include "adapters/secondary/PostgresLedgerRepository.hpp"
#include "adapters/secondary/PostgresTransactionRepository.hpp"
#include "adapters/secondary/PostgresUnitOfWork.hpp"

// Primary Adapters
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/CreateTransactionHandler.hpp"
#include "adapters/primary/GetTransactionHandler.hpp"
#include "adapters/primary/GetBalanceHandler.hpp"
#include "adapters/primary/GetHistoryHandler.hpp"
#include "adapters/primary/GetAccountsHandler.hpp"
#include "adapters/primary/GetUsersHandler.hpp"

#include <iostream>
#include <memory>

namespace di = boost::di;

namespace ledger
{

    /**
     * @brief Ledger Service Application
     *
     * Хранилище выбирается по LEDGER_STORAGE:
     * - postgres: репозитории и единица работы на libpqxx, схема создаётся при старте
     * - memory:   один InMemoryLedgerStore на все выходные порты
     *
     * HTTP: POST создаёт транзакции, GET читает транзакции, балансы, историю, счета.
     */
    class LedgerApp : public BoostBeastApplication
    {
    public:
        LedgerApp() { std::cout << "[LedgerApp] Initializing..." << std::endl; }
        ~LedgerApp() override { std::cout << "[LedgerApp] Shutting down..." << std::endl; }

    protected:
        void loadEnvironment(int argc, char *argv[]) override
        {
            BoostBeastApplication::loadEnvironment(argc, argv);
            std::cout << "[LedgerApp] Environment loaded" << std::endl;
        }

        void configureInjection() override
        {
            std::cout << "[LedgerApp] Configuring DI..." << std::endl;

            // Шаг 1: Настройки леджера нужны до выбора хранилища
            auto settingsInjector = di::make_injector(
                di::bind<settings::LedgerSettings>().in(di::singleton));
            auto ledgerSettings = settingsInjector.create<std::shared_ptr<settings::LedgerSettings>>();

            // Шаг 2: Injector под выбранное хранилище
            if (ledgerSettings->useInMemoryStorage())
            {
                std::cout << "[LedgerApp] Storage: in-memory" << std::endl;

                // Один экземпляр для всех выходных портов
                auto store = std::make_shared<adapters::secondary::InMemoryLedgerStore>(ledgerSettings);

                auto injector = di::make_injector(
                    di::bind<settings::LedgerSettings>().to(ledgerSettings),

                    di::bind<ports::output::IAssetTypeRepository>().to(store),
                    di::bind<ports::output::IAccountRepository>().to(store),
                    di::bind<ports::output::ILedgerRepository>().to(store),
                    di::bind<ports::output::ITransactionRepository>().to(store),
                    di::bind<ports::output::IUnitOfWorkFactory>().to(store),

                    di::bind<ports::input::ITransactionService>().to<application::TransactionEngine>().in(di::singleton),
                    di::bind<ports::input::IWalletService>().to<application::WalletService>().in(di::singleton));

                registerHandlers(injector);
            }
            else
            {
                std::cout << "[LedgerApp] Storage: PostgreSQL" << std::endl;

                auto injector = di::make_injector(
                    di::bind<settings::DbSettings>().in(di::singleton),
                    di::bind<settings::LedgerSettings>().to(ledgerSettings),

                    di::bind<ports::output::IAssetTypeRepository>()
                        .to<adapters::secondary::PostgresAssetTypeRepository>().in(di::singleton),
                    di::bind<ports::output::IAccountRepository>()
                        .to<adapters::secondary::PostgresAccountRepository>().in(di::singleton),
                    di::bind<ports::output::ILedgerRepository>()
                        .to<adapters::secondary::PostgresLedgerRepository>().in(di::singleton),
                    di::bind<ports::output::ITransactionRepository>()
                        .to<adapters::secondary::PostgresTransactionRepository>().in(di::singleton),
                    di::bind<ports::output::IUnitOfWorkFactory>()
                        .to<adapters::secondary::PostgresUnitOfWorkFactory>().in(di::singleton),

                    di::bind<ports::input::ITransactionService>().to<application::TransactionEngine>().in(di::singleton),
                    di::bind<ports::input::IWalletService>().to<application::WalletService>().in(di::singleton));

                injector.create<std::shared_ptr<adapters::secondary::PostgresSchema>>()->init();

                registerHandlers(injector);
            }

            std::cout << "[LedgerApp] Ready" << std::endl;
        }

    private:
        template <class Injector>
        void registerHandlers(Injector &injector)
        {
            // Шаг 3: Справочники, казначейство, сверка журнала
            auto bootstrap = injector.template create<std::shared_ptr<application::LedgerBootstrap>>();
            if (!bootstrap->run())
            {
                std::cerr << "[LedgerApp] Journal is not balanced, check reconciliation output" << std::endl;
            }

            // Шаг 4: HTTP Handlers
            handlers_[getHandlerKey("GET", "/health")] = injector.template create<std::shared_ptr<adapters::primary::HealthHandler>>();

            auto transactionService = injector.template create<std::shared_ptr<ports::input::ITransactionService>>();
            handlers_[getHandlerKey("POST", "/api/v1/transactions")] =
                std::make_shared<adapters::primary::CreateTransactionHandler>(transactionService);
            handlers_[getHandlerKey("POST", "/api/v1/transactions/topup")] =
                std::make_shared<adapters::primary::CreateTransactionHandler>(transactionService, domain::TransactionType::TOPUP);
            handlers_[getHandlerKey("POST", "/api/v1/transactions/bonus")] =
                std::make_shared<adapters::primary::CreateTransactionHandler>(transactionService, domain::TransactionType::BONUS);
            handlers_[getHandlerKey("POST", "/api/v1/transactions/spend")] =
                std::make_shared<adapters::primary::CreateTransactionHandler>(transactionService, domain::TransactionType::SPEND);
            handlers_[getHandlerKey("GET", "/api/v1/transactions/*")] =
                injector.template create<std::shared_ptr<adapters::primary::GetTransactionHandler>>();

            handlers_[getHandlerKey("GET", "/api/v1/balance")] =
                injector.template create<std::shared_ptr<adapters::primary::GetBalanceHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/history")] =
                injector.template create<std::shared_ptr<adapters::primary::GetHistoryHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/accounts")] =
                injector.template create<std::shared_ptr<adapters::primary::GetAccountsHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/users")] =
                injector.template create<std::shared_ptr<adapters::primary::GetUsersHandler>>();
        }
    };

} // namespace ledger
