#pragma once

#include <boost/di.hpp>

// Ports
#include "ports/input/ILedgerService.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "ports/output/IAccountNumberGenerator.hpp"

// Application
#include "application/LedgerService.hpp"

// Secondary Adapters
#include "adapters/secondary/PostgresLedgerStore.hpp"
#include "adapters/secondary/InMemoryLedgerStore.hpp"
#include "adapters/secondary/RandomAccountNumberGenerator.hpp"

// Primary Adapters
#include "adapters/primary/LedgerCommandHandler.hpp"

// Settings
#include "settings/DbSettings.hpp"
#include "settings/LedgerSettings.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace di = boost::di;

namespace ledger {

/**
 * @brief Ledger CLI Application
 *
 * Template Method:
 * 1. loadEnvironment()     - настройки из ENV
 * 2. configureInjection()  - граф объектов через Boost.DI
 * 3. execute()             - одна команда из argv или по команде на строку из stdin
 */
class LedgerApp {
public:
    LedgerApp() {
        std::cout << "[LedgerApp] Initializing..." << std::endl;
    }

    int run(int argc, char* argv[]) {
        loadEnvironment();
        configureInjection();
        return execute(argc, argv);
    }

private:
    std::shared_ptr<settings::LedgerSettings> ledgerSettings_;
    std::shared_ptr<adapters::primary::LedgerCommandHandler> handler_;

    void loadEnvironment() {
        ledgerSettings_ = std::make_shared<settings::LedgerSettings>();
        std::cout << "[LedgerApp] Environment loaded, store backend: "
                  << ledgerSettings_->getStoreBackend() << std::endl;
    }

    void configureInjection() {
        std::cout << "[LedgerApp] Configuring Boost.DI injection..." << std::endl;

        if (ledgerSettings_->getStoreBackend() == "memory") {
            handler_ = createHandler(
                di::bind<ports::output::ILedgerStore>()
                    .to<adapters::secondary::InMemoryLedgerStore>()
                    .in(di::singleton)
            );
        } else {
            handler_ = createHandler(
                di::bind<settings::DbSettings>()
                    .to(std::make_shared<settings::DbSettings>()),

                di::bind<ports::output::ILedgerStore>()
                    .to<adapters::secondary::PostgresLedgerStore>()
                    .in(di::singleton)
            );
        }

        std::cout << "[LedgerApp] DI Injector configured" << std::endl;
    }

    /**
     * @brief Собрать обработчик; привязки хранилища передаются снаружи
     */
    template <typename... StoreBindings>
    std::shared_ptr<adapters::primary::LedgerCommandHandler> createHandler(StoreBindings&&... storeBindings) {
        auto injector = di::make_injector(

            // ================================================================
            // Layer 1: Settings
            // ================================================================
            di::bind<settings::ILedgerSettings>()
                .to(std::static_pointer_cast<settings::ILedgerSettings>(ledgerSettings_)),

            // ================================================================
            // Layer 2: Secondary Adapters (Output Ports implementations)
            // ================================================================
            std::forward<StoreBindings>(storeBindings)...,

            di::bind<ports::output::IAccountNumberGenerator>()
                .to<adapters::secondary::RandomAccountNumberGenerator>()
                .in(di::singleton),

            // ================================================================
            // Layer 3: Application Services (Input Ports implementations)
            // ================================================================
            di::bind<ports::input::ILedgerService>()
                .to<application::LedgerService>()
                .in(di::singleton)
        );

        // Layer 4: Primary Adapter
        return injector.template create<std::shared_ptr<adapters::primary::LedgerCommandHandler>>();
    }

    int execute(int argc, char* argv[]) {
        if (argc > 1) {
            std::vector<std::string> args(argv + 1, argv + argc);
            return respond(handler_->handle(args));
        }

        // Пакетный режим: имеет смысл для LEDGER_STORE=memory
        std::cout << "[LedgerApp] Reading commands from stdin" << std::endl;
        int lastStatus = adapters::primary::CommandResponse::OK;
        std::string line;
        while (std::getline(std::cin, line)) {
            if (line.empty() || line[0] == '#') {
                continue;
            }

            adapters::primary::CommandResponse response;
            try {
                response = handler_->handle(adapters::primary::LedgerCommandHandler::tokenize(line));
            } catch (const std::invalid_argument& e) {
                response.status = adapters::primary::CommandResponse::USAGE_ERROR;
                response.body["error"] = "USAGE";
                response.body["message"] = e.what();
            }
            lastStatus = respond(response);
        }
        return lastStatus;
    }

    static int respond(const adapters::primary::CommandResponse& response) {
        if (response.status == adapters::primary::CommandResponse::OK) {
            std::cout << response.render() << std::endl;
        } else {
            std::cerr << response.render() << std::endl;
        }
        return response.status;
    }
};

} // namespace ledger
