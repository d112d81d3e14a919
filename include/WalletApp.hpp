#pragma once

#include <boost/di.hpp>

// Ports
#include "ports/input/IWalletService.hpp"
#include "ports/output/IIdGenerator.hpp"
#include "ports/output/IAccountExportFile.hpp"
#include "ports/output/ILedgerDumpStorage.hpp"

// Application
#include "application/WalletService.hpp"

// Secondary Adapters
#include "adapters/secondary/UuidGenerator.hpp"
#include "adapters/secondary/PipeDelimitedAccountFile.hpp"
#include "adapters/secondary/DumpDirectoryStorage.hpp"
#include "settings/WalletSettings.hpp"

// Primary Adapters
#include "adapters/primary/CommandHandler.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace di = boost::di;

namespace wallet {

/**
 * @brief Wallet CLI Application
 *
 * Один запуск - одна команда:
 * 1. loadEnvironment() - настройки из ENV
 * 2. configureInjection() - Boost.DI: порты -> адаптеры
 * 3. run() - загрузка дампа, команда, запись дампа
 *
 * Результат команды печатается в stdout как JSON, логи идут туда же
 * построчно с префиксом [Component], ошибки - в stderr.
 */
class WalletApp {
public:
    WalletApp() {
        std::cout << "[WalletApp] Initializing..." << std::endl;
    }

    ~WalletApp() {
        std::cout << "[WalletApp] Shutting down..." << std::endl;
    }

    int run(int argc, char* argv[]) {
        loadEnvironment();
        configureInjection();

        const auto dataDir = settings_->getDataDir();
        std::filesystem::create_directories(dataDir);

        try {
            walletService_->importDump(dataDir);
        } catch (const domain::WalletException& e) {
            std::cerr << "[WalletApp] Cannot load dump from " << dataDir << ": " << e.what() << std::endl;
            return 1;
        }

        std::vector<std::string> args(argv + 1, argv + argc);
        auto result = commandHandler_->handle(args);

        if (result.exitCode == 0 && result.modified) {
            try {
                walletService_->exportDump(dataDir);
            } catch (const domain::WalletException& e) {
                std::cerr << "[WalletApp] Cannot save dump to " << dataDir << ": " << e.what() << std::endl;
                return 1;
            }
        }

        std::cout << result.body.dump(2) << std::endl;
        return result.exitCode;
    }

protected:
    void loadEnvironment() {
        settings_ = std::make_shared<settings::WalletSettings>();
        std::cout << "[WalletApp] Environment loaded: data_dir=" << settings_->getDataDir()
                  << " export_file=" << settings_->getExportFile()
                  << " sum_workers=" << settings_->getSumWorkers() << std::endl;
    }

    void configureInjection() {
        std::cout << "[WalletApp] Configuring Boost.DI injection..." << std::endl;

        auto injector = di::make_injector(

            // ================================================================
            // Layer 1: Settings
            // ================================================================
            di::bind<settings::WalletSettings>().to(settings_),

            // ================================================================
            // Layer 2: Secondary Adapters (Output Ports implementations)
            // ================================================================
            di::bind<ports::output::IIdGenerator>()
                .to<adapters::secondary::UuidGenerator>()
                .in(di::singleton),

            di::bind<ports::output::IAccountExportFile>()
                .to<adapters::secondary::PipeDelimitedAccountFile>()
                .in(di::singleton),

            di::bind<ports::output::ILedgerDumpStorage>()
                .to<adapters::secondary::DumpDirectoryStorage>()
                .in(di::singleton),

            // ================================================================
            // Layer 3: Application Services (Input Ports implementations)
            // ================================================================
            di::bind<ports::input::IWalletService>()
                .to<application::WalletService>()
                .in(di::singleton)
        );

        walletService_ = injector.create<std::shared_ptr<ports::input::IWalletService>>();
        commandHandler_ = injector.create<std::shared_ptr<adapters::primary::CommandHandler>>();

        std::cout << "[WalletApp] DI Injector configured" << std::endl;
    }

private:
    std::shared_ptr<settings::WalletSettings> settings_;
    std::shared_ptr<ports::input::IWalletService> walletService_;
    std::shared_ptr<adapters::primary::CommandHandler> commandHandler_;
};

} // namespace wallet
