#pragma once

#include <cstdlib>
#include <string>

namespace wallet::settings {

/**
 * @brief Настройки кошелька
 *
 * Читает из ENV:
 * - WALLET_DATA_DIR (default: data) - каталог дампа
 * - WALLET_EXPORT_FILE (default: data/export.txt) - файл экспорта счетов
 * - WALLET_SUM_WORKERS (default: 4) - потоков для sum без аргумента
 */
class WalletSettings {
public:
    WalletSettings() {
        dataDir_ = getEnvOrDefault("WALLET_DATA_DIR", "data");
        exportFile_ = getEnvOrDefault("WALLET_EXPORT_FILE", dataDir_ + "/export.txt");
        if (const char* val = std::getenv("WALLET_SUM_WORKERS")) {
            sumWorkers_ = std::stoi(val);
        }
    }

    std::string getDataDir() const { return dataDir_; }
    std::string getExportFile() const { return exportFile_; }
    int getSumWorkers() const { return sumWorkers_; }

private:
    std::string dataDir_;
    std::string exportFile_;
    int sumWorkers_ = 4;

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? value : defaultValue;
    }
};

} // namespace wallet::settings
