#pragma once

#include "ports/output/ILedgerDumpStorage.hpp"
#include <string>

namespace wallet::adapters::secondary {

/**
 * @brief Дамп реестра в каталог: accounts.dump, payments.dump, favorites.dump
 *
 * Строка на запись, поля через ';', каждая строка завершается '\n'.
 *   accounts:  id;phone;balance
 *   payments:  id;accountId;amount;category;status
 *   favorites: id;accountId;amount;category
 *
 * Имя шаблона в дамп не попадает.
 */
class DumpDirectoryStorage : public ports::output::ILedgerDumpStorage {
public:
    static constexpr const char* ACCOUNTS_FILE = "accounts.dump";
    static constexpr const char* PAYMENTS_FILE = "payments.dump";
    static constexpr const char* FAVORITES_FILE = "favorites.dump";

    void writeAccounts(const std::string& dir, const std::vector<domain::Account>& accounts) override;
    void writePayments(const std::string& dir, const std::vector<domain::Payment>& payments) override;
    void writeFavorites(const std::string& dir, const std::vector<domain::Favorite>& favorites) override;

    bool readAccounts(const std::string& dir, const Sink<domain::Account>& sink) override;
    bool readPayments(const std::string& dir, const Sink<domain::Payment>& sink) override;
    bool readFavorites(const std::string& dir, const Sink<domain::Favorite>& sink) override;

    static std::string filePath(const std::string& dir, const char* fileName);

private:
    /**
     * @brief Прочитать строки файла, если он существует
     * @return false если файла нет
     */
    static bool readLines(const std::string& path, std::vector<std::string>& lines);
};

} // namespace wallet::adapters::secondary
