#pragma once

#include "domain/Account.hpp"
#include "domain/Payment.hpp"
#include "domain/Favorite.hpp"
#include <functional>
#include <string>
#include <vector>

namespace wallet::ports::output {

/**
 * @brief Output Port: дамп реестра в каталог, по файлу на тип сущности
 *
 * accounts.dump, payments.dump, favorites.dump - одна запись на строку,
 * поля через ';'.
 */
class ILedgerDumpStorage {
public:
    template <typename T>
    using Sink = std::function<void(const T&)>;

    virtual ~ILedgerDumpStorage() = default;

    /**
     * @brief Перезаписать <dir>/accounts.dump
     * @throws domain::WalletException (FILE_NOT_FOUND)
     */
    virtual void writeAccounts(const std::string& dir, const std::vector<domain::Account>& accounts) = 0;
    virtual void writePayments(const std::string& dir, const std::vector<domain::Payment>& payments) = 0;
    virtual void writeFavorites(const std::string& dir, const std::vector<domain::Favorite>& favorites) = 0;

    /**
     * @brief Прочитать <dir>/accounts.dump, отдавая записи в sink по одной
     *
     * @return false если файла нет (это не ошибка)
     * @throws domain::WalletException (FILE_NOT_FOUND, PARSE_ERROR)
     */
    virtual bool readAccounts(const std::string& dir, const Sink<domain::Account>& sink) = 0;
    virtual bool readPayments(const std::string& dir, const Sink<domain::Payment>& sink) = 0;
    virtual bool readFavorites(const std::string& dir, const Sink<domain::Favorite>& sink) = 0;
};

} // namespace wallet::ports::output
