#pragma once

#include "domain/Account.hpp"
#include "domain/Payment.hpp"
#include "domain/Favorite.hpp"
#include <string>
#include <vector>

namespace wallet::ports::input {

/**
 * @brief Интерфейс сервиса кошелька
 *
 * Все операции бросают domain::WalletException. Реализация не
 * потокобезопасна: вызовы должен сериализовать вызывающий.
 */
class IWalletService {
public:
    virtual ~IWalletService() = default;

    // ------------------------------------------------------------------
    // Счета и платежи
    // ------------------------------------------------------------------

    /**
     * @brief Зарегистрировать счёт с нулевым балансом
     * @throws PHONE_ALREADY_REGISTERED
     */
    virtual domain::Account registerAccount(const domain::Phone& phone) = 0;

    virtual domain::Account findAccountById(int64_t accountId) = 0;

    /**
     * @brief Найти платёж. При повторяющихся ID побеждает последний
     */
    virtual domain::Payment findPaymentById(const std::string& paymentId) = 0;

    virtual domain::Favorite findFavoriteById(const std::string& favoriteId) = 0;

    /**
     * @brief Списать amount со счёта и создать платёж
     * @throws AMOUNT_MUST_BE_POSITIVE если amount <= 0
     * @throws ACCOUNT_NOT_FOUND, NOT_ENOUGH_BALANCE
     */
    virtual domain::Payment pay(
        int64_t accountId,
        domain::Money amount,
        const domain::PaymentCategory& category
    ) = 0;

    /**
     * @brief Пополнить счёт. Ноль допустим, отрицательная сумма - нет
     */
    virtual void deposit(int64_t accountId, domain::Money amount) = 0;

    /**
     * @brief Отклонить платёж: статус FAIL и возврат суммы на счёт
     *
     * Предыдущий статус не проверяется, повторный вызов вернёт деньги ещё раз.
     */
    virtual void reject(const std::string& paymentId) = 0;

    /**
     * @brief Повторить платёж (новый ID, новое списание)
     */
    virtual domain::Payment repeat(const std::string& paymentId) = 0;

    virtual domain::Favorite favoritePayment(const std::string& paymentId, const std::string& name) = 0;

    virtual domain::Payment payFromFavorite(const std::string& favoriteId) = 0;

    // ------------------------------------------------------------------
    // Чтение коллекций
    // ------------------------------------------------------------------

    virtual std::vector<domain::Account> accounts() const = 0;
    virtual std::vector<domain::Payment> payments() const = 0;
    virtual std::vector<domain::Favorite> favorites() const = 0;

    /**
     * @brief Сумма всех платежей, посчитанная workerCount потоками
     *
     * workerCount <= 0 считается как 1.
     */
    virtual domain::Money sumPayments(int workerCount) const = 0;

    // ------------------------------------------------------------------
    // Сохранение
    // ------------------------------------------------------------------

    /**
     * @brief Выгрузить счета в один файл (id;phone;balance|...)
     */
    virtual void exportToFile(const std::string& path) = 0;

    /**
     * @brief Загрузить счета из файла exportToFile
     *
     * Всегда ДОБАВЛЯЕТ счета, дубликаты ID не проверяются.
     */
    virtual void importFromFile(const std::string& path) = 0;

    /**
     * @brief Записать непустые коллекции в accounts.dump, payments.dump, favorites.dump
     */
    virtual void exportDump(const std::string& dir) = 0;

    /**
     * @brief Загрузить дамп каталога, сливая записи по ID с существующими
     */
    virtual void importDump(const std::string& dir) = 0;
};

} // namespace wallet::ports::input
