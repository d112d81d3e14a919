#pragma once

#include "ports/input/IWalletService.hpp"
#include "ports/output/IIdGenerator.hpp"
#include "ports/output/IAccountExportFile.hpp"
#include "ports/output/ILedgerDumpStorage.hpp"
#include <memory>
#include <vector>

namespace wallet::application {

/**
 * @brief Сервис кошелька: единственный владелец счетов, платежей и шаблонов
 *
 * Коллекции хранятся в порядке добавления, поиск - линейный проход.
 * Вторичных индексов нет намеренно: findPaymentById при повторяющихся
 * ID возвращает последний добавленный платёж.
 *
 * Внутренней синхронизации нет. Исключение - sumPayments, который
 * только читает payments_ из нескольких потоков.
 *
 * Адаптеры хранения своего состояния не держат: при выгрузке получают
 * коллекции, при загрузке отдают записи по одной, а решение
 * "добавить или слить по ID" принимает сервис.
 */
class WalletService : public ports::input::IWalletService {
public:
    WalletService(
        std::shared_ptr<ports::output::IIdGenerator> idGenerator,
        std::shared_ptr<ports::output::IAccountExportFile> exportFile,
        std::shared_ptr<ports::output::ILedgerDumpStorage> dumpStorage
    );

    domain::Account registerAccount(const domain::Phone& phone) override;
    domain::Account findAccountById(int64_t accountId) override;
    domain::Payment findPaymentById(const std::string& paymentId) override;
    domain::Favorite findFavoriteById(const std::string& favoriteId) override;

    domain::Payment pay(
        int64_t accountId,
        domain::Money amount,
        const domain::PaymentCategory& category
    ) override;

    void deposit(int64_t accountId, domain::Money amount) override;
    void reject(const std::string& paymentId) override;
    domain::Payment repeat(const std::string& paymentId) override;
    domain::Favorite favoritePayment(const std::string& paymentId, const std::string& name) override;
    domain::Payment payFromFavorite(const std::string& favoriteId) override;

    std::vector<domain::Account> accounts() const override { return accounts_; }
    std::vector<domain::Payment> payments() const override { return payments_; }
    std::vector<domain::Favorite> favorites() const override { return favorites_; }

    domain::Money sumPayments(int workerCount) const override;

    void exportToFile(const std::string& path) override;
    void importFromFile(const std::string& path) override;
    void exportDump(const std::string& dir) override;
    void importDump(const std::string& dir) override;

private:
    std::shared_ptr<ports::output::IIdGenerator> idGenerator_;
    std::shared_ptr<ports::output::IAccountExportFile> exportFile_;
    std::shared_ptr<ports::output::ILedgerDumpStorage> dumpStorage_;

    int64_t nextAccountId_ = 0;
    std::vector<domain::Account> accounts_;
    std::vector<domain::Payment> payments_;
    std::vector<domain::Favorite> favorites_;

    domain::Account& accountRef(int64_t accountId);
    domain::Payment& paymentRef(const std::string& paymentId);
    domain::Favorite& favoriteRef(const std::string& favoriteId);

    /**
     * @brief Не выдавать при регистрации ID, уже пришедшие из файла
     */
    void reserveAccountId(int64_t accountId);
};

} // namespace wallet::application
