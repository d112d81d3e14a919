#include "application/WalletService.hpp"
#include "application/PaymentAggregator.hpp"
#include "domain/WalletException.hpp"

#include <algorithm>
#include <iostream>

namespace wallet::application {

using domain::ErrorKind;
using domain::WalletException;

WalletService::WalletService(
    std::shared_ptr<ports::output::IIdGenerator> idGenerator,
    std::shared_ptr<ports::output::IAccountExportFile> exportFile,
    std::shared_ptr<ports::output::ILedgerDumpStorage> dumpStorage
) : idGenerator_(std::move(idGenerator))
  , exportFile_(std::move(exportFile))
  , dumpStorage_(std::move(dumpStorage))
{
    std::cout << "[WalletService] Created" << std::endl;
}

// ============================================================================
// ACCOUNTS
// ============================================================================

domain::Account WalletService::registerAccount(const domain::Phone& phone) {
    for (const auto& account : accounts_) {
        if (account.phone == phone) {
            throw WalletException(ErrorKind::PHONE_ALREADY_REGISTERED);
        }
    }

    ++nextAccountId_;
    accounts_.emplace_back(nextAccountId_, phone, 0);

    std::cout << "[WalletService] Registered account " << nextAccountId_
              << " phone=" << phone << std::endl;
    return accounts_.back();
}

domain::Account WalletService::findAccountById(int64_t accountId) {
    return accountRef(accountId);
}

domain::Payment WalletService::findPaymentById(const std::string& paymentId) {
    return paymentRef(paymentId);
}

domain::Favorite WalletService::findFavoriteById(const std::string& favoriteId) {
    return favoriteRef(favoriteId);
}

void WalletService::deposit(int64_t accountId, domain::Money amount) {
    // Ноль разрешён, в отличие от pay()
    if (amount < 0) {
        throw WalletException(ErrorKind::AMOUNT_MUST_BE_POSITIVE);
    }

    auto& account = accountRef(accountId);
    account.balance += amount;
}

// ============================================================================
// PAYMENTS
// ============================================================================

domain::Payment WalletService::pay(
    int64_t accountId,
    domain::Money amount,
    const domain::PaymentCategory& category
) {
    if (amount <= 0) {
        throw WalletException(ErrorKind::AMOUNT_MUST_BE_POSITIVE);
    }

    auto& account = accountRef(accountId);
    if (account.balance < amount) {
        throw WalletException(ErrorKind::NOT_ENOUGH_BALANCE);
    }

    account.balance -= amount;

    payments_.emplace_back(idGenerator_->generate(), accountId, amount, category);

    std::cout << "[WalletService] Payment " << payments_.back().id
              << " account=" << accountId << " amount=" << amount << std::endl;
    return payments_.back();
}

void WalletService::reject(const std::string& paymentId) {
    auto& payment = paymentRef(paymentId);
    auto& account = accountRef(payment.accountId);

    // Статус не проверяется: повторный reject вернёт сумму ещё раз
    payment.status = domain::PaymentStatus::FAIL;
    account.balance += payment.amount;

    std::cout << "[WalletService] Rejected payment " << paymentId
              << " refund=" << payment.amount << std::endl;
}

domain::Payment WalletService::repeat(const std::string& paymentId) {
    // Копия: pay() добавляет в payments_ и может инвалидировать ссылку
    const domain::Payment original = paymentRef(paymentId);
    return pay(original.accountId, original.amount, original.category);
}

domain::Favorite WalletService::favoritePayment(const std::string& paymentId, const std::string& name) {
    const auto& payment = paymentRef(paymentId);

    favorites_.emplace_back(
        idGenerator_->generate(),
        payment.accountId,
        name,
        payment.amount,
        payment.category
    );
    return favorites_.back();
}

domain::Payment WalletService::payFromFavorite(const std::string& favoriteId) {
    const auto& favorite = favoriteRef(favoriteId);
    return pay(favorite.accountId, favorite.amount, favorite.category);
}

domain::Money WalletService::sumPayments(int workerCount) const {
    return PaymentAggregator::sum(payments_, workerCount);
}

// ============================================================================
// FORMAT A: id;phone;balance|
// ============================================================================

void WalletService::exportToFile(const std::string& path) {
    exportFile_->writeAccounts(path, accounts_);
    std::cout << "[WalletService] Exported " << accounts_.size()
              << " accounts to " << path << std::endl;
}

void WalletService::importFromFile(const std::string& path) {
    size_t imported = 0;

    // Только добавление, без проверки дубликатов
    exportFile_->readAccounts(path, [this, &imported](const domain::Account& account) {
        accounts_.push_back(account);
        reserveAccountId(account.id);
        ++imported;
    });

    std::cout << "[WalletService] Imported " << imported
              << " accounts from " << path << std::endl;
}

// ============================================================================
// FORMAT B: <dir>/accounts.dump, payments.dump, favorites.dump
// ============================================================================

void WalletService::exportDump(const std::string& dir) {
    if (!accounts_.empty()) {
        dumpStorage_->writeAccounts(dir, accounts_);
    }
    if (!payments_.empty()) {
        dumpStorage_->writePayments(dir, payments_);
    }
    if (!favorites_.empty()) {
        dumpStorage_->writeFavorites(dir, favorites_);
    }

    std::cout << "[WalletService] Dumped to " << dir
              << ": accounts=" << accounts_.size()
              << " payments=" << payments_.size()
              << " favorites=" << favorites_.size() << std::endl;
}

void WalletService::importDump(const std::string& dir) {
    dumpStorage_->readAccounts(dir, [this](const domain::Account& record) {
        bool merged = false;
        for (auto& account : accounts_) {
            if (account.id == record.id) {
                account.phone = record.phone;
                account.balance = record.balance;
                merged = true;
            }
        }
        if (!merged) {
            accounts_.push_back(record);
        }
        reserveAccountId(record.id);
    });

    dumpStorage_->readPayments(dir, [this](const domain::Payment& record) {
        bool merged = false;
        for (auto& payment : payments_) {
            if (payment.id == record.id) {
                payment.accountId = record.accountId;
                payment.amount = record.amount;
                payment.category = record.category;
                payment.status = record.status;
                merged = true;
            }
        }
        if (!merged) {
            payments_.push_back(record);
        }
    });

    dumpStorage_->readFavorites(dir, [this](const domain::Favorite& record) {
        bool merged = false;
        for (auto& favorite : favorites_) {
            if (favorite.id == record.id) {
                // Имя в дамп не пишется, поэтому сохраняем текущее
                favorite.accountId = record.accountId;
                favorite.amount = record.amount;
                favorite.category = record.category;
                merged = true;
            }
        }
        if (!merged) {
            favorites_.push_back(record);
        }
    });

    std::cout << "[WalletService] Loaded dump from " << dir
              << ": accounts=" << accounts_.size()
              << " payments=" << payments_.size()
              << " favorites=" << favorites_.size() << std::endl;
}

// ============================================================================
// LOOKUPS
// ============================================================================

domain::Account& WalletService::accountRef(int64_t accountId) {
    for (auto& account : accounts_) {
        if (account.id == accountId) {
            return account;
        }
    }
    throw WalletException(ErrorKind::ACCOUNT_NOT_FOUND);
}

domain::Payment& WalletService::paymentRef(const std::string& paymentId) {
    // Последнее совпадение
    auto it = std::find_if(payments_.rbegin(), payments_.rend(),
        [&paymentId](const domain::Payment& p) { return p.id == paymentId; });

    if (it == payments_.rend()) {
        throw WalletException(ErrorKind::PAYMENT_NOT_FOUND);
    }
    return *it;
}

domain::Favorite& WalletService::favoriteRef(const std::string& favoriteId) {
    for (auto& favorite : favorites_) {
        if (favorite.id == favoriteId) {
            return favorite;
        }
    }
    throw WalletException(ErrorKind::FAVORITE_NOT_FOUND);
}

void WalletService::reserveAccountId(int64_t accountId) {
    nextAccountId_ = std::max(nextAccountId_, accountId);
}

} // namespace wallet::application
