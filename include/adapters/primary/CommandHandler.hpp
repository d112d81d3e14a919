#pragma once

#include "ports/input/IWalletService.hpp"
#include "settings/WalletSettings.hpp"
#include "domain/WalletException.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace wallet::adapters::primary {

/**
 * @brief Результат выполнения команды
 */
struct CommandResult {
    int exitCode = 0;       ///< 0 - успех, 1 - ошибка кошелька, 2 - неверные аргументы
    bool modified = false;  ///< Команда изменила состояние, дамп нужно перезаписать
    nlohmann::json body;
};

/**
 * @brief Primary adapter: команда командной строки -> IWalletService -> JSON
 *
 *   register <phone>
 *   deposit <accountId> <amount>
 *   pay <accountId> <amount> <category>
 *   reject <paymentId>
 *   repeat <paymentId>
 *   favorite <paymentId> <name>
 *   pay-favorite <favoriteId>
 *   account <accountId> | payment <paymentId> | favorite-info <favoriteId>
 *   list
 *   sum [workers]
 *   export-file [path] | import-file [path]
 *   demo
 */
class CommandHandler {
public:
    CommandHandler(
        std::shared_ptr<ports::input::IWalletService> walletService,
        std::shared_ptr<settings::WalletSettings> settings
    ) : walletService_(std::move(walletService))
      , settings_(std::move(settings))
    {
        std::cout << "[CommandHandler] Created" << std::endl;
    }

    CommandResult handle(const std::vector<std::string>& args) {
        if (args.empty()) {
            return usageError("command is required");
        }

        const std::string& command = args[0];
        const std::vector<std::string> params(args.begin() + 1, args.end());

        try {
            if (command == "register") {
                requireParams(params, 1, "register <phone>");
                return modified(toJson(walletService_->registerAccount(params[0])));
            }
            if (command == "deposit") {
                requireParams(params, 2, "deposit <accountId> <amount>");
                auto accountId = parseNumber(params[0], "accountId");
                walletService_->deposit(accountId, parseNumber(params[1], "amount"));
                return modified(toJson(walletService_->findAccountById(accountId)));
            }
            if (command == "pay") {
                requireParams(params, 3, "pay <accountId> <amount> <category>");
                return modified(toJson(walletService_->pay(
                    parseNumber(params[0], "accountId"),
                    parseNumber(params[1], "amount"),
                    params[2])));
            }
            if (command == "reject") {
                requireParams(params, 1, "reject <paymentId>");
                walletService_->reject(params[0]);
                return modified(toJson(walletService_->findPaymentById(params[0])));
            }
            if (command == "repeat") {
                requireParams(params, 1, "repeat <paymentId>");
                return modified(toJson(walletService_->repeat(params[0])));
            }
            if (command == "favorite") {
                requireParams(params, 2, "favorite <paymentId> <name>");
                return modified(toJson(walletService_->favoritePayment(params[0], params[1])));
            }
            if (command == "pay-favorite") {
                requireParams(params, 1, "pay-favorite <favoriteId>");
                return modified(toJson(walletService_->payFromFavorite(params[0])));
            }
            if (command == "account") {
                requireParams(params, 1, "account <accountId>");
                return ok(toJson(walletService_->findAccountById(parseNumber(params[0], "accountId"))));
            }
            if (command == "payment") {
                requireParams(params, 1, "payment <paymentId>");
                return ok(toJson(walletService_->findPaymentById(params[0])));
            }
            if (command == "favorite-info") {
                requireParams(params, 1, "favorite-info <favoriteId>");
                return ok(toJson(walletService_->findFavoriteById(params[0])));
            }
            if (command == "list") {
                return ok(listAll());
            }
            if (command == "sum") {
                int workers = settings_->getSumWorkers();
                if (!params.empty()) {
                    const auto requested = parseNumber(params[0], "workers");
                    if (requested < std::numeric_limits<int>::min() || requested > std::numeric_limits<int>::max()) {
                        throw std::invalid_argument("'workers' is out of range, got '" + params[0] + "'");
                    }
                    workers = static_cast<int>(requested);
                }
                nlohmann::json response;
                response["workers"] = workers;
                response["total"] = walletService_->sumPayments(workers);
                return ok(response);
            }
            if (command == "export-file") {
                const auto path = params.empty() ? settings_->getExportFile() : params[0];
                walletService_->exportToFile(path);
                return ok({{"exported", walletService_->accounts().size()}, {"path", path}});
            }
            if (command == "import-file") {
                const auto path = params.empty() ? settings_->getExportFile() : params[0];
                walletService_->importFromFile(path);
                return modified({{"accounts", walletService_->accounts().size()}, {"path", path}});
            }
            if (command == "demo") {
                return modified(runDemo());
            }

            return usageError("unknown command: " + command);

        } catch (const domain::WalletException& e) {
            return walletError(e);
        } catch (const std::invalid_argument& e) {
            return usageError(e.what());
        }
    }

    // ------------------------------------------------------------------
    // JSON mapping
    // ------------------------------------------------------------------

    static nlohmann::json toJson(const domain::Account& account) {
        return {
            {"id", account.id},
            {"phone", account.phone},
            {"balance", account.balance}
        };
    }

    static nlohmann::json toJson(const domain::Payment& payment) {
        return {
            {"id", payment.id},
            {"account_id", payment.accountId},
            {"amount", payment.amount},
            {"category", payment.category},
            {"status", domain::toString(payment.status)}
        };
    }

    static nlohmann::json toJson(const domain::Favorite& favorite) {
        return {
            {"id", favorite.id},
            {"account_id", favorite.accountId},
            {"name", favorite.name},
            {"amount", favorite.amount},
            {"category", favorite.category}
        };
    }

private:
    std::shared_ptr<ports::input::IWalletService> walletService_;
    std::shared_ptr<settings::WalletSettings> settings_;

    nlohmann::json listAll() const {
        nlohmann::json response;
        response["accounts"] = nlohmann::json::array();
        response["payments"] = nlohmann::json::array();
        response["favorites"] = nlohmann::json::array();

        for (const auto& a : walletService_->accounts()) response["accounts"].push_back(toJson(a));
        for (const auto& p : walletService_->payments()) response["payments"].push_back(toJson(p));
        for (const auto& f : walletService_->favorites()) response["favorites"].push_back(toJson(f));
        return response;
    }

    /**
     * @brief Три тестовых счёта и выгрузка в файл экспорта
     */
    nlohmann::json runDemo() {
        nlohmann::json response;
        response["accounts"] = nlohmann::json::array();

        for (const char* phone : {"+992000000001", "+992000000002", "+992000000003"}) {
            response["accounts"].push_back(toJson(walletService_->registerAccount(phone)));
        }

        walletService_->exportToFile(settings_->getExportFile());
        response["path"] = settings_->getExportFile();
        return response;
    }

    static void requireParams(const std::vector<std::string>& params, size_t count, const std::string& usage) {
        if (params.size() < count) {
            throw std::invalid_argument("usage: " + usage);
        }
    }

    static int64_t parseNumber(const std::string& value, const std::string& name) {
        try {
            size_t pos = 0;
            int64_t result = std::stoll(value, &pos);
            if (pos != value.size()) {
                throw std::invalid_argument("trailing characters");
            }
            return result;
        } catch (const std::logic_error&) {
            throw std::invalid_argument("'" + name + "' must be an integer, got '" + value + "'");
        }
    }

    static CommandResult ok(nlohmann::json body) {
        return CommandResult{0, false, std::move(body)};
    }

    static CommandResult modified(nlohmann::json body) {
        return CommandResult{0, true, std::move(body)};
    }

    static CommandResult walletError(const domain::WalletException& e) {
        nlohmann::json error;
        error["error"] = e.what();
        error["kind"] = domain::toString(e.kind());
        return CommandResult{1, false, error};
    }

    static CommandResult usageError(const std::string& message) {
        nlohmann::json error;
        error["error"] = message;
        error["kind"] = "INVALID_ARGUMENT";
        return CommandResult{2, false, error};
    }
};

} // namespace wallet::adapters::primary
