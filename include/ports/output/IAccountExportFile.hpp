#pragma once

#include "domain/Account.hpp"
#include <functional>
#include <string>
#include <vector>

namespace wallet::ports::output {

/**
 * @brief Output Port: выгрузка счетов в один файл
 *
 * Формат: `id;phone;balance|id;phone;balance|` - без перевода строки.
 */
class IAccountExportFile {
public:
    using AccountSink = std::function<void(const domain::Account&)>;

    virtual ~IAccountExportFile() = default;

    /**
     * @brief Перезаписать файл списком счетов
     *
     * @throws domain::WalletException (FILE_NOT_FOUND) если файл не открыть
     */
    virtual void writeAccounts(
        const std::string& path,
        const std::vector<domain::Account>& accounts
    ) = 0;

    /**
     * @brief Прочитать файл и передать каждый счёт в sink по порядку
     *
     * Счета отдаются по одному по мере разбора: если запись повреждена,
     * уже переданные остаются у получателя.
     *
     * @throws domain::WalletException (FILE_NOT_FOUND, PARSE_ERROR)
     */
    virtual void readAccounts(const std::string& path, const AccountSink& sink) = 0;
};

} // namespace wallet::ports::output
