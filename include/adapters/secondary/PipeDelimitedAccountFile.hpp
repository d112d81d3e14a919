#pragma once

#include "ports/output/IAccountExportFile.hpp"

namespace wallet::adapters::secondary {

/**
 * @brief Файл экспорта счетов: `id;phone;balance|...`
 *
 * Каждая запись завершается '|', перевода строки нет. Экранирования
 * нет: телефон с ';' или '|' портит файл.
 */
class PipeDelimitedAccountFile : public ports::output::IAccountExportFile {
public:
    static constexpr char RECORD_TERMINATOR = '|';

    void writeAccounts(
        const std::string& path,
        const std::vector<domain::Account>& accounts
    ) override;

    void readAccounts(const std::string& path, const AccountSink& sink) override;

    /**
     * @brief Сериализовать счета в строку файла
     */
    static std::string encode(const std::vector<domain::Account>& accounts);
};

} // namespace wallet::adapters::secondary
