#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace wallet::adapters::secondary {

/**
 * @brief Общие операции плоских файлов для обоих форматов
 */
class FlatFile {
public:
    /**
     * @brief Прочитать файл целиком
     * @throws domain::WalletException (FILE_NOT_FOUND)
     */
    static std::string readAll(const std::string& path);

    /**
     * @brief Перезаписать файл строкой content
     *
     * Ошибка закрытия только логируется.
     *
     * @throws domain::WalletException (FILE_NOT_FOUND)
     */
    static void writeAll(const std::string& path, const std::string& content);

    /**
     * @brief Разрезать по разделителю и отбросить хвост после последнего
     *
     * "a|b|" -> {"a", "b"}; "" -> {}; "a|b" -> {"a"}.
     */
    static std::vector<std::string> splitRecords(const std::string& content, char terminator);

    static std::vector<std::string> splitFields(const std::string& record);

    /**
     * @brief Строгий разбор целого: вся строка должна быть числом
     * @throws domain::WalletException (PARSE_ERROR)
     */
    static int64_t parseInt(const std::string& field, const std::string& context);

    /**
     * @throws domain::WalletException (PARSE_ERROR) если полей меньше expected
     */
    static void requireFields(
        const std::vector<std::string>& fields,
        size_t expected,
        const std::string& context
    );
};

} // namespace wallet::adapters::secondary
