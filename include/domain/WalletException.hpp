#pragma once

#include <stdexcept>
#include <string>

namespace wallet::domain {

/**
 * @brief Вид ошибки кошелька
 */
enum class ErrorKind {
    PHONE_ALREADY_REGISTERED,
    AMOUNT_MUST_BE_POSITIVE,
    ACCOUNT_NOT_FOUND,
    NOT_ENOUGH_BALANCE,
    PAYMENT_NOT_FOUND,
    FAVORITE_NOT_FOUND,
    FILE_NOT_FOUND,     ///< Любая ошибка открытия/чтения/записи файла
    PARSE_ERROR         ///< Повреждённая запись в файле
};

inline std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::PHONE_ALREADY_REGISTERED: return "PHONE_ALREADY_REGISTERED";
        case ErrorKind::AMOUNT_MUST_BE_POSITIVE:  return "AMOUNT_MUST_BE_POSITIVE";
        case ErrorKind::ACCOUNT_NOT_FOUND:        return "ACCOUNT_NOT_FOUND";
        case ErrorKind::NOT_ENOUGH_BALANCE:       return "NOT_ENOUGH_BALANCE";
        case ErrorKind::PAYMENT_NOT_FOUND:        return "PAYMENT_NOT_FOUND";
        case ErrorKind::FAVORITE_NOT_FOUND:       return "FAVORITE_NOT_FOUND";
        case ErrorKind::FILE_NOT_FOUND:           return "FILE_NOT_FOUND";
        case ErrorKind::PARSE_ERROR:              return "PARSE_ERROR";
    }
    return "UNKNOWN";
}

/**
 * @brief Текст ошибки по умолчанию
 */
inline std::string defaultMessage(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::PHONE_ALREADY_REGISTERED: return "phone already registered";
        case ErrorKind::AMOUNT_MUST_BE_POSITIVE:  return "amount must be greater than zero";
        case ErrorKind::ACCOUNT_NOT_FOUND:        return "account not found";
        case ErrorKind::NOT_ENOUGH_BALANCE:       return "account not enough balance";
        case ErrorKind::PAYMENT_NOT_FOUND:        return "payment not found";
        case ErrorKind::FAVORITE_NOT_FOUND:       return "favorite not found";
        case ErrorKind::FILE_NOT_FOUND:           return "file not found";
        case ErrorKind::PARSE_ERROR:              return "parse error";
    }
    return "unknown error";
}

/**
 * @brief Исключение, выбрасываемое операциями кошелька
 *
 * Вызывающий код различает ошибки по kind(), текст - для логов и ответа.
 */
class WalletException : public std::runtime_error {
public:
    explicit WalletException(ErrorKind kind)
        : std::runtime_error(defaultMessage(kind)), kind_(kind) {}

    WalletException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace wallet::domain
