#pragma once

#include "Types.hpp"
#include <string>

namespace wallet::domain {

/**
 * @brief Счёт пользователя, идентифицируемый номером телефона
 */
struct Account {
    int64_t id = 0;         ///< Порядковый номер, выдаётся сервисом
    Phone phone;            ///< Уникален на момент регистрации
    Money balance = 0;      ///< Текущий остаток

    Account() = default;

    Account(int64_t id, const Phone& phone, Money balance = 0)
        : id(id), phone(phone), balance(balance) {}
};

} // namespace wallet::domain
