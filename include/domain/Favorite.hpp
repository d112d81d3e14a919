#pragma once

#include "Types.hpp"
#include <string>

namespace wallet::domain {

/**
 * @brief Избранный платёж: шаблон для повторной оплаты
 *
 * Создаётся из существующего платежа и больше не меняется.
 */
struct Favorite {
    std::string id;             ///< UUID шаблона
    int64_t accountId = 0;      ///< Счёт, с которого платить
    std::string name;           ///< Название ("Интернет", "Мама")
    Money amount = 0;
    PaymentCategory category;

    Favorite() = default;

    Favorite(
        const std::string& id,
        int64_t accountId,
        const std::string& name,
        Money amount,
        const PaymentCategory& category
    ) : id(id), accountId(accountId), name(name),
        amount(amount), category(category) {}
};

} // namespace wallet::domain
