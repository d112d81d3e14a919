#pragma once

#include "Types.hpp"
#include "enums/PaymentStatus.hpp"
#include <string>

namespace wallet::domain {

/**
 * @brief Платёж, списанный со счёта
 */
struct Payment {
    std::string id;             ///< UUID платежа
    int64_t accountId = 0;      ///< FK на accounts
    Money amount = 0;           ///< Сумма, всегда > 0 при создании
    PaymentCategory category;   ///< Произвольная метка
    PaymentStatus status;       ///< INPROGRESS / FAIL

    Payment() : status(PaymentStatus::IN_PROGRESS) {}

    Payment(
        const std::string& id,
        int64_t accountId,
        Money amount,
        const PaymentCategory& category,
        PaymentStatus status = PaymentStatus::IN_PROGRESS
    ) : id(id), accountId(accountId), amount(amount),
        category(category), status(status) {}
};

} // namespace wallet::domain
