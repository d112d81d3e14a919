#pragma once

#include <cstdint>
#include <string>

namespace wallet::domain {

/**
 * @brief Денежная сумма в минимальных единицах валюты (дирамы, копейки)
 *
 * Знаковое целое без защиты от переполнения.
 */
using Money = int64_t;

using Phone = std::string;            ///< Номер телефона владельца счёта
using PaymentCategory = std::string;  ///< Категория платежа ("auto", "mobile", ...)

} // namespace wallet::domain
