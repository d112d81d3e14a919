#pragma once

#include <string>
#include <stdexcept>

namespace wallet::domain {

/**
 * @brief Статус платежа
 *
 * Успешное завершение отдельного статуса не имеет: платёж остаётся
 * INPROGRESS, пока его не отклонят.
 */
enum class PaymentStatus {
    IN_PROGRESS,    ///< Проведён, деньги списаны
    FAIL            ///< Отклонён, деньги возвращены на счёт
};

/**
 * @brief Преобразовать в строку (в этом виде статус пишется в payments.dump)
 */
inline std::string toString(PaymentStatus status) {
    switch (status) {
        case PaymentStatus::IN_PROGRESS: return "INPROGRESS";
        case PaymentStatus::FAIL:        return "FAIL";
    }
    return "UNKNOWN";
}

/**
 * @brief Создать из строки
 * @throws std::invalid_argument если строка не распознана
 */
inline PaymentStatus paymentStatusFromString(const std::string& str) {
    if (str == "INPROGRESS") return PaymentStatus::IN_PROGRESS;
    if (str == "FAIL")       return PaymentStatus::FAIL;
    throw std::invalid_argument("Unknown PaymentStatus: " + str);
}

} // namespace wallet::domain
