#pragma once

#include <string>

namespace wallet::ports::output {

/**
 * @brief Генератор уникальных идентификаторов платежей и шаблонов
 */
class IIdGenerator {
public:
    virtual ~IIdGenerator() = default;

    virtual std::string generate() = 0;
};

} // namespace wallet::ports::output
