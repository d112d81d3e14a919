#pragma once

#include "ports/output/IIdGenerator.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace wallet::adapters::secondary {

/**
 * @brief Идентификаторы платежей и шаблонов: случайный UUID версии 4
 */
class UuidGenerator : public ports::output::IIdGenerator {
public:
    std::string generate() override {
        auto bytes = randomBytes();
        bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);  // версия 4
        bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);  // вариант RFC 4122

        std::ostringstream out;
        out << std::hex << std::setfill('0');
        for (std::size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                out << '-';
            }
            out << std::setw(2) << static_cast<int>(bytes[i]);
        }
        return out.str();
    }

private:
    static std::array<uint8_t, 16> randomBytes() {
        thread_local std::mt19937_64 engine{std::random_device{}()};

        std::array<uint8_t, 16> bytes{};
        for (std::size_t i = 0; i < bytes.size(); i += 8) {
            const uint64_t word = engine();
            for (std::size_t j = 0; j < 8; ++j) {
                bytes[i + j] = static_cast<uint8_t>(word >> (8 * j));
            }
        }
        return bytes;
    }
};

} // namespace wallet::adapters::secondary
