#pragma once

#include "ports/output/IIdGenerator.hpp"
#include <deque>
#include <string>

namespace wallet::tests {

/**
 * @brief Предсказуемый генератор ID для тестов
 *
 * Сначала отдаёт заранее заданные ID (queue), затем "id-1", "id-2", ...
 */
class SequentialIdGenerator : public ports::output::IIdGenerator {
public:
    std::string generate() override {
        if (!queued_.empty()) {
            auto id = queued_.front();
            queued_.pop_front();
            return id;
        }
        return "id-" + std::to_string(++counter_);
    }

    void queue(const std::string& id) { queued_.push_back(id); }

    int generatedCount() const { return counter_; }

private:
    std::deque<std::string> queued_;
    int counter_ = 0;
};

} // namespace wallet::tests
