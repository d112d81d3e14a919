#pragma once

#include "domain/Payment.hpp"
#include <cstddef>
#include <iostream>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace wallet::application {

/**
 * @brief Параллельное суммирование платежей
 *
 * Коллекция режется на workerCount непрерывных кусков размером
 * size / workerCount, остаток целиком уходит в последний кусок.
 * На каждый кусок - отдельный поток, частичные суммы складываются
 * под мьютексом. Вызов блокируется до завершения всех потоков.
 */
class PaymentAggregator {
public:
    /**
     * @brief Полуинтервал [begin, end) индексов платежей
     */
    struct Chunk {
        std::size_t begin = 0;
        std::size_t end = 0;

        std::size_t size() const { return end - begin; }
    };

    /**
     * @brief Разбить count элементов на max(1, workerCount) кусков
     */
    static std::vector<Chunk> partition(std::size_t count, int workerCount) {
        const std::size_t workers = workerCount > 0 ? static_cast<std::size_t>(workerCount) : 1;
        const std::size_t chunkSize = count / workers;

        std::vector<Chunk> chunks;
        chunks.reserve(workers);
        for (std::size_t i = 0; i + 1 < workers; ++i) {
            chunks.push_back({i * chunkSize, (i + 1) * chunkSize});
        }
        chunks.push_back({(workers - 1) * chunkSize, count});
        return chunks;
    }

    static domain::Money sum(const std::vector<domain::Payment>& payments, int workerCount) {
        return sum(payments, workerCount, [](auto task) { return std::thread(std::move(task)); });
    }

    /**
     * @brief Суммирование с заданным способом запуска потоков
     *
     * spawn(task) должен вернуть std::thread, выполняющий task.
     * Если очередной поток не создаётся (std::system_error), уже запущенные
     * продолжают работу, а оставшиеся куски считаются в вызывающем потоке.
     * Все запущенные потоки присоединяются до возврата.
     */
    template <typename Spawn>
    static domain::Money sum(const std::vector<domain::Payment>& payments, int workerCount, Spawn spawn) {
        const auto chunks = partition(payments.size(), workerCount);

        std::mutex mutex;
        domain::Money total = 0;

        auto sumChunk = [&payments, &mutex, &total](Chunk chunk) {
            domain::Money subtotal = 0;
            for (std::size_t i = chunk.begin; i < chunk.end; ++i) {
                subtotal += payments[i].amount;
            }

            std::lock_guard<std::mutex> lock(mutex);
            total += subtotal;
        };

        std::vector<std::thread> workers;
        workers.reserve(chunks.size());

        std::size_t started = 0;
        try {
            for (; started < chunks.size(); ++started) {
                const Chunk chunk = chunks[started];
                workers.push_back(spawn([&sumChunk, chunk]() { sumChunk(chunk); }));
            }
        } catch (const std::system_error& e) {
            std::cerr << "[PaymentAggregator] Started " << started << " of " << chunks.size()
                      << " threads (" << e.what() << "), summing the rest inline" << std::endl;
        }

        for (std::size_t i = started; i < chunks.size(); ++i) {
            sumChunk(chunks[i]);
        }

        for (auto& worker : workers) {
            worker.join();
        }

        return total;
    }
};

} // namespace wallet::application
