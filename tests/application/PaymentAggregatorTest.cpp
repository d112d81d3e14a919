/**
 * @file PaymentAggregatorTest.cpp
 * @brief Unit tests for PaymentAggregator
 */

#include <gtest/gtest.h>
#include "application/PaymentAggregator.hpp"

#include <system_error>
#include <thread>

using namespace wallet;
using wallet::application::PaymentAggregator;

namespace {

std::vector<domain::Payment> paymentsWithAmounts(std::initializer_list<domain::Money> amounts) {
    std::vector<domain::Payment> payments;
    int n = 0;
    for (auto amount : amounts) {
        payments.emplace_back("p-" + std::to_string(++n), 1, amount, "misc");
    }
    return payments;
}

} // namespace

// ============================================================================
// PARTITION TESTS
// ============================================================================

TEST(PaymentAggregatorTest, Partition_RemainderGoesToLastChunk) {
    auto chunks = PaymentAggregator::partition(5, 3);

    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].begin, 0u);
    EXPECT_EQ(chunks[0].end, 1u);
    EXPECT_EQ(chunks[1].begin, 1u);
    EXPECT_EQ(chunks[1].end, 2u);
    EXPECT_EQ(chunks[2].begin, 2u);
    EXPECT_EQ(chunks[2].end, 5u);
}

TEST(PaymentAggregatorTest, Partition_ZeroWorkers_SingleChunk) {
    auto chunks = PaymentAggregator::partition(7, 0);

    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].begin, 0u);
    EXPECT_EQ(chunks[0].end, 7u);
}

TEST(PaymentAggregatorTest, Partition_NegativeWorkers_SingleChunk) {
    auto chunks = PaymentAggregator::partition(4, -3);

    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].size(), 4u);
}

TEST(PaymentAggregatorTest, Partition_MoreWorkersThanPayments) {
    auto chunks = PaymentAggregator::partition(2, 5);

    ASSERT_EQ(chunks.size(), 5u);
    for (size_t i = 0; i < 4; ++i) {
        EXPECT_EQ(chunks[i].size(), 0u) << "chunk " << i;
    }
    EXPECT_EQ(chunks[4].begin, 0u);
    EXPECT_EQ(chunks[4].end, 2u);
}

TEST(PaymentAggregatorTest, Partition_CoversEveryIndexExactlyOnce) {
    for (int workers = 1; workers <= 12; ++workers) {
        auto chunks = PaymentAggregator::partition(37, workers);

        size_t covered = 0;
        size_t expectedBegin = 0;
        for (const auto& chunk : chunks) {
            EXPECT_EQ(chunk.begin, expectedBegin) << "workers=" << workers;
            expectedBegin = chunk.end;
            covered += chunk.size();
        }
        EXPECT_EQ(covered, 37u) << "workers=" << workers;
        EXPECT_EQ(chunks.size(), static_cast<size_t>(workers));
    }
}

// ============================================================================
// SUM TESTS
// ============================================================================

TEST(PaymentAggregatorTest, Sum_ZeroWorkers) {
    auto payments = paymentsWithAmounts({100, 250, 50});

    EXPECT_EQ(PaymentAggregator::sum(payments, 0), 400);
}

TEST(PaymentAggregatorTest, Sum_ThreeWorkers_UnevenSplit) {
    auto payments = paymentsWithAmounts({100, 250, 50, 10, 5});

    EXPECT_EQ(PaymentAggregator::sum(payments, 3), 415);
    EXPECT_EQ(PaymentAggregator::sum(payments, 1), 415);
    EXPECT_EQ(PaymentAggregator::sum(payments, 0), 415);
}

TEST(PaymentAggregatorTest, Sum_EmptyCollection) {
    std::vector<domain::Payment> payments;

    EXPECT_EQ(PaymentAggregator::sum(payments, 0), 0);
    EXPECT_EQ(PaymentAggregator::sum(payments, 4), 0);
}

TEST(PaymentAggregatorTest, Sum_ManyPayments_ManyWorkers) {
    std::vector<domain::Payment> payments;
    domain::Money expected = 0;
    for (int i = 1; i <= 10000; ++i) {
        payments.emplace_back("p-" + std::to_string(i), 1, i, "misc");
        expected += i;
    }

    for (int workers : {1, 2, 7, 16, 64}) {
        EXPECT_EQ(PaymentAggregator::sum(payments, workers), expected) << "workers=" << workers;
    }
}

// ============================================================================
// THREAD START FAILURE
// ============================================================================

namespace {

std::system_error threadLimitReached() {
    return std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
}

} // namespace

TEST(PaymentAggregatorTest, Sum_ThreadStartFails_RemainingChunksSummedInline) {
    auto payments = paymentsWithAmounts({100, 250, 50, 10, 5});
    int attempts = 0;

    auto total = PaymentAggregator::sum(payments, 5, [&attempts](auto task) {
        if (++attempts > 2) {
            throw threadLimitReached();
        }
        return std::thread(std::move(task));
    });

    EXPECT_EQ(total, 415);
    EXPECT_EQ(attempts, 3);
}

TEST(PaymentAggregatorTest, Sum_NoThreadCanStart_StillReturnsTotal) {
    auto payments = paymentsWithAmounts({100, 250, 50});

    auto total = PaymentAggregator::sum(payments, 3, [](auto task) -> std::thread {
        (void)task;
        throw threadLimitReached();
    });

    EXPECT_EQ(total, 400);
}

TEST(PaymentAggregatorTest, Sum_WorkersFarAboveCollectionSize) {
    auto payments = paymentsWithAmounts({1, 2, 3, 4, 5, 6, 7, 8, 9, 10});

    EXPECT_EQ(PaymentAggregator::sum(payments, 2000), 55);
}
