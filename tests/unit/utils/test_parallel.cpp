//
// Created by gregorian-rayne on 1/23/26.
//

#include "depmap/utils/parallel.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <numeric>
#include <stdexcept>
#include <thread>

namespace depmap::parallel
{
    TEST(ThreadPoolTest, RunsSubmittedTasks) {
        ThreadPool pool(4);
        EXPECT_EQ(pool.size(), 4u);

        auto first = pool.submit([] { return 21 * 2; });
        auto second = pool.submit([] { return std::string("done"); });

        EXPECT_EQ(first.get(), 42);
        EXPECT_EQ(second.get(), "done");
    }

    TEST(ThreadPoolTest, DestructionDrainsQueue) {
        std::atomic<int> counter{0};
        {
            ThreadPool pool(2);
            for (int i = 0; i < 100; ++i) {
                (void)pool.submit([&counter] { ++counter; });
            }
        }
        EXPECT_EQ(counter.load(), 100);
    }

    TEST(ThreadPoolTest, DefaultUsesHardwareConcurrency) {
        const ThreadPool pool;
        EXPECT_EQ(pool.size(), hardware_concurrency());
    }

    TEST(ParallelMapTest, PreservesOrder) {
        std::vector<int> items(200);
        std::iota(items.begin(), items.end(), 0);

        const auto squares = map(items, [](const int x) { return x * x; }, 8u);

        ASSERT_EQ(squares.size(), items.size());
        for (std::size_t i = 0; i < items.size(); ++i) {
            EXPECT_EQ(squares[i], items[i] * items[i]);
        }
    }

    TEST(ParallelMapTest, SingleThreadRunsInline) {
        const std::vector<std::string> items{"a", "bb", "ccc"};

        const auto lengths = map(items, [](const std::string& s) { return s.size(); }, 1u);

        EXPECT_EQ(lengths, (std::vector<std::size_t>{1, 2, 3}));
    }

    TEST(ParallelMapTest, EmptyInput) {
        const std::vector<int> items;
        EXPECT_TRUE(map(items, [](const int x) { return x; }, 4u).empty());
    }

    TEST(ParallelMapTest, ExplicitPool) {
        ThreadPool pool(3);
        const std::vector<int> items{1, 2, 3, 4};

        EXPECT_EQ(map(items, [](const int x) { return x + 1; }, pool), (std::vector<int>{2, 3, 4, 5}));
    }

    TEST(ParallelMapTest, FailureWaitsForEveryChunk) {
        ThreadPool pool(2);
        const std::vector<int> items{0, 1, 2, 3, 4, 5, 6, 7};
        std::atomic<int> finished{0};

        EXPECT_THROW((void)map(items, [&finished](const int item) {
            if (item == 0) {
                throw std::runtime_error("extraction failed");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            return ++finished;
        }, pool), std::runtime_error);

        EXPECT_EQ(finished.load(), 7);
    }
}  // namespace depmap::parallel
