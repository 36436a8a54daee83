#include <gtest/gtest.h>
#include "core/cache/result_cache.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

namespace
{
    FusionResult resultFor(const std::string &id, double confidence)
    {
        FusionResult result;
        result.document_id = id;
        result.overall_confidence = confidence;
        result.uncertainty = 100.0 - confidence;
        return result;
    }
}

TEST(ResultCacheTest, ComputesOnceAndServesFromCache)
{
    ResultCache cache;
    int runs = 0;
    auto compute = [&runs]()
    {
        ++runs;
        return resultFor("doc", 42.0);
    };

    bool computed = false;
    FusionResult first = cache.getOrCompute("doc", compute, &computed);
    EXPECT_TRUE(computed);

    FusionResult second = cache.getOrCompute("doc", compute, &computed);
    EXPECT_FALSE(computed);

    EXPECT_EQ(runs, 1);
    EXPECT_DOUBLE_EQ(second.overall_confidence, first.overall_confidence);
    EXPECT_TRUE(cache.contains("doc"));
    EXPECT_EQ(cache.size(), 1u);
    ASSERT_TRUE(cache.get("doc").has_value());
    EXPECT_FALSE(cache.get("other").has_value());
}

TEST(ResultCacheTest, ConcurrentCallersShareOneComputation)
{
    ResultCache cache;
    std::atomic<int> runs{0};
    auto compute = [&runs]()
    {
        runs.fetch_add(1);
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        return resultFor("shared", 77.0);
    };

    constexpr int kCallers = 10;
    std::atomic<int> computed_count{0};
    std::vector<double> seen(kCallers, -1.0);
    std::vector<std::thread> callers;
    for (int i = 0; i < kCallers; ++i)
    {
        callers.emplace_back([&, i]()
                             {
            bool computed = false;
            seen[i] = cache.getOrCompute("shared", compute, &computed).overall_confidence;
            if (computed)
                computed_count.fetch_add(1); });
    }
    for (auto &caller : callers)
        caller.join();

    EXPECT_EQ(runs.load(), 1);
    EXPECT_EQ(computed_count.load(), 1);
    for (double value : seen)
        EXPECT_DOUBLE_EQ(value, 77.0);
    EXPECT_EQ(cache.inFlight(), 0u);
}

TEST(ResultCacheTest, DistinctKeysComputeIndependently)
{
    ResultCache cache;
    cache.getOrCompute("a", []()
                       { return resultFor("a", 10.0); });
    cache.getOrCompute("b", []()
                       { return resultFor("b", 20.0); });

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_DOUBLE_EQ(cache.get("a")->overall_confidence, 10.0);
    EXPECT_DOUBLE_EQ(cache.get("b")->overall_confidence, 20.0);
}

TEST(ResultCacheTest, FailedComputationIsNotCached)
{
    ResultCache cache;
    EXPECT_THROW(cache.getOrCompute("doc", []() -> FusionResult
                                    { throw std::runtime_error("pipeline exploded"); }),
                 std::runtime_error);

    EXPECT_FALSE(cache.contains("doc"));
    EXPECT_EQ(cache.inFlight(), 0u);

    bool computed = false;
    cache.getOrCompute("doc", []()
                       { return resultFor("doc", 5.0); },
                       &computed);
    EXPECT_TRUE(computed);
    EXPECT_TRUE(cache.contains("doc"));
}

TEST(ResultCacheTest, ClearDropsEntries)
{
    ResultCache cache;
    int runs = 0;
    auto compute = [&runs]()
    {
        ++runs;
        return resultFor("doc", 1.0);
    };

    cache.getOrCompute("doc", compute);
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);

    cache.getOrCompute("doc", compute);
    EXPECT_EQ(runs, 2);
}
