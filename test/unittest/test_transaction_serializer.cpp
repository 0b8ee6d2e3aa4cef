/**
 * @file test_transaction_serializer.cpp
 * @brief FIFO ordering, contention retries and shutdown of the write queue.
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <localsync/cache/Metrics.hpp>
#include <localsync/cache/TransactionSerializer.hpp>
#include <localsync/cache/errors.hpp>

using namespace localsync::cache;
using namespace std::chrono_literals;

namespace
{
    RetryPolicy fast_policy(int attempts = 3)
    {
        return RetryPolicy{attempts, 1ms};
    }
}

TEST(RetryPolicyTest, DelayIsLinear)
{
    RetryPolicy policy;
    EXPECT_EQ(policy.maxAttempts, 3);
    EXPECT_EQ(policy.delay(1), 100ms);
    EXPECT_EQ(policy.delay(2), 200ms);
    EXPECT_EQ(policy.delay(3), 300ms);
}

TEST(TransactionSerializerTest, ReturnsUnitValue)
{
    TransactionSerializer serializer{fast_policy()};

    auto fut = serializer.submit([] { return 42; });
    EXPECT_EQ(fut.get(), 42);
}

TEST(TransactionSerializerTest, RunsUnitsInSubmissionOrder)
{
    TransactionSerializer serializer{fast_policy()};

    std::vector<int> order;
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 50; ++i)
        futures.push_back(serializer.submit([&order, i] { order.push_back(i); }));

    for (auto &f : futures)
        f.get();

    ASSERT_EQ(order.size(), 50u);
    for (int i = 0; i < 50; ++i)
        EXPECT_EQ(order[i], i);
}

TEST(TransactionSerializerTest, NeverRunsTwoUnitsAtOnce)
{
    TransactionSerializer serializer{fast_policy()};

    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    std::vector<std::future<void>> futures;

    std::vector<std::thread> producers;
    std::mutex futuresMutex;
    for (int t = 0; t < 4; ++t)
    {
        producers.emplace_back(
            [&]
            {
                for (int i = 0; i < 25; ++i)
                {
                    auto f = serializer.submit(
                        [&]
                        {
                            int now = ++active;
                            int seen = peak.load();
                            while (now > seen && !peak.compare_exchange_weak(seen, now))
                            {
                            }
                            std::this_thread::sleep_for(100us);
                            --active;
                        });
                    std::lock_guard<std::mutex> lock(futuresMutex);
                    futures.push_back(std::move(f));
                }
            });
    }
    for (auto &p : producers)
        p.join();
    for (auto &f : futures)
        f.get();

    EXPECT_EQ(futures.size(), 100u);
    EXPECT_EQ(peak.load(), 1);
}

TEST(TransactionSerializerTest, OtherExceptionsAreNotRetried)
{
    TransactionSerializer serializer{fast_policy()};

    int calls = 0;
    auto fut = serializer.submit(
        [&]() -> int
        {
            ++calls;
            throw ValidationError("missing sender");
        });

    EXPECT_THROW(fut.get(), ValidationError);
    EXPECT_EQ(calls, 1);
}

TEST(TransactionSerializerTest, RetriesContentionThenSucceeds)
{
    CacheMetricsMonitor metrics;
    TransactionSerializer serializer{fast_policy(), &metrics};

    int calls = 0;
    auto fut = serializer.submit(
        [&]
        {
            if (++calls < 3)
                throw WriteContention("database is locked");
            return calls;
        });

    EXPECT_EQ(fut.get(), 3);
    EXPECT_EQ(metrics.snapshot().writeRetries, 2u);
    EXPECT_EQ(metrics.snapshot().writeFailures, 0u);
}

TEST(TransactionSerializerTest, ExhaustedRetriesReportWriteFailedAndQueueContinues)
{
    CacheMetricsMonitor metrics;
    TransactionSerializer serializer{fast_policy(3), &metrics};

    int calls = 0;
    auto failing = serializer.submit(
        [&]
        {
            ++calls;
            throw WriteContention("database is locked");
        },
        "stuck write");
    auto next = serializer.submit([] { return std::string("after"); });

    try
    {
        failing.get();
        FAIL() << "expected WriteFailed";
    }
    catch (const WriteFailed &e)
    {
        EXPECT_EQ(e.attempts(), 3);
        EXPECT_NE(std::string(e.what()).find("stuck write"), std::string::npos);
    }

    EXPECT_EQ(calls, 3);
    EXPECT_EQ(next.get(), "after");

    auto snap = metrics.snapshot();
    EXPECT_EQ(snap.writeRetries, 2u);
    EXPECT_EQ(snap.writeFailures, 1u);
}

TEST(TransactionSerializerTest, SingleAttemptPolicyFailsImmediately)
{
    TransactionSerializer serializer{fast_policy(1)};

    auto fut = serializer.submit([]
                                 { throw WriteContention("busy"); });
    EXPECT_THROW(fut.get(), WriteFailed);
}

TEST(TransactionSerializerTest, DrainWaitsForQueuedUnits)
{
    TransactionSerializer serializer{fast_policy()};

    std::atomic<int> done{0};
    for (int i = 0; i < 10; ++i)
    {
        // futures intentionally dropped; drain() is the only synchronization
        (void)serializer.submit([&]
                                {
                                    std::this_thread::sleep_for(1ms);
                                    ++done;
                                });
    }

    serializer.drain();
    EXPECT_EQ(done.load(), 10);
}

TEST(TransactionSerializerTest, UnitsRunOnTheStrand)
{
    TransactionSerializer serializer{fast_policy()};

    EXPECT_FALSE(serializer.running_in_this_thread());
    auto fut = serializer.submit([&] { return serializer.running_in_this_thread(); });
    EXPECT_TRUE(fut.get());
}

TEST(TransactionSerializerTest, StopIsIdempotentAndRejectsLaterUnits)
{
    TransactionSerializer serializer{fast_policy()};

    std::atomic<bool> ran{false};
    auto queued = serializer.submit([&] { ran = true; });

    serializer.stop();
    serializer.stop();

    EXPECT_TRUE(serializer.stopped());
    EXPECT_NO_THROW(queued.get());
    EXPECT_TRUE(ran.load());

    auto rejected = serializer.submit([] { return 1; });
    EXPECT_THROW(rejected.get(), StorageUnavailable);

    EXPECT_NO_THROW(serializer.drain());
}

TEST(TransactionSerializerTest, SubmitRacingStopEitherRunsOrIsRejected)
{
    for (int round = 0; round < 20; ++round)
    {
        TransactionSerializer serializer{fast_policy()};

        std::atomic<bool> go{false};
        std::mutex futuresMutex;
        std::vector<std::future<int>> futures;

        std::vector<std::thread> submitters;
        for (int t = 0; t < 4; ++t)
        {
            submitters.emplace_back(
                [&, t]
                {
                    while (!go.load())
                        std::this_thread::yield();
                    for (int i = 0; i < 50; ++i)
                    {
                        auto f = serializer.submit([t] { return t; });
                        std::lock_guard<std::mutex> lock(futuresMutex);
                        futures.push_back(std::move(f));
                    }
                });
        }

        go = true;
        serializer.stop();
        for (auto &s : submitters)
            s.join();

        for (auto &f : futures)
        {
            try
            {
                EXPECT_GE(f.get(), 0);
            }
            catch (const StorageUnavailable &)
            {
            }
        }
    }
}
