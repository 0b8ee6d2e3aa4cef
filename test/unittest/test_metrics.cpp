/**
 * @file test_metrics.cpp
 * @brief Query counters, derived rates and the text exposition.
 */

#include <gtest/gtest.h>

#include <localsync/cache/Metrics.hpp>

using namespace localsync::cache;
using namespace std::chrono_literals;

TEST(CacheMetricsMonitorTest, EmptySnapshot)
{
    CacheMetricsMonitor monitor;
    auto m = monitor.snapshot();

    EXPECT_EQ(m.totalQueries, 0u);
    EXPECT_DOUBLE_EQ(m.successRate(), 0.0);
    EXPECT_DOUBLE_EQ(m.averageQueryTime, 0.0);
    EXPECT_FALSE(m.isReady);
}

TEST(CacheMetricsMonitorTest, CountsHitsAndMisses)
{
    CacheMetricsMonitor monitor;
    monitor.record_query(2ms, QueryOutcome::Hit);
    monitor.record_query(4ms, QueryOutcome::Hit);
    monitor.record_query(6ms, QueryOutcome::Hit);
    monitor.record_query(8ms, QueryOutcome::Miss);

    auto m = monitor.snapshot();
    EXPECT_EQ(m.hitCount, 3u);
    EXPECT_EQ(m.missCount, 1u);
    EXPECT_EQ(m.totalQueries, 4u);
    EXPECT_DOUBLE_EQ(m.successRate(), 75.0);
    EXPECT_DOUBLE_EQ(m.averageQueryTime, 5.0);
}

TEST(CacheMetricsMonitorTest, FailedReadIsAMiss)
{
    CacheMetricsMonitor monitor;
    monitor.record_query(1ms, QueryOutcome::Failed);

    auto m = monitor.snapshot();
    EXPECT_EQ(m.totalQueries, 1u);
    EXPECT_EQ(m.missCount, 1u);
    EXPECT_EQ(m.readFailures, 1u);
}

TEST(CacheMetricsMonitorTest, NotReadyIsNotAQuery)
{
    CacheMetricsMonitor monitor;
    monitor.record_query(0ns, QueryOutcome::NotReady);
    monitor.record_query(0ns, QueryOutcome::NotReady);

    auto m = monitor.snapshot();
    EXPECT_EQ(m.totalQueries, 0u);
    EXPECT_EQ(m.missCount, 0u);
    EXPECT_EQ(m.notReadyCount, 2u);
}

TEST(CacheMetricsMonitorTest, WriteAndSweepCounters)
{
    CacheMetricsMonitor monitor;
    monitor.record_write_retry();
    monitor.record_write_retry();
    monitor.record_write_failure();
    monitor.record_eviction(7);
    monitor.set_last_cleanup(1234);
    monitor.set_ready(true);

    auto m = monitor.snapshot();
    EXPECT_EQ(m.writeRetries, 2u);
    EXPECT_EQ(m.writeFailures, 1u);
    EXPECT_EQ(m.rowsEvicted, 7u);
    EXPECT_EQ(m.lastCleanup, 1234);
    EXPECT_TRUE(m.isReady);
    EXPECT_TRUE(monitor.ready());
}

TEST(CacheMetricsMonitorTest, PrometheusExposition)
{
    CacheMetricsMonitor monitor;
    monitor.record_query(1ms, QueryOutcome::Hit);
    monitor.record_eviction(3);
    monitor.set_ready(true);

    const auto text = monitor.render_prometheus();
    EXPECT_NE(text.find("# TYPE localsync_cache_queries_total counter"), std::string::npos);
    EXPECT_NE(text.find("localsync_cache_hits_total 1\n"), std::string::npos);
    EXPECT_NE(text.find("localsync_cache_rows_evicted_total 3\n"), std::string::npos);
    EXPECT_NE(text.find("localsync_cache_success_rate 100.000"), std::string::npos);
    EXPECT_NE(text.find("localsync_cache_ready 1\n"), std::string::npos);
}
