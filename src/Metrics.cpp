#include <localsync/cache/Metrics.hpp>

#include <iomanip>
#include <sstream>

namespace localsync::cache
{
    void CacheMetricsMonitor::record_query(std::chrono::nanoseconds elapsed, QueryOutcome outcome) noexcept
    {
        if (outcome == QueryOutcome::NotReady)
        {
            notReady_.fetch_add(1, std::memory_order_relaxed);
            return;
        }

        const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count();
        totalQueryMicros_.fetch_add(static_cast<std::uint64_t>(micros > 0 ? micros : 0),
                                    std::memory_order_relaxed);
        queries_.fetch_add(1, std::memory_order_relaxed);

        switch (outcome)
        {
        case QueryOutcome::Hit:
            hits_.fetch_add(1, std::memory_order_relaxed);
            break;
        case QueryOutcome::Failed:
            readFailures_.fetch_add(1, std::memory_order_relaxed);
            misses_.fetch_add(1, std::memory_order_relaxed);
            break;
        default:
            misses_.fetch_add(1, std::memory_order_relaxed);
            break;
        }
    }

    CacheMetrics CacheMetricsMonitor::snapshot() const noexcept
    {
        CacheMetrics m;
        m.hitCount = hits_.load(std::memory_order_relaxed);
        m.missCount = misses_.load(std::memory_order_relaxed);
        m.totalQueries = queries_.load(std::memory_order_relaxed);

        const auto micros = totalQueryMicros_.load(std::memory_order_relaxed);
        m.averageQueryTime = m.totalQueries == 0
                                 ? 0.0
                                 : static_cast<double>(micros) / 1000.0 / static_cast<double>(m.totalQueries);

        m.lastCleanup = lastCleanup_.load(std::memory_order_relaxed);
        m.isReady = ready_.load(std::memory_order_acquire);
        m.notReadyCount = notReady_.load(std::memory_order_relaxed);
        m.readFailures = readFailures_.load(std::memory_order_relaxed);
        m.writeRetries = writeRetries_.load(std::memory_order_relaxed);
        m.writeFailures = writeFailures_.load(std::memory_order_relaxed);
        m.rowsEvicted = rowsEvicted_.load(std::memory_order_relaxed);
        return m;
    }

    std::string CacheMetricsMonitor::render_prometheus() const
    {
        const auto m = snapshot();
        std::ostringstream os;

        os << "# HELP localsync_cache_queries_total Total cache reads that reached the store\n"
           << "# TYPE localsync_cache_queries_total counter\n"
           << "localsync_cache_queries_total " << m.totalQueries << "\n\n"

           << "# HELP localsync_cache_hits_total Reads that returned at least one row\n"
           << "# TYPE localsync_cache_hits_total counter\n"
           << "localsync_cache_hits_total " << m.hitCount << "\n\n"

           << "# HELP localsync_cache_misses_total Reads that returned nothing or failed\n"
           << "# TYPE localsync_cache_misses_total counter\n"
           << "localsync_cache_misses_total " << m.missCount << "\n\n"

           << "# HELP localsync_cache_read_failures_total Reads that failed in the store\n"
           << "# TYPE localsync_cache_read_failures_total counter\n"
           << "localsync_cache_read_failures_total " << m.readFailures << "\n\n"

           << "# HELP localsync_cache_not_ready_total Reads rejected before the store was open\n"
           << "# TYPE localsync_cache_not_ready_total counter\n"
           << "localsync_cache_not_ready_total " << m.notReadyCount << "\n\n";

        os << std::fixed << std::setprecision(3)
           << "# HELP localsync_cache_query_time_avg_ms Mean read latency in milliseconds\n"
           << "# TYPE localsync_cache_query_time_avg_ms gauge\n"
           << "localsync_cache_query_time_avg_ms " << m.averageQueryTime << "\n\n"

           << "# HELP localsync_cache_success_rate Percentage of reads that were hits\n"
           << "# TYPE localsync_cache_success_rate gauge\n"
           << "localsync_cache_success_rate " << m.successRate() << "\n\n";

        os << "# HELP localsync_cache_write_retries_total Write attempts retried on lock contention\n"
           << "# TYPE localsync_cache_write_retries_total counter\n"
           << "localsync_cache_write_retries_total " << m.writeRetries << "\n\n"

           << "# HELP localsync_cache_write_failures_total Write units that exhausted their retries\n"
           << "# TYPE localsync_cache_write_failures_total counter\n"
           << "localsync_cache_write_failures_total " << m.writeFailures << "\n\n"

           << "# HELP localsync_cache_rows_evicted_total Rows removed by the retention sweep\n"
           << "# TYPE localsync_cache_rows_evicted_total counter\n"
           << "localsync_cache_rows_evicted_total " << m.rowsEvicted << "\n\n"

           << "# HELP localsync_cache_last_cleanup_ms Time of the last retention sweep (ms since epoch)\n"
           << "# TYPE localsync_cache_last_cleanup_ms gauge\n"
           << "localsync_cache_last_cleanup_ms " << m.lastCleanup << "\n\n"

           << "# HELP localsync_cache_ready Whether the store finished opening\n"
           << "# TYPE localsync_cache_ready gauge\n"
           << "localsync_cache_ready " << (m.isReady ? 1 : 0) << "\n";

        return os.str();
    }

} // namespace localsync::cache
