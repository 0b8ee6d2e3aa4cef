#ifndef LOCALSYNC_CACHE_METRICS_HPP
#define LOCALSYNC_CACHE_METRICS_HPP

/**
 * @file Metrics.hpp
 * @brief Lock-free health counters for the cache.
 *
 * The read path records every query here; the serializer records retries
 * and exhausted writes; the sweeper records evicted rows. Nothing in this
 * file blocks, so recording a sample never slows down a read.
 *
 * Typical usage
 * -------------
 * @code{.cpp}
 * localsync::cache::CacheMetricsMonitor monitor;
 *
 * auto t0 = std::chrono::steady_clock::now();
 * auto rows = store.query_messages("c1", 50);
 * monitor.record_query(std::chrono::steady_clock::now() - t0,
 *                      rows.empty() ? QueryOutcome::Miss : QueryOutcome::Hit);
 *
 * auto snap = monitor.snapshot();
 * // snap.successRate, snap.averageQueryTime ...
 * @endcode
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include <localsync/cache/types.hpp>

namespace localsync::cache
{
    enum class QueryOutcome
    {
        Hit,     ///< query returned at least one row
        Miss,    ///< query ran and returned nothing
        Failed,  ///< query threw; counted as a miss as well
        NotReady ///< store not open; not counted as a query
    };

    /// Point-in-time copy of the monitor counters.
    struct CacheMetrics
    {
        std::uint64_t hitCount = 0;
        std::uint64_t missCount = 0;
        std::uint64_t totalQueries = 0;
        double averageQueryTime = 0.0; ///< ms, cumulative mean
        Timestamp lastCleanup = 0;
        bool isReady = false;

        std::uint64_t notReadyCount = 0;
        std::uint64_t readFailures = 0;
        std::uint64_t writeRetries = 0;
        std::uint64_t writeFailures = 0;
        std::uint64_t rowsEvicted = 0;

        /// hitCount / totalQueries * 100, 0 when nothing was queried.
        [[nodiscard]] double successRate() const noexcept
        {
            return totalQueries == 0
                       ? 0.0
                       : static_cast<double>(hitCount) * 100.0 / static_cast<double>(totalQueries);
        }
    };

    /**
     * @class CacheMetricsMonitor
     * @brief Atomic counters shared by the read path, the serializer and the sweeper.
     */
    class CacheMetricsMonitor
    {
    public:
        void record_query(std::chrono::nanoseconds elapsed, QueryOutcome outcome) noexcept;

        void record_write_retry() noexcept { writeRetries_.fetch_add(1, std::memory_order_relaxed); }
        void record_write_failure() noexcept { writeFailures_.fetch_add(1, std::memory_order_relaxed); }
        void record_eviction(std::uint64_t rows) noexcept { rowsEvicted_.fetch_add(rows, std::memory_order_relaxed); }

        void set_ready(bool ready) noexcept { ready_.store(ready, std::memory_order_release); }
        [[nodiscard]] bool ready() const noexcept { return ready_.load(std::memory_order_acquire); }

        void set_last_cleanup(Timestamp ts) noexcept { lastCleanup_.store(ts, std::memory_order_relaxed); }

        [[nodiscard]] CacheMetrics snapshot() const noexcept;

        /// Prometheus text exposition (v0.0.4) of every counter.
        [[nodiscard]] std::string render_prometheus() const;

    private:
        std::atomic<std::uint64_t> hits_{0};
        std::atomic<std::uint64_t> misses_{0};
        std::atomic<std::uint64_t> queries_{0};
        std::atomic<std::uint64_t> totalQueryMicros_{0};
        std::atomic<std::uint64_t> notReady_{0};
        std::atomic<std::uint64_t> readFailures_{0};
        std::atomic<std::uint64_t> writeRetries_{0};
        std::atomic<std::uint64_t> writeFailures_{0};
        std::atomic<std::uint64_t> rowsEvicted_{0};
        std::atomic<Timestamp> lastCleanup_{0};
        std::atomic<bool> ready_{false};
    };

} // namespace localsync::cache

#endif // LOCALSYNC_CACHE_METRICS_HPP
