#ifndef LOCALSYNC_CACHE_RETENTION_SWEEPER_HPP
#define LOCALSYNC_CACHE_RETENTION_SWEEPER_HPP

/**
 * @file RetentionSweeper.hpp
 * @brief Periodic reclaim of old, fully synced messages.
 *
 * A sweep removes rows that are SYNCED, not pinned and whose localTimestamp
 * is older than the retention window. PENDING and FAILED rows survive
 * whatever their age. It then purges expired user profiles, refreshes the
 * cursor counts of touched conversations, compacts the file and stamps
 * lastCleanup.
 *
 * The timer lives on the serializer strand, so a scheduled sweep is just
 * another write unit in the FIFO.
 */

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>

#include <boost/asio/steady_timer.hpp>

#include <localsync/cache/MessageStore.hpp>
#include <localsync/cache/TransactionSerializer.hpp>
#include <localsync/cache/types.hpp>

namespace localsync::cache
{
    class CacheMetricsMonitor;

    struct SweepReport
    {
        std::int64_t messagesRemoved = 0;
        std::int64_t profilesRemoved = 0;
        std::size_t conversationsTouched = 0;
        Timestamp cutoff = 0;
        Timestamp finishedAt = 0;
    };

    class RetentionSweeper
    {
    public:
        RetentionSweeper(IMessageStore &store,
                         TransactionSerializer &serializer,
                         CacheMetricsMonitor *metrics,
                         int retentionDays,
                         std::chrono::hours interval);
        ~RetentionSweeper();

        RetentionSweeper(const RetentionSweeper &) = delete;
        RetentionSweeper &operator=(const RetentionSweeper &) = delete;

        /// Arm the periodic timer. The first sweep runs after one interval,
        /// or right away if the previous one is older than an interval.
        void start();

        /// Cancel the timer and wait for a sweep the timer already queued.
        void stop();

        [[nodiscard]] bool running() const noexcept;

        /// Synchronous sweep. Must run inside a serializer unit (or in tests).
        SweepReport sweep(Timestamp now);

        /// Queue a sweep as a serializer unit.
        std::future<SweepReport> sweep_async();

        [[nodiscard]] int retention_days() const noexcept { return retentionDays_; }

    private:
        void schedule(std::chrono::milliseconds delay);
        void on_timer(const boost::system::error_code &ec);

        IMessageStore &store_;
        TransactionSerializer &serializer_;
        CacheMetricsMonitor *metrics_;
        int retentionDays_;
        std::chrono::hours interval_;

        mutable std::mutex mutex_;
        std::condition_variable idle_;
        std::unique_ptr<boost::asio::steady_timer> timer_;
        int pendingWaits_{0};
        bool running_{false};
    };

} // namespace localsync::cache

#endif // LOCALSYNC_CACHE_RETENTION_SWEEPER_HPP
