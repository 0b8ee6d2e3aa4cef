#include <localsync/cache/RetentionSweeper.hpp>
#include <localsync/cache/Metrics.hpp>
#include <localsync/cache/errors.hpp>

#include <algorithm>

#include <vix/utils/Logger.hpp>

namespace localsync::cache
{
    static vix::utils::Logger &logger = vix::utils::Logger::getInstance();
    using Logger = vix::utils::Logger;

    namespace
    {
        constexpr Timestamp kDayMs = 24LL * 60 * 60 * 1000;
    }

    RetentionSweeper::RetentionSweeper(IMessageStore &store,
                                       TransactionSerializer &serializer,
                                       CacheMetricsMonitor *metrics,
                                       int retentionDays,
                                       std::chrono::hours interval)
        : store_(store),
          serializer_(serializer),
          metrics_(metrics),
          retentionDays_(std::max(0, retentionDays)),
          interval_(std::max(interval, std::chrono::hours{1})),
          timer_(std::make_unique<boost::asio::steady_timer>(serializer.executor()))
    {
    }

    RetentionSweeper::~RetentionSweeper()
    {
        stop();
    }

    void RetentionSweeper::start()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_)
            return;

        running_ = true;

        // Resume the schedule across restarts instead of sweeping on every launch.
        const auto intervalMs = std::chrono::duration_cast<std::chrono::milliseconds>(interval_);
        const Timestamp elapsed = now_ms() - store_.last_cleanup();
        const auto delay = elapsed >= intervalMs.count()
                               ? std::chrono::milliseconds{0}
                               : intervalMs - std::chrono::milliseconds{elapsed};

        schedule(delay);

        logger.log(Logger::Level::INFO,
                   "[cache][Sweeper] started (retention {} days, every {} h, next in {} ms)",
                   retentionDays_, interval_.count(), delay.count());
    }

    void RetentionSweeper::stop()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!running_ && pendingWaits_ == 0)
            return;

        running_ = false;
        timer_->cancel();

        // The cancelled handler still has to run once on the strand; a stopped
        // serializer discards it instead.
        if (!serializer_.running_in_this_thread() && !serializer_.stopped())
        {
            idle_.wait(lock, [this]
                       { return pendingWaits_ == 0; });
            lock.unlock();
            serializer_.drain(); // a sweep the timer queued before the cancel
        }

        logger.log(Logger::Level::DEBUG, "[cache][Sweeper] stopped");
    }

    bool RetentionSweeper::running() const noexcept
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_;
    }

    void RetentionSweeper::schedule(std::chrono::milliseconds delay)
    {
        // mutex_ held by the caller
        timer_->expires_after(delay);
        ++pendingWaits_;
        timer_->async_wait([this](const boost::system::error_code &ec)
                           { on_timer(ec); });
    }

    void RetentionSweeper::on_timer(const boost::system::error_code &ec)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --pendingWaits_;

        if (ec && ec != boost::asio::error::operation_aborted)
        {
            logger.log(Logger::Level::WARN, "[cache][Sweeper] timer error: {}", ec.message());
        }

        if (!ec && running_)
        {
            auto queued = sweep_async();
            (void)queued; // result is logged by sweep(); errors by the serializer

            schedule(std::chrono::duration_cast<std::chrono::milliseconds>(interval_));
        }

        idle_.notify_all();
    }

    SweepReport RetentionSweeper::sweep(Timestamp now)
    {
        SweepReport report;
        report.cutoff = now - static_cast<Timestamp>(retentionDays_) * kDayMs;

        auto purged = store_.delete_expired_messages(report.cutoff);
        report.messagesRemoved = purged.removed;
        report.conversationsTouched = purged.conversations.size();

        report.profilesRemoved = store_.delete_expired_profiles(now);

        for (const auto &conversationId : purged.conversations)
        {
            auto cursor = store_.get_sync_cursor(conversationId);
            if (!cursor)
                continue;

            cursor->cachedMessageCount = store_.count_messages(conversationId);
            store_.upsert_sync_cursor(*cursor);
        }

        store_.compact();
        store_.set_last_cleanup(now);

        report.finishedAt = now;

        if (metrics_)
        {
            metrics_->record_eviction(static_cast<std::uint64_t>(report.messagesRemoved));
            metrics_->set_last_cleanup(now);
        }

        logger.log(Logger::Level::INFO,
                   "[cache][Sweeper] removed {} messages in {} conversations, {} expired profiles",
                   report.messagesRemoved, report.conversationsTouched, report.profilesRemoved);

        return report;
    }

    std::future<SweepReport> RetentionSweeper::sweep_async()
    {
        return serializer_.submit(
            [this]()
            {
                try
                {
                    return sweep(now_ms());
                }
                catch (const WriteContention &)
                {
                    throw; // retried by the serializer
                }
                catch (const std::exception &e)
                {
                    logger.log(Logger::Level::ERROR, "[cache][Sweeper] sweep failed: {}", e.what());
                    throw;
                }
            },
            "retention sweep");
    }

} // namespace localsync::cache
