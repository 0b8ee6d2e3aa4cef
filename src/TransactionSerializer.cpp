#include <localsync/cache/TransactionSerializer.hpp>
#include <localsync/cache/Metrics.hpp>

#include <vix/utils/Logger.hpp>

namespace localsync::cache
{
    static vix::utils::Logger &logger = vix::utils::Logger::getInstance();
    using Logger = vix::utils::Logger;

    TransactionSerializer::TransactionSerializer(RetryPolicy policy, CacheMetricsMonitor *metrics)
        : policy_(policy),
          metrics_(metrics),
          ioc_(1),
          strand_(boost::asio::make_strand(ioc_)),
          work_(boost::asio::make_work_guard(ioc_))
    {
        if (policy_.maxAttempts < 1)
            policy_.maxAttempts = 1;

        worker_ = std::thread([this]()
                              { ioc_.run(); });
    }

    TransactionSerializer::~TransactionSerializer()
    {
        stop();
    }

    void TransactionSerializer::drain()
    {
        // A unit waiting on its own queue would never finish.
        if (running_in_this_thread() || stopped())
            return;

        auto marker = submit([] {}, "drain");
        marker.wait();
    }

    void TransactionSerializer::stop() noexcept
    {
        {
            std::lock_guard<std::mutex> lock(submitMutex_);
            bool expected = false;
            if (!stopped_.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
                return;

            // Runs after every unit already queued on the strand; pending timers
            // (the sweeper) do not keep the worker alive past this point.
            boost::asio::post(strand_, [this]()
                              { ioc_.stop(); });
        }
        work_.reset();

        if (worker_.joinable())
        {
            if (worker_.get_id() == std::this_thread::get_id())
                worker_.detach();
            else
                worker_.join();
        }

        logger.log(Logger::Level::DEBUG, "[cache][Serializer] stopped");
    }

    void TransactionSerializer::on_retry(const std::string &label, int attempt, const char *reason) noexcept
    {
        if (metrics_)
            metrics_->record_write_retry();

        logger.log(Logger::Level::WARN,
                   "[cache][Serializer] {} hit lock contention (attempt {}/{}), retrying in {} ms: {}",
                   label, attempt, policy_.maxAttempts, policy_.delay(attempt).count(), reason);
    }

    void TransactionSerializer::on_exhausted(const std::string &label, int attempts, const char *reason) noexcept
    {
        if (metrics_)
            metrics_->record_write_failure();

        logger.log(Logger::Level::ERROR,
                   "[cache][Serializer] {} failed after {} attempts: {}",
                   label, attempts, reason);
    }

} // namespace localsync::cache
