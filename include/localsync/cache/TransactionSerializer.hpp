#ifndef LOCALSYNC_CACHE_TRANSACTION_SERIALIZER_HPP
#define LOCALSYNC_CACHE_TRANSACTION_SERIALIZER_HPP

/**
 * @file TransactionSerializer.hpp
 * @brief Single-consumer FIFO queue for every write against the store.
 *
 * Write units are posted to a Boost.Asio strand driven by one worker thread,
 * so at most one unit touches the store at a time and units run in
 * submission order. A unit that fails with WriteContention is retried in
 * place according to RetryPolicy; once the attempts are exhausted its future
 * carries WriteFailed and the queue moves on.
 *
 * @code{.cpp}
 * TransactionSerializer serializer{RetryPolicy{}, &monitor};
 *
 * auto fut = serializer.submit([&] { return store.upsert_message(msg); });
 * std::int64_t seq = fut.get(); // rethrows the unit's exception, if any
 * @endcode
 */

#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <localsync/cache/config.hpp>
#include <localsync/cache/errors.hpp>

namespace localsync::cache
{
    class CacheMetricsMonitor;

    /// Linear backoff on lock contention.
    struct RetryPolicy
    {
        int maxAttempts = 3; ///< first try included
        std::chrono::milliseconds baseDelay{100};

        /// Delay before retrying after the given (1-based) failed attempt.
        [[nodiscard]] std::chrono::milliseconds delay(int attempt) const noexcept
        {
            return baseDelay * attempt;
        }

        static RetryPolicy from_config(const Config &cfg) noexcept
        {
            return RetryPolicy{cfg.maxWriteAttempts, cfg.retryBaseDelay};
        }
    };

    class TransactionSerializer
    {
    public:
        using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

        explicit TransactionSerializer(RetryPolicy policy = {}, CacheMetricsMonitor *metrics = nullptr);
        ~TransactionSerializer();

        TransactionSerializer(const TransactionSerializer &) = delete;
        TransactionSerializer &operator=(const TransactionSerializer &) = delete;

        /**
         * @brief Enqueue a write unit.
         *
         * The unit's return value (or exception) is delivered through the
         * returned future. After stop(), the future immediately carries
         * StorageUnavailable.
         */
        template <typename Fn>
        auto submit(Fn &&unit, std::string label = "write")
            -> std::future<std::invoke_result_t<std::decay_t<Fn> &>>
        {
            using Result = std::invoke_result_t<std::decay_t<Fn> &>;

            // Held across check and post so stop() cannot slip in between.
            std::lock_guard<std::mutex> lock(submitMutex_);
            if (stopped_.load(std::memory_order_acquire))
            {
                std::promise<Result> rejected;
                rejected.set_exception(std::make_exception_ptr(
                    StorageUnavailable("[cache][Serializer] serializer stopped, rejected " + label)));
                return rejected.get_future();
            }

            auto task = std::make_shared<std::packaged_task<Result()>>(
                [this, fn = std::forward<Fn>(unit), label = std::move(label)]() mutable
                {
                    return run_with_retry(fn, label);
                });

            auto fut = task->get_future();
            boost::asio::post(strand_, [task]()
                              { (*task)(); });
            return fut;
        }

        /// Block until every unit submitted so far has completed.
        void drain();

        /// Strand on which units run; timers bound to it are serialized with writes.
        [[nodiscard]] Strand executor() const noexcept { return strand_; }

        [[nodiscard]] bool running_in_this_thread() const noexcept { return strand_.running_in_this_thread(); }

        /// Run queued units, then join the worker. Idempotent.
        void stop() noexcept;

        [[nodiscard]] bool stopped() const noexcept { return stopped_.load(std::memory_order_acquire); }

        [[nodiscard]] const RetryPolicy &policy() const noexcept { return policy_; }

    private:
        template <typename Fn>
        auto run_with_retry(Fn &fn, const std::string &label) -> std::invoke_result_t<Fn &>
        {
            for (int attempt = 1;; ++attempt)
            {
                try
                {
                    return fn();
                }
                catch (const WriteContention &e)
                {
                    if (attempt >= policy_.maxAttempts)
                    {
                        on_exhausted(label, attempt, e.what());
                        throw WriteFailed("[cache][Serializer] " + label + " failed after " +
                                              std::to_string(attempt) + " attempts: " + e.what(),
                                          attempt);
                    }

                    on_retry(label, attempt, e.what());
                    std::this_thread::sleep_for(policy_.delay(attempt));
                }
            }
        }

        void on_retry(const std::string &label, int attempt, const char *reason) noexcept;
        void on_exhausted(const std::string &label, int attempts, const char *reason) noexcept;

        RetryPolicy policy_;
        CacheMetricsMonitor *metrics_;

        boost::asio::io_context ioc_;
        Strand strand_;
        boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
        std::thread worker_;
        std::mutex submitMutex_;
        std::atomic<bool> stopped_{false};
    };

} // namespace localsync::cache

#endif // LOCALSYNC_CACHE_TRANSACTION_SERIALIZER_HPP
