#ifndef LOCALSYNC_CACHE_MESSAGE_CACHE_HPP
#define LOCALSYNC_CACHE_MESSAGE_CACHE_HPP

/**
 * @file MessageCache.hpp
 * @brief Entry point of the local-first message cache.
 *
 * One MessageCache is constructed by the application and passed by
 * reference to whoever needs it. Writes are queued on the internal
 * TransactionSerializer and return futures; reads go straight to the store
 * and never throw.
 *
 * @code{.cpp}
 * localsync::cache::MessageCache cache{"chat-cache.db"};
 * cache.open();
 *
 * CachedMessage draft;
 * draft.conversationId = "c1";
 * draft.optimisticId = "opt_1";
 * draft.senderId = "u1";
 * draft.content = "hi";
 * cache.add_optimistic_message(draft);
 *
 * auto page = cache.get_messages("c1", 50);
 * if (page.status == QueryStatus::NotReady) { ... show a spinner ... }
 * @endcode
 *
 * Refresh listeners run on the serializer thread: they must not wait on a
 * future returned by this cache.
 */

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <localsync/cache/Metrics.hpp>
#include <localsync/cache/MessageStore.hpp>
#include <localsync/cache/Reconciler.hpp>
#include <localsync/cache/RetentionSweeper.hpp>
#include <localsync/cache/TransactionSerializer.hpp>
#include <localsync/cache/config.hpp>
#include <localsync/cache/types.hpp>

namespace localsync::cache
{
    class MessageCache
    {
    public:
        /// Called after a sync landed for the conversation currently on screen.
        using RefreshListener = std::function<void(const std::string &conversationId,
                                                    const ReconcileReport &report)>;

        /// SQLite-backed cache stored at dbPath.
        explicit MessageCache(const std::string &dbPath, Config config = {});

        /// Cache over any store implementation.
        explicit MessageCache(std::unique_ptr<IMessageStore> store, Config config = {});

        ~MessageCache();

        MessageCache(const MessageCache &) = delete;
        MessageCache &operator=(const MessageCache &) = delete;

        // ───────────── lifecycle ─────────────

        /// Open the store; throws StorageUnavailable. Starts the sweeper if autoCleanup.
        void open();

        /// open() as a serializer unit; is_ready() stays false until it completes.
        std::future<void> open_async();

        /// Stop the sweeper, flush queued writes, close the store.
        void close() noexcept;

        [[nodiscard]] bool is_ready() const noexcept;

        // ───────────── writes (serialized) ─────────────

        /// Register a locally authored message as PENDING.
        std::future<void> add_optimistic_message(CachedMessage record);

        std::future<ReconcileReport> reconcile_batch(const std::string &conversationId,
                                                     std::vector<InboundMessage> records,
                                                     ReconcileOptions options = {});

        /// false when the row is unknown or the transition is not allowed.
        std::future<bool> update_message_status(const std::string &conversationId,
                                                const std::string &identityKey,
                                                MessageStatus status,
                                                std::optional<Timestamp> timestamp = std::nullopt);

        std::future<void> clear_conversation(const std::string &conversationId);

        /// FAILED → PENDING with the same optimistic id and a fresh client timestamp.
        std::future<bool> resend(const std::string &conversationId, const std::string &optimisticId);

        /// Transport reported a failure for this message.
        std::future<bool> mark_failed(const std::string &conversationId, const std::string &identityKey);

        /// cachedAt / expiresAt default to now and now + profileTtl when left at 0.
        std::future<void> cache_user_profile(UserProfileCacheEntry entry);

        std::future<SweepReport> cleanup_old_messages();

        /// Block until every write queued so far has been applied.
        void drain();

        // ───────────── refresh routing ─────────────

        void set_visible_conversation(std::optional<std::string> conversationId);
        [[nodiscard]] std::optional<std::string> visible_conversation() const;

        void on_refresh(RefreshListener listener);

        /// Conversations with a reconcile batch queued or running.
        [[nodiscard]] std::size_t syncs_in_flight() const;

        // ───────────── reads ─────────────

        /// Newest-first page; limit defaults to Config::defaultPageSize.
        [[nodiscard]] MessagePage get_messages(const std::string &conversationId,
                                               std::optional<std::size_t> limit = std::nullopt,
                                               const std::optional<std::string> &beforeIdentityKey = std::nullopt);

        [[nodiscard]] std::optional<ConversationSyncCursor> get_sync_cursor(const std::string &conversationId);
        [[nodiscard]] std::optional<UserProfileCacheEntry> get_user_profile(const std::string &userId);

        [[nodiscard]] CacheMetrics get_metrics() const noexcept { return metrics_.snapshot(); }
        [[nodiscard]] const CacheMetricsMonitor &metrics() const noexcept { return metrics_; }

        [[nodiscard]] const Config &config() const noexcept { return config_; }

    private:
        /// Modifies an existing row inside a serializer unit; fn returns false to skip the write.
        std::future<bool> mutate(const std::string &conversationId,
                                 const std::string &identityKey,
                                 std::function<bool(CachedMessage &)> fn,
                                 std::string label);

        std::optional<CachedMessage> locate(const std::string &conversationId, const std::string &key);

        void finish_sync(const std::string &conversationId);

        Config config_;
        CacheMetricsMonitor metrics_;
        std::unique_ptr<IMessageStore> store_;

        mutable std::mutex syncMutex_;
        std::optional<std::string> visible_;
        std::map<std::string, std::uint64_t> latestTicket_;
        std::map<std::string, int> inFlight_;
        std::uint64_t nextTicket_{0};
        RefreshListener listener_;

        TransactionSerializer serializer_;
        Reconciler reconciler_;
        RetentionSweeper sweeper_;
    };

} // namespace localsync::cache

#endif // LOCALSYNC_CACHE_MESSAGE_CACHE_HPP
