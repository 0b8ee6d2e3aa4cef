#include <localsync/cache/MessageCache.hpp>
#include <localsync/cache/Lifecycle.hpp>
#include <localsync/cache/SqliteMessageStore.hpp>
#include <localsync/cache/errors.hpp>

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

#include <vix/utils/Logger.hpp>

namespace localsync::cache
{
    static vix::utils::Logger &logger = vix::utils::Logger::getInstance();
    using Logger = vix::utils::Logger;

    namespace
    {
        IMessageStore &require_store(const std::unique_ptr<IMessageStore> &store)
        {
            if (!store)
                throw std::invalid_argument("MessageCache: null store");
            return *store;
        }

        Timestamp ms(std::chrono::hours h)
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(h).count();
        }
    } // namespace

    // ───────────────────────── Construction ─────────────────────────

    MessageCache::MessageCache(const std::string &dbPath, Config config)
        : MessageCache(std::make_unique<SqliteMessageStore>(dbPath, config.busyTimeout), config)
    {
    }

    MessageCache::MessageCache(std::unique_ptr<IMessageStore> store, Config config)
        : config_(std::move(config)),
          store_(std::move(store)),
          serializer_(RetryPolicy::from_config(config_), &metrics_),
          reconciler_(require_store(store_)),
          sweeper_(*store_, serializer_, &metrics_, config_.retentionDays, config_.cleanupInterval)
    {
    }

    MessageCache::~MessageCache()
    {
        close();
        serializer_.stop();
    }

    // ───────────────────────── Lifecycle ─────────────────────────

    void MessageCache::open()
    {
        if (metrics_.ready())
            return;

        store_->open(); // StorageUnavailable propagates

        metrics_.set_last_cleanup(store_->last_cleanup());
        metrics_.set_ready(true);

        if (config_.autoCleanup)
            sweeper_.start();

        logger.log(Logger::Level::INFO, "[cache][MessageCache] ready (retention {} days)",
                   config_.retentionDays);
    }

    std::future<void> MessageCache::open_async()
    {
        return serializer_.submit([this]()
                                  { open(); },
                                  "open");
    }

    void MessageCache::close() noexcept
    {
        sweeper_.stop();
        serializer_.drain();

        metrics_.set_ready(false);
        store_->close();
    }

    bool MessageCache::is_ready() const noexcept
    {
        return metrics_.ready() && store_->is_open();
    }

    void MessageCache::drain()
    {
        serializer_.drain();
    }

    // ───────────────────────── Optimistic writes ─────────────────────────

    std::future<void> MessageCache::add_optimistic_message(CachedMessage record)
    {
        const Timestamp now = now_ms();

        record.status = MessageStatus::Pending;
        record.syncStatus = SyncStatus::Pending;
        record.sequence = 0;
        if (record.clientTimestamp == 0)
            record.clientTimestamp = now;
        record.localTimestamp = now;
        if (record.senderName.empty() && !record.senderId.empty())
            record.senderName = fallback_display_name(record.senderId);

        return serializer_.submit(
            [this, record = std::move(record)]()
            {
                if (!record.optimisticId || record.optimisticId->empty())
                    throw ValidationError("optimistic message in " + record.conversationId +
                                          " has no optimistic id");

                auto existing = store_->find_by_optimistic_id(record.conversationId, *record.optimisticId);
                if (existing && existing->serverId)
                {
                    // Already confirmed: a late re-add must not resurrect the draft.
                    logger.log(Logger::Level::DEBUG,
                               "[cache][MessageCache] {} already confirmed as {}, ignoring re-add",
                               *record.optimisticId, *existing->serverId);
                    return;
                }

                if (existing && existing->status != MessageStatus::Pending)
                {
                    // Past PENDING only resend() may move the row back.
                    logger.log(Logger::Level::DEBUG,
                               "[cache][MessageCache] {} is {}, ignoring re-add",
                               *record.optimisticId, to_string(existing->status));
                    return;
                }

                CachedMessage row = record;
                if (existing)
                {
                    row.sequence = existing->sequence;
                    row.isEditing = existing->isEditing;
                }

                store_->transaction(
                    [&]
                    {
                        store_->upsert_message(row);

                        auto cursor = store_->get_sync_cursor(row.conversationId).value_or(ConversationSyncCursor{});
                        cursor.conversationId = row.conversationId;
                        cursor.lastMessageTimestamp = std::max(cursor.lastMessageTimestamp, row.clientTimestamp);
                        cursor.cachedMessageCount = store_->count_messages(row.conversationId);
                        store_->upsert_sync_cursor(cursor);
                    });
            },
            "add optimistic message");
    }

    std::optional<CachedMessage> MessageCache::locate(const std::string &conversationId, const std::string &key)
    {
        if (auto row = store_->find_by_identity(conversationId, key))
            return row;
        // A confirmed row is still reachable through its optimistic id.
        return store_->find_by_optimistic_id(conversationId, key);
    }

    std::future<bool> MessageCache::mutate(const std::string &conversationId,
                                           const std::string &identityKey,
                                           std::function<bool(CachedMessage &)> fn,
                                           std::string label)
    {
        return serializer_.submit(
            [this, conversationId, identityKey, fn = std::move(fn), label]()
            {
                auto row = locate(conversationId, identityKey);
                if (!row)
                {
                    logger.log(Logger::Level::DEBUG, "[cache][MessageCache] {}: {} not found in {}",
                               label, identityKey, conversationId);
                    return false;
                }

                if (!fn(*row))
                    return false;

                store_->upsert_message(*row);
                return true;
            },
            label);
    }

    std::future<bool> MessageCache::update_message_status(const std::string &conversationId,
                                                          const std::string &identityKey,
                                                          MessageStatus status,
                                                          std::optional<Timestamp> timestamp)
    {
        return mutate(
            conversationId, identityKey,
            [status, timestamp, identityKey](CachedMessage &row)
            {
                if (!lifecycle::can_transition(row.status, status))
                {
                    logger.log(Logger::Level::WARN,
                               "[cache][MessageCache] refused status change {} -> {} for {}",
                               to_string(row.status), to_string(status), identityKey);
                    return false;
                }

                row.status = status;
                switch (status)
                {
                case MessageStatus::Delivered:
                    row.deliveredAt = timestamp.value_or(now_ms());
                    break;
                case MessageStatus::Read:
                    row.readAt = timestamp.value_or(now_ms());
                    break;
                case MessageStatus::Failed:
                    row.syncStatus = SyncStatus::Failed;
                    break;
                default:
                    break;
                }
                return true;
            },
            "update status");
    }

    std::future<bool> MessageCache::resend(const std::string &conversationId, const std::string &optimisticId)
    {
        return mutate(
            conversationId, optimisticId,
            [optimisticId](CachedMessage &row)
            {
                if (!lifecycle::can_resend(row.status) || row.optimisticId != optimisticId)
                    return false;

                const Timestamp now = now_ms();
                row.status = MessageStatus::Pending;
                row.syncStatus = SyncStatus::Pending;
                row.clientTimestamp = now;
                row.localTimestamp = now;
                return true;
            },
            "resend");
    }

    std::future<bool> MessageCache::mark_failed(const std::string &conversationId, const std::string &identityKey)
    {
        return mutate(
            conversationId, identityKey,
            [](CachedMessage &row)
            {
                if (!lifecycle::can_transition(row.status, MessageStatus::Failed))
                    return false;

                row.status = MessageStatus::Failed;
                row.syncStatus = SyncStatus::Failed;
                return true;
            },
            "mark failed");
    }

    std::future<void> MessageCache::clear_conversation(const std::string &conversationId)
    {
        return serializer_.submit(
            [this, conversationId]()
            {
                const auto removed = store_->delete_conversation(conversationId);
                logger.log(Logger::Level::INFO, "[cache][MessageCache] cleared {} ({} rows)",
                           conversationId, removed);
            },
            "clear conversation");
    }

    std::future<void> MessageCache::cache_user_profile(UserProfileCacheEntry entry)
    {
        if (entry.cachedAt == 0)
            entry.cachedAt = now_ms();
        if (entry.expiresAt == 0)
            entry.expiresAt = entry.cachedAt + ms(config_.profileTtl);

        return serializer_.submit([this, entry = std::move(entry)]()
                                  { store_->set_user_profile(entry); },
                                  "cache user profile");
    }

    std::future<SweepReport> MessageCache::cleanup_old_messages()
    {
        return sweeper_.sweep_async();
    }

    // ───────────────────────── Reconciliation ─────────────────────────

    std::future<ReconcileReport> MessageCache::reconcile_batch(const std::string &conversationId,
                                                               std::vector<InboundMessage> records,
                                                               ReconcileOptions options)
    {
        std::uint64_t ticket = 0;
        {
            std::lock_guard<std::mutex> lock(syncMutex_);
            ticket = ++nextTicket_;
            latestTicket_[conversationId] = ticket;
            ++inFlight_[conversationId];
        }

        auto fut = serializer_.submit(
            [this, conversationId, records = std::move(records), options, ticket]() mutable
            {
                {
                    std::lock_guard<std::mutex> lock(syncMutex_);
                    options.otherSyncInFlight = inFlight_[conversationId] > 1;
                }

                auto report = reconciler_.reconcile(conversationId, records, options);

                // Always written; only refresh if the user still looks at it
                // and no newer sync has been issued since.
                RefreshListener listener;
                {
                    std::lock_guard<std::mutex> lock(syncMutex_);
                    const bool visible = visible_ && *visible_ == conversationId;
                    auto it = latestTicket_.find(conversationId);
                    const bool latest = it != latestTicket_.end() && it->second == ticket;
                    if (visible && latest)
                        listener = listener_;
                }

                if (listener)
                    listener(conversationId, report);

                return report;
            },
            "reconcile batch");

        // Runs right after the batch whether it succeeded or not.
        auto bookkeeping = serializer_.submit([this, conversationId]()
                                              { finish_sync(conversationId); },
                                              "sync bookkeeping");
        (void)bookkeeping;

        return fut;
    }

    void MessageCache::finish_sync(const std::string &conversationId)
    {
        std::lock_guard<std::mutex> lock(syncMutex_);
        auto it = inFlight_.find(conversationId);
        if (it != inFlight_.end() && --it->second <= 0)
        {
            inFlight_.erase(it);
            latestTicket_.erase(conversationId);
        }
    }

    void MessageCache::set_visible_conversation(std::optional<std::string> conversationId)
    {
        std::lock_guard<std::mutex> lock(syncMutex_);
        visible_ = std::move(conversationId);
    }

    std::optional<std::string> MessageCache::visible_conversation() const
    {
        std::lock_guard<std::mutex> lock(syncMutex_);
        return visible_;
    }

    std::size_t MessageCache::syncs_in_flight() const
    {
        std::lock_guard<std::mutex> lock(syncMutex_);
        return latestTicket_.size();
    }

    void MessageCache::on_refresh(RefreshListener listener)
    {
        std::lock_guard<std::mutex> lock(syncMutex_);
        listener_ = std::move(listener);
    }

    // ───────────────────────── Reads ─────────────────────────

    MessagePage MessageCache::get_messages(const std::string &conversationId,
                                           std::optional<std::size_t> limit,
                                           const std::optional<std::string> &beforeIdentityKey)
    {
        if (!is_ready())
        {
            metrics_.record_query(std::chrono::nanoseconds{0}, QueryOutcome::NotReady);
            return MessagePage::not_ready();
        }

        const std::size_t pageSize = std::clamp<std::size_t>(limit.value_or(config_.defaultPageSize),
                                                             1, config_.maxPageSize);

        const auto t0 = std::chrono::steady_clock::now();
        std::vector<CachedMessage> rows;

        try
        {
            rows = store_->query_messages(conversationId, pageSize + 1, beforeIdentityKey);
        }
        catch (const std::exception &e)
        {
            metrics_.record_query(std::chrono::steady_clock::now() - t0, QueryOutcome::Failed);
            logger.log(Logger::Level::WARN, "[cache][MessageCache] read of {} failed: {}",
                       conversationId, e.what());
            return MessagePage::read_failed();
        }

        MessagePage page;
        page.status = QueryStatus::Hit;
        page.fromCache = true;
        page.hasMore = rows.size() > pageSize;
        if (page.hasMore)
            rows.resize(pageSize);
        page.messages = std::move(rows);

        metrics_.record_query(std::chrono::steady_clock::now() - t0,
                              page.messages.empty() ? QueryOutcome::Miss : QueryOutcome::Hit);

        logger.log(Logger::Level::DEBUG, "[cache][MessageCache] {} rows for {} (hasMore={})",
                   page.messages.size(), conversationId, page.hasMore);
        return page;
    }

    std::optional<ConversationSyncCursor> MessageCache::get_sync_cursor(const std::string &conversationId)
    {
        if (!is_ready())
            return std::nullopt;

        try
        {
            return store_->get_sync_cursor(conversationId);
        }
        catch (const CacheError &e)
        {
            logger.log(Logger::Level::WARN, "[cache][MessageCache] cursor read failed: {}", e.what());
            return std::nullopt;
        }
    }

    std::optional<UserProfileCacheEntry> MessageCache::get_user_profile(const std::string &userId)
    {
        if (!is_ready())
            return std::nullopt;

        try
        {
            return store_->get_user_profile(userId, now_ms());
        }
        catch (const CacheError &e)
        {
            logger.log(Logger::Level::WARN, "[cache][MessageCache] profile read failed: {}", e.what());
            return std::nullopt;
        }
    }

} // namespace localsync::cache
