#ifndef LOCALSYNC_CACHE_SQLITE_MESSAGE_STORE_HPP
#define LOCALSYNC_CACHE_SQLITE_MESSAGE_STORE_HPP

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <localsync/cache/MessageStore.hpp>
#include <localsync/cache/types.hpp>

struct sqlite3;

namespace localsync::cache
{
    /**
     * @brief SQLite (WAL) implementation of IMessageStore.
     *
     * Tables: messages, conversation_sync_info, user_cache, cache_metrics.
     * The schema is versioned through PRAGMA user_version; a file written by
     * another version is dropped and rebuilt on open(), which is acceptable
     * because the cache is never the source of truth.
     *
     * One connection, guarded by a recursive mutex so that transaction()
     * can call back into the store from the same thread.
     */
    class SqliteMessageStore : public IMessageStore
    {
    public:
        static constexpr int kSchemaVersion = 5;

        explicit SqliteMessageStore(std::string db_path,
                                    std::chrono::milliseconds busyTimeout = std::chrono::milliseconds{50});
        ~SqliteMessageStore() override;

        SqliteMessageStore(const SqliteMessageStore &) = delete;
        SqliteMessageStore &operator=(const SqliteMessageStore &) = delete;
        SqliteMessageStore(SqliteMessageStore &&) = delete;
        SqliteMessageStore &operator=(SqliteMessageStore &&) = delete;

        void open() override;
        void close() noexcept override;
        [[nodiscard]] bool is_open() const noexcept override;

        /// True when the last open() found an outdated schema and rebuilt it.
        [[nodiscard]] bool was_rebuilt() const noexcept { return rebuilt_; }

        [[nodiscard]] const std::string &path() const noexcept { return path_; }

        void transaction(const std::function<void()> &fn) override;

        std::int64_t upsert_message(const CachedMessage &msg) override;
        bool remove_message(std::int64_t sequence) override;

        [[nodiscard]] std::vector<CachedMessage> query_messages(
            const std::string &conversationId,
            std::size_t limit,
            const std::optional<std::string> &beforeIdentityKey = std::nullopt) override;

        [[nodiscard]] std::optional<CachedMessage> find_by_identity(
            const std::string &conversationId, const std::string &identityKey) override;
        [[nodiscard]] std::optional<CachedMessage> find_by_server_id(
            const std::string &conversationId, const std::string &serverId) override;
        [[nodiscard]] std::optional<CachedMessage> find_by_optimistic_id(
            const std::string &conversationId, const std::string &optimisticId) override;

        std::int64_t count_messages(const std::string &conversationId) override;

        std::optional<ConversationSyncCursor> get_sync_cursor(const std::string &conversationId) override;
        void upsert_sync_cursor(const ConversationSyncCursor &cursor) override;

        std::optional<UserProfileCacheEntry> get_user_profile(const std::string &userId, Timestamp now) override;
        void set_user_profile(const UserProfileCacheEntry &entry) override;

        std::int64_t delete_conversation(const std::string &conversationId) override;

        PurgeResult delete_expired_messages(Timestamp cutoff) override;
        std::int64_t delete_expired_profiles(Timestamp now) override;

        void compact() override;

        Timestamp last_cleanup() override;
        void set_last_cleanup(Timestamp ts) override;

    private:
        std::string path_;
        std::chrono::milliseconds busyTimeout_;
        sqlite3 *db_{nullptr};
        mutable std::recursive_mutex mutex_;
        int txDepth_{0};
        bool rebuilt_{false};

        void ensure_open() const;
        void exec(const char *sql, const char *stage);
        void init_schema();
        void create_tables();
        void drop_tables();
        int user_version();

        std::optional<CachedMessage> find_one(const std::string &where,
                                              const std::string &conversationId,
                                              const std::string &key);
        std::optional<std::int64_t> find_sequence(const std::string &conversationId,
                                                  const std::string &identityKey);
    };

} // namespace localsync::cache

#endif // LOCALSYNC_CACHE_SQLITE_MESSAGE_STORE_HPP
