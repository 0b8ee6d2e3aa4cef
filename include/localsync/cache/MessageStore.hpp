#ifndef LOCALSYNC_CACHE_MESSAGE_STORE_HPP
#define LOCALSYNC_CACHE_MESSAGE_STORE_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <localsync/cache/types.hpp>

namespace localsync::cache
{
    struct PurgeResult
    {
        std::int64_t removed = 0;
        std::vector<std::string> conversations; ///< conversations that lost rows
    };

    /**
     * @brief Storage abstraction for cached messages, sync cursors and
     * user profiles.
     *
     * Expected semantics:
     *  - open() : idempotent; every other call throws StorageUnavailable
     *    until it succeeded.
     *  - upsert_message(msg) :
     *      → if msg.sequence names a stored row, that row is rewritten in
     *        place (its identity key may change)
     *      → otherwise insert, or replace the row with the same identity key
     *        in the same conversation
     *      → returns the sequence of the written row
     *  - query_messages(conversation, limit, before) :
     *      → non-deleted rows, newest-first by serverTimestamp (clientTimestamp
     *        when absent), ties newest insertion first
     *      → if before is set, only rows STRICTLY older than that row;
     *        an unknown anchor yields nothing
     *  - upsert_sync_cursor(c) : lastSyncTimestamp never goes backwards.
     *
     * Writes are expected to come from a single writer (the
     * TransactionSerializer); reads may come from any thread.
     */
    class IMessageStore
    {
    public:
        virtual ~IMessageStore() = default;

        virtual void open() = 0;
        virtual void close() noexcept = 0;
        [[nodiscard]] virtual bool is_open() const noexcept = 0;

        /// Run fn inside a single write transaction (rolled back if fn throws).
        virtual void transaction(const std::function<void()> &fn) = 0;

        virtual std::int64_t upsert_message(const CachedMessage &msg) = 0;
        virtual bool remove_message(std::int64_t sequence) = 0;

        virtual std::vector<CachedMessage> query_messages(
            const std::string &conversationId,
            std::size_t limit,
            const std::optional<std::string> &beforeIdentityKey = std::nullopt) = 0;

        virtual std::optional<CachedMessage> find_by_identity(
            const std::string &conversationId, const std::string &identityKey) = 0;
        virtual std::optional<CachedMessage> find_by_server_id(
            const std::string &conversationId, const std::string &serverId) = 0;
        virtual std::optional<CachedMessage> find_by_optimistic_id(
            const std::string &conversationId, const std::string &optimisticId) = 0;

        virtual std::int64_t count_messages(const std::string &conversationId) = 0;

        virtual std::optional<ConversationSyncCursor> get_sync_cursor(const std::string &conversationId) = 0;
        virtual void upsert_sync_cursor(const ConversationSyncCursor &cursor) = 0;

        virtual std::optional<UserProfileCacheEntry> get_user_profile(const std::string &userId, Timestamp now) = 0;
        virtual void set_user_profile(const UserProfileCacheEntry &entry) = 0;

        /// Removes every row and the cursor of a conversation. Returns rows removed.
        virtual std::int64_t delete_conversation(const std::string &conversationId) = 0;

        /// Retention: synced, unpinned rows with localTimestamp < cutoff.
        virtual PurgeResult delete_expired_messages(Timestamp cutoff) = 0;
        virtual std::int64_t delete_expired_profiles(Timestamp now) = 0;

        /// Reclaim free pages after bulk deletion.
        virtual void compact() = 0;

        [[nodiscard]] virtual Timestamp last_cleanup() = 0;
        virtual void set_last_cleanup(Timestamp ts) = 0;
    };

} // namespace localsync::cache

#endif // LOCALSYNC_CACHE_MESSAGE_STORE_HPP
