#ifndef LOCALSYNC_CACHE_TYPES_HPP
#define LOCALSYNC_CACHE_TYPES_HPP

/**
 * @file types.hpp
 * @brief In-memory record types exchanged with the cache.
 *
 * Everything here is a plain value type. Nested data (attachments, metadata)
 * is typed; it is only turned into JSON text by the storage codec
 * (see codec.hpp) when a row is written.
 *
 * Timestamps are milliseconds since the Unix epoch (UTC).
 */

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace localsync::cache
{
    using Timestamp = std::int64_t; ///< ms since epoch

    /// Current wall-clock time in ms since epoch.
    Timestamp now_ms() noexcept;

    enum class MessageStatus
    {
        Pending,
        Sent,
        Delivered,
        Read,
        Failed
    };

    /// Agreement between the cached row and the server.
    enum class SyncStatus
    {
        Synced,
        Pending,
        Failed
    };

    enum class MessageKind
    {
        Text,
        Image,
        Video,
        Audio,
        File,
        System,
        Reply,
        Forward,
        Thread,
        Announcement
    };

    std::string_view to_string(MessageStatus s) noexcept;
    std::string_view to_string(SyncStatus s) noexcept;
    std::string_view to_string(MessageKind k) noexcept;

    /// Case-insensitive parse ("delivered", "DELIVERED"...).
    std::optional<MessageStatus> parse_message_status(std::string_view s) noexcept;
    std::optional<SyncStatus> parse_sync_status(std::string_view s) noexcept;
    std::optional<MessageKind> parse_message_kind(std::string_view s) noexcept;

    /// Scalar metadata value (null, bool, integer, double, string).
    using MetadataValue = std::variant<std::monostate, bool, long long, double, std::string>;
    using Metadata = std::map<std::string, MetadataValue>;

    struct Attachment
    {
        std::string url;
        std::string fileName;
        std::optional<std::int64_t> fileSize;
        std::string mimeType;
        std::optional<std::string> thumbnailUrl;

        bool operator==(const Attachment &other) const = default;
    };

    /**
     * @struct CachedMessage
     * @brief One chat message as known locally.
     *
     * Kept as an aggregate on purpose: the storage layer destructures it
     * field by field, so any new member must also be mapped to a column.
     */
    struct CachedMessage
    {
        std::string conversationId;
        std::optional<std::string> serverId;
        std::optional<std::string> optimisticId;
        std::string senderId;
        std::string senderName;
        std::optional<std::string> senderAvatar;
        MessageKind kind = MessageKind::Text;
        std::string content;
        MessageStatus status = MessageStatus::Pending;
        SyncStatus syncStatus = SyncStatus::Pending;
        std::optional<Timestamp> serverTimestamp;
        Timestamp clientTimestamp = 0;
        Timestamp localTimestamp = 0;
        std::optional<Timestamp> editedAt;
        std::optional<Timestamp> deliveredAt;
        std::optional<Timestamp> readAt;
        std::optional<Timestamp> deletedAt;
        std::optional<std::string> replyTo;
        bool isPinned = false;
        std::optional<Attachment> attachment;
        Metadata metadata;
        bool isEditing = false;   ///< local UI only, never supplied by the server
        std::int64_t sequence = 0; ///< insertion order, assigned by the store (0 = not stored)

        /// Server id when confirmed, optimistic id otherwise. Empty if neither.
        [[nodiscard]] std::string identity_key() const;

        /// serverTimestamp if known, else clientTimestamp.
        [[nodiscard]] Timestamp ordering_timestamp() const noexcept
        {
            return serverTimestamp.value_or(clientTimestamp);
        }
    };

    /**
     * @struct InboundMessage
     * @brief Authoritative record delivered by the transport.
     *
     * Every optional member that is set overwrites the cached value during
     * reconciliation; unset members leave the cached value untouched.
     */
    struct InboundMessage
    {
        std::optional<std::string> serverId;
        std::optional<std::string> optimisticId;
        std::optional<std::string> senderId;
        std::optional<std::string> senderName;
        std::optional<std::string> senderAvatar;
        std::optional<MessageKind> kind;
        std::optional<std::string> content;
        std::optional<MessageStatus> status;
        std::optional<Timestamp> timestamp; ///< server timestamp
        std::optional<Timestamp> editedAt;
        std::optional<Timestamp> deliveredAt;
        std::optional<Timestamp> readAt;
        std::optional<Timestamp> deletedAt;
        std::optional<std::string> replyTo;
        std::optional<bool> isPinned;
        std::optional<Attachment> attachment;
        std::optional<Metadata> metadata;
    };

    struct ConversationSyncCursor
    {
        std::string conversationId;
        Timestamp lastSyncTimestamp = 0;
        Timestamp lastMessageTimestamp = 0;
        std::int64_t cachedMessageCount = 0;
        bool hasMoreHistory = true;
        bool syncInProgress = false;
    };

    struct UserProfileCacheEntry
    {
        std::string userId;
        std::string displayName;
        std::optional<std::string> avatarRef;
        Timestamp cachedAt = 0;
        Timestamp expiresAt = 0;

        [[nodiscard]] bool is_expired(Timestamp now) const noexcept { return expiresAt <= now; }
    };

    /// Outcome of a read through the cache handle.
    enum class QueryStatus
    {
        Hit,       ///< query ran; messages may legitimately be empty
        NotReady,  ///< store not opened yet, nothing was queried
        ReadFailed ///< query failed; caller should fetch from the network
    };

    struct MessagePage
    {
        QueryStatus status = QueryStatus::Hit;
        std::vector<CachedMessage> messages; ///< newest-first
        bool hasMore = false;
        bool fromCache = false;

        static MessagePage not_ready() { return MessagePage{QueryStatus::NotReady, {}, false, false}; }
        static MessagePage read_failed() { return MessagePage{QueryStatus::ReadFailed, {}, false, false}; }
    };

    /// Placeholder display name used when a record carries none.
    std::string fallback_display_name(const std::string &senderId);

} // namespace localsync::cache

#endif // LOCALSYNC_CACHE_TYPES_HPP
