#ifndef LOCALSYNC_CACHE_COMMUNITY_STORE_HPP
#define LOCALSYNC_CACHE_COMMUNITY_STORE_HPP

/**
 * @file CommunityStore.hpp
 * @brief Local cache of community and space metadata.
 *
 * Lives in its own SQLite file with its own schema version, write queue and
 * metrics, so a rebuild of one cache domain never touches the other.
 * Community business rules are not enforced here: enum-like fields are kept
 * as the strings the server sends.
 */

#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <localsync/cache/Metrics.hpp>
#include <localsync/cache/TransactionSerializer.hpp>
#include <localsync/cache/config.hpp>
#include <localsync/cache/types.hpp>

struct sqlite3;

namespace localsync::cache
{
    struct CommunityPolicy
    {
        bool allowInvites = true;
        bool allowMemberInvites = true;
        bool requireEmailVerification = false;
        int minimumAge = 13;
        std::int64_t maxMembers = 100000;
        bool allowSpaceCreation = true;
        bool allowFileUploads = true;
        std::int64_t maxFileSize = 52428800; // 50 MiB
    };

    struct ModerationSettings
    {
        bool enableSlowMode = false;
        int slowModeDelay = 0; ///< seconds
        bool enableWordFilter = true;
        std::vector<std::string> bannedWords;
        bool requireMessageApproval = false;
        bool enableRaidProtection = false;
    };

    struct Community
    {
        std::string id;
        std::string name;
        std::string slug;
        std::string description;
        std::optional<std::string> coverImageUrl;
        std::optional<std::string> avatarUrl;
        std::string type = "public";
        std::string interactionType = "hybrid";
        std::string status = "active";
        std::string joinRequirement = "open";
        std::string verificationStatus = "unverified";
        std::string ownerId;

        CommunityPolicy policy;
        ModerationSettings moderation;

        std::int64_t spaceCount = 0;
        std::int64_t activeMembersToday = 0;
        std::int64_t messageCount = 0;
        std::int64_t memberCount = 1;

        std::vector<std::string> keywords;
        bool isFeatured = false;
        bool isTrending = false;
        bool isPlatformVerified = false;

        std::optional<std::string> website;
        std::optional<std::string> discordUrl;
        std::optional<std::string> twitterHandle;
        std::optional<std::string> githubOrg;

        Metadata settings;
        Metadata metadata;

        // viewer-relative
        bool isJoined = false;
        bool isOwner = false;
        std::optional<std::string> memberRole;

        Timestamp localTimestamp = 0;
        Timestamp lastFetchedAt = 0;
        SyncStatus syncStatus = SyncStatus::Synced;
        Timestamp createdAt = 0;
        Timestamp updatedAt = 0;
    };

    struct CommunitySpace
    {
        std::string id;
        std::string communityId;
        std::string name;
        std::optional<std::string> description;
        std::string type = "public";
        std::string interactionType = "chat";
        std::string status = "active";

        std::optional<std::string> userRole;
        bool isJoined = false;
        std::optional<Timestamp> joinedAt;

        std::optional<Timestamp> lastMessageAt;
        std::optional<std::string> lastMessagePreview;
        std::int64_t unreadCount = 0;

        Timestamp localTimestamp = 0;
        SyncStatus syncStatus = SyncStatus::Synced;
        Timestamp createdAt = 0;
        Timestamp updatedAt = 0;
    };

    struct CommunityPage
    {
        QueryStatus status = QueryStatus::Hit;
        std::vector<Community> communities; ///< most active first
        bool fromCache = false;
    };

    class CommunityStore
    {
    public:
        static constexpr int kSchemaVersion = 3;

        explicit CommunityStore(std::string dbPath, Config config = {});
        ~CommunityStore();

        CommunityStore(const CommunityStore &) = delete;
        CommunityStore &operator=(const CommunityStore &) = delete;

        /// Throws StorageUnavailable.
        void open();
        void close() noexcept;
        [[nodiscard]] bool is_ready() const noexcept;

        [[nodiscard]] bool was_rebuilt() const noexcept { return rebuilt_; }

        /// Upsert by id; rows become SYNCED with lastFetchedAt = now.
        std::future<void> sync_communities(std::vector<Community> communities);

        std::future<void> upsert_spaces(const std::string &communityId, std::vector<CommunitySpace> spaces);

        /// Active communities, ordered by activeMembersToday, messageCount, createdAt (all desc).
        [[nodiscard]] CommunityPage get_communities();

        /// Spaces of a community, most recent activity first. Empty when not ready.
        [[nodiscard]] std::vector<CommunitySpace> get_spaces(const std::string &communityId);

        /// Drops non-active communities not fetched for communityRetentionDays. Returns rows removed.
        std::future<std::int64_t> cleanup(Timestamp now);

        void drain() { serializer_.drain(); }

        [[nodiscard]] CacheMetrics get_metrics() const noexcept { return metrics_.snapshot(); }

    private:
        void ensure_open() const;
        void init_schema();
        void create_tables();
        void transaction(const std::function<void()> &fn);

        void write_community(const Community &c);
        void write_space(const CommunitySpace &s);

        std::string path_;
        Config config_;
        sqlite3 *db_{nullptr};
        mutable std::recursive_mutex mutex_;
        int txDepth_{0};
        bool rebuilt_{false};

        CacheMetricsMonitor metrics_;
        TransactionSerializer serializer_;
    };

} // namespace localsync::cache

#endif // LOCALSYNC_CACHE_COMMUNITY_STORE_HPP
