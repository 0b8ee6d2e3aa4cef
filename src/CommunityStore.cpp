#include <localsync/cache/CommunityStore.hpp>
#include <localsync/cache/errors.hpp>

#include <array>
#include <chrono>
#include <string_view>
#include <utility>

#include <vix/utils/Logger.hpp>

#include "codec.hpp"
#include "sqlite_util.hpp"

namespace localsync::cache
{
    using namespace localsync::cache::detail;

    static vix::utils::Logger &logger = vix::utils::Logger::getInstance();
    using Logger = vix::utils::Logger;

    namespace
    {
        constexpr Timestamp kDayMs = 24LL * 60 * 60 * 1000;

        constexpr std::array<std::string_view, 48> kCommunityColumns{
            "id", "name", "slug", "description", "cover_image_url", "avatar_url",
            "type", "interaction_type", "status", "join_requirement", "verification_status", "owner_id",
            // policy
            "allow_invites", "allow_member_invites", "require_email_verification", "minimum_age",
            "max_members", "allow_space_creation", "allow_file_uploads", "max_file_size",
            // moderation
            "enable_slow_mode", "slow_mode_delay", "enable_word_filter", "banned_words",
            "require_message_approval", "enable_raid_protection",
            // stats
            "space_count", "active_members_today", "message_count", "member_count",
            // discovery
            "keywords", "is_featured", "is_trending", "is_platform_verified",
            "website", "discord_url", "twitter_handle", "github_org",
            "settings", "metadata",
            "is_joined", "is_owner", "member_role",
            "local_timestamp", "last_fetched_at", "sync_status", "created_at", "updated_at",
        };

        constexpr std::array<std::string_view, 17> kSpaceColumns{
            "id", "community_id", "name", "description", "type", "interaction_type", "status",
            "user_role", "is_joined", "joined_at",
            "last_message_at", "last_message_preview", "unread_count",
            "local_timestamp", "sync_status", "created_at", "updated_at",
        };

        /// INSERT ... ON CONFLICT(id) DO UPDATE for every non-key column.
        template <std::size_t N>
        std::string upsert_sql(std::string_view table, const std::array<std::string_view, N> &cols)
        {
            std::string names;
            std::string params;
            std::string updates;
            for (std::size_t i = 0; i < N; ++i)
            {
                if (i)
                {
                    names += ", ";
                    params += ", ";
                }
                names += cols[i];
                params += "?";

                if (cols[i] != "id")
                {
                    if (!updates.empty())
                        updates += ", ";
                    updates += std::string(cols[i]) + " = excluded." + std::string(cols[i]);
                }
            }

            return "INSERT INTO " + std::string(table) + " (" + names + ") VALUES (" + params +
                   ") ON CONFLICT(id) DO UPDATE SET " + updates + ";";
        }

        template <std::size_t N>
        std::string select_sql(std::string_view table, const std::array<std::string_view, N> &cols)
        {
            std::string out = "SELECT ";
            for (std::size_t i = 0; i < N; ++i)
            {
                if (i)
                    out += ", ";
                out += cols[i];
            }
            return out + " FROM " + std::string(table) + " ";
        }

        /// Sequential binder: each call binds the next parameter.
        struct Binder
        {
            sqlite3_stmt *st;
            int idx = 1;

            void text(std::string_view v) { bind_text(st, idx++, v); }
            void opt_text(const std::optional<std::string> &v) { bind_opt_text(st, idx++, v); }
            void i64(std::int64_t v) { bind_int64(st, idx++, v); }
            void opt_i64(const std::optional<std::int64_t> &v) { bind_opt_int64(st, idx++, v); }
            void flag(bool v) { bind_bool(st, idx++, v); }
        };

        /// Sequential column reader, mirror of Binder.
        struct Reader
        {
            sqlite3_stmt *st;
            int col = 0;

            std::string text() { return col_text(st, col++); }
            std::optional<std::string> opt_text() { return col_opt_text(st, col++); }
            std::int64_t i64() { return col_int64(st, col++); }
            std::optional<std::int64_t> opt_i64() { return col_opt_int64(st, col++); }
            bool flag() { return col_bool(st, col++); }
        };

        void bind_community(sqlite3_stmt *st, const Community &c)
        {
            Binder b{st};
            b.text(c.id);
            b.text(c.name);
            b.text(c.slug);
            b.text(c.description);
            b.opt_text(c.coverImageUrl);
            b.opt_text(c.avatarUrl);
            b.text(c.type);
            b.text(c.interactionType);
            b.text(c.status);
            b.text(c.joinRequirement);
            b.text(c.verificationStatus);
            b.text(c.ownerId);

            b.flag(c.policy.allowInvites);
            b.flag(c.policy.allowMemberInvites);
            b.flag(c.policy.requireEmailVerification);
            b.i64(c.policy.minimumAge);
            b.i64(c.policy.maxMembers);
            b.flag(c.policy.allowSpaceCreation);
            b.flag(c.policy.allowFileUploads);
            b.i64(c.policy.maxFileSize);

            b.flag(c.moderation.enableSlowMode);
            b.i64(c.moderation.slowModeDelay);
            b.flag(c.moderation.enableWordFilter);
            b.text(encode_string_list(c.moderation.bannedWords));
            b.flag(c.moderation.requireMessageApproval);
            b.flag(c.moderation.enableRaidProtection);

            b.i64(c.spaceCount);
            b.i64(c.activeMembersToday);
            b.i64(c.messageCount);
            b.i64(c.memberCount);

            b.text(encode_string_list(c.keywords));
            b.flag(c.isFeatured);
            b.flag(c.isTrending);
            b.flag(c.isPlatformVerified);
            b.opt_text(c.website);
            b.opt_text(c.discordUrl);
            b.opt_text(c.twitterHandle);
            b.opt_text(c.githubOrg);
            b.text(encode_metadata(c.settings));
            b.text(encode_metadata(c.metadata));

            b.flag(c.isJoined);
            b.flag(c.isOwner);
            b.opt_text(c.memberRole);

            b.i64(c.localTimestamp);
            b.i64(c.lastFetchedAt);
            b.text(to_string(c.syncStatus));
            b.i64(c.createdAt);
            b.i64(c.updatedAt);

            if (b.idx - 1 != static_cast<int>(kCommunityColumns.size()))
                throw StorageError("[CommunityStore] community binder out of sync with columns", SQLITE_MISUSE);
        }

        Community read_community(sqlite3_stmt *st)
        {
            Reader r{st};
            Community c;
            c.id = r.text();
            c.name = r.text();
            c.slug = r.text();
            c.description = r.text();
            c.coverImageUrl = r.opt_text();
            c.avatarUrl = r.opt_text();
            c.type = r.text();
            c.interactionType = r.text();
            c.status = r.text();
            c.joinRequirement = r.text();
            c.verificationStatus = r.text();
            c.ownerId = r.text();

            c.policy.allowInvites = r.flag();
            c.policy.allowMemberInvites = r.flag();
            c.policy.requireEmailVerification = r.flag();
            c.policy.minimumAge = static_cast<int>(r.i64());
            c.policy.maxMembers = r.i64();
            c.policy.allowSpaceCreation = r.flag();
            c.policy.allowFileUploads = r.flag();
            c.policy.maxFileSize = r.i64();

            c.moderation.enableSlowMode = r.flag();
            c.moderation.slowModeDelay = static_cast<int>(r.i64());
            c.moderation.enableWordFilter = r.flag();
            c.moderation.bannedWords = decode_string_list(r.text());
            c.moderation.requireMessageApproval = r.flag();
            c.moderation.enableRaidProtection = r.flag();

            c.spaceCount = r.i64();
            c.activeMembersToday = r.i64();
            c.messageCount = r.i64();
            c.memberCount = r.i64();

            c.keywords = decode_string_list(r.text());
            c.isFeatured = r.flag();
            c.isTrending = r.flag();
            c.isPlatformVerified = r.flag();
            c.website = r.opt_text();
            c.discordUrl = r.opt_text();
            c.twitterHandle = r.opt_text();
            c.githubOrg = r.opt_text();
            c.settings = decode_metadata(r.text());
            c.metadata = decode_metadata(r.text());

            c.isJoined = r.flag();
            c.isOwner = r.flag();
            c.memberRole = r.opt_text();

            c.localTimestamp = r.i64();
            c.lastFetchedAt = r.i64();
            c.syncStatus = parse_sync_status(r.text()).value_or(SyncStatus::Synced);
            c.createdAt = r.i64();
            c.updatedAt = r.i64();
            return c;
        }

        void bind_space(sqlite3_stmt *st, const CommunitySpace &s)
        {
            Binder b{st};
            b.text(s.id);
            b.text(s.communityId);
            b.text(s.name);
            b.opt_text(s.description);
            b.text(s.type);
            b.text(s.interactionType);
            b.text(s.status);
            b.opt_text(s.userRole);
            b.flag(s.isJoined);
            b.opt_i64(s.joinedAt);
            b.opt_i64(s.lastMessageAt);
            b.opt_text(s.lastMessagePreview);
            b.i64(s.unreadCount);
            b.i64(s.localTimestamp);
            b.text(to_string(s.syncStatus));
            b.i64(s.createdAt);
            b.i64(s.updatedAt);

            if (b.idx - 1 != static_cast<int>(kSpaceColumns.size()))
                throw StorageError("[CommunityStore] space binder out of sync with columns", SQLITE_MISUSE);
        }

        CommunitySpace read_space(sqlite3_stmt *st)
        {
            Reader r{st};
            CommunitySpace s;
            s.id = r.text();
            s.communityId = r.text();
            s.name = r.text();
            s.description = r.opt_text();
            s.type = r.text();
            s.interactionType = r.text();
            s.status = r.text();
            s.userRole = r.opt_text();
            s.isJoined = r.flag();
            s.joinedAt = r.opt_i64();
            s.lastMessageAt = r.opt_i64();
            s.lastMessagePreview = r.opt_text();
            s.unreadCount = r.i64();
            s.localTimestamp = r.i64();
            s.syncStatus = parse_sync_status(r.text()).value_or(SyncStatus::Synced);
            s.createdAt = r.i64();
            s.updatedAt = r.i64();
            return s;
        }
    } // namespace

    // ───────────────────────── Ctor / Dtor ─────────────────────────

    CommunityStore::CommunityStore(std::string dbPath, Config config)
        : path_(std::move(dbPath)),
          config_(config),
          serializer_(RetryPolicy::from_config(config), &metrics_)
    {
    }

    CommunityStore::~CommunityStore()
    {
        serializer_.stop();
        close();
    }

    // ───────────────────────── open() / close() ─────────────────────────

    void CommunityStore::open()
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (db_)
            return;

        const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
        int rc = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);
        if (rc != SQLITE_OK)
        {
            std::string msg = "[CommunityStore] Failed to open DB '" + path_ + "': ";
            msg += db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
            if (db_)
            {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            logger.log(Logger::Level::ERROR, "[cache][Communities] {}", msg);
            throw StorageUnavailable(msg);
        }

        try
        {
            exec_sql(db_, "PRAGMA journal_mode=WAL;", "set WAL");
            exec_sql(db_, "PRAGMA synchronous=NORMAL;", "set synchronous");
            sqlite3_busy_timeout(db_, static_cast<int>(config_.busyTimeout.count()));
            init_schema();
        }
        catch (const CacheError &e)
        {
            sqlite3_close(db_);
            db_ = nullptr;
            logger.log(Logger::Level::ERROR, "[cache][Communities] init failed: {}", e.what());
            throw StorageUnavailable(std::string("[CommunityStore] init failed: ") + e.what());
        }

        metrics_.set_ready(true);
        logger.log(Logger::Level::INFO, "[cache][Communities] opened {} (schema v{})", path_, kSchemaVersion);
    }

    void CommunityStore::close() noexcept
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        metrics_.set_ready(false);
        if (db_)
        {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    bool CommunityStore::is_ready() const noexcept
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return db_ != nullptr;
    }

    void CommunityStore::ensure_open() const
    {
        if (!db_)
            throw StorageUnavailable("[CommunityStore] store is not open");
    }

    // ───────────────────────── Schema ─────────────────────────

    void CommunityStore::init_schema()
    {
        int version = 0;
        {
            Statement st(db_, "PRAGMA user_version;", "prepare user_version");
            if (st.step("step user_version"))
                version = sqlite3_column_int(st.get(), 0);
        }

        rebuilt_ = false;
        if (version != kSchemaVersion)
        {
            if (version != 0)
            {
                logger.log(Logger::Level::WARN,
                           "[cache][Communities] schema v{} found, expected v{}: rebuilding",
                           version, kSchemaVersion);
                rebuilt_ = true;
            }

            exec_sql(db_,
                     "DROP TABLE IF EXISTS communities;"
                     "DROP TABLE IF EXISTS community_spaces;"
                     "DROP TABLE IF EXISTS community_cache_metrics;",
                     "drop tables");

            create_tables();

            const std::string pragma = "PRAGMA user_version = " + std::to_string(kSchemaVersion) + ";";
            exec_sql(db_, pragma.c_str(), "set user_version");
        }
        else
        {
            create_tables();
        }
    }

    void CommunityStore::create_tables()
    {
        exec_sql(db_,
                 "CREATE TABLE IF NOT EXISTS communities ("
                 "  id TEXT PRIMARY KEY,"
                 "  name TEXT NOT NULL,"
                 "  slug TEXT NOT NULL,"
                 "  description TEXT NOT NULL,"
                 "  cover_image_url TEXT,"
                 "  avatar_url TEXT,"
                 "  type TEXT NOT NULL DEFAULT 'public',"
                 "  interaction_type TEXT NOT NULL DEFAULT 'hybrid',"
                 "  status TEXT NOT NULL DEFAULT 'active',"
                 "  join_requirement TEXT NOT NULL DEFAULT 'open',"
                 "  verification_status TEXT NOT NULL DEFAULT 'unverified',"
                 "  owner_id TEXT NOT NULL,"
                 "  allow_invites INTEGER NOT NULL DEFAULT 1,"
                 "  allow_member_invites INTEGER NOT NULL DEFAULT 1,"
                 "  require_email_verification INTEGER NOT NULL DEFAULT 0,"
                 "  minimum_age INTEGER NOT NULL DEFAULT 13,"
                 "  max_members INTEGER NOT NULL DEFAULT 100000,"
                 "  allow_space_creation INTEGER NOT NULL DEFAULT 1,"
                 "  allow_file_uploads INTEGER NOT NULL DEFAULT 1,"
                 "  max_file_size INTEGER NOT NULL DEFAULT 52428800,"
                 "  enable_slow_mode INTEGER NOT NULL DEFAULT 0,"
                 "  slow_mode_delay INTEGER NOT NULL DEFAULT 0,"
                 "  enable_word_filter INTEGER NOT NULL DEFAULT 1,"
                 "  banned_words TEXT NOT NULL DEFAULT '[]',"
                 "  require_message_approval INTEGER NOT NULL DEFAULT 0,"
                 "  enable_raid_protection INTEGER NOT NULL DEFAULT 0,"
                 "  space_count INTEGER NOT NULL DEFAULT 0,"
                 "  active_members_today INTEGER NOT NULL DEFAULT 0,"
                 "  message_count INTEGER NOT NULL DEFAULT 0,"
                 "  member_count INTEGER NOT NULL DEFAULT 1,"
                 "  keywords TEXT NOT NULL DEFAULT '[]',"
                 "  is_featured INTEGER NOT NULL DEFAULT 0,"
                 "  is_trending INTEGER NOT NULL DEFAULT 0,"
                 "  is_platform_verified INTEGER NOT NULL DEFAULT 0,"
                 "  website TEXT,"
                 "  discord_url TEXT,"
                 "  twitter_handle TEXT,"
                 "  github_org TEXT,"
                 "  settings TEXT NOT NULL DEFAULT '{}',"
                 "  metadata TEXT NOT NULL DEFAULT '{}',"
                 "  is_joined INTEGER NOT NULL DEFAULT 0,"
                 "  is_owner INTEGER NOT NULL DEFAULT 0,"
                 "  member_role TEXT,"
                 "  local_timestamp INTEGER NOT NULL,"
                 "  last_fetched_at INTEGER NOT NULL,"
                 "  sync_status TEXT NOT NULL DEFAULT 'synced',"
                 "  created_at INTEGER NOT NULL,"
                 "  updated_at INTEGER NOT NULL"
                 ");",
                 "create communities");

        exec_sql(db_,
                 "CREATE TABLE IF NOT EXISTS community_spaces ("
                 "  id TEXT PRIMARY KEY,"
                 "  community_id TEXT NOT NULL,"
                 "  name TEXT NOT NULL,"
                 "  description TEXT,"
                 "  type TEXT NOT NULL DEFAULT 'public',"
                 "  interaction_type TEXT NOT NULL DEFAULT 'chat',"
                 "  status TEXT NOT NULL DEFAULT 'active',"
                 "  user_role TEXT,"
                 "  is_joined INTEGER NOT NULL DEFAULT 0,"
                 "  joined_at INTEGER,"
                 "  last_message_at INTEGER,"
                 "  last_message_preview TEXT,"
                 "  unread_count INTEGER NOT NULL DEFAULT 0,"
                 "  local_timestamp INTEGER NOT NULL,"
                 "  sync_status TEXT NOT NULL DEFAULT 'synced',"
                 "  created_at INTEGER NOT NULL,"
                 "  updated_at INTEGER NOT NULL"
                 ");",
                 "create community_spaces");

        exec_sql(db_,
                 "CREATE INDEX IF NOT EXISTS idx_communities_activity "
                 "  ON communities (status, active_members_today DESC, message_count DESC, created_at DESC);"
                 "CREATE INDEX IF NOT EXISTS idx_communities_fetched ON communities (status, last_fetched_at);"
                 "CREATE INDEX IF NOT EXISTS idx_communities_owner ON communities (owner_id);"
                 "CREATE INDEX IF NOT EXISTS idx_spaces_community "
                 "  ON community_spaces (community_id, status, last_message_at DESC);",
                 "create indexes");
    }

    void CommunityStore::transaction(const std::function<void()> &fn)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        ensure_open();
        run_transaction(db_, txDepth_, "Communities", fn);
    }

    // ───────────────────────── Writes ─────────────────────────

    void CommunityStore::write_community(const Community &c)
    {
        static const std::string sql = upsert_sql("communities", kCommunityColumns);
        Statement st(db_, sql, "prepare upsert community");
        bind_community(st.get(), c);
        st.step("step upsert community");
    }

    void CommunityStore::write_space(const CommunitySpace &s)
    {
        static const std::string sql = upsert_sql("community_spaces", kSpaceColumns);
        Statement st(db_, sql, "prepare upsert space");
        bind_space(st.get(), s);
        st.step("step upsert space");
    }

    std::future<void> CommunityStore::sync_communities(std::vector<Community> communities)
    {
        return serializer_.submit(
            [this, communities = std::move(communities)]()
            {
                const Timestamp now = now_ms();

                for (const auto &c : communities)
                {
                    if (c.id.empty() || c.ownerId.empty())
                        throw ValidationError("community without id or owner");
                }

                transaction(
                    [&]
                    {
                        for (auto c : communities)
                        {
                            c.localTimestamp = now;
                            c.lastFetchedAt = now;
                            c.syncStatus = SyncStatus::Synced;
                            if (c.createdAt == 0)
                                c.createdAt = now;
                            if (c.updatedAt == 0)
                                c.updatedAt = c.createdAt;
                            if (c.slug.empty())
                                c.slug = c.id;
                            write_community(c);
                        }
                    });

                logger.log(Logger::Level::INFO, "[cache][Communities] synced {} communities",
                           communities.size());
            },
            "sync communities");
    }

    std::future<void> CommunityStore::upsert_spaces(const std::string &communityId,
                                                    std::vector<CommunitySpace> spaces)
    {
        return serializer_.submit(
            [this, communityId, spaces = std::move(spaces)]()
            {
                if (communityId.empty())
                    throw ValidationError("spaces without community id");

                const Timestamp now = now_ms();
                transaction(
                    [&]
                    {
                        for (auto s : spaces)
                        {
                            if (s.id.empty())
                                throw ValidationError("space without id in community " + communityId);

                            s.communityId = communityId;
                            s.localTimestamp = now;
                            s.syncStatus = SyncStatus::Synced;
                            if (s.createdAt == 0)
                                s.createdAt = now;
                            if (s.updatedAt == 0)
                                s.updatedAt = s.createdAt;
                            write_space(s);
                        }
                    });
            },
            "upsert spaces");
    }

    std::future<std::int64_t> CommunityStore::cleanup(Timestamp now)
    {
        return serializer_.submit(
            [this, now]()
            {
                const Timestamp cutoff = now - static_cast<Timestamp>(config_.communityRetentionDays) * kDayMs;
                std::int64_t removed = 0;

                transaction(
                    [&]
                    {
                        Statement del(db_,
                                      "DELETE FROM communities WHERE last_fetched_at < ?1 AND status != 'active';",
                                      "prepare cleanup communities");
                        bind_int64(del.get(), 1, cutoff);
                        del.step("step cleanup communities");
                        removed = sqlite3_changes(db_);

                        exec_sql(db_,
                                 "DELETE FROM community_spaces "
                                 "WHERE community_id NOT IN (SELECT id FROM communities);",
                                 "cleanup orphan spaces");
                    });

                metrics_.record_eviction(static_cast<std::uint64_t>(removed));
                metrics_.set_last_cleanup(now);

                logger.log(Logger::Level::INFO, "[cache][Communities] cleanup removed {} communities", removed);
                return removed;
            },
            "community cleanup");
    }

    // ───────────────────────── Reads ─────────────────────────

    CommunityPage CommunityStore::get_communities()
    {
        if (!is_ready())
        {
            metrics_.record_query(std::chrono::nanoseconds{0}, QueryOutcome::NotReady);
            return CommunityPage{QueryStatus::NotReady, {}, false};
        }

        const auto t0 = std::chrono::steady_clock::now();
        CommunityPage page;

        try
        {
            std::lock_guard<std::recursive_mutex> lock(mutex_);
            ensure_open();

            static const std::string sql =
                select_sql("communities", kCommunityColumns) +
                "WHERE status = 'active' "
                "ORDER BY active_members_today DESC, message_count DESC, created_at DESC;";

            Statement st(db_, sql, "prepare get_communities");
            while (st.step("step get_communities"))
                page.communities.push_back(read_community(st.get()));
        }
        catch (const std::exception &e)
        {
            metrics_.record_query(std::chrono::steady_clock::now() - t0, QueryOutcome::Failed);
            logger.log(Logger::Level::WARN, "[cache][Communities] read failed: {}", e.what());
            return CommunityPage{QueryStatus::ReadFailed, {}, false};
        }

        page.status = QueryStatus::Hit;
        page.fromCache = true;
        metrics_.record_query(std::chrono::steady_clock::now() - t0,
                              page.communities.empty() ? QueryOutcome::Miss : QueryOutcome::Hit);
        return page;
    }

    std::vector<CommunitySpace> CommunityStore::get_spaces(const std::string &communityId)
    {
        std::vector<CommunitySpace> out;
        if (!is_ready())
            return out;

        try
        {
            std::lock_guard<std::recursive_mutex> lock(mutex_);
            ensure_open();

            static const std::string sql =
                select_sql("community_spaces", kSpaceColumns) +
                "WHERE community_id = ?1 "
                "ORDER BY COALESCE(last_message_at, 0) DESC, name ASC;";

            Statement st(db_, sql, "prepare get_spaces");
            bind_text(st.get(), 1, communityId);
            while (st.step("step get_spaces"))
                out.push_back(read_space(st.get()));
        }
        catch (const CacheError &e)
        {
            logger.log(Logger::Level::WARN, "[cache][Communities] spaces read failed: {}", e.what());
            out.clear();
        }

        return out;
    }

} // namespace localsync::cache
