#include <localsync/cache/SqliteMessageStore.hpp>
#include <localsync/cache/errors.hpp>

#include <array>
#include <string_view>
#include <utility>

#include <vix/utils/Logger.hpp>

#include "codec.hpp"
#include "sqlite_util.hpp"

namespace localsync::cache
{
    using namespace localsync::cache::detail; // Statement / bind_* / col_* / codec

    static vix::utils::Logger &logger = vix::utils::Logger::getInstance();
    using Logger = vix::utils::Logger;

    namespace
    {
        // ───────────────────────── Row mapping ─────────────────────────
        //
        // Column order of the messages table, `seq` excluded. Two columns are
        // derived (identity_key, order_ts); every other column maps to exactly
        // one CachedMessage member. bind_message() and read_message()
        // destructure the whole struct, so adding a member without a column
        // does not compile.

        constexpr std::array<std::string_view, 24> kMessageColumns{
            "conversation_id",
            "identity_key", // derived
            "server_id",
            "optimistic_id",
            "sender_id",
            "sender_name",
            "sender_avatar",
            "kind",
            "content",
            "status",
            "sync_status",
            "server_timestamp",
            "client_timestamp",
            "order_ts", // derived
            "local_timestamp",
            "edited_at",
            "delivered_at",
            "read_at",
            "deleted_at",
            "reply_to",
            "is_pinned",
            "attachment",
            "metadata",
            "is_editing",
        };

        constexpr std::size_t kMessageMembers = 23; // CachedMessage, sequence included
        constexpr std::size_t kDerivedColumns = 2;

        // + 1 for seq ↔ sequence
        static_assert(kMessageColumns.size() + 1 == kMessageMembers + kDerivedColumns,
                      "messages columns and CachedMessage members are out of sync");

        const std::string &column_list()
        {
            static const std::string s = []
            {
                std::string out;
                for (std::size_t i = 0; i < kMessageColumns.size(); ++i)
                {
                    if (i)
                        out += ", ";
                    out += kMessageColumns[i];
                }
                return out;
            }();
            return s;
        }

        const std::string &select_sql()
        {
            static const std::string s = "SELECT seq, " + column_list() + " FROM messages ";
            return s;
        }

        const std::string &insert_sql()
        {
            static const std::string s = []
            {
                std::string out = "INSERT INTO messages (" + column_list() + ") VALUES (";
                for (std::size_t i = 0; i < kMessageColumns.size(); ++i)
                    out += i ? ", ?" : "?";
                out += ");";
                return out;
            }();
            return s;
        }

        const std::string &update_sql()
        {
            static const std::string s = []
            {
                std::string out = "UPDATE messages SET ";
                for (std::size_t i = 0; i < kMessageColumns.size(); ++i)
                {
                    if (i)
                        out += ", ";
                    out += kMessageColumns[i];
                    out += " = ?";
                    out += std::to_string(i + 1);
                }
                out += " WHERE seq = ?" + std::to_string(kMessageColumns.size() + 1) + ";";
                return out;
            }();
            return s;
        }

        /// Binds every column of kMessageColumns, in order, starting at index 1.
        void bind_message(sqlite3_stmt *st, const CachedMessage &msg)
        {
            [[maybe_unused]] const auto &[conversationId, serverId, optimisticId, senderId, senderName,
                                          senderAvatar, kind, content, status, syncStatus,
                                          serverTimestamp, clientTimestamp, localTimestamp,
                                          editedAt, deliveredAt, readAt, deletedAt, replyTo,
                                          isPinned, attachment, metadata, isEditing, sequence] = msg;

            int i = 1;
            bind_text(st, i++, conversationId);
            bind_text(st, i++, msg.identity_key());
            bind_opt_text(st, i++, serverId);
            bind_opt_text(st, i++, optimisticId);
            bind_text(st, i++, senderId);
            bind_text(st, i++, senderName);
            bind_opt_text(st, i++, senderAvatar);
            bind_text(st, i++, to_string(kind));
            bind_text(st, i++, content);
            bind_text(st, i++, to_string(status));
            bind_text(st, i++, to_string(syncStatus));
            bind_opt_int64(st, i++, serverTimestamp);
            bind_int64(st, i++, clientTimestamp);
            bind_int64(st, i++, msg.ordering_timestamp());
            bind_int64(st, i++, localTimestamp);
            bind_opt_int64(st, i++, editedAt);
            bind_opt_int64(st, i++, deliveredAt);
            bind_opt_int64(st, i++, readAt);
            bind_opt_int64(st, i++, deletedAt);
            bind_opt_text(st, i++, replyTo);
            bind_bool(st, i++, isPinned);
            bind_opt_text(st, i++, encode_attachment(attachment));
            bind_text(st, i++, encode_metadata(metadata));
            bind_bool(st, i++, isEditing);
        }

        /// Reads a row produced by select_sql(): seq first, then kMessageColumns.
        CachedMessage read_message(sqlite3_stmt *st)
        {
            CachedMessage msg;
            auto &[conversationId, serverId, optimisticId, senderId, senderName,
                   senderAvatar, kind, content, status, syncStatus,
                   serverTimestamp, clientTimestamp, localTimestamp,
                   editedAt, deliveredAt, readAt, deletedAt, replyTo,
                   isPinned, attachment, metadata, isEditing, sequence] = msg;

            sequence = col_int64(st, 0);
            conversationId = col_text(st, 1);
            // 2: identity_key (derived)
            serverId = col_opt_text(st, 3);
            optimisticId = col_opt_text(st, 4);
            senderId = col_text(st, 5);
            senderName = col_text(st, 6);
            senderAvatar = col_opt_text(st, 7);
            kind = parse_message_kind(col_text(st, 8)).value_or(MessageKind::Text);
            content = col_text(st, 9);
            status = parse_message_status(col_text(st, 10)).value_or(MessageStatus::Pending);
            syncStatus = parse_sync_status(col_text(st, 11)).value_or(SyncStatus::Synced);
            serverTimestamp = col_opt_int64(st, 12);
            clientTimestamp = col_int64(st, 13);
            // 14: order_ts (derived)
            localTimestamp = col_int64(st, 15);
            editedAt = col_opt_int64(st, 16);
            deliveredAt = col_opt_int64(st, 17);
            readAt = col_opt_int64(st, 18);
            deletedAt = col_opt_int64(st, 19);
            replyTo = col_opt_text(st, 20);
            isPinned = col_bool(st, 21);
            if (auto att = col_opt_text(st, 22))
                attachment = decode_attachment(*att);
            metadata = decode_metadata(col_text(st, 23));
            isEditing = col_bool(st, 24);

            return msg;
        }

        void validate(const CachedMessage &msg)
        {
            if (msg.conversationId.empty())
                throw ValidationError("message has no conversation id");
            if (msg.senderId.empty())
                throw ValidationError("message " + msg.identity_key() + " has no sender id");
            if (msg.identity_key().empty())
                throw ValidationError("message in " + msg.conversationId + " has neither server nor optimistic id");
        }
    } // namespace

    // ───────────────────────── Ctor / Dtor ─────────────────────────

    SqliteMessageStore::SqliteMessageStore(std::string db_path,
                                           std::chrono::milliseconds busyTimeout)
        : path_(std::move(db_path)),
          busyTimeout_(busyTimeout)
    {
    }

    SqliteMessageStore::~SqliteMessageStore()
    {
        close();
    }

    // ───────────────────────── open() / close() ─────────────────────────

    void SqliteMessageStore::open()
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (db_)
            return;

        const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
        int rc = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);
        if (rc != SQLITE_OK)
        {
            std::string msg = "[SqliteMessageStore] Failed to open DB '" + path_ + "': ";
            msg += db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
            if (db_)
            {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            logger.log(Logger::Level::ERROR, "[cache][Store] {}", msg);
            throw StorageUnavailable(msg);
        }

        try
        {
            // WAL: readers are not blocked by the writer
            exec("PRAGMA journal_mode=WAL;", "set WAL");
            exec("PRAGMA synchronous=NORMAL;", "set synchronous");
            exec("PRAGMA temp_store=MEMORY;", "set temp_store");
            sqlite3_busy_timeout(db_, static_cast<int>(busyTimeout_.count()));

            init_schema();
        }
        catch (const CacheError &e)
        {
            sqlite3_close(db_);
            db_ = nullptr;
            logger.log(Logger::Level::ERROR, "[cache][Store] init failed: {}", e.what());
            throw StorageUnavailable(std::string("[SqliteMessageStore] init failed: ") + e.what());
        }

        logger.log(Logger::Level::INFO, "[cache][Store] opened {} (schema v{}{})",
                   path_, kSchemaVersion, rebuilt_ ? ", rebuilt" : "");
    }

    void SqliteMessageStore::close() noexcept
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (db_)
        {
            sqlite3_close(db_);
            db_ = nullptr;
            txDepth_ = 0;
        }
    }

    bool SqliteMessageStore::is_open() const noexcept
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return db_ != nullptr;
    }

    void SqliteMessageStore::ensure_open() const
    {
        if (!db_)
            throw StorageUnavailable("[SqliteMessageStore] store is not open");
    }

    void SqliteMessageStore::exec(const char *sql, const char *stage)
    {
        exec_sql(db_, sql, stage);
    }

    // ───────────────────────── Schema ─────────────────────────

    int SqliteMessageStore::user_version()
    {
        Statement st(db_, "PRAGMA user_version;", "prepare user_version");
        if (st.step("step user_version"))
            return sqlite3_column_int(st.get(), 0);
        return 0;
    }

    void SqliteMessageStore::init_schema()
    {
        const int version = user_version();
        rebuilt_ = false;

        if (version != kSchemaVersion)
        {
            if (version != 0)
            {
                logger.log(Logger::Level::WARN,
                           "[cache][Store] schema v{} found, expected v{}: rebuilding cache tables",
                           version, kSchemaVersion);
                rebuilt_ = true;
            }

            drop_tables();
            create_tables();

            const std::string pragma = "PRAGMA user_version = " + std::to_string(kSchemaVersion) + ";";
            exec(pragma.c_str(), "set user_version");
        }
        else
        {
            create_tables();
        }

        // A fresh or rebuilt file starts its cleanup clock now.
        Statement st(db_, "INSERT OR IGNORE INTO cache_metrics (id, last_cleanup) VALUES (1, ?1);",
                     "prepare init metrics");
        bind_int64(st.get(), 1, now_ms());
        st.step("step init metrics");
    }

    void SqliteMessageStore::drop_tables()
    {
        exec("DROP TABLE IF EXISTS messages;"
             "DROP TABLE IF EXISTS conversation_sync_info;"
             "DROP TABLE IF EXISTS user_cache;"
             "DROP TABLE IF EXISTS cache_metrics;",
             "drop tables");
    }

    void SqliteMessageStore::create_tables()
    {
        exec("CREATE TABLE IF NOT EXISTS messages ("
             "  seq              INTEGER PRIMARY KEY AUTOINCREMENT,"
             "  conversation_id  TEXT NOT NULL,"
             "  identity_key     TEXT NOT NULL,"
             "  server_id        TEXT,"
             "  optimistic_id    TEXT,"
             "  sender_id        TEXT NOT NULL,"
             "  sender_name      TEXT NOT NULL,"
             "  sender_avatar    TEXT,"
             "  kind             TEXT NOT NULL DEFAULT 'text',"
             "  content          TEXT NOT NULL,"
             "  status           TEXT NOT NULL DEFAULT 'pending',"
             "  sync_status      TEXT NOT NULL DEFAULT 'synced',"
             "  server_timestamp INTEGER,"
             "  client_timestamp INTEGER NOT NULL,"
             "  order_ts         INTEGER NOT NULL,"
             "  local_timestamp  INTEGER NOT NULL,"
             "  edited_at        INTEGER,"
             "  delivered_at     INTEGER,"
             "  read_at          INTEGER,"
             "  deleted_at       INTEGER,"
             "  reply_to         TEXT,"
             "  is_pinned        INTEGER NOT NULL DEFAULT 0,"
             "  attachment       TEXT,"
             "  metadata         TEXT NOT NULL DEFAULT '{}',"
             "  is_editing       INTEGER NOT NULL DEFAULT 0,"
             "  UNIQUE (conversation_id, identity_key)"
             ");",
             "create messages");

        exec("CREATE TABLE IF NOT EXISTS conversation_sync_info ("
             "  conversation_id        TEXT PRIMARY KEY,"
             "  last_sync_timestamp    INTEGER NOT NULL,"
             "  last_message_timestamp INTEGER NOT NULL,"
             "  message_count          INTEGER NOT NULL DEFAULT 0,"
             "  has_more_messages      INTEGER NOT NULL DEFAULT 1,"
             "  sync_in_progress       INTEGER NOT NULL DEFAULT 0,"
             "  created_at             INTEGER NOT NULL,"
             "  updated_at             INTEGER NOT NULL"
             ");",
             "create conversation_sync_info");

        exec("CREATE TABLE IF NOT EXISTS user_cache ("
             "  user_id      TEXT PRIMARY KEY,"
             "  display_name TEXT NOT NULL,"
             "  avatar_ref   TEXT,"
             "  cached_at    INTEGER NOT NULL,"
             "  expires_at   INTEGER NOT NULL"
             ");",
             "create user_cache");

        exec("CREATE TABLE IF NOT EXISTS cache_metrics ("
             "  id           INTEGER PRIMARY KEY CHECK (id = 1),"
             "  last_cleanup INTEGER NOT NULL DEFAULT 0"
             ");",
             "create cache_metrics");

        exec("CREATE INDEX IF NOT EXISTS idx_messages_conversation_order "
             "  ON messages (conversation_id, order_ts DESC, seq DESC);"
             "CREATE UNIQUE INDEX IF NOT EXISTS idx_messages_server_id "
             "  ON messages (conversation_id, server_id) WHERE server_id IS NOT NULL;"
             "CREATE UNIQUE INDEX IF NOT EXISTS idx_messages_optimistic_id "
             "  ON messages (conversation_id, optimistic_id) WHERE optimistic_id IS NOT NULL;"
             "CREATE INDEX IF NOT EXISTS idx_messages_sync_status "
             "  ON messages (sync_status, local_timestamp);"
             "CREATE INDEX IF NOT EXISTS idx_user_cache_expires ON user_cache (expires_at);",
             "create indexes");
    }

    // ───────────────────────── transaction() ─────────────────────────

    void SqliteMessageStore::transaction(const std::function<void()> &fn)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        ensure_open();
        run_transaction(db_, txDepth_, "Store", fn);
    }

    // ───────────────────────── Messages ─────────────────────────

    std::optional<std::int64_t> SqliteMessageStore::find_sequence(const std::string &conversationId,
                                                                  const std::string &identityKey)
    {
        Statement st(db_,
                     "SELECT seq FROM messages WHERE conversation_id = ?1 AND identity_key = ?2 LIMIT 1;",
                     "prepare find_sequence");
        bind_text(st.get(), 1, conversationId);
        bind_text(st.get(), 2, identityKey);

        if (st.step("step find_sequence"))
            return col_int64(st.get(), 0);
        return std::nullopt;
    }

    std::int64_t SqliteMessageStore::upsert_message(const CachedMessage &msg)
    {
        validate(msg);

        std::lock_guard<std::recursive_mutex> lock(mutex_);
        ensure_open();

        const auto bound = static_cast<int>(kMessageColumns.size());

        auto update_row = [&](std::int64_t seq)
        {
            Statement st(db_, update_sql(), "prepare update message");
            bind_message(st.get(), msg);
            bind_int64(st.get(), bound + 1, seq);
            st.step("step update message");
            return sqlite3_changes(db_) > 0;
        };

        if (msg.sequence > 0 && update_row(msg.sequence))
            return msg.sequence;

        if (auto seq = find_sequence(msg.conversationId, msg.identity_key()))
        {
            update_row(*seq);
            return *seq;
        }

        Statement st(db_, insert_sql(), "prepare insert message");
        bind_message(st.get(), msg);
        st.step("step insert message");

        const auto seq = static_cast<std::int64_t>(sqlite3_last_insert_rowid(db_));
        logger.log(Logger::Level::DEBUG, "[cache][Store] inserted {} in {} (seq={})",
                   msg.identity_key(), msg.conversationId, seq);
        return seq;
    }

    bool SqliteMessageStore::remove_message(std::int64_t sequence)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        ensure_open();

        Statement st(db_, "DELETE FROM messages WHERE seq = ?1;", "prepare remove_message");
        bind_int64(st.get(), 1, sequence);
        st.step("step remove_message");
        return sqlite3_changes(db_) > 0;
    }

    std::vector<CachedMessage> SqliteMessageStore::query_messages(
        const std::string &conversationId,
        std::size_t limit,
        const std::optional<std::string> &beforeIdentityKey)
    {
        std::vector<CachedMessage> out;
        if (limit == 0)
            return out;

        std::lock_guard<std::recursive_mutex> lock(mutex_);
        ensure_open();

        // newest-first, with optional keyset pagination on (order_ts, seq)
        if (beforeIdentityKey.has_value())
        {
            // The anchor may have been confirmed since the caller saw it,
            // so an optimistic id still resolves.
            Statement anchor(db_,
                             "SELECT order_ts, seq FROM messages "
                             "WHERE conversation_id = ?1 AND (identity_key = ?2 OR optimistic_id = ?2) "
                             "LIMIT 1;",
                             "prepare query anchor");
            bind_text(anchor.get(), 1, conversationId);
            bind_text(anchor.get(), 2, *beforeIdentityKey);

            if (!anchor.step("step query anchor"))
                return out;

            const auto anchorTs = col_int64(anchor.get(), 0);
            const auto anchorSeq = col_int64(anchor.get(), 1);

            Statement st(db_,
                         select_sql() +
                             "WHERE conversation_id = ?1 AND deleted_at IS NULL "
                             "AND (order_ts < ?2 OR (order_ts = ?2 AND seq < ?3)) "
                             "ORDER BY order_ts DESC, seq DESC LIMIT ?4;",
                         "prepare query_messages");
            bind_text(st.get(), 1, conversationId);
            bind_int64(st.get(), 2, anchorTs);
            bind_int64(st.get(), 3, anchorSeq);
            bind_int64(st.get(), 4, static_cast<std::int64_t>(limit));

            while (st.step("step query_messages"))
                out.push_back(read_message(st.get()));
            return out;
        }

        Statement st(db_,
                     select_sql() +
                         "WHERE conversation_id = ?1 AND deleted_at IS NULL "
                         "ORDER BY order_ts DESC, seq DESC LIMIT ?2;",
                     "prepare query_messages");
        bind_text(st.get(), 1, conversationId);
        bind_int64(st.get(), 2, static_cast<std::int64_t>(limit));

        while (st.step("step query_messages"))
            out.push_back(read_message(st.get()));

        return out; // newest-first
    }

    std::optional<CachedMessage> SqliteMessageStore::find_one(const std::string &where,
                                                              const std::string &conversationId,
                                                              const std::string &key)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        ensure_open();

        Statement st(db_, select_sql() + where + " LIMIT 1;", "prepare find");
        bind_text(st.get(), 1, conversationId);
        bind_text(st.get(), 2, key);

        if (st.step("step find"))
            return read_message(st.get());
        return std::nullopt;
    }

    std::optional<CachedMessage> SqliteMessageStore::find_by_identity(const std::string &conversationId,
                                                                      const std::string &identityKey)
    {
        return find_one("WHERE conversation_id = ?1 AND identity_key = ?2", conversationId, identityKey);
    }

    std::optional<CachedMessage> SqliteMessageStore::find_by_server_id(const std::string &conversationId,
                                                                       const std::string &serverId)
    {
        return find_one("WHERE conversation_id = ?1 AND server_id = ?2", conversationId, serverId);
    }

    std::optional<CachedMessage> SqliteMessageStore::find_by_optimistic_id(const std::string &conversationId,
                                                                           const std::string &optimisticId)
    {
        return find_one("WHERE conversation_id = ?1 AND optimistic_id = ?2", conversationId, optimisticId);
    }

    std::int64_t SqliteMessageStore::count_messages(const std::string &conversationId)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        ensure_open();

        Statement st(db_,
                     "SELECT COUNT(*) FROM messages WHERE conversation_id = ?1 AND deleted_at IS NULL;",
                     "prepare count_messages");
        bind_text(st.get(), 1, conversationId);

        if (st.step("step count_messages"))
            return col_int64(st.get(), 0);
        return 0;
    }

    // ───────────────────────── Sync cursors ─────────────────────────

    std::optional<ConversationSyncCursor> SqliteMessageStore::get_sync_cursor(const std::string &conversationId)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        ensure_open();

        Statement st(db_,
                     "SELECT conversation_id, last_sync_timestamp, last_message_timestamp, "
                     "message_count, has_more_messages, sync_in_progress "
                     "FROM conversation_sync_info WHERE conversation_id = ?1;",
                     "prepare get_sync_cursor");
        bind_text(st.get(), 1, conversationId);

        if (!st.step("step get_sync_cursor"))
            return std::nullopt;

        ConversationSyncCursor c;
        c.conversationId = col_text(st.get(), 0);
        c.lastSyncTimestamp = col_int64(st.get(), 1);
        c.lastMessageTimestamp = col_int64(st.get(), 2);
        c.cachedMessageCount = col_int64(st.get(), 3);
        c.hasMoreHistory = col_bool(st.get(), 4);
        c.syncInProgress = col_bool(st.get(), 5);
        return c;
    }

    void SqliteMessageStore::upsert_sync_cursor(const ConversationSyncCursor &cursor)
    {
        if (cursor.conversationId.empty())
            throw ValidationError("sync cursor has no conversation id");

        std::lock_guard<std::recursive_mutex> lock(mutex_);
        ensure_open();

        // MAX() keeps the watermarks monotonic even if a caller passes an older value.
        Statement st(db_,
                     "INSERT INTO conversation_sync_info "
                     "(conversation_id, last_sync_timestamp, last_message_timestamp, message_count, "
                     " has_more_messages, sync_in_progress, created_at, updated_at) "
                     "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?7) "
                     "ON CONFLICT(conversation_id) DO UPDATE SET "
                     "  last_sync_timestamp = MAX(last_sync_timestamp, excluded.last_sync_timestamp),"
                     "  last_message_timestamp = MAX(last_message_timestamp, excluded.last_message_timestamp),"
                     "  message_count = excluded.message_count,"
                     "  has_more_messages = excluded.has_more_messages,"
                     "  sync_in_progress = excluded.sync_in_progress,"
                     "  updated_at = excluded.updated_at;",
                     "prepare upsert_sync_cursor");
        bind_text(st.get(), 1, cursor.conversationId);
        bind_int64(st.get(), 2, cursor.lastSyncTimestamp);
        bind_int64(st.get(), 3, cursor.lastMessageTimestamp);
        bind_int64(st.get(), 4, cursor.cachedMessageCount);
        bind_bool(st.get(), 5, cursor.hasMoreHistory);
        bind_bool(st.get(), 6, cursor.syncInProgress);
        bind_int64(st.get(), 7, now_ms());
        st.step("step upsert_sync_cursor");
    }

    // ───────────────────────── User profiles ─────────────────────────

    std::optional<UserProfileCacheEntry> SqliteMessageStore::get_user_profile(const std::string &userId,
                                                                              Timestamp now)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        ensure_open();

        Statement st(db_,
                     "SELECT user_id, display_name, avatar_ref, cached_at, expires_at "
                     "FROM user_cache WHERE user_id = ?1 AND expires_at > ?2;",
                     "prepare get_user_profile");
        bind_text(st.get(), 1, userId);
        bind_int64(st.get(), 2, now);

        if (!st.step("step get_user_profile"))
            return std::nullopt;

        UserProfileCacheEntry e;
        e.userId = col_text(st.get(), 0);
        e.displayName = col_text(st.get(), 1);
        e.avatarRef = col_opt_text(st.get(), 2);
        e.cachedAt = col_int64(st.get(), 3);
        e.expiresAt = col_int64(st.get(), 4);
        return e;
    }

    void SqliteMessageStore::set_user_profile(const UserProfileCacheEntry &entry)
    {
        if (entry.userId.empty())
            throw ValidationError("user profile has no user id");

        std::lock_guard<std::recursive_mutex> lock(mutex_);
        ensure_open();

        Statement st(db_,
                     "INSERT OR REPLACE INTO user_cache (user_id, display_name, avatar_ref, cached_at, expires_at) "
                     "VALUES (?1, ?2, ?3, ?4, ?5);",
                     "prepare set_user_profile");
        bind_text(st.get(), 1, entry.userId);
        bind_text(st.get(), 2, entry.displayName.empty() ? fallback_display_name(entry.userId)
                                                          : entry.displayName);
        bind_opt_text(st.get(), 3, entry.avatarRef);
        bind_int64(st.get(), 4, entry.cachedAt);
        bind_int64(st.get(), 5, entry.expiresAt);
        st.step("step set_user_profile");
    }

    // ───────────────────────── Deletion / retention ─────────────────────────

    std::int64_t SqliteMessageStore::delete_conversation(const std::string &conversationId)
    {
        std::int64_t removed = 0;

        transaction(
            [&]
            {
                Statement msgs(db_, "DELETE FROM messages WHERE conversation_id = ?1;",
                               "prepare delete_conversation");
                bind_text(msgs.get(), 1, conversationId);
                msgs.step("step delete_conversation");
                removed = sqlite3_changes(db_);

                Statement cursor(db_, "DELETE FROM conversation_sync_info WHERE conversation_id = ?1;",
                                 "prepare delete cursor");
                bind_text(cursor.get(), 1, conversationId);
                cursor.step("step delete cursor");
            });

        return removed;
    }

    PurgeResult SqliteMessageStore::delete_expired_messages(Timestamp cutoff)
    {
        PurgeResult result;

        // PENDING / FAILED rows are never candidates, whatever their age.
        static constexpr const char *kExpired =
            "sync_status = 'synced' AND is_pinned = 0 AND local_timestamp < ?1";

        transaction(
            [&]
            {
                Statement touched(db_,
                                  std::string("SELECT DISTINCT conversation_id FROM messages WHERE ") + kExpired + ";",
                                  "prepare expired conversations");
                bind_int64(touched.get(), 1, cutoff);
                while (touched.step("step expired conversations"))
                    result.conversations.push_back(col_text(touched.get(), 0));

                Statement del(db_, std::string("DELETE FROM messages WHERE ") + kExpired + ";",
                              "prepare delete_expired_messages");
                bind_int64(del.get(), 1, cutoff);
                del.step("step delete_expired_messages");
                result.removed = sqlite3_changes(db_);
            });

        return result;
    }

    std::int64_t SqliteMessageStore::delete_expired_profiles(Timestamp now)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        ensure_open();

        Statement st(db_, "DELETE FROM user_cache WHERE expires_at <= ?1;", "prepare delete_expired_profiles");
        bind_int64(st.get(), 1, now);
        st.step("step delete_expired_profiles");
        return sqlite3_changes(db_);
    }

    void SqliteMessageStore::compact()
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        ensure_open();
        exec("VACUUM;", "vacuum");
    }

    Timestamp SqliteMessageStore::last_cleanup()
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        ensure_open();

        Statement st(db_, "SELECT last_cleanup FROM cache_metrics WHERE id = 1;", "prepare last_cleanup");
        if (st.step("step last_cleanup"))
            return col_int64(st.get(), 0);
        return 0;
    }

    void SqliteMessageStore::set_last_cleanup(Timestamp ts)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        ensure_open();

        Statement st(db_,
                     "INSERT INTO cache_metrics (id, last_cleanup) VALUES (1, ?1) "
                     "ON CONFLICT(id) DO UPDATE SET last_cleanup = excluded.last_cleanup;",
                     "prepare set_last_cleanup");
        bind_int64(st.get(), 1, ts);
        st.step("step set_last_cleanup");
    }

} // namespace localsync::cache
