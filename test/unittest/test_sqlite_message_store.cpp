/**
 * @file test_sqlite_message_store.cpp
 * @brief SqliteMessageStore: schema, upsert semantics, ordering, retention queries.
 */

#include <gtest/gtest.h>

#include <sqlite3.h>

#include <localsync/cache/SqliteMessageStore.hpp>
#include <localsync/cache/errors.hpp>

#include "TestCache.hpp"

using namespace localsync::cache;
using namespace localsync::cache::test;

class SqliteMessageStoreTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        store_ = std::make_unique<SqliteMessageStore>(db_.str(), std::chrono::milliseconds{0});
        store_->open();
    }

    void TearDown() override
    {
        store_.reset();
    }

    CachedMessage server_row(const std::string &conv, const std::string &id, Timestamp ts)
    {
        auto m = make_message(conv, id, std::nullopt, "msg " + id);
        m.serverTimestamp = ts;
        return m;
    }

    TempDbPath db_;
    std::unique_ptr<SqliteMessageStore> store_;
};

TEST(SqliteMessageStoreOpenTest, OperationsBeforeOpenThrow)
{
    TempDbPath db;
    SqliteMessageStore store(db.str());

    EXPECT_FALSE(store.is_open());
    EXPECT_THROW(store.count_messages("c1"), StorageUnavailable);
    EXPECT_THROW(store.upsert_message(make_message("c1", std::nullopt, std::string("o1"))), StorageUnavailable);
}

TEST(SqliteMessageStoreOpenTest, OpenFailsOnUnreachablePath)
{
    SqliteMessageStore store("/nonexistent-localsync-dir/nested/cache.db");
    EXPECT_THROW(store.open(), StorageUnavailable);
    EXPECT_FALSE(store.is_open());
}

TEST_F(SqliteMessageStoreTest, OpenIsIdempotent)
{
    auto seq = store_->upsert_message(make_message("c1", std::nullopt, std::string("o1")));
    EXPECT_GT(seq, 0);

    store_->open();
    EXPECT_TRUE(store_->is_open());
    EXPECT_EQ(store_->count_messages("c1"), 1);
}

TEST_F(SqliteMessageStoreTest, UpsertValidatesRequiredFields)
{
    auto noConversation = make_message("", std::nullopt, std::string("o1"));
    EXPECT_THROW(store_->upsert_message(noConversation), ValidationError);

    auto noSender = make_message("c1", std::nullopt, std::string("o1"));
    noSender.senderId.clear();
    EXPECT_THROW(store_->upsert_message(noSender), ValidationError);

    auto noIdentity = make_message("c1", std::nullopt, std::nullopt);
    EXPECT_THROW(store_->upsert_message(noIdentity), ValidationError);

    EXPECT_EQ(store_->count_messages("c1"), 0);
}

TEST_F(SqliteMessageStoreTest, UpsertReplacesByIdentityKey)
{
    auto first = store_->upsert_message(make_message("c1", std::nullopt, std::string("o1"), "v1"));
    auto second = store_->upsert_message(make_message("c1", std::nullopt, std::string("o1"), "v2"));

    EXPECT_EQ(first, second);
    EXPECT_EQ(store_->count_messages("c1"), 1);

    auto row = store_->find_by_identity("c1", "o1");
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->content, "v2");
}

TEST_F(SqliteMessageStoreTest, SameIdentityInOtherConversationIsDistinct)
{
    store_->upsert_message(make_message("c1", std::nullopt, std::string("o1")));
    store_->upsert_message(make_message("c2", std::nullopt, std::string("o1")));

    EXPECT_EQ(store_->count_messages("c1"), 1);
    EXPECT_EQ(store_->count_messages("c2"), 1);
}

TEST_F(SqliteMessageStoreTest, UpsertBySequenceSwitchesIdentity)
{
    auto draft = make_message("c1", std::nullopt, std::string("opt_1"));
    draft.sequence = store_->upsert_message(draft);

    draft.serverId = "m1";
    draft.serverTimestamp = 5000;
    auto seq = store_->upsert_message(draft);

    EXPECT_EQ(seq, draft.sequence);
    EXPECT_EQ(store_->count_messages("c1"), 1);

    auto byServer = store_->find_by_server_id("c1", "m1");
    auto byOptimistic = store_->find_by_optimistic_id("c1", "opt_1");
    ASSERT_TRUE(byServer.has_value());
    ASSERT_TRUE(byOptimistic.has_value());
    EXPECT_EQ(byServer->sequence, byOptimistic->sequence);
    EXPECT_EQ(byServer->identity_key(), "m1");

    EXPECT_FALSE(store_->find_by_identity("c1", "opt_1").has_value());
}

TEST_F(SqliteMessageStoreTest, RowRoundTripsEveryField)
{
    CachedMessage m = make_message("c1", std::string("m1"), std::string("o1"), "full");
    m.senderAvatar = "avatars/alice.png";
    m.kind = MessageKind::Image;
    m.status = MessageStatus::Read;
    m.syncStatus = SyncStatus::Synced;
    m.serverTimestamp = 111;
    m.clientTimestamp = 100;
    m.localTimestamp = 222;
    m.editedAt = 333;
    m.deliveredAt = 444;
    m.readAt = 555;
    m.replyTo = "m0";
    m.isPinned = true;
    m.isEditing = true;
    m.attachment = Attachment{"https://cdn/x.png", "x.png", 2048, "image/png", std::string("https://cdn/x_t.png")};
    m.metadata = Metadata{{"edited", true}, {"reactions", 3LL}};

    m.sequence = store_->upsert_message(m);

    auto back = store_->find_by_identity("c1", "m1");
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->sequence, m.sequence);
    EXPECT_EQ(back->senderAvatar, m.senderAvatar);
    EXPECT_EQ(back->kind, MessageKind::Image);
    EXPECT_EQ(back->status, MessageStatus::Read);
    EXPECT_EQ(back->serverTimestamp, m.serverTimestamp);
    EXPECT_EQ(back->clientTimestamp, 100);
    EXPECT_EQ(back->localTimestamp, 222);
    EXPECT_EQ(back->editedAt, m.editedAt);
    EXPECT_EQ(back->deliveredAt, m.deliveredAt);
    EXPECT_EQ(back->readAt, m.readAt);
    EXPECT_FALSE(back->deletedAt.has_value());
    EXPECT_EQ(back->replyTo, m.replyTo);
    EXPECT_TRUE(back->isPinned);
    EXPECT_TRUE(back->isEditing);
    EXPECT_EQ(back->attachment, m.attachment);
    EXPECT_EQ(back->metadata, m.metadata);
}

TEST_F(SqliteMessageStoreTest, QueryOrdersNewestFirstWithInsertionTies)
{
    store_->upsert_message(server_row("c1", "a", 100));
    store_->upsert_message(server_row("c1", "b", 300));
    store_->upsert_message(server_row("c1", "c", 200));
    store_->upsert_message(server_row("c1", "d", 300)); // tie with b, inserted later

    auto draft = make_message("c1", std::nullopt, std::string("o1"));
    draft.clientTimestamp = 250; // no server timestamp yet
    store_->upsert_message(draft);

    auto rows = store_->query_messages("c1", 10);
    ASSERT_EQ(rows.size(), 5u);
    EXPECT_EQ(rows[0].identity_key(), "d");
    EXPECT_EQ(rows[1].identity_key(), "b");
    EXPECT_EQ(rows[2].identity_key(), "o1");
    EXPECT_EQ(rows[3].identity_key(), "c");
    EXPECT_EQ(rows[4].identity_key(), "a");
}

TEST_F(SqliteMessageStoreTest, QueryPaginatesBeforeAnchor)
{
    for (int i = 1; i <= 5; ++i)
        store_->upsert_message(server_row("c1", "m" + std::to_string(i), i * 100));

    auto first = store_->query_messages("c1", 2);
    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(first[1].identity_key(), "m4");

    auto next = store_->query_messages("c1", 2, std::string("m4"));
    ASSERT_EQ(next.size(), 2u);
    EXPECT_EQ(next[0].identity_key(), "m3");
    EXPECT_EQ(next[1].identity_key(), "m2");

    auto last = store_->query_messages("c1", 10, std::string("m1"));
    EXPECT_TRUE(last.empty());

    EXPECT_TRUE(store_->query_messages("c1", 10, std::string("unknown")).empty());
    EXPECT_TRUE(store_->query_messages("c1", 0).empty());
}

TEST_F(SqliteMessageStoreTest, AnchorResolvesConfirmedOptimisticId)
{
    store_->upsert_message(server_row("c1", "m1", 100));
    auto confirmed = server_row("c1", "m2", 200);
    confirmed.optimisticId = "opt_2";
    store_->upsert_message(confirmed);

    auto older = store_->query_messages("c1", 10, std::string("opt_2"));
    ASSERT_EQ(older.size(), 1u);
    EXPECT_EQ(older[0].identity_key(), "m1");
}

TEST_F(SqliteMessageStoreTest, SoftDeletedRowsAreHidden)
{
    store_->upsert_message(server_row("c1", "m1", 100));
    auto gone = server_row("c1", "m2", 200);
    gone.deletedAt = 250;
    store_->upsert_message(gone);

    auto rows = store_->query_messages("c1", 10);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].identity_key(), "m1");
    EXPECT_EQ(store_->count_messages("c1"), 1);
}

TEST_F(SqliteMessageStoreTest, CursorNeverRegresses)
{
    ConversationSyncCursor cursor;
    cursor.conversationId = "c1";
    cursor.lastSyncTimestamp = 2000;
    cursor.lastMessageTimestamp = 1900;
    cursor.cachedMessageCount = 4;
    store_->upsert_sync_cursor(cursor);

    cursor.lastSyncTimestamp = 1000;
    cursor.lastMessageTimestamp = 900;
    cursor.cachedMessageCount = 2;
    cursor.hasMoreHistory = false;
    store_->upsert_sync_cursor(cursor);

    auto stored = store_->get_sync_cursor("c1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->lastSyncTimestamp, 2000);
    EXPECT_EQ(stored->lastMessageTimestamp, 1900);
    EXPECT_EQ(stored->cachedMessageCount, 2);
    EXPECT_FALSE(stored->hasMoreHistory);

    EXPECT_FALSE(store_->get_sync_cursor("c2").has_value());
}

TEST_F(SqliteMessageStoreTest, ExpiredProfilesAreAbsent)
{
    UserProfileCacheEntry entry;
    entry.userId = "u1";
    entry.displayName = "Alice";
    entry.cachedAt = 1000;
    entry.expiresAt = 2000;
    store_->set_user_profile(entry);

    auto fresh = store_->get_user_profile("u1", 1500);
    ASSERT_TRUE(fresh.has_value());
    EXPECT_EQ(fresh->displayName, "Alice");

    EXPECT_FALSE(store_->get_user_profile("u1", 2000).has_value());
    EXPECT_EQ(store_->delete_expired_profiles(2500), 1);
    EXPECT_FALSE(store_->get_user_profile("u1", 1500).has_value());
}

TEST_F(SqliteMessageStoreTest, ProfileWithoutNameGetsPlaceholder)
{
    UserProfileCacheEntry entry;
    entry.userId = "abcdefghijk";
    entry.cachedAt = 1;
    entry.expiresAt = now_ms() + kDay;
    store_->set_user_profile(entry);

    auto stored = store_->get_user_profile("abcdefghijk", now_ms());
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->displayName, "User abcdefgh");
}

TEST_F(SqliteMessageStoreTest, DeleteExpiredKeepsUnsyncedAndPinned)
{
    const Timestamp old = now_ms() - 40 * kDay;

    auto synced = server_row("c1", "old-synced", 100);
    synced.localTimestamp = old;
    store_->upsert_message(synced);

    auto pinned = server_row("c1", "old-pinned", 110);
    pinned.localTimestamp = old;
    pinned.isPinned = true;
    store_->upsert_message(pinned);

    auto pending = make_message("c2", std::nullopt, std::string("old-pending"));
    pending.localTimestamp = old;
    store_->upsert_message(pending);

    auto failed = make_message("c2", std::nullopt, std::string("old-failed"));
    failed.localTimestamp = old;
    failed.status = MessageStatus::Failed;
    failed.syncStatus = SyncStatus::Failed;
    store_->upsert_message(failed);

    auto recent = server_row("c3", "recent", 120);
    store_->upsert_message(recent);

    auto purged = store_->delete_expired_messages(now_ms() - 30 * kDay);
    EXPECT_EQ(purged.removed, 1);
    ASSERT_EQ(purged.conversations.size(), 1u);
    EXPECT_EQ(purged.conversations[0], "c1");

    EXPECT_FALSE(store_->find_by_identity("c1", "old-synced").has_value());
    EXPECT_TRUE(store_->find_by_identity("c1", "old-pinned").has_value());
    EXPECT_TRUE(store_->find_by_identity("c2", "old-pending").has_value());
    EXPECT_TRUE(store_->find_by_identity("c2", "old-failed").has_value());
    EXPECT_TRUE(store_->find_by_identity("c3", "recent").has_value());
}

TEST_F(SqliteMessageStoreTest, DeleteConversationRemovesRowsAndCursor)
{
    store_->upsert_message(server_row("c1", "m1", 100));
    store_->upsert_message(server_row("c1", "m2", 200));
    store_->upsert_message(server_row("c2", "m3", 300));

    ConversationSyncCursor cursor;
    cursor.conversationId = "c1";
    cursor.lastSyncTimestamp = 200;
    store_->upsert_sync_cursor(cursor);

    EXPECT_EQ(store_->delete_conversation("c1"), 2);
    EXPECT_EQ(store_->count_messages("c1"), 0);
    EXPECT_FALSE(store_->get_sync_cursor("c1").has_value());
    EXPECT_EQ(store_->count_messages("c2"), 1);
}

TEST_F(SqliteMessageStoreTest, RemoveMessageBySequence)
{
    auto seq = store_->upsert_message(server_row("c1", "m1", 100));
    EXPECT_TRUE(store_->remove_message(seq));
    EXPECT_FALSE(store_->remove_message(seq));
    EXPECT_EQ(store_->count_messages("c1"), 0);
}

TEST_F(SqliteMessageStoreTest, TransactionRollsBackOnException)
{
    EXPECT_THROW(store_->transaction(
                     [&]
                     {
                         store_->upsert_message(server_row("c1", "m1", 100));
                         store_->transaction([&]
                                             { store_->upsert_message(server_row("c1", "m2", 200)); });
                         throw std::runtime_error("abort batch");
                     }),
                 std::runtime_error);

    EXPECT_EQ(store_->count_messages("c1"), 0);

    store_->transaction([&]
                        { store_->upsert_message(server_row("c1", "m3", 300)); });
    EXPECT_EQ(store_->count_messages("c1"), 1);
}

TEST_F(SqliteMessageStoreTest, CompactAndLastCleanup)
{
    EXPECT_GT(store_->last_cleanup(), 0);

    store_->set_last_cleanup(12345);
    EXPECT_EQ(store_->last_cleanup(), 12345);

    EXPECT_NO_THROW(store_->compact());
}

TEST_F(SqliteMessageStoreTest, LockedDatabaseSurfacesAsContention)
{
    sqlite3 *other = nullptr;
    ASSERT_EQ(sqlite3_open(db_.str().c_str(), &other), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(other, "BEGIN EXCLUSIVE;", nullptr, nullptr, nullptr), SQLITE_OK);

    EXPECT_THROW(store_->upsert_message(server_row("c1", "m1", 100)), WriteContention);

    sqlite3_exec(other, "ROLLBACK;", nullptr, nullptr, nullptr);
    sqlite3_close(other);

    EXPECT_NO_THROW(store_->upsert_message(server_row("c1", "m1", 100)));
}

TEST(SqliteMessageStoreSchemaTest, VersionMismatchRebuildsAndResetsCleanup)
{
    TempDbPath db;

    {
        SqliteMessageStore store(db.str());
        store.open();
        EXPECT_FALSE(store.was_rebuilt());
        store.upsert_message(make_message("c1", std::string("m1"), std::nullopt));
        store.set_last_cleanup(1);
    }

    {
        sqlite3 *raw = nullptr;
        ASSERT_EQ(sqlite3_open(db.str().c_str(), &raw), SQLITE_OK);
        ASSERT_EQ(sqlite3_exec(raw, "PRAGMA user_version = 1;", nullptr, nullptr, nullptr), SQLITE_OK);
        sqlite3_close(raw);
    }

    SqliteMessageStore store(db.str());
    store.open();
    EXPECT_TRUE(store.was_rebuilt());
    EXPECT_EQ(store.count_messages("c1"), 0);
    EXPECT_GT(store.last_cleanup(), 1);
}

TEST(SqliteMessageStoreSchemaTest, MatchingVersionKeepsData)
{
    TempDbPath db;

    {
        SqliteMessageStore store(db.str());
        store.open();
        store.upsert_message(make_message("c1", std::string("m1"), std::nullopt));
    }

    SqliteMessageStore store(db.str());
    store.open();
    EXPECT_FALSE(store.was_rebuilt());
    EXPECT_EQ(store.count_messages("c1"), 1);
}
