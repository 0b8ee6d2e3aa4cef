/**
 * @file test_types.cpp
 * @brief Record helpers, enum names and the storage codec.
 */

#include <gtest/gtest.h>

#include <localsync/cache/errors.hpp>
#include <localsync/cache/types.hpp>

#include "TestCache.hpp"
#include "codec.hpp"

using namespace localsync::cache;
using namespace localsync::cache::test;

TEST(CachedMessageTest, IdentityKeyPrefersServerId)
{
    auto m = make_message("c1", std::nullopt, std::string("opt_1"));
    EXPECT_EQ(m.identity_key(), "opt_1");

    m.serverId = "m1";
    EXPECT_EQ(m.identity_key(), "m1");

    m.serverId.reset();
    m.optimisticId.reset();
    EXPECT_TRUE(m.identity_key().empty());
}

TEST(CachedMessageTest, OrderingFallsBackToClientTimestamp)
{
    auto m = make_message("c1", std::nullopt, std::string("opt_1"));
    m.clientTimestamp = 42;
    EXPECT_EQ(m.ordering_timestamp(), 42);

    m.serverTimestamp = 7;
    EXPECT_EQ(m.ordering_timestamp(), 7);
}

TEST(EnumNamesTest, ParseIsCaseInsensitive)
{
    EXPECT_EQ(parse_message_status("DELIVERED"), MessageStatus::Delivered);
    EXPECT_EQ(parse_message_status("read"), MessageStatus::Read);
    EXPECT_EQ(parse_sync_status("Synced"), SyncStatus::Synced);
    EXPECT_EQ(parse_message_kind("Announcement"), MessageKind::Announcement);

    EXPECT_FALSE(parse_message_status("archived").has_value());
    EXPECT_FALSE(parse_message_kind("").has_value());
}

TEST(EnumNamesTest, NamesRoundTrip)
{
    for (auto s : {MessageStatus::Pending, MessageStatus::Sent, MessageStatus::Delivered,
                   MessageStatus::Read, MessageStatus::Failed})
    {
        EXPECT_EQ(parse_message_status(to_string(s)), s);
    }

    EXPECT_EQ(to_string(MessageKind::Image), "image");
    EXPECT_EQ(to_string(SyncStatus::Failed), "failed");
    EXPECT_EQ(to_string(ErrorKind::WriteContention), "WriteContention");
}

TEST(FallbackNameTest, UsesFirstEightCharactersOfSender)
{
    EXPECT_EQ(fallback_display_name("0123456789abcdef"), "User 01234567");
    EXPECT_EQ(fallback_display_name("abc"), "User abc");
}

TEST(ErrorsTest, KindsAreCarried)
{
    WriteFailed failed("boom", 3);
    EXPECT_EQ(failed.kind(), ErrorKind::WriteFailed);
    EXPECT_EQ(failed.attempts(), 3);

    StorageError err("disk", 10);
    EXPECT_EQ(err.kind(), ErrorKind::StorageError);
    EXPECT_EQ(err.sqlite_code(), 10);

    const CacheError &base = err;
    EXPECT_STREQ(base.what(), "disk");
}

TEST(CodecTest, MetadataKeepsScalarTypes)
{
    Metadata meta{
        {"flag", true},
        {"count", 12LL},
        {"ratio", 0.5},
        {"label", std::string("x")},
        {"none", std::monostate{}},
    };

    auto decoded = detail::decode_metadata(detail::encode_metadata(meta));
    EXPECT_EQ(decoded, meta);
}

TEST(CodecTest, MetadataDropsNestedValues)
{
    auto decoded = detail::decode_metadata(R"({"a": 1, "nested": {"b": 2}, "list": [1, 2]})");
    ASSERT_EQ(decoded.size(), 1u);
    EXPECT_EQ(std::get<long long>(decoded.at("a")), 1);
}

TEST(CodecTest, GarbageDecodesToEmpty)
{
    EXPECT_TRUE(detail::decode_metadata("{not json").empty());
    EXPECT_FALSE(detail::decode_attachment("[]").has_value());
    EXPECT_TRUE(detail::decode_string_list("\"scalar\"").empty());
}

TEST(CodecTest, InvalidUtf8IsAValidationError)
{
    const std::string broken("\xff\xfe");

    EXPECT_THROW(detail::encode_metadata(Metadata{{"k", broken}}), ValidationError);
    EXPECT_THROW(detail::encode_string_list({"ok", broken}), ValidationError);

    Attachment att;
    att.url = "https://cdn.example/" + broken;
    EXPECT_THROW(detail::encode_attachment(att), ValidationError);
}

TEST(CodecTest, AttachmentOptionalFields)
{
    Attachment att;
    att.url = "https://cdn.example/img.png";
    att.fileName = "img.png";
    att.mimeType = "image/png";

    auto text = detail::encode_attachment(att);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(text->find("file_size"), std::string::npos);

    auto back = detail::decode_attachment(*text);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, att);

    EXPECT_FALSE(detail::encode_attachment(std::nullopt).has_value());
}
