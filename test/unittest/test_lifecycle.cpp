/**
 * @file test_lifecycle.cpp
 * @brief Delivery status transitions.
 */

#include <gtest/gtest.h>

#include <localsync/cache/Lifecycle.hpp>

using namespace localsync::cache;
namespace lc = localsync::cache::lifecycle;

TEST(LifecycleTest, ForwardPathAllowsSkips)
{
    EXPECT_TRUE(lc::can_transition(MessageStatus::Pending, MessageStatus::Sent));
    EXPECT_TRUE(lc::can_transition(MessageStatus::Sent, MessageStatus::Delivered));
    EXPECT_TRUE(lc::can_transition(MessageStatus::Delivered, MessageStatus::Read));
    EXPECT_TRUE(lc::can_transition(MessageStatus::Pending, MessageStatus::Read));
    EXPECT_TRUE(lc::can_transition(MessageStatus::Sent, MessageStatus::Read));
}

TEST(LifecycleTest, NoBackwardMoves)
{
    EXPECT_FALSE(lc::can_transition(MessageStatus::Read, MessageStatus::Delivered));
    EXPECT_FALSE(lc::can_transition(MessageStatus::Delivered, MessageStatus::Sent));
    EXPECT_FALSE(lc::can_transition(MessageStatus::Sent, MessageStatus::Pending));
    EXPECT_FALSE(lc::can_transition(MessageStatus::Read, MessageStatus::Pending));
}

TEST(LifecycleTest, FailureOnlyBeforeDelivery)
{
    EXPECT_TRUE(lc::can_transition(MessageStatus::Pending, MessageStatus::Failed));
    EXPECT_TRUE(lc::can_transition(MessageStatus::Sent, MessageStatus::Failed));
    EXPECT_FALSE(lc::can_transition(MessageStatus::Delivered, MessageStatus::Failed));
    EXPECT_FALSE(lc::can_transition(MessageStatus::Read, MessageStatus::Failed));
}

TEST(LifecycleTest, FailedLeavesOnlyThroughResend)
{
    EXPECT_FALSE(lc::can_transition(MessageStatus::Failed, MessageStatus::Pending));
    EXPECT_FALSE(lc::can_transition(MessageStatus::Failed, MessageStatus::Delivered));

    EXPECT_TRUE(lc::can_resend(MessageStatus::Failed));
    EXPECT_FALSE(lc::can_resend(MessageStatus::Pending));
    EXPECT_FALSE(lc::can_resend(MessageStatus::Read));
}

TEST(LifecycleTest, SameStateIsANoOp)
{
    for (auto s : {MessageStatus::Pending, MessageStatus::Sent, MessageStatus::Delivered,
                   MessageStatus::Read, MessageStatus::Failed})
    {
        EXPECT_TRUE(lc::can_transition(s, s));
    }
}

TEST(LifecycleTest, ReadIsTerminal)
{
    EXPECT_TRUE(lc::is_terminal(MessageStatus::Read));
    EXPECT_FALSE(lc::is_terminal(MessageStatus::Failed));
    EXPECT_EQ(lc::rank(MessageStatus::Failed), -1);
    EXPECT_LT(lc::rank(MessageStatus::Sent), lc::rank(MessageStatus::Delivered));
}

TEST(LifecycleTest, ServerStatusMerge)
{
    // unconfirmed rows take whatever the server says
    EXPECT_EQ(lc::merge_server_status(MessageStatus::Pending, MessageStatus::Sent), MessageStatus::Sent);
    EXPECT_EQ(lc::merge_server_status(MessageStatus::Failed, MessageStatus::Delivered), MessageStatus::Delivered);
    EXPECT_EQ(lc::merge_server_status(MessageStatus::Pending, MessageStatus::Failed), MessageStatus::Failed);

    // confirmed rows only move forward
    EXPECT_EQ(lc::merge_server_status(MessageStatus::Read, MessageStatus::Sent), MessageStatus::Read);
    EXPECT_EQ(lc::merge_server_status(MessageStatus::Sent, MessageStatus::Read), MessageStatus::Read);
    EXPECT_EQ(lc::merge_server_status(MessageStatus::Delivered, MessageStatus::Failed), MessageStatus::Delivered);
}
