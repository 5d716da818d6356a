#include <gtest/gtest.h>
#include <agenthub/agenthub.hpp>

using namespace agenthub;
using namespace std::chrono_literals;

static Message make_msg(const std::string& action, MessagePriority priority = MessagePriority::Medium) {
    return Message::create("sender", "receiver", MessageType::Request, action,
                           Value(Json::objectValue), priority);
}

// ===========================================================================
// Ordering
// ===========================================================================

TEST(MessageQueueTest, EmptyQueue) {
    MessageQueue q;
    EXPECT_TRUE(q.empty());
    EXPECT_EQ(q.size(), 0u);
    EXPECT_FALSE(q.pop_ready().has_value());
    EXPECT_FALSE(q.next_due().has_value());
}

TEST(MessageQueueTest, HigherPriorityFirst) {
    MessageQueue q;
    q.enqueue(make_msg("low", MessagePriority::Low));
    q.enqueue(make_msg("critical", MessagePriority::Critical));
    q.enqueue(make_msg("medium", MessagePriority::Medium));
    q.enqueue(make_msg("high", MessagePriority::High));

    EXPECT_EQ(q.pop_ready()->message.action, "critical");
    EXPECT_EQ(q.pop_ready()->message.action, "high");
    EXPECT_EQ(q.pop_ready()->message.action, "medium");
    EXPECT_EQ(q.pop_ready()->message.action, "low");
    EXPECT_TRUE(q.empty());
}

TEST(MessageQueueTest, FifoWithinTier) {
    MessageQueue q;
    q.enqueue(make_msg("first"));
    q.enqueue(make_msg("second"));
    q.enqueue(make_msg("third"));

    EXPECT_EQ(q.pop_ready()->message.action, "first");
    EXPECT_EQ(q.pop_ready()->message.action, "second");
    EXPECT_EQ(q.pop_ready()->message.action, "third");
}

// ===========================================================================
// Scheduled attempts
// ===========================================================================

TEST(MessageQueueTest, ScheduledMessageIsSkippedUntilDue) {
    MessageQueue q;
    auto now = Clock::now();
    q.enqueue(make_msg("later", MessagePriority::Critical), now + 2s, true);
    q.enqueue(make_msg("now", MessagePriority::Low), now);

    auto first = q.pop_ready(now);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->message.action, "now");

    EXPECT_FALSE(q.pop_ready(now + 1s).has_value());
    EXPECT_EQ(q.next_due().value(), now + 2s);

    auto later = q.pop_ready(now + 2s);
    ASSERT_TRUE(later.has_value());
    EXPECT_EQ(later->message.action, "later");
    EXPECT_TRUE(later->is_retry);
}

// ===========================================================================
// Capacity
// ===========================================================================

TEST(MessageQueueTest, FullQueueRejectsNewMessages) {
    MessageQueue q(2);
    q.enqueue(make_msg("a"));
    q.enqueue(make_msg("b"));
    EXPECT_TRUE(q.full());
    EXPECT_THROW(q.enqueue(make_msg("c")), QueueFullException);
    EXPECT_EQ(q.size(), 2u);
}

TEST(MessageQueueTest, RetriesBypassCapacity) {
    MessageQueue q(1);
    q.enqueue(make_msg("a"));
    EXPECT_NO_THROW(q.enqueue(make_msg("retry"), Clock::now(), true));
    EXPECT_EQ(q.size(), 2u);
}

// ===========================================================================
// Lookup and removal
// ===========================================================================

TEST(MessageQueueTest, RemoveById) {
    MessageQueue q;
    auto a = make_msg("a");
    auto b = make_msg("b");
    q.enqueue(a);
    q.enqueue(b);

    EXPECT_TRUE(q.contains(a.id));
    EXPECT_TRUE(q.remove(a.id));
    EXPECT_FALSE(q.contains(a.id));
    EXPECT_FALSE(q.remove(a.id));

    auto pending = q.get_all_pending();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].message.id, b.id);
}
