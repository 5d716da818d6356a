#include <gtest/gtest.h>
#include <agenthub/agenthub.hpp>

using namespace agenthub;
using namespace std::chrono_literals;

// ===========================================================================
// Construction
// ===========================================================================

TEST(MessageTest, CreateAssignsIdAndTimestamp) {
    auto before = Clock::now();
    auto m = Message::create("a", "b", MessageType::Request, "do_work");

    EXPECT_FALSE(m.id.empty());
    EXPECT_GE(m.timestamp, before);
    EXPECT_EQ(m.priority, MessagePriority::Medium);
    EXPECT_EQ(m.retry_count, 0);
    EXPECT_EQ(m.max_retries, 3);
    EXPECT_TRUE(m.payload.isObject());

    auto other = Message::create("a", "b", MessageType::Request, "do_work");
    EXPECT_NE(m.id, other.id);
}

TEST(MessageTest, ReplyIsAddressedBackAndCorrelated) {
    auto m = Message::create("router", "worker", MessageType::Request, "process_request",
                             Value(Json::objectValue), MessagePriority::High);
    m.correlation_id = "session-1";

    Value payload(Json::objectValue);
    payload["status"] = "success";
    auto r = m.reply(payload);

    EXPECT_EQ(r.from, "worker");
    EXPECT_EQ(r.to, "router");
    EXPECT_EQ(r.type, MessageType::Response);
    EXPECT_EQ(r.in_reply_to.value(), m.id);
    EXPECT_EQ(r.correlation_id.value(), "session-1");
    EXPECT_EQ(r.priority, MessagePriority::High);
    EXPECT_NE(r.id, m.id);
}

TEST(MessageTest, ExpiryIsInclusive) {
    auto m = Message::create("a", "b", MessageType::Event, "tick");
    EXPECT_FALSE(m.is_expired(Clock::now()));

    auto deadline = Clock::now() + 1s;
    m.expires_at = deadline;
    EXPECT_FALSE(m.is_expired(deadline - 1ms));
    EXPECT_TRUE(m.is_expired(deadline));
}

// ===========================================================================
// Wire format
// ===========================================================================

TEST(MessageTest, WireFieldNames) {
    auto m = Message::create("a", "b", MessageType::Coordination, "workflow_step");
    m.correlation_id = "wf-1";
    auto json = m.to_json();

    EXPECT_EQ(json["from"].asString(), "a");
    EXPECT_EQ(json["to"].asString(), "b");
    EXPECT_EQ(json["type"].asString(), "coordination");
    EXPECT_EQ(json["priority"].asString(), "medium");
    EXPECT_EQ(json["correlation_id"].asString(), "wf-1");
    EXPECT_FALSE(json.isMember("in_reply_to"));
    EXPECT_FALSE(json.isMember("expires_at"));
    EXPECT_EQ(json["retry_count"].asInt(), 0);
}

TEST(MessageTest, WireRoundTripPreservesFields) {
    Value payload(Json::objectValue);
    payload["n"] = 42;
    auto m = Message::create("a", "b", MessageType::Escalation, "conflict_escalation",
                             payload, MessagePriority::Critical);
    m.in_reply_to = "parent";
    m.expires_at = Clock::now() + 1h;
    m.retry_count = 2;

    auto back = Message::from_wire(m.to_wire());
    EXPECT_EQ(back.id, m.id);
    EXPECT_EQ(back.type, MessageType::Escalation);
    EXPECT_EQ(back.priority, MessagePriority::Critical);
    EXPECT_EQ(back.payload["n"].asInt(), 42);
    EXPECT_EQ(back.in_reply_to.value(), "parent");
    EXPECT_TRUE(back.expires_at.has_value());
    EXPECT_EQ(back.retry_count, 2);
    EXPECT_EQ(back.to_wire(), m.to_wire());
}

TEST(MessageTest, MalformedInputIsRejected) {
    auto m = Message::create("a", "b", MessageType::Request, "x");

    auto missing = m.to_json();
    missing.removeMember("action");
    EXPECT_THROW(Message::from_json(missing), ValidationException);

    auto bad_type = m.to_json();
    bad_type["type"] = "shout";
    EXPECT_THROW(Message::from_json(bad_type), ValidationException);

    auto bad_priority = m.to_json();
    bad_priority["priority"] = "urgent";
    EXPECT_THROW(Message::from_json(bad_priority), ValidationException);

    auto over_retried = m.to_json();
    over_retried["retry_count"] = 5;
    EXPECT_THROW(Message::from_json(over_retried), ValidationException);

    EXPECT_THROW(Message::from_json(Value("text")), ValidationException);
}

// ===========================================================================
// FunctionHandler
// ===========================================================================

TEST(MessageTest, FunctionHandlerForwardsToCallable) {
    auto handler = make_handler([](const Message& m) -> std::optional<Message> {
        Value payload(Json::objectValue);
        payload["echo"] = m.action;
        return m.reply(payload);
    });

    auto m = Message::create("a", "b", MessageType::Request, "ping");
    auto reply = handler->handle(m);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->payload["echo"].asString(), "ping");
}
