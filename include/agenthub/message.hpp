#pragma once

#include "agenthub/types.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace agenthub {

// Wire schema:
// {id, from, to, type, action, payload, priority, timestamp,
//  correlation_id?, in_reply_to?, expires_at?, retry_count, max_retries}
struct Message {
    MessageId id;
    AgentId from;
    AgentId to;
    MessageType type{MessageType::Request};
    std::string action;
    Value payload{Json::objectValue};
    MessagePriority priority{MessagePriority::Medium};
    Timestamp timestamp{};
    std::optional<std::string> correlation_id;
    std::optional<MessageId> in_reply_to;
    std::optional<Timestamp> expires_at;
    int retry_count{0};
    int max_retries{3};

    // Fresh id and timestamp
    static Message create(AgentId from, AgentId to, MessageType type, std::string action,
                          Value payload = Value(Json::objectValue),
                          MessagePriority priority = MessagePriority::Medium);

    // Response addressed back to the sender, correlated with this message
    Message reply(Value payload) const;

    bool is_expired(Timestamp now) const;

    Value to_json() const;
    std::string to_wire() const;

    // Throw ValidationException on malformed input
    static Message from_json(const Value& json);
    static Message from_wire(const std::string& text);
};

// The single entrypoint an agent exposes to the bus. Signal failure by
// throwing; the bus treats it as a delivery failure subject to retry, so
// implementations must tolerate seeing the same message id more than once.
class MessageHandler {
public:
    virtual ~MessageHandler() = default;
    virtual std::optional<Message> handle(const Message& message) = 0;
};

// Adapts a callable to MessageHandler
class FunctionHandler : public MessageHandler {
public:
    using Function = std::function<std::optional<Message>(const Message&)>;

    explicit FunctionHandler(Function fn) : fn_(std::move(fn)) {}

    std::optional<Message> handle(const Message& message) override { return fn_(message); }

private:
    Function fn_;
};

inline std::shared_ptr<MessageHandler> make_handler(FunctionHandler::Function fn) {
    return std::make_shared<FunctionHandler>(std::move(fn));
}

} // namespace agenthub
