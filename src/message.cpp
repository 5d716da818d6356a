#include "agenthub/message.hpp"
#include "agenthub/exceptions.hpp"
#include "agenthub/util.hpp"

namespace agenthub {

Message Message::create(AgentId from, AgentId to, MessageType type, std::string action,
                        Value payload, MessagePriority priority) {
    Message m;
    m.id = generate_id();
    m.from = std::move(from);
    m.to = std::move(to);
    m.type = type;
    m.action = std::move(action);
    m.payload = std::move(payload);
    m.priority = priority;
    m.timestamp = Clock::now();
    return m;
}

Message Message::reply(Value payload) const {
    Message r = create(to, from, MessageType::Response, action, std::move(payload), priority);
    r.in_reply_to = id;
    r.correlation_id = correlation_id;
    return r;
}

bool Message::is_expired(Timestamp now) const {
    return expires_at.has_value() && now >= expires_at.value();
}

Value Message::to_json() const {
    Value json(Json::objectValue);
    json["id"] = id;
    json["from"] = from;
    json["to"] = to;
    json["type"] = to_string(type);
    json["action"] = action;
    json["payload"] = payload;
    json["priority"] = to_string(priority);
    json["timestamp"] = format_timestamp(timestamp);
    if (correlation_id.has_value()) {
        json["correlation_id"] = correlation_id.value();
    }
    if (in_reply_to.has_value()) {
        json["in_reply_to"] = in_reply_to.value();
    }
    if (expires_at.has_value()) {
        json["expires_at"] = format_timestamp(expires_at.value());
    }
    json["retry_count"] = retry_count;
    json["max_retries"] = max_retries;
    return json;
}

std::string Message::to_wire() const {
    return to_json_string(to_json());
}

Message Message::from_json(const Value& json) {
    if (!json.isObject()) {
        throw ValidationException("Message must be a JSON object");
    }
    for (const char* field : {"id", "from", "to", "type", "action", "priority", "timestamp"}) {
        if (!json[field].isString()) {
            throw ValidationException(std::string("Message field missing or not a string: ") + field);
        }
    }

    auto type = parse_message_type(json["type"].asString());
    if (!type.has_value()) {
        throw ValidationException("Unknown message type: " + json["type"].asString());
    }
    auto priority = parse_message_priority(json["priority"].asString());
    if (!priority.has_value()) {
        throw ValidationException("Unknown message priority: " + json["priority"].asString());
    }
    auto timestamp = parse_timestamp(json["timestamp"].asString());
    if (!timestamp.has_value()) {
        throw ValidationException("Malformed message timestamp: " + json["timestamp"].asString());
    }

    Message m;
    m.id = json["id"].asString();
    m.from = json["from"].asString();
    m.to = json["to"].asString();
    m.type = type.value();
    m.action = json["action"].asString();
    m.payload = json.isMember("payload") ? json["payload"] : Value(Json::objectValue);
    m.priority = priority.value();
    m.timestamp = timestamp.value();

    if (json.isMember("correlation_id") && !json["correlation_id"].isNull()) {
        m.correlation_id = json["correlation_id"].asString();
    }
    if (json.isMember("in_reply_to") && !json["in_reply_to"].isNull()) {
        m.in_reply_to = json["in_reply_to"].asString();
    }
    if (json.isMember("expires_at") && !json["expires_at"].isNull()) {
        auto expires = parse_timestamp(json["expires_at"].asString());
        if (!expires.has_value()) {
            throw ValidationException("Malformed expires_at: " + json["expires_at"].asString());
        }
        m.expires_at = expires;
    }

    m.retry_count = json.get("retry_count", 0).asInt();
    m.max_retries = json.get("max_retries", 3).asInt();
    if (m.retry_count < 0 || m.max_retries < 0 || m.retry_count > m.max_retries) {
        throw ValidationException("retry_count must be within [0, max_retries]");
    }
    return m;
}

Message Message::from_wire(const std::string& text) {
    return from_json(parse_json(text));
}

} // namespace agenthub
