#pragma once

#include "agenthub/types.hpp"
#include <stdexcept>
#include <string>

namespace agenthub {

class AgentHubException : public std::runtime_error {
public:
    AgentHubException(ErrorKind kind, const std::string& what)
        : std::runtime_error(what)
        , kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Malformed or incomplete input; never queued, never retried.
class ValidationException : public AgentHubException {
public:
    explicit ValidationException(const std::string& what)
        : AgentHubException(ErrorKind::Validation, what) {}
};

// No capable or available agent for a request.
class RoutingException : public AgentHubException {
public:
    explicit RoutingException(const std::string& what)
        : AgentHubException(ErrorKind::Routing, what) {}
};

class DeliveryFailureException : public AgentHubException {
public:
    DeliveryFailureException(MessageId id, const std::string& what)
        : AgentHubException(ErrorKind::DeliveryFailure, what)
        , message_id_(std::move(id)) {}

    const MessageId& message_id() const noexcept { return message_id_; }

private:
    MessageId message_id_;
};

class DeadLetteredException : public AgentHubException {
public:
    explicit DeadLetteredException(MessageId id)
        : AgentHubException(ErrorKind::DeadLettered,
                            "Message dead-lettered after exhausting retries: " + id)
        , message_id_(std::move(id)) {}

    const MessageId& message_id() const noexcept { return message_id_; }

private:
    MessageId message_id_;
};

class LockContentionException : public AgentHubException {
public:
    explicit LockContentionException(std::string key)
        : AgentHubException(ErrorKind::LockContention, "Lock held by another owner: " + key)
        , key_(std::move(key)) {}

    const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

class TransactionAbortedException : public AgentHubException {
public:
    TransactionAbortedException(TransactionId id, const std::string& reason)
        : AgentHubException(ErrorKind::TransactionAborted,
                            "Transaction " + id + " aborted: " + reason)
        , transaction_id_(std::move(id)) {}

    const TransactionId& transaction_id() const noexcept { return transaction_id_; }

private:
    TransactionId transaction_id_;
};

class ConsistencyViolationException : public AgentHubException {
public:
    explicit ConsistencyViolationException(std::string key)
        : AgentHubException(ErrorKind::ConsistencyViolation, "Checksum mismatch for " + key)
        , key_(std::move(key)) {}

    const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

class AgentNotFoundException : public AgentHubException {
public:
    explicit AgentNotFoundException(const AgentId& id)
        : AgentHubException(ErrorKind::NotFound, "Agent not found: " + id)
        , agent_id_(id) {}

    const AgentId& agent_id() const noexcept { return agent_id_; }

private:
    AgentId agent_id_;
};

class AgentAlreadyRegisteredException : public AgentHubException {
public:
    explicit AgentAlreadyRegisteredException(const AgentId& id)
        : AgentHubException(ErrorKind::Conflict, "Agent already registered: " + id)
        , agent_id_(id) {}

    const AgentId& agent_id() const noexcept { return agent_id_; }

private:
    AgentId agent_id_;
};

class TransactionNotFoundException : public AgentHubException {
public:
    explicit TransactionNotFoundException(const TransactionId& id)
        : AgentHubException(ErrorKind::NotFound, "Transaction not found: " + id)
        , transaction_id_(id) {}

    const TransactionId& transaction_id() const noexcept { return transaction_id_; }

private:
    TransactionId transaction_id_;
};

class QueueFullException : public AgentHubException {
public:
    QueueFullException()
        : AgentHubException(ErrorKind::DeliveryFailure, "Message queue is full") {}
};

} // namespace agenthub
