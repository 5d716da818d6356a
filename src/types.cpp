#include "agenthub/types.hpp"
#include "agenthub/config.hpp"

namespace agenthub {

namespace {

template <typename Enum, std::size_t N>
std::optional<Enum> parse_enum(const std::string& s, const Enum (&values)[N]) {
    for (Enum v : values) {
        if (s == to_string(v)) {
            return v;
        }
    }
    return std::nullopt;
}

} // anonymous namespace

std::optional<MessageType> parse_message_type(const std::string& s) {
    static const MessageType all[] = {
        MessageType::Request, MessageType::Response, MessageType::Event,
        MessageType::Coordination, MessageType::Escalation};
    return parse_enum(s, all);
}

std::optional<MessagePriority> parse_message_priority(const std::string& s) {
    static const MessagePriority all[] = {
        MessagePriority::Low, MessagePriority::Medium,
        MessagePriority::High, MessagePriority::Critical};
    return parse_enum(s, all);
}

std::optional<StateScope> parse_state_scope(const std::string& s) {
    static const StateScope all[] = {
        StateScope::Global, StateScope::Workflow, StateScope::Agent,
        StateScope::User, StateScope::Temporary};
    return parse_enum(s, all);
}

std::optional<StateType> parse_state_type(const std::string& s) {
    static const StateType all[] = {
        StateType::Configuration, StateType::WorkflowState, StateType::AgentState,
        StateType::UserPreferences, StateType::DecisionHistory,
        StateType::RiskAssessment, StateType::PerformanceMetrics};
    return parse_enum(s, all);
}

std::optional<ConsistencyLevel> parse_consistency_level(const std::string& s) {
    static const ConsistencyLevel all[] = {
        ConsistencyLevel::Strong, ConsistencyLevel::Eventual, ConsistencyLevel::Weak};
    return parse_enum(s, all);
}

std::optional<LockType> parse_lock_type(const std::string& s) {
    static const LockType all[] = {LockType::Exclusive, LockType::Shared, LockType::Intent};
    return parse_enum(s, all);
}

std::optional<TransactionStatus> parse_transaction_status(const std::string& s) {
    static const TransactionStatus all[] = {
        TransactionStatus::Pending, TransactionStatus::Committed, TransactionStatus::Aborted};
    return parse_enum(s, all);
}

std::optional<OperationType> parse_operation_type(const std::string& s) {
    static const OperationType all[] = {
        OperationType::Set, OperationType::Delete, OperationType::Put};
    return parse_enum(s, all);
}

std::vector<CapabilityRule> default_capability_rules() {
    return {
        {"financial",    {"defi", "swap", "yield", "liquidity", "trade"}},
        {"wallet",       {"wallet", "transaction", "send", "receive"}},
        {"analysis",     {"predict", "forecast", "market", "trend"}},
        {"security",     {"security", "risk", "safe", "audit"}},
        {"productivity", {"email", "calendar", "task", "schedule"}},
        {"impact",       {"climate", "social", "impact", "problem"}},
    };
}

} // namespace agenthub
