#pragma once

#include <json/json.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agenthub {

// Unique identifiers
using AgentId = std::string;
using MessageId = std::string;
using TransactionId = std::string;
using WorkflowId = std::string;
using SessionId = std::string;

// Time types (wall clock: timestamps travel on the wire and into the store)
using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;
using Duration = Clock::duration;

// Payloads and state values
using Value = Json::Value;

// Pseudo-agent that receives everything nobody else can decide
inline const AgentId HUMAN_OVERSIGHT = "human_oversight";

enum class MessageType {
    Request,
    Response,
    Event,
    Coordination,
    Escalation
};

enum class MessagePriority {
    Low,
    Medium,
    High,
    Critical
};

enum class AgentStatus {
    Idle,
    Busy,
    Error,
    Maintenance
};

// Coordination hierarchy, strongest first
enum class AgentRole {
    Security,
    Orchestrator,
    Compliance,
    QualityAssurance,
    Design,
    Implementation,
    Information,
    None
};

enum class StateScope {
    Global,
    Workflow,
    Agent,
    User,
    Temporary
};

enum class StateType {
    Configuration,
    WorkflowState,
    AgentState,
    UserPreferences,
    DecisionHistory,
    RiskAssessment,
    PerformanceMetrics
};

enum class ConsistencyLevel {
    Strong,
    Eventual,
    Weak
};

enum class LockType {
    Exclusive,
    Shared,
    Intent
};

enum class ConflictStrategy {
    LastWriterWins,
    VersionVector,
    AgentPriority,
    Merge,
    HumanIntervention
};

enum class TransactionStatus {
    Pending,
    Committed,
    Aborted
};

enum class OperationType {
    Set,
    Delete,
    Put      // verbatim entry insert (checkpoint restore)
};

enum class WorkflowPattern {
    Sequential,
    Parallel,
    Iterative,
    Escalation
};

enum class WorkflowStatus {
    Active,
    Completed,
    Failed,
    Escalated,
    Cancelled
};

enum class SessionStatus {
    Active,
    Completed,
    Expired
};

// Outcome enums for expected, branchable results
enum class SendStatus {
    Delivered,
    Queued,
    Rejected
};

enum class LockStatus {
    Granted,
    Denied
};

enum class WriteStatus {
    Applied,
    Rejected,
    Contended
};

enum class DeleteStatus {
    Deleted,
    NotFound,
    Contended
};

enum class ErrorKind {
    Validation,
    Routing,
    DeliveryFailure,
    DeadLettered,
    LockContention,
    TransactionAborted,
    ConsistencyViolation,
    NotFound,
    Conflict
};

// Point-in-time view of the hub, handed to monitors periodically
struct AgentLoadSnapshot {
    AgentId agent_id;
    AgentStatus status{AgentStatus::Idle};
    double load{0.0};
    std::size_t active_tasks{0};
};

struct SystemSnapshot {
    Timestamp timestamp{};
    std::vector<AgentLoadSnapshot> agents;
    std::size_t queued_messages{0};
    std::size_t dead_letters{0};
    std::size_t active_workflows{0};
    std::size_t pending_transactions{0};
    std::size_t active_sessions{0};
    std::size_t cached_entries{0};
};

inline const char* to_string(MessageType t) {
    switch (t) {
        case MessageType::Request:      return "request";
        case MessageType::Response:     return "response";
        case MessageType::Event:        return "event";
        case MessageType::Coordination: return "coordination";
        case MessageType::Escalation:   return "escalation";
    }
    return "unknown";
}

inline const char* to_string(MessagePriority p) {
    switch (p) {
        case MessagePriority::Low:      return "low";
        case MessagePriority::Medium:   return "medium";
        case MessagePriority::High:     return "high";
        case MessagePriority::Critical: return "critical";
    }
    return "unknown";
}

inline const char* to_string(AgentStatus s) {
    switch (s) {
        case AgentStatus::Idle:        return "idle";
        case AgentStatus::Busy:        return "busy";
        case AgentStatus::Error:       return "error";
        case AgentStatus::Maintenance: return "maintenance";
    }
    return "unknown";
}

inline const char* to_string(AgentRole r) {
    switch (r) {
        case AgentRole::Security:         return "security";
        case AgentRole::Orchestrator:     return "orchestrator";
        case AgentRole::Compliance:       return "compliance";
        case AgentRole::QualityAssurance: return "quality_assurance";
        case AgentRole::Design:           return "design";
        case AgentRole::Implementation:   return "implementation";
        case AgentRole::Information:      return "information";
        case AgentRole::None:             return "none";
    }
    return "unknown";
}

inline const char* to_string(StateScope s) {
    switch (s) {
        case StateScope::Global:    return "global";
        case StateScope::Workflow:  return "workflow";
        case StateScope::Agent:     return "agent";
        case StateScope::User:      return "user";
        case StateScope::Temporary: return "temporary";
    }
    return "unknown";
}

inline const char* to_string(StateType t) {
    switch (t) {
        case StateType::Configuration:      return "configuration";
        case StateType::WorkflowState:      return "workflow_state";
        case StateType::AgentState:         return "agent_state";
        case StateType::UserPreferences:    return "user_preferences";
        case StateType::DecisionHistory:    return "decision_history";
        case StateType::RiskAssessment:     return "risk_assessment";
        case StateType::PerformanceMetrics: return "performance_metrics";
    }
    return "unknown";
}

inline const char* to_string(ConsistencyLevel c) {
    switch (c) {
        case ConsistencyLevel::Strong:   return "strong";
        case ConsistencyLevel::Eventual: return "eventual";
        case ConsistencyLevel::Weak:     return "weak";
    }
    return "unknown";
}

inline const char* to_string(LockType t) {
    switch (t) {
        case LockType::Exclusive: return "exclusive";
        case LockType::Shared:    return "shared";
        case LockType::Intent:    return "intent";
    }
    return "unknown";
}

inline const char* to_string(ConflictStrategy s) {
    switch (s) {
        case ConflictStrategy::LastWriterWins:    return "last_writer_wins";
        case ConflictStrategy::VersionVector:     return "version_vector";
        case ConflictStrategy::AgentPriority:     return "agent_priority";
        case ConflictStrategy::Merge:             return "merge_strategy";
        case ConflictStrategy::HumanIntervention: return "human_intervention";
    }
    return "unknown";
}

inline const char* to_string(TransactionStatus s) {
    switch (s) {
        case TransactionStatus::Pending:   return "pending";
        case TransactionStatus::Committed: return "committed";
        case TransactionStatus::Aborted:   return "aborted";
    }
    return "unknown";
}

inline const char* to_string(OperationType t) {
    switch (t) {
        case OperationType::Set:    return "set";
        case OperationType::Delete: return "delete";
        case OperationType::Put:    return "put";
    }
    return "unknown";
}

inline const char* to_string(WorkflowPattern p) {
    switch (p) {
        case WorkflowPattern::Sequential: return "sequential";
        case WorkflowPattern::Parallel:   return "parallel";
        case WorkflowPattern::Iterative:  return "iterative";
        case WorkflowPattern::Escalation: return "escalation";
    }
    return "unknown";
}

inline const char* to_string(WorkflowStatus s) {
    switch (s) {
        case WorkflowStatus::Active:    return "active";
        case WorkflowStatus::Completed: return "completed";
        case WorkflowStatus::Failed:    return "failed";
        case WorkflowStatus::Escalated: return "escalated";
        case WorkflowStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

inline const char* to_string(SessionStatus s) {
    switch (s) {
        case SessionStatus::Active:    return "active";
        case SessionStatus::Completed: return "completed";
        case SessionStatus::Expired:   return "expired";
    }
    return "unknown";
}

inline const char* to_string(SendStatus s) {
    switch (s) {
        case SendStatus::Delivered: return "Delivered";
        case SendStatus::Queued:    return "Queued";
        case SendStatus::Rejected:  return "Rejected";
    }
    return "Unknown";
}

inline const char* to_string(LockStatus s) {
    switch (s) {
        case LockStatus::Granted: return "Granted";
        case LockStatus::Denied:  return "Denied";
    }
    return "Unknown";
}

inline const char* to_string(WriteStatus s) {
    switch (s) {
        case WriteStatus::Applied:   return "Applied";
        case WriteStatus::Rejected:  return "Rejected";
        case WriteStatus::Contended: return "Contended";
    }
    return "Unknown";
}

inline const char* to_string(DeleteStatus s) {
    switch (s) {
        case DeleteStatus::Deleted:   return "Deleted";
        case DeleteStatus::NotFound:  return "NotFound";
        case DeleteStatus::Contended: return "Contended";
    }
    return "Unknown";
}

inline const char* to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::Validation:           return "ValidationError";
        case ErrorKind::Routing:              return "RoutingError";
        case ErrorKind::DeliveryFailure:      return "DeliveryFailure";
        case ErrorKind::DeadLettered:         return "DeadLettered";
        case ErrorKind::LockContention:       return "LockContention";
        case ErrorKind::TransactionAborted:   return "TransactionAborted";
        case ErrorKind::ConsistencyViolation: return "ConsistencyViolation";
        case ErrorKind::NotFound:             return "NotFound";
        case ErrorKind::Conflict:             return "Conflict";
    }
    return "Unknown";
}

// Wire-format parsing (inverse of to_string for the enums that are serialized)
std::optional<MessageType> parse_message_type(const std::string& s);
std::optional<MessagePriority> parse_message_priority(const std::string& s);
std::optional<StateScope> parse_state_scope(const std::string& s);
std::optional<StateType> parse_state_type(const std::string& s);
std::optional<ConsistencyLevel> parse_consistency_level(const std::string& s);
std::optional<LockType> parse_lock_type(const std::string& s);
std::optional<TransactionStatus> parse_transaction_status(const std::string& s);
std::optional<OperationType> parse_operation_type(const std::string& s);

} // namespace agenthub
