#include "bind_forward.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

#include <agenthub/agenthub.hpp>

using namespace agenthub;

// ---------------------------------------------------------------------------
// Module entry point
// ---------------------------------------------------------------------------
PYBIND11_MODULE(_agenthub, m) {
    m.doc() = "AgentHub: Coordination substrate for fleets of specialized agents";

    bind_enums_and_structs(m);
    bind_exceptions(m);
    bind_policies(m);
    bind_monitors(m);
    bind_subsystems(m);
    bind_core(m);
}

// ---------------------------------------------------------------------------
// Enums & structs
// ---------------------------------------------------------------------------
void bind_enums_and_structs(py::module_& m) {

    // ---- Enums ------------------------------------------------------------

    py::enum_<MessageType>(m, "MessageType")
        .value("Request",      MessageType::Request)
        .value("Response",     MessageType::Response)
        .value("Event",        MessageType::Event)
        .value("Coordination", MessageType::Coordination)
        .value("Escalation",   MessageType::Escalation)
        .export_values();

    py::enum_<MessagePriority>(m, "MessagePriority")
        .value("Low",      MessagePriority::Low)
        .value("Medium",   MessagePriority::Medium)
        .value("High",     MessagePriority::High)
        .value("Critical", MessagePriority::Critical)
        .export_values();

    py::enum_<AgentStatus>(m, "AgentStatus")
        .value("Idle",        AgentStatus::Idle)
        .value("Busy",        AgentStatus::Busy)
        .value("Error",       AgentStatus::Error)
        .value("Maintenance", AgentStatus::Maintenance)
        .export_values();

    py::enum_<AgentRole>(m, "AgentRole")
        .value("Security",         AgentRole::Security)
        .value("Orchestrator",     AgentRole::Orchestrator)
        .value("Compliance",       AgentRole::Compliance)
        .value("QualityAssurance", AgentRole::QualityAssurance)
        .value("Design",           AgentRole::Design)
        .value("Implementation",   AgentRole::Implementation)
        .value("Information",      AgentRole::Information)
        .value("NoRole",           AgentRole::None);

    py::enum_<StateScope>(m, "StateScope")
        .value("Global",    StateScope::Global)
        .value("Workflow",  StateScope::Workflow)
        .value("Agent",     StateScope::Agent)
        .value("User",      StateScope::User)
        .value("Temporary", StateScope::Temporary);

    py::enum_<StateType>(m, "StateType")
        .value("Configuration",      StateType::Configuration)
        .value("WorkflowState",      StateType::WorkflowState)
        .value("AgentState",         StateType::AgentState)
        .value("UserPreferences",    StateType::UserPreferences)
        .value("DecisionHistory",    StateType::DecisionHistory)
        .value("RiskAssessment",     StateType::RiskAssessment)
        .value("PerformanceMetrics", StateType::PerformanceMetrics);

    py::enum_<ConsistencyLevel>(m, "ConsistencyLevel")
        .value("Strong",   ConsistencyLevel::Strong)
        .value("Eventual", ConsistencyLevel::Eventual)
        .value("Weak",     ConsistencyLevel::Weak);

    py::enum_<LockType>(m, "LockType")
        .value("Exclusive", LockType::Exclusive)
        .value("Shared",    LockType::Shared)
        .value("Intent",    LockType::Intent);

    py::enum_<ConflictStrategy>(m, "ConflictStrategy")
        .value("LastWriterWins",    ConflictStrategy::LastWriterWins)
        .value("VersionVector",     ConflictStrategy::VersionVector)
        .value("AgentPriority",     ConflictStrategy::AgentPriority)
        .value("Merge",             ConflictStrategy::Merge)
        .value("HumanIntervention", ConflictStrategy::HumanIntervention);

    py::enum_<TransactionStatus>(m, "TransactionStatus")
        .value("Pending",   TransactionStatus::Pending)
        .value("Committed", TransactionStatus::Committed)
        .value("Aborted",   TransactionStatus::Aborted);

    py::enum_<OperationType>(m, "OperationType")
        .value("Set",    OperationType::Set)
        .value("Delete", OperationType::Delete)
        .value("Put",    OperationType::Put);

    py::enum_<WorkflowPattern>(m, "WorkflowPattern")
        .value("Sequential", WorkflowPattern::Sequential)
        .value("Parallel",   WorkflowPattern::Parallel)
        .value("Iterative",  WorkflowPattern::Iterative)
        .value("Escalation", WorkflowPattern::Escalation);

    py::enum_<WorkflowStatus>(m, "WorkflowStatus")
        .value("Active",    WorkflowStatus::Active)
        .value("Completed", WorkflowStatus::Completed)
        .value("Failed",    WorkflowStatus::Failed)
        .value("Escalated", WorkflowStatus::Escalated)
        .value("Cancelled", WorkflowStatus::Cancelled);

    py::enum_<SessionStatus>(m, "SessionStatus")
        .value("Active",    SessionStatus::Active)
        .value("Completed", SessionStatus::Completed)
        .value("Expired",   SessionStatus::Expired);

    py::enum_<SendStatus>(m, "SendStatus")
        .value("Delivered", SendStatus::Delivered)
        .value("Queued",    SendStatus::Queued)
        .value("Rejected",  SendStatus::Rejected);

    py::enum_<LockStatus>(m, "LockStatus")
        .value("Granted", LockStatus::Granted)
        .value("Denied",  LockStatus::Denied);

    py::enum_<WriteStatus>(m, "WriteStatus")
        .value("Applied",   WriteStatus::Applied)
        .value("Rejected",  WriteStatus::Rejected)
        .value("Contended", WriteStatus::Contended);

    py::enum_<DeleteStatus>(m, "DeleteStatus")
        .value("Deleted",   DeleteStatus::Deleted)
        .value("NotFound",  DeleteStatus::NotFound)
        .value("Contended", DeleteStatus::Contended);

    py::enum_<EventType>(m, "EventType")
        .value("AgentRegistered",       EventType::AgentRegistered)
        .value("AgentDeregistered",     EventType::AgentDeregistered)
        .value("AgentStatusChanged",    EventType::AgentStatusChanged)
        .value("AgentUnresponsive",     EventType::AgentUnresponsive)
        .value("RequestRouted",         EventType::RequestRouted)
        .value("RoutingFailed",         EventType::RoutingFailed)
        .value("CoordinationStarted",   EventType::CoordinationStarted)
        .value("CoordinationCompleted", EventType::CoordinationCompleted)
        .value("SessionExpired",        EventType::SessionExpired)
        .value("ConflictResolved",      EventType::ConflictResolved)
        .value("EscalatedToHuman",      EventType::EscalatedToHuman)
        .value("MessageSent",           EventType::MessageSent)
        .value("MessageRejected",       EventType::MessageRejected)
        .value("MessageDelivered",      EventType::MessageDelivered)
        .value("MessageFailed",         EventType::MessageFailed)
        .value("MessageRetryScheduled", EventType::MessageRetryScheduled)
        .value("MessageDeadLettered",   EventType::MessageDeadLettered)
        .value("DeadLetterReplayed",    EventType::DeadLetterReplayed)
        .value("BroadcastSent",         EventType::BroadcastSent)
        .value("QueueSizeChanged",      EventType::QueueSizeChanged)
        .value("WorkflowStarted",       EventType::WorkflowStarted)
        .value("WorkflowAdvanced",      EventType::WorkflowAdvanced)
        .value("WorkflowCompleted",     EventType::WorkflowCompleted)
        .value("WorkflowFailed",        EventType::WorkflowFailed)
        .value("WorkflowEscalated",     EventType::WorkflowEscalated)
        .value("WorkflowCancelled",     EventType::WorkflowCancelled)
        .value("WorkflowStuck",         EventType::WorkflowStuck)
        .value("WorkflowExpired",       EventType::WorkflowExpired)
        .value("LockAcquired",          EventType::LockAcquired)
        .value("LockDenied",            EventType::LockDenied)
        .value("LockReleased",          EventType::LockReleased)
        .value("LockRenewed",           EventType::LockRenewed)
        .value("LockExpired",           EventType::LockExpired)
        .value("TransactionBegun",      EventType::TransactionBegun)
        .value("TransactionCommitted",  EventType::TransactionCommitted)
        .value("TransactionAborted",    EventType::TransactionAborted)
        .value("StateUpdated",          EventType::StateUpdated)
        .value("StateWriteRejected",    EventType::StateWriteRejected)
        .value("StateDeleted",          EventType::StateDeleted)
        .value("CacheInvalidated",      EventType::CacheInvalidated)
        .value("ConsistencyViolation",  EventType::ConsistencyViolation)
        .value("ConsistencyRepaired",   EventType::ConsistencyRepaired)
        .value("CheckpointCreated",     EventType::CheckpointCreated)
        .value("CheckpointRestored",    EventType::CheckpointRestored)
        .value("BackgroundTaskFailed",  EventType::BackgroundTaskFailed);

    // ---- Configuration ----------------------------------------------------

    py::class_<BusConfig>(m, "BusConfig")
        .def(py::init<>())
        .def_readwrite("max_queue_size",            &BusConfig::max_queue_size)
        .def_readwrite("poll_interval",             &BusConfig::poll_interval)
        .def_readwrite("retry_backoff_base",        &BusConfig::retry_backoff_base)
        .def_readwrite("max_retry_delay",           &BusConfig::max_retry_delay)
        .def_readwrite("default_max_retries",       &BusConfig::default_max_retries)
        .def_readwrite("handler_timeout",           &BusConfig::handler_timeout)
        .def_readwrite("audit_retention",           &BusConfig::audit_retention)
        .def_readwrite("workflow_ttl",              &BusConfig::workflow_ttl)
        .def_readwrite("stuck_workflow_threshold",  &BusConfig::stuck_workflow_threshold)
        .def_readwrite("health_check_interval",     &BusConfig::health_check_interval)
        .def_readwrite("workflow_step_max_retries", &BusConfig::workflow_step_max_retries)
        .def_readwrite("default_max_iterations",    &BusConfig::default_max_iterations)
        .def_readwrite("orchestrator_agent",        &BusConfig::orchestrator_agent);

    py::class_<LockConfig>(m, "LockConfig")
        .def(py::init<>())
        .def_readwrite("default_lease",    &LockConfig::default_lease)
        .def_readwrite("sweep_interval",   &LockConfig::sweep_interval)
        .def_readwrite("max_cas_attempts", &LockConfig::max_cas_attempts);

    py::class_<TransactionConfig>(m, "TransactionConfig")
        .def(py::init<>())
        .def_readwrite("default_timeout",    &TransactionConfig::default_timeout)
        .def_readwrite("sweep_interval",     &TransactionConfig::sweep_interval)
        .def_readwrite("finished_retention", &TransactionConfig::finished_retention)
        .def_readwrite("record_retention",   &TransactionConfig::record_retention);

    py::class_<StateConfig>(m, "StateConfig")
        .def(py::init<>())
        .def_readwrite("default_strategy",           &StateConfig::default_strategy)
        .def_readwrite("default_consistency",        &StateConfig::default_consistency)
        .def_readwrite("write_lock_lease",           &StateConfig::write_lock_lease)
        .def_readwrite("consistency_check_interval", &StateConfig::consistency_check_interval)
        .def_readwrite("sync_interval",              &StateConfig::sync_interval)
        .def_readwrite("restore_timeout",            &StateConfig::restore_timeout);

    py::class_<CapabilityRule>(m, "CapabilityRule")
        .def(py::init<>())
        .def_readwrite("capability", &CapabilityRule::capability)
        .def_readwrite("keywords",   &CapabilityRule::keywords);

    py::class_<RouterConfig>(m, "RouterConfig")
        .def(py::init<>())
        .def_readwrite("capability_rules",      &RouterConfig::capability_rules)
        .def_readwrite("default_capability",    &RouterConfig::default_capability)
        .def_readwrite("load_threshold",        &RouterConfig::load_threshold)
        .def_readwrite("consensus_threshold",   &RouterConfig::consensus_threshold)
        .def_readwrite("coordination_timeout",  &RouterConfig::coordination_timeout)
        .def_readwrite("session_ttl",           &RouterConfig::session_ttl)
        .def_readwrite("heartbeat_timeout",     &RouterConfig::heartbeat_timeout)
        .def_readwrite("health_check_interval", &RouterConfig::health_check_interval)
        .def_readwrite("dispatch_max_retries",  &RouterConfig::dispatch_max_retries)
        .def_readwrite("audit_retention",       &RouterConfig::audit_retention);

    // Config (top-level, embeds the per-component configs)
    py::class_<Config>(m, "Config")
        .def(py::init<>())
        .def_readwrite("bus",               &Config::bus)
        .def_readwrite("locks",             &Config::locks)
        .def_readwrite("transactions",      &Config::transactions)
        .def_readwrite("state",             &Config::state)
        .def_readwrite("router",            &Config::router)
        .def_readwrite("snapshot_interval", &Config::snapshot_interval);

    m.attr("HUMAN_OVERSIGHT") = HUMAN_OVERSIGHT;
}

// ---------------------------------------------------------------------------
// Exceptions
// ---------------------------------------------------------------------------
void bind_exceptions(py::module_& m) {
    // Base exception -> RuntimeError
    static auto py_AgentHubError =
        py::register_exception<AgentHubException>(m, "AgentHubError", PyExc_RuntimeError);

    // Derived from AgentHubError
    static auto py_ValidationError =
        py::register_exception<ValidationException>(m, "ValidationError", py_AgentHubError.ptr());
    static auto py_RoutingError =
        py::register_exception<RoutingException>(m, "RoutingError", py_AgentHubError.ptr());
    static auto py_DeliveryFailureError =
        py::register_exception<DeliveryFailureException>(m, "DeliveryFailureError", py_AgentHubError.ptr());
    static auto py_DeadLetteredError =
        py::register_exception<DeadLetteredException>(m, "DeadLetteredError", py_AgentHubError.ptr());
    static auto py_LockContentionError =
        py::register_exception<LockContentionException>(m, "LockContentionError", py_AgentHubError.ptr());
    static auto py_TransactionAbortedError =
        py::register_exception<TransactionAbortedException>(m, "TransactionAbortedError", py_AgentHubError.ptr());
    static auto py_ConsistencyViolationError =
        py::register_exception<ConsistencyViolationException>(m, "ConsistencyViolationError", py_AgentHubError.ptr());
    static auto py_AgentNotFoundError =
        py::register_exception<AgentNotFoundException>(m, "AgentNotFoundError", py_AgentHubError.ptr());
    static auto py_AgentAlreadyRegisteredError =
        py::register_exception<AgentAlreadyRegisteredException>(m, "AgentAlreadyRegisteredError", py_AgentHubError.ptr());
    static auto py_TransactionNotFoundError =
        py::register_exception<TransactionNotFoundException>(m, "TransactionNotFoundError", py_AgentHubError.ptr());
    static auto py_QueueFullError =
        py::register_exception<QueueFullException>(m, "QueueFullError", py_AgentHubError.ptr());
}
