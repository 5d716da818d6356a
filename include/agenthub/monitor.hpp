#pragma once

#include "agenthub/types.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agenthub {

enum class EventType {
    AgentRegistered,
    AgentDeregistered,
    AgentStatusChanged,
    AgentUnresponsive,
    // Routing and coordination
    RequestRouted,
    RoutingFailed,
    CoordinationStarted,
    CoordinationCompleted,
    SessionExpired,
    ConflictResolved,
    EscalatedToHuman,
    // Message delivery
    MessageSent,
    MessageRejected,
    MessageDelivered,
    MessageFailed,
    MessageRetryScheduled,
    MessageDeadLettered,
    DeadLetterReplayed,
    BroadcastSent,
    QueueSizeChanged,
    // Workflows
    WorkflowStarted,
    WorkflowAdvanced,
    WorkflowCompleted,
    WorkflowFailed,
    WorkflowEscalated,
    WorkflowCancelled,
    WorkflowStuck,
    WorkflowExpired,
    // Locks and transactions
    LockAcquired,
    LockDenied,
    LockReleased,
    LockRenewed,
    LockExpired,
    TransactionBegun,
    TransactionCommitted,
    TransactionAborted,
    // State store
    StateUpdated,
    StateWriteRejected,
    StateDeleted,
    CacheInvalidated,
    ConsistencyViolation,
    ConsistencyRepaired,
    CheckpointCreated,
    CheckpointRestored,
    // A background loop iteration threw
    BackgroundTaskFailed
};

const char* to_string(EventType t);

struct MonitorEvent {
    EventType type;
    Timestamp timestamp;
    std::string message;

    std::optional<AgentId> agent_id;
    // Recipient, selected agent or resolution winner
    std::optional<AgentId> target_agent_id;
    std::optional<MessageId> message_id;
    // State or lock key
    std::optional<std::string> key;
    std::optional<TransactionId> transaction_id;
    std::optional<WorkflowId> workflow_id;

    // Retry backoff that was scheduled
    std::optional<Duration> delay;
    // Handler execution time in milliseconds
    std::optional<double> duration_ms;
    // Generic numeric payload (load, version, queue size)
    std::optional<double> value;
};

// Abstract monitor interface
class Monitor {
public:
    virtual ~Monitor() = default;
    virtual void on_event(const MonitorEvent& event) = 0;
    virtual void on_snapshot(const SystemSnapshot& snapshot) = 0;
};

// Console logger
class ConsoleMonitor : public Monitor {
public:
    enum class Verbosity { Quiet, Normal, Verbose, Debug };

    explicit ConsoleMonitor(Verbosity v = Verbosity::Normal);

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const SystemSnapshot& snapshot) override;

private:
    Verbosity verbosity_;
    mutable std::mutex output_mutex_;
};

// Metrics collector
class MetricsMonitor : public Monitor {
public:
    struct Metrics {
        std::uint64_t messages_sent{0};
        std::uint64_t messages_delivered{0};
        std::uint64_t messages_rejected{0};
        std::uint64_t messages_retried{0};
        std::uint64_t messages_dead_lettered{0};
        double average_handling_time_ms{0.0};
        std::uint64_t requests_routed{0};
        std::uint64_t routing_failures{0};
        std::uint64_t coordinations{0};
        std::uint64_t escalations{0};
        std::uint64_t locks_granted{0};
        std::uint64_t locks_denied{0};
        std::uint64_t transactions_committed{0};
        std::uint64_t transactions_aborted{0};
        std::uint64_t consistency_violations{0};
        std::uint64_t consistency_repairs{0};
        double average_agent_load{0.0};
    };

    MetricsMonitor();

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const SystemSnapshot& snapshot) override;

    Metrics get_metrics() const;
    void reset_metrics();

    using AlertCallback = std::function<void(const std::string&)>;
    void set_load_alert_threshold(double threshold, AlertCallback cb);
    void set_dead_letter_alert_threshold(std::size_t threshold, AlertCallback cb);

private:
    mutable std::mutex metrics_mutex_;
    Metrics metrics_;

    double load_threshold_{1.1};  // > 1.0 means disabled
    AlertCallback load_cb_;
    std::size_t dead_letter_threshold_{0};
    AlertCallback dead_letter_cb_;

    std::uint64_t handling_sample_count_{0};
    double handling_time_sum_ms_{0.0};
};

// Fan-out to multiple monitors
class CompositeMonitor : public Monitor {
public:
    void add_monitor(std::shared_ptr<Monitor> monitor);

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const SystemSnapshot& snapshot) override;

private:
    std::vector<std::shared_ptr<Monitor>> monitors_;
};

} // namespace agenthub
