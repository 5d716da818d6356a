#pragma once

#include "agenthub/types.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace agenthub {

// Message bus and workflow engine configuration
struct BusConfig {
    // Queue capacity across all priority tiers
    std::size_t max_queue_size = 10000;

    // How often the delivery loop re-checks the queue when idle
    Duration poll_interval = std::chrono::milliseconds(10);

    // Retry delay is retry_backoff_base * 2^retry_count, at most max_retry_delay
    Duration retry_backoff_base = std::chrono::seconds(1);
    Duration max_retry_delay = std::chrono::hours(1);
    int default_max_retries = 3;

    // A handler running longer than this counts as a delivery failure
    Duration handler_timeout = std::chrono::seconds(30);

    // Retention of message:{id} audit records
    Duration audit_retention = std::chrono::hours(24);

    // Workflow lifecycle
    Duration workflow_ttl = std::chrono::hours(24);
    Duration stuck_workflow_threshold = std::chrono::minutes(30);
    Duration health_check_interval = std::chrono::seconds(60);
    int workflow_step_max_retries = 1;
    int default_max_iterations = 3;

    // Receives workflow_recovery events and escalations
    AgentId orchestrator_agent = "intent_router";
};

struct LockConfig {
    Duration default_lease = std::chrono::seconds(30);
    Duration sweep_interval = std::chrono::seconds(30);

    // Compare-and-set retries before an acquisition gives up under churn
    int max_cas_attempts = 16;
};

struct TransactionConfig {
    Duration default_timeout = std::chrono::minutes(5);
    Duration sweep_interval = std::chrono::seconds(60);

    // Terminal transactions stay queryable (idempotent commit/rollback) this long
    Duration finished_retention = std::chrono::hours(1);

    // Retention of transaction:{id} records in the store
    Duration record_retention = std::chrono::hours(24);
};

struct StateConfig {
    ConflictStrategy default_strategy = ConflictStrategy::LastWriterWins;
    ConsistencyLevel default_consistency = ConsistencyLevel::Eventual;

    // Lease taken by strong writes and deletes
    Duration write_lock_lease = std::chrono::seconds(30);

    Duration consistency_check_interval = std::chrono::minutes(5);
    Duration sync_interval = std::chrono::milliseconds(100);

    // Timeout of the transaction wrapping a checkpoint restore
    Duration restore_timeout = std::chrono::minutes(10);
};

// Keyword classification: a request mentioning any keyword falls into the capability bucket
struct CapabilityRule {
    std::string capability;
    std::vector<std::string> keywords;
};

std::vector<CapabilityRule> default_capability_rules();

struct RouterConfig {
    std::vector<CapabilityRule> capability_rules = default_capability_rules();

    // Used when a request matches no bucket
    std::string default_capability = "financial";

    // Agents at or above this load are not selected
    double load_threshold = 0.8;

    // Fraction of dispatched agents that must succeed for consensus
    double consensus_threshold = 0.6;

    Duration coordination_timeout = std::chrono::seconds(30);
    Duration session_ttl = std::chrono::hours(1);
    Duration heartbeat_timeout = std::chrono::minutes(5);
    Duration health_check_interval = std::chrono::seconds(60);

    // Agent dispatches are not retried: a failing agent is excluded instead
    int dispatch_max_retries = 0;

    Duration audit_retention = std::chrono::hours(24);
};

struct Config {
    BusConfig bus;
    LockConfig locks;
    TransactionConfig transactions;
    StateConfig state;
    RouterConfig router;

    // How often the hub emits system snapshots to the monitor
    Duration snapshot_interval = std::chrono::seconds(5);
};

} // namespace agenthub
