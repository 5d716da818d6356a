#include "agenthub/monitor.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>

namespace agenthub {

const char* to_string(EventType t) {
    switch (t) {
        case EventType::AgentRegistered:       return "AgentRegistered";
        case EventType::AgentDeregistered:     return "AgentDeregistered";
        case EventType::AgentStatusChanged:    return "AgentStatusChanged";
        case EventType::AgentUnresponsive:     return "AgentUnresponsive";
        case EventType::RequestRouted:         return "RequestRouted";
        case EventType::RoutingFailed:         return "RoutingFailed";
        case EventType::CoordinationStarted:   return "CoordinationStarted";
        case EventType::CoordinationCompleted: return "CoordinationCompleted";
        case EventType::SessionExpired:        return "SessionExpired";
        case EventType::ConflictResolved:      return "ConflictResolved";
        case EventType::EscalatedToHuman:      return "EscalatedToHuman";
        case EventType::MessageSent:           return "MessageSent";
        case EventType::MessageRejected:       return "MessageRejected";
        case EventType::MessageDelivered:      return "MessageDelivered";
        case EventType::MessageFailed:         return "MessageFailed";
        case EventType::MessageRetryScheduled: return "MessageRetryScheduled";
        case EventType::MessageDeadLettered:   return "MessageDeadLettered";
        case EventType::DeadLetterReplayed:    return "DeadLetterReplayed";
        case EventType::BroadcastSent:         return "BroadcastSent";
        case EventType::QueueSizeChanged:      return "QueueSizeChanged";
        case EventType::WorkflowStarted:       return "WorkflowStarted";
        case EventType::WorkflowAdvanced:      return "WorkflowAdvanced";
        case EventType::WorkflowCompleted:     return "WorkflowCompleted";
        case EventType::WorkflowFailed:        return "WorkflowFailed";
        case EventType::WorkflowEscalated:     return "WorkflowEscalated";
        case EventType::WorkflowCancelled:     return "WorkflowCancelled";
        case EventType::WorkflowStuck:         return "WorkflowStuck";
        case EventType::WorkflowExpired:       return "WorkflowExpired";
        case EventType::LockAcquired:          return "LockAcquired";
        case EventType::LockDenied:            return "LockDenied";
        case EventType::LockReleased:          return "LockReleased";
        case EventType::LockRenewed:           return "LockRenewed";
        case EventType::LockExpired:           return "LockExpired";
        case EventType::TransactionBegun:      return "TransactionBegun";
        case EventType::TransactionCommitted:  return "TransactionCommitted";
        case EventType::TransactionAborted:    return "TransactionAborted";
        case EventType::StateUpdated:          return "StateUpdated";
        case EventType::StateWriteRejected:    return "StateWriteRejected";
        case EventType::StateDeleted:          return "StateDeleted";
        case EventType::CacheInvalidated:      return "CacheInvalidated";
        case EventType::ConsistencyViolation:  return "ConsistencyViolation";
        case EventType::ConsistencyRepaired:   return "ConsistencyRepaired";
        case EventType::CheckpointCreated:     return "CheckpointCreated";
        case EventType::CheckpointRestored:    return "CheckpointRestored";
        case EventType::BackgroundTaskFailed:  return "BackgroundTaskFailed";
    }
    return "Unknown";
}

namespace {

bool is_important_event(EventType t) {
    switch (t) {
        case EventType::AgentRegistered:
        case EventType::AgentDeregistered:
        case EventType::AgentUnresponsive:
        case EventType::RoutingFailed:
        case EventType::EscalatedToHuman:
        case EventType::MessageDeadLettered:
        case EventType::WorkflowFailed:
        case EventType::WorkflowEscalated:
        case EventType::WorkflowStuck:
        case EventType::TransactionAborted:
        case EventType::ConsistencyViolation:
        case EventType::CheckpointRestored:
        case EventType::BackgroundTaskFailed:
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

// ========== ConsoleMonitor ==========

ConsoleMonitor::ConsoleMonitor(Verbosity v) : verbosity_(v) {}

void ConsoleMonitor::on_event(const MonitorEvent& event) {
    if (verbosity_ == Verbosity::Quiet) return;
    if (verbosity_ == Verbosity::Normal && !is_important_event(event.type)) return;

    std::lock_guard<std::mutex> lock(output_mutex_);

    std::cout << "[AgentHub] " << to_string(event.type);

    if (event.agent_id.has_value()) {
        std::cout << " agent=" << event.agent_id.value();
    }
    if (event.target_agent_id.has_value()) {
        std::cout << " target=" << event.target_agent_id.value();
    }
    if (event.message_id.has_value()) {
        std::cout << " message=" << event.message_id.value();
    }
    if (event.key.has_value()) {
        std::cout << " key=" << event.key.value();
    }
    if (event.transaction_id.has_value()) {
        std::cout << " tx=" << event.transaction_id.value();
    }
    if (event.workflow_id.has_value()) {
        std::cout << " workflow=" << event.workflow_id.value();
    }
    if (event.delay.has_value()) {
        std::cout << " delay_ms="
                  << std::chrono::duration_cast<std::chrono::milliseconds>(*event.delay).count();
    }
    if (verbosity_ == Verbosity::Debug && event.duration_ms.has_value()) {
        std::cout << " took_ms=" << std::fixed << std::setprecision(2) << event.duration_ms.value();
    }

    if (!event.message.empty()) {
        std::cout << " | " << event.message;
    }

    std::cout << "\n";
}

void ConsoleMonitor::on_snapshot(const SystemSnapshot& snapshot) {
    if (verbosity_ < Verbosity::Verbose) return;

    std::lock_guard<std::mutex> lock(output_mutex_);

    std::cout << "\n[AgentHub] === System Snapshot ===\n";
    std::cout << "  Queued messages: " << snapshot.queued_messages << "\n";
    std::cout << "  Dead letters: " << snapshot.dead_letters << "\n";
    std::cout << "  Active workflows: " << snapshot.active_workflows << "\n";
    std::cout << "  Pending transactions: " << snapshot.pending_transactions << "\n";
    std::cout << "  Coordination sessions: " << snapshot.active_sessions << "\n";
    std::cout << "  Cached state entries: " << snapshot.cached_entries << "\n";
    std::cout << "  Agents: " << snapshot.agents.size() << "\n";

    for (const auto& agent : snapshot.agents) {
        std::cout << "    [" << agent.agent_id << "] " << to_string(agent.status)
                  << " load=" << std::fixed << std::setprecision(2) << agent.load
                  << " tasks=" << agent.active_tasks << "\n";
    }
    std::cout << "  ========================\n\n";
}

// ========== MetricsMonitor ==========

MetricsMonitor::MetricsMonitor() = default;

void MetricsMonitor::on_event(const MonitorEvent& event) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);

    switch (event.type) {
        case EventType::MessageSent:
            metrics_.messages_sent++;
            break;
        case EventType::MessageDelivered:
            metrics_.messages_delivered++;
            if (event.duration_ms.has_value()) {
                handling_time_sum_ms_ += event.duration_ms.value();
                handling_sample_count_++;
                metrics_.average_handling_time_ms =
                    handling_time_sum_ms_ / static_cast<double>(handling_sample_count_);
            }
            break;
        case EventType::MessageRejected:
            metrics_.messages_rejected++;
            break;
        case EventType::MessageRetryScheduled:
            metrics_.messages_retried++;
            break;
        case EventType::MessageDeadLettered:
            metrics_.messages_dead_lettered++;
            break;
        case EventType::RequestRouted:
            metrics_.requests_routed++;
            break;
        case EventType::RoutingFailed:
            metrics_.routing_failures++;
            break;
        case EventType::CoordinationCompleted:
            metrics_.coordinations++;
            break;
        case EventType::EscalatedToHuman:
        case EventType::WorkflowEscalated:
            metrics_.escalations++;
            break;
        case EventType::LockAcquired:
            metrics_.locks_granted++;
            break;
        case EventType::LockDenied:
            metrics_.locks_denied++;
            break;
        case EventType::TransactionCommitted:
            metrics_.transactions_committed++;
            break;
        case EventType::TransactionAborted:
            metrics_.transactions_aborted++;
            break;
        case EventType::ConsistencyViolation:
            metrics_.consistency_violations++;
            break;
        case EventType::ConsistencyRepaired:
            metrics_.consistency_repairs++;
            break;
        default:
            break;
    }
}

void MetricsMonitor::on_snapshot(const SystemSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);

    double total_load = 0.0;
    for (const auto& agent : snapshot.agents) {
        total_load += agent.load;
    }
    metrics_.average_agent_load = snapshot.agents.empty()
        ? 0.0 : total_load / static_cast<double>(snapshot.agents.size());

    if (load_cb_ && metrics_.average_agent_load > load_threshold_) {
        load_cb_("Average agent load " + std::to_string(metrics_.average_agent_load) +
                 " exceeds threshold");
    }

    if (dead_letter_cb_ && snapshot.dead_letters > dead_letter_threshold_) {
        dead_letter_cb_("Dead letters " + std::to_string(snapshot.dead_letters) +
                        " exceed threshold " + std::to_string(dead_letter_threshold_));
    }
}

MetricsMonitor::Metrics MetricsMonitor::get_metrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return metrics_;
}

void MetricsMonitor::reset_metrics() {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_ = Metrics{};
    handling_sample_count_ = 0;
    handling_time_sum_ms_ = 0.0;
}

void MetricsMonitor::set_load_alert_threshold(double threshold, AlertCallback cb) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    load_threshold_ = threshold;
    load_cb_ = std::move(cb);
}

void MetricsMonitor::set_dead_letter_alert_threshold(std::size_t threshold, AlertCallback cb) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    dead_letter_threshold_ = threshold;
    dead_letter_cb_ = std::move(cb);
}

// ========== CompositeMonitor ==========

void CompositeMonitor::add_monitor(std::shared_ptr<Monitor> monitor) {
    monitors_.push_back(std::move(monitor));
}

void CompositeMonitor::on_event(const MonitorEvent& event) {
    for (auto& m : monitors_) {
        m->on_event(event);
    }
}

void CompositeMonitor::on_snapshot(const SystemSnapshot& snapshot) {
    for (auto& m : monitors_) {
        m->on_snapshot(snapshot);
    }
}

} // namespace agenthub
