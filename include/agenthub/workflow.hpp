#pragma once

#include "agenthub/types.hpp"
#include "agenthub/config.hpp"
#include "agenthub/conflict.hpp"
#include "agenthub/message.hpp"
#include "agenthub/monitor.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agenthub {

class MessageBus;

struct WorkflowState {
    WorkflowId id;
    WorkflowPattern pattern{WorkflowPattern::Sequential};
    // Escalation workflows keep these ordered from lowest to highest authority
    std::vector<AgentId> participants;
    std::size_t current_step{0};
    std::size_t total_steps{0};
    WorkflowStatus status{WorkflowStatus::Active};
    Value context{Json::objectValue};
    std::map<AgentId, Value> results;
    std::vector<std::string> errors;
    Timestamp created_at{};
    Timestamp updated_at{};
    int iteration{0};

    // Set once a stale workflow has been reported; cleared on progress
    bool stuck_reported{false};

    bool is_active() const noexcept { return status == WorkflowStatus::Active; }
    Value to_json() const;
};

// Drives workflow state machines over the bus. Each step is a coordination
// message (action "workflow_step", correlation id = workflow id); the bus
// reports the handler's response or the step's dead-lettering back here.
//
//   sequential - one participant per step, in order; a failure fails it
//   parallel   - every participant at once; completes when all reported,
//                Failed if any step failed
//   iterative  - rounds over the participants until a response carries
//                "done": true or the step budget runs out
//   escalation - lowest authority first; a failure or a response with
//                "status": "failed" moves to the next higher role; when none
//                remain the workflow is Escalated to human oversight
class WorkflowEngine {
public:
    WorkflowEngine(MessageBus& bus, const PriorityModel& priorities, BusConfig config);

    WorkflowEngine(const WorkflowEngine&) = delete;
    WorkflowEngine& operator=(const WorkflowEngine&) = delete;

    // False for an empty or duplicate id, or no participants.
    bool start(const WorkflowId& id, WorkflowPattern pattern,
               std::vector<AgentId> participants, Value context);

    bool cancel(const WorkflowId& id);

    // Outcome of a step message. Unknown ids are ignored.
    void on_step_result(const MessageId& step_id, const std::optional<Message>& response);
    void on_step_failed(const MessageId& step_id, const std::string& error);
    bool owns_step(const MessageId& step_id) const;

    std::optional<WorkflowState> get(const WorkflowId& id) const;
    std::size_t active_count() const;

    // Active workflows not updated within the stuck threshold, reported once
    // per stale period.
    std::vector<WorkflowState> find_stuck(Timestamp now);

    // Drops workflows older than the workflow TTL. Returns the ids removed.
    std::vector<WorkflowId> expire(Timestamp now);

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    struct PendingStep {
        WorkflowId workflow_id;
        AgentId agent;
        std::size_t step{0};
    };

    MessageBus& bus_;
    const PriorityModel& priorities_;
    BusConfig config_;
    std::shared_ptr<Monitor> monitor_;

    mutable std::mutex mutex_;
    std::unordered_map<WorkflowId, WorkflowState> workflows_;
    std::unordered_map<MessageId, PendingStep> pending_steps_;

    // Caller holds mutex_. Builds the step message and records it as pending.
    Message make_step(WorkflowState& wf, const AgentId& agent, std::size_t step);
    // Caller holds mutex_. Sequential/iterative/escalation: next step or nullopt when done.
    std::optional<Message> next_step(WorkflowState& wf);
    void finish(WorkflowState& wf, WorkflowStatus status);
    void drop_pending(const WorkflowId& id);

    // Outside the lock
    void dispatch(std::vector<Message> steps);
    void announce(const WorkflowState& wf);

    void emit_event(EventType type, const std::string& message,
                    const WorkflowId& workflow_id,
                    std::optional<AgentId> agent_id = std::nullopt);
};

} // namespace agenthub
