#include "agenthub/workflow.hpp"
#include "agenthub/message_bus.hpp"
#include "agenthub/util.hpp"

#include <algorithm>

namespace agenthub {

namespace {

const AgentId ENGINE_SENDER = "workflow_engine";
const char* STEP_ACTION = "workflow_step";

bool reports_failure(const Value& result) {
    return result.isObject() && result.get("status", "").asString() == "failed";
}

bool reports_done(const Value& result) {
    return result.isObject() && result.get("done", false).asBool();
}

} // namespace

// ==================== WorkflowState ====================

Value WorkflowState::to_json() const {
    Value json(Json::objectValue);
    json["workflow_id"] = id;
    json["pattern"] = to_string(pattern);
    json["status"] = to_string(status);
    json["current_step"] = static_cast<Json::UInt64>(current_step);
    json["total_steps"] = static_cast<Json::UInt64>(total_steps);
    json["iteration"] = iteration;
    json["context"] = context;

    Value agents(Json::arrayValue);
    for (const auto& agent : participants) {
        agents.append(agent);
    }
    json["participants"] = agents;

    Value res(Json::objectValue);
    for (const auto& [agent, result] : results) {
        res[agent] = result;
    }
    json["results"] = res;

    Value errs(Json::arrayValue);
    for (const auto& e : errors) {
        errs.append(e);
    }
    json["errors"] = errs;

    json["created_at"] = format_timestamp(created_at);
    json["updated_at"] = format_timestamp(updated_at);
    return json;
}

// ==================== WorkflowEngine ====================

WorkflowEngine::WorkflowEngine(MessageBus& bus, const PriorityModel& priorities, BusConfig config)
    : bus_(bus)
    , priorities_(priorities)
    , config_(std::move(config))
{}

void WorkflowEngine::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::atomic_store(&monitor_, std::move(monitor));
}

bool WorkflowEngine::start(const WorkflowId& id, WorkflowPattern pattern,
                           std::vector<AgentId> participants, Value context) {
    if (id.empty() || participants.empty()) {
        return false;
    }
    if (!context.isObject()) {
        context = Value(Json::objectValue);
    }

    std::vector<Message> steps;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (workflows_.count(id) > 0) {
            return false;
        }

        WorkflowState wf;
        wf.id = id;
        wf.pattern = pattern;
        wf.context = std::move(context);
        wf.created_at = Clock::now();
        wf.updated_at = wf.created_at;

        switch (pattern) {
            case WorkflowPattern::Escalation:
                wf.participants = priorities_.ascending_authority(participants);
                wf.total_steps = wf.participants.size();
                break;
            case WorkflowPattern::Iterative: {
                int rounds = wf.context.get("max_iterations", config_.default_max_iterations).asInt();
                if (rounds < 1) {
                    rounds = 1;
                }
                wf.participants = std::move(participants);
                wf.total_steps = wf.participants.size() * static_cast<std::size_t>(rounds);
                break;
            }
            case WorkflowPattern::Sequential:
            case WorkflowPattern::Parallel:
                wf.participants = std::move(participants);
                wf.total_steps = wf.participants.size();
                break;
        }

        auto& stored = workflows_.emplace(id, std::move(wf)).first->second;
        if (pattern == WorkflowPattern::Parallel) {
            for (std::size_t i = 0; i < stored.participants.size(); ++i) {
                steps.push_back(make_step(stored, stored.participants[i], i));
            }
        } else {
            steps.push_back(make_step(stored, stored.participants.front(), 0));
        }
    }

    emit_event(EventType::WorkflowStarted,
               std::string(to_string(pattern)) + " workflow started with " +
                   std::to_string(steps.size()) + " initial step(s)", id);
    dispatch(std::move(steps));
    return true;
}

bool WorkflowEngine::cancel(const WorkflowId& id) {
    WorkflowState snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = workflows_.find(id);
        if (it == workflows_.end() || !it->second.is_active()) {
            return false;
        }
        finish(it->second, WorkflowStatus::Cancelled);
        snapshot = it->second;
    }
    announce(snapshot);
    return true;
}

void WorkflowEngine::on_step_result(const MessageId& step_id,
                                    const std::optional<Message>& response) {
    WorkflowState snapshot;
    std::vector<Message> next;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto pit = pending_steps_.find(step_id);
        if (pit == pending_steps_.end()) {
            return;
        }
        PendingStep step = pit->second;
        pending_steps_.erase(pit);

        auto it = workflows_.find(step.workflow_id);
        if (it == workflows_.end() || !it->second.is_active()) {
            return;
        }
        WorkflowState& wf = it->second;
        wf.updated_at = Clock::now();
        wf.stuck_reported = false;

        Value result = response.has_value() ? response->payload : Value(Json::nullValue);

        switch (wf.pattern) {
            case WorkflowPattern::Sequential:
                wf.results[step.agent] = result;
                wf.current_step = step.step + 1;
                if (wf.current_step >= wf.total_steps) {
                    finish(wf, WorkflowStatus::Completed);
                } else {
                    next.push_back(make_step(wf, wf.participants[wf.current_step], wf.current_step));
                }
                break;

            case WorkflowPattern::Parallel:
                wf.results[step.agent] = result;
                ++wf.current_step;
                if (wf.current_step >= wf.total_steps) {
                    finish(wf, wf.errors.empty() ? WorkflowStatus::Completed : WorkflowStatus::Failed);
                }
                break;

            case WorkflowPattern::Iterative:
                wf.results[step.agent] = result;
                wf.current_step = step.step + 1;
                wf.iteration = static_cast<int>(wf.current_step / wf.participants.size());
                if (reports_done(result)) {
                    finish(wf, WorkflowStatus::Completed);
                } else if (wf.current_step >= wf.total_steps) {
                    wf.context["budget_exhausted"] = true;
                    finish(wf, WorkflowStatus::Completed);
                } else {
                    const auto& agent = wf.participants[wf.current_step % wf.participants.size()];
                    next.push_back(make_step(wf, agent, wf.current_step));
                }
                break;

            case WorkflowPattern::Escalation:
                if (reports_failure(result)) {
                    wf.errors.push_back(step.agent + ": reported failure");
                    wf.current_step = step.step + 1;
                    if (wf.current_step >= wf.total_steps) {
                        finish(wf, WorkflowStatus::Escalated);
                    } else {
                        next.push_back(make_step(wf, wf.participants[wf.current_step], wf.current_step));
                    }
                } else {
                    wf.results[step.agent] = result;
                    wf.current_step = step.step + 1;
                    finish(wf, WorkflowStatus::Completed);
                }
                break;
        }
        snapshot = wf;
    }

    announce(snapshot);
    dispatch(std::move(next));
}

void WorkflowEngine::on_step_failed(const MessageId& step_id, const std::string& error) {
    WorkflowState snapshot;
    std::vector<Message> next;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto pit = pending_steps_.find(step_id);
        if (pit == pending_steps_.end()) {
            return;
        }
        PendingStep step = pit->second;
        pending_steps_.erase(pit);

        auto it = workflows_.find(step.workflow_id);
        if (it == workflows_.end() || !it->second.is_active()) {
            return;
        }
        WorkflowState& wf = it->second;
        wf.updated_at = Clock::now();
        wf.stuck_reported = false;
        wf.errors.push_back(step.agent + ": " + error);

        switch (wf.pattern) {
            case WorkflowPattern::Sequential:
            case WorkflowPattern::Iterative:
                wf.current_step = step.step;
                finish(wf, WorkflowStatus::Failed);
                break;

            case WorkflowPattern::Parallel:
                ++wf.current_step;
                if (wf.current_step >= wf.total_steps) {
                    finish(wf, WorkflowStatus::Failed);
                }
                break;

            case WorkflowPattern::Escalation:
                wf.current_step = step.step + 1;
                if (wf.current_step >= wf.total_steps) {
                    finish(wf, WorkflowStatus::Escalated);
                } else {
                    next.push_back(make_step(wf, wf.participants[wf.current_step], wf.current_step));
                }
                break;
        }
        snapshot = wf;
    }

    announce(snapshot);
    dispatch(std::move(next));
}

bool WorkflowEngine::owns_step(const MessageId& step_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_steps_.count(step_id) > 0;
}

std::optional<WorkflowState> WorkflowEngine::get(const WorkflowId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = workflows_.find(id);
    if (it == workflows_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t WorkflowEngine::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(workflows_.begin(), workflows_.end(),
        [](const auto& kv) { return kv.second.is_active(); }));
}

std::vector<WorkflowState> WorkflowEngine::find_stuck(Timestamp now) {
    std::vector<WorkflowState> stuck;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, wf] : workflows_) {
            if (!wf.is_active() || wf.stuck_reported) {
                continue;
            }
            if (now - wf.updated_at >= config_.stuck_workflow_threshold) {
                wf.stuck_reported = true;
                stuck.push_back(wf);
            }
        }
    }

    for (const auto& wf : stuck) {
        emit_event(EventType::WorkflowStuck,
                   "No progress since " + format_timestamp(wf.updated_at), wf.id);
    }
    return stuck;
}

std::vector<WorkflowId> WorkflowEngine::expire(Timestamp now) {
    std::vector<WorkflowId> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = workflows_.begin(); it != workflows_.end();) {
            if (now - it->second.created_at >= config_.workflow_ttl) {
                expired.push_back(it->first);
                drop_pending(it->first);
                it = workflows_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& id : expired) {
        emit_event(EventType::WorkflowExpired, "Workflow removed after TTL", id);
    }
    return expired;
}

// ==================== Internals ====================

Message WorkflowEngine::make_step(WorkflowState& wf, const AgentId& agent, std::size_t step) {
    Value payload(Json::objectValue);
    payload["workflow_id"] = wf.id;
    payload["step"] = static_cast<Json::UInt64>(step);
    payload["total_steps"] = static_cast<Json::UInt64>(wf.total_steps);
    payload["pattern"] = to_string(wf.pattern);
    payload["context"] = wf.context;

    if (wf.pattern == WorkflowPattern::Iterative) {
        payload["iteration"] = static_cast<Json::UInt64>(step / wf.participants.size());
    }
    if (step > 0 && wf.pattern != WorkflowPattern::Parallel) {
        const auto& previous = wf.participants[(step - 1) % wf.participants.size()];
        auto it = wf.results.find(previous);
        if (it != wf.results.end()) {
            payload["previous_result"] = it->second;
        }
    }

    Message msg = Message::create(ENGINE_SENDER, agent, MessageType::Coordination,
                                  STEP_ACTION, std::move(payload), MessagePriority::High);
    msg.correlation_id = wf.id;
    msg.max_retries = config_.workflow_step_max_retries;

    pending_steps_[msg.id] = PendingStep{wf.id, agent, step};
    return msg;
}

void WorkflowEngine::finish(WorkflowState& wf, WorkflowStatus status) {
    wf.status = status;
    wf.updated_at = Clock::now();
    drop_pending(wf.id);
}

void WorkflowEngine::drop_pending(const WorkflowId& id) {
    for (auto it = pending_steps_.begin(); it != pending_steps_.end();) {
        if (it->second.workflow_id == id) {
            it = pending_steps_.erase(it);
        } else {
            ++it;
        }
    }
}

void WorkflowEngine::dispatch(std::vector<Message> steps) {
    for (auto& step : steps) {
        MessageId id = step.id;
        AgentId to = step.to;
        if (bus_.send(std::move(step)) == SendStatus::Rejected) {
            on_step_failed(id, "step rejected for " + to);
        }
    }
}

void WorkflowEngine::announce(const WorkflowState& wf) {
    switch (wf.status) {
        case WorkflowStatus::Active:
            emit_event(EventType::WorkflowAdvanced,
                       "Step " + std::to_string(wf.current_step) + "/" +
                           std::to_string(wf.total_steps), wf.id);
            break;
        case WorkflowStatus::Completed:
            emit_event(EventType::WorkflowCompleted, "Workflow completed", wf.id);
            break;
        case WorkflowStatus::Failed:
            emit_event(EventType::WorkflowFailed,
                       wf.errors.empty() ? "Workflow failed" : wf.errors.back(), wf.id);
            break;
        case WorkflowStatus::Cancelled:
            emit_event(EventType::WorkflowCancelled, "Workflow cancelled", wf.id);
            break;
        case WorkflowStatus::Escalated: {
            emit_event(EventType::WorkflowEscalated,
                       "Every participant failed, escalating", wf.id);
            emit_event(EventType::EscalatedToHuman,
                       "Workflow requires human oversight", wf.id, HUMAN_OVERSIGHT);

            if (bus_.has_handler(HUMAN_OVERSIGHT)) {
                Message escalation = Message::create(ENGINE_SENDER, HUMAN_OVERSIGHT,
                                                     MessageType::Escalation, "workflow_escalation",
                                                     wf.to_json(), MessagePriority::High);
                escalation.correlation_id = wf.id;
                bus_.send(std::move(escalation));
            }
            break;
        }
    }
}

void WorkflowEngine::emit_event(EventType type, const std::string& message,
                                const WorkflowId& workflow_id,
                                std::optional<AgentId> agent_id) {
    auto monitor = std::atomic_load(&monitor_);
    if (!monitor) {
        return;
    }

    MonitorEvent event;
    event.type = type;
    event.timestamp = Clock::now();
    event.message = message;
    event.workflow_id = workflow_id;
    event.agent_id = std::move(agent_id);
    monitor->on_event(event);
}

} // namespace agenthub
