#include "agenthub/router.hpp"
#include "agenthub/exceptions.hpp"
#include "agenthub/util.hpp"

#include <algorithm>

namespace agenthub {

namespace {

const AgentId ROUTER_SENDER = "router";
const char* DISPATCH_ACTION = "process_request";

double elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - since).count();
}

Value to_json_array(const std::vector<AgentId>& ids) {
    Value array(Json::arrayValue);
    for (const auto& id : ids) {
        array.append(id);
    }
    return array;
}

} // namespace

// ==================== Data types ====================

Value AgentDescriptor::to_json() const {
    Value json(Json::objectValue);
    json["agent_id"] = id;
    json["type"] = type;
    Value caps(Json::arrayValue);
    for (const auto& c : capabilities) {
        caps.append(c);
    }
    json["capabilities"] = caps;
    json["role"] = to_string(role);
    json["status"] = to_string(status);
    json["load"] = load;
    json["max_concurrent_tasks"] = static_cast<Json::UInt64>(max_concurrent_tasks);
    json["active_tasks"] = static_cast<Json::UInt64>(active_tasks);
    json["last_heartbeat"] = format_timestamp(last_heartbeat);
    json["registered_at"] = format_timestamp(registered_at);
    json["requests_processed"] = static_cast<Json::UInt64>(requests_processed);
    json["failures"] = static_cast<Json::UInt64>(failures);
    return json;
}

Request Request::create(std::string user_id, std::string content,
                        MessagePriority priority, Value context) {
    Request r;
    r.id = generate_id();
    r.user_id = std::move(user_id);
    r.content = std::move(content);
    r.priority = priority;
    r.context = context.isObject() ? std::move(context) : Value(Json::objectValue);
    r.created_at = Clock::now();
    return r;
}

Value Request::to_json() const {
    Value json(Json::objectValue);
    json["request_id"] = id;
    json["user_id"] = user_id;
    json["content"] = content;
    json["priority"] = to_string(priority);
    json["context"] = context;
    json["timestamp"] = format_timestamp(created_at);
    return json;
}

Value Response::to_json() const {
    Value json(Json::objectValue);
    json["request_id"] = request_id;
    json["agent_id"] = agent_id;
    json["status"] = status;
    json["result"] = result;
    json["metadata"] = metadata;
    json["execution_time_ms"] = execution_time_ms;
    return json;
}

// ==================== Router ====================

Router::Router(MessageBus& bus, KeyValueStore& store, PriorityModel& priorities,
               RouterConfig config)
    : bus_(bus)
    , store_(store)
    , priorities_(priorities)
    , config_(std::move(config))
{}

Router::~Router() {
    if (running_.load()) {
        stop();
    }
}

void Router::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::atomic_store(&monitor_, std::move(monitor));
}

// ==================== Registry ====================

void Router::register_agent(AgentDescriptor agent, std::shared_ptr<MessageHandler> handler) {
    if (agent.id.empty()) {
        throw ValidationException("Agent id must not be empty");
    }

    auto now = Clock::now();
    agent.load = std::clamp(agent.load, 0.0, 1.0);
    agent.max_concurrent_tasks = std::max<std::size_t>(agent.max_concurrent_tasks, 1);
    agent.registered_at = now;
    if (agent.last_heartbeat == Timestamp{}) {
        agent.last_heartbeat = now;
    }
    if (agent.role == AgentRole::None) {
        agent.role = priorities_.role_of(agent.id);
    }

    Value record;
    {
        std::lock_guard<std::mutex> lock(agents_mutex_);
        if (agents_.count(agent.id) > 0) {
            throw AgentAlreadyRegisteredException(agent.id);
        }
        if (agent.role != AgentRole::None) {
            priorities_.assign_role(agent.id, agent.role);
        }
        record = agent.to_json();
        agents_.emplace(agent.id, agent);
    }

    if (handler) {
        bus_.register_handler(agent.id, std::move(handler));
    }

    record["event"] = "registered";
    write_audit("audit:agent:" + agent.id, record);
    emit_event(EventType::AgentRegistered,
               "Registered " + agent.type + " agent with role " + to_string(agent.role),
               agent.id, std::nullopt, agent.load);
}

bool Router::deregister_agent(const AgentId& id) {
    {
        std::lock_guard<std::mutex> lock(agents_mutex_);
        if (agents_.erase(id) == 0) {
            return false;
        }
    }
    bus_.unregister_handler(id);
    bus_.unsubscribe(id);
    emit_event(EventType::AgentDeregistered, "Agent deregistered", id);
    return true;
}

bool Router::heartbeat(const AgentId& id, double load, std::optional<AgentStatus> status) {
    std::optional<AgentStatus> changed;
    {
        std::lock_guard<std::mutex> lock(agents_mutex_);
        auto it = agents_.find(id);
        if (it == agents_.end()) {
            return false;
        }
        auto& agent = it->second;
        agent.last_heartbeat = Clock::now();
        agent.load = std::clamp(load, 0.0, 1.0);

        AgentStatus next = status.value_or(
            agent.status == AgentStatus::Error ? AgentStatus::Idle : agent.status);
        if (next != agent.status) {
            agent.status = next;
            changed = next;
        }
    }

    if (changed.has_value()) {
        emit_event(EventType::AgentStatusChanged,
                   std::string("Status now ") + to_string(changed.value()), id,
                   std::nullopt, load);
    }
    return true;
}

bool Router::update_capabilities(const AgentId& id, std::set<std::string> capabilities) {
    std::lock_guard<std::mutex> lock(agents_mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) {
        return false;
    }
    it->second.capabilities = std::move(capabilities);
    return true;
}

std::optional<AgentDescriptor> Router::get_agent(const AgentId& id) const {
    std::lock_guard<std::mutex> lock(agents_mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<AgentDescriptor> Router::agents() const {
    std::lock_guard<std::mutex> lock(agents_mutex_);
    std::vector<AgentDescriptor> result;
    result.reserve(agents_.size());
    for (const auto& [id, agent] : agents_) {
        result.push_back(agent);
    }
    return result;
}

std::size_t Router::agent_count() const {
    std::lock_guard<std::mutex> lock(agents_mutex_);
    return agents_.size();
}

// ==================== Selection ====================

std::vector<AgentId> Router::select_agents(const Request& request) const {
    std::string content = to_lower(request.content);

    std::vector<std::string> buckets;
    for (const auto& rule : config_.capability_rules) {
        bool hit = std::any_of(rule.keywords.begin(), rule.keywords.end(),
            [&content](const std::string& kw) { return content.find(kw) != std::string::npos; });
        if (hit) {
            buckets.push_back(rule.capability);
        }
    }

    // Explicit tags in the request context
    if (request.context.isObject() && request.context["capabilities"].isArray()) {
        for (const auto& tag : request.context["capabilities"]) {
            if (tag.isString() &&
                std::find(buckets.begin(), buckets.end(), tag.asString()) == buckets.end()) {
                buckets.push_back(tag.asString());
            }
        }
    }

    std::lock_guard<std::mutex> lock(agents_mutex_);
    std::vector<AgentId> selected;
    std::set<AgentId> seen;
    auto collect = [&](const std::string& bucket) {
        for (const auto& [id, agent] : agents_) {
            if (agent.capabilities.count(bucket) > 0 &&
                agent.is_available(config_.load_threshold) &&
                seen.insert(id).second) {
                selected.push_back(id);
            }
        }
    };

    for (const auto& bucket : buckets) {
        collect(bucket);
    }
    if (selected.empty()) {
        collect(config_.default_capability);
    }
    return selected;
}

// ==================== Routing ====================

Response Router::route(const Request& request) {
    auto started = std::chrono::steady_clock::now();
    auto selected = select_agents(request);

    if (selected.empty()) {
        emit_event(EventType::RoutingFailed, "No suitable agents available for request " + request.id);
        throw RoutingException("No suitable agents available for request " + request.id);
    }

    if (selected.size() == 1) {
        const AgentId& agent = selected.front();
        try {
            Response response = dispatch(agent, request, std::nullopt);
            emit_event(EventType::RequestRouted, "Request " + request.id + " handled",
                       std::nullopt, agent, response.execution_time_ms);
            return response;
        } catch (const AgentHubException& e) {
            emit_event(EventType::RoutingFailed, e.what(), std::nullopt, agent);
            throw RoutingException("Agent " + agent + " failed request " + request.id + ": " + e.what());
        }
    }

    CoordinatedResponse coordinated = coordinate(request, selected);

    Response response;
    response.request_id = request.id;
    response.agent_id = COORDINATED;
    response.status = coordinated.individual_responses.empty() ? "error" : "success";
    response.result = coordinated.consolidated_result;
    response.metadata["coordination_id"] = coordinated.coordination_id;
    response.metadata["consensus_reached"] = coordinated.consensus_reached;
    response.metadata["confidence_score"] = coordinated.confidence_score;
    response.metadata["participating_agents"] = to_json_array(coordinated.participating_agents);
    response.execution_time_ms = elapsed_ms(started);

    emit_event(EventType::RequestRouted,
               "Request " + request.id + " coordinated across " +
                   std::to_string(selected.size()) + " agents",
               std::nullopt, AgentId(COORDINATED), response.execution_time_ms);
    return response;
}

CoordinatedResponse Router::coordinate(const Request& request, const std::vector<AgentId>& agents) {
    if (agents.empty()) {
        throw RoutingException("Coordination needs at least one agent");
    }

    auto started = std::chrono::steady_clock::now();
    SessionId session_id = generate_id();
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        CoordinationSession session;
        session.id = session_id;
        session.request = request;
        session.agents = agents;
        session.created_at = Clock::now();
        sessions_.emplace(session_id, std::move(session));
    }
    emit_event(EventType::CoordinationStarted,
               "Coordinating " + std::to_string(agents.size()) + " agents for request " + request.id);

    // Fan out first, then collect against a single deadline
    std::vector<std::future<Message>> pending;
    pending.reserve(agents.size());
    for (const auto& agent : agents) {
        begin_task(agent);
        pending.push_back(send_request(agent, request, session_id));
    }

    auto deadline = std::chrono::steady_clock::now() + config_.coordination_timeout;
    std::vector<Response> succeeded;
    for (std::size_t i = 0; i < agents.size(); ++i) {
        const AgentId& agent = agents[i];
        try {
            if (pending[i].wait_until(deadline) == std::future_status::timeout) {
                throw DeliveryFailureException("", "No response from " + agent + " before the deadline");
            }
            Message reply = pending[i].get();
            Response response = to_response(agent, request, reply, elapsed_ms(started));
            response.metadata["coordination_id"] = session_id;

            bool ok = response.status != "error";
            end_task(agent, ok, response.execution_time_ms);
            if (ok) {
                succeeded.push_back(std::move(response));
            }
        } catch (const std::exception& e) {
            end_task(agent, false, elapsed_ms(started));
            emit_event(EventType::RoutingFailed,
                       "Excluded from coordination " + session_id + ": " + e.what(),
                       std::nullopt, agent);
        }
    }

    CoordinatedResponse result;
    result.coordination_id = session_id;
    result.request_id = request.id;
    result.participating_agents = agents;
    result.consolidated_result = consolidate(succeeded);
    result.individual_responses = succeeded;
    result.consensus_reached = consensus_reached(succeeded.size(), agents.size(),
                                                 config_.consensus_threshold);
    result.confidence_score = confidence_score(succeeded.size());
    result.total_execution_time_ms = elapsed_ms(started);

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(session_id);
        if (it != sessions_.end()) {
            for (const auto& r : succeeded) {
                it->second.responses[r.agent_id] = r;
            }
            it->second.status = SessionStatus::Completed;
        }
    }

    Value audit(Json::objectValue);
    audit["coordination_id"] = session_id;
    audit["request_id"] = request.id;
    audit["participating_agents"] = to_json_array(agents);
    std::vector<AgentId> responders;
    for (const auto& r : succeeded) {
        responders.push_back(r.agent_id);
    }
    audit["successful_agents"] = to_json_array(responders);
    audit["consensus_reached"] = result.consensus_reached;
    audit["confidence_score"] = result.confidence_score;
    audit["total_execution_time_ms"] = result.total_execution_time_ms;
    audit["timestamp"] = format_timestamp(Clock::now());
    write_audit("audit:coordination:" + session_id, audit);

    emit_event(EventType::CoordinationCompleted,
               std::to_string(succeeded.size()) + "/" + std::to_string(agents.size()) +
                   " agents responded, consensus " + (result.consensus_reached ? "reached" : "not reached"),
               std::nullopt, std::nullopt, result.confidence_score);
    return result;
}

Response Router::dispatch(const AgentId& agent, const Request& request,
                          const std::optional<SessionId>& coordination_id) {
    auto started = std::chrono::steady_clock::now();
    begin_task(agent);

    auto pending = send_request(agent, request, coordination_id);
    if (pending.wait_for(config_.coordination_timeout) == std::future_status::timeout) {
        end_task(agent, false, elapsed_ms(started));
        throw DeliveryFailureException("", "No response from " + agent + " within the timeout");
    }

    Message reply;
    try {
        reply = pending.get();
    } catch (const std::exception&) {
        end_task(agent, false, elapsed_ms(started));
        throw;
    }

    Response response = to_response(agent, request, reply, elapsed_ms(started));
    end_task(agent, response.status != "error", response.execution_time_ms);
    return response;
}

std::future<Message> Router::send_request(const AgentId& agent, const Request& request,
                                          const std::optional<SessionId>& coordination_id) {
    Value payload = request.to_json();
    if (coordination_id.has_value()) {
        payload["coordination_id"] = coordination_id.value();
    }

    Message message = Message::create(ROUTER_SENDER, agent, MessageType::Request,
                                      DISPATCH_ACTION, std::move(payload), request.priority);
    message.correlation_id = coordination_id.value_or(request.id);
    message.max_retries = config_.dispatch_max_retries;
    return bus_.request(std::move(message));
}

Response Router::to_response(const AgentId& agent, const Request& request, const Message& reply,
                             double execution_time_ms) const {
    Response response;
    response.request_id = request.id;
    response.agent_id = agent;
    response.result = reply.payload;
    response.status = "success";
    if (reply.payload.isObject() && reply.payload["status"].isString()) {
        response.status = reply.payload["status"].asString();
    }
    if (reply.in_reply_to.has_value()) {
        response.metadata["message_id"] = reply.in_reply_to.value();
    }
    response.execution_time_ms = execution_time_ms;
    return response;
}

Value Router::consolidate(const std::vector<Response>& responses) {
    Value consolidated(Json::objectValue);
    if (responses.empty()) {
        consolidated["error"] = "No valid responses received";
        consolidated["agent_count"] = 0;
        return consolidated;
    }

    consolidated["primary_result"] = responses.front().result;
    Value supporting(Json::arrayValue);
    for (std::size_t i = 1; i < responses.size(); ++i) {
        supporting.append(responses[i].result);
    }
    consolidated["supporting_results"] = supporting;
    consolidated["agent_count"] = static_cast<Json::UInt64>(responses.size());
    return consolidated;
}

double Router::confidence_score(std::size_t successes) {
    if (successes == 0) {
        return 0.0;
    }
    double bonus = std::min(0.4, 0.1 * static_cast<double>(successes));
    return std::min(1.0, 0.5 + bonus);
}

bool Router::consensus_reached(std::size_t successes, std::size_t dispatched, double threshold) {
    if (dispatched == 0) {
        return false;
    }
    // Epsilon keeps 3/5 at 0.6 from failing on floating-point rounding
    return static_cast<double>(successes) + 1e-9 >= threshold * static_cast<double>(dispatched);
}

// ==================== Load gauges ====================

void Router::begin_task(const AgentId& agent) {
    std::lock_guard<std::mutex> lock(agents_mutex_);
    auto it = agents_.find(agent);
    if (it == agents_.end()) {
        return;
    }
    auto& a = it->second;
    ++a.active_tasks;
    a.load = std::min(1.0, a.load + 1.0 / static_cast<double>(a.max_concurrent_tasks));
    if (a.status == AgentStatus::Idle && a.active_tasks >= a.max_concurrent_tasks) {
        a.status = AgentStatus::Busy;
    }
}

void Router::end_task(const AgentId& agent, bool success, double execution_time_ms) {
    std::lock_guard<std::mutex> lock(agents_mutex_);
    auto it = agents_.find(agent);
    if (it == agents_.end()) {
        return;
    }
    auto& a = it->second;
    if (a.active_tasks > 0) {
        --a.active_tasks;
    }
    a.load = std::max(0.0, a.load - 1.0 / static_cast<double>(a.max_concurrent_tasks));
    if (a.status == AgentStatus::Busy && a.active_tasks < a.max_concurrent_tasks) {
        a.status = AgentStatus::Idle;
    }

    ++a.requests_processed;
    a.total_response_time_ms += execution_time_ms;
    if (!success) {
        ++a.failures;
    }
}

// ==================== Conflicts ====================

AgentId Router::resolve_conflict(const std::vector<AgentId>& agents, const Value& data) {
    if (agents.empty()) {
        throw ValidationException("Conflict resolution needs at least one agent");
    }

    AgentId winner = priorities_.resolve(agents);
    std::string reason;
    if (winner == HUMAN_OVERSIGHT) {
        reason = "no_ranked_agent";
    } else if (priorities_.role_of(winner) == AgentRole::Security) {
        reason = "security_override";
    } else {
        reason = "role_hierarchy";
    }

    Value notice(Json::objectValue);
    notice["conflict_id"] = generate_id();
    notice["resolution_agent"] = winner;
    notice["reason"] = reason;
    notice["conflict_data"] = data;
    notice["timestamp"] = format_timestamp(Clock::now());

    emit_event(EventType::ConflictResolved,
               "Conflict among " + std::to_string(agents.size()) + " agents resolved by " + reason,
               std::nullopt, winner);

    if (winner == HUMAN_OVERSIGHT) {
        emit_event(EventType::EscalatedToHuman, "No ranked agent in conflict",
                   std::nullopt, HUMAN_OVERSIGHT);
        if (bus_.has_handler(HUMAN_OVERSIGHT)) {
            bus_.send(Message::create(ROUTER_SENDER, HUMAN_OVERSIGHT, MessageType::Escalation,
                                      "conflict_escalation", notice, MessagePriority::High));
        }
    }

    std::set<AgentId> notified;
    for (const auto& agent : agents) {
        if (!notified.insert(agent).second || !bus_.has_handler(agent)) {
            continue;
        }
        bus_.send(Message::create(ROUTER_SENDER, agent, MessageType::Event,
                                  "conflict_resolved", notice, MessagePriority::High));
    }
    return winner;
}

// ==================== Observability ====================

std::vector<AgentMetrics> Router::metrics() const {
    auto now = Clock::now();
    std::lock_guard<std::mutex> lock(agents_mutex_);
    std::vector<AgentMetrics> result;
    result.reserve(agents_.size());
    for (const auto& [id, a] : agents_) {
        AgentMetrics m;
        m.agent_id = id;
        m.type = a.type;
        m.role = a.role;
        m.status = a.status;
        m.requests_processed = a.requests_processed;
        m.failures = a.failures;
        if (a.requests_processed > 0) {
            m.average_response_time_ms =
                a.total_response_time_ms / static_cast<double>(a.requests_processed);
            m.success_rate = static_cast<double>(a.requests_processed - a.failures) /
                             static_cast<double>(a.requests_processed);
        }
        m.load = a.load;
        m.active_tasks = a.active_tasks;
        m.since_last_heartbeat = now - a.last_heartbeat;
        result.push_back(m);
    }
    return result;
}

std::vector<AgentLoadSnapshot> Router::load_snapshot() const {
    std::lock_guard<std::mutex> lock(agents_mutex_);
    std::vector<AgentLoadSnapshot> result;
    result.reserve(agents_.size());
    for (const auto& [id, a] : agents_) {
        result.push_back(AgentLoadSnapshot{id, a.status, a.load, a.active_tasks});
    }
    return result;
}

std::optional<CoordinationSession> Router::get_session(const SessionId& id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t Router::active_sessions() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return static_cast<std::size_t>(std::count_if(sessions_.begin(), sessions_.end(),
        [](const auto& kv) { return kv.second.status == SessionStatus::Active; }));
}

// ==================== Maintenance ====================

std::size_t Router::expire_sessions(Timestamp now) {
    std::vector<SessionId> expired;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (now - it->second.created_at > config_.session_ttl) {
                expired.push_back(it->first);
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& id : expired) {
        emit_event(EventType::SessionExpired, "Coordination session " + id + " expired");
    }
    return expired.size();
}

std::size_t Router::check_agent_health(Timestamp now) {
    std::vector<AgentId> unresponsive;
    {
        std::lock_guard<std::mutex> lock(agents_mutex_);
        for (auto& [id, agent] : agents_) {
            if (agent.status != AgentStatus::Error &&
                now - agent.last_heartbeat > config_.heartbeat_timeout) {
                agent.status = AgentStatus::Error;
                unresponsive.push_back(id);
            }
        }
    }

    for (const auto& id : unresponsive) {
        emit_event(EventType::AgentUnresponsive, "Heartbeat timeout, marked error", id);
    }
    return unresponsive.size();
}

void Router::write_audit(const std::string& key, const Value& record) {
    store_.set(key, to_json_string(record), config_.audit_retention);
}

// ==================== Lifecycle ====================

void Router::start() {
    if (running_.exchange(true)) {
        return;
    }
    maintenance_thread_ = std::thread(&Router::maintenance_loop, this);
}

void Router::stop() {
    running_.store(false);
    {
        std::lock_guard<std::mutex> lock(cv_mutex_);
        cv_.notify_all();
    }
    if (maintenance_thread_.joinable()) {
        maintenance_thread_.join();
    }
}

bool Router::is_running() const noexcept {
    return running_.load();
}

void Router::maintenance_loop() {
    while (running_.load()) {
        try {
            auto now = Clock::now();
            check_agent_health(now);
            expire_sessions(now);
        } catch (const std::exception& e) {
            emit_event(EventType::BackgroundTaskFailed,
                       std::string("Router maintenance failed: ") + e.what());
        }

        std::unique_lock<std::mutex> lock(cv_mutex_);
        cv_.wait_for(lock, config_.health_check_interval, [this] {
            return !running_.load();
        });
    }
}

void Router::emit_event(EventType type, const std::string& message,
                        std::optional<AgentId> agent_id,
                        std::optional<AgentId> target_agent_id,
                        std::optional<double> value) {
    auto monitor = std::atomic_load(&monitor_);
    if (!monitor) {
        return;
    }

    MonitorEvent event;
    event.type = type;
    event.timestamp = Clock::now();
    event.message = message;
    event.agent_id = std::move(agent_id);
    event.target_agent_id = std::move(target_agent_id);
    event.value = value;
    if (type == EventType::RequestRouted) {
        event.duration_ms = value;
    }
    monitor->on_event(event);
}

} // namespace agenthub
