#pragma once

#include "agenthub/types.hpp"
#include "agenthub/config.hpp"
#include "agenthub/conflict.hpp"
#include "agenthub/kv_store.hpp"
#include "agenthub/message_bus.hpp"
#include "agenthub/monitor.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace agenthub {

struct AgentDescriptor {
    AgentId id;
    std::string type;
    // Capability buckets the agent serves (e.g. "financial", "security")
    std::set<std::string> capabilities;
    AgentRole role{AgentRole::None};
    AgentStatus status{AgentStatus::Idle};
    double load{0.0};
    std::size_t max_concurrent_tasks{1};
    std::size_t active_tasks{0};
    Timestamp last_heartbeat{};
    Timestamp registered_at{};

    // Performance counters
    std::uint64_t requests_processed{0};
    std::uint64_t failures{0};
    double total_response_time_ms{0.0};

    bool is_available(double load_threshold) const noexcept {
        return status == AgentStatus::Idle && load < load_threshold;
    }

    Value to_json() const;
};

// Immutable user request
struct Request {
    std::string id;
    std::string user_id;
    std::string content;
    MessagePriority priority{MessagePriority::Medium};
    Value context{Json::objectValue};
    Timestamp created_at{};

    static Request create(std::string user_id, std::string content,
                          MessagePriority priority = MessagePriority::Medium,
                          Value context = Value(Json::objectValue));

    Value to_json() const;
};

struct Response {
    std::string request_id;
    // Responding agent, or "coordinated" for a consolidated answer
    AgentId agent_id;
    std::string status;
    Value result;
    Value metadata{Json::objectValue};
    double execution_time_ms{0.0};

    Value to_json() const;
};

struct CoordinatedResponse {
    SessionId coordination_id;
    std::string request_id;
    std::vector<AgentId> participating_agents;
    Value consolidated_result;
    std::vector<Response> individual_responses;
    bool consensus_reached{false};
    double confidence_score{0.0};
    double total_execution_time_ms{0.0};
};

struct CoordinationSession {
    SessionId id;
    Request request;
    std::vector<AgentId> agents;
    std::map<AgentId, Response> responses;
    SessionStatus status{SessionStatus::Active};
    Timestamp created_at{};
};

struct AgentMetrics {
    AgentId agent_id;
    std::string type;
    AgentRole role{AgentRole::None};
    AgentStatus status{AgentStatus::Idle};
    std::uint64_t requests_processed{0};
    std::uint64_t failures{0};
    double average_response_time_ms{0.0};
    double success_rate{1.0};
    double load{0.0};
    std::size_t active_tasks{0};
    Duration since_last_heartbeat{};
};

// Agent registry and request router. Requests reach agents as bus messages
// (action "process_request"); the agent's reply payload becomes the result.
class Router {
public:
    static constexpr const char* COORDINATED = "coordinated";

    Router(MessageBus& bus, KeyValueStore& store, PriorityModel& priorities,
           RouterConfig config = {});
    ~Router();

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    // ---- Registry ----
    // Throws ValidationException on an empty id, AgentAlreadyRegisteredException
    // on a duplicate. A non-null handler is registered with the bus for the agent.
    void register_agent(AgentDescriptor agent, std::shared_ptr<MessageHandler> handler = nullptr);
    bool deregister_agent(const AgentId& id);

    // Refreshes the heartbeat and load gauge. An agent marked unresponsive
    // returns to Idle unless a status is given.
    bool heartbeat(const AgentId& id, double load,
                   std::optional<AgentStatus> status = std::nullopt);
    bool update_capabilities(const AgentId& id, std::set<std::string> capabilities);

    std::optional<AgentDescriptor> get_agent(const AgentId& id) const;
    std::vector<AgentDescriptor> agents() const;
    std::size_t agent_count() const;

    // ---- Routing ----
    std::vector<AgentId> select_agents(const Request& request) const;

    // Throws RoutingException when no agent is available or the single
    // selected agent fails.
    Response route(const Request& request);

    CoordinatedResponse coordinate(const Request& request, const std::vector<AgentId>& agents);

    // Winning agent, or HUMAN_OVERSIGHT. Conflicting agents with a handler
    // receive a conflict_resolved event.
    AgentId resolve_conflict(const std::vector<AgentId>& agents, const Value& data);

    // ---- Observability ----
    std::vector<AgentMetrics> metrics() const;
    std::vector<AgentLoadSnapshot> load_snapshot() const;

    std::optional<CoordinationSession> get_session(const SessionId& id) const;
    std::size_t active_sessions() const;

    // ---- Maintenance passes (run by the background loop) ----
    std::size_t expire_sessions(Timestamp now = Clock::now());
    // Agents silent past the heartbeat timeout are marked Error
    std::size_t check_agent_health(Timestamp now = Clock::now());

    static double confidence_score(std::size_t successes);
    static bool consensus_reached(std::size_t successes, std::size_t dispatched,
                                  double threshold = 0.6);

    void set_monitor(std::shared_ptr<Monitor> monitor);

    void start();
    void stop();
    bool is_running() const noexcept;

private:
    MessageBus& bus_;
    KeyValueStore& store_;
    PriorityModel& priorities_;
    RouterConfig config_;
    std::shared_ptr<Monitor> monitor_;

    mutable std::mutex agents_mutex_;
    std::map<AgentId, AgentDescriptor> agents_;

    mutable std::mutex sessions_mutex_;
    std::map<SessionId, CoordinationSession> sessions_;

    std::atomic<bool> running_{false};
    std::thread maintenance_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;

    // Sends the request to one agent and waits up to coordination_timeout.
    // Throws on failure.
    Response dispatch(const AgentId& agent, const Request& request,
                      const std::optional<SessionId>& coordination_id);
    std::future<Message> send_request(const AgentId& agent, const Request& request,
                                      const std::optional<SessionId>& coordination_id);
    Response to_response(const AgentId& agent, const Request& request, const Message& reply,
                         double execution_time_ms) const;

    // Load gauge bookkeeping around a dispatch
    void begin_task(const AgentId& agent);
    void end_task(const AgentId& agent, bool success, double execution_time_ms);

    static Value consolidate(const std::vector<Response>& responses);
    void write_audit(const std::string& key, const Value& record);

    void maintenance_loop();

    void emit_event(EventType type, const std::string& message,
                    std::optional<AgentId> agent_id = std::nullopt,
                    std::optional<AgentId> target_agent_id = std::nullopt,
                    std::optional<double> value = std::nullopt);
};

} // namespace agenthub
