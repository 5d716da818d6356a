#pragma once

#include "agenthub/types.hpp"
#include "agenthub/config.hpp"
#include "agenthub/conflict.hpp"
#include "agenthub/kv_store.hpp"
#include "agenthub/message.hpp"
#include "agenthub/message_queue.hpp"
#include "agenthub/monitor.hpp"
#include "agenthub/workflow.hpp"

#include <atomic>
#include <condition_variable>
#include <future>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace agenthub {

struct DeadLetter {
    Message message;
    std::string reason;
    Timestamp dead_lettered_at{};

    Value to_json() const;
};

// Priority-aware message delivery between agents.
//
// Critical messages are delivered inline by send(); everything else goes
// through the delivery queue. A failed delivery is retried after
// retry_backoff_base * 2^retry_count; once retry_count reaches max_retries the
// message is dead-lettered and never attempted again unless replayed.
class MessageBus {
public:
    MessageBus(KeyValueStore& store, const PriorityModel& priorities, BusConfig config = {});
    ~MessageBus();

    MessageBus(const MessageBus&) = delete;
    MessageBus& operator=(const MessageBus&) = delete;

    // ---- Handlers and subscriptions ----
    // Replaces any handler already registered for the agent
    void register_handler(const AgentId& agent, std::shared_ptr<MessageHandler> handler);
    bool unregister_handler(const AgentId& agent);
    bool has_handler(const AgentId& agent) const;

    void subscribe(const AgentId& agent, const std::vector<std::string>& event_types);
    void unsubscribe(const AgentId& agent);
    std::vector<AgentId> subscribers(const std::string& event_type) const;

    // ---- Sending ----
    SendStatus send(Message message);

    // Sends and resolves with the handler's response. The future holds a
    // ValidationException when the message is rejected, DeadLetteredException
    // when delivery gives up, DeliveryFailureException if the bus stops first.
    std::future<Message> request(Message message);

    // One event message per subscriber of event_type other than the sender.
    // Returns how many were accepted.
    std::size_t broadcast(const std::string& event_type, const Value& payload,
                          const AgentId& from,
                          MessagePriority priority = MessagePriority::Medium);

    // ---- Dead letters ----
    std::vector<DeadLetter> dead_letters() const;
    std::optional<DeadLetter> get_dead_letter(const MessageId& id) const;
    bool is_dead_lettered(const MessageId& id) const;
    std::size_t dead_letter_count() const;

    // Re-sends a fresh copy (new id, retry_count 0). The dead letter stays
    // recorded. False if unknown or the copy was rejected.
    bool replay_dead_letter(const MessageId& id);

    // ---- Workflows ----
    bool start_workflow(const WorkflowId& id, WorkflowPattern pattern,
                        std::vector<AgentId> agents, Value context = Value(Json::objectValue));
    std::optional<WorkflowState> get_workflow(const WorkflowId& id) const;
    bool cancel_workflow(const WorkflowId& id);
    std::size_t active_workflow_count() const;

    std::size_t queue_size() const;

    // ---- Single passes of the background loops (also used by tests) ----
    // Delivers every queued message due at `now`. Returns how many were attempted.
    std::size_t process_ready(Timestamp now = Clock::now());
    // Persists newly dead-lettered messages under dead_letter:{id}
    std::size_t drain_dead_letters();
    // Reports stuck workflows and sends workflow_recovery to the orchestrator
    std::size_t check_workflow_health(Timestamp now = Clock::now());
    std::size_t expire_workflows(Timestamp now = Clock::now());

    void set_monitor(std::shared_ptr<Monitor> monitor);

    // Lifecycle: delivery, dead-letter and workflow monitor threads. Sends are
    // accepted before start() (queued until processed) but refused after stop().
    void start();
    void stop();
    bool is_running() const noexcept;

    // retry_backoff_base * 2^retry_count, capped at max_retry_delay
    Duration retry_delay(int retry_count) const;

    // Handler invocations that have not been joined yet
    std::size_t handler_runs_in_flight();

    static std::string audit_key(const MessageId& id);
    static std::string dead_letter_key(const MessageId& id);

private:
    using RequestPromise = std::shared_ptr<std::promise<Message>>;

    KeyValueStore& store_;
    BusConfig config_;
    std::shared_ptr<Monitor> monitor_;

    MessageQueue queue_;

    mutable std::shared_mutex handlers_mutex_;
    std::unordered_map<AgentId, std::shared_ptr<MessageHandler>> handlers_;

    mutable std::shared_mutex subscriptions_mutex_;
    std::unordered_map<AgentId, std::set<std::string>> subscriptions_;

    mutable std::mutex dead_letter_mutex_;
    std::map<MessageId, DeadLetter> dead_letters_;
    std::vector<MessageId> unpersisted_dead_letters_;

    std::mutex requests_mutex_;
    std::unordered_map<MessageId, RequestPromise> pending_requests_;

    WorkflowEngine workflows_;

    // Each invocation runs on its own thread so a timed-out handler can
    // finish later. Finished runs are joined on the next invocation, the
    // rest by stop().
    struct HandlerRun {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };
    std::mutex handler_runs_mutex_;
    std::list<HandlerRun> handler_runs_;

    std::atomic<bool> accepting_{true};
    std::atomic<bool> running_{false};
    std::thread delivery_thread_;
    std::thread dead_letter_thread_;
    std::thread workflow_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    std::condition_variable dead_letter_cv_;
    // Guarded by cv_mutex_
    bool delivery_wake_{false};
    bool dead_letter_wake_{false};

    // Reason for rejection, or nullopt if the message may be sent
    std::optional<std::string> validate(const Message& message, Timestamp now) const;
    void audit(const Message& message);

    // One attempt. Handles success, retry scheduling and dead-lettering.
    // Returns true if the handler succeeded.
    bool deliver(Message message, Timestamp now);
    std::optional<Message> invoke_handler(const Message& message);
    void join_handler_runs(bool wait_for_all);

    void on_delivered(const Message& message, const std::optional<Message>& response,
                      double duration_ms);
    void on_failed(Message message, const std::string& error, Timestamp now);
    void dead_letter(Message message, const std::string& reason, Timestamp now);

    void resolve_request(const MessageId& id, const std::optional<Message>& response,
                         const Message& original);
    void fail_request(const MessageId& id, std::exception_ptr error);
    void notify_delivery_loop();

    void delivery_loop();
    void dead_letter_loop();
    void workflow_loop();

    void emit_event(EventType type, const std::string& message, const Message* subject,
                    std::optional<Duration> delay = std::nullopt,
                    std::optional<double> duration_ms = std::nullopt);
};

} // namespace agenthub
