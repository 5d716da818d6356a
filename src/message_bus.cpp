#include "agenthub/message_bus.hpp"
#include "agenthub/exceptions.hpp"
#include "agenthub/util.hpp"

#include <algorithm>
#include <cstdint>
#include <iterator>

namespace agenthub {

namespace {

const AgentId BUS_SENDER = "message_bus";

} // namespace

Value DeadLetter::to_json() const {
    Value json(Json::objectValue);
    json["message"] = message.to_json();
    json["reason"] = reason;
    json["dead_lettered_at"] = format_timestamp(dead_lettered_at);
    return json;
}

MessageBus::MessageBus(KeyValueStore& store, const PriorityModel& priorities, BusConfig config)
    : store_(store)
    , config_(std::move(config))
    , queue_(config_.max_queue_size)
    , workflows_(*this, priorities, config_)
{}

MessageBus::~MessageBus() {
    stop();
}

void MessageBus::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::atomic_store(&monitor_, monitor);
    workflows_.set_monitor(std::move(monitor));
}

// ==================== Handlers and subscriptions ====================

void MessageBus::register_handler(const AgentId& agent, std::shared_ptr<MessageHandler> handler) {
    if (agent.empty()) {
        throw ValidationException("Handler agent id must not be empty");
    }
    if (!handler) {
        throw ValidationException("Handler for " + agent + " must not be null");
    }
    std::unique_lock lock(handlers_mutex_);
    handlers_[agent] = std::move(handler);
}

bool MessageBus::unregister_handler(const AgentId& agent) {
    std::unique_lock lock(handlers_mutex_);
    return handlers_.erase(agent) > 0;
}

bool MessageBus::has_handler(const AgentId& agent) const {
    std::shared_lock lock(handlers_mutex_);
    return handlers_.count(agent) > 0;
}

void MessageBus::subscribe(const AgentId& agent, const std::vector<std::string>& event_types) {
    if (agent.empty()) {
        throw ValidationException("Subscriber agent id must not be empty");
    }
    std::unique_lock lock(subscriptions_mutex_);
    auto& types = subscriptions_[agent];
    types.insert(event_types.begin(), event_types.end());
}

void MessageBus::unsubscribe(const AgentId& agent) {
    std::unique_lock lock(subscriptions_mutex_);
    subscriptions_.erase(agent);
}

std::vector<AgentId> MessageBus::subscribers(const std::string& event_type) const {
    std::shared_lock lock(subscriptions_mutex_);
    std::vector<AgentId> result;
    for (const auto& [agent, types] : subscriptions_) {
        if (types.count(event_type) > 0) {
            result.push_back(agent);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

// ==================== Sending ====================

SendStatus MessageBus::send(Message message) {
    auto now = Clock::now();
    if (message.id.empty()) {
        message.id = generate_id();
    }
    if (message.timestamp == Timestamp{}) {
        message.timestamp = now;
    }

    audit(message);

    auto rejection = validate(message, now);
    if (rejection.has_value()) {
        emit_event(EventType::MessageRejected, rejection.value(), &message);
        return SendStatus::Rejected;
    }

    emit_event(EventType::MessageSent,
               std::string(to_string(message.priority)) + " " + to_string(message.type) +
                   " '" + message.action + "'", &message);

    if (message.priority == MessagePriority::Critical) {
        return deliver(std::move(message), now) ? SendStatus::Delivered : SendStatus::Queued;
    }

    try {
        queue_.enqueue(message, now);
    } catch (const QueueFullException& e) {
        emit_event(EventType::MessageRejected, e.what(), &message);
        return SendStatus::Rejected;
    }

    if (auto monitor = std::atomic_load(&monitor_)) {
        MonitorEvent event;
        event.type = EventType::QueueSizeChanged;
        event.timestamp = now;
        event.message = "Message queued";
        event.message_id = message.id;
        event.value = static_cast<double>(queue_.size());
        monitor->on_event(event);
    }

    notify_delivery_loop();
    return SendStatus::Queued;
}

std::future<Message> MessageBus::request(Message message) {
    if (message.id.empty()) {
        message.id = generate_id();
    }

    auto promise = std::make_shared<std::promise<Message>>();
    auto future = promise->get_future();
    MessageId id = message.id;
    {
        std::lock_guard<std::mutex> lock(requests_mutex_);
        pending_requests_[id] = promise;
    }

    if (send(std::move(message)) == SendStatus::Rejected) {
        fail_request(id, std::make_exception_ptr(
            ValidationException("Message " + id + " was rejected by the bus")));
    }
    return future;
}

std::size_t MessageBus::broadcast(const std::string& event_type, const Value& payload,
                                  const AgentId& from, MessagePriority priority) {
    std::size_t accepted = 0;
    for (const auto& agent : subscribers(event_type)) {
        if (agent == from) {
            continue;
        }
        Message event = Message::create(from, agent, MessageType::Event, event_type,
                                        payload, priority);
        if (send(std::move(event)) != SendStatus::Rejected) {
            ++accepted;
        }
    }

    if (auto monitor = std::atomic_load(&monitor_)) {
        MonitorEvent event;
        event.type = EventType::BroadcastSent;
        event.timestamp = Clock::now();
        event.message = "Broadcast '" + event_type + "' to " + std::to_string(accepted) + " subscriber(s)";
        event.agent_id = from;
        event.value = static_cast<double>(accepted);
        monitor->on_event(event);
    }
    return accepted;
}

std::optional<std::string> MessageBus::validate(const Message& message, Timestamp now) const {
    if (!accepting_.load()) {
        return std::string("Message bus is stopped");
    }
    if (message.from.empty()) {
        return std::string("Message has no sender");
    }
    if (message.to.empty()) {
        return std::string("Message has no recipient");
    }
    if (message.action.empty()) {
        return std::string("Message has no action");
    }
    if (message.retry_count < 0 || message.max_retries < 0 ||
        message.retry_count > message.max_retries) {
        return std::string("retry_count outside [0, max_retries]");
    }
    if (!has_handler(message.to)) {
        return "Unknown recipient: " + message.to;
    }
    if (message.is_expired(now)) {
        return std::string("Message expired before sending");
    }
    return std::nullopt;
}

void MessageBus::audit(const Message& message) {
    store_.set(audit_key(message.id), message.to_wire(), config_.audit_retention);
}

// ==================== Delivery ====================

std::size_t MessageBus::process_ready(Timestamp now) {
    // Bounded so a message rescheduled at or before `now` waits for the next pass
    std::size_t budget = queue_.size();
    std::size_t attempted = 0;

    while (attempted < budget) {
        auto queued = queue_.pop_ready(now);
        if (!queued.has_value()) {
            break;
        }
        ++attempted;

        Message& message = queued->message;
        if (queued->is_retry && message.retry_count >= message.max_retries) {
            dead_letter(std::move(message), "Retries exhausted", now);
            continue;
        }
        deliver(std::move(message), now);
    }
    return attempted;
}

bool MessageBus::deliver(Message message, Timestamp now) {
    if (message.is_expired(now)) {
        emit_event(EventType::MessageFailed, "Message expired before delivery", &message);
        fail_request(message.id, std::make_exception_ptr(
            DeliveryFailureException(message.id, "Message expired before delivery")));
        workflows_.on_step_failed(message.id, "expired before delivery");
        return false;
    }

    auto started = std::chrono::steady_clock::now();
    std::optional<Message> response;
    try {
        response = invoke_handler(message);
    } catch (const std::exception& e) {
        on_failed(std::move(message), e.what(), now);
        return false;
    }
    double duration_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - started).count();

    on_delivered(message, response, duration_ms);
    return true;
}

std::optional<Message> MessageBus::invoke_handler(const Message& message) {
    std::shared_ptr<MessageHandler> handler;
    {
        std::shared_lock lock(handlers_mutex_);
        auto it = handlers_.find(message.to);
        if (it != handlers_.end()) {
            handler = it->second;
        }
    }
    if (!handler) {
        throw DeliveryFailureException(message.id, "No handler registered for " + message.to);
    }

    // The task owns copies of everything it touches, so a handler that
    // overruns the timeout can finish on its own after we give up on it.
    auto task = std::make_shared<std::packaged_task<std::optional<Message>()>>(
        [handler, message]() { return handler->handle(message); });
    auto result = task->get_future();
    auto finished = std::make_shared<std::atomic<bool>>(false);

    join_handler_runs(false);
    {
        std::lock_guard<std::mutex> lock(handler_runs_mutex_);
        handler_runs_.push_back(HandlerRun{
            std::thread([task, finished]() {
                (*task)();
                finished->store(true);
            }),
            finished});
    }

    if (result.wait_for(config_.handler_timeout) == std::future_status::timeout) {
        throw DeliveryFailureException(message.id, "Handler for " + message.to + " timed out");
    }
    return result.get();
}

void MessageBus::join_handler_runs(bool wait_for_all) {
    std::list<HandlerRun> done;
    {
        std::lock_guard<std::mutex> lock(handler_runs_mutex_);
        auto it = handler_runs_.begin();
        while (it != handler_runs_.end()) {
            auto next = std::next(it);
            if (wait_for_all || it->finished->load()) {
                done.splice(done.end(), handler_runs_, it);
            }
            it = next;
        }
    }
    for (auto& run : done) {
        if (run.thread.joinable()) {
            run.thread.join();
        }
    }
}

std::size_t MessageBus::handler_runs_in_flight() {
    join_handler_runs(false);
    std::lock_guard<std::mutex> lock(handler_runs_mutex_);
    return handler_runs_.size();
}

void MessageBus::on_delivered(const Message& message, const std::optional<Message>& response,
                              double duration_ms) {
    emit_event(EventType::MessageDelivered, "Delivered to " + message.to, &message,
               std::nullopt, duration_ms);
    resolve_request(message.id, response, message);
    if (workflows_.owns_step(message.id)) {
        workflows_.on_step_result(message.id, response);
    }
}

void MessageBus::on_failed(Message message, const std::string& error, Timestamp now) {
    emit_event(EventType::MessageFailed, error, &message);

    if (message.retry_count >= message.max_retries) {
        dead_letter(std::move(message), error, now);
        return;
    }

    ++message.retry_count;
    Duration delay = retry_delay(message.retry_count);
    audit(message);
    emit_event(EventType::MessageRetryScheduled,
               "Attempt " + std::to_string(message.retry_count) + "/" +
                   std::to_string(message.max_retries) + " failed: " + error,
               &message, delay);
    queue_.enqueue(std::move(message), now + delay, true);
    notify_delivery_loop();
}

Duration MessageBus::retry_delay(int retry_count) const {
    const Duration cap = config_.max_retry_delay;
    const auto base = config_.retry_backoff_base.count();
    if (retry_count <= 0) {
        return std::min(config_.retry_backoff_base, cap);
    }
    if (retry_count >= 62) {
        return cap;
    }

    const std::int64_t factor = std::int64_t{1} << retry_count;
    if (base > cap.count() / factor) {
        return cap;
    }
    return Duration(base * factor);
}

void MessageBus::dead_letter(Message message, const std::string& reason, Timestamp now) {
    MessageId id = message.id;
    {
        std::lock_guard<std::mutex> lock(dead_letter_mutex_);
        if (dead_letters_.count(id) > 0) {
            return;
        }
        dead_letters_.emplace(id, DeadLetter{std::move(message), reason, now});
        unpersisted_dead_letters_.push_back(id);
    }
    {
        std::lock_guard<std::mutex> lock(cv_mutex_);
        dead_letter_wake_ = true;
    }
    dead_letter_cv_.notify_one();

    auto letter = get_dead_letter(id);
    emit_event(EventType::MessageDeadLettered, reason, letter ? &letter->message : nullptr);

    fail_request(id, std::make_exception_ptr(DeadLetteredException(id)));
    workflows_.on_step_failed(id, "dead-lettered: " + reason);
}

// ==================== Requests ====================

void MessageBus::resolve_request(const MessageId& id, const std::optional<Message>& response,
                                 const Message& original) {
    RequestPromise promise;
    {
        std::lock_guard<std::mutex> lock(requests_mutex_);
        auto it = pending_requests_.find(id);
        if (it == pending_requests_.end()) {
            return;
        }
        promise = std::move(it->second);
        pending_requests_.erase(it);
    }
    promise->set_value(response.has_value() ? response.value()
                                            : original.reply(Value(Json::nullValue)));
}

void MessageBus::fail_request(const MessageId& id, std::exception_ptr error) {
    RequestPromise promise;
    {
        std::lock_guard<std::mutex> lock(requests_mutex_);
        auto it = pending_requests_.find(id);
        if (it == pending_requests_.end()) {
            return;
        }
        promise = std::move(it->second);
        pending_requests_.erase(it);
    }
    promise->set_exception(std::move(error));
}

// ==================== Dead letters ====================

std::vector<DeadLetter> MessageBus::dead_letters() const {
    std::lock_guard<std::mutex> lock(dead_letter_mutex_);
    std::vector<DeadLetter> result;
    result.reserve(dead_letters_.size());
    for (const auto& [id, letter] : dead_letters_) {
        result.push_back(letter);
    }
    return result;
}

std::optional<DeadLetter> MessageBus::get_dead_letter(const MessageId& id) const {
    std::lock_guard<std::mutex> lock(dead_letter_mutex_);
    auto it = dead_letters_.find(id);
    if (it == dead_letters_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MessageBus::is_dead_lettered(const MessageId& id) const {
    std::lock_guard<std::mutex> lock(dead_letter_mutex_);
    return dead_letters_.count(id) > 0;
}

std::size_t MessageBus::dead_letter_count() const {
    std::lock_guard<std::mutex> lock(dead_letter_mutex_);
    return dead_letters_.size();
}

bool MessageBus::replay_dead_letter(const MessageId& id) {
    auto letter = get_dead_letter(id);
    if (!letter.has_value()) {
        return false;
    }

    Message copy = letter->message;
    copy.id = generate_id();
    copy.timestamp = Clock::now();
    copy.retry_count = 0;

    emit_event(EventType::DeadLetterReplayed, "Replaying dead letter " + id + " as " + copy.id,
               &copy);
    return send(std::move(copy)) != SendStatus::Rejected;
}

std::size_t MessageBus::drain_dead_letters() {
    std::vector<DeadLetter> batch;
    {
        std::lock_guard<std::mutex> lock(dead_letter_mutex_);
        for (const auto& id : unpersisted_dead_letters_) {
            auto it = dead_letters_.find(id);
            if (it != dead_letters_.end()) {
                batch.push_back(it->second);
            }
        }
        unpersisted_dead_letters_.clear();
    }

    for (const auto& letter : batch) {
        store_.set(dead_letter_key(letter.message.id), to_json_string(letter.to_json()));
    }
    return batch.size();
}

// ==================== Workflows ====================

bool MessageBus::start_workflow(const WorkflowId& id, WorkflowPattern pattern,
                                std::vector<AgentId> agents, Value context) {
    return workflows_.start(id, pattern, std::move(agents), std::move(context));
}

std::optional<WorkflowState> MessageBus::get_workflow(const WorkflowId& id) const {
    return workflows_.get(id);
}

bool MessageBus::cancel_workflow(const WorkflowId& id) {
    return workflows_.cancel(id);
}

std::size_t MessageBus::active_workflow_count() const {
    return workflows_.active_count();
}

std::size_t MessageBus::check_workflow_health(Timestamp now) {
    auto stuck = workflows_.find_stuck(now);
    if (stuck.empty() || !has_handler(config_.orchestrator_agent)) {
        return stuck.size();
    }

    for (const auto& wf : stuck) {
        Value payload(Json::objectValue);
        payload["workflow_id"] = wf.id;
        payload["stuck_since"] = format_timestamp(wf.updated_at);
        Value agents(Json::arrayValue);
        for (const auto& agent : wf.participants) {
            agents.append(agent);
        }
        payload["participating_agents"] = agents;

        Message recovery = Message::create(BUS_SENDER, config_.orchestrator_agent,
                                           MessageType::Event, "workflow_recovery",
                                           std::move(payload), MessagePriority::High);
        recovery.correlation_id = wf.id;
        send(std::move(recovery));
    }
    return stuck.size();
}

std::size_t MessageBus::expire_workflows(Timestamp now) {
    return workflows_.expire(now).size();
}

std::size_t MessageBus::queue_size() const {
    return queue_.size();
}

std::string MessageBus::audit_key(const MessageId& id) {
    return "message:" + id;
}

std::string MessageBus::dead_letter_key(const MessageId& id) {
    return "dead_letter:" + id;
}

// ==================== Lifecycle ====================

void MessageBus::start() {
    if (running_.exchange(true)) {
        return;
    }
    accepting_.store(true);
    delivery_thread_ = std::thread(&MessageBus::delivery_loop, this);
    dead_letter_thread_ = std::thread(&MessageBus::dead_letter_loop, this);
    workflow_thread_ = std::thread(&MessageBus::workflow_loop, this);
}

void MessageBus::stop() {
    accepting_.store(false);
    running_.store(false);
    {
        std::lock_guard<std::mutex> lock(cv_mutex_);
        cv_.notify_all();
        dead_letter_cv_.notify_all();
    }
    for (auto* t : {&delivery_thread_, &dead_letter_thread_, &workflow_thread_}) {
        if (t->joinable()) {
            t->join();
        }
    }
    join_handler_runs(true);

    std::unordered_map<MessageId, RequestPromise> outstanding;
    {
        std::lock_guard<std::mutex> lock(requests_mutex_);
        outstanding.swap(pending_requests_);
    }
    for (auto& [id, promise] : outstanding) {
        promise->set_exception(std::make_exception_ptr(
            DeliveryFailureException(id, "Message bus stopped before delivery")));
    }
}

bool MessageBus::is_running() const noexcept {
    return running_.load();
}

void MessageBus::notify_delivery_loop() {
    {
        std::lock_guard<std::mutex> lock(cv_mutex_);
        delivery_wake_ = true;
    }
    cv_.notify_all();
}

void MessageBus::delivery_loop() {
    while (running_.load()) {
        try {
            process_ready(Clock::now());
        } catch (const std::exception& e) {
            emit_event(EventType::BackgroundTaskFailed,
                       std::string("Delivery pass failed: ") + e.what(), nullptr);
        }

        std::unique_lock<std::mutex> lock(cv_mutex_);
        cv_.wait_for(lock, config_.poll_interval, [this] {
            return !running_.load() || delivery_wake_;
        });
        delivery_wake_ = false;
    }
}

void MessageBus::dead_letter_loop() {
    while (running_.load()) {
        try {
            drain_dead_letters();
        } catch (const std::exception& e) {
            emit_event(EventType::BackgroundTaskFailed,
                       std::string("Dead-letter persistence failed: ") + e.what(), nullptr);
        }

        std::unique_lock<std::mutex> lock(cv_mutex_);
        dead_letter_cv_.wait_for(lock, config_.health_check_interval, [this] {
            return !running_.load() || dead_letter_wake_;
        });
        dead_letter_wake_ = false;
    }

    // Persist whatever was dead-lettered during shutdown
    try {
        drain_dead_letters();
    } catch (const std::exception& e) {
        emit_event(EventType::BackgroundTaskFailed,
                   std::string("Dead-letter persistence failed: ") + e.what(), nullptr);
    }
}

void MessageBus::workflow_loop() {
    while (running_.load()) {
        try {
            auto now = Clock::now();
            check_workflow_health(now);
            expire_workflows(now);
        } catch (const std::exception& e) {
            emit_event(EventType::BackgroundTaskFailed,
                       std::string("Workflow monitor failed: ") + e.what(), nullptr);
        }

        std::unique_lock<std::mutex> lock(cv_mutex_);
        cv_.wait_for(lock, config_.health_check_interval, [this] {
            return !running_.load();
        });
    }
}

void MessageBus::emit_event(EventType type, const std::string& message, const Message* subject,
                            std::optional<Duration> delay, std::optional<double> duration_ms) {
    auto monitor = std::atomic_load(&monitor_);
    if (!monitor) {
        return;
    }

    MonitorEvent event;
    event.type = type;
    event.timestamp = Clock::now();
    event.message = message;
    if (subject != nullptr) {
        event.agent_id = subject->from;
        event.target_agent_id = subject->to;
        event.message_id = subject->id;
        if (subject->action == "workflow_step" && subject->correlation_id.has_value()) {
            event.workflow_id = subject->correlation_id;
        }
    }
    event.delay = delay;
    event.duration_ms = duration_ms;
    monitor->on_event(event);
}

} // namespace agenthub
