#include "bind_forward.hpp"
#include <agenthub/agenthub.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

using namespace agenthub;

// ---------------------------------------------------------------------------
// Wrapper for std::future<Message>
// ---------------------------------------------------------------------------
struct FutureMessage {
    std::future<Message> fut;

    Message result() {
        py::gil_scoped_release release;
        return fut.get();
    }

    bool ready() const {
        return fut.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }
};

// ---------------------------------------------------------------------------
// bind_subsystems  --  messages, bus, locks, transactions, state
// ---------------------------------------------------------------------------
void bind_subsystems(py::module_& m) {

    // ===================================================================
    // Message
    // ===================================================================
    py::class_<Message>(m, "Message")
        .def(py::init<>())
        .def_static("create",
            [](AgentId from, AgentId to, MessageType type, std::string action,
               const std::string& payload, MessagePriority priority) {
                return Message::create(std::move(from), std::move(to), type, std::move(action),
                                       payload.empty() ? Value(Json::objectValue)
                                                       : json_from_text(payload),
                                       priority);
            },
            py::arg("from_agent"), py::arg("to_agent"), py::arg("type"),
            py::arg("action"), py::arg("payload") = "",
            py::arg("priority") = MessagePriority::Medium)
        .def_readwrite("id",             &Message::id)
        .def_readwrite("from_agent",     &Message::from)
        .def_readwrite("to_agent",       &Message::to)
        .def_readwrite("type",           &Message::type)
        .def_readwrite("action",         &Message::action)
        .def_readwrite("priority",       &Message::priority)
        .def_readwrite("timestamp",      &Message::timestamp)
        .def_readwrite("correlation_id", &Message::correlation_id)
        .def_readwrite("in_reply_to",    &Message::in_reply_to)
        .def_readwrite("expires_at",     &Message::expires_at)
        .def_readwrite("retry_count",    &Message::retry_count)
        .def_readwrite("max_retries",    &Message::max_retries)
        // JSON payload as text
        .def_property("payload",
            [](const Message& msg) { return json_to_text(msg.payload); },
            [](Message& msg, const std::string& text) { msg.payload = json_from_text(text); })
        .def("reply",
            [](const Message& msg, const std::string& payload) {
                return msg.reply(json_from_text(payload));
            },
            py::arg("payload") = "")
        .def("to_wire",   &Message::to_wire)
        .def_static("from_wire", &Message::from_wire, py::arg("text"))
        .def("__repr__", [](const Message& msg) {
            return "<Message id=" + msg.id + " " + msg.from + "->" + msg.to
                 + " action='" + msg.action + "'>";
        });

    py::class_<DeadLetter>(m, "DeadLetter")
        .def_readonly("message",          &DeadLetter::message)
        .def_readonly("reason",           &DeadLetter::reason)
        .def_readonly("dead_lettered_at", &DeadLetter::dead_lettered_at);

    py::class_<FutureMessage>(m, "FutureMessage")
        .def("result", &FutureMessage::result,
             "Block until the response is available (releases the GIL while waiting).")
        .def("ready",  &FutureMessage::ready,
             "Return True if the response is available without blocking.");

    py::class_<WorkflowState>(m, "WorkflowState")
        .def_readonly("id",           &WorkflowState::id)
        .def_readonly("pattern",      &WorkflowState::pattern)
        .def_readonly("participants", &WorkflowState::participants)
        .def_readonly("current_step", &WorkflowState::current_step)
        .def_readonly("total_steps",  &WorkflowState::total_steps)
        .def_readonly("status",       &WorkflowState::status)
        .def_readonly("errors",       &WorkflowState::errors)
        .def_readonly("iteration",    &WorkflowState::iteration)
        .def("to_json", [](const WorkflowState& wf) { return json_to_text(wf.to_json()); });

    // ===================================================================
    // MessageBus
    // ===================================================================
    py::class_<MessageBus>(m, "MessageBus")
        .def("register_handler",
            [](MessageBus& self, const AgentId& agent, py::function handler) {
                self.register_handler(agent, python_handler(std::move(handler)));
            },
            py::arg("agent"), py::arg("handler"))
        .def("unregister_handler", &MessageBus::unregister_handler, py::arg("agent"))
        .def("has_handler",        &MessageBus::has_handler, py::arg("agent"))
        .def("subscribe",          &MessageBus::subscribe,
             py::arg("agent"), py::arg("event_types"))
        .def("unsubscribe",        &MessageBus::unsubscribe, py::arg("agent"))
        .def("subscribers",        &MessageBus::subscribers, py::arg("event_type"))

        // Critical messages are delivered inline, which may call back into Python
        .def("send", &MessageBus::send, py::arg("message"),
             py::call_guard<py::gil_scoped_release>())
        .def("request",
            [](MessageBus& self, Message message) {
                return FutureMessage{self.request(std::move(message))};
            },
            py::arg("message"))
        .def("broadcast",
            [](MessageBus& self, const std::string& event_type, const std::string& payload,
               const AgentId& from, MessagePriority priority) {
                Value body = json_from_text(payload);
                py::gil_scoped_release release;
                return self.broadcast(event_type, body, from, priority);
            },
            py::arg("event_type"), py::arg("payload"), py::arg("from_agent"),
            py::arg("priority") = MessagePriority::Medium)

        .def("dead_letters",       &MessageBus::dead_letters)
        .def("get_dead_letter",    &MessageBus::get_dead_letter, py::arg("id"))
        .def("is_dead_lettered",   &MessageBus::is_dead_lettered, py::arg("id"))
        .def("dead_letter_count",  &MessageBus::dead_letter_count)
        .def("replay_dead_letter", &MessageBus::replay_dead_letter, py::arg("id"),
             py::call_guard<py::gil_scoped_release>())

        .def("start_workflow",
            [](MessageBus& self, const WorkflowId& id, WorkflowPattern pattern,
               std::vector<AgentId> agents, const std::string& context) {
                Value ctx = context.empty() ? Value(Json::objectValue) : json_from_text(context);
                py::gil_scoped_release release;
                return self.start_workflow(id, pattern, std::move(agents), std::move(ctx));
            },
            py::arg("id"), py::arg("pattern"), py::arg("agents"), py::arg("context") = "")
        .def("get_workflow",          &MessageBus::get_workflow, py::arg("id"))
        .def("cancel_workflow",       &MessageBus::cancel_workflow, py::arg("id"))
        .def("active_workflow_count", &MessageBus::active_workflow_count)
        .def("queue_size",            &MessageBus::queue_size)
        .def("is_running",            &MessageBus::is_running);

    // ===================================================================
    // LockManager
    // ===================================================================
    py::class_<LockManager>(m, "LockManager")
        .def("acquire", &LockManager::acquire,
             py::arg("key"), py::arg("type"), py::arg("owner"),
             py::arg("duration") = std::nullopt, py::arg("renewable") = true)
        .def("release",    &LockManager::release, py::arg("key"), py::arg("owner"))
        .def("renew",      &LockManager::renew,
             py::arg("key"), py::arg("owner"), py::arg("duration") = std::nullopt)
        .def("is_locked",  &LockManager::is_locked, py::arg("key"))
        .def("is_held_by", &LockManager::is_held_by, py::arg("key"), py::arg("owner"))
        .def_static("resource_key", &LockManager::resource_key,
             py::arg("scope"), py::arg("key"));

    // ===================================================================
    // TransactionCoordinator
    // ===================================================================
    py::class_<TransactionCoordinator>(m, "TransactionCoordinator")
        .def("begin", &TransactionCoordinator::begin,
             py::arg("coordinator"), py::arg("participants") = std::vector<AgentId>{},
             py::arg("timeout") = std::nullopt)
        .def("add_operation",
            [](TransactionCoordinator& self, const TransactionId& id, OperationType type,
               const std::string& key, StateScope scope, const std::string& value,
               const AgentId& agent) {
                return self.add_operation(id, type, key, scope, json_from_text(value), agent);
            },
            py::arg("id"), py::arg("type"), py::arg("key"), py::arg("scope"),
            py::arg("value"), py::arg("agent"))
        .def("commit",   &TransactionCoordinator::commit, py::arg("id"),
             py::call_guard<py::gil_scoped_release>())
        .def("rollback", &TransactionCoordinator::rollback,
             py::arg("id"), py::arg("reason") = "rolled back",
             py::call_guard<py::gil_scoped_release>())
        .def("status",
            [](const TransactionCoordinator& self, const TransactionId& id)
                -> std::optional<TransactionStatus> {
                auto tx = self.get(id);
                if (!tx.has_value()) {
                    return std::nullopt;
                }
                return tx->status;
            },
            py::arg("id"))
        .def("pending_count", &TransactionCoordinator::pending_count);

    // ===================================================================
    // StateManager
    // ===================================================================
    py::class_<SetOptions>(m, "SetOptions")
        .def(py::init<>())
        .def_readwrite("consistency",  &SetOptions::consistency)
        .def_readwrite("ttl",          &SetOptions::ttl)
        .def_readwrite("strategy",     &SetOptions::strategy)
        .def_readwrite("state_type",   &SetOptions::state_type)
        .def_readwrite("dependencies", &SetOptions::dependencies);

    py::class_<StateEntry>(m, "StateEntry")
        .def_readonly("key",        &StateEntry::key)
        .def_readonly("scope",      &StateEntry::scope)
        .def_readonly("owner",      &StateEntry::owner)
        .def_readonly("version",    &StateEntry::version)
        .def_readonly("updated_at", &StateEntry::updated_at)
        .def_readonly("expires_at", &StateEntry::expires_at)
        .def_property_readonly("value",
            [](const StateEntry& e) { return json_to_text(e.value); });

    py::class_<StateManager>(m, "StateManager")
        .def("set",
            [](StateManager& self, const std::string& key, const std::string& value,
               StateScope scope, const AgentId& owner, const SetOptions& options) {
                Value v = json_from_text(value);
                py::gil_scoped_release release;
                return self.set(key, std::move(v), scope, owner, options);
            },
            py::arg("key"), py::arg("value"), py::arg("scope"), py::arg("owner"),
            py::arg("options") = SetOptions{})
        .def("get",
            [](StateManager& self, const std::string& key, StateScope scope,
               std::optional<ConsistencyLevel> consistency) -> std::optional<std::string> {
                auto value = self.get(key, scope, consistency);
                if (!value.has_value()) {
                    return std::nullopt;
                }
                return json_to_text(value.value());
            },
            py::arg("key"), py::arg("scope"), py::arg("consistency") = std::nullopt)
        .def("get_entry", &StateManager::get_entry,
             py::arg("key"), py::arg("scope"), py::arg("consistency") = std::nullopt)
        .def("erase",     &StateManager::erase,
             py::arg("key"), py::arg("scope"), py::arg("owner"))
        .def("list_keys", &StateManager::list_keys, py::arg("scope"))
        .def("create_checkpoint",  &StateManager::create_checkpoint,
             py::arg("name"), py::arg("scope"))
        .def("restore_checkpoint", &StateManager::restore_checkpoint,
             py::arg("name"), py::arg("scope"),
             py::call_guard<py::gil_scoped_release>())
        .def("list_checkpoints",   &StateManager::list_checkpoints, py::arg("scope"))
        .def("subscribe_to_changes",
            [](StateManager& self, const std::string& key_prefix, StateScope scope,
               py::function callback) {
                StateManager::ChangeCallback cpp_cb =
                    [cb = py::object(callback)](const StateChange& change) {
                        py::gil_scoped_acquire acquire;
                        cb(json_to_text(change.to_json()));
                    };
                return self.subscribe_to_changes(key_prefix, scope, std::move(cpp_cb));
            },
            py::arg("key_prefix"), py::arg("scope"), py::arg("callback"))
        .def("unsubscribe_from_changes", &StateManager::unsubscribe_from_changes, py::arg("id"))
        .def("verify_consistency", &StateManager::verify_consistency)
        .def("cache_size",         &StateManager::cache_size);
}
