#include "bind_forward.hpp"
#include <agenthub/agenthub.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

using namespace agenthub;

// ---------------------------------------------------------------------------
// bind_core  --  AgentDescriptor, Request, Response, Router, Hub
// ---------------------------------------------------------------------------
void bind_core(py::module_& m) {

    // ===================================================================
    // AgentDescriptor
    // ===================================================================
    py::class_<AgentDescriptor>(m, "AgentDescriptor")
        .def(py::init([](AgentId id, std::string type, std::set<std::string> capabilities,
                         AgentRole role, std::size_t max_concurrent_tasks) {
                 AgentDescriptor agent;
                 agent.id = std::move(id);
                 agent.type = std::move(type);
                 agent.capabilities = std::move(capabilities);
                 agent.role = role;
                 agent.max_concurrent_tasks = max_concurrent_tasks;
                 return agent;
             }),
             py::arg("id"), py::arg("type") = "",
             py::arg("capabilities") = std::set<std::string>{},
             py::arg("role") = AgentRole::None,
             py::arg("max_concurrent_tasks") = 1)
        .def_readwrite("id",                   &AgentDescriptor::id)
        .def_readwrite("type",                 &AgentDescriptor::type)
        .def_readwrite("capabilities",         &AgentDescriptor::capabilities)
        .def_readwrite("role",                 &AgentDescriptor::role)
        .def_readwrite("status",               &AgentDescriptor::status)
        .def_readwrite("load",                 &AgentDescriptor::load)
        .def_readwrite("max_concurrent_tasks", &AgentDescriptor::max_concurrent_tasks)
        .def_readonly("active_tasks",          &AgentDescriptor::active_tasks)
        .def_readonly("last_heartbeat",        &AgentDescriptor::last_heartbeat)
        .def_readonly("requests_processed",    &AgentDescriptor::requests_processed)
        .def_readonly("failures",              &AgentDescriptor::failures)
        .def("__repr__", [](const AgentDescriptor& a) {
            return "<AgentDescriptor id='" + a.id + "' role=" + std::string(to_string(a.role))
                 + " status=" + std::string(to_string(a.status)) + ">";
        });

    // ===================================================================
    // Request / Response
    // ===================================================================
    py::class_<Request>(m, "Request")
        .def_static("create",
            [](std::string user_id, std::string content, MessagePriority priority,
               const std::string& context) {
                return Request::create(std::move(user_id), std::move(content), priority,
                                       context.empty() ? Value(Json::objectValue)
                                                       : json_from_text(context));
            },
            py::arg("user_id"), py::arg("content"),
            py::arg("priority") = MessagePriority::Medium, py::arg("context") = "")
        .def_readonly("id",       &Request::id)
        .def_readonly("user_id",  &Request::user_id)
        .def_readonly("content",  &Request::content)
        .def_readonly("priority", &Request::priority);

    py::class_<Response>(m, "Response")
        .def_readonly("request_id",        &Response::request_id)
        .def_readonly("agent_id",          &Response::agent_id)
        .def_readonly("status",            &Response::status)
        .def_readonly("execution_time_ms", &Response::execution_time_ms)
        .def_property_readonly("result",
            [](const Response& r) { return json_to_text(r.result); })
        .def_property_readonly("metadata",
            [](const Response& r) { return json_to_text(r.metadata); });

    py::class_<CoordinatedResponse>(m, "CoordinatedResponse")
        .def_readonly("coordination_id",         &CoordinatedResponse::coordination_id)
        .def_readonly("request_id",              &CoordinatedResponse::request_id)
        .def_readonly("participating_agents",    &CoordinatedResponse::participating_agents)
        .def_readonly("individual_responses",    &CoordinatedResponse::individual_responses)
        .def_readonly("consensus_reached",       &CoordinatedResponse::consensus_reached)
        .def_readonly("confidence_score",        &CoordinatedResponse::confidence_score)
        .def_readonly("total_execution_time_ms", &CoordinatedResponse::total_execution_time_ms)
        .def_property_readonly("consolidated_result",
            [](const CoordinatedResponse& r) { return json_to_text(r.consolidated_result); });

    py::class_<AgentMetrics>(m, "AgentMetrics")
        .def_readonly("agent_id",                 &AgentMetrics::agent_id)
        .def_readonly("type",                     &AgentMetrics::type)
        .def_readonly("role",                     &AgentMetrics::role)
        .def_readonly("status",                   &AgentMetrics::status)
        .def_readonly("requests_processed",       &AgentMetrics::requests_processed)
        .def_readonly("failures",                 &AgentMetrics::failures)
        .def_readonly("average_response_time_ms", &AgentMetrics::average_response_time_ms)
        .def_readonly("success_rate",             &AgentMetrics::success_rate)
        .def_readonly("load",                     &AgentMetrics::load)
        .def_readonly("active_tasks",             &AgentMetrics::active_tasks);

    // ===================================================================
    // Router
    // ===================================================================
    py::class_<Router>(m, "Router")
        // ------------- Registry -------------
        .def("register_agent",
            [](Router& self, AgentDescriptor agent, std::optional<py::function> handler) {
                self.register_agent(std::move(agent),
                                    handler.has_value() ? python_handler(std::move(*handler))
                                                        : nullptr);
            },
            py::arg("agent"), py::arg("handler") = std::nullopt)
        .def("deregister_agent",    &Router::deregister_agent, py::arg("id"))
        .def("heartbeat",           &Router::heartbeat,
             py::arg("id"), py::arg("load"), py::arg("status") = std::nullopt)
        .def("update_capabilities", &Router::update_capabilities,
             py::arg("id"), py::arg("capabilities"))
        .def("get_agent",           &Router::get_agent, py::arg("id"))
        .def("agents",              &Router::agents)
        .def("agent_count",         &Router::agent_count)

        // ------------- Routing (blocks on agent handlers) -------------
        .def("select_agents", &Router::select_agents, py::arg("request"))
        .def("route",         &Router::route, py::arg("request"),
             py::call_guard<py::gil_scoped_release>())
        .def("coordinate",    &Router::coordinate,
             py::arg("request"), py::arg("agents"),
             py::call_guard<py::gil_scoped_release>())
        .def("resolve_conflict",
            [](Router& self, const std::vector<AgentId>& agents, const std::string& data) {
                Value body = json_from_text(data);
                py::gil_scoped_release release;
                return self.resolve_conflict(agents, body);
            },
            py::arg("agents"), py::arg("data") = "")

        // ------------- Observability -------------
        .def("metrics",         &Router::metrics)
        .def("load_snapshot",   &Router::load_snapshot)
        .def("active_sessions", &Router::active_sessions)
        .def_static("confidence_score",  &Router::confidence_score, py::arg("successes"))
        .def_static("consensus_reached", &Router::consensus_reached,
             py::arg("successes"), py::arg("dispatched"), py::arg("threshold") = 0.6);

    // ===================================================================
    // Hub
    // ===================================================================
    py::class_<Hub>(m, "Hub")
        .def(py::init([](Config config) { return std::make_unique<Hub>(std::move(config)); }),
             py::arg("config") = Config{})

        // Components live as long as the hub
        .def("priorities",   &Hub::priorities,   py::return_value_policy::reference_internal)
        .def("locks",        &Hub::locks,        py::return_value_policy::reference_internal)
        .def("transactions", &Hub::transactions, py::return_value_policy::reference_internal)
        .def("state",        &Hub::state,        py::return_value_policy::reference_internal)
        .def("bus",          &Hub::bus,          py::return_value_policy::reference_internal)
        .def("router",       &Hub::router,       py::return_value_policy::reference_internal)

        .def("get_snapshot", &Hub::get_snapshot)
        .def("set_monitor",  &Hub::set_monitor, py::arg("monitor"))
        .def("start",        &Hub::start)
        .def("stop",         &Hub::stop, py::call_guard<py::gil_scoped_release>())
        .def("is_running",   &Hub::is_running);
}
