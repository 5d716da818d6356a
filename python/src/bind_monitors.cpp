#include "bind_forward.hpp"
#include <agenthub/agenthub.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

#include <optional>
#include <sstream>

using namespace agenthub;

namespace {

// Python subclasses of Monitor are called from bus, lock and router threads
class PyMonitor : public Monitor {
public:
    void on_event(const MonitorEvent& event) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(void, Monitor, on_event, event);
    }

    void on_snapshot(const SystemSnapshot& snapshot) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(void, Monitor, on_snapshot, snapshot);
    }
};

MetricsMonitor::AlertCallback alert_from_python(py::function fn) {
    return [fn = py::object(fn)](const std::string& alert) {
        py::gil_scoped_acquire acquire;
        fn(alert);
    };
}

std::string describe(const MonitorEvent& event) {
    std::ostringstream os;
    os << "<MonitorEvent " << to_string(event.type);
    if (event.agent_id.has_value()) {
        os << " agent='" << *event.agent_id << "'";
    }
    if (event.target_agent_id.has_value()) {
        os << " target='" << *event.target_agent_id << "'";
    }
    if (event.key.has_value()) {
        os << " key='" << *event.key << "'";
    }
    os << " message='" << event.message << "'>";
    return os.str();
}

} // namespace

// ---------------------------------------------------------------------------
// bind_monitors  --  events, snapshots, metrics and the monitor hierarchy
// ---------------------------------------------------------------------------
void bind_monitors(py::module_& m) {

    py::enum_<ConsoleMonitor::Verbosity>(m, "Verbosity")
        .value("Quiet",   ConsoleMonitor::Verbosity::Quiet)
        .value("Normal",  ConsoleMonitor::Verbosity::Normal)
        .value("Verbose", ConsoleMonitor::Verbosity::Verbose)
        .value("Debug",   ConsoleMonitor::Verbosity::Debug)
        .export_values();

    m.def("event_name", [](EventType type) { return std::string(to_string(type)); },
          py::arg("type"));

    // ===================================================================
    // Events
    // ===================================================================
    py::class_<MonitorEvent>(m, "MonitorEvent")
        .def(py::init<>())
        .def_readwrite("type",            &MonitorEvent::type)
        .def_readwrite("timestamp",       &MonitorEvent::timestamp)
        .def_readwrite("message",         &MonitorEvent::message)
        .def_readwrite("agent_id",        &MonitorEvent::agent_id)
        .def_readwrite("target_agent_id", &MonitorEvent::target_agent_id)
        .def_readwrite("message_id",      &MonitorEvent::message_id)
        .def_readwrite("key",             &MonitorEvent::key)
        .def_readwrite("transaction_id",  &MonitorEvent::transaction_id)
        .def_readwrite("workflow_id",     &MonitorEvent::workflow_id)
        .def_readwrite("delay",           &MonitorEvent::delay)
        .def_readwrite("duration_ms",     &MonitorEvent::duration_ms)
        .def_readwrite("value",           &MonitorEvent::value)
        .def_property_readonly("name",
            [](const MonitorEvent& e) { return std::string(to_string(e.type)); })
        .def("__repr__", &describe);

    // ===================================================================
    // Snapshots
    // ===================================================================
    py::class_<AgentLoadSnapshot>(m, "AgentLoadSnapshot")
        .def(py::init<>())
        .def_readwrite("agent_id",     &AgentLoadSnapshot::agent_id)
        .def_readwrite("status",       &AgentLoadSnapshot::status)
        .def_readwrite("load",         &AgentLoadSnapshot::load)
        .def_readwrite("active_tasks", &AgentLoadSnapshot::active_tasks)
        .def("__repr__", [](const AgentLoadSnapshot& a) {
            return "<AgentLoadSnapshot '" + a.agent_id + "' " +
                   std::string(to_string(a.status)) + " load=" + std::to_string(a.load) + ">";
        });

    py::class_<SystemSnapshot>(m, "SystemSnapshot")
        .def(py::init<>())
        .def_readwrite("timestamp",            &SystemSnapshot::timestamp)
        .def_readwrite("agents",               &SystemSnapshot::agents)
        .def_readwrite("queued_messages",      &SystemSnapshot::queued_messages)
        .def_readwrite("dead_letters",         &SystemSnapshot::dead_letters)
        .def_readwrite("active_workflows",     &SystemSnapshot::active_workflows)
        .def_readwrite("pending_transactions", &SystemSnapshot::pending_transactions)
        .def_readwrite("active_sessions",      &SystemSnapshot::active_sessions)
        .def_readwrite("cached_entries",       &SystemSnapshot::cached_entries)
        .def("agent",
            [](const SystemSnapshot& s, const AgentId& id) -> std::optional<AgentLoadSnapshot> {
                for (const auto& a : s.agents) {
                    if (a.agent_id == id) {
                        return a;
                    }
                }
                return std::nullopt;
            },
            py::arg("id"))
        .def("overloaded_agents",
            [](const SystemSnapshot& s, double threshold) {
                std::vector<AgentId> ids;
                for (const auto& a : s.agents) {
                    if (a.load >= threshold) {
                        ids.push_back(a.agent_id);
                    }
                }
                return ids;
            },
            py::arg("threshold") = 0.8);

    // ===================================================================
    // Metrics counters (read-only from Python)
    // ===================================================================
    using Metrics = MetricsMonitor::Metrics;
    py::class_<Metrics>(m, "Metrics")
        // Delivery
        .def_readonly("messages_sent",            &Metrics::messages_sent)
        .def_readonly("messages_delivered",       &Metrics::messages_delivered)
        .def_readonly("messages_rejected",        &Metrics::messages_rejected)
        .def_readonly("messages_retried",         &Metrics::messages_retried)
        .def_readonly("messages_dead_lettered",   &Metrics::messages_dead_lettered)
        .def_readonly("average_handling_time_ms", &Metrics::average_handling_time_ms)
        // Routing
        .def_readonly("requests_routed",          &Metrics::requests_routed)
        .def_readonly("routing_failures",         &Metrics::routing_failures)
        .def_readonly("coordinations",            &Metrics::coordinations)
        .def_readonly("escalations",              &Metrics::escalations)
        .def_readonly("average_agent_load",       &Metrics::average_agent_load)
        // Locks, transactions and state
        .def_readonly("locks_granted",            &Metrics::locks_granted)
        .def_readonly("locks_denied",             &Metrics::locks_denied)
        .def_readonly("transactions_committed",   &Metrics::transactions_committed)
        .def_readonly("transactions_aborted",     &Metrics::transactions_aborted)
        .def_readonly("consistency_violations",   &Metrics::consistency_violations)
        .def_readonly("consistency_repairs",      &Metrics::consistency_repairs)
        .def_property_readonly("delivery_success_rate", [](const Metrics& x) {
            auto attempts = x.messages_delivered + x.messages_retried + x.messages_dead_lettered;
            return attempts == 0 ? 1.0
                                 : static_cast<double>(x.messages_delivered) / static_cast<double>(attempts);
        })
        .def("__repr__", [](const Metrics& x) {
            return "<Metrics sent=" + std::to_string(x.messages_sent) +
                   " delivered=" + std::to_string(x.messages_delivered) +
                   " dead_lettered=" + std::to_string(x.messages_dead_lettered) +
                   " committed=" + std::to_string(x.transactions_committed) +
                   " aborted=" + std::to_string(x.transactions_aborted) + ">";
        });

    // ===================================================================
    // Monitors
    // ===================================================================
    py::class_<Monitor, PyMonitor, std::shared_ptr<Monitor>>(m, "Monitor")
        .def(py::init<>())
        .def("on_event",    &Monitor::on_event,    py::arg("event"))
        .def("on_snapshot", &Monitor::on_snapshot, py::arg("snapshot"));

    py::class_<ConsoleMonitor, Monitor, std::shared_ptr<ConsoleMonitor>>(m, "ConsoleMonitor")
        .def(py::init<ConsoleMonitor::Verbosity>(),
             py::arg("verbosity") = ConsoleMonitor::Verbosity::Normal);

    py::class_<MetricsMonitor, Monitor, std::shared_ptr<MetricsMonitor>>(m, "MetricsMonitor")
        .def(py::init<>())
        .def("get_metrics",   &MetricsMonitor::get_metrics)
        .def("reset_metrics", &MetricsMonitor::reset_metrics)
        // Fires when a snapshot's average agent load crosses the threshold
        .def("on_high_load",
            [](MetricsMonitor& self, double threshold, py::function fn) {
                self.set_load_alert_threshold(threshold, alert_from_python(std::move(fn)));
            },
            py::arg("threshold"), py::arg("callback"))
        // Fires when a snapshot holds more dead letters than the threshold
        .def("on_dead_letters",
            [](MetricsMonitor& self, std::size_t threshold, py::function fn) {
                self.set_dead_letter_alert_threshold(threshold, alert_from_python(std::move(fn)));
            },
            py::arg("threshold"), py::arg("callback"));

    py::class_<CompositeMonitor, Monitor, std::shared_ptr<CompositeMonitor>>(m, "CompositeMonitor")
        .def(py::init<>())
        .def(py::init([](const std::vector<std::shared_ptr<Monitor>>& monitors) {
                 auto composite = std::make_shared<CompositeMonitor>();
                 for (const auto& monitor : monitors) {
                     composite->add_monitor(monitor);
                 }
                 return composite;
             }),
             py::arg("monitors"))
        .def("add_monitor", &CompositeMonitor::add_monitor, py::arg("monitor"));
}
