#include "bind_forward.hpp"
#include <agenthub/agenthub.hpp>
#include <pybind11/stl.h>

using namespace agenthub;

void bind_policies(py::module_& m) {
    // --- Role hierarchy used by conflict resolution and escalation ---
    py::class_<PriorityModel>(m, "PriorityModel")
        .def(py::init<>())
        .def("load_default_roles",  &PriorityModel::load_default_roles)
        .def("assign_role",         &PriorityModel::assign_role,
             py::arg("agent"), py::arg("role"))
        .def("set_priority",        &PriorityModel::set_priority,
             py::arg("agent"), py::arg("priority"))
        .def("remove",              &PriorityModel::remove, py::arg("agent"))
        .def("role_of",             &PriorityModel::role_of, py::arg("agent"))
        .def("priority_of",         &PriorityModel::priority_of, py::arg("agent"))
        .def("resolve",             &PriorityModel::resolve, py::arg("agents"))
        .def("ascending_authority", &PriorityModel::ascending_authority, py::arg("agents"))
        .def_static("rank",         &PriorityModel::rank, py::arg("role"));

    // --- Conflict resolvers: resolve(existing_value, incoming, writer, owner) ---
    m.def("resolve_write",
          [](ConflictStrategy strategy, const PriorityModel& priorities,
             const std::string& existing_json, const AgentId& existing_owner,
             const std::string& incoming_json, const AgentId& writer)
              -> std::optional<std::string> {
              StateEntry existing;
              existing.value = json_from_text(existing_json);
              existing.owner = existing_owner;
              auto resolved = make_resolver(strategy, priorities)
                                  ->resolve(existing, json_from_text(incoming_json), writer);
              if (!resolved.has_value()) {
                  return std::nullopt;
              }
              return json_to_text(resolved.value());
          },
          py::arg("strategy"), py::arg("priorities"),
          py::arg("existing"), py::arg("existing_owner"),
          py::arg("incoming"), py::arg("writer"),
          "Apply a conflict strategy to one write. Returns the JSON to persist, or None if rejected.");
}
