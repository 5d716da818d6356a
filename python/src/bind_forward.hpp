#pragma once
#include <pybind11/pybind11.h>
#include <agenthub/util.hpp>
namespace py = pybind11;

void bind_enums_and_structs(py::module_& m);
void bind_exceptions(py::module_& m);
void bind_core(py::module_& m);
void bind_monitors(py::module_& m);
void bind_policies(py::module_& m);
void bind_subsystems(py::module_& m);

// JSON values cross the boundary as compact JSON text; "" means null.
inline agenthub::Value json_from_text(const std::string& text) {
    return text.empty() ? agenthub::Value() : agenthub::parse_json(text);
}

inline std::string json_to_text(const agenthub::Value& value) {
    return agenthub::to_json_string(value);
}

#include <agenthub/message.hpp>

// Wraps a Python callable(Message) -> Message | None. The bus calls handlers
// from its own threads, so the GIL is taken for the duration of the call.
inline std::shared_ptr<agenthub::MessageHandler> python_handler(py::function fn) {
    return agenthub::make_handler(
        [fn = py::object(fn)](const agenthub::Message& message) -> std::optional<agenthub::Message> {
            py::gil_scoped_acquire acquire;
            py::object result = fn(message);
            if (result.is_none()) {
                return std::nullopt;
            }
            return result.cast<agenthub::Message>();
        });
}
