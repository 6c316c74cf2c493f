#include "bind_forward.hpp"
#include <agentgate/agentgate.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

using namespace agentgate;

// Trampoline class to allow Python subclassing of Monitor
class PyMonitor : public Monitor {
public:
    using Monitor::Monitor;

    void on_event(const MonitorEvent& event) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(void, Monitor, on_event, event);
    }
};

namespace {

MetricsMonitor::AlertCallback wrap_alert(py::function cb) {
    return [cb = py::object(cb)](const std::string& msg) {
        py::gil_scoped_acquire acquire;
        cb(msg);
    };
}

} // anonymous namespace

void bind_monitors(py::module_& m) {
    // --- Abstract Monitor with trampoline ---
    py::class_<Monitor, PyMonitor, std::shared_ptr<Monitor>>(m, "Monitor")
        .def(py::init<>())
        .def("on_event", &Monitor::on_event);

    // --- ConsoleMonitor ---
    py::class_<ConsoleMonitor, Monitor, std::shared_ptr<ConsoleMonitor>>(m, "ConsoleMonitor")
        .def(py::init<ConsoleMonitor::Verbosity>(),
             py::arg("verbosity") = ConsoleMonitor::Verbosity::Normal);

    // --- MetricsMonitor ---
    py::class_<MetricsMonitor, Monitor, std::shared_ptr<MetricsMonitor>>(m, "MetricsMonitor")
        .def(py::init<>())
        .def("get_metrics", &MetricsMonitor::get_metrics)
        .def("reset_metrics", &MetricsMonitor::reset_metrics)
        .def("set_breaker_open_alert",
            [](MetricsMonitor& self, py::function cb) {
                self.set_breaker_open_alert(wrap_alert(std::move(cb)));
            },
            py::arg("callback"))
        .def("set_budget_overrun_alert",
            [](MetricsMonitor& self, py::function cb) {
                self.set_budget_overrun_alert(wrap_alert(std::move(cb)));
            },
            py::arg("callback"));

    // --- CompositeMonitor ---
    py::class_<CompositeMonitor, Monitor, std::shared_ptr<CompositeMonitor>>(m, "CompositeMonitor")
        .def(py::init<>())
        .def("add_monitor", &CompositeMonitor::add_monitor);

    m.def("event_name", [](EventType t) { return std::string(to_string(t)); }, py::arg("type"));
}
