#include "bind_forward.hpp"
#include <agentgate/agentgate.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>

using namespace agentgate;

// Trampoline class to allow Python subclassing of SelectionPolicy
class PySelectionPolicy : public SelectionPolicy {
public:
    using SelectionPolicy::SelectionPolicy;

    std::vector<FallbackTier> order(const std::vector<FallbackTier>& candidates) const override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(std::vector<FallbackTier>, SelectionPolicy, order, candidates);
    }

    std::string name() const override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(std::string, SelectionPolicy, name);
    }
};

// Lets Python code stand in for the outbound HTTP client
class PyHttpTransport : public HttpTransport {
public:
    using HttpTransport::HttpTransport;

    HttpResponse send(const HttpRequest& request) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(HttpResponse, HttpTransport, send, request);
    }
};

class PyAuditSink : public AuditSink {
public:
    using AuditSink::AuditSink;

    void publish(const AuditEvent& event) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(void, AuditSink, publish, event);
    }
};

void bind_policies(py::module_& m) {
    // --- Abstract SelectionPolicy with trampoline ---
    py::class_<SelectionPolicy, PySelectionPolicy, std::shared_ptr<SelectionPolicy>>(
            m, "SelectionPolicy")
        .def(py::init<>())
        .def("order", &SelectionPolicy::order, py::arg("candidates"))
        .def("name", &SelectionPolicy::name);

    // --- Concrete policies ---

    py::class_<PreferencePolicy, SelectionPolicy, std::shared_ptr<PreferencePolicy>>(
            m, "PreferencePolicy")
        .def(py::init<>());

    py::class_<CostAwarePolicy, SelectionPolicy, std::shared_ptr<CostAwarePolicy>>(
            m, "CostAwarePolicy")
        .def(py::init([](std::shared_ptr<PricingTable> pricing) {
                 return std::make_shared<CostAwarePolicy>(std::move(pricing));
             }),
             py::arg("pricing"));

    py::class_<QualityAwarePolicy, SelectionPolicy, std::shared_ptr<QualityAwarePolicy>>(
            m, "QualityAwarePolicy")
        .def(py::init<>());

    // --- Transport ---

    py::class_<HttpRequest>(m, "HttpRequest")
        .def(py::init<>())
        .def_readwrite("method",  &HttpRequest::method)
        .def_readwrite("url",     &HttpRequest::url)
        .def_readwrite("headers", &HttpRequest::headers)
        .def_readwrite("body",    &HttpRequest::body)
        .def_readwrite("timeout", &HttpRequest::timeout);

    py::class_<HttpResponse>(m, "HttpResponse")
        .def(py::init<>())
        .def(py::init([](int status, std::string body) {
                 HttpResponse r;
                 r.status = status;
                 r.body = std::move(body);
                 return r;
             }),
             py::arg("status"), py::arg("body") = "")
        .def_readwrite("status",    &HttpResponse::status)
        .def_readwrite("body",      &HttpResponse::body)
        .def_readwrite("timed_out", &HttpResponse::timed_out);

    py::class_<HttpTransport, PyHttpTransport, std::shared_ptr<HttpTransport>>(
            m, "HttpTransport")
        .def(py::init<>())
        .def("send", &HttpTransport::send, py::arg("request"));

    py::class_<HttplibTransport, HttpTransport, std::shared_ptr<HttplibTransport>>(
            m, "HttplibTransport")
        .def(py::init<bool>(), py::arg("verify_certificates") = true)
        .def("send", &HttplibTransport::send, py::arg("request"),
             py::call_guard<py::gil_scoped_release>());

    // --- Audit sinks ---

    py::enum_<AuditEventKind>(m, "AuditEventKind")
        .value("Audit",      AuditEventKind::Audit)
        .value("CostReport", AuditEventKind::CostReport)
        .export_values();

    py::class_<AuditEvent>(m, "AuditEvent")
        .def(py::init<>())
        .def_readwrite("kind",                &AuditEvent::kind)
        .def_readwrite("request_id",          &AuditEvent::request_id)
        .def_readwrite("agent_id",            &AuditEvent::agent_id)
        .def_readwrite("capability",          &AuditEvent::capability)
        .def_readwrite("providers_attempted", &AuditEvent::providers_attempted)
        .def_readwrite("provider_id",         &AuditEvent::provider_id)
        .def_readwrite("model",               &AuditEvent::model)
        .def_readwrite("status",              &AuditEvent::status)
        .def_readwrite("estimated_cost",      &AuditEvent::estimated_cost)
        .def_readwrite("actual_cost",         &AuditEvent::actual_cost)
        .def_readwrite("usage",               &AuditEvent::usage)
        .def_readwrite("attempts",            &AuditEvent::attempts)
        .def_readwrite("latency_ms",          &AuditEvent::latency_ms)
        .def("to_json", [](const AuditEvent& e) { return to_json(e); });

    py::class_<AuditSink, PyAuditSink, std::shared_ptr<AuditSink>>(m, "AuditSink")
        .def(py::init<>())
        .def("publish", &AuditSink::publish, py::arg("event"));
}
