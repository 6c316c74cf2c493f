#include "bind_forward.hpp"
#include <agentgate/agentgate.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>

#include <iostream>

using namespace agentgate;

void bind_subsystems(py::module_& m) {

    // ===================================================================
    // Circuit breakers
    // ===================================================================
    py::class_<CircuitBreaker, std::shared_ptr<CircuitBreaker>>(m, "CircuitBreaker")
        .def(py::init<std::string, BreakerConfig>(),
             py::arg("dependency"), py::arg("config") = BreakerConfig{})
        .def("allow_request",  &CircuitBreaker::allow_request)
        .def("record_success", &CircuitBreaker::record_success)
        .def("record_failure", &CircuitBreaker::record_failure)
        .def("cancel_probe",   &CircuitBreaker::cancel_probe)
        .def("state",          &CircuitBreaker::state)
        .def("failure_count",  &CircuitBreaker::failure_count)
        .def("dependency",     &CircuitBreaker::dependency)
        .def("reset",          &CircuitBreaker::reset);

    py::class_<CircuitBreakerRegistry, std::shared_ptr<CircuitBreakerRegistry>>(
            m, "CircuitBreakerRegistry")
        .def(py::init<BreakerConfig>(), py::arg("defaults") = BreakerConfig{})
        .def("get_or_create", &CircuitBreakerRegistry::get_or_create, py::arg("dependency"))
        .def("find",          &CircuitBreakerRegistry::find, py::arg("dependency"))
        .def("set_override",  &CircuitBreakerRegistry::set_override,
             py::arg("dependency"), py::arg("config"))
        .def("state",         &CircuitBreakerRegistry::state, py::arg("dependency"))
        .def("states",        &CircuitBreakerRegistry::states)
        .def("set_monitor",   &CircuitBreakerRegistry::set_monitor, py::arg("monitor"));

    // ===================================================================
    // Rate limiting
    // ===================================================================
    py::class_<RateLimiter, std::shared_ptr<RateLimiter>>(m, "RateLimiter")
        .def(py::init<RateLimitConfig>(), py::arg("config") = RateLimitConfig{})
        .def("check",          &RateLimiter::check, py::arg("key"), py::arg("fallback"))
        .def("check_agent",    &RateLimiter::check_agent, py::arg("agent_id"))
        .def("check_endpoint", &RateLimiter::check_endpoint, py::arg("endpoint"))
        .def("check_request",  &RateLimiter::check_request, py::arg("agent_id"), py::arg("endpoint"))
        .def("set_rule",       &RateLimiter::set_rule, py::arg("key"), py::arg("rule"))
        .def("tracked_keys",   &RateLimiter::tracked_keys)
        .def("set_monitor",    &RateLimiter::set_monitor, py::arg("monitor"))
        .def_static("agent_key",    &RateLimiter::agent_key, py::arg("agent_id"))
        .def_static("endpoint_key", &RateLimiter::endpoint_key, py::arg("endpoint"));

    // ===================================================================
    // Pricing
    // ===================================================================
    py::class_<PricingTable, std::shared_ptr<PricingTable>>(m, "PricingTable")
        .def(py::init<ModelPrice>(), py::arg("default_price") = ModelPrice{})
        .def("set_price",    &PricingTable::set_price, py::arg("model"), py::arg("price"))
        .def("remove_price", &PricingTable::remove_price, py::arg("model"))
        .def("find",         &PricingTable::find, py::arg("model"))
        .def("price_for",    &PricingTable::price_for, py::arg("model"))
        .def("cost",         &PricingTable::cost, py::arg("model"), py::arg("usage"))
        .def("max_cost",     &PricingTable::max_cost,
             py::arg("model"), py::arg("input_tokens"), py::arg("requested_max_output") = 0);

    // ===================================================================
    // Fallback selection
    // ===================================================================
    py::class_<FallbackChainSelector, std::shared_ptr<FallbackChainSelector>>(
            m, "FallbackChainSelector")
        .def(py::init([](std::shared_ptr<CircuitBreakerRegistry> breakers) {
                 return std::make_shared<FallbackChainSelector>(std::move(breakers));
             }),
             py::arg("breakers"))
        .def("add_tier",          &FallbackChainSelector::add_tier,
             py::arg("capability"), py::arg("tier"))
        .def("set_tiers",         &FallbackChainSelector::set_tiers,
             py::arg("capability"), py::arg("tiers"))
        .def("remove_capability", &FallbackChainSelector::remove_capability,
             py::arg("capability"))
        .def("has_capability",    &FallbackChainSelector::has_capability,
             py::arg("capability"))
        .def("tiers",             &FallbackChainSelector::tiers, py::arg("capability"))
        .def("capabilities",      &FallbackChainSelector::capabilities)
        .def("select",            &FallbackChainSelector::select,
             py::arg("capability"), py::arg("exclude") = std::set<ProviderId>{})
        .def("set_policy",
             [](FallbackChainSelector& self, std::shared_ptr<SelectionPolicy> policy) {
                 // Bridge shared_ptr (pybind11 holder) to unique_ptr (C++ API)
                 struct PolicyBridge : SelectionPolicy {
                     std::shared_ptr<SelectionPolicy> inner;
                     explicit PolicyBridge(std::shared_ptr<SelectionPolicy> p) : inner(std::move(p)) {}
                     std::vector<FallbackTier> order(
                         const std::vector<FallbackTier>& candidates) const override {
                         return inner->order(candidates);
                     }
                     std::string name() const override { return inner->name(); }
                 };
                 self.set_policy(std::make_unique<PolicyBridge>(std::move(policy)));
             },
             py::arg("policy"))
        .def("policy_name",       &FallbackChainSelector::policy_name);

    // ===================================================================
    // Providers
    // ===================================================================
    py::class_<ProviderAdapter, std::shared_ptr<ProviderAdapter>>(m, "ProviderAdapter")
        .def("id",       &ProviderAdapter::id)
        .def("base_url", &ProviderAdapter::base_url)
        .def("kind",     &ProviderAdapter::kind);

    py::class_<OpenAiAdapter, ProviderAdapter, std::shared_ptr<OpenAiAdapter>>(m, "OpenAiAdapter")
        .def(py::init<ProviderId, std::shared_ptr<HttpTransport>, std::string>(),
             py::arg("id"), py::arg("transport"),
             py::arg("base_url") = "https://api.openai.com");

    py::class_<AnthropicAdapter, ProviderAdapter, std::shared_ptr<AnthropicAdapter>>(
            m, "AnthropicAdapter")
        .def(py::init<ProviderId, std::shared_ptr<HttpTransport>, std::string>(),
             py::arg("id"), py::arg("transport"),
             py::arg("base_url") = "https://api.anthropic.com");

    py::class_<ProviderRegistry, std::shared_ptr<ProviderRegistry>>(m, "ProviderRegistry")
        .def(py::init<>())
        .def("register_adapter",   &ProviderRegistry::register_adapter, py::arg("adapter"))
        .def("unregister_adapter", &ProviderRegistry::unregister_adapter, py::arg("id"))
        .def("find",               &ProviderRegistry::find, py::arg("id"))
        .def("get",                &ProviderRegistry::get, py::arg("id"))
        .def("providers",          &ProviderRegistry::providers);

    // ===================================================================
    // Audit
    // ===================================================================
    py::class_<AuditDispatcher, std::shared_ptr<AuditDispatcher>>(m, "AuditDispatcher")
        .def(py::init<std::shared_ptr<AuditSink>, AuditConfig>(),
             py::arg("sink"), py::arg("config") = AuditConfig{})
        .def("enqueue",     &AuditDispatcher::enqueue, py::arg("event"))
        .def("flush",       &AuditDispatcher::flush,
             py::call_guard<py::gil_scoped_release>())
        .def("start",       &AuditDispatcher::start)
        .def("stop",        &AuditDispatcher::stop,
             py::call_guard<py::gil_scoped_release>())
        .def("is_running",  &AuditDispatcher::is_running)
        .def("pending",     &AuditDispatcher::pending)
        .def("dropped",     &AuditDispatcher::dropped)
        .def("delivered",   &AuditDispatcher::delivered)
        .def("failed",      &AuditDispatcher::failed)
        .def("set_monitor", &AuditDispatcher::set_monitor, py::arg("monitor"));

    m.def("stdout_audit_sink", []() -> std::shared_ptr<AuditSink> {
        return std::make_shared<StreamAuditSink>(std::cout);
    });
}
