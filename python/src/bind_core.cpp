#include "bind_forward.hpp"
#include <agentgate/agentgate.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

using namespace agentgate;

// ---------------------------------------------------------------------------
// Wrapper for std::future<InferenceResponse>
// ---------------------------------------------------------------------------
struct FutureInferenceResponse {
    std::future<InferenceResponse> fut;

    InferenceResponse result() {
        py::gil_scoped_release release;
        return fut.get();
    }

    bool ready() const {
        return fut.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }
};

// ---------------------------------------------------------------------------
// bind_core  --  tokens, credentials, ledger, gateway
// ---------------------------------------------------------------------------
void bind_core(py::module_& m) {

    // ===================================================================
    // TokenValidator
    // ===================================================================
    py::class_<TokenValidator, std::shared_ptr<TokenValidator>>(m, "TokenValidator")
        .def(py::init<TokenConfig>(), py::arg("config"))
        .def("mint", &TokenValidator::mint,
             py::arg("agent_id"), py::arg("name"), py::arg("scopes"),
             py::arg("expires_at") = std::nullopt)
        .def("rotate",       &TokenValidator::rotate, py::arg("agent_id"))
        .def("revoke",       &TokenValidator::revoke, py::arg("token"))
        .def("revoke_agent", &TokenValidator::revoke_agent, py::arg("agent_id"))
        .def("validate",     &TokenValidator::validate, py::arg("token"),
             py::call_guard<py::gil_scoped_release>())
        .def("clear_cache",  &TokenValidator::clear_cache)
        .def("cache_size",   &TokenValidator::cache_size)
        .def("set_monitor",  &TokenValidator::set_monitor, py::arg("monitor"));

    // ===================================================================
    // CredentialVault
    // ===================================================================
    py::enum_<VaultStatus>(m, "VaultStatus")
        .value("Ok",               VaultStatus::Ok)
        .value("NotFound",         VaultStatus::NotFound)
        .value("Unavailable",      VaultStatus::Unavailable)
        .value("DecryptionFailed", VaultStatus::DecryptionFailed)
        .export_values();

    py::class_<CredentialVault, std::shared_ptr<CredentialVault>>(m, "CredentialVault")
        // Master key as base64 of 32 bytes
        .def(py::init([](const std::string& master_key) {
                 return std::make_shared<CredentialVault>(
                     crypto::SecretCipher(crypto::base64_decode(master_key)));
             }),
             py::arg("master_key"))
        .def_static("from_env", [](const std::string& variable) {
                 return std::make_shared<CredentialVault>(
                     crypto::SecretCipher::from_env(variable.c_str()));
             },
             py::arg("variable") = std::string(crypto::MASTER_KEY_ENV_VAR))
        .def("register_credential", &CredentialVault::register_credential,
             py::arg("provider_id"), py::arg("secret"))
        .def("remove_credential",    &CredentialVault::remove_credential,
             py::arg("provider_id"))
        .def("registered_providers", &CredentialVault::registered_providers)
        // Plaintext never crosses into Python; only the status and masked form
        .def("probe", [](const CredentialVault& self, const ProviderId& provider_id) {
                 auto lookup = self.decrypt(provider_id);
                 std::string masked = lookup.credential ? lookup.credential->masked() : "";
                 return py::make_tuple(lookup.status, masked);
             },
             py::arg("provider_id"))
        .def("set_monitor", &CredentialVault::set_monitor, py::arg("monitor"));

    // ===================================================================
    // TokenTranslator
    // ===================================================================
    py::enum_<TranslationStatus>(m, "TranslationStatus")
        .value("Ok",                TranslationStatus::Ok)
        .value("NoProviderBinding", TranslationStatus::NoProviderBinding)
        .value("VaultUnavailable",  TranslationStatus::VaultUnavailable)
        .export_values();

    py::class_<TokenTranslator, std::shared_ptr<TokenTranslator>>(m, "TokenTranslator")
        .def(py::init<std::shared_ptr<CredentialVault>>(), py::arg("vault"))
        .def("bind",            &TokenTranslator::bind,
             py::arg("agent_id"), py::arg("provider_id"))
        .def("unbind",          &TokenTranslator::unbind,
             py::arg("agent_id"), py::arg("provider_id"))
        .def("unbind_all",      &TokenTranslator::unbind_all, py::arg("agent_id"))
        .def("is_bound",        &TokenTranslator::is_bound,
             py::arg("agent_id"), py::arg("provider_id"))
        .def("bound_providers", &TokenTranslator::bound_providers, py::arg("agent_id"))
        .def("translate_status", [](const TokenTranslator& self, const AgentId& agent_id,
                                    const ProviderId& provider_id) {
                 return self.translate(agent_id, provider_id).status;
             },
             py::arg("agent_id"), py::arg("provider_id"));

    // ===================================================================
    // BudgetLedger
    // ===================================================================
    py::class_<BudgetLedger, std::shared_ptr<BudgetLedger>>(m, "BudgetLedger")
        .def(py::init<LedgerConfig>(), py::arg("config") = LedgerConfig{})

        // ------------- Accounts -------------
        .def("open_account",  &BudgetLedger::open_account,
             py::arg("agent_id"), py::arg("limit"), py::arg("spent") = 0)
        .def("set_limit",     &BudgetLedger::set_limit,
             py::arg("agent_id"), py::arg("limit"))
        .def("close_account", &BudgetLedger::close_account, py::arg("agent_id"))
        .def("snapshot",      &BudgetLedger::snapshot, py::arg("agent_id"))
        .def("remaining",     &BudgetLedger::remaining, py::arg("agent_id"))

        // ------------- Reservations -------------
        .def("reserve", &BudgetLedger::reserve,
             py::arg("agent_id"), py::arg("estimated_cost"),
             py::call_guard<py::gil_scoped_release>())
        .def("commit",  &BudgetLedger::commit,
             py::arg("reservation_id"), py::arg("actual_cost"),
             py::call_guard<py::gil_scoped_release>())
        .def("release", &BudgetLedger::release,
             py::arg("reservation_id"),
             py::call_guard<py::gil_scoped_release>())
        .def("find_reservation", &BudgetLedger::find_reservation,
             py::arg("reservation_id"))

        // ------------- Expiry / Lifecycle -------------
        .def("sweep",       &BudgetLedger::sweep)
        .def("start",       &BudgetLedger::start)
        .def("stop",        &BudgetLedger::stop,
             py::call_guard<py::gil_scoped_release>())
        .def("is_running",  &BudgetLedger::is_running)
        .def("set_monitor", &BudgetLedger::set_monitor, py::arg("monitor"));

    // ===================================================================
    // Gateway
    // ===================================================================
    py::class_<InferenceRequest>(m, "InferenceRequest")
        .def(py::init<>())
        .def_readwrite("bearer_token",           &InferenceRequest::bearer_token)
        .def_readwrite("capability",             &InferenceRequest::capability)
        .def_readwrite("payload",                &InferenceRequest::payload)
        .def_readwrite("estimated_input_tokens", &InferenceRequest::estimated_input_tokens)
        .def_readwrite("max_output_tokens",      &InferenceRequest::max_output_tokens)
        .def_readwrite("endpoint",               &InferenceRequest::endpoint)
        .def("set_timeout", [](InferenceRequest& self, Duration timeout) {
                 self.deadline = Clock::now() + timeout;
             },
             py::arg("timeout"));

    py::class_<InferenceResponse>(m, "InferenceResponse")
        .def(py::init<>())
        .def_readwrite("status",           &InferenceResponse::status)
        .def_readwrite("request_id",       &InferenceResponse::request_id)
        .def_readwrite("body",             &InferenceResponse::body)
        .def_readwrite("provider_id",      &InferenceResponse::provider_id)
        .def_readwrite("model",            &InferenceResponse::model)
        .def_readwrite("actual_cost",      &InferenceResponse::actual_cost)
        .def_readwrite("remaining_budget", &InferenceResponse::remaining_budget)
        .def_readwrite("retry_after",      &InferenceResponse::retry_after)
        .def_readwrite("attempts",         &InferenceResponse::attempts)
        .def_readwrite("message",          &InferenceResponse::message)
        .def("ok", &InferenceResponse::ok)
        .def("__repr__", [](const InferenceResponse& r) {
            return "<InferenceResponse request=" + std::to_string(r.request_id)
                 + " status=" + std::string(to_string(r.status))
                 + " provider='" + r.provider_id + "'>";
        });

    py::class_<FutureInferenceResponse>(m, "FutureInferenceResponse")
        .def("result", &FutureInferenceResponse::result,
             "Block until the response is available (releases the GIL while waiting).")
        .def("ready",  &FutureInferenceResponse::ready,
             "Return True if the response is available without blocking.");

    py::class_<GatewayComponents>(m, "GatewayComponents")
        .def(py::init<>())
        .def_readwrite("validator",    &GatewayComponents::validator)
        .def_readwrite("translator",   &GatewayComponents::translator)
        .def_readwrite("ledger",       &GatewayComponents::ledger)
        .def_readwrite("breakers",     &GatewayComponents::breakers)
        .def_readwrite("selector",     &GatewayComponents::selector)
        .def_readwrite("rate_limiter", &GatewayComponents::rate_limiter)
        .def_readwrite("providers",    &GatewayComponents::providers)
        .def_readwrite("pricing",      &GatewayComponents::pricing)
        .def_readwrite("audit",        &GatewayComponents::audit);

    py::class_<Gateway, std::shared_ptr<Gateway>>(m, "Gateway")
        .def(py::init<Config, GatewayComponents>(),
             py::arg("config"), py::arg("components"))
        .def("handle", &Gateway::handle, py::arg("request"),
             py::call_guard<py::gil_scoped_release>())
        .def("submit",
             [](Gateway& self, InferenceRequest request) {
                 return FutureInferenceResponse{self.submit(std::move(request))};
             },
             py::arg("request"))
        .def("start",       &Gateway::start)
        .def("stop",        &Gateway::stop,
             py::call_guard<py::gil_scoped_release>())
        .def("is_running",  &Gateway::is_running)
        .def("set_monitor", &Gateway::set_monitor, py::arg("monitor"));
}
