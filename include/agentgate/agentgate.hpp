#pragma once

// AgentGate: credential-isolating, budget-enforcing gateway between
// autonomous agents and LLM providers.

// Core
#include "agentgate/types.hpp"
#include "agentgate/exceptions.hpp"
#include "agentgate/config.hpp"
#include "agentgate/retry_policy.hpp"
#include "agentgate/monitor.hpp"

// Identity and secrets
#include "agentgate/crypto.hpp"
#include "agentgate/credential_vault.hpp"
#include "agentgate/token_validator.hpp"
#include "agentgate/token_translator.hpp"

// Spend
#include "agentgate/pricing.hpp"
#include "agentgate/budget_ledger.hpp"

// Provider access
#include "agentgate/circuit_breaker.hpp"
#include "agentgate/policy.hpp"
#include "agentgate/fallback_selector.hpp"
#include "agentgate/rate_limiter.hpp"
#include "agentgate/provider.hpp"
#include "agentgate/httplib_transport.hpp"

// Orchestration
#include "agentgate/audit.hpp"
#include "agentgate/worker_pool.hpp"
#include "agentgate/gateway.hpp"
