#pragma once

#include "agentgate/types.hpp"
#include <stdexcept>
#include <string>

namespace agentgate {

class AgentGateException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class AgentNotFoundException : public AgentGateException {
public:
    explicit AgentNotFoundException(const AgentId& id)
        : AgentGateException("Agent not found: " + id)
        , agent_id_(id) {}

    const AgentId& agent_id() const noexcept { return agent_id_; }

private:
    AgentId agent_id_;
};

class AgentAlreadyRegisteredException : public AgentGateException {
public:
    explicit AgentAlreadyRegisteredException(const AgentId& id)
        : AgentGateException("Agent already registered: " + id)
        , agent_id_(id) {}

    const AgentId& agent_id() const noexcept { return agent_id_; }

private:
    AgentId agent_id_;
};

class ProviderNotFoundException : public AgentGateException {
public:
    explicit ProviderNotFoundException(const ProviderId& id)
        : AgentGateException("Provider not found: " + id)
        , provider_id_(id) {}

    const ProviderId& provider_id() const noexcept { return provider_id_; }

private:
    ProviderId provider_id_;
};

class InvalidRequestException : public AgentGateException {
public:
    using AgentGateException::AgentGateException;
};

class InvalidConfigException : public AgentGateException {
public:
    using AgentGateException::AgentGateException;
};

class CryptoException : public AgentGateException {
public:
    using AgentGateException::AgentGateException;
};

// Thrown by CredentialStore backends when the backing store cannot be reached
class VaultUnavailableException : public AgentGateException {
public:
    using AgentGateException::AgentGateException;
};

// Thrown by LedgerStore backends when persistence fails
class LedgerStoreException : public AgentGateException {
public:
    using AgentGateException::AgentGateException;
};

// Thrown by AuditSink implementations when an event cannot be delivered
class AuditSinkException : public AgentGateException {
public:
    using AgentGateException::AgentGateException;
};

// Thrown by HttpTransport implementations on connection-level failures
class TransportException : public AgentGateException {
public:
    using AgentGateException::AgentGateException;
};

class QueueFullException : public AgentGateException {
public:
    QueueFullException()
        : AgentGateException("Request queue is full") {}
};

} // namespace agentgate
