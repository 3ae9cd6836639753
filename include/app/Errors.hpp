#pragma once
#include <stdexcept>
#include <string>

namespace vigil::app {

struct AgentError : public std::runtime_error { using std::runtime_error::runtime_error; };

// Missing or invalid configuration
struct ConfigError : public AgentError { using AgentError::AgentError; };

// Server refused or could not process registration
struct RegistrationError : public AgentError { using AgentError::AgentError; };

// Transport-level HTTP failure (DNS, connect, timeout)
struct TransportError : public AgentError { using AgentError::AgentError; };

} // namespace vigil::app
