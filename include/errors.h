#pragma once

#include <stdexcept>
#include <string>

namespace neurax {

// Error kinds carried by a failed session and by the exceptions below
enum class ErrorKind {
    CONNECTION,
    CONNECTION_TIMEOUT,
    KEY_EXCHANGE,
    INTEGRITY,
    DECODE,
    NOT_READY,
    PROTOCOL,
    SANDBOX_UNAVAILABLE,
    EXECUTION_TIMEOUT
};

std::string error_kind_name(ErrorKind kind);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Relay unreachable after the bounded initial attempts
class ConnectionError : public Error {
public:
    explicit ConnectionError(const std::string& message)
        : Error(ErrorKind::CONNECTION, "Connection error: " + message) {}
};

// Local readiness or result wait exceeded
class ConnectionTimeoutError : public Error {
public:
    explicit ConnectionTimeoutError(const std::string& message)
        : Error(ErrorKind::CONNECTION_TIMEOUT, "Connection timeout: " + message) {}
};

// Asymmetric decryption of the session key failed
class KeyExchangeError : public Error {
public:
    explicit KeyExchangeError(const std::string& message)
        : Error(ErrorKind::KEY_EXCHANGE, "Key exchange failed: " + message) {}
};

// Authenticated decryption failed (tampered or corrupted payload)
class IntegrityError : public Error {
public:
    explicit IntegrityError(const std::string& message)
        : Error(ErrorKind::INTEGRITY, "Integrity check failed: " + message) {}
};

// Malformed encoding or message
class DecodeError : public Error {
public:
    explicit DecodeError(const std::string& message)
        : Error(ErrorKind::DECODE, "Decode error: " + message) {}
};

// Seal/unseal before the session key exists
class NotReadyError : public Error {
public:
    explicit NotReadyError(const std::string& message)
        : Error(ErrorKind::NOT_READY, "Not ready: " + message) {}
};

// Message not allowed in the session's current state
class ProtocolError : public Error {
public:
    explicit ProtocolError(const std::string& message)
        : Error(ErrorKind::PROTOCOL, "Protocol violation: " + message) {}
};

// Isolation runtime missing; converted to a degraded result by the executor
class SandboxUnavailableError : public Error {
public:
    explicit SandboxUnavailableError(const std::string& message)
        : Error(ErrorKind::SANDBOX_UNAVAILABLE, "Sandbox unavailable: " + message) {}
};

// Task exceeded its budget; converted to a result with the reserved exit code
class ExecutionTimeoutError : public Error {
public:
    explicit ExecutionTimeoutError(const std::string& message)
        : Error(ErrorKind::EXECUTION_TIMEOUT, "Execution timeout: " + message) {}
};

} // namespace neurax
