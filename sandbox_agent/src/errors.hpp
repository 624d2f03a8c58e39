#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <stdexcept>
#include <string>

namespace sandbox {

enum class ErrorKind {
    Protocol,
    Validation,
    NotFound,
    Spawn,
    Execution,
    Timeout,
    Internal,
};

const char* to_string(ErrorKind kind);

/**
 * Base of every failure a request handler reports on purpose.
 * The dispatcher turns it into a JSON-RPC error object; details() becomes error.data.
 */
class AgentError : public std::runtime_error {
public:
    AgentError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const noexcept { return kind_; }
    virtual nlohmann::json details() const;

private:
    ErrorKind kind_;
};

/// Malformed or incomplete request. Carries the best-effort request id.
class ProtocolError : public AgentError {
public:
    explicit ProtocolError(const std::string& message, nlohmann::json request_id = "unknown");

    const nlohmann::json& request_id() const noexcept { return request_id_; }

private:
    nlohmann::json request_id_;
};

class ValidationError : public AgentError {
public:
    enum class Reason {
        NotConfigured,
        InvalidArgument,
        OutsideWorkspace,
        PathTraversal,
        BlockedCommand,
        CommandOutsideWorkspace,
    };

    ValidationError(Reason reason, const std::string& message);

    Reason reason() const noexcept { return reason_; }
    nlohmann::json details() const override;

private:
    Reason reason_;
};

const char* to_string(ValidationError::Reason reason);

class NotFoundError : public AgentError {
public:
    explicit NotFoundError(const std::string& message);
};

/// The subprocess could not be started at all.
class SpawnError : public AgentError {
public:
    SpawnError(const std::string& message, int error_number);

    int error_number() const noexcept { return error_number_; }
    nlohmann::json details() const override;

private:
    int error_number_;
};

/// The subprocess ran and exited with a non-zero status.
class ExecutionError : public AgentError {
public:
    ExecutionError(const std::string& message, int exit_code, std::string stderr_text);

    int exit_code() const noexcept { return exit_code_; }
    const std::string& stderr_text() const noexcept { return stderr_text_; }
    nlohmann::json details() const override;

private:
    int exit_code_;
    std::string stderr_text_;
};

class TimeoutError : public AgentError {
public:
    TimeoutError(const std::string& message, std::chrono::milliseconds timeout);

    std::chrono::milliseconds timeout() const noexcept { return timeout_; }
    nlohmann::json details() const override;

private:
    std::chrono::milliseconds timeout_;
};

} // namespace sandbox
