#include "errors.hpp"

#include <utility>

namespace sandbox {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Protocol: return "ProtocolError";
        case ErrorKind::Validation: return "ValidationError";
        case ErrorKind::NotFound: return "NotFoundError";
        case ErrorKind::Spawn: return "SpawnError";
        case ErrorKind::Execution: return "ExecutionError";
        case ErrorKind::Timeout: return "TimeoutError";
        case ErrorKind::Internal: return "InternalError";
    }
    return "InternalError";
}

const char* to_string(ValidationError::Reason reason) {
    switch (reason) {
        case ValidationError::Reason::NotConfigured: return "NotConfigured";
        case ValidationError::Reason::InvalidArgument: return "InvalidArgument";
        case ValidationError::Reason::OutsideWorkspace: return "OutsideWorkspace";
        case ValidationError::Reason::PathTraversal: return "PathTraversal";
        case ValidationError::Reason::BlockedCommand: return "BlockedCommand";
        case ValidationError::Reason::CommandOutsideWorkspace: return "CommandOutsideWorkspace";
    }
    return "InvalidArgument";
}

AgentError::AgentError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

nlohmann::json AgentError::details() const {
    return nlohmann::json{{"kind", to_string(kind_)}};
}

ProtocolError::ProtocolError(const std::string& message, nlohmann::json request_id)
    : AgentError(ErrorKind::Protocol, message), request_id_(std::move(request_id)) {}

ValidationError::ValidationError(Reason reason, const std::string& message)
    : AgentError(ErrorKind::Validation, message), reason_(reason) {}

nlohmann::json ValidationError::details() const {
    auto data = AgentError::details();
    data["reason"] = to_string(reason_);
    return data;
}

NotFoundError::NotFoundError(const std::string& message)
    : AgentError(ErrorKind::NotFound, message) {}

SpawnError::SpawnError(const std::string& message, int error_number)
    : AgentError(ErrorKind::Spawn, message), error_number_(error_number) {}

nlohmann::json SpawnError::details() const {
    auto data = AgentError::details();
    data["errno"] = error_number_;
    return data;
}

ExecutionError::ExecutionError(const std::string& message, int exit_code, std::string stderr_text)
    : AgentError(ErrorKind::Execution, message), exit_code_(exit_code), stderr_text_(std::move(stderr_text)) {}

nlohmann::json ExecutionError::details() const {
    auto data = AgentError::details();
    data["exitCode"] = exit_code_;
    data["stderr"] = stderr_text_;
    return data;
}

TimeoutError::TimeoutError(const std::string& message, std::chrono::milliseconds timeout)
    : AgentError(ErrorKind::Timeout, message), timeout_(timeout) {}

nlohmann::json TimeoutError::details() const {
    auto data = AgentError::details();
    data["timeoutMs"] = timeout_.count();
    return data;
}

} // namespace sandbox
