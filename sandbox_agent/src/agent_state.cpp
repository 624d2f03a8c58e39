#include "agent_state.hpp"

#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <mutex>
#include <utility>

AgentState::AgentState(AgentConfig config)
    : config_(std::move(config)) {}

void AgentState::set_workspace(const std::string& path, const std::string& host_path) {
    sandbox::Workspace next = sandbox::make_workspace(path, host_path);

    std::unique_lock<std::shared_mutex> lock(workspace_mutex_);
    workspace_ = std::move(next);
    LOG4CPLUS_INFO(core_logger(), "Workspace set to: " << workspace_.root.string()
                                  << (workspace_.host_path.empty() ? "" : " (host: " + workspace_.host_path + ")"));
}

sandbox::Workspace AgentState::workspace() const {
    std::shared_lock<std::shared_mutex> lock(workspace_mutex_);
    return workspace_;
}

sandbox::WorkspaceGuard AgentState::guard() const {
    return sandbox::WorkspaceGuard(workspace());
}
