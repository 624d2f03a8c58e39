#pragma once

#include "agent_config.hpp"
#include "process_executor.hpp"
#include "workspace_guard.hpp"

#include <atomic>
#include <shared_mutex>
#include <string>

/**
 * Process-wide agent state, passed to every action handler.
 *
 * The workspace is read by every confined request and written only by setWorkspace.
 * Handlers take one snapshot (guard()) at entry and validate against it for the whole
 * request; reconfiguring while requests are in flight is not coordinated beyond that,
 * so the host is expected to serialize setWorkspace with outstanding work.
 */
class AgentState {
public:
    explicit AgentState(AgentConfig config = {});

    const AgentConfig& config() const { return config_; }

    /// @throws sandbox::ValidationError, leaving the previous workspace in place
    void set_workspace(const std::string& path, const std::string& host_path);

    sandbox::Workspace workspace() const;
    sandbox::WorkspaceGuard guard() const;

    bool is_shutting_down() const { return shutting_down_.load(); }
    void begin_shutdown() { shutting_down_.store(true); }

    sandbox::ProcessTracker& processes() { return processes_; }

private:
    AgentConfig config_;

    mutable std::shared_mutex workspace_mutex_;
    sandbox::Workspace workspace_;

    std::atomic<bool> shutting_down_{false};
    sandbox::ProcessTracker processes_;
};
