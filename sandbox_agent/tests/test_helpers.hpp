#pragma once

#include "agent_state.hpp"
#include "workspace_guard.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

/**
 * Scratch directory for one test: base() is a fresh mkdtemp directory, root() is the
 * "workspace" directory inside it, so tests can also place things just outside the root.
 * The base is taken from the build tree or /var/tmp before the system temp directory, so
 * that absolute paths of the workspace are not covered by the command allowlist.
 */
class TempWorkspace {
public:
    TempWorkspace();
    ~TempWorkspace();

    TempWorkspace(const TempWorkspace&) = delete;
    TempWorkspace& operator=(const TempWorkspace&) = delete;

    const std::filesystem::path& base() const { return base_; }
    const std::filesystem::path& root() const { return root_; }

    /// False when only an allowlisted location (such as /tmp) could host the scratch directory.
    bool outside_allowlist() const { return outside_allowlist_; }

    sandbox::WorkspaceGuard guard() const;

    void write(const std::filesystem::path& relative, const std::string& content) const;

private:
    std::filesystem::path base_;
    std::filesystem::path root_;
    bool outside_allowlist_ = false;
};

/// Write an executable /bin/sh script and return its absolute path.
std::filesystem::path write_script(const std::filesystem::path& path, const std::string& body);

std::string read_text(const std::filesystem::path& path);

/// Run one request through the dispatcher and parse the single response line.
nlohmann::json call_method(AgentState& state, const std::string& method,
                           const nlohmann::json& params = nlohmann::json::object(),
                           const nlohmann::json& id = "test-id");

std::string get_error_message(const nlohmann::json& response);
std::string get_error_kind(const nlohmann::json& response);
bool get_success_flag(const nlohmann::json& response);
