#pragma once

#include "process_executor.hpp"
#include "workspace_guard.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace sandbox {

constexpr std::chrono::milliseconds kDefaultAgentTimeout{300000};

struct AgentRequest {
    std::string prompt;
    std::string cwd; // empty means the workspace root
    std::optional<std::string> model;
    std::optional<int> max_turns;
    std::optional<std::string> system_prompt;
    Environment env;
};

/// Arguments for a non-interactive CLI run; the prompt is always the last one.
std::vector<std::string> build_agent_arguments(const AgentRequest& request);

/**
 * Turn CLI stdout into messages: each non-empty line that parses as a JSON object is
 * kept as is, anything else becomes {"type":"text","content":line}.
 */
std::vector<nlohmann::json> parse_agent_output(const std::string& output);

/**
 * Run the AI-coding CLI in the workspace and collect its messages.
 * @throws ExecutionError carrying exit code and stderr on a non-zero exit
 */
std::vector<nlohmann::json> run_agent(const WorkspaceGuard& guard, const AgentRequest& request,
                                      const std::string& executable, std::chrono::milliseconds timeout,
                                      ProcessTracker* tracker = nullptr);

} // namespace sandbox
