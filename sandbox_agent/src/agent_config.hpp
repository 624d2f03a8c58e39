#pragma once

#include "agent_invoker.hpp"

#include <chrono>
#include <cstddef>
#include <string>

/**
 * Startup options of the agent process.
 */
struct AgentConfig {
    std::string log_config_path = "log4cplus.ini";
    std::string shell = "/bin/bash";
    std::string claude_executable = "claude";
    std::chrono::milliseconds agent_timeout = sandbox::kDefaultAgentTimeout;
    size_t worker_threads = 4;
    bool enable_pdeathsig = false;
    bool show_version = false;
};

/**
 * Fill an AgentConfig from argv. Accepts both "--opt value" and "--opt=value".
 * @throws std::invalid_argument on a malformed or unknown option
 */
AgentConfig parse_command_line(int argc, const char* const* argv);
