#include "agent_config.hpp"

#include <cstring>
#include <stdexcept>
#include <string>

namespace {

bool match_option(const char* arg, const char* name, int& i, int argc, const char* const* argv, std::string& value) {
    const size_t len = std::strlen(name);
    if (std::strncmp(arg, name, len) != 0) {
        return false;
    }
    if (arg[len] == '=') {
        value = arg + len + 1;
        return true;
    }
    if (arg[len] != '\0') {
        return false;
    }
    if (i + 1 >= argc) {
        throw std::invalid_argument(std::string("Missing value for ") + name);
    }
    value = argv[++i];
    return true;
}

long long parse_positive(const std::string& value, const char* name) {
    size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("Invalid value for ") + name + ": " + value);
    }
    if (consumed != value.size() || parsed <= 0) {
        throw std::invalid_argument(std::string("Invalid value for ") + name + ": " + value);
    }
    return parsed;
}

} // namespace

AgentConfig parse_command_line(int argc, const char* const* argv) {
    AgentConfig config;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        std::string value;

        if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--version") == 0) {
            config.show_version = true;
            continue;
        }

        if (std::strcmp(arg, "--pdeathsig") == 0) {
            config.enable_pdeathsig = true;
            continue;
        }

        if (match_option(arg, "--config", i, argc, argv, value)) {
            config.log_config_path = value;
            continue;
        }

        if (match_option(arg, "--shell", i, argc, argv, value)) {
            config.shell = value;
            continue;
        }

        if (match_option(arg, "--claude", i, argc, argv, value)) {
            config.claude_executable = value;
            continue;
        }

        if (match_option(arg, "--workers", i, argc, argv, value)) {
            config.worker_threads = static_cast<size_t>(parse_positive(value, "--workers"));
            continue;
        }

        if (match_option(arg, "--agent-timeout", i, argc, argv, value)) {
            config.agent_timeout = std::chrono::milliseconds(parse_positive(value, "--agent-timeout"));
            if (config.agent_timeout > sandbox::kMaxTimeout) {
                throw std::invalid_argument("Invalid value for --agent-timeout: exceeds " +
                                            std::to_string(sandbox::kMaxTimeout.count()) + "ms");
            }
            continue;
        }

        throw std::invalid_argument(std::string("Unknown option: ") + arg);
    }

    return config;
}
