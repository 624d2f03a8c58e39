#include "agent_invoker.hpp"

#include "errors.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <sstream>

namespace sandbox {

std::vector<std::string> build_agent_arguments(const AgentRequest& request) {
    std::vector<std::string> args{"--print"};
    if (request.model && !request.model->empty()) {
        args.push_back("--model");
        args.push_back(*request.model);
    }
    if (request.max_turns && *request.max_turns > 0) {
        args.push_back("--max-turns");
        args.push_back(std::to_string(*request.max_turns));
    }
    if (request.system_prompt && !request.system_prompt->empty()) {
        args.push_back("--append-system-prompt");
        args.push_back(*request.system_prompt);
    }
    args.push_back(request.prompt);
    return args;
}

std::vector<nlohmann::json> parse_agent_output(const std::string& output) {
    std::vector<nlohmann::json> messages;
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }

        auto parsed = nlohmann::json::parse(line, nullptr, false);
        if (!parsed.is_discarded() && parsed.is_object()) {
            messages.push_back(std::move(parsed));
        } else {
            messages.push_back({{"type", "text"}, {"content", line}});
        }
    }
    return messages;
}

std::vector<nlohmann::json> run_agent(const WorkspaceGuard& guard, const AgentRequest& request,
                                      const std::string& executable, std::chrono::milliseconds timeout,
                                      ProcessTracker* tracker) {
    if (request.prompt.empty()) {
        throw ValidationError(ValidationError::Reason::InvalidArgument, "Prompt is required");
    }

    const std::string cwd = request.cwd.empty() ? guard.workspace().root.string() : request.cwd;

    SpawnOptions options;
    options.executable = executable;
    options.arguments = build_agent_arguments(request);
    options.cwd = guard.validate_path(cwd);
    options.environment = workspace_environment(guard.workspace(), request.env);

    LOG4CPLUS_INFO(process_logger(), "Running " << executable << " in " << options.cwd.string()
                                                << (request.model ? " model=" + *request.model : std::string()));

    ExecutionResult result = run_process(options, timeout, tracker);
    if (result.exit_code != 0) {
        LOG4CPLUS_WARN(process_logger(), executable << " exited with code " << result.exit_code);
        throw ExecutionError("claude-code exited with code " + std::to_string(result.exit_code) + ": " +
                                 result.stderr_text,
                             result.exit_code, result.stderr_text);
    }

    auto messages = parse_agent_output(result.stdout_text);
    LOG4CPLUS_INFO(process_logger(), executable << " produced " << messages.size() << " messages");
    return messages;
}

} // namespace sandbox
