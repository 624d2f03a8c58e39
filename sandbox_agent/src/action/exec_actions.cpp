#include "action_base.hpp"
#include "action_registry.hpp"

#include "../agent_invoker.hpp"
#include "../errors.hpp"
#include "../process_executor.hpp"

#include <limits>
#include <string>

namespace ipc::actions {

class ExecuteCommandAction final : public ActionHandler {
public:
    const char* name() const override { return "executeCommand"; }

    nlohmann::json handle(ActionContext& ctx) override {
        sandbox::CommandRequest request;
        request.command = require_string(ctx, "command");
        if (request.command.empty()) {
            throw sandbox::ValidationError(sandbox::ValidationError::Reason::InvalidArgument, "Command is required");
        }
        request.cwd = optional_string(ctx, "cwd").value_or("");
        request.env = optional_env(ctx, "env");
        if (auto timeout = optional_int(ctx, "timeout"); timeout && *timeout > 0) {
            if (*timeout > sandbox::kMaxTimeout.count()) {
                throw sandbox::ValidationError(sandbox::ValidationError::Reason::InvalidArgument,
                                               "Invalid parameter timeout: must not exceed " +
                                                   std::to_string(sandbox::kMaxTimeout.count()) + "ms");
            }
            request.timeout = std::chrono::milliseconds(*timeout);
        }

        auto guard = ctx.state.guard();
        auto result = sandbox::execute_command(guard, request, ctx.state.config().shell, &ctx.state.processes());
        return nlohmann::json{
            {"code", result.exit_code},
            {"stdout", result.stdout_text},
            {"stderr", result.stderr_text},
        };
    }
};

class RunClaudeCodeAction final : public ActionHandler {
public:
    const char* name() const override { return "runClaudeCode"; }

    nlohmann::json handle(ActionContext& ctx) override {
        sandbox::AgentRequest request;
        request.prompt = require_string(ctx, "prompt");
        request.cwd = optional_string(ctx, "cwd").value_or("");
        request.model = optional_string(ctx, "model");
        if (auto max_turns = optional_int(ctx, "maxTurns")) {
            if (*max_turns > std::numeric_limits<int>::max() || *max_turns < std::numeric_limits<int>::min()) {
                throw sandbox::ValidationError(sandbox::ValidationError::Reason::InvalidArgument,
                                               "Invalid parameter maxTurns: out of range");
            }
            request.max_turns = static_cast<int>(*max_turns);
        }
        request.system_prompt = optional_string(ctx, "systemPrompt");
        request.env = optional_env(ctx, "env");

        const AgentConfig& config = ctx.state.config();
        auto guard = ctx.state.guard();
        auto messages = sandbox::run_agent(guard, request, config.claude_executable, config.agent_timeout,
                                           &ctx.state.processes());
        return nlohmann::json{{"messages", messages}};
    }
};

void register_exec_actions(ActionRegistry& registry) {
    registry.add(std::make_unique<ExecuteCommandAction>());
    registry.add(std::make_unique<RunClaudeCodeAction>());
}

} // namespace ipc::actions
