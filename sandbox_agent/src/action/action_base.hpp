#pragma once

#include "../agent_state.hpp"
#include "../process_executor.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace ipc::actions {

struct ActionContext {
	const std::string& method;
	AgentState& state;
	const nlohmann::json& params;
	bool close_after_send = false;
};

class ActionHandler {
public:
	virtual ~ActionHandler() = default;
	virtual const char* name() const = 0;

	/// Returns the JSON-RPC result; failures are thrown as sandbox::AgentError.
	virtual nlohmann::json handle(ActionContext& ctx) = 0;

protected:
	std::string require_string(const ActionContext& ctx, const char* key) const;
	std::optional<std::string> optional_string(const ActionContext& ctx, const char* key) const;
	std::optional<int64_t> optional_int(const ActionContext& ctx, const char* key) const;
	sandbox::Environment optional_env(const ActionContext& ctx, const char* key) const;
	static nlohmann::json success_payload();
};

} // namespace ipc::actions
