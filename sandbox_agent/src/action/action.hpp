#pragma once

#include "../agent_state.hpp"
#include "../protocol.hpp"

#include <string>

namespace ipc::actions {

/// Decode one request line, dispatch it and encode exactly one response line.
Reply handle_action(const std::string& request_line, AgentState& state);

} // namespace ipc::actions
