#include "action.hpp"

#include "action_base.hpp"
#include "action_registry.hpp"
#include "errors.hpp"
#include "json_codec.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace ipc::actions {

namespace {

const ActionRegistry& get_registry() {
	static const ActionRegistry registry = [] {
		ActionRegistry reg;
		register_workspace_actions(reg);
		register_file_actions(reg);
		register_exec_actions(reg);

		std::string names;
		for (const auto& method : reg.methods()) {
			names += names.empty() ? method : ", " + method;
		}
		LOG4CPLUS_DEBUG(action_logger(), "Registered " << reg.size() << " methods: " << names);
		return reg;
	}();

	return registry;
}

nlohmann::json kind_payload(sandbox::ErrorKind kind) {
	return nlohmann::json{{"kind", sandbox::to_string(kind)}};
}

std::string invalid_param(const char* key, const char* expected) {
	return std::string("Invalid parameter ") + key + ": expected " + expected;
}

} // namespace

std::string ActionHandler::require_string(const ActionContext& ctx, const char* key) const {
	const nlohmann::json* value = ipc::codec::find_key(ctx.params, key);
	if (!value || value->is_null()) {
		throw sandbox::ProtocolError(std::string("Missing required parameter: ") + key);
	}
	if (!value->is_string()) {
		throw sandbox::ProtocolError(invalid_param(key, "string"));
	}
	return value->get<std::string>();
}

std::optional<std::string> ActionHandler::optional_string(const ActionContext& ctx, const char* key) const {
	const nlohmann::json* value = ipc::codec::find_key(ctx.params, key);
	if (!value || value->is_null()) {
		return std::nullopt;
	}
	if (!value->is_string()) {
		throw sandbox::ProtocolError(invalid_param(key, "string"));
	}
	return value->get<std::string>();
}

std::optional<int64_t> ActionHandler::optional_int(const ActionContext& ctx, const char* key) const {
	const nlohmann::json* value = ipc::codec::find_key(ctx.params, key);
	if (!value || value->is_null()) {
		return std::nullopt;
	}
	if (!value->is_number()) {
		throw sandbox::ProtocolError(invalid_param(key, "number"));
	}
	if (!ipc::codec::fits_int64(*value)) {
		throw sandbox::ProtocolError(invalid_param(key, "64-bit integer"));
	}
	return ipc::codec::as_int64(*value);
}

sandbox::Environment ActionHandler::optional_env(const ActionContext& ctx, const char* key) const {
	sandbox::Environment env;
	const nlohmann::json* value = ipc::codec::find_key(ctx.params, key);
	if (!value || value->is_null()) {
		return env;
	}
	if (!value->is_object()) {
		throw sandbox::ProtocolError(invalid_param(key, "object"));
	}
	for (auto it = value->begin(); it != value->end(); ++it) {
		if (it.value().is_string()) {
			env[it.key()] = it.value().get<std::string>();
		} else if (it.value().is_primitive() && !it.value().is_null()) {
			env[it.key()] = it.value().dump();
		} else if (!it.value().is_null()) {
			throw sandbox::ProtocolError(invalid_param(key, "string values"));
		}
	}
	return env;
}

nlohmann::json ActionHandler::success_payload() {
	return nlohmann::json{{"success", true}};
}

Reply handle_action(const std::string& request_line, AgentState& state) {
	Reply reply;

	ipc::codec::Request request;
	try {
		request = ipc::codec::decode_request(request_line);
	} catch (const sandbox::ProtocolError& exc) {
		LOG4CPLUS_ERROR(action_logger(), "Decode error: " << exc.what());
		reply.line = ipc::codec::encode_error(exc.request_id(), kServerErrorCode, exc.what(), exc.details());
		return reply;
	}

	LOG4CPLUS_INFO(action_logger(), "Request: " << request.method << " id=" << ipc::codec::dump(request.id));

	if (state.is_shutting_down()) {
		LOG4CPLUS_WARN(action_logger(), request.method << " rejected, agent is shutting down");
		reply.line = ipc::codec::encode_error(request.id, kServerErrorCode, "Agent is shutting down",
		                                      kind_payload(sandbox::ErrorKind::Internal));
		return reply;
	}

	ActionHandler* handler = get_registry().find(request.method);
	if (!handler) {
		LOG4CPLUS_WARN(action_logger(), "Unknown method: " << request.method);
		reply.line = ipc::codec::encode_error(request.id, kServerErrorCode, "Unknown method: " + request.method,
		                                      kind_payload(sandbox::ErrorKind::Protocol));
		return reply;
	}

	ActionContext ctx{request.method, state, request.params};
	try {
		nlohmann::json result = handler->handle(ctx);
		reply.line = ipc::codec::encode_result(request.id, result);
		reply.close_after_send = ctx.close_after_send;
	} catch (const sandbox::AgentError& exc) {
		LOG4CPLUS_WARN(action_logger(), request.method << " failed (" << sandbox::to_string(exc.kind()) << "): " << exc.what());
		reply.line = ipc::codec::encode_error(request.id, kServerErrorCode, exc.what(), exc.details());
	} catch (const std::exception& exc) {
		LOG4CPLUS_ERROR(action_logger(), request.method << " failed: " << exc.what());
		reply.line = ipc::codec::encode_error(request.id, kServerErrorCode, exc.what(),
		                                      kind_payload(sandbox::ErrorKind::Internal));
	} catch (...) {
		LOG4CPLUS_ERROR(action_logger(), request.method << " failed with a non-standard exception");
		reply.line = ipc::codec::encode_error(request.id, kServerErrorCode, "Internal error",
		                                      kind_payload(sandbox::ErrorKind::Internal));
	}

	return reply;
}

} // namespace ipc::actions
