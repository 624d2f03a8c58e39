#include "json_codec.hpp"

#include "errors.hpp"
#include "protocol.hpp"

#include <cmath>
#include <limits>

namespace ipc::codec {

namespace {

bool is_valid_id(const nlohmann::json& id) {
    if (id.is_string()) {
        return !id.get_ref<const std::string&>().empty();
    }
    return id.is_number_integer();
}

} // namespace

Request decode_request(const std::string& line) {
    auto root = nlohmann::json::parse(line, nullptr, false);
    if (root.is_discarded()) {
        throw sandbox::ProtocolError("Parse error: invalid JSON");
    }
    if (!root.is_object()) {
        throw sandbox::ProtocolError("Invalid JSON-RPC request: not an object");
    }

    Request req;
    nlohmann::json best_effort_id = kUnknownRequestId;
    if (auto id_obj = find_key(root, "id"); id_obj && is_valid_id(*id_obj)) {
        req.id = *id_obj;
        best_effort_id = *id_obj;
    }

    const nlohmann::json* version = find_key(root, "jsonrpc");
    if (!version || as_string(*version) != kJsonRpcVersion) {
        throw sandbox::ProtocolError("Invalid JSON-RPC request: jsonrpc must be \"2.0\"", best_effort_id);
    }
    if (req.id.is_null()) {
        throw sandbox::ProtocolError("Invalid JSON-RPC request: missing id", best_effort_id);
    }
    if (auto method_obj = find_key(root, "method")) {
        req.method = as_string(*method_obj, "");
    }
    if (req.method.empty()) {
        throw sandbox::ProtocolError("Invalid JSON-RPC request: missing method", best_effort_id);
    }

    if (auto params_obj = find_key(root, "params"); params_obj && !params_obj->is_null()) {
        if (!params_obj->is_object()) {
            throw sandbox::ProtocolError("Invalid JSON-RPC request: params must be an object", best_effort_id);
        }
        req.params = *params_obj;
    }

    return req;
}

const nlohmann::json* find_key(const nlohmann::json& obj, const std::string& key) {
    if (!obj.is_object()) {
        return nullptr;
    }
    auto it = obj.find(key);
    if (it == obj.end()) {
        return nullptr;
    }
    return &*it;
}

std::string as_string(const nlohmann::json& obj, const std::string& fallback) {
    if (obj.is_string()) {
        return obj.get<std::string>();
    }
    return fallback;
}

bool fits_int64(const nlohmann::json& obj) {
    if (obj.is_number_unsigned()) {
        return obj.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    }
    if (obj.is_number_integer()) {
        return true;
    }
    if (obj.is_number_float()) {
        // 2^63 is exact as a double; the valid range is [-2^63, 2^63).
        double value = obj.get<double>();
        return std::isfinite(value) && value >= -9223372036854775808.0 && value < 9223372036854775808.0;
    }
    return false;
}

int64_t as_int64(const nlohmann::json& obj, int64_t fallback) {
    if (!fits_int64(obj)) {
        return fallback;
    }
    if (obj.is_number_float()) {
        return static_cast<int64_t>(obj.get<double>());
    }
    return obj.get<int64_t>();
}

std::string dump(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string encode_result(const nlohmann::json& id, const nlohmann::json& result) {
    nlohmann::json response = {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"result", result},
    };
    return dump(response);
}

std::string encode_error(const nlohmann::json& id, int code, const std::string& message, const nlohmann::json& data) {
    nlohmann::json error = {
        {"code", code},
        {"message", message},
    };
    if (!data.is_null()) {
        error["data"] = data;
    }
    nlohmann::json response = {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"error", error},
    };
    return dump(response);
}

} // namespace ipc::codec
