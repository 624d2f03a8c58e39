#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace ipc::codec {

struct Request {
    nlohmann::json id;
    std::string method;
    nlohmann::json params = nlohmann::json::object();
};

/**
 * Parse one request line.
 * @throws sandbox::ProtocolError carrying the best-effort id ("unknown" if none)
 */
Request decode_request(const std::string& line);

const nlohmann::json* find_key(const nlohmann::json& obj, const std::string& key);
std::string as_string(const nlohmann::json& obj, const std::string& fallback = "");
/// True for numbers whose integral part is representable as int64_t.
bool fits_int64(const nlohmann::json& obj);
/// Floats are truncated; values outside the int64_t range yield fallback.
int64_t as_int64(const nlohmann::json& obj, int64_t fallback = 0);

/// Single-line serialization; invalid UTF-8 is replaced rather than thrown on.
std::string dump(const nlohmann::json& value);

std::string encode_result(const nlohmann::json& id, const nlohmann::json& result);
std::string encode_error(const nlohmann::json& id, int code, const std::string& message,
                         const nlohmann::json& data = nullptr);

} // namespace ipc::codec
