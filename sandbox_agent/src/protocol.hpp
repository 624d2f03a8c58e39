#pragma once

#include <string>

namespace ipc {

constexpr const char* kJsonRpcVersion = "2.0";

/// Every failure, including unknown methods, is reported with this code.
constexpr int kServerErrorCode = -32000;

constexpr const char* kUnknownRequestId = "unknown";

/// One encoded response line (without the trailing newline) for the transport to write.
struct Reply {
    std::string line;
    bool close_after_send = false; // stop reading once this line has been written
};

} // namespace ipc
