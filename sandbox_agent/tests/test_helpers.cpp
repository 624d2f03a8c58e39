#include "test_helpers.hpp"

#include "action/action.hpp"
#include "logger.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <fstream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <stdlib.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

class LoggingEnvironment final : public ::testing::Environment {
public:
    void SetUp() override {
        static std::once_flag once;
        std::call_once(once, []() { init_logging(SANDBOX_AGENT_TEST_LOG_CONFIG); });
    }
};

::testing::Environment* const kLoggingEnvironment = ::testing::AddGlobalTestEnvironment(new LoggingEnvironment());

bool under_allowlisted_path(const fs::path& path) {
    for (const char* allowed : {"/usr", "/bin", "/tmp"}) {
        if (sandbox::is_within(allowed, path)) {
            return true;
        }
    }
    return false;
}

// First writable candidate outside the allowlist, otherwise the system temp directory.
fs::path scratch_parent() {
    std::error_code ec;
    fs::create_directories(SANDBOX_AGENT_TEST_SCRATCH_DIR, ec);
    for (const fs::path candidate : {fs::path(SANDBOX_AGENT_TEST_SCRATCH_DIR), fs::path("/var/tmp")}) {
        fs::path resolved = fs::canonical(candidate, ec);
        if (!ec && ::access(resolved.c_str(), W_OK) == 0 && !under_allowlisted_path(resolved)) {
            return resolved;
        }
    }
    return fs::temp_directory_path();
}

} // namespace

TempWorkspace::TempWorkspace() {
    std::string pattern = (scratch_parent() / "sandbox_agent_test.XXXXXX").string();
    if (::mkdtemp(pattern.data()) == nullptr) {
        throw std::system_error(errno, std::generic_category(), "mkdtemp");
    }
    base_ = fs::canonical(pattern);
    outside_allowlist_ = !under_allowlisted_path(base_);
    root_ = base_ / "workspace";
    fs::create_directory(root_);
}

TempWorkspace::~TempWorkspace() {
    std::error_code ec;
    fs::remove_all(base_, ec);
}

sandbox::WorkspaceGuard TempWorkspace::guard() const {
    return sandbox::WorkspaceGuard(sandbox::make_workspace(root_.string(), ""));
}

void TempWorkspace::write(const fs::path& relative, const std::string& content) const {
    fs::path target = root_ / relative;
    fs::create_directories(target.parent_path());
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    out << content;
}

fs::path write_script(const fs::path& path, const std::string& body) {
    fs::create_directories(path.parent_path());
    {
        std::ofstream out(path, std::ios::trunc);
        out << "#!/bin/sh\n" << body << "\n";
    }
    fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec,
                    fs::perm_options::replace);
    return path;
}

std::string read_text(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

nlohmann::json call_method(AgentState& state, const std::string& method, const nlohmann::json& params,
                           const nlohmann::json& id) {
    nlohmann::json request = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
    ipc::Reply reply = ipc::actions::handle_action(request.dump(), state);
    return nlohmann::json::parse(reply.line);
}

std::string get_error_message(const nlohmann::json& response) {
    auto error = response.find("error");
    if (error == response.end() || !error->is_object()) {
        return "";
    }
    return error->value("message", "");
}

std::string get_error_kind(const nlohmann::json& response) {
    auto error = response.find("error");
    if (error == response.end() || !error->is_object()) {
        return "";
    }
    auto data = error->find("data");
    if (data == error->end() || !data->is_object()) {
        return "";
    }
    return data->value("kind", "");
}

bool get_success_flag(const nlohmann::json& response) {
    auto result = response.find("result");
    if (result == response.end() || !result->is_object()) {
        return false;
    }
    return result->value("success", false);
}
