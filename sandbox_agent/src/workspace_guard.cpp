#include "workspace_guard.hpp"

#include "errors.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <cstring>
#include <iterator>
#include <regex>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace sandbox {

namespace {

constexpr int kMaxSymlinkDepth = 40;

struct BlockedPattern {
    const char* description;
    std::regex pattern;
};

const std::vector<BlockedPattern>& blocked_patterns() {
    static const std::vector<BlockedPattern> patterns = [] {
        const auto flags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;
        std::vector<BlockedPattern> list;
        list.push_back({"recursive delete of / or home",
                        std::regex(R"(\brm\s+(?:-\S+\s+)*(?:-[a-z]*r[a-z]*|--recursive)\s+(?:-\S+\s+)*["']?(?:/\*?|~[^\s'"]*|\$[{]?HOME[}]?[^\s'"]*)["']?(?:\s|$|[;&|)]))", flags)});
        list.push_back({"raw device write", std::regex(R"(\bdd\b[^|;&]*\bof=/dev/(?!null\b))", flags)});
        list.push_back({"filesystem format", std::regex(R"(\bmkfs(?:\.[a-z0-9]+)?\b)", flags)});
        list.push_back({"redirect into device file", std::regex(R"(>\s*/dev/(?!null\b|stdout\b|stderr\b|fd/))", flags)});
        list.push_back({"remote script piped to shell",
                        std::regex(R"(\b(?:curl|wget)\b.*\|\s*(?:sudo\s+)?(?:ba|z|da)?sh\b)", flags)});
        list.push_back({"privileged delete", std::regex(R"(\bsudo\s+(?:\S+\s+)*rm\b)", flags)});
        list.push_back({"world-writable permissions on absolute path",
                        std::regex(R"(\bchmod\s+(?:-\S+\s+)*(?:0?777|a\+rwx)\s+/)", flags)});
        list.push_back({"ownership change of /", std::regex(R"(\bchown\s+(?:-\S+\s+)*\S+\s+/(?:\s|$|[;&|)]))", flags)});
        return list;
    }();
    return patterns;
}

// rm or rmdir with its arguments up to the next command separator.
const std::regex& delete_command_pattern() {
    static const std::regex pattern(R"(\b(rm|rmdir)\s+([^;&|\n]*))", std::regex::ECMAScript | std::regex::optimize);
    return pattern;
}

bool has_recursive_flag(const std::string& arguments) {
    size_t pos = 0;
    while (pos < arguments.size()) {
        size_t start = arguments.find_first_not_of(" \t", pos);
        if (start == std::string::npos) {
            break;
        }
        size_t end = arguments.find_first_of(" \t", start);
        std::string word = arguments.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (word == "--recursive") {
            return true;
        }
        if (word.size() > 1 && word[0] == '-' && word[1] != '-' && word.find_first_of("rR") != std::string::npos) {
            return true;
        }
        pos = end == std::string::npos ? arguments.size() : end;
    }
    return false;
}

// Read-only system locations a command may name without being inside the workspace.
const fs::path kAllowedSystemPaths[] = {"/usr", "/bin", "/tmp", "/dev/null"};

bool is_token_delimiter(char c) {
    return std::strchr(" \t\r\n=<>|;&()'\"`", c) != nullptr;
}

bool is_segment_boundary(char c) {
    return c == '/' || c == '\\' || c == ':' || is_token_delimiter(c);
}

bool has_parent_segment(const std::string& command) {
    for (size_t pos = command.find(".."); pos != std::string::npos; pos = command.find("..", pos + 1)) {
        bool starts = pos == 0 || is_segment_boundary(command[pos - 1]);
        bool ends = pos + 2 == command.size() || is_segment_boundary(command[pos + 2]);
        if (starts && ends) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> extract_absolute_paths(const std::string& command) {
    std::vector<std::string> tokens;
    size_t i = 0;
    while (i < command.size()) {
        if (command[i] == '/' && (i == 0 || is_token_delimiter(command[i - 1]))) {
            size_t end = i;
            while (end < command.size() && !is_token_delimiter(command[end])) {
                ++end;
            }
            tokens.push_back(command.substr(i, end - i));
            i = end;
            continue;
        }
        ++i;
    }
    return tokens;
}

bool is_allowed_system_path(const std::string& token) {
    fs::path normalized = fs::path(token).lexically_normal();
    for (const auto& allowed : kAllowedSystemPaths) {
        if (is_within(allowed, normalized)) {
            return true;
        }
    }
    return false;
}

} // namespace

bool is_within(const fs::path& root, const fs::path& candidate) {
    if (root.empty() || candidate.empty()) {
        return false;
    }

    auto c = candidate.begin();
    for (auto r = root.begin(); r != root.end(); ++r) {
        if (r->empty()) {
            continue; // trailing separator
        }
        while (c != candidate.end() && c->empty()) {
            ++c;
        }
        if (c == candidate.end() || *r != *c) {
            return false;
        }
        ++c;
    }
    return true;
}

fs::path canonicalize(const fs::path& path) {
    std::error_code ec;
    fs::path current = fs::weakly_canonical(path, ec);
    if (ec) {
        throw ValidationError(ValidationError::Reason::InvalidArgument,
                              "Cannot resolve path " + path.string() + ": " + ec.message());
    }

    // weakly_canonical only follows links that resolve; chase a dangling leaf by hand.
    for (int depth = 0; depth < kMaxSymlinkDepth; ++depth) {
        auto status = fs::symlink_status(current, ec);
        if (ec || !fs::is_symlink(status)) {
            return current;
        }
        fs::path target = fs::read_symlink(current, ec);
        if (ec) {
            throw ValidationError(ValidationError::Reason::InvalidArgument,
                                  "Cannot read symlink " + current.string() + ": " + ec.message());
        }
        fs::path next = target.is_absolute() ? target : current.parent_path() / target;
        current = fs::weakly_canonical(next, ec);
        if (ec) {
            throw ValidationError(ValidationError::Reason::InvalidArgument,
                                  "Cannot resolve path " + next.string() + ": " + ec.message());
        }
    }

    throw ValidationError(ValidationError::Reason::InvalidArgument,
                          "Too many levels of symbolic links: " + path.string());
}

Workspace make_workspace(const std::string& path, const std::string& host_path) {
    if (path.empty()) {
        throw ValidationError(ValidationError::Reason::InvalidArgument, "Workspace path is required");
    }

    std::error_code ec;
    fs::path root = fs::canonical(fs::absolute(path, ec), ec);
    if (ec || !fs::is_directory(root, ec)) {
        throw ValidationError(ValidationError::Reason::InvalidArgument,
                              "Workspace directory does not exist: " + path);
    }

    return Workspace{root, host_path};
}

WorkspaceGuard::WorkspaceGuard(Workspace workspace)
    : workspace_(std::move(workspace)) {}

void WorkspaceGuard::require_configured() const {
    if (!workspace_.configured()) {
        throw ValidationError(ValidationError::Reason::NotConfigured, "Workspace not configured");
    }
}

fs::path WorkspaceGuard::absolute_in_workspace(const std::string& target) const {
    fs::path path(target);
    if (path.is_relative()) {
        return workspace_.root / path;
    }
    return path;
}

fs::path WorkspaceGuard::validate_path(const std::string& target) const {
    require_configured();
    if (target.empty()) {
        throw ValidationError(ValidationError::Reason::InvalidArgument, "Path is required");
    }

    fs::path resolved = canonicalize(absolute_in_workspace(target));
    if (!is_within(workspace_.root, resolved)) {
        LOG4CPLUS_WARN(action_logger(), "Rejected path outside workspace: " << resolved.string());
        throw ValidationError(ValidationError::Reason::OutsideWorkspace,
                              "Path is outside workspace: " + resolved.string());
    }
    return resolved;
}

fs::path WorkspaceGuard::validate_entry(const std::string& target) const {
    require_configured();
    if (target.empty()) {
        throw ValidationError(ValidationError::Reason::InvalidArgument, "Path is required");
    }

    fs::path absolute = absolute_in_workspace(target).lexically_normal();
    if (!absolute.has_filename()) {
        absolute = absolute.parent_path();
    }
    fs::path name = absolute.filename();
    if (name.empty() || name == "." || name == ".." || absolute == absolute.root_path()) {
        return validate_path(target);
    }

    fs::path resolved = canonicalize(absolute.parent_path()) / name;
    if (!is_within(workspace_.root, resolved)) {
        LOG4CPLUS_WARN(action_logger(), "Rejected entry outside workspace: " << resolved.string());
        throw ValidationError(ValidationError::Reason::OutsideWorkspace,
                              "Path is outside workspace: " + resolved.string());
    }
    return resolved;
}

bool WorkspaceGuard::contains(const std::string& target) const {
    if (!workspace_.configured() || target.empty()) {
        return false;
    }
    try {
        return is_within(workspace_.root, canonicalize(absolute_in_workspace(target)));
    } catch (const ValidationError&) {
        return false;
    }
}

void WorkspaceGuard::validate_command(const std::string& command, const std::string& cwd) const {
    validate_path(cwd);

    if (has_parent_segment(command)) {
        throw ValidationError(ValidationError::Reason::PathTraversal, "Path traversal detected in command");
    }

    for (const auto& blocked : blocked_patterns()) {
        if (std::regex_search(command, blocked.pattern)) {
            LOG4CPLUS_WARN(action_logger(), "Blocked command (" << blocked.description << "): "
                                                                << command.substr(0, 100));
            throw ValidationError(ValidationError::Reason::BlockedCommand,
                                  std::string("Potentially dangerous command blocked: ") + blocked.description);
        }
    }

    // The system allowlist covers reading, never removal.
    const auto& deletes = delete_command_pattern();
    for (std::sregex_iterator it(command.begin(), command.end(), deletes), end; it != end; ++it) {
        const std::string arguments = (*it)[2].str();
        if ((*it)[1] == "rm" && !has_recursive_flag(arguments)) {
            continue;
        }
        for (const auto& token : extract_absolute_paths(arguments)) {
            if (!contains(token)) {
                LOG4CPLUS_WARN(action_logger(), "Blocked recursive delete of " << token << ": " << command.substr(0, 100));
                throw ValidationError(ValidationError::Reason::BlockedCommand,
                                      "Potentially dangerous command blocked: recursive delete outside workspace");
            }
        }
    }

    for (const auto& token : extract_absolute_paths(command)) {
        if (is_allowed_system_path(token)) {
            continue;
        }
        if (!contains(token)) {
            throw ValidationError(ValidationError::Reason::CommandOutsideWorkspace,
                                  "Command references path outside workspace: " + token);
        }
    }
}

} // namespace sandbox
