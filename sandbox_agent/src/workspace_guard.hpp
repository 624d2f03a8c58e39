#pragma once

#include <filesystem>
#include <string>

namespace sandbox {

/**
 * The directory tree an agent instance may touch.
 * root is canonical (symlinks resolved); host_path is the host's view of the same
 * directory and is only passed through to child processes.
 */
struct Workspace {
    std::filesystem::path root;
    std::string host_path;

    bool configured() const { return !root.empty(); }
};

/**
 * Build a Workspace from a setWorkspace request.
 * @throws ValidationError if path is empty or is not an existing directory
 */
Workspace make_workspace(const std::string& path, const std::string& host_path);

/// Segment-wise containment: true if candidate is root or lies below it.
bool is_within(const std::filesystem::path& root, const std::filesystem::path& candidate);

/// Lexically normalize and canonicalize every existing prefix, following a dangling leaf symlink.
std::filesystem::path canonicalize(const std::filesystem::path& path);

class WorkspaceGuard {
public:
    explicit WorkspaceGuard(Workspace workspace);

    const Workspace& workspace() const { return workspace_; }

    /**
     * Resolve target (relative paths are taken from the workspace root) to its canonical
     * form and require it to stay inside the workspace.
     * @throws ValidationError (NotConfigured, InvalidArgument, OutsideWorkspace)
     */
    std::filesystem::path validate_path(const std::string& target) const;

    /// Like validate_path, but the last component is not dereferenced if it is a symlink.
    std::filesystem::path validate_entry(const std::string& target) const;

    /**
     * Check a shell command before it is run from cwd.
     *
     * This is a textual heuristic over the command string, not a sandbox: it sees literal
     * paths, ~ and $HOME, but not paths built at run time (other variables, command
     * substitution, eval, scripts). Recursive rm and rmdir of any absolute path outside the
     * workspace is refused, including the read-only system locations other commands may name.
     * @throws ValidationError (PathTraversal, BlockedCommand, CommandOutsideWorkspace, ...)
     */
    void validate_command(const std::string& command, const std::string& cwd) const;

    /// Non-throwing check used for absolute-path tokens found in command text.
    bool contains(const std::string& target) const;

private:
    void require_configured() const;
    std::filesystem::path absolute_in_workspace(const std::string& target) const;

    Workspace workspace_;
};

} // namespace sandbox
