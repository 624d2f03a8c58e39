#pragma once

#include "workspace_guard.hpp"

#include <sys/types.h>

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace sandbox {

constexpr std::chrono::milliseconds kDefaultCommandTimeout{60000};

/// Upper bound for any child timeout; larger values are clamped by ChildProcess::wait.
constexpr std::chrono::milliseconds kMaxTimeout{24 * 60 * 60 * 1000};

using Environment = std::map<std::string, std::string>;

struct ExecutionResult {
    int exit_code = 1;
    std::string stdout_text;
    std::string stderr_text;
};

struct SpawnOptions {
    std::string executable;             // absolute, or searched in PATH of the merged environment
    std::vector<std::string> arguments; // not including argv[0]
    std::filesystem::path cwd;
    Environment environment;            // overlaid on the agent's own environment
};

/**
 * Registry of live child process groups, so the lifecycle controller can kill
 * everything still running when the agent exits.
 */
class ProcessTracker {
public:
    void add(pid_t process_group);
    void remove(pid_t process_group);
    size_t size() const;
    void terminate_all();

private:
    mutable std::mutex mutex_;
    std::unordered_set<pid_t> groups_;
};

/**
 * One spawned process. Owns the pid and the read ends of its stdout/stderr pipes.
 * The child leads its own process group; kill() and the destructor signal the whole group.
 */
class ChildProcess {
public:
    /// @throws SpawnError when the executable cannot be started
    static std::unique_ptr<ChildProcess> spawn(const SpawnOptions& options, ProcessTracker* tracker = nullptr);

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /**
     * Accumulate output until the child exits and both pipes are drained.
     * timeout is clamped to [0, kMaxTimeout].
     * @throws TimeoutError after killing the process group when the deadline passes
     */
    ExecutionResult wait(std::chrono::milliseconds timeout);

    void kill(int signal_number);

private:
    ChildProcess(pid_t pid, int stdout_fd, int stderr_fd, ProcessTracker* tracker);

    bool drain_pipes(std::chrono::steady_clock::time_point deadline);
    bool reap(std::chrono::steady_clock::time_point deadline);
    void close_pipes();
    void mark_reaped();

    pid_t pid_;
    int stdout_fd_;
    int stderr_fd_;
    ProcessTracker* tracker_;
    bool reaped_ = false;
    int exit_code_ = 1;
    std::string stdout_;
    std::string stderr_;
};

/// Spawn, wait with timeout, and return the collected result.
ExecutionResult run_process(const SpawnOptions& options, std::chrono::milliseconds timeout,
                            ProcessTracker* tracker = nullptr);

struct CommandRequest {
    std::string command;
    std::string cwd; // empty means the workspace root
    Environment env;
    std::chrono::milliseconds timeout = kDefaultCommandTimeout;
};

/// Environment variables exposing the workspace to child processes.
Environment workspace_environment(const Workspace& workspace, const Environment& overrides);

/**
 * Validate and run a shell command inside the workspace.
 * @throws ValidationError before anything is spawned if the command is rejected
 */
ExecutionResult execute_command(const WorkspaceGuard& guard, const CommandRequest& request,
                                const std::string& shell, ProcessTracker* tracker = nullptr);

} // namespace sandbox
