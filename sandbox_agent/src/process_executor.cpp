#include "process_executor.hpp"

#include "errors.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <system_error>
#include <thread>

extern char** environ;

namespace sandbox {

namespace {

constexpr int kChildFailureExitCode = 127;

enum class ChildStage : int {
    Chdir = 1,
    Exec = 2,
};

struct ChildFailure {
    ChildStage stage;
    int error_number;
};

class Pipe {
public:
    Pipe() {
        if (::pipe2(fds_, O_CLOEXEC) != 0) {
            int err = errno;
            throw SpawnError(std::string("Failed to create pipe: ") + std::strerror(err), err);
        }
    }

    ~Pipe() {
        close_read();
        close_write();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int read_end() const { return fds_[0]; }
    int write_end() const { return fds_[1]; }

    int release_read() {
        int fd = fds_[0];
        fds_[0] = -1;
        return fd;
    }

    void close_read() {
        if (fds_[0] >= 0) {
            ::close(fds_[0]);
            fds_[0] = -1;
        }
    }

    void close_write() {
        if (fds_[1] >= 0) {
            ::close(fds_[1]);
            fds_[1] = -1;
        }
    }

private:
    int fds_[2] = {-1, -1};
};

Environment base_environment() {
    Environment env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string item(*entry);
        auto eq = item.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        env[item.substr(0, eq)] = item.substr(eq + 1);
    }
    return env;
}

std::string resolve_executable(const std::string& executable, const Environment& env) {
    if (executable.empty()) {
        throw SpawnError("Executable name is empty", ENOENT);
    }
    if (executable.find('/') != std::string::npos) {
        return executable;
    }

    std::string search_path = "/usr/local/bin:/usr/bin:/bin";
    auto it = env.find("PATH");
    if (it != env.end() && !it->second.empty()) {
        search_path = it->second;
    }

    std::stringstream dirs(search_path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        std::string candidate = dir + "/" + executable;
        std::error_code ec;
        if (::access(candidate.c_str(), X_OK) == 0 && std::filesystem::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }

    throw SpawnError("Executable not found in PATH: " + executable, ENOENT);
}

void write_failure(int fd, ChildStage stage) {
    ChildFailure failure{stage, errno};
    ssize_t ignored = ::write(fd, &failure, sizeof(failure));
    (void)ignored;
}

// Runs in the forked child: only async-signal-safe calls from here on.
[[noreturn]] void exec_child(const char* program, char* const* argv, char* const* envp, const char* cwd,
                             int stdout_fd, int stderr_fd, int status_fd) {
    ::setpgid(0, 0);

    sigset_t empty;
    sigemptyset(&empty);
    ::sigprocmask(SIG_SETMASK, &empty, nullptr);
    ::signal(SIGPIPE, SIG_DFL);

    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
        ::dup2(devnull, STDIN_FILENO);
    } else {
        ::close(STDIN_FILENO);
    }
    ::dup2(stdout_fd, STDOUT_FILENO);
    ::dup2(stderr_fd, STDERR_FILENO);

    if (::chdir(cwd) != 0) {
        write_failure(status_fd, ChildStage::Chdir);
        ::_exit(kChildFailureExitCode);
    }

    ::execve(program, argv, envp);
    write_failure(status_fd, ChildStage::Exec);
    ::_exit(kChildFailureExitCode);
}

} // namespace

void ProcessTracker::add(pid_t process_group) {
    std::lock_guard<std::mutex> lock(mutex_);
    groups_.insert(process_group);
}

void ProcessTracker::remove(pid_t process_group) {
    std::lock_guard<std::mutex> lock(mutex_);
    groups_.erase(process_group);
}

size_t ProcessTracker::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return groups_.size();
}

void ProcessTracker::terminate_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (pid_t group : groups_) {
        LOG4CPLUS_INFO(process_logger(), "Killing process group " << group);
        ::kill(-group, SIGKILL);
    }
}

std::unique_ptr<ChildProcess> ChildProcess::spawn(const SpawnOptions& options, ProcessTracker* tracker) {
    Environment merged = base_environment();
    for (const auto& entry : options.environment) {
        merged[entry.first] = entry.second;
    }

    const std::string program = resolve_executable(options.executable, merged);
    const std::string cwd = options.cwd.string();

    // Everything the child needs is built before fork().
    std::vector<std::string> env_strings;
    env_strings.reserve(merged.size());
    for (const auto& entry : merged) {
        env_strings.push_back(entry.first + "=" + entry.second);
    }
    std::vector<char*> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto& item : env_strings) {
        envp.push_back(item.data());
    }
    envp.push_back(nullptr);

    std::vector<std::string> arg_strings;
    arg_strings.reserve(options.arguments.size() + 1);
    arg_strings.push_back(options.executable);
    arg_strings.insert(arg_strings.end(), options.arguments.begin(), options.arguments.end());
    std::vector<char*> argv;
    argv.reserve(arg_strings.size() + 1);
    for (auto& item : arg_strings) {
        argv.push_back(item.data());
    }
    argv.push_back(nullptr);

    Pipe out_pipe;
    Pipe err_pipe;
    Pipe status_pipe;

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        throw SpawnError(std::string("fork failed: ") + std::strerror(err), err);
    }

    if (pid == 0) {
        exec_child(program.c_str(), argv.data(), envp.data(), cwd.c_str(),
                   out_pipe.write_end(), err_pipe.write_end(), status_pipe.write_end());
    }

    ::setpgid(pid, pid);
    out_pipe.close_write();
    err_pipe.close_write();
    status_pipe.close_write();

    ChildFailure failure{};
    ssize_t n;
    do {
        n = ::read(status_pipe.read_end(), &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(failure))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        std::string message = failure.stage == ChildStage::Chdir
            ? "Failed to enter working directory " + cwd
            : "Failed to execute " + options.executable;
        LOG4CPLUS_ERROR(process_logger(), message << ": " << std::strerror(failure.error_number));
        throw SpawnError(message + ": " + std::strerror(failure.error_number), failure.error_number);
    }

    LOG4CPLUS_DEBUG(process_logger(), "Spawned " << program << " pid=" << pid);
    if (tracker) {
        tracker->add(pid);
    }
    return std::unique_ptr<ChildProcess>(
        new ChildProcess(pid, out_pipe.release_read(), err_pipe.release_read(), tracker));
}

ChildProcess::ChildProcess(pid_t pid, int stdout_fd, int stderr_fd, ProcessTracker* tracker)
    : pid_(pid), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd), tracker_(tracker) {}

ChildProcess::~ChildProcess() {
    if (!reaped_) {
        kill(SIGKILL);
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
        mark_reaped();
    }
    close_pipes();
}

void ChildProcess::mark_reaped() {
    reaped_ = true;
    if (tracker_) {
        tracker_->remove(pid_);
    }
}

void ChildProcess::kill(int signal_number) {
    if (reaped_) {
        return;
    }
    if (::kill(-pid_, signal_number) != 0) {
        ::kill(pid_, signal_number);
    }
}

void ChildProcess::close_pipes() {
    if (stdout_fd_ >= 0) {
        ::close(stdout_fd_);
        stdout_fd_ = -1;
    }
    if (stderr_fd_ >= 0) {
        ::close(stderr_fd_);
        stderr_fd_ = -1;
    }
}

bool ChildProcess::drain_pipes(std::chrono::steady_clock::time_point deadline) {
    std::array<char, 8192> buffer{};

    while (stdout_fd_ >= 0 || stderr_fd_ >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return false;
        }

        std::array<pollfd, 2> fds = {{{stdout_fd_, POLLIN, 0}, {stderr_fd_, POLLIN, 0}}};
        int ready = ::poll(fds.data(), fds.size(), static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::system_error(errno, std::generic_category(), "poll failed for pid " + std::to_string(pid_));
        }

        int* targets[2] = {&stdout_fd_, &stderr_fd_};
        std::string* sinks[2] = {&stdout_, &stderr_};
        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            ssize_t got = ::read(fds[i].fd, buffer.data(), buffer.size());
            if (got > 0) {
                sinks[i]->append(buffer.data(), static_cast<size_t>(got));
            } else if (got == 0 || errno != EINTR) {
                ::close(*targets[i]);
                *targets[i] = -1;
            }
        }
    }
    return true;
}

bool ChildProcess::reap(std::chrono::steady_clock::time_point deadline) {
    while (true) {
        int status = 0;
        pid_t result = ::waitpid(pid_, &status, WNOHANG);
        if (result == pid_) {
            mark_reaped();
            if (WIFEXITED(status)) {
                exit_code_ = WEXITSTATUS(status);
            } else {
                if (WIFSIGNALED(status)) {
                    LOG4CPLUS_WARN(process_logger(), "pid " << pid_ << " terminated by signal " << WTERMSIG(status));
                }
                exit_code_ = 1;
            }
            return true;
        }
        if (result < 0 && errno != EINTR) {
            LOG4CPLUS_ERROR(process_logger(), "waitpid failed for pid " << pid_ << ": " << std::strerror(errno));
            mark_reaped();
            exit_code_ = 1;
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

ExecutionResult ChildProcess::wait(std::chrono::milliseconds timeout) {
    timeout = std::clamp(timeout, std::chrono::milliseconds::zero(), kMaxTimeout);
    auto deadline = std::chrono::steady_clock::now() + timeout;

    if (!drain_pipes(deadline) || !reap(deadline)) {
        LOG4CPLUS_WARN(process_logger(), "pid " << pid_ << " exceeded " << timeout.count() << "ms, killing");
        kill(SIGKILL);
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
        mark_reaped();
        close_pipes();
        throw TimeoutError("Command timed out after " + std::to_string(timeout.count()) + "ms", timeout);
    }

    close_pipes();
    ExecutionResult result;
    result.exit_code = exit_code_;
    result.stdout_text = std::move(stdout_);
    result.stderr_text = std::move(stderr_);
    return result;
}

ExecutionResult run_process(const SpawnOptions& options, std::chrono::milliseconds timeout,
                            ProcessTracker* tracker) {
    auto child = ChildProcess::spawn(options, tracker);
    return child->wait(timeout);
}

Environment workspace_environment(const Workspace& workspace, const Environment& overrides) {
    Environment env = overrides;
    env["WORKSPACE"] = workspace.root.string();
    env["HOST_WORKSPACE"] = workspace.host_path;
    env["MAC_WORKSPACE"] = workspace.host_path;
    return env;
}

ExecutionResult execute_command(const WorkspaceGuard& guard, const CommandRequest& request,
                                const std::string& shell, ProcessTracker* tracker) {
    const std::string cwd = request.cwd.empty() ? guard.workspace().root.string() : request.cwd;
    guard.validate_command(request.command, cwd);

    SpawnOptions options;
    options.executable = shell;
    options.arguments = {"-c", request.command};
    options.cwd = guard.validate_path(cwd);
    options.environment = workspace_environment(guard.workspace(), request.env);

    LOG4CPLUS_INFO(process_logger(), "Executing: " << request.command << " in " << options.cwd.string());
    ExecutionResult result = run_process(options, request.timeout, tracker);
    LOG4CPLUS_DEBUG(process_logger(), "Command exited with code " << result.exit_code);
    return result;
}

} // namespace sandbox
