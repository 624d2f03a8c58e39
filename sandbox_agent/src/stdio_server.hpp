#pragma once

#include "protocol.hpp"

#include <atomic>
#include <cstddef>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace ipc {

class StdioServer {
public:
    /// Turns one request line into one response line. Must not throw for per-request failures.
    using RequestHandler = std::function<Reply(const std::string& request_line)>;

    /// Lines longer than this are discarded and answered with a protocol error.
    static constexpr size_t kMaxLineBytes = 64 * 1024 * 1024;

    /**
     * Construct a line-delimited server over a pair of descriptors.
     *
     * @param input_fd Descriptor requests are read from (stdin in production)
     * @param output_fd Descriptor responses are written to (stdout in production)
     * @param handler Request handler, called on worker threads
     * @param thread_pool_size Number of worker threads handling requests concurrently
     */
    StdioServer(int input_fd, int output_fd, RequestHandler handler, size_t thread_pool_size = 4);
    ~StdioServer();

    StdioServer(const StdioServer&) = delete;
    StdioServer& operator=(const StdioServer&) = delete;

    /// Read and dispatch until the input closes or stop() is called. Blocks the caller.
    bool run();

    /// Stop reading and drop any response not yet written. Safe from any thread.
    void stop();

    bool is_running() const { return running_.load(); }

private:
    void dispatch_line(std::string line);
    void wake();
    void worker_thread_func();
    bool send_response(const std::string& line);
    void start_workers();
    void join_workers();

    int input_fd_;
    int output_fd_;
    RequestHandler handler_;
    size_t thread_pool_size_;
    int wake_fds_[2] = {-1, -1};
    std::atomic<bool> running_{false};
    std::atomic<bool> accepting_output_{true};

    // Thread pool members
    std::vector<std::thread> worker_threads_;
    std::queue<std::string> task_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    bool pool_running_ = false;

    std::mutex write_mutex_;
};

} // namespace ipc
