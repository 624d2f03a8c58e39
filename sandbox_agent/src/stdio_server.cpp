#include "stdio_server.hpp"

#include "errors.hpp"
#include "json_codec.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace ipc {

namespace {

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

std::string oversized_line_error() {
    return codec::encode_error(kUnknownRequestId, kServerErrorCode, "Request line too large",
                               {{"kind", sandbox::to_string(sandbox::ErrorKind::Protocol)}});
}

} // namespace

StdioServer::StdioServer(int input_fd, int output_fd, RequestHandler handler, size_t thread_pool_size)
    : input_fd_(input_fd),
      output_fd_(output_fd),
      handler_(std::move(handler)),
      thread_pool_size_(thread_pool_size > 0 ? thread_pool_size : 4) {
    if (::pipe2(wake_fds_, O_CLOEXEC | O_NONBLOCK) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe2");
    }
}

StdioServer::~StdioServer() {
    stop();
    join_workers();
    for (int& fd : wake_fds_) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
}

void StdioServer::start_workers() {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    pool_running_ = true;
    for (size_t i = 0; i < thread_pool_size_; ++i) {
        worker_threads_.emplace_back(&StdioServer::worker_thread_func, this);
    }
}

void StdioServer::join_workers() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        pool_running_ = false;
        std::queue<std::string>().swap(task_queue_);
    }
    queue_cv_.notify_all();
    for (auto& t : worker_threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    worker_threads_.clear();
}

bool StdioServer::run() {
    if (running_.exchange(true)) {
        return false;
    }
    start_workers();

    bool clean = true;
    std::string pending;
    bool discarding = false;
    std::array<char, 65536> buffer{};

    while (running_) {
        std::array<pollfd, 2> fds = {{{input_fd_, POLLIN, 0}, {wake_fds_[0], POLLIN, 0}}};
        int ready = ::poll(fds.data(), fds.size(), -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG4CPLUS_ERROR(transport_logger(), "poll failed: " << std::strerror(errno));
            clean = false;
            break;
        }
        if (fds[1].revents & POLLIN) {
            LOG4CPLUS_DEBUG(transport_logger(), "Stop requested");
            break;
        }
        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) {
            continue;
        }

        ssize_t got = ::read(input_fd_, buffer.data(), buffer.size());
        if (got < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            LOG4CPLUS_ERROR(transport_logger(), "read failed: " << std::strerror(errno));
            clean = false;
            break;
        }
        if (got == 0) {
            LOG4CPLUS_INFO(transport_logger(), "Input stream closed");
            break;
        }

        size_t start = 0;
        for (size_t i = 0; i < static_cast<size_t>(got); ++i) {
            if (buffer[i] != '\n') {
                continue;
            }
            if (!discarding) {
                pending.append(buffer.data() + start, i - start);
                if (pending.size() > kMaxLineBytes) {
                    send_response(oversized_line_error());
                } else {
                    dispatch_line(std::move(pending));
                }
            }
            pending.clear();
            discarding = false;
            start = i + 1;
        }

        if (!discarding) {
            pending.append(buffer.data() + start, static_cast<size_t>(got) - start);
            if (pending.size() > kMaxLineBytes) {
                LOG4CPLUS_WARN(transport_logger(), "Discarding request line over " << kMaxLineBytes << " bytes");
                send_response(oversized_line_error());
                pending.clear();
                discarding = true;
            }
        }
    }

    if (!pending.empty()) {
        LOG4CPLUS_DEBUG(transport_logger(), "Dropping unterminated input of " << pending.size() << " bytes");
    }

    running_ = false;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        accepting_output_ = false;
    }
    return clean;
}

void StdioServer::stop() {
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        accepting_output_ = false;
    }
    running_ = false;
    wake();
}

void StdioServer::wake() {
    char byte = 1;
    if (::write(wake_fds_[1], &byte, 1) < 0 && errno != EAGAIN) {
        LOG4CPLUS_WARN(transport_logger(), "Failed to wake reader: " << std::strerror(errno));
    }
}

void StdioServer::dispatch_line(std::string line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (is_blank(line)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        task_queue_.push(std::move(line));
    }
    queue_cv_.notify_one();
}

bool StdioServer::send_response(const std::string& line) {
    std::string framed = line;
    framed.push_back('\n');

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!accepting_output_) {
        LOG4CPLUS_DEBUG(transport_logger(), "Output closed, dropping response");
        return false;
    }

    size_t offset = 0;
    while (offset < framed.size()) {
        ssize_t written = ::write(output_fd_, framed.data() + offset, framed.size() - offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG4CPLUS_ERROR(transport_logger(), "Failed to write response: " << std::strerror(errno));
            accepting_output_ = false;
            running_ = false;
            wake();
            return false;
        }
        offset += static_cast<size_t>(written);
    }
    return true;
}

void StdioServer::worker_thread_func() {
    while (true) {
        std::string line;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !task_queue_.empty() || !pool_running_; });

            if (!pool_running_ && task_queue_.empty()) {
                return;
            }

            line = std::move(task_queue_.front());
            task_queue_.pop();
        }

        Reply reply;
        try {
            reply = handler_(line);
        } catch (const std::exception& e) {
            LOG4CPLUS_ERROR(transport_logger(), "Request handler error: " << e.what());
            reply.line = codec::encode_error(kUnknownRequestId, kServerErrorCode, e.what(),
                                             {{"kind", sandbox::to_string(sandbox::ErrorKind::Internal)}});
        }

        if (send_response(reply.line) && reply.close_after_send) {
            LOG4CPLUS_INFO(transport_logger(), "Final response sent, stopping");
            stop();
        }
    }
}

} // namespace ipc
