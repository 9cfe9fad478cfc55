#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>
#include "core/errors/client_errors.hpp"
#include "protocol/server_spec.hpp"
#include "transport/line_transport.hpp"

namespace mcplink::transport {

struct ProcessOptions {
    std::chrono::milliseconds terminate_grace{5000};
    std::chrono::milliseconds poll_interval{50};
    std::string label;  // tag for forwarded stderr lines
};

// Owns exactly one child process and its three stdio pipes.
class ProcessTransport : public LineTransport {
public:
    static core::errors::Result<std::unique_ptr<ProcessTransport>> start(
        const protocol::ServerLaunchSpec& spec, ProcessOptions options = {});

    ~ProcessTransport() override;

    ProcessTransport(const ProcessTransport&) = delete;
    ProcessTransport& operator=(const ProcessTransport&) = delete;

    core::errors::VoidResult write_line(const std::string& line,
                                        std::chrono::milliseconds timeout) override;
    core::errors::Result<std::optional<std::string>> read_line() override;
    void close() override;
    bool is_open() const override;

    // Closes stdin and sends SIGTERM, then SIGKILL once `grace` has elapsed.
    // A writer stuck on a full pipe gives up within one poll interval.
    void terminate(std::chrono::milliseconds grace);

    pid_t pid() const { return pid_; }
    std::optional<int> exit_code() const;

private:
    ProcessTransport(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd,
                     ProcessOptions options);

    void forward_stderr_lines(bool flush_partial);
    void close_read_fds();

    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    ProcessOptions options_;

    std::timed_mutex write_mutex_;
    std::mutex read_mutex_;
    mutable std::mutex status_mutex_;
    std::atomic_bool closing_{false};
    std::atomic_bool stdout_eof_{false};
    std::atomic_bool terminated_{false};
    std::optional<int> exit_code_;

    std::string stdout_buffer_;
    std::string stderr_buffer_;
};

}  // namespace mcplink::transport
