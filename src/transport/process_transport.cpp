#include "transport/process_transport.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

extern char** environ;

namespace mcplink::transport {

using core::errors::ClientError;
using core::errors::ErrorKind;

namespace {

// Written by the child to the status pipe when it cannot exec.
struct LaunchFailure {
    int stage;  // 1 = chdir, 2 = exec
    int error_number;
};

void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, []() { static_cast<void>(signal(SIGPIPE, SIG_IGN)); });
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(::close(fd));
        fd = -1;
    }
}

void close_pipe(int (&fds)[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

ClientError stdin_closed() {
    return ClientError{ErrorKind::Connection, "Server input stream is closed.",
                       "stdin_closed"};
}

ClientError write_timeout(const std::chrono::milliseconds timeout) {
    return ClientError{ErrorKind::Timeout,
                       "Server did not accept input within " +
                           std::to_string(timeout.count()) + "ms.",
                       "write_timeout", "The server may have stopped reading its stdin.",
                       core::errors::rpc::kInternalError};
}

enum class PipeState { Open, Eof, Failed };

PipeState drain_pipe(const int fd, std::string& out) {
    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            return PipeState::Eof;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return PipeState::Open;
        }
        return PipeState::Failed;
    }
}

std::vector<std::string> build_environment(
    const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> entries;
    for (char** cursor = environ; cursor != nullptr && *cursor != nullptr; ++cursor) {
        const std::string entry(*cursor);
        const auto eq = entry.find('=');
        const std::string key = entry.substr(0, eq);
        if (overrides.find(key) == overrides.end()) {
            entries.push_back(entry);
        }
    }
    for (const auto& [key, value] : overrides) {
        entries.push_back(key + "=" + value);
    }
    return entries;
}

std::vector<char*> to_pointer_array(std::vector<std::string>& values) {
    std::vector<char*> pointers;
    pointers.reserve(values.size() + 1);
    for (auto& value : values) {
        pointers.push_back(value.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

}  // namespace

core::errors::Result<std::unique_ptr<ProcessTransport>> ProcessTransport::start(
    const protocol::ServerLaunchSpec& spec, ProcessOptions options) {
    if (spec.command.empty()) {
        return ClientError{ErrorKind::Launch, "Server command cannot be empty.",
                           "empty_command"};
    }
    ignore_sigpipe_once();

    // Everything the child touches is prepared before fork.
    std::vector<std::string> argv_storage;
    argv_storage.push_back(spec.command);
    argv_storage.insert(argv_storage.end(), spec.args.begin(), spec.args.end());
    std::vector<std::string> env_storage = build_environment(spec.env);
    std::vector<char*> argv = to_pointer_array(argv_storage);
    std::vector<char*> envp = to_pointer_array(env_storage);
    const std::string working_directory = spec.working_directory.value_or("");

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (pipe2(stdin_pipe, O_CLOEXEC) != 0 || pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
        pipe2(stderr_pipe, O_CLOEXEC) != 0 || pipe2(status_pipe, O_CLOEXEC) != 0) {
        const int saved = errno;
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(status_pipe);
        return ClientError{ErrorKind::Launch,
                           std::string("Failed to create process pipes: ") + std::strerror(saved),
                           "pipe_creation_failed"};
    }

    const pid_t pid = fork();
    if (pid < 0) {
        const int saved = errno;
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(status_pipe);
        return ClientError{ErrorKind::Launch,
                           std::string("Failed to fork process: ") + std::strerror(saved),
                           "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(dup2(stdin_pipe[0], STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));

        LaunchFailure failure{0, 0};
        if (!working_directory.empty() && chdir(working_directory.c_str()) != 0) {
            failure = LaunchFailure{1, errno};
        } else {
            execvpe(argv[0], argv.data(), envp.data());
            failure = LaunchFailure{2, errno};
        }
        static_cast<void>(write(status_pipe[1], &failure, sizeof(failure)));
        _exit(127);
    }

    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(status_pipe[1]);

    // The status pipe closes on a successful exec (O_CLOEXEC) without data.
    LaunchFailure failure{0, 0};
    ssize_t got = 0;
    do {
        got = read(status_pipe[0], &failure, sizeof(failure));
    } while (got < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (got == static_cast<ssize_t>(sizeof(failure))) {
        close_fd(stdin_pipe[1]);
        close_fd(stdout_pipe[0]);
        close_fd(stderr_pipe[0]);
        int status = 0;
        static_cast<void>(waitpid(pid, &status, 0));
        if (failure.stage == 1) {
            return ClientError{ErrorKind::Launch,
                               "Cannot enter working directory '" + working_directory +
                                   "': " + std::strerror(failure.error_number),
                               "invalid_working_directory"};
        }
        return ClientError{ErrorKind::Launch,
                           "Failed to launch '" + spec.command +
                               "': " + std::strerror(failure.error_number),
                           "launch_failed"};
    }

    set_nonblocking(stdin_pipe[1]);
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    LOG_DEBUG("ProcessTransport: started '" + spec.command + "' as pid " +
              std::to_string(pid));
    return std::unique_ptr<ProcessTransport>(new ProcessTransport(
        pid, stdin_pipe[1], stdout_pipe[0], stderr_pipe[0], std::move(options)));
}

ProcessTransport::ProcessTransport(const pid_t pid, const int stdin_fd,
                                   const int stdout_fd, const int stderr_fd,
                                   ProcessOptions options)
    : pid_(pid),
      stdin_fd_(stdin_fd),
      stdout_fd_(stdout_fd),
      stderr_fd_(stderr_fd),
      options_(std::move(options)) {}

ProcessTransport::~ProcessTransport() {
    terminate(options_.terminate_grace);
}

core::errors::VoidResult ProcessTransport::write_line(const std::string& line,
                                                     const std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::timed_mutex> lock(write_mutex_, std::defer_lock);
    if (!lock.try_lock_until(deadline)) {
        return write_timeout(timeout);
    }
    if (stdin_fd_ < 0 || closing_.load()) {
        return stdin_closed();
    }

    const std::string payload = line + "\n";
    std::size_t offset = 0;
    while (offset < payload.size()) {
        if (closing_.load()) {
            return stdin_closed();
        }
        const ssize_t n = write(stdin_fd_, payload.data() + offset, payload.size() - offset);
        if (n > 0) {
            offset += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                if (offset > 0) {
                    // The peer now holds half a message; nothing after it can be framed.
                    LOG_WARN("ProcessTransport: pid " + std::to_string(pid_) +
                             " stopped reading mid-message, closing its input");
                    close_fd(stdin_fd_);
                }
                return write_timeout(timeout);
            }
            const auto remaining =
                std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            const auto slice = std::max(std::chrono::milliseconds(1),
                                        std::min(remaining, options_.poll_interval));
            pollfd fd{stdin_fd_, POLLOUT, 0};
            if (poll(&fd, 1, static_cast<int>(slice.count())) < 0 && errno != EINTR) {
                const int saved = errno;
                return ClientError{ErrorKind::Connection,
                                   std::string("Failed to poll server input: ") +
                                       std::strerror(saved),
                                   "write_failed"};
            }
            continue;
        }
        const int saved = errno;
        return ClientError{ErrorKind::Connection,
                           std::string("Failed to write to server: ") + std::strerror(saved),
                           "write_failed"};
    }
    return core::errors::ok();
}

core::errors::Result<std::optional<std::string>> ProcessTransport::read_line() {
    while (true) {
        std::lock_guard<std::mutex> lock(read_mutex_);

        const auto newline = stdout_buffer_.find('\n');
        if (newline != std::string::npos) {
            std::string line = stdout_buffer_.substr(0, newline);
            stdout_buffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return std::optional<std::string>(std::move(line));
        }

        if (closing_.load() || stdout_fd_ < 0 || stdout_eof_.load()) {
            forward_stderr_lines(true);
            if (!stdout_buffer_.empty() && !closing_.load()) {
                std::string tail = std::move(stdout_buffer_);
                stdout_buffer_.clear();
                return std::optional<std::string>(std::move(tail));
            }
            return std::optional<std::string>();
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        fds[nfds].fd = stdout_fd_;
        fds[nfds].events = POLLIN;
        ++nfds;
        if (stderr_fd_ >= 0) {
            fds[nfds].fd = stderr_fd_;
            fds[nfds].events = POLLIN;
            ++nfds;
        }

        const int ready = poll(fds, nfds, static_cast<int>(options_.poll_interval.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int saved = errno;
            return ClientError{ErrorKind::Connection,
                               std::string("Failed to poll server output: ") +
                                   std::strerror(saved),
                               "read_failed"};
        }

        if (stderr_fd_ >= 0 && drain_pipe(stderr_fd_, stderr_buffer_) != PipeState::Open) {
            close_fd(stderr_fd_);
        }
        forward_stderr_lines(false);

        const PipeState state = drain_pipe(stdout_fd_, stdout_buffer_);
        if (state == PipeState::Failed) {
            const int saved = errno;
            stdout_eof_.store(true);
            return ClientError{ErrorKind::Connection,
                               std::string("Failed to read server output: ") +
                                   std::strerror(saved),
                               "read_failed"};
        }
        if (state == PipeState::Eof) {
            stdout_eof_.store(true);
        }
    }
}

void ProcessTransport::forward_stderr_lines(const bool flush_partial) {
    std::size_t newline = stderr_buffer_.find('\n');
    while (newline != std::string::npos) {
        const std::string line = stderr_buffer_.substr(0, newline);
        stderr_buffer_.erase(0, newline + 1);
        if (!line.empty()) {
            LOG_DEBUG("[" + options_.label + " stderr] " + line);
        }
        newline = stderr_buffer_.find('\n');
    }
    if (flush_partial && !stderr_buffer_.empty()) {
        LOG_DEBUG("[" + options_.label + " stderr] " + stderr_buffer_);
        stderr_buffer_.clear();
    }
}

void ProcessTransport::close() {
    terminate(options_.terminate_grace);
}

bool ProcessTransport::is_open() const {
    return !closing_.load() && !stdout_eof_.load();
}

std::optional<int> ProcessTransport::exit_code() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return exit_code_;
}

void ProcessTransport::terminate(const std::chrono::milliseconds grace) {
    bool expected = false;
    if (!terminated_.compare_exchange_strong(expected, true)) {
        return;
    }
    closing_.store(true);

    {
        std::lock_guard<std::timed_mutex> lock(write_mutex_);
        close_fd(stdin_fd_);
    }

    if (pid_ > 0) {
        int status = 0;
        pid_t waited = waitpid(pid_, &status, WNOHANG);
        if (waited == 0) {
            static_cast<void>(kill(pid_, SIGTERM));
            const auto deadline = std::chrono::steady_clock::now() + grace;
            while (waited == 0 && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                waited = waitpid(pid_, &status, WNOHANG);
            }
            if (waited == 0) {
                LOG_WARN("ProcessTransport: pid " + std::to_string(pid_) +
                         " ignored SIGTERM, sending SIGKILL");
                static_cast<void>(kill(pid_, SIGKILL));
                waited = waitpid(pid_, &status, 0);
            }
        }

        std::lock_guard<std::mutex> lock(status_mutex_);
        if (waited == pid_) {
            if (WIFEXITED(status)) {
                exit_code_ = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                exit_code_ = 128 + WTERMSIG(status);
            }
        }
    }

    close_read_fds();
}

void ProcessTransport::close_read_fds() {
    std::lock_guard<std::mutex> lock(read_mutex_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

}  // namespace mcplink::transport
