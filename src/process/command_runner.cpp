#include "privgate/process/command_runner.hpp"
#include "privgate/common/constants.hpp"
#include "privgate/common/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace privgate {
namespace process {

namespace {

class FdGuard {
public:
    FdGuard() = default;
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() { reset(); }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    void reset(int fd = -1) {
        if (fd_ >= 0) {
            close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

bool makePipe(FdGuard& read_end, FdGuard& write_end) {
    int fds[2];
    if (pipe(fds) != 0) {
        return false;
    }
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
    return true;
}

bool setCloseOnExec(int fd) {
    int flags = fcntl(fd, F_GETFD, 0);
    if (flags < 0) {
        return false;
    }
    return fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == 0;
}

bool setNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

void ignoreSigpipe() {
    static std::once_flag once;
    std::call_once(once, []() { signal(SIGPIPE, SIG_IGN); });
}

void appendBounded(std::string& target, const char* data, size_t size, size_t cap, bool& truncated) {
    if (target.size() >= cap) {
        truncated = truncated || size > 0;
        return;
    }
    size_t room = cap - target.size();
    size_t take = std::min(room, size);
    target.append(data, take);
    if (take < size) {
        truncated = true;
    }
}

// Returns false once the descriptor reached EOF or failed.
bool drainInto(int fd, std::string* target, size_t cap, bool& truncated) {
    char buffer[8192];
    for (;;) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            if (target) {
                appendBounded(*target, buffer, static_cast<size_t>(n), cap, truncated);
            }
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

}

CommandSpec CommandSpec::passthrough(std::vector<std::string> argv) {
    CommandSpec spec;
    spec.argv = std::move(argv);
    spec.stdin_mode = StdinMode::INHERIT;
    spec.stdout_mode = OutputMode::INHERIT;
    spec.stderr_mode = OutputMode::INHERIT;
    return spec;
}

CommandSpec CommandSpec::capture(std::vector<std::string> argv) {
    CommandSpec spec;
    spec.argv = std::move(argv);
    spec.stdin_mode = StdinMode::NULL_DEVICE;
    spec.stdout_mode = OutputMode::CAPTURE;
    spec.stderr_mode = OutputMode::CAPTURE;
    return spec;
}

CommandSpec CommandSpec::checkOutput(std::vector<std::string> argv) {
    CommandSpec spec;
    spec.argv = std::move(argv);
    spec.stdin_mode = StdinMode::NULL_DEVICE;
    spec.stdout_mode = OutputMode::CAPTURE;
    spec.stderr_mode = OutputMode::INHERIT;
    return spec;
}

CommandFailedError::CommandFailedError(const std::string& command, int exit_code,
                                       std::string stdout_data, std::string stderr_data)
    : common::PrivgateError(common::ErrorCode::COMMAND_FAILED,
                            "Command failed: " + command + " (exit code " + std::to_string(exit_code) + ")",
                            common::ErrorContext::at("process", {{"command", command}})
                                .with("exit_code", std::to_string(exit_code))),
      exit_code_(exit_code),
      stdout_data_(std::move(stdout_data)),
      stderr_data_(std::move(stderr_data)) {}

SpawnError::SpawnError(const std::string& command, int error_number)
    : common::PrivgateError(common::ErrorCode::SPAWN_FAILED,
                            "Failed to start " + command + ": " + std::strerror(error_number),
                            common::ErrorContext::at("process", {{"command", command}})
                                .with("errno", std::to_string(error_number))),
      error_number_(error_number) {}

CommandCancelledError::CommandCancelledError(const std::string& command, bool timed_out)
    : common::PrivgateError(common::ErrorCode::COMMAND_CANCELLED,
                            (timed_out ? "Command timed out: " : "Command cancelled: ") + command,
                            common::ErrorContext::at("process", {{"command", command}})),
      timed_out_(timed_out) {}

CommandRunner::CommandRunner(RunnerLimits limits, const CancellationToken* token)
    : limits_(limits), token_(token) {}

CommandResult CommandRunner::run(const CommandSpec& spec) {
    if (spec.argv.empty()) {
        throw SpawnError("<empty command>", EINVAL);
    }

    ignoreSigpipe();

    const std::string command_text = formatCommand(spec.argv);

    auto timeout = spec.timeout.value_or(limits_.default_timeout);
    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (timeout.count() > 0) {
        deadline = std::chrono::steady_clock::now() + timeout;
    }

    bool timed_out = false;
    if (shouldCancel(spec, deadline, timed_out)) {
        throw CommandCancelledError(command_text, timed_out);
    }

    FdGuard stdin_read, stdin_write;
    FdGuard stdout_read, stdout_write;
    FdGuard stderr_read, stderr_write;
    FdGuard exec_error_read, exec_error_write;
    FdGuard null_device;

    bool needs_null = spec.stdin_mode == StdinMode::NULL_DEVICE ||
                      spec.stdout_mode == OutputMode::DISCARD ||
                      spec.stderr_mode == OutputMode::DISCARD;
    if (needs_null) {
        null_device.reset(open("/dev/null", O_RDWR));
        if (!null_device.valid()) {
            throw SpawnError(command_text, errno);
        }
    }

    if ((spec.stdin_mode == StdinMode::PIPE && !makePipe(stdin_read, stdin_write)) ||
        (spec.stdout_mode == OutputMode::CAPTURE && !makePipe(stdout_read, stdout_write)) ||
        (spec.stderr_mode == OutputMode::CAPTURE && !makePipe(stderr_read, stderr_write)) ||
        !makePipe(exec_error_read, exec_error_write)) {
        throw SpawnError(command_text, errno);
    }
    setCloseOnExec(exec_error_write.get());

    // Everything the child touches is prepared before fork.
    std::vector<char*> argv_ptrs;
    argv_ptrs.reserve(spec.argv.size() + 1);
    for (const auto& arg : spec.argv) {
        argv_ptrs.push_back(const_cast<char*>(arg.c_str()));
    }
    argv_ptrs.push_back(nullptr);

    std::vector<std::string> env_storage;
    std::vector<char*> env_ptrs;
    if (spec.environment) {
        env_storage.reserve(spec.environment->size());
        for (const auto& [key, value] : *spec.environment) {
            env_storage.push_back(key + "=" + value);
        }
        for (auto& entry : env_storage) {
            env_ptrs.push_back(entry.data());
        }
        env_ptrs.push_back(nullptr);
    }

    auto started_at = std::chrono::steady_clock::now();
    common::Logger::instance().flush();

    pid_t pid = fork();
    if (pid < 0) {
        throw SpawnError(command_text, errno);
    }

    if (pid == 0) {
        signal(SIGPIPE, SIG_DFL);
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);

        int stdin_fd = spec.stdin_mode == StdinMode::PIPE ? stdin_read.get()
                     : spec.stdin_mode == StdinMode::NULL_DEVICE ? null_device.get() : -1;
        int stdout_fd = spec.stdout_mode == OutputMode::CAPTURE ? stdout_write.get()
                      : spec.stdout_mode == OutputMode::DISCARD ? null_device.get() : -1;
        int stderr_fd = spec.stderr_mode == OutputMode::CAPTURE ? stderr_write.get()
                      : spec.stderr_mode == OutputMode::DISCARD ? null_device.get() : -1;

        if ((stdin_fd >= 0 && dup2(stdin_fd, STDIN_FILENO) < 0) ||
            (stdout_fd >= 0 && dup2(stdout_fd, STDOUT_FILENO) < 0) ||
            (stderr_fd >= 0 && dup2(stderr_fd, STDERR_FILENO) < 0)) {
            int err = errno;
            ssize_t ignored = write(exec_error_write.get(), &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }

        for (int fd : {stdin_read.get(), stdin_write.get(), stdout_read.get(), stdout_write.get(),
                       stderr_read.get(), stderr_write.get(), exec_error_read.get(), null_device.get()}) {
            if (fd > STDERR_FILENO) {
                close(fd);
            }
        }

        if (spec.environment) {
            environ = env_ptrs.data();
        }

        execvp(argv_ptrs[0], argv_ptrs.data());

        int err = errno;
        ssize_t ignored = write(exec_error_write.get(), &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    stdin_read.reset();
    stdout_write.reset();
    stderr_write.reset();
    exec_error_write.reset();
    null_device.reset();

    int exec_errno = 0;
    ssize_t error_bytes;
    do {
        error_bytes = read(exec_error_read.get(), &exec_errno, sizeof(exec_errno));
    } while (error_bytes < 0 && errno == EINTR);
    exec_error_read.reset();

    if (error_bytes == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        common::Logger::instance().debug("[Process] Spawn failed | command={} | error={}",
                                         command_text, std::strerror(exec_errno));
        throw SpawnError(command_text, exec_errno);
    }

    common::Logger::instance().debug("[Process] Spawned | pid={} | command={}", pid, command_text);

    CommandResult result;
    size_t input_offset = 0;

    if (stdin_write.valid()) {
        if (spec.input.empty()) {
            stdin_write.reset();
        } else {
            setNonBlocking(stdin_write.get());
        }
    }
    if (stdout_read.valid()) setNonBlocking(stdout_read.get());
    if (stderr_read.valid()) setNonBlocking(stderr_read.get());

    bool exited = false;
    int wait_status = 0;

    for (;;) {
        if (shouldCancel(spec, deadline, timed_out)) {
            common::Logger::instance().warn("[Process] Cancelling | pid={} | timed_out={} | command={}",
                                            pid, timed_out, command_text);
            terminateChild(pid);
            throw CommandCancelledError(command_text, timed_out);
        }

        std::vector<pollfd> fds;
        if (stdin_write.valid()) fds.push_back({stdin_write.get(), POLLOUT, 0});
        if (stdout_read.valid()) fds.push_back({stdout_read.get(), POLLIN, 0});
        if (stderr_read.valid()) fds.push_back({stderr_read.get(), POLLIN, 0});

        if (fds.empty()) {
            pid_t w = waitpid(pid, &wait_status, WNOHANG);
            if (w == pid) {
                exited = true;
                break;
            }
            if (w < 0 && errno != EINTR) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(constants::limits::POLL_INTERVAL_MS));
            continue;
        }

        int ready = poll(fds.data(), fds.size(), constants::limits::POLL_INTERVAL_MS);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            terminateChild(pid);
            throw SpawnError(command_text, err);
        }
        if (ready == 0) {
            continue;
        }

        for (const auto& entry : fds) {
            if (entry.revents == 0) {
                continue;
            }

            if (stdin_write.valid() && entry.fd == stdin_write.get()) {
                if (entry.revents & (POLLERR | POLLHUP)) {
                    stdin_write.reset();
                    continue;
                }
                ssize_t n = write(stdin_write.get(), spec.input.data() + input_offset,
                                  spec.input.size() - input_offset);
                if (n > 0) {
                    input_offset += static_cast<size_t>(n);
                    if (input_offset >= spec.input.size()) {
                        stdin_write.reset();
                    }
                } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                    // EPIPE: the child stopped reading its input.
                    stdin_write.reset();
                }
            } else if (stdout_read.valid() && entry.fd == stdout_read.get()) {
                if (!drainInto(stdout_read.get(), &result.stdout_data, limits_.max_capture_bytes,
                               result.stdout_truncated)) {
                    stdout_read.reset();
                }
            } else if (stderr_read.valid() && entry.fd == stderr_read.get()) {
                if (!drainInto(stderr_read.get(), &result.stderr_data, limits_.max_capture_bytes,
                               result.stderr_truncated)) {
                    stderr_read.reset();
                }
            }
        }
    }

    if (!exited) {
        int err = errno;
        throw SpawnError(command_text, err);
    }

    result.exit_code = decodeWaitStatus(wait_status);

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at);
    common::Logger::instance().debug("[Process] Exited | pid={} | exit_code={} | duration_ms={}",
                                     pid, result.exit_code, duration.count());

    if (result.stdout_truncated || result.stderr_truncated) {
        common::Logger::instance().warn("[Process] Captured output truncated | command={} | cap_bytes={}",
                                        command_text, limits_.max_capture_bytes);
    }

    if (result.exit_code != 0 && !spec.ignore_failure) {
        throw CommandFailedError(command_text, result.exit_code,
                                 std::move(result.stdout_data), std::move(result.stderr_data));
    }

    return result;
}

bool CommandRunner::shouldCancel(const CommandSpec& spec,
                                 const std::optional<std::chrono::steady_clock::time_point>& deadline,
                                 bool& timed_out) const {
    if (deadline && std::chrono::steady_clock::now() >= *deadline) {
        timed_out = true;
        return true;
    }
    if (spec.ignore_cancellation) {
        return false;
    }
    if (token_ && token_->isCancelled()) {
        timed_out = token_->deadlineExpired();
        return true;
    }
    if (CancellationToken::interruptRequested()) {
        timed_out = false;
        return true;
    }
    return false;
}

void CommandRunner::terminateChild(pid_t pid) {
    int status;
    kill(pid, SIGTERM);

    auto give_up_at = std::chrono::steady_clock::now() +
                      std::chrono::milliseconds(constants::limits::KILL_GRACE_MS);
    while (std::chrono::steady_clock::now() < give_up_at) {
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid || (w < 0 && errno != EINTR)) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    kill(pid, SIGKILL);
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

int CommandRunner::decodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

std::string formatCommand(const std::vector<std::string>& argv) {
    std::string text;
    for (const auto& arg : argv) {
        if (!text.empty()) {
            text += ' ';
        }
        bool needs_quotes = arg.empty() || arg.find_first_of(" \t\n\"'\\$") != std::string::npos;
        if (!needs_quotes) {
            text += arg;
            continue;
        }
        text += '"';
        for (char c : arg) {
            if (c == '"' || c == '\\') {
                text += '\\';
            }
            text += c;
        }
        text += '"';
    }
    return text;
}

std::map<std::string, std::string> currentEnvironment() {
    std::map<std::string, std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string item(*entry);
        auto eq_pos = item.find('=');
        if (eq_pos == std::string::npos || eq_pos == 0) {
            continue;
        }
        env.emplace(item.substr(0, eq_pos), item.substr(eq_pos + 1));
    }
    return env;
}

std::optional<std::string> findExecutable(const std::string& name, const std::string& search_path) {
    if (name.empty()) {
        return std::nullopt;
    }

    auto is_executable_file = [](const std::string& candidate) {
        struct stat st;
        return stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
               access(candidate.c_str(), X_OK) == 0;
    };

    std::error_code ec;

    if (name.find('/') != std::string::npos) {
        if (!is_executable_file(name)) {
            return std::nullopt;
        }
        auto absolute = std::filesystem::absolute(name, ec);
        return ec ? name : absolute.lexically_normal().string();
    }

    size_t start = 0;
    while (start <= search_path.size()) {
        size_t end = search_path.find(':', start);
        if (end == std::string::npos) {
            end = search_path.size();
        }

        std::string dir = search_path.substr(start, end - start);
        if (dir.empty()) {
            dir = ".";
        }

        std::string candidate = dir + "/" + name;
        if (is_executable_file(candidate)) {
            auto absolute = std::filesystem::absolute(candidate, ec);
            return ec ? candidate : absolute.lexically_normal().string();
        }

        start = end + 1;
    }

    return std::nullopt;
}

std::optional<std::string> findExecutable(const std::string& name) {
    const char* path = std::getenv("PATH");
    return findExecutable(name, path ? path : "/usr/bin:/bin");
}

}}
