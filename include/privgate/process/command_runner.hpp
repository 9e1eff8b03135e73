#pragma once

#include "cancellation.hpp"
#include "../common/error_codes.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

namespace privgate {
namespace process {

enum class StdinMode {
    NULL_DEVICE,
    INHERIT,
    PIPE
};

enum class OutputMode {
    INHERIT,
    CAPTURE,
    DISCARD
};

struct CommandSpec {
    std::vector<std::string> argv;
    StdinMode stdin_mode = StdinMode::NULL_DEVICE;
    std::string input;
    OutputMode stdout_mode = OutputMode::INHERIT;
    OutputMode stderr_mode = OutputMode::INHERIT;
    // Full child environment; the parent's environment is inherited when unset.
    std::optional<std::map<std::string, std::string>> environment;
    bool ignore_failure = false;
    // Only the spec's own timeout applies; token and interrupt are not
    // consulted. Used for cleanup that must run after a cancellation.
    bool ignore_cancellation = false;
    std::optional<std::chrono::milliseconds> timeout;

    // All three standard streams shared with the caller.
    static CommandSpec passthrough(std::vector<std::string> argv);
    // stdin from /dev/null, stdout and stderr captured.
    static CommandSpec capture(std::vector<std::string> argv);
    // stdin from /dev/null, stdout captured, stderr shown to the caller.
    static CommandSpec checkOutput(std::vector<std::string> argv);
};

struct CommandResult {
    int exit_code = 0;
    std::string stdout_data;
    std::string stderr_data;
    bool stdout_truncated = false;
    bool stderr_truncated = false;

    bool succeeded() const { return exit_code == 0; }
};

class CommandFailedError : public common::PrivgateError {
public:
    CommandFailedError(const std::string& command, int exit_code,
                       std::string stdout_data, std::string stderr_data);

    int exitCode() const { return exit_code_; }
    const std::string& stdoutData() const { return stdout_data_; }
    const std::string& stderrData() const { return stderr_data_; }

private:
    int exit_code_;
    std::string stdout_data_;
    std::string stderr_data_;
};

class SpawnError : public common::PrivgateError {
public:
    SpawnError(const std::string& command, int error_number);

    int errorNumber() const { return error_number_; }

private:
    int error_number_;
};

class CommandCancelledError : public common::PrivgateError {
public:
    CommandCancelledError(const std::string& command, bool timed_out);

    bool timedOut() const { return timed_out_; }

private:
    bool timed_out_;
};

class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Runs to completion. Throws CommandFailedError on non-zero exit unless
    // spec.ignore_failure is set, SpawnError when the program cannot start,
    // CommandCancelledError when cancelled or timed out.
    virtual CommandResult run(const CommandSpec& spec) = 0;
};

struct RunnerLimits {
    size_t max_capture_bytes = 16 * 1024 * 1024;
    std::chrono::milliseconds default_timeout{0};
};

class CommandRunner : public ProcessRunner {
public:
    explicit CommandRunner(RunnerLimits limits = {}, const CancellationToken* token = nullptr);

    CommandResult run(const CommandSpec& spec) override;

    const RunnerLimits& limits() const { return limits_; }

private:
    RunnerLimits limits_;
    const CancellationToken* token_;

    bool shouldCancel(const CommandSpec& spec,
                      const std::optional<std::chrono::steady_clock::time_point>& deadline,
                      bool& timed_out) const;
    static void terminateChild(pid_t pid);
    static int decodeWaitStatus(int status);
};

std::string formatCommand(const std::vector<std::string>& argv);

std::map<std::string, std::string> currentEnvironment();

std::optional<std::string> findExecutable(const std::string& name, const std::string& search_path);
std::optional<std::string> findExecutable(const std::string& name);

}}
