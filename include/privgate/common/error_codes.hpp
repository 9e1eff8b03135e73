#pragma once

#include "error_framework.hpp"
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace privgate {
namespace common {

enum class ErrorCode {
    INVALID_SAFETY_STRATEGY = 100,
    UNSUPPORTED_STRATEGY_FOR_OS = 101,
    INVALID_SANDBOX_MODE = 102,
    MISSING_RUN_AS_USER = 103,
    INVALID_USERNAME = 104,
    INVALID_PROMPT_SOURCE = 105,
    PROMPT_UNREADABLE = 106,
    INVALID_SCHEMA_SOURCE = 107,
    INVALID_EXTRA_ARGS = 108,
    EXECUTABLE_NOT_FOUND = 109,
    INVALID_CONFIG = 110,

    ELEVATION_UNAVAILABLE = 200,
    UNSUPPORTED_OS = 201,
    ROOT_REQUIRED = 202,
    NO_GROUP_REMOVAL_MECHANISM = 203,
    SUDOERS_REWRITE_FAILED = 204,
    ROOT_PHASE_FAILED = 205,

    COMMAND_FAILED = 300,
    SPAWN_FAILED = 301,
    COMMAND_CANCELLED = 302,

    AGENT_PROCESS_FAILED = 400,
    FINAL_READ_FAILED = 401,

    RESOURCE_OPERATION_FAILED = 500,
    RESOURCE_CLEANUP_FAILED = 501,

    SERVER_INFO_UNAVAILABLE = 600,
    CONFIG_WRITE_FAILED = 601
};

using ErrorCodeHelper = ErrorRegistry<ErrorCode>;

class PrivgateError : public std::runtime_error {
public:
    PrivgateError(ErrorCode code, const std::string& message, ErrorContext context = {})
        : std::runtime_error(message), code_(code), context_(std::move(context)) {}

    ErrorCode code() const { return code_; }
    const ErrorContext& context() const { return context_; }

private:
    ErrorCode code_;
    ErrorContext context_;
};

class ValidationError : public PrivgateError {
public:
    using PrivgateError::PrivgateError;
};

class PrivilegeOperationError : public PrivgateError {
public:
    using PrivgateError::PrivgateError;
};

class ResourceError : public PrivgateError {
public:
    ResourceError(const std::string& message, ErrorContext context = {})
        : PrivgateError(ErrorCode::RESOURCE_OPERATION_FAILED, message, std::move(context)) {}
};

class FinalReadError : public PrivgateError {
public:
    FinalReadError(const std::string& message, ErrorContext context = {})
        : PrivgateError(ErrorCode::FINAL_READ_FAILED, message, std::move(context)) {}
};

class AgentProcessError : public PrivgateError {
public:
    AgentProcessError(const std::string& message, int exit_code, ErrorContext context = {})
        : PrivgateError(ErrorCode::AGENT_PROCESS_FAILED, message, std::move(context)),
          exit_code_(exit_code) {}

    int exitCode() const { return exit_code_; }

private:
    int exit_code_;
};

class ServerInfoError : public PrivgateError {
public:
    ServerInfoError(const std::string& message, ErrorContext context = {})
        : PrivgateError(ErrorCode::SERVER_INFO_UNAVAILABLE, message, std::move(context)) {}
};

class ConfigWriteError : public PrivgateError {
public:
    ConfigWriteError(const std::string& message, ErrorContext context = {})
        : PrivgateError(ErrorCode::CONFIG_WRITE_FAILED, message, std::move(context)) {}
};

}
}

namespace privgate {
namespace common {

template<>
inline const std::unordered_map<ErrorCode, ErrorInfo<ErrorCode>>&
ErrorRegistry<ErrorCode>::getInfoMap() {
    static const std::unordered_map<ErrorCode, ErrorInfo<ErrorCode>> map = {
        {ErrorCode::INVALID_SAFETY_STRATEGY, {
            ErrorCode::INVALID_SAFETY_STRATEGY,
            "INVALID_SAFETY_STRATEGY",
            "Unknown safety strategy"
        }},
        {ErrorCode::UNSUPPORTED_STRATEGY_FOR_OS, {
            ErrorCode::UNSUPPORTED_STRATEGY_FOR_OS,
            "UNSUPPORTED_STRATEGY_FOR_OS",
            "Safety strategy not supported on this OS"
        }},
        {ErrorCode::INVALID_SANDBOX_MODE, {
            ErrorCode::INVALID_SANDBOX_MODE,
            "INVALID_SANDBOX_MODE",
            "Unknown sandbox mode"
        }},
        {ErrorCode::MISSING_RUN_AS_USER, {
            ErrorCode::MISSING_RUN_AS_USER,
            "MISSING_RUN_AS_USER",
            "Impersonation user required"
        }},
        {ErrorCode::INVALID_USERNAME, {
            ErrorCode::INVALID_USERNAME,
            "INVALID_USERNAME",
            "Invalid user or group name"
        }},
        {ErrorCode::INVALID_PROMPT_SOURCE, {
            ErrorCode::INVALID_PROMPT_SOURCE,
            "INVALID_PROMPT_SOURCE",
            "Exactly one prompt source required"
        }},
        {ErrorCode::PROMPT_UNREADABLE, {
            ErrorCode::PROMPT_UNREADABLE,
            "PROMPT_UNREADABLE",
            "Prompt file could not be read"
        }},
        {ErrorCode::INVALID_SCHEMA_SOURCE, {
            ErrorCode::INVALID_SCHEMA_SOURCE,
            "INVALID_SCHEMA_SOURCE",
            "At most one output schema source allowed"
        }},
        {ErrorCode::INVALID_EXTRA_ARGS, {
            ErrorCode::INVALID_EXTRA_ARGS,
            "INVALID_EXTRA_ARGS",
            "Extra arguments could not be parsed"
        }},
        {ErrorCode::EXECUTABLE_NOT_FOUND, {
            ErrorCode::EXECUTABLE_NOT_FOUND,
            "EXECUTABLE_NOT_FOUND",
            "Executable not found in PATH"
        }},
        {ErrorCode::INVALID_CONFIG, {
            ErrorCode::INVALID_CONFIG,
            "INVALID_CONFIG",
            "Configuration invalid"
        }},
        {ErrorCode::ELEVATION_UNAVAILABLE, {
            ErrorCode::ELEVATION_UNAVAILABLE,
            "ELEVATION_UNAVAILABLE",
            "Passwordless elevation not available"
        }},
        {ErrorCode::UNSUPPORTED_OS, {
            ErrorCode::UNSUPPORTED_OS,
            "UNSUPPORTED_OS",
            "Operation not supported on this OS"
        }},
        {ErrorCode::ROOT_REQUIRED, {
            ErrorCode::ROOT_REQUIRED,
            "ROOT_REQUIRED",
            "Root privileges required"
        }},
        {ErrorCode::NO_GROUP_REMOVAL_MECHANISM, {
            ErrorCode::NO_GROUP_REMOVAL_MECHANISM,
            "NO_GROUP_REMOVAL_MECHANISM",
            "No group removal command available"
        }},
        {ErrorCode::SUDOERS_REWRITE_FAILED, {
            ErrorCode::SUDOERS_REWRITE_FAILED,
            "SUDOERS_REWRITE_FAILED",
            "Sudoers file rewrite failed"
        }},
        {ErrorCode::ROOT_PHASE_FAILED, {
            ErrorCode::ROOT_PHASE_FAILED,
            "ROOT_PHASE_FAILED",
            "Elevated root phase failed"
        }},
        {ErrorCode::COMMAND_FAILED, {
            ErrorCode::COMMAND_FAILED,
            "COMMAND_FAILED",
            "Command exited with non-zero status"
        }},
        {ErrorCode::SPAWN_FAILED, {
            ErrorCode::SPAWN_FAILED,
            "SPAWN_FAILED",
            "Command could not be started"
        }},
        {ErrorCode::COMMAND_CANCELLED, {
            ErrorCode::COMMAND_CANCELLED,
            "COMMAND_CANCELLED",
            "Command cancelled"
        }},
        {ErrorCode::AGENT_PROCESS_FAILED, {
            ErrorCode::AGENT_PROCESS_FAILED,
            "AGENT_PROCESS_FAILED",
            "Agent process failed"
        }},
        {ErrorCode::FINAL_READ_FAILED, {
            ErrorCode::FINAL_READ_FAILED,
            "FINAL_READ_FAILED",
            "Final message could not be read"
        }},
        {ErrorCode::RESOURCE_OPERATION_FAILED, {
            ErrorCode::RESOURCE_OPERATION_FAILED,
            "RESOURCE_OPERATION_FAILED",
            "Resource operation failed"
        }},
        {ErrorCode::RESOURCE_CLEANUP_FAILED, {
            ErrorCode::RESOURCE_CLEANUP_FAILED,
            "RESOURCE_CLEANUP_FAILED",
            "Temporary resource cleanup failed"
        }},
        {ErrorCode::SERVER_INFO_UNAVAILABLE, {
            ErrorCode::SERVER_INFO_UNAVAILABLE,
            "SERVER_INFO_UNAVAILABLE",
            "Server info could not be read"
        }},
        {ErrorCode::CONFIG_WRITE_FAILED, {
            ErrorCode::CONFIG_WRITE_FAILED,
            "CONFIG_WRITE_FAILED",
            "Configuration file could not be written"
        }}
    };
    return map;
}

}
}
