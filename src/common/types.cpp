#include "privgate/common/types.hpp"
#include "privgate/common/error_codes.hpp"
#include <algorithm>
#include <cctype>

namespace privgate {
namespace common {

std::string to_string(SafetyStrategy strategy) {
    switch (strategy) {
        case SafetyStrategy::DROP_SUDO: return "drop-sudo";
        case SafetyStrategy::UNPRIVILEGED_USER: return "unprivileged-user";
        case SafetyStrategy::READ_ONLY: return "read-only";
        case SafetyStrategy::UNSAFE: return "unsafe";
        default: return "unknown";
    }
}

std::string to_string(SandboxMode mode) {
    switch (mode) {
        case SandboxMode::READ_ONLY: return "read-only";
        case SandboxMode::WORKSPACE_WRITE: return "workspace-write";
        case SandboxMode::DANGER_FULL_ACCESS: return "danger-full-access";
        default: return "unknown";
    }
}

std::string to_string(HostOs os) {
    switch (os) {
        case HostOs::LINUX: return "linux";
        case HostOs::MACOS: return "macos";
        case HostOs::WINDOWS: return "windows";
        case HostOs::OTHER_UNIX: return "unix";
        default: return "unknown";
    }
}

SafetyStrategy parseSafetyStrategy(const std::string& token) {
    std::string normalized = token;
    std::replace(normalized.begin(), normalized.end(), '_', '-');

    if (normalized == "drop-sudo") return SafetyStrategy::DROP_SUDO;
    if (normalized == "unprivileged-user") return SafetyStrategy::UNPRIVILEGED_USER;
    if (normalized == "read-only") return SafetyStrategy::READ_ONLY;
    if (normalized == "unsafe") return SafetyStrategy::UNSAFE;

    throw ValidationError(ErrorCode::INVALID_SAFETY_STRATEGY,
                          "Invalid safety strategy: " + token +
                          ". Must be one of 'drop-sudo', 'read-only', 'unprivileged-user', or 'unsafe'.",
                          ErrorContext{"types", {{"value", token}}, std::nullopt});
}

SandboxMode parseSandboxMode(const std::string& token) {
    if (token == "read-only") return SandboxMode::READ_ONLY;
    if (token == "workspace-write") return SandboxMode::WORKSPACE_WRITE;
    if (token == "danger-full-access") return SandboxMode::DANGER_FULL_ACCESS;

    throw ValidationError(ErrorCode::INVALID_SANDBOX_MODE,
                          "Invalid sandbox mode: " + token +
                          ". Must be one of 'read-only', 'workspace-write', or 'danger-full-access'.",
                          ErrorContext{"types", {{"value", token}}, std::nullopt});
}

HostOs currentHostOs() {
#if defined(_WIN32)
    return HostOs::WINDOWS;
#elif defined(__APPLE__)
    return HostOs::MACOS;
#elif defined(__linux__)
    return HostOs::LINUX;
#else
    return HostOs::OTHER_UNIX;
#endif
}

bool isUnixLike(HostOs os) {
    return os != HostOs::WINDOWS;
}

void validateSafetyStrategy(SafetyStrategy strategy, HostOs os) {
    if (isUnixLike(os) || strategy == SafetyStrategy::UNSAFE) {
        return;
    }

    throw ValidationError(ErrorCode::UNSUPPORTED_STRATEGY_FOR_OS,
                          "Safety strategy '" + to_string(strategy) + "' is not supported on " +
                          to_string(os) + "; only 'unsafe' is supported there.",
                          ErrorContext{"types", {{"strategy", to_string(strategy)}, {"os", to_string(os)}},
                                       std::nullopt});
}

SandboxMode effectiveSandboxMode(SafetyStrategy strategy, SandboxMode requested) {
    if (strategy == SafetyStrategy::READ_ONLY) {
        return SandboxMode::READ_ONLY;
    }
    return requested;
}

bool isValidAccountName(const std::string& name) {
    if (name.empty() || name.length() > 32) {
        return false;
    }

    if (name[0] == '-') {
        return false;
    }

    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_' && c != '.') {
            return false;
        }
    }

    return true;
}

}}
