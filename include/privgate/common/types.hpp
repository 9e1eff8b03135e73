#pragma once

#include "error_framework.hpp"
#include <string>
#include <vector>
#include <optional>
#include <utility>

namespace privgate {
namespace common {

enum class SafetyStrategy {
    DROP_SUDO,
    UNPRIVILEGED_USER,
    READ_ONLY,
    UNSAFE
};

enum class SandboxMode {
    READ_ONLY,
    WORKSPACE_WRITE,
    DANGER_FULL_ACCESS
};

enum class HostOs {
    LINUX,
    MACOS,
    WINDOWS,
    OTHER_UNIX
};

enum class SourceKind {
    INLINE,
    FILE
};

// Either literal content or a path to read it from.
struct ContentSource {
    SourceKind kind = SourceKind::INLINE;
    std::string value;

    static ContentSource inlineText(std::string text) { return {SourceKind::INLINE, std::move(text)}; }
    static ContentSource fromFile(std::string path) { return {SourceKind::FILE, std::move(path)}; }
};

std::string to_string(SafetyStrategy strategy);
std::string to_string(SandboxMode mode);
std::string to_string(HostOs os);

SafetyStrategy parseSafetyStrategy(const std::string& token);
SandboxMode parseSandboxMode(const std::string& token);

HostOs currentHostOs();
bool isUnixLike(HostOs os);

// Throws ValidationError when the strategy cannot be enforced on the given OS.
void validateSafetyStrategy(SafetyStrategy strategy, HostOs os);

SandboxMode effectiveSandboxMode(SafetyStrategy strategy, SandboxMode requested);

bool isValidAccountName(const std::string& name);

}}
