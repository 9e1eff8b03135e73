#pragma once

#include "../process/command_runner.hpp"
#include <optional>
#include <string>
#include <vector>

namespace privgate {
namespace privilege {

enum class ResourceKind {
    EXPLICIT,
    TEMPORARY
};

struct ManagedResource {
    ResourceKind kind = ResourceKind::EXPLICIT;
    // What callers hand to the agent.
    std::string path;
    // What gets removed on release; empty for explicit resources.
    std::string cleanup_path;
    // User the resource was created as, if impersonated.
    std::optional<std::string> owner;

    static ManagedResource explicitPath(std::string path);
    static ManagedResource temporary(std::string path, std::string cleanup_path,
                                     std::optional<std::string> owner = std::nullopt);
};

std::vector<std::string> impersonationPrefix(const std::string& elevation_command, const std::string& user);

/**
 * File operations that honour an optional run-as user.
 *
 * With a run-as user every operation is a single command run through the
 * elevation prefix so it executes with that user's identity and permissions.
 * Without one the operations are plain filesystem calls. Failures throw
 * ResourceError; cancellation is passed through unchanged.
 */
class ResourceManager {
public:
    ResourceManager(process::ProcessRunner& runner,
                    std::optional<std::string> run_as_user = std::nullopt,
                    std::string elevation_command = "sudo",
                    std::string temp_dir = "");

    std::string createTempDirectory(const std::string& prefix);
    // Writes to a sibling temporary file and moves it over the target.
    void writeFile(const std::string& path, const std::string& content);
    void moveFile(const std::string& from, const std::string& to);
    // Recursive; a missing path is not an error.
    void removePath(const std::string& path);
    std::string readFile(const std::string& path);

    bool impersonating() const { return run_as_user_.has_value(); }
    const std::optional<std::string>& runAsUser() const { return run_as_user_; }

    std::vector<std::string> wrap(const std::vector<std::string>& argv) const;

private:
    process::ProcessRunner& runner_;
    std::optional<std::string> run_as_user_;
    std::string elevation_command_;
    std::string temp_dir_;

    process::CommandResult runImpersonated(const process::CommandSpec& spec, const std::string& operation);
    static std::string siblingTempPath(const std::string& path);
};

// Releases a temporary resource when it goes out of scope. Cleanup failures
// are logged, never thrown.
class ScopedResource {
public:
    ScopedResource(ResourceManager& manager, ManagedResource resource);
    ~ScopedResource();

    ScopedResource(const ScopedResource&) = delete;
    ScopedResource& operator=(const ScopedResource&) = delete;
    ScopedResource(ScopedResource&& other) noexcept;

    const ManagedResource& resource() const { return resource_; }
    const std::string& path() const { return resource_.path; }

    // Returns false when cleanup failed. Safe to call more than once.
    bool release();

private:
    ResourceManager* manager_;
    ManagedResource resource_;
    bool released_ = false;
};

}}
