#include "privgate/privilege/resource_manager.hpp"
#include "privgate/common/constants.hpp"
#include "privgate/common/logger.hpp"
#include "privgate/common/paths.hpp"
#include <atomic>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <unistd.h>

namespace privgate {
namespace privilege {

using common::ErrorCode;
using common::ErrorContext;
using common::Logger;
using common::ResourceError;

namespace {

std::string trimTrailingNewlines(std::string value) {
    while (!value.empty() && (value.back() == '\n' || value.back() == '\r')) {
        value.pop_back();
    }
    return value;
}

ErrorContext resourceContext(const std::string& operation, const std::string& path) {
    return ErrorContext::at("resource", {{"operation", operation}, {"path", path}});
}

}

ManagedResource ManagedResource::explicitPath(std::string path) {
    ManagedResource resource;
    resource.kind = ResourceKind::EXPLICIT;
    resource.path = std::move(path);
    return resource;
}

ManagedResource ManagedResource::temporary(std::string path, std::string cleanup_path,
                                           std::optional<std::string> owner) {
    ManagedResource resource;
    resource.kind = ResourceKind::TEMPORARY;
    resource.path = std::move(path);
    resource.cleanup_path = std::move(cleanup_path);
    resource.owner = std::move(owner);
    return resource;
}

std::vector<std::string> impersonationPrefix(const std::string& elevation_command, const std::string& user) {
    return {elevation_command, "-n", "-u", user, "--"};
}

ResourceManager::ResourceManager(process::ProcessRunner& runner,
                                 std::optional<std::string> run_as_user,
                                 std::string elevation_command,
                                 std::string temp_dir)
    : runner_(runner),
      run_as_user_(std::move(run_as_user)),
      elevation_command_(std::move(elevation_command)),
      temp_dir_(std::move(temp_dir)) {
    if (temp_dir_.empty()) {
        temp_dir_ = common::PathManager::instance().getTempDir();
    }
}

std::vector<std::string> ResourceManager::wrap(const std::vector<std::string>& argv) const {
    if (!run_as_user_) {
        return argv;
    }
    auto command = impersonationPrefix(elevation_command_, *run_as_user_);
    command.insert(command.end(), argv.begin(), argv.end());
    return command;
}

process::CommandResult ResourceManager::runImpersonated(const process::CommandSpec& spec,
                                                        const std::string& operation) {
    process::CommandSpec wrapped = spec;
    wrapped.argv = wrap(spec.argv);

    Logger::instance().debug("[Resource] {} as {} | command={}", operation, *run_as_user_,
                             process::formatCommand(wrapped.argv));
    try {
        return runner_.run(wrapped);
    } catch (const process::CommandFailedError& e) {
        auto ctx = resourceContext(operation, spec.argv.empty() ? "" : spec.argv.back());
        ctx.details["exit_code"] = std::to_string(e.exitCode());
        ctx.details["stderr"] = trimTrailingNewlines(e.stderrData());
        throw ResourceError(operation + " as " + *run_as_user_ + " failed: " + e.what(), ctx);
    } catch (const process::SpawnError& e) {
        throw ResourceError(operation + " as " + *run_as_user_ + " failed: " + e.what(),
                            resourceContext(operation, spec.argv.empty() ? "" : spec.argv.back()));
    }
}

std::string ResourceManager::createTempDirectory(const std::string& prefix) {
    if (run_as_user_) {
        auto result = runImpersonated(process::CommandSpec::capture({"mktemp", "-d", "-t", prefix + "XXXXXX"}),
                                      "mktemp");
        auto dir = trimTrailingNewlines(result.stdout_data);
        if (dir.empty()) {
            throw ResourceError("mktemp as " + *run_as_user_ + " returned no path",
                                resourceContext("mktemp", prefix));
        }
        return dir;
    }

    std::string pattern = (std::filesystem::path(temp_dir_) / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (mkdtemp(buffer.data()) == nullptr) {
        throw ResourceError("Failed to create temporary directory " + pattern + ": " + std::strerror(errno),
                            resourceContext("mkdtemp", pattern));
    }

    std::string dir(buffer.data());
    Logger::instance().debug("[Resource] Temporary directory created | path={}", dir);
    return dir;
}

void ResourceManager::writeFile(const std::string& path, const std::string& content) {
    std::string temp_path = siblingTempPath(path);

    if (run_as_user_) {
        process::CommandSpec spec;
        spec.argv = {"tee", temp_path};
        spec.stdin_mode = process::StdinMode::PIPE;
        spec.input = content;
        spec.stdout_mode = process::OutputMode::DISCARD;
        spec.stderr_mode = process::OutputMode::CAPTURE;
        runImpersonated(spec, "tee");

        try {
            moveFile(temp_path, path);
        } catch (const ResourceError&) {
            try {
                removePath(temp_path);
            } catch (const ResourceError& cleanup) {
                Logger::instance().warn("[Resource] Stale temporary file left | path={} | error={}",
                                        temp_path, cleanup.what());
            }
            throw;
        }
        return;
    }

    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw ResourceError("Failed to open " + temp_path + ": " + std::strerror(errno),
                                resourceContext("write", path));
        }
        out << content;
        out.flush();
        if (!out) {
            std::error_code ignore;
            std::filesystem::remove(temp_path, ignore);
            throw ResourceError("Failed to write " + temp_path, resourceContext("write", path));
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignore;
        std::filesystem::remove(temp_path, ignore);
        throw ResourceError("Failed to move " + temp_path + " to " + path + ": " + ec.message(),
                            resourceContext("write", path));
    }
}

void ResourceManager::moveFile(const std::string& from, const std::string& to) {
    if (run_as_user_) {
        runImpersonated(process::CommandSpec::capture({"mv", "-f", from, to}), "mv");
        return;
    }

    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (ec) {
        throw ResourceError("Failed to move " + from + " to " + to + ": " + ec.message(),
                            resourceContext("move", to));
    }
}

void ResourceManager::removePath(const std::string& path) {
    if (run_as_user_) {
        // Cleanup still has to happen after the run was cancelled.
        auto spec = process::CommandSpec::capture({"rm", "-rf", path});
        spec.ignore_cancellation = true;
        spec.timeout = std::chrono::seconds(constants::limits::CLEANUP_TIMEOUT_SECONDS);
        runImpersonated(spec, "rm");
        return;
    }

    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
        throw ResourceError("Failed to remove " + path + ": " + ec.message(), resourceContext("remove", path));
    }
}

std::string ResourceManager::readFile(const std::string& path) {
    if (run_as_user_) {
        auto result = runImpersonated(process::CommandSpec::capture({"cat", path}), "cat");
        if (result.stdout_truncated) {
            throw ResourceError("File exceeds the capture limit: " + path, resourceContext("read", path));
        }
        return result.stdout_data;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ResourceError("Failed to read " + path + ": " + std::strerror(errno), resourceContext("read", path));
    }
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

std::string ResourceManager::siblingTempPath(const std::string& path) {
    static std::atomic<unsigned> counter{0};

    std::filesystem::path target(path);
    std::string name = "." + target.filename().string() + ".privgate-" +
                       std::to_string(getpid()) + "-" + std::to_string(counter++);
    return (target.parent_path() / name).string();
}

ScopedResource::ScopedResource(ResourceManager& manager, ManagedResource resource)
    : manager_(&manager), resource_(std::move(resource)) {}

ScopedResource::ScopedResource(ScopedResource&& other) noexcept
    : manager_(other.manager_), resource_(std::move(other.resource_)), released_(other.released_) {
    other.released_ = true;
}

ScopedResource::~ScopedResource() {
    release();
}

bool ScopedResource::release() {
    if (released_) {
        return true;
    }
    released_ = true;

    if (resource_.kind != ResourceKind::TEMPORARY || resource_.cleanup_path.empty()) {
        return true;
    }

    try {
        manager_->removePath(resource_.cleanup_path);
        Logger::instance().debug("[Resource] Released | path={}", resource_.cleanup_path);
        return true;
    } catch (const common::PrivgateError& e) {
        Logger::instance().warn("[Resource] {} | path={} | error={}",
                                common::ErrorCodeHelper::toString(ErrorCode::RESOURCE_CLEANUP_FAILED),
                                resource_.cleanup_path, e.what());
    } catch (const std::exception& e) {
        Logger::instance().warn("[Resource] {} | path={} | error={}",
                                common::ErrorCodeHelper::toString(ErrorCode::RESOURCE_CLEANUP_FAILED),
                                resource_.cleanup_path, e.what());
    }
    return false;
}

}}
