#include "privgate/proxy/proxy_config.hpp"
#include "privgate/common/constants.hpp"
#include "privgate/common/logger.hpp"
#include "privgate/privilege/resource_manager.hpp"
#include <filesystem>
#include <fmt/format.h>

namespace privgate {
namespace proxy {

using common::ConfigWriteError;
using common::ErrorCode;
using common::ErrorContext;
using common::Logger;

ProxyConfigWriter::ProxyConfigWriter(process::ProcessRunner& runner, std::string elevation_command,
                                     std::string temp_dir)
    : runner_(runner), elevation_command_(std::move(elevation_command)), temp_dir_(std::move(temp_dir)) {}

std::string ProxyConfigWriter::render(const std::string& existing, int port) {
    namespace proxy = constants::proxy;

    return fmt::format("# Added by {app}.\n"
                       "model_provider = \"{provider}\"\n"
                       "\n"
                       "\n"
                       "{existing}"
                       "\n"
                       "\n"
                       "# Added by {app}.\n"
                       "[model_providers.{provider}]\n"
                       "name = \"{name}\"\n"
                       "base_url = \"http://127.0.0.1:{port}/v1\"\n"
                       "wire_api = \"responses\"\n",
                       fmt::arg("app", constants::system::APPLICATION_NAME),
                       fmt::arg("provider", proxy::MODEL_PROVIDER),
                       fmt::arg("existing", existing),
                       fmt::arg("name", proxy::PROVIDER_NAME),
                       fmt::arg("port", port));
}

std::string ProxyConfigWriter::write(const ProxyConfigRequest& request) {
    if (request.config_home.empty()) {
        throw common::ValidationError(ErrorCode::INVALID_CONFIG, "A config home directory is required.");
    }
    if (request.port <= 0 || request.port > 65535) {
        throw common::ValidationError(ErrorCode::INVALID_CONFIG,
                                      "Invalid proxy port: " + std::to_string(request.port));
    }

    std::optional<std::string> run_as_user;
    if (request.safety_strategy == common::SafetyStrategy::UNPRIVILEGED_USER) {
        if (!request.run_as_user || request.run_as_user->empty()) {
            throw common::ValidationError(ErrorCode::MISSING_RUN_AS_USER,
                                          "A run-as user must be specified when using the "
                                          "'unprivileged-user' safety strategy.");
        }
        run_as_user = request.run_as_user;
    }

    std::string path = (std::filesystem::path(request.config_home) / constants::proxy::CONFIG_FILE_NAME).string();
    auto ctx = ErrorContext::at("proxy_config", {{"path", path}});

    privilege::ResourceManager resources(runner_, run_as_user, elevation_command_, temp_dir_);

    std::string existing;
    try {
        existing = resources.readFile(path);
    } catch (const common::ResourceError& e) {
        Logger::instance().debug("[Proxy] No existing config | path={} | error={}", path, e.what());
    }

    if (!run_as_user) {
        std::error_code ec;
        std::filesystem::create_directories(request.config_home, ec);
        if (ec) {
            throw ConfigWriteError("Failed to create " + request.config_home + ": " + ec.message(), ctx);
        }
    }

    try {
        resources.writeFile(path, render(existing, request.port));
    } catch (const common::ResourceError& e) {
        throw ConfigWriteError(std::string("Failed to write proxy config: ") + e.what(), ctx);
    }

    Logger::instance().info("[Proxy] Config written | path={} | port={} | impersonated={}",
                            path, request.port, run_as_user.has_value());
    return path;
}

}}
