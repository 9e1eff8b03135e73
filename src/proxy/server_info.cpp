#include "privgate/proxy/server_info.hpp"
#include "privgate/common/error_codes.hpp"
#include "privgate/common/logger.hpp"
#include "privgate/process/cancellation.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iterator>
#include <thread>

namespace privgate {
namespace proxy {

using common::Logger;

int readServerInfo(const std::string& path, const ServerInfoPolicy& policy) {
    for (int attempt = 0; attempt < policy.attempts; ++attempt) {
        if (attempt > 0) {
            std::this_thread::sleep_for(policy.retry_interval);
        }
        if (process::CancellationToken::interruptRequested()) {
            break;
        }

        std::ifstream file(path);
        if (!file) {
            Logger::instance().debug("[ServerInfo] Not readable yet | path={} | attempt={}", path, attempt + 1);
            continue;
        }

        std::string contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

        try {
            auto info = nlohmann::json::parse(contents);
            if (info.is_object() && info.contains("port") && info["port"].is_number()) {
                int port = info["port"].get<int>();
                Logger::instance().debug("[ServerInfo] Port found | path={} | port={}", path, port);
                return port;
            }
            Logger::instance().debug("[ServerInfo] No numeric port yet | path={} | attempt={}", path, attempt + 1);
        } catch (const nlohmann::json::parse_error& e) {
            Logger::instance().warn("[ServerInfo] Error reading server info | path={} | error={}", path, e.what());
        }
    }

    throw common::ServerInfoError("Failed to read server info from " + path,
                                  common::ErrorContext::at("server_info", {{"path", path}})
                                      .with("attempts", std::to_string(policy.attempts)));
}

}}
