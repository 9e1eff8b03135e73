#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <csignal>
#include <string>

#include "privgate/common/config.hpp"
#include "privgate/common/constants.hpp"
#include "privgate/common/error_codes.hpp"
#include "privgate/common/logger.hpp"
#include "privgate/common/paths.hpp"
#include "privgate/config/validator.hpp"
#include "privgate/process/cancellation.hpp"
#include "cli/main_command.hpp"
#include "cli/drop_sudo_command.hpp"
#include "cli/run_agent_command.hpp"
#include "cli/proxy_config_command.hpp"
#include "cli/server_info_command.hpp"

// The configuration decides subcommand defaults, so it is located before
// CLI11 parses anything.
std::string find_config_argument(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind("--config=", 0) == 0) {
            return arg.substr(9);
        }
    }
    return "";
}

int main(int argc, char** argv) {
    try {
        auto& path_manager = privgate::common::PathManager::instance();
        path_manager.setInvocationName(argc > 0 ? argv[0] : "");

        std::signal(SIGPIPE, SIG_IGN);
        privgate::process::CancellationToken::installSignalHandlers();

        auto& config = privgate::common::Config::instance();
        std::string config_file = find_config_argument(argc, argv);
        if (!config.load(config_file)) {
            std::cerr << "Error: Failed to load configuration"
                      << (config_file.empty() ? "" : " from " + config_file) << std::endl;
            return 1;
        }

        privgate::config::ConfigValidator validator;
        auto validation = validator.validate(config.global());
        for (const auto& warning : validation.warnings) {
            std::cerr << "Warning: " << warning << std::endl;
        }
        if (!validation.is_valid) {
            for (const auto& error : validation.errors) {
                std::cerr << "Error: " << error << std::endl;
            }
            return 1;
        }

        privgate::common::Logger::instance().initialize(config.global().logging);

        CLI::App app{"Privilege-boundary launcher for an untrusted coding agent",
                     privgate::constants::system::APPLICATION_NAME};
        app.set_version_flag("--version,-v", privgate::constants::version::getFullVersion());
        app.require_subcommand(0, 1);

        std::string config_option;
        std::string log_level;
        app.add_option("-c,--config", config_option, "Configuration file path");
        app.add_option("--log-level", log_level, "Override the log level (ERROR, WARN, INFO, DEBUG)");

        auto drop_sudo_cmd = std::make_unique<privgate::cli::DropSudoCommand>();
        auto run_agent_cmd = std::make_unique<privgate::cli::RunAgentCommand>();
        auto proxy_config_cmd = std::make_unique<privgate::cli::ProxyConfigCommand>();
        auto server_info_cmd = std::make_unique<privgate::cli::ServerInfoCommand>();

        drop_sudo_cmd->setup(app.add_subcommand("drop-sudo", "Drop sudo privileges for the configured user"));
        run_agent_cmd->setup(app.add_subcommand("run-agent", "Run the agent non-interactively"));
        proxy_config_cmd->setup(app.add_subcommand("write-proxy-config",
                                                   "Point the agent configuration at the responses proxy"));
        server_info_cmd->setup(app.add_subcommand("read-server-info",
                                                  "Read the port from the responses proxy server info"));

        CLI11_PARSE(app, argc, argv);

        if (!log_level.empty()) {
            privgate::common::Logger::instance().setLevel(privgate::common::parseLogLevel(log_level));
        }

        if (drop_sudo_cmd->wasCalled()) {
            return drop_sudo_cmd->execute();
        } else if (run_agent_cmd->wasCalled()) {
            return run_agent_cmd->execute();
        } else if (proxy_config_cmd->wasCalled()) {
            return proxy_config_cmd->execute();
        } else if (server_info_cmd->wasCalled()) {
            return server_info_cmd->execute();
        } else {
            std::cout << app.help() << std::endl;
            return 0;
        }

    } catch (const CLI::ParseError& e) {
        return 1;
    } catch (const privgate::common::PrivgateError& e) {
        auto& logger = privgate::common::Logger::instance();
        logger.debug("[Main] Failed | {}", privgate::common::ErrorCodeHelper::describe(e.code(), e.context()));
        logger.flush();
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        privgate::common::Logger::instance().flush();
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
