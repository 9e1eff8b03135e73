#include "proxy_config_command.hpp"
#include "privgate/common/config.hpp"
#include "privgate/common/types.hpp"
#include "privgate/proxy/proxy_config.hpp"

namespace privgate {
namespace cli {

ProxyConfigCommand::ProxyConfigCommand() = default;

void ProxyConfigCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    subcommand->add_option("--codex-home", codex_home_, "Agent configuration home directory")->required();
    subcommand->add_option("--port", port_, "Port of the responses proxy")
        ->required()
        ->check(CLI::Range(1, 65535));
    subcommand->add_option("--safety-strategy", safety_strategy_,
                           "One of 'drop-sudo', 'read-only', 'unprivileged-user' or 'unsafe'")
        ->capture_default_str();
    subcommand->add_option("--codex-user", codex_user_,
                           "Owner of the configuration home under 'unprivileged-user'");

    subcommand->callback([this]() { was_called_ = true; });
}

int ProxyConfigCommand::execute() {
    auto strategy = common::parseSafetyStrategy(emptyAsAbsent(safety_strategy_).value_or("unsafe"));
    common::validateSafetyStrategy(strategy, common::currentHostOs());

    proxy::ProxyConfigRequest request;
    request.config_home = codex_home_;
    request.port = port_;
    request.safety_strategy = strategy;
    request.run_as_user = emptyAsAbsent(codex_user_);

    process::CommandRunner runner(runnerLimits(), &cancellation_);
    proxy::ProxyConfigWriter writer(runner, common::Config::instance().global().privilege.elevation_command);
    writer.write(request);
    return 0;
}

}}
