#include "server_info_command.hpp"
#include "privgate/common/constants.hpp"
#include "privgate/proxy/server_info.hpp"
#include <iostream>

namespace privgate {
namespace cli {

ServerInfoCommand::ServerInfoCommand() = default;

void ServerInfoCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    subcommand->add_option("server_info_file", server_info_file_, "Path to the server info file")
        ->required();

    subcommand->callback([this]() { was_called_ = true; });
}

int ServerInfoCommand::execute() {
    proxy::ServerInfoPolicy policy;
    policy.attempts = constants::proxy::SERVER_INFO_ATTEMPTS;
    policy.retry_interval = std::chrono::milliseconds(constants::proxy::SERVER_INFO_RETRY_MS);

    int port = proxy::readServerInfo(server_info_file_, policy);
    std::cout << port << std::endl;
    return 0;
}

}}
