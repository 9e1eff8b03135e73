#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace privgate {
namespace cli {

class ServerInfoCommand : public MainCommand {
public:
    ServerInfoCommand();

    void setup(CLI::App* subcommand);
    int execute();

private:
    std::string server_info_file_;
};

}}
