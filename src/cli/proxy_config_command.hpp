#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace privgate {
namespace cli {

class ProxyConfigCommand : public MainCommand {
public:
    ProxyConfigCommand();

    void setup(CLI::App* subcommand);
    int execute();

private:
    std::string codex_home_;
    int port_ = 0;
    std::string safety_strategy_ = "unsafe";
    std::string codex_user_;
};

}}
