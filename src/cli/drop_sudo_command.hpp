#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace privgate {
namespace cli {

class DropSudoCommand : public MainCommand {
public:
    DropSudoCommand();

    void setup(CLI::App* subcommand);
    int execute();

private:
    std::string user_;
    std::string group_;
    bool root_phase_ = false;
};

}}
