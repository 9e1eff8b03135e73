#pragma once

#include "main_command.hpp"
#include "privgate/exec/agent_executor.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace privgate {
namespace cli {

class RunAgentCommand : public MainCommand {
public:
    RunAgentCommand();

    void setup(CLI::App* subcommand);
    int execute();

private:
    std::string prompt_;
    std::string prompt_file_;
    std::string codex_home_;
    std::string cd_;
    std::string extra_args_;
    std::string output_file_;
    std::string output_schema_;
    std::string output_schema_file_;
    std::string model_;
    std::string safety_strategy_ = "unsafe";
    std::string codex_user_;
    std::string sandbox_ = "workspace-write";

    exec::AgentExecRequest buildRequest() const;
};

}}
