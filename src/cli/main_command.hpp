#pragma once

#include "privgate/process/cancellation.hpp"
#include "privgate/process/command_runner.hpp"
#include <CLI/CLI.hpp>
#include <optional>
#include <string>

namespace privgate {
namespace cli {

class MainCommand {
public:
    MainCommand();
    virtual ~MainCommand();

    bool wasCalled() const { return was_called_; }

    // Blank or whitespace-only option values count as not given.
    static std::optional<std::string> emptyAsAbsent(const std::string& value);

protected:
    CLI::App* subcommand_ = nullptr;
    bool was_called_ = false;

    process::RunnerLimits runnerLimits() const;
    process::CancellationToken cancellation_;
};

}}
