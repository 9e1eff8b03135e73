#include "main_command.hpp"
#include "privgate/common/config.hpp"
#include <chrono>

namespace privgate {
namespace cli {

MainCommand::MainCommand() = default;
MainCommand::~MainCommand() = default;

std::optional<std::string> MainCommand::emptyAsAbsent(const std::string& value) {
    if (value.find_first_not_of(" \t\r\n") == std::string::npos) {
        return std::nullopt;
    }
    return value;
}

process::RunnerLimits MainCommand::runnerLimits() const {
    const auto& process_config = common::Config::instance().global().process;

    process::RunnerLimits limits;
    limits.max_capture_bytes = process_config.max_capture_bytes;
    limits.default_timeout = std::chrono::seconds(process_config.command_timeout_seconds);
    return limits;
}

}}
