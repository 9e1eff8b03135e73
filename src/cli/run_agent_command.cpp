#include "run_agent_command.hpp"
#include "privgate/common/config.hpp"
#include "privgate/common/paths.hpp"
#include "privgate/exec/extra_args.hpp"
#include <chrono>
#include <iostream>

namespace privgate {
namespace cli {

using common::ErrorCode;
using common::ValidationError;

RunAgentCommand::RunAgentCommand() = default;

void RunAgentCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    subcommand->add_option("--prompt", prompt_, "Prompt passed to the agent on stdin");
    subcommand->add_option("--prompt-file", prompt_file_, "File containing the prompt");
    subcommand->add_option("--cd", cd_, "Working directory for the agent")->required();
    subcommand->add_option("--codex-home", codex_home_, "Agent configuration home directory");
    subcommand->add_option("--extra-args", extra_args_,
                           "Additional agent arguments as a JSON array or shell string");
    subcommand->add_option("--output-file", output_file_, "Where the agent writes its final message");
    subcommand->add_option("--output-schema", output_schema_, "Inline JSON schema for the final message");
    subcommand->add_option("--output-schema-file", output_schema_file_, "JSON schema file for the final message");
    subcommand->add_option("--model", model_, "Model name");
    subcommand->add_option("--safety-strategy", safety_strategy_,
                           "One of 'drop-sudo', 'read-only', 'unprivileged-user' or 'unsafe'")
        ->capture_default_str();
    subcommand->add_option("--codex-user", codex_user_, "User to run the agent as under 'unprivileged-user'");
    subcommand->add_option("--sandbox", sandbox_, "One of 'read-only', 'workspace-write' or 'danger-full-access'")
        ->capture_default_str();

    subcommand->callback([this]() { was_called_ = true; });
}

exec::AgentExecRequest RunAgentCommand::buildRequest() const {
    exec::AgentExecRequest request;

    auto prompt = emptyAsAbsent(prompt_);
    auto prompt_file = emptyAsAbsent(prompt_file_);
    if (prompt && prompt_file) {
        throw ValidationError(ErrorCode::INVALID_PROMPT_SOURCE,
                              "Only one of --prompt or --prompt-file may be specified.");
    }
    if (prompt) {
        request.prompt = common::ContentSource::inlineText(*prompt);
    } else if (prompt_file) {
        request.prompt = common::ContentSource::fromFile(*prompt_file);
    } else {
        throw ValidationError(ErrorCode::INVALID_PROMPT_SOURCE,
                              "Either --prompt or --prompt-file must be specified.");
    }

    auto schema = emptyAsAbsent(output_schema_);
    auto schema_file = emptyAsAbsent(output_schema_file_);
    if (schema && schema_file) {
        throw ValidationError(ErrorCode::INVALID_SCHEMA_SOURCE,
                              "Only one of --output-schema or --output-schema-file may be specified.");
    }
    if (schema) {
        request.output_schema = common::ContentSource::inlineText(*schema);
    } else if (schema_file) {
        request.output_schema = common::ContentSource::fromFile(*schema_file);
    }

    request.working_dir = cd_;
    request.config_home = emptyAsAbsent(codex_home_);
    request.extra_args = exec::parseExtraArgs(emptyAsAbsent(extra_args_).value_or(""));
    request.output_file = emptyAsAbsent(output_file_);
    request.model = emptyAsAbsent(model_);
    request.safety_strategy = common::parseSafetyStrategy(emptyAsAbsent(safety_strategy_).value_or("unsafe"));
    request.run_as_user = emptyAsAbsent(codex_user_);
    request.sandbox = common::parseSandboxMode(emptyAsAbsent(sandbox_).value_or("workspace-write"));

    return request;
}

int RunAgentCommand::execute() {
    auto request = buildRequest();

    const auto& global = common::Config::instance().global();

    exec::AgentSettings settings;
    settings.executable = global.agent.executable;
    settings.originator = global.agent.originator;
    settings.elevation_command = global.privilege.elevation_command;
    settings.temp_dir = common::PathManager::instance().getTempDir();
    settings.timeout = std::chrono::seconds(global.process.agent_timeout_seconds);

    process::CommandRunner runner(runnerLimits(), &cancellation_);
    exec::AgentExecutor executor(runner, settings);

    auto result = executor.run(request);

    std::cout << result.final_message;
    std::cout.flush();
    return 0;
}

}}
