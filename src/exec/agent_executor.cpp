#include "privgate/exec/agent_executor.hpp"
#include "privgate/common/constants.hpp"
#include "privgate/common/logger.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace privgate {
namespace exec {

using common::AgentProcessError;
using common::ErrorCode;
using common::ErrorContext;
using common::FinalReadError;
using common::Logger;
using common::SafetyStrategy;
using common::ValidationError;
using privilege::ManagedResource;
using privilege::ScopedResource;

namespace {

ErrorContext execContext(const std::string& key, const std::string& value) {
    return ErrorContext::at("agent_executor", {{key, value}});
}

}

AgentExecutor::AgentExecutor(process::ProcessRunner& runner, AgentSettings settings)
    : runner_(runner), settings_(std::move(settings)) {}

std::optional<std::string> AgentExecutor::effectiveRunAsUser(const AgentExecRequest& request) {
    if (request.safety_strategy != SafetyStrategy::UNPRIVILEGED_USER) {
        return std::nullopt;
    }
    return request.run_as_user;
}

void AgentExecutor::validate(const AgentExecRequest& request) const {
    common::validateSafetyStrategy(request.safety_strategy, settings_.host_os);

    if (request.prompt.value.empty()) {
        throw ValidationError(ErrorCode::INVALID_PROMPT_SOURCE,
                              "Either a prompt or a prompt file must be specified.");
    }

    if (request.output_schema && request.output_schema->value.empty()) {
        throw ValidationError(ErrorCode::INVALID_SCHEMA_SOURCE, "Output schema source is empty.");
    }

    if (request.safety_strategy == SafetyStrategy::UNPRIVILEGED_USER) {
        if (!request.run_as_user || request.run_as_user->empty()) {
            throw ValidationError(ErrorCode::MISSING_RUN_AS_USER,
                                  "A run-as user must be specified when using the 'unprivileged-user' "
                                  "safety strategy.");
        }
        if (!common::isValidAccountName(*request.run_as_user)) {
            throw ValidationError(ErrorCode::INVALID_USERNAME,
                                  "Invalid run-as user: '" + *request.run_as_user + "'",
                                  execContext("user", *request.run_as_user));
        }
    }
}

AgentExecResult AgentExecutor::run(const AgentExecRequest& request) {
    validate(request);

    std::string input = readPrompt(request.prompt);
    auto run_as_user = effectiveRunAsUser(request);
    std::string executable = resolveExecutable(run_as_user.has_value());

    privilege::ResourceManager resources(runner_, run_as_user, settings_.elevation_command, settings_.temp_dir);

    ScopedResource output = allocateOutput(request, resources);
    std::optional<ScopedResource> schema = allocateSchema(request, resources);

    std::optional<std::string> schema_file;
    if (schema) {
        schema_file = schema->path();
    }

    auto plan = buildPlan(request, executable, output.path(), schema_file, process::currentEnvironment());

    spawnAgent(plan, input);

    AgentExecResult result;
    result.output_file = plan.output_file;
    result.sandbox = plan.sandbox;
    try {
        result.final_message = resources.readFile(plan.output_file);
    } catch (const common::ResourceError& e) {
        throw FinalReadError("Failed to read final message from " + plan.output_file + ": " + e.what(),
                             execContext("output_file", plan.output_file));
    }

    Logger::instance().info("[Agent] Completed | output_file={} | bytes={}",
                            plan.output_file, result.final_message.size());
    return result;
}

ExecutionPlan AgentExecutor::buildPlan(const AgentExecRequest& request,
                                       const std::string& executable,
                                       const std::string& output_file,
                                       const std::optional<std::string>& schema_file,
                                       std::map<std::string, std::string> base_environment) const {
    namespace agent = constants::agent;

    ExecutionPlan plan;
    plan.working_dir = request.working_dir;
    plan.output_file = output_file;
    plan.schema_file = schema_file;
    plan.sandbox = common::effectiveSandboxMode(request.safety_strategy, request.sandbox);
    plan.run_as_user = effectiveRunAsUser(request);

    if (plan.run_as_user) {
        plan.command = privilege::impersonationPrefix(settings_.elevation_command, *plan.run_as_user);
    }

    plan.command.insert(plan.command.end(), {
        executable,
        agent::EXEC_SUBCOMMAND,
        agent::SKIP_REPO_CHECK_FLAG,
        agent::CD_FLAG, request.working_dir,
        agent::OUTPUT_LAST_MESSAGE_FLAG, output_file
    });

    if (schema_file) {
        plan.command.push_back(agent::OUTPUT_SCHEMA_FLAG);
        plan.command.push_back(*schema_file);
    }

    if (request.model) {
        plan.command.push_back(agent::MODEL_FLAG);
        plan.command.push_back(*request.model);
    }

    plan.command.insert(plan.command.end(), request.extra_args.begin(), request.extra_args.end());

    plan.command.push_back(agent::SANDBOX_FLAG);
    plan.command.push_back(common::to_string(plan.sandbox));

    plan.environment = std::move(base_environment);
    auto originator = plan.environment.find(agent::ORIGINATOR_ENV);
    if (originator == plan.environment.end() || originator->second.empty()) {
        plan.environment[agent::ORIGINATOR_ENV] = settings_.originator;
    }
    if (request.config_home) {
        plan.environment[agent::HOME_ENV] = *request.config_home;
    }

    return plan;
}

std::string AgentExecutor::readPrompt(const common::ContentSource& prompt) const {
    if (prompt.kind == common::SourceKind::INLINE) {
        return prompt.value;
    }

    std::ifstream file(prompt.value, std::ios::binary);
    if (!file) {
        throw ValidationError(ErrorCode::PROMPT_UNREADABLE,
                              "Failed to read prompt file " + prompt.value + ": " + std::strerror(errno),
                              execContext("prompt_file", prompt.value));
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw ValidationError(ErrorCode::PROMPT_UNREADABLE,
                              "Failed to read prompt file " + prompt.value,
                              execContext("prompt_file", prompt.value));
    }
    return content;
}

std::string AgentExecutor::resolveExecutable(bool impersonating) const {
    // The impersonated user gets a different PATH, so pin the caller's binary.
    if (!impersonating || settings_.executable.find('/') != std::string::npos) {
        return settings_.executable;
    }

    auto resolved = process::findExecutable(settings_.executable);
    if (!resolved) {
        throw ValidationError(ErrorCode::EXECUTABLE_NOT_FOUND,
                              "Could not find '" + settings_.executable + "' in PATH",
                              execContext("executable", settings_.executable));
    }
    return *resolved;
}

ScopedResource AgentExecutor::allocateOutput(const AgentExecRequest& request,
                                             privilege::ResourceManager& resources) const {
    if (request.output_file) {
        return ScopedResource(resources, ManagedResource::explicitPath(*request.output_file));
    }

    std::string dir = resources.createTempDirectory(constants::agent::OUTPUT_DIR_PREFIX);
    std::string file = (std::filesystem::path(dir) / constants::agent::OUTPUT_FILE_NAME).string();
    Logger::instance().debug("[Agent] Temporary output | path={}", file);
    return ScopedResource(resources, ManagedResource::temporary(file, dir, resources.runAsUser()));
}

std::optional<ScopedResource> AgentExecutor::allocateSchema(const AgentExecRequest& request,
                                                            privilege::ResourceManager& resources) const {
    std::optional<ScopedResource> schema;
    if (!request.output_schema) {
        return schema;
    }

    if (request.output_schema->kind == common::SourceKind::FILE) {
        schema.emplace(resources, ManagedResource::explicitPath(request.output_schema->value));
        return schema;
    }

    std::string dir = resources.createTempDirectory(constants::agent::SCHEMA_DIR_PREFIX);
    std::string file = (std::filesystem::path(dir) / constants::agent::SCHEMA_FILE_NAME).string();
    schema.emplace(resources, ManagedResource::temporary(file, dir, resources.runAsUser()));

    resources.writeFile(file, request.output_schema->value);
    Logger::instance().debug("[Agent] Inline schema written | path={} | bytes={}",
                             file, request.output_schema->value.size());
    return schema;
}

void AgentExecutor::spawnAgent(const ExecutionPlan& plan, const std::string& input) {
    std::string env_prefix;
    auto home = plan.environment.find(constants::agent::HOME_ENV);
    if (home != plan.environment.end()) {
        env_prefix = std::string(constants::agent::HOME_ENV) + "=" + home->second + " ";
    }
    Logger::instance().info("Running: {}{}", env_prefix, process::formatCommand(plan.command));

    process::CommandSpec spec;
    spec.argv = plan.command;
    spec.stdin_mode = process::StdinMode::PIPE;
    spec.input = input;
    spec.stdout_mode = process::OutputMode::INHERIT;
    spec.stderr_mode = process::OutputMode::INHERIT;
    spec.environment = plan.environment;
    spec.ignore_failure = true;
    if (settings_.timeout.count() > 0) {
        spec.timeout = settings_.timeout;
    }

    const std::string& program = plan.command.front();
    process::CommandResult result;
    try {
        result = runner_.run(spec);
    } catch (const process::SpawnError& e) {
        throw AgentProcessError(std::string("Failed to start ") + program + ": " + e.what(), -1,
                                execContext("program", program));
    }

    if (!result.succeeded()) {
        throw AgentProcessError(program + " exited with code " + std::to_string(result.exit_code),
                                result.exit_code, execContext("program", program));
    }
}

}}
