#pragma once

#include "../common/types.hpp"
#include "../privilege/resource_manager.hpp"
#include "../process/command_runner.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace privgate {
namespace exec {

struct AgentExecRequest {
    common::ContentSource prompt;
    std::optional<std::string> config_home;
    std::string working_dir;
    std::vector<std::string> extra_args;
    std::optional<std::string> output_file;
    std::optional<common::ContentSource> output_schema;
    std::optional<std::string> model;
    common::SafetyStrategy safety_strategy = common::SafetyStrategy::UNSAFE;
    // Only honoured under the unprivileged-user strategy.
    std::optional<std::string> run_as_user;
    common::SandboxMode sandbox = common::SandboxMode::WORKSPACE_WRITE;
};

struct AgentSettings {
    std::string executable = "codex";
    std::string originator = "privgate";
    std::string elevation_command = "sudo";
    common::HostOs host_os = common::currentHostOs();
    std::string temp_dir;
    std::chrono::milliseconds timeout{0};
};

struct ExecutionPlan {
    std::vector<std::string> command;
    std::map<std::string, std::string> environment;
    std::string working_dir;
    std::string output_file;
    std::optional<std::string> schema_file;
    common::SandboxMode sandbox = common::SandboxMode::WORKSPACE_WRITE;
    std::optional<std::string> run_as_user;
};

struct AgentExecResult {
    std::string final_message;
    std::string output_file;
    common::SandboxMode sandbox = common::SandboxMode::WORKSPACE_WRITE;
};

/**
 * Runs one non-interactive agent invocation.
 *
 * Validation happens before any subprocess is started. Output and schema
 * files are allocated through a ResourceManager bound to the impersonated
 * user (if any) and every temporary one is removed again on return, whether
 * the agent succeeded or not. An explicit output file is never deleted.
 */
class AgentExecutor {
public:
    AgentExecutor(process::ProcessRunner& runner, AgentSettings settings);

    AgentExecResult run(const AgentExecRequest& request);

    void validate(const AgentExecRequest& request) const;

    // Pure composition of the command line and environment.
    ExecutionPlan buildPlan(const AgentExecRequest& request,
                            const std::string& executable,
                            const std::string& output_file,
                            const std::optional<std::string>& schema_file,
                            std::map<std::string, std::string> base_environment) const;

    static std::optional<std::string> effectiveRunAsUser(const AgentExecRequest& request);

private:
    process::ProcessRunner& runner_;
    AgentSettings settings_;

    std::string readPrompt(const common::ContentSource& prompt) const;
    std::string resolveExecutable(bool impersonating) const;
    privilege::ScopedResource allocateOutput(const AgentExecRequest& request,
                                             privilege::ResourceManager& resources) const;
    std::optional<privilege::ScopedResource> allocateSchema(const AgentExecRequest& request,
                                                            privilege::ResourceManager& resources) const;
    void spawnAgent(const ExecutionPlan& plan, const std::string& input);
};

}}
