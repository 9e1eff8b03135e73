#pragma once

#include "../common/types.hpp"
#include "../process/command_runner.hpp"
#include <optional>
#include <string>

namespace privgate {
namespace proxy {

struct ProxyConfigRequest {
    std::string config_home;
    int port = 0;
    common::SafetyStrategy safety_strategy = common::SafetyStrategy::UNSAFE;
    std::optional<std::string> run_as_user;
};

/**
 * Points the agent at a local responses proxy.
 *
 * Rewrites <config_home>/config.toml with the provider selection at the top,
 * the existing content in the middle and the provider table at the end.
 * Under the unprivileged-user strategy the home belongs to the run-as user,
 * so the read and the write are impersonated.
 */
class ProxyConfigWriter {
public:
    ProxyConfigWriter(process::ProcessRunner& runner, std::string elevation_command = "sudo",
                      std::string temp_dir = "");

    // Returns the path of the written file.
    std::string write(const ProxyConfigRequest& request);

    static std::string render(const std::string& existing, int port);

private:
    process::ProcessRunner& runner_;
    std::string elevation_command_;
    std::string temp_dir_;
};

}}
