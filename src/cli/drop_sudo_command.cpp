#include "drop_sudo_command.hpp"
#include "privgate/common/config.hpp"
#include "privgate/common/constants.hpp"
#include "privgate/common/logger.hpp"
#include "privgate/common/paths.hpp"
#include "privgate/privilege/privilege_revoker.hpp"

namespace privgate {
namespace cli {

DropSudoCommand::DropSudoCommand() = default;

void DropSudoCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    const auto& privilege = common::Config::instance().global().privilege;
    user_ = privilege.default_user;
    group_ = privilege.default_group;

    subcommand->add_option("--user", user_, "User to modify")->capture_default_str();
    subcommand->add_option("--group", group_, "Group granting sudo privileges")->capture_default_str();
    subcommand->add_flag(constants::privilege::ROOT_PHASE_FLAG, root_phase_, "internal")->group("");

    subcommand->callback([this]() { was_called_ = true; });
}

int DropSudoCommand::execute() {
    const auto& privilege = common::Config::instance().global().privilege;

    privilege::RevokerSettings settings;
    settings.elevation_command = privilege.elevation_command;
    settings.sudoers_file = privilege.sudoers_file;
    settings.sudoers_dir = privilege.sudoers_dir;
    settings.self_executable = common::PathManager::instance().getSelfExecutable();
    settings.config_file = common::Config::instance().getConfigPath();

    privilege::DropSudoRequest request;
    request.user = user_;
    request.group = group_;
    request.phase = root_phase_ ? privilege::RevocationPhase::ROOT : privilege::RevocationPhase::CALLER;

    process::CommandRunner runner(runnerLimits(), &cancellation_);
    privilege::PrivilegeRevoker revoker(runner, settings);

    auto report = revoker.execute(request);

    if (request.phase == privilege::RevocationPhase::ROOT) {
        common::Logger::instance().info("[DropSudo] Root phase finished | user={} | changed={}",
                                        request.user, report.changed());
    }
    return 0;
}

}}
