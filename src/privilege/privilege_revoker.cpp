#include "privgate/privilege/privilege_revoker.hpp"
#include "privgate/common/constants.hpp"
#include "privgate/common/logger.hpp"
#include <chrono>
#include <sstream>
#include <unistd.h>

namespace privgate {
namespace privilege {

using common::ErrorCode;
using common::ErrorContext;
using common::Logger;
using common::PrivilegeOperationError;

namespace {

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

ErrorContext revokerContext(const DropSudoRequest& request) {
    return ErrorContext::at("revoker", {{"user", request.user}, {"group", request.group}})
        .with("phase", to_string(request.phase));
}

}

std::string to_string(RevocationPhase phase) {
    switch (phase) {
        case RevocationPhase::CALLER: return "caller";
        case RevocationPhase::ROOT: return "root";
        default: return "unknown";
    }
}

bool RevocationReport::changed() const {
    if (group_membership_removed) {
        return true;
    }
    for (const auto& result : sudoers_results) {
        if (result.changed()) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> RevocationReport::failedPaths() const {
    std::vector<std::string> paths;
    for (const auto& result : sudoers_results) {
        if (result.failed()) {
            paths.push_back(result.path);
        }
    }
    return paths;
}

PrivilegeRevoker::PrivilegeRevoker(process::ProcessRunner& runner, RevokerSettings settings)
    : runner_(runner), settings_(std::move(settings)) {}

const std::map<RevocationPhase, PrivilegeRevoker::PhaseHandler>& PrivilegeRevoker::phaseTable() {
    static const std::map<RevocationPhase, PhaseHandler> table = {
        {RevocationPhase::CALLER, &PrivilegeRevoker::runCallerPhase},
        {RevocationPhase::ROOT, &PrivilegeRevoker::runRootPhase}
    };
    return table;
}

RevocationReport PrivilegeRevoker::execute(const DropSudoRequest& request) {
    const auto& table = phaseTable();
    auto it = table.find(request.phase);
    if (it == table.end()) {
        throw PrivilegeOperationError(ErrorCode::ROOT_PHASE_FAILED,
                                      "Unknown drop-sudo phase", revokerContext(request));
    }
    return (this->*(it->second))(request);
}

void PrivilegeRevoker::validateRequest(const DropSudoRequest& request) const {
    if (!common::isValidAccountName(request.user)) {
        throw common::ValidationError(ErrorCode::INVALID_USERNAME,
                                      "Invalid user name: '" + request.user + "'", revokerContext(request));
    }
    if (!common::isValidAccountName(request.group)) {
        throw common::ValidationError(ErrorCode::INVALID_USERNAME,
                                      "Invalid group name: '" + request.group + "'", revokerContext(request));
    }

    if (settings_.host_os != common::HostOs::LINUX && settings_.host_os != common::HostOs::MACOS) {
        throw PrivilegeOperationError(ErrorCode::UNSUPPORTED_OS,
                                      "Unsupported OS for drop-sudo safety strategy: " +
                                      common::to_string(settings_.host_os),
                                      revokerContext(request));
    }
}

RevocationReport PrivilegeRevoker::runCallerPhase(const DropSudoRequest& request) {
    validateRequest(request);

    Logger::instance().info("[Revoker] Caller phase | user={} | group={}", request.user, request.group);

    ensurePasswordlessElevation();
    invalidateElevationTicket();

    // The ticket must not outlive a failed root phase either.
    auto invalidate_after_failure = [this]() {
        try {
            invalidateElevationTicket();
        } catch (const common::PrivgateError& e) {
            Logger::instance().warn("[Revoker] Ticket invalidation failed | error={}", e.what());
        }
    };

    auto command = buildRootPhaseCommand(request);
    try {
        runner_.run(process::CommandSpec::passthrough(command));
    } catch (const process::CommandFailedError& e) {
        invalidate_after_failure();
        throw PrivilegeOperationError(ErrorCode::ROOT_PHASE_FAILED,
                                      "drop-sudo root phase failed with exit code " +
                                      std::to_string(e.exitCode()),
                                      revokerContext(request));
    } catch (const common::PrivgateError&) {
        invalidate_after_failure();
        throw;
    }

    invalidateElevationTicket();

    Logger::instance().info("[Revoker] Caller phase complete | user={}", request.user);
    return RevocationReport{};
}

RevocationReport PrivilegeRevoker::runRootPhase(const DropSudoRequest& request) {
    validateRequest(request);

    if (settings_.require_root && geteuid() != 0) {
        throw PrivilegeOperationError(ErrorCode::ROOT_REQUIRED,
                                      "drop-sudo root phase must run as root.", revokerContext(request));
    }

    Logger::instance().info("[Revoker] Root phase | user={} | group={} | os={}",
                            request.user, request.group, common::to_string(settings_.host_os));

    RevocationReport report;

    removeGroupMembership(request, report);

    auto dir_results = SudoersEditor::stripUserEntriesFromDirectory(settings_.sudoers_dir, request.user);
    bool dir_changed = false;
    for (auto& result : dir_results) {
        if (result.changed()) {
            Logger::instance().info("[Revoker] {}", result.description);
            dir_changed = true;
        } else if (result.failed()) {
            Logger::instance().error("[Revoker] {}", result.description);
        }
        report.sudoers_results.push_back(std::move(result));
    }
    if (!dir_changed) {
        Logger::instance().info("[Revoker] No {} entries found in {} requiring changes.",
                                request.user, settings_.sudoers_dir);
    }

    auto file_result = SudoersEditor::stripUserEntriesFromFile(settings_.sudoers_file, request.user);
    if (file_result.changed()) {
        Logger::instance().info("[Revoker] {}", file_result.description);
    } else if (file_result.failed()) {
        Logger::instance().error("[Revoker] {}", file_result.description);
    } else {
        Logger::instance().info("[Revoker] No {} entries found in {} requiring changes.",
                                request.user, settings_.sudoers_file);
    }
    report.sudoers_results.push_back(std::move(file_result));

    if (!report.changed()) {
        Logger::instance().info("[Revoker] {} already lacks sudo privileges.", request.user);
    }

    report.groups_after = queryGroups(request.user);
    Logger::instance().info("[Revoker] Groups for {} after cleanup: {}", request.user, report.groups_after);

    auto failed = report.failedPaths();
    if (!failed.empty()) {
        std::string joined;
        for (const auto& path : failed) {
            if (!joined.empty()) {
                joined += ", ";
            }
            joined += path;
        }
        throw PrivilegeOperationError(ErrorCode::SUDOERS_REWRITE_FAILED,
                                      "Could not remove " + request.user + " entries from: " + joined,
                                      revokerContext(request));
    }

    return report;
}

void PrivilegeRevoker::removeGroupMembership(const DropSudoRequest& request, RevocationReport& report) {
    if (!isUserInGroup(request.user, request.group)) {
        Logger::instance().info("[Revoker] {} is not a member of the {} group.", request.user, request.group);
        return;
    }

    std::vector<std::string> command;
    if (settings_.host_os == common::HostOs::LINUX) {
        if (commandExists("deluser")) {
            command = {"deluser", request.user, request.group};
        } else if (commandExists("gpasswd")) {
            command = {"gpasswd", "-d", request.user, request.group};
        }
    } else if (settings_.host_os == common::HostOs::MACOS) {
        if (commandExists("dseditgroup")) {
            command = {"dseditgroup", "-o", "edit", "-d", request.user, "-t", "user", request.group};
        }
    }

    if (command.empty()) {
        throw PrivilegeOperationError(ErrorCode::NO_GROUP_REMOVAL_MECHANISM,
                                      "No command available to remove " + request.user + " from " +
                                      request.group + " (tried deluser, gpasswd, dseditgroup).",
                                      revokerContext(request));
    }

    runner_.run(process::CommandSpec::passthrough(command));

    report.group_membership_removed = true;
    report.removal_command = process::formatCommand(command);
    Logger::instance().info("[Revoker] Used '{}' to drop sudo privilege.", report.removal_command);
}

bool PrivilegeRevoker::isUserInGroup(const std::string& user, const std::string& group) {
    auto spec = process::CommandSpec::capture({"id", "-nG", user});
    spec.ignore_failure = true;
    auto result = runner_.run(spec);
    if (!result.succeeded()) {
        return false;
    }

    std::istringstream stream(result.stdout_data);
    std::string name;
    while (stream >> name) {
        if (name == group) {
            return true;
        }
    }
    return false;
}

bool PrivilegeRevoker::commandExists(const std::string& binary) {
    auto spec = process::CommandSpec::capture({"sh", "-c", "command -v " + binary});
    spec.ignore_failure = true;
    return runner_.run(spec).succeeded();
}

std::vector<std::string> PrivilegeRevoker::buildRootPhaseCommand(const DropSudoRequest& request) const {
    std::vector<std::string> command = {settings_.elevation_command, "-n", settings_.self_executable};
    if (!settings_.config_file.empty()) {
        command.push_back("--config");
        command.push_back(settings_.config_file);
    }
    command.insert(command.end(), {
        "drop-sudo",
        constants::privilege::ROOT_PHASE_FLAG,
        "--user", request.user,
        "--group", request.group
    });
    return command;
}

void PrivilegeRevoker::ensurePasswordlessElevation() {
    try {
        runner_.run(process::CommandSpec::capture({settings_.elevation_command, "-n", "true"}));
    } catch (const common::PrivgateError& e) {
        Logger::instance().debug("[Revoker] Elevation probe failed | error={}", e.what());
        throw PrivilegeOperationError(ErrorCode::ELEVATION_UNAVAILABLE,
                                      "Unexpected: passwordless sudo not available.",
                                      ErrorContext::at("revoker", {{"cause", e.what()}}));
    }
}

void PrivilegeRevoker::invalidateElevationTicket() {
    // Exits non-zero when no ticket exists yet; that is fine.
    auto spec = process::CommandSpec::passthrough({settings_.elevation_command, "-K"});
    spec.ignore_failure = true;
    spec.ignore_cancellation = true;
    spec.timeout = std::chrono::seconds(constants::limits::CLEANUP_TIMEOUT_SECONDS);
    auto result = runner_.run(spec);
    if (!result.succeeded()) {
        Logger::instance().debug("[Revoker] Ticket invalidation returned {}", result.exit_code);
    }
}

std::string PrivilegeRevoker::queryGroups(const std::string& user) {
    auto spec = process::CommandSpec::capture({"id", "-Gn", user});
    spec.ignore_failure = true;
    auto result = runner_.run(spec);
    if (!result.succeeded()) {
        Logger::instance().warn("[Revoker] Group query failed | user={} | exit_code={}", user, result.exit_code);
        return "";
    }
    return trim(result.stdout_data);
}

}}
