#pragma once

#include "sudoers_editor.hpp"
#include "../common/types.hpp"
#include "../process/command_runner.hpp"
#include <map>
#include <string>
#include <vector>

namespace privgate {
namespace privilege {

enum class RevocationPhase {
    CALLER,
    ROOT
};

std::string to_string(RevocationPhase phase);

struct DropSudoRequest {
    std::string user;
    std::string group;
    RevocationPhase phase = RevocationPhase::CALLER;
};

struct RevokerSettings {
    std::string elevation_command = "sudo";
    std::string sudoers_file = "/etc/sudoers";
    std::string sudoers_dir = "/etc/sudoers.d";
    // Binary re-invoked under elevation for the root phase.
    std::string self_executable;
    // Forwarded to the root phase so both phases share one configuration.
    std::string config_file;
    common::HostOs host_os = common::currentHostOs();
    bool require_root = true;
};

struct RevocationReport {
    bool group_membership_removed = false;
    std::string removal_command;
    std::vector<SudoersEditResult> sudoers_results;
    std::string groups_after;

    bool changed() const;
    std::vector<std::string> failedPaths() const;
};

/**
 * Two-phase removal of a user's passwordless elevation.
 *
 * The caller phase proves elevation works, flushes the cached ticket,
 * re-invokes this binary under elevation with the root-phase flag, and
 * flushes the ticket again. The root phase drops the elevation-group
 * membership and strips the user's rules from the sudoers directory and the
 * primary sudoers file. The phase comes only from the request, never from
 * the process identity, so the root phase can be driven directly.
 */
class PrivilegeRevoker {
public:
    PrivilegeRevoker(process::ProcessRunner& runner, RevokerSettings settings);

    RevocationReport execute(const DropSudoRequest& request);

    RevocationReport runCallerPhase(const DropSudoRequest& request);
    RevocationReport runRootPhase(const DropSudoRequest& request);

    bool isUserInGroup(const std::string& user, const std::string& group);
    bool commandExists(const std::string& binary);

    std::vector<std::string> buildRootPhaseCommand(const DropSudoRequest& request) const;

private:
    using PhaseHandler = RevocationReport (PrivilegeRevoker::*)(const DropSudoRequest&);

    process::ProcessRunner& runner_;
    RevokerSettings settings_;

    static const std::map<RevocationPhase, PhaseHandler>& phaseTable();

    void validateRequest(const DropSudoRequest& request) const;
    void ensurePasswordlessElevation();
    void invalidateElevationTicket();
    void removeGroupMembership(const DropSudoRequest& request, RevocationReport& report);
    std::string queryGroups(const std::string& user);
};

}}
