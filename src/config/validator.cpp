#include "privgate/config/validator.hpp"
#include "privgate/common/logger.hpp"
#include "privgate/common/types.hpp"
#include <filesystem>
#include <cctype>

namespace privgate {
namespace config {

ValidationResult ConfigValidator::validate(const common::GlobalConfig& config) {
    ValidationResult result;

    common::Logger::instance().debug("[Validator] Starting validation");

    if (!validateCommandName(config.privilege.elevation_command)) {
        result.errors.push_back("privilege.elevation_command: Must be a command name or absolute path");
        result.is_valid = false;
    }

    if (!common::isValidAccountName(config.privilege.default_user)) {
        result.errors.push_back("privilege.default_user: Invalid user name");
        result.is_valid = false;
    }

    if (!common::isValidAccountName(config.privilege.default_group)) {
        result.errors.push_back("privilege.default_group: Invalid group name");
        result.is_valid = false;
    }

    if (!validateAbsolutePath(config.privilege.sudoers_file)) {
        result.errors.push_back("privilege.sudoers_file: Must be an absolute path");
        result.is_valid = false;
    }

    if (!validateAbsolutePath(config.privilege.sudoers_dir)) {
        result.errors.push_back("privilege.sudoers_dir: Must be an absolute path");
        result.is_valid = false;
    }

    if (!validateCommandName(config.agent.executable)) {
        result.errors.push_back("agent.executable: Must be a command name or absolute path");
        result.is_valid = false;
    }

    if (config.agent.originator.empty()) {
        result.warnings.push_back("agent.originator: Empty, originator marker will be blank");
    }

    if (config.process.max_capture_bytes == 0) {
        result.errors.push_back("process.max_capture_bytes: Must be greater than zero");
        result.is_valid = false;
    }

    if (config.process.command_timeout_seconds < 0) {
        result.errors.push_back("process.command_timeout_seconds: Must not be negative");
        result.is_valid = false;
    }

    if (config.process.agent_timeout_seconds < 0) {
        result.errors.push_back("process.agent_timeout_seconds: Must not be negative");
        result.is_valid = false;
    }

    if (config.logging.max_files == 0 || config.logging.rotation_size_mb == 0) {
        result.warnings.push_back("logging: rotation_size_mb and max_files should be positive");
    }

    common::Logger::instance().debug("[Validator] Completed | valid={} | errors={} | warnings={}",
                                     result.is_valid, result.errors.size(), result.warnings.size());

    return result;
}

bool ConfigValidator::validateAbsolutePath(const std::string& path) {
    return !path.empty() && std::filesystem::path(path).is_absolute();
}

bool ConfigValidator::validateCommandName(const std::string& command) {
    if (command.empty()) {
        return false;
    }

    if (command.find('/') != std::string::npos) {
        return validateAbsolutePath(command);
    }

    for (char c : command) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }

    return true;
}

}}
