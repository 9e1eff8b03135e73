#include "privgate/common/config.hpp"
#include "privgate/common/constants.hpp"
#include "privgate/common/paths.hpp"
#include "privgate/common/logger.hpp"
#include <toml.hpp>
#include <filesystem>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <unistd.h>

namespace privgate {
namespace common {

namespace {

void applyTomlValues(GlobalConfig& global, const toml::value& data) {
    if (data.contains("logging")) {
        auto logging_section = data.at("logging");

        if (logging_section.contains("level")) {
            global.logging.level = parseLogLevel(toml::find<std::string>(logging_section, "level"));
        }
        if (logging_section.contains("format")) {
            std::string format_str = toml::find<std::string>(logging_section, "format");
            global.logging.format = (format_str == "json") ? LogFormat::JSON : LogFormat::TEXT;
        }
        if (logging_section.contains("file")) {
            global.logging.file = toml::find<std::string>(logging_section, "file");
        }
        if (logging_section.contains("rotation_size_mb")) {
            global.logging.rotation_size_mb = toml::find<size_t>(logging_section, "rotation_size_mb");
        }
        if (logging_section.contains("max_files")) {
            global.logging.max_files = toml::find<size_t>(logging_section, "max_files");
        }
    }

    if (data.contains("privilege")) {
        auto privilege_section = data.at("privilege");

        if (privilege_section.contains("elevation_command")) {
            global.privilege.elevation_command = toml::find<std::string>(privilege_section, "elevation_command");
        }
        if (privilege_section.contains("default_user")) {
            global.privilege.default_user = toml::find<std::string>(privilege_section, "default_user");
        }
        if (privilege_section.contains("default_group")) {
            global.privilege.default_group = toml::find<std::string>(privilege_section, "default_group");
        }
        if (privilege_section.contains("sudoers_file")) {
            global.privilege.sudoers_file = toml::find<std::string>(privilege_section, "sudoers_file");
        }
        if (privilege_section.contains("sudoers_dir")) {
            global.privilege.sudoers_dir = toml::find<std::string>(privilege_section, "sudoers_dir");
        }
    }

    if (data.contains("agent")) {
        auto agent_section = data.at("agent");

        if (agent_section.contains("executable")) {
            global.agent.executable = toml::find<std::string>(agent_section, "executable");
        }
        if (agent_section.contains("originator")) {
            global.agent.originator = toml::find<std::string>(agent_section, "originator");
        }
    }

    if (data.contains("process")) {
        auto process_section = data.at("process");

        if (process_section.contains("max_capture_bytes")) {
            global.process.max_capture_bytes = toml::find<size_t>(process_section, "max_capture_bytes");
        }
        if (process_section.contains("command_timeout_seconds")) {
            global.process.command_timeout_seconds = toml::find<int>(process_section, "command_timeout_seconds");
        }
        if (process_section.contains("agent_timeout_seconds")) {
            global.process.agent_timeout_seconds = toml::find<int>(process_section, "agent_timeout_seconds");
        }
    }
}

}

LogLevel parseLogLevel(const std::string& value) {
    std::string level = value;
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (level == "DEBUG") return LogLevel::DEBUG;
    if (level == "WARN" || level == "WARNING") return LogLevel::WARN;
    if (level == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN: return "WARN";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
        default: return "INFO";
    }
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

GlobalConfig Config::createDefaultConfig() {
    GlobalConfig config;

    config.logging.level = LogLevel::INFO;
    config.logging.format = LogFormat::TEXT;
    config.logging.file = "";
    config.logging.rotation_size_mb = constants::limits::DEFAULT_LOG_ROTATION_SIZE_MB;
    config.logging.max_files = constants::limits::DEFAULT_LOG_MAX_FILES;

    config.privilege.elevation_command = constants::privilege::ELEVATION_COMMAND;
    config.privilege.default_user = constants::privilege::DEFAULT_USER;
    config.privilege.default_group = constants::privilege::DEFAULT_GROUP;
    config.privilege.sudoers_file = constants::privilege::SUDOERS_FILE;
    config.privilege.sudoers_dir = constants::privilege::SUDOERS_DIR;

    config.agent.executable = constants::agent::EXECUTABLE;
    config.agent.originator = constants::agent::DEFAULT_ORIGINATOR;

    config.process.max_capture_bytes = constants::limits::DEFAULT_MAX_CAPTURE_BYTES;
    config.process.command_timeout_seconds = constants::limits::DEFAULT_COMMAND_TIMEOUT_SECONDS;
    config.process.agent_timeout_seconds = constants::limits::DEFAULT_AGENT_TIMEOUT_SECONDS;

    return config;
}

std::optional<std::string> Config::findBestConfig() const {
    auto paths = PathManager::instance().getConfigSearchPaths();

    for (const auto& path : paths) {
        if (std::filesystem::exists(path) && access(path.c_str(), R_OK) == 0) {
            return path;
        }
    }

    return std::nullopt;
}

bool Config::load(const std::string& config_file) {
    global_ = createDefaultConfig();
    current_config_path_.clear();

    std::string effective_config_file = config_file;
    if (effective_config_file.empty()) {
        auto best = findBestConfig();
        if (!best) {
            Logger::instance().debug("[Config] No configuration file found, using defaults");
            return true;
        }
        effective_config_file = *best;
    }

    if (!tryLoadTomlFile(effective_config_file)) {
        return false;
    }

    current_config_path_ = effective_config_file;
    return true;
}

bool Config::loadFromString(const std::string& content, const std::string& source_name) {
    global_ = createDefaultConfig();

    try {
        std::istringstream stream(content);
        auto data = toml::parse(stream, source_name);
        applyTomlValues(global_, data);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Parse failed | source={} | error={}", source_name, e.what());
        return false;
    }
}

bool Config::tryLoadTomlFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        Logger::instance().error("[Config] File not found | path={}", path);
        return false;
    }

    if (access(path.c_str(), R_OK) != 0) {
        Logger::instance().error("[Config] File not readable | path={}", path);
        return false;
    }

    try {
        auto data = toml::parse(path);
        applyTomlValues(global_, data);

        Logger::instance().debug("[Config] Loaded | path={}", path);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Parse failed | path={} | error={}", path, e.what());
        return false;
    }
}

}}
