#pragma once

#include <string>
#include <optional>
#include <cstddef>

namespace privgate {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

struct LoggingConfig {
    LogLevel level;
    LogFormat format;
    std::string file;
    size_t rotation_size_mb;
    size_t max_files;
};

struct PrivilegeConfig {
    std::string elevation_command;
    std::string default_user;
    std::string default_group;
    std::string sudoers_file;
    std::string sudoers_dir;
};

struct AgentConfig {
    std::string executable;
    std::string originator;
};

struct ProcessConfig {
    size_t max_capture_bytes;
    int command_timeout_seconds;
    int agent_timeout_seconds;
};

struct GlobalConfig {
    LoggingConfig logging;
    PrivilegeConfig privilege;
    AgentConfig agent;
    ProcessConfig process;
};

LogLevel parseLogLevel(const std::string& value);
std::string to_string(LogLevel level);

class Config {
public:
    static Config& instance();

    bool load(const std::string& config_file = "");
    bool loadFromString(const std::string& content, const std::string& source_name = "inline");

    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }

    std::optional<std::string> findBestConfig() const;
    std::string getConfigPath() const { return current_config_path_; }

    static GlobalConfig createDefaultConfig();

private:
    Config();
    GlobalConfig global_;
    std::string current_config_path_;

    bool tryLoadTomlFile(const std::string& path);
};

}}
