#pragma once

#include <string>
#include <cstddef>

namespace privgate {
namespace constants {

namespace version {
    constexpr const char* CLI_VERSION = "1.0.0";

    inline std::string getFullVersion() {
        return std::string("privgate v") + CLI_VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "privgate";
    constexpr const char* CONFIG_ENV = "PRIVGATE_CONFIG";
    constexpr const char* SYSTEM_CONFIG_FILE = "/etc/privgate/privgate.toml";
    constexpr const char* CONFIG_FILE_NAME = "privgate.toml";
}

namespace privilege {
    constexpr const char* ELEVATION_COMMAND = "sudo";
    constexpr const char* DEFAULT_USER = "runner";
    constexpr const char* DEFAULT_GROUP = "sudo";
    constexpr const char* SUDOERS_FILE = "/etc/sudoers";
    constexpr const char* SUDOERS_DIR = "/etc/sudoers.d";
    constexpr const char* ROOT_PHASE_FLAG = "--root-phase";
}

namespace agent {
    constexpr const char* EXECUTABLE = "codex";
    constexpr const char* EXEC_SUBCOMMAND = "exec";
    constexpr const char* SKIP_REPO_CHECK_FLAG = "--skip-git-repo-check";
    constexpr const char* CD_FLAG = "--cd";
    constexpr const char* OUTPUT_LAST_MESSAGE_FLAG = "--output-last-message";
    constexpr const char* OUTPUT_SCHEMA_FLAG = "--output-schema";
    constexpr const char* MODEL_FLAG = "--model";
    constexpr const char* SANDBOX_FLAG = "--sandbox";

    constexpr const char* HOME_ENV = "CODEX_HOME";
    constexpr const char* ORIGINATOR_ENV = "CODEX_INTERNAL_ORIGINATOR_OVERRIDE";
    constexpr const char* DEFAULT_ORIGINATOR = "privgate";

    constexpr const char* OUTPUT_DIR_PREFIX = "privgate-exec-";
    constexpr const char* OUTPUT_FILE_NAME = "output.md";
    constexpr const char* SCHEMA_DIR_PREFIX = "privgate-schema-";
    constexpr const char* SCHEMA_FILE_NAME = "schema.json";
}

namespace proxy {
    constexpr const char* MODEL_PROVIDER = "responses-proxy";
    constexpr const char* PROVIDER_NAME = "Responses Proxy";
    constexpr const char* CONFIG_FILE_NAME = "config.toml";
    constexpr int SERVER_INFO_ATTEMPTS = 100;
    constexpr int SERVER_INFO_RETRY_MS = 100;
}

namespace limits {
    constexpr size_t DEFAULT_MAX_CAPTURE_BYTES = 16 * 1024 * 1024;
    constexpr int DEFAULT_COMMAND_TIMEOUT_SECONDS = 0;
    constexpr int DEFAULT_AGENT_TIMEOUT_SECONDS = 0;
    constexpr int POLL_INTERVAL_MS = 100;
    constexpr int KILL_GRACE_MS = 2000;
    constexpr int CLEANUP_TIMEOUT_SECONDS = 30;

    constexpr size_t DEFAULT_LOG_ROTATION_SIZE_MB = 10;
    constexpr size_t DEFAULT_LOG_MAX_FILES = 3;
}

}
}
