#include "privgate/common/paths.hpp"
#include "privgate/common/constants.hpp"
#include "privgate/common/logger.hpp"
#include <unistd.h>
#include <filesystem>
#include <cstdlib>
#include <cstring>

namespace privgate {
namespace common {

PathManager& PathManager::instance() {
    static PathManager instance;
    return instance;
}

std::vector<std::string> PathManager::getConfigSearchPaths() const {
    std::vector<std::string> paths;

    if (const char* env = std::getenv(constants::system::CONFIG_ENV)) {
        if (strlen(env) > 0) {
            paths.push_back(env);
        }
    }

    if (getuid() != 0) {
        std::string user_config = getUserConfigFile();
        if (!user_config.empty()) {
            paths.push_back(user_config);
        }
    }

    paths.push_back(getSystemConfigFile());

    return paths;
}

std::string PathManager::getUserConfigFile() const {
    std::string config_home = getXdgConfigHome();
    if (config_home.empty()) {
        return "";
    }
    return config_home + "/privgate/" + constants::system::CONFIG_FILE_NAME;
}

std::string PathManager::getSystemConfigFile() const {
    return constants::system::SYSTEM_CONFIG_FILE;
}

std::string PathManager::getTempDir() const {
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return "/tmp";
    }
    return dir.string();
}

std::string PathManager::getSelfExecutable() const {
    std::error_code ec;
    auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);

    if (!ec && !exe_path.empty()) {
        return exe_path.string();
    }

    Logger::instance().debug("[Paths] /proc/self/exe unavailable, falling back to argv[0] | argv0={}", argv0_);

    if (argv0_.empty()) {
        return constants::system::APPLICATION_NAME;
    }

    if (argv0_.find('/') == std::string::npos) {
        return argv0_;
    }

    auto absolute = std::filesystem::absolute(argv0_, ec);
    return ec ? argv0_ : absolute.string();
}

std::string PathManager::getXdgConfigHome() const {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && strlen(xdg) > 0) {
        return xdg;
    }
    const char* home = std::getenv("HOME");
    return home ? std::string(home) + "/.config" : "";
}

}}
