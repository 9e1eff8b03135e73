#pragma once

#include <string>
#include <vector>

namespace privgate {
namespace common {

class PathManager {
public:
    static PathManager& instance();

    std::vector<std::string> getConfigSearchPaths() const;
    std::string getUserConfigFile() const;
    std::string getSystemConfigFile() const;

    std::string getTempDir() const;

    // Absolute path of the running binary, used for elevated re-invocation.
    std::string getSelfExecutable() const;
    void setInvocationName(const std::string& argv0) { argv0_ = argv0; }

private:
    PathManager() = default;
    std::string argv0_;

    std::string getXdgConfigHome() const;
};

}}
