#pragma once

#include "../common/config.hpp"
#include <string>
#include <vector>

namespace privgate {
namespace config {

struct ValidationResult {
    bool is_valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

class ConfigValidator {
public:
    ValidationResult validate(const common::GlobalConfig& config);

    static bool validateAbsolutePath(const std::string& path);
    static bool validateCommandName(const std::string& command);
};

}}
