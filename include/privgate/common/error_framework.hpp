#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>

namespace privgate {
namespace common {

template<typename EnumType>
struct ErrorInfo {
    EnumType code;
    const char* code_str;
    const char* default_message;
};

// Where an error came from plus the key/value pairs that identify the
// object it concerns (path, user, command).
struct ErrorContext {
    std::string component;
    std::map<std::string, std::string> details;
    std::optional<std::chrono::system_clock::time_point> when;

    static ErrorContext at(std::string component, std::map<std::string, std::string> details = {}) {
        return ErrorContext{std::move(component), std::move(details), std::chrono::system_clock::now()};
    }

    ErrorContext& with(const std::string& key, std::string value) {
        details[key] = std::move(value);
        return *this;
    }

    bool empty() const { return component.empty() && details.empty(); }
};

inline std::string formatContext(const ErrorContext& ctx) {
    std::string result;
    for (const auto& [key, value] : ctx.details) {
        if (!result.empty()) {
            result += " | ";
        }
        result += key + "=" + value;
    }
    return result;
}

// Code table specialised once per error enum via getInfoMap().
template<typename EnumType>
class ErrorRegistry {
public:
    static const ErrorInfo<EnumType>& getInfo(EnumType code) {
        const auto& map = getInfoMap();
        auto it = map.find(code);
        if (it != map.end()) {
            return it->second;
        }
        static const ErrorInfo<EnumType> unknown{EnumType{}, "UNKNOWN", "Unknown error"};
        return unknown;
    }

    static const char* toString(EnumType code) { return getInfo(code).code_str; }
    static const char* getMessage(EnumType code) { return getInfo(code).default_message; }

    // "CODE [component] | key=value | ..." for log lines.
    static std::string describe(EnumType code, const ErrorContext& ctx) {
        std::string line = toString(code);
        if (!ctx.component.empty()) {
            line += " [" + ctx.component + "]";
        }
        std::string details = formatContext(ctx);
        if (!details.empty()) {
            line += " | " + details;
        }
        return line;
    }

protected:
    static const std::unordered_map<EnumType, ErrorInfo<EnumType>>& getInfoMap();
};

}}
