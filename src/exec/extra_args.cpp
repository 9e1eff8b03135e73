#include "privgate/exec/extra_args.hpp"
#include "privgate/common/error_codes.hpp"
#include <nlohmann/json.hpp>
#include <cctype>

namespace privgate {
namespace exec {

using common::ErrorCode;
using common::ErrorContext;
using common::ValidationError;

namespace {

ErrorContext argsContext(const std::string& value) {
    return ErrorContext{"extra_args", {{"value", value}}, std::nullopt};
}

}

std::vector<std::string> parseExtraArgs(const std::string& value) {
    if (value.empty()) {
        return {};
    }

    if (value[0] != '[') {
        return splitShellWords(value);
    }

    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(value);
    } catch (const nlohmann::json::parse_error& e) {
        throw ValidationError(ErrorCode::INVALID_EXTRA_ARGS,
                              std::string("Invalid JSON in extra args: ") + e.what(), argsContext(value));
    }

    if (!parsed.is_array()) {
        throw ValidationError(ErrorCode::INVALID_EXTRA_ARGS,
                              "Extra args JSON must be an array of strings", argsContext(value));
    }

    std::vector<std::string> args;
    args.reserve(parsed.size());
    for (const auto& item : parsed) {
        if (!item.is_string()) {
            throw ValidationError(ErrorCode::INVALID_EXTRA_ARGS,
                                  "Extra args JSON must contain only strings, got: " + item.dump(),
                                  argsContext(value));
        }
        args.push_back(item.get<std::string>());
    }
    return args;
}

std::vector<std::string> splitShellWords(const std::string& value) {
    std::vector<std::string> words;
    std::string current;
    bool in_word = false;
    char quote = '\0';

    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];

        if (quote == '\'') {
            if (c == '\'') {
                quote = '\0';
            } else {
                current += c;
            }
            continue;
        }

        if (c == '\\' && i + 1 < value.size()) {
            char next = value[i + 1];
            // Inside double quotes only the quote and backslash itself escape.
            if (quote == '"' && next != '"' && next != '\\') {
                current += c;
            } else {
                current += next;
                ++i;
            }
            in_word = true;
            continue;
        }

        if (quote == '"') {
            if (c == '"') {
                quote = '\0';
            } else {
                current += c;
            }
            continue;
        }

        if (c == '"' || c == '\'') {
            quote = c;
            in_word = true;
            continue;
        }

        if (std::isspace(static_cast<unsigned char>(c))) {
            if (in_word) {
                words.push_back(current);
                current.clear();
                in_word = false;
            }
            continue;
        }

        current += c;
        in_word = true;
    }

    if (quote != '\0') {
        throw ValidationError(ErrorCode::INVALID_EXTRA_ARGS,
                              std::string("Unterminated ") + quote + " quote in extra args", argsContext(value));
    }

    if (in_word) {
        words.push_back(current);
    }
    return words;
}

}}
