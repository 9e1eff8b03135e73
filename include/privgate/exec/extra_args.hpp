#pragma once

#include <string>
#include <vector>

namespace privgate {
namespace exec {

// Splits a pass-through argument string. A value starting with '[' must be a
// JSON array of strings; anything else is tokenized shell style (whitespace
// separated, single and double quotes group, backslash escapes outside single
// quotes). Empty input yields no arguments. Throws ValidationError.
std::vector<std::string> parseExtraArgs(const std::string& value);

std::vector<std::string> splitShellWords(const std::string& value);

}}
