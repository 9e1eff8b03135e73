#include "privgate/privilege/sudoers_editor.hpp"
#include "privgate/common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace privgate {
namespace privilege {

namespace {

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::vector<std::string> splitLines(const std::string& content) {
    std::vector<std::string> lines;
    size_t start = 0;

    while (true) {
        size_t pos = content.find('\n', start);
        if (pos == std::string::npos) {
            lines.push_back(content.substr(start));
            break;
        }
        size_t end = pos;
        if (end > start && content[end - 1] == '\r') {
            --end;
        }
        lines.push_back(content.substr(start, end - start));
        start = pos + 1;
    }

    if (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }
    return lines;
}

bool writeAll(int fd, const std::string& content) {
    size_t offset = 0;
    while (offset < content.size()) {
        ssize_t n = write(fd, content.data() + offset, content.size() - offset);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        offset += static_cast<size_t>(n);
    }
    return true;
}

}

std::string to_string(EditStatus status) {
    switch (status) {
        case EditStatus::CHANGED: return "CHANGED";
        case EditStatus::UNCHANGED: return "UNCHANGED";
        case EditStatus::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

StripOutcome SudoersEditor::stripUserEntries(const std::string& content, const std::string& user) {
    StripOutcome outcome;

    const std::string newline = content.find("\r\n") != std::string::npos ? "\r\n" : "\n";
    const bool ends_with_newline = !content.empty() && content.back() == '\n';

    std::vector<std::string> kept;
    for (const auto& line : splitLines(content)) {
        auto first = std::find_if_not(line.begin(), line.end(), isSpace);
        if (first == line.end() || *first == '#') {
            kept.push_back(line);
            continue;
        }

        auto token_end = std::find_if(first, line.end(), isSpace);
        if (std::string(first, token_end) == user) {
            ++outcome.removed_lines;
            continue;
        }
        kept.push_back(line);
    }

    if (outcome.removed_lines == 0) {
        outcome.content = content;
        return outcome;
    }

    for (size_t i = 0; i < kept.size(); ++i) {
        if (i > 0) {
            outcome.content += newline;
        }
        outcome.content += kept[i];
    }
    if (ends_with_newline) {
        outcome.content += newline;
    }

    return outcome;
}

SudoersEditResult SudoersEditor::stripUserEntriesFromFile(const std::string& path, const std::string& user) {
    SudoersEditResult result;
    result.path = path;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        result.status = EditStatus::UNCHANGED;
        result.description = "Not present: " + path;
        return result;
    }

    if (!std::filesystem::is_regular_file(path, ec)) {
        result.status = EditStatus::FAILED;
        result.description = "Not a regular file: " + path;
        common::Logger::instance().warn("[Sudoers] Skipping non-regular file | path={}", path);
        return result;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        result.status = EditStatus::FAILED;
        result.description = "Failed to read " + path + ": " + std::strerror(errno);
        common::Logger::instance().warn("[Sudoers] Read failed | path={} | error={}", path, std::strerror(errno));
        return result;
    }

    std::string original((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    file.close();

    auto outcome = stripUserEntries(original, user);
    if (outcome.removed_lines == 0) {
        result.status = EditStatus::UNCHANGED;
        result.description = "No " + user + " entries found in " + path;
        return result;
    }

    std::string error;
    if (!atomicRewrite(path, outcome.content, error)) {
        result.status = EditStatus::FAILED;
        result.description = "Failed to rewrite " + path + ": " + error;
        common::Logger::instance().warn("[Sudoers] Rewrite failed | path={} | error={}", path, error);
        return result;
    }

    result.status = EditStatus::CHANGED;
    result.removed_lines = outcome.removed_lines;
    result.description = "Removed " + user + " entry from " + path;
    common::Logger::instance().debug("[Sudoers] Rewritten | path={} | removed_lines={}", path, outcome.removed_lines);
    return result;
}

std::vector<SudoersEditResult> SudoersEditor::stripUserEntriesFromDirectory(const std::string& dir,
                                                                            const std::string& user) {
    std::vector<SudoersEditResult> results;
    std::vector<std::string> files;

    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            common::Logger::instance().debug("[Sudoers] Directory absent | path={}", dir);
            return results;
        }

        SudoersEditResult failure;
        failure.path = dir;
        failure.status = EditStatus::FAILED;
        failure.description = "Failed to list " + dir + ": " + ec.message();
        common::Logger::instance().warn("[Sudoers] Directory listing failed | path={} | error={}", dir, ec.message());
        results.push_back(failure);
        return results;
    }

    for (const auto& entry : it) {
        std::error_code status_ec;
        auto status = entry.symlink_status(status_ec);
        if (!status_ec && std::filesystem::is_regular_file(status)) {
            files.push_back(entry.path().string());
        }
    }

    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        results.push_back(stripUserEntriesFromFile(file, user));
    }

    return results;
}

bool SudoersEditor::atomicRewrite(const std::string& path, const std::string& content, std::string& error) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        error = std::strerror(errno);
        return false;
    }

    std::filesystem::path target(path);
    std::string temp_template = (target.parent_path() / ("." + target.filename().string() + ".privgate-XXXXXX")).string();
    std::vector<char> temp_path(temp_template.begin(), temp_template.end());
    temp_path.push_back('\0');

    int fd = mkstemp(temp_path.data());
    if (fd < 0) {
        error = std::string("mkstemp: ") + std::strerror(errno);
        return false;
    }

    auto fail = [&](const std::string& what) {
        error = what + ": " + std::strerror(errno);
        close(fd);
        unlink(temp_path.data());
        return false;
    };

    if (!writeAll(fd, content)) {
        return fail("write");
    }

    if (fchown(fd, st.st_uid, st.st_gid) != 0) {
        struct stat temp_st;
        if (fstat(fd, &temp_st) != 0 || temp_st.st_uid != st.st_uid || temp_st.st_gid != st.st_gid) {
            return fail("fchown");
        }
    }

    if (fchmod(fd, st.st_mode & 07777) != 0) {
        return fail("fchmod");
    }

    if (fsync(fd) != 0) {
        return fail("fsync");
    }

    if (close(fd) != 0) {
        error = std::string("close: ") + std::strerror(errno);
        unlink(temp_path.data());
        return false;
    }

    if (rename(temp_path.data(), path.c_str()) != 0) {
        error = std::string("rename: ") + std::strerror(errno);
        unlink(temp_path.data());
        return false;
    }

    return true;
}

}}
