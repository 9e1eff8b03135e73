#pragma once

#include <string>
#include <vector>

namespace privgate {
namespace privilege {

enum class EditStatus {
    CHANGED,
    UNCHANGED,
    FAILED
};

struct SudoersEditResult {
    std::string path;
    EditStatus status = EditStatus::UNCHANGED;
    size_t removed_lines = 0;
    std::string description;

    bool changed() const { return status == EditStatus::CHANGED; }
    bool failed() const { return status == EditStatus::FAILED; }
};

struct StripOutcome {
    std::string content;
    size_t removed_lines = 0;
};

std::string to_string(EditStatus status);

/**
 * Line-level editor for sudoers rule files.
 *
 * Removes every line whose first whitespace-delimited token is the target
 * user. Comment lines (first non-blank character '#') and blank lines are
 * kept verbatim. The rewrite keeps the file's line-ending style (CRLF when
 * any CRLF is present, LF otherwise), whether it ends with a newline, its
 * permission bits and its owner. Files are replaced atomically: the new
 * content goes to a sibling temporary file that is renamed over the original.
 */
class SudoersEditor {
public:
    static StripOutcome stripUserEntries(const std::string& content, const std::string& user);

    // A missing file is UNCHANGED; an unreadable or unwritable one is FAILED.
    static SudoersEditResult stripUserEntriesFromFile(const std::string& path, const std::string& user);

    // Regular files directly under dir, in name order. A missing directory
    // yields no results; symlinks and subdirectories are skipped.
    static std::vector<SudoersEditResult> stripUserEntriesFromDirectory(const std::string& dir,
                                                                        const std::string& user);

private:
    static bool atomicRewrite(const std::string& path, const std::string& content, std::string& error);
};

}}
