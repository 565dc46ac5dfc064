#pragma once

#include <string>
#include <vector>

namespace protonsync {

/**
 * Selective sync mode
 *
 *   FULL    - everything under the remote is synced
 *   INCLUDE - only the listed folders are synced
 *   EXCLUDE - everything except the listed folders is synced
 */
enum class SyncMode {
    FULL,
    INCLUDE,
    EXCLUDE
};

std::string sync_mode_to_string(SyncMode mode);

// Accepts "full", "include", "exclude" and the older
// "selective_include" / "selective_exclude" names. Unknown values map to FULL.
SyncMode parse_sync_mode(const std::string& value);

enum class FilterAction {
    INCLUDE,
    EXCLUDE
};

/**
 * One rclone filter directive. Rules are evaluated by rclone in the order
 * they appear on the command line and the first match wins.
 */
struct FilterRule {
    FilterAction action;
    std::string pattern;

    // "--include=Photos/**" / "--exclude=*"
    std::string to_argument() const;

    bool operator==(const FilterRule& other) const {
        return action == other.action && pattern == other.pattern;
    }
    bool operator!=(const FilterRule& other) const { return !(*this == other); }
};

/**
 * Build the ordered filter list for a selective sync configuration.
 *
 * INCLUDE emits "<folder>/**" then "<folder>" for every folder and closes with
 * a catch-all exclude, but only when at least one folder is listed. EXCLUDE
 * emits the same pair of excludes per folder with no catch-all. FULL yields an
 * empty list. Folder order is preserved and duplicates are not removed.
 */
std::vector<FilterRule> compile_filters(SyncMode mode,
                                        const std::vector<std::string>& included_folders,
                                        const std::vector<std::string>& excluded_folders);

std::vector<std::string> filter_arguments(const std::vector<FilterRule>& rules);

} // namespace protonsync
