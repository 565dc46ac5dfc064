#include "filter_compiler.hpp"
#include <algorithm>
#include <cctype>

namespace protonsync {

namespace {

const char* const CATCH_ALL_PATTERN = "*";

// Folder names come from the remote listing and may carry a trailing slash
std::string strip_trailing_slashes(const std::string& folder) {
    std::string result = folder;
    while (result.size() > 1 && result.back() == '/') {
        result.pop_back();
    }
    return result;
}

void append_folder_rules(std::vector<FilterRule>& rules, FilterAction action,
                         const std::vector<std::string>& folders) {
    for (const auto& raw : folders) {
        std::string folder = strip_trailing_slashes(raw);
        rules.push_back({action, folder + "/**"});
        rules.push_back({action, folder});
    }
}

} // namespace

std::string sync_mode_to_string(SyncMode mode) {
    switch (mode) {
        case SyncMode::INCLUDE: return "include";
        case SyncMode::EXCLUDE: return "exclude";
        case SyncMode::FULL:
        default:
            return "full";
    }
}

SyncMode parse_sync_mode(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "include" || lower == "selective_include") return SyncMode::INCLUDE;
    if (lower == "exclude" || lower == "selective_exclude") return SyncMode::EXCLUDE;
    return SyncMode::FULL;
}

std::string FilterRule::to_argument() const {
    return std::string(action == FilterAction::INCLUDE ? "--include=" : "--exclude=") + pattern;
}

std::vector<FilterRule> compile_filters(SyncMode mode,
                                        const std::vector<std::string>& included_folders,
                                        const std::vector<std::string>& excluded_folders) {
    std::vector<FilterRule> rules;

    switch (mode) {
        case SyncMode::INCLUDE:
            append_folder_rules(rules, FilterAction::INCLUDE, included_folders);
            if (!included_folders.empty()) {
                rules.push_back({FilterAction::EXCLUDE, CATCH_ALL_PATTERN});
            }
            break;
        case SyncMode::EXCLUDE:
            append_folder_rules(rules, FilterAction::EXCLUDE, excluded_folders);
            break;
        case SyncMode::FULL:
            break;
    }

    return rules;
}

std::vector<std::string> filter_arguments(const std::vector<FilterRule>& rules) {
    std::vector<std::string> args;
    args.reserve(rules.size());
    for (const auto& rule : rules) {
        args.push_back(rule.to_argument());
    }
    return args;
}

} // namespace protonsync
