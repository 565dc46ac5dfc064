#include "config_manager.hpp"
#include "logger.hpp"
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <cctype>
#include <algorithm>
#include <filesystem>

namespace protonsync {

namespace {

const char* const CONFIG_FILE = "config.json";

// One year; keeps the scheduler deadline well inside steady_clock range
const int MAX_INTERVAL_MINUTES = 525600;

void skip_whitespace(const std::string& content, size_t& pos) {
    while (pos < content.size() && std::isspace(static_cast<unsigned char>(content[pos]))) {
        pos++;
    }
}

bool read_hex4(const std::string& content, size_t& pos, unsigned int& code) {
    if (pos + 4 > content.size()) return false;
    code = 0;
    for (size_t i = 0; i < 4; i++) {
        char c = content[pos + i];
        code <<= 4;
        if (c >= '0' && c <= '9') code |= c - '0';
        else if (c >= 'a' && c <= 'f') code |= c - 'a' + 10;
        else if (c >= 'A' && c <= 'F') code |= c - 'A' + 10;
        else return false;
    }
    pos += 4;
    return true;
}

void append_utf8(unsigned int code, std::string& out) {
    if (code < 0x80) {
        out += static_cast<char>(code);
    } else if (code < 0x800) {
        out += static_cast<char>(0xC0 | (code >> 6));
        out += static_cast<char>(0x80 | (code & 0x3F));
    } else if (code < 0x10000) {
        out += static_cast<char>(0xE0 | (code >> 12));
        out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (code >> 18));
        out += static_cast<char>(0x80 | ((code >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code & 0x3F));
    }
}

// Reads a quoted JSON string starting at content[pos] == '"'
bool read_string(const std::string& content, size_t& pos, std::string& out) {
    if (pos >= content.size() || content[pos] != '"') return false;
    pos++;
    out.clear();
    while (pos < content.size()) {
        char c = content[pos++];
        if (c == '"') return true;
        if (c != '\\') {
            out += c;
            continue;
        }
        if (pos >= content.size()) return false;
        char esc = content[pos++];
        switch (esc) {
            case 'n': out += '\n'; break;
            case 't': out += '\t'; break;
            case 'r': out += '\r'; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'u': {
                unsigned int code = 0;
                if (!read_hex4(content, pos, code)) return false;
                // High surrogate must be followed by an escaped low surrogate
                if (code >= 0xD800 && code <= 0xDBFF) {
                    unsigned int low = 0;
                    if (pos + 1 >= content.size() || content[pos] != '\\' || content[pos + 1] != 'u') {
                        return false;
                    }
                    pos += 2;
                    if (!read_hex4(content, pos, low) || low < 0xDC00 || low > 0xDFFF) return false;
                    code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                } else if (code >= 0xDC00 && code <= 0xDFFF) {
                    return false;
                }
                append_utf8(code, out);
                break;
            }
            default: out += esc; break;
        }
    }
    return false;
}

// Bare literal: number, true, false or null
std::string read_literal(const std::string& content, size_t& pos) {
    size_t start = pos;
    while (pos < content.size() && content[pos] != ',' && content[pos] != '}' &&
           content[pos] != ']' && !std::isspace(static_cast<unsigned char>(content[pos]))) {
        pos++;
    }
    return content.substr(start, pos - start);
}

std::string escape_json(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    for (char c : value) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            default:   out += c; break;
        }
    }
    return out;
}

bool is_plain_number(const std::string& value) {
    if (value.empty()) return false;
    size_t start = (value[0] == '-') ? 1 : 0;
    if (start == value.size()) return false;
    return std::all_of(value.begin() + start, value.end(),
                       [](unsigned char c) { return std::isdigit(c); });
}

int parse_int(const std::string& key, const std::string& str, int default_value) {
    if (str.empty()) return default_value;
    try {
        return std::stoi(str);
    } catch (const std::exception&) {
        Logger::warn("[Config] Value of " + key + " is not a number: " + str);
        return default_value;
    }
}

bool parse_bool(const std::string& str, bool default_value) {
    if (str.empty()) return default_value;
    return (str == "true" || str == "1" || str == "yes");
}

} // namespace

ConfigManager::ConfigManager(const std::string& config_dir)
    : config_dir_(config_dir.empty() ? default_config_dir() : config_dir) {
    config_path_ = (std::filesystem::path(config_dir_) / CONFIG_FILE).string();
    ensure_defaults();
}

std::string ConfigManager::default_config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return std::string(xdg) + "/protondrive-sync";
    }
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.config/protondrive-sync";
    }
    return "/tmp/protondrive-sync";
}

void ConfigManager::ensure_defaults() {
    const std::map<std::string, std::string> defaults = {
        {"rclone_remote", ""},
        {"local_folder", ""},
        {"auto_sync_enabled", "false"},
        {"sync_interval_minutes", "30"},
        {"sync_mode", "full"},
        {"dry_run_first_sync", "true"},
        {"confirm_large_sync", "true"},
        {"large_sync_threshold_mb", "1000"},
        {"large_sync_confirm_timeout_seconds", "300"},
        {"bandwidth_limit_kbps", "0"},
        {"notifications_enabled", "true"},
        {"log_level", "INFO"},
        {"rclone_path", ""},
    };
    for (const auto& [key, value] : defaults) {
        if (settings_.find(key) == settings_.end()) {
            settings_[key] = value;
        }
    }
    for (const char* key : {"included_folders", "excluded_folders"}) {
        if (lists_.find(key) == lists_.end()) {
            lists_[key] = {};
        }
    }
}

bool ConfigManager::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::ifstream file(config_path_);
    if (!file.is_open()) {
        Logger::info("[Config] No config file at " + config_path_ + ", using defaults");
        ensure_defaults();
        return false;
    }
    
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    file.close();

    std::map<std::string, std::string> loaded;
    std::map<std::string, std::vector<std::string>> loaded_lists;

    size_t pos = 0;
    skip_whitespace(content, pos);
    bool ok = pos < content.size() && content[pos] == '{';
    if (ok) pos++;

    while (ok) {
        skip_whitespace(content, pos);
        if (pos < content.size() && content[pos] == '}') break;

        std::string key;
        if (!read_string(content, pos, key)) { ok = false; break; }
        skip_whitespace(content, pos);
        if (pos >= content.size() || content[pos] != ':') { ok = false; break; }
        pos++;
        skip_whitespace(content, pos);
        if (pos >= content.size()) { ok = false; break; }

        if (content[pos] == '"') {
            std::string value;
            if (!read_string(content, pos, value)) { ok = false; break; }
            loaded[key] = value;
        } else if (content[pos] == '[') {
            pos++;
            std::vector<std::string> values;
            while (true) {
                skip_whitespace(content, pos);
                if (pos < content.size() && content[pos] == ']') { pos++; break; }
                std::string item;
                if (!read_string(content, pos, item)) { ok = false; break; }
                values.push_back(item);
                skip_whitespace(content, pos);
                if (pos < content.size() && content[pos] == ',') pos++;
            }
            if (!ok) break;
            loaded_lists[key] = values;
        } else {
            std::string literal = read_literal(content, pos);
            if (literal.empty()) { ok = false; break; }
            if (literal != "null") loaded[key] = literal;
        }

        skip_whitespace(content, pos);
        if (pos < content.size() && content[pos] == ',') pos++;
    }

    if (!ok) {
        Logger::error("[Config] Malformed config file " + config_path_ + " (near offset " +
                      std::to_string(pos) + "), using defaults");
        settings_.clear();
        lists_.clear();
        ensure_defaults();
        return false;
    }

    const size_t loaded_count = loaded.size() + loaded_lists.size();
    // Keys missing from the file go back to their defaults
    settings_ = std::move(loaded);
    lists_ = std::move(loaded_lists);
    ensure_defaults();
    Logger::info("[Config] Loaded " + std::to_string(loaded_count) + " settings from " + config_path_);
    return true;
}

bool ConfigManager::save() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    std::filesystem::create_directories(config_dir_, ec);
    if (ec) {
        Logger::error("[Config] Cannot create " + config_dir_ + ": " + ec.message());
        return false;
    }
    
    std::ofstream file(config_path_);
    if (!file.is_open()) {
        Logger::error("[Config] Failed to open config file for writing: " + config_path_);
        return false;
    }
    
    file << "{\n";
    bool first = true;
    for (const auto& [key, value] : settings_) {
        if (!first) file << ",\n";
        first = false;
        
        bool is_bool = (value == "true" || value == "false");
        if (is_plain_number(value) || is_bool) {
            file << "    \"" << escape_json(key) << "\": " << value;
        } else {
            file << "    \"" << escape_json(key) << "\": \"" << escape_json(value) << "\"";
        }
    }
    for (const auto& [key, values] : lists_) {
        if (!first) file << ",\n";
        first = false;

        file << "    \"" << escape_json(key) << "\": [";
        for (size_t i = 0; i < values.size(); i++) {
            if (i > 0) file << ", ";
            file << "\"" << escape_json(values[i]) << "\"";
        }
        file << "]";
    }
    file << "\n}\n";
    file.close();

    if (!file) {
        Logger::error("[Config] Write to " + config_path_ + " failed");
        return false;
    }
    Logger::info("[Config] Saved " + std::to_string(settings_.size() + lists_.size()) + " settings");
    return true;
}

SyncConfiguration ConfigManager::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    SyncConfiguration config;
    config.remote = lookup_locked("rclone_remote");
    config.local_path = lookup_locked("local_folder");
    config.sync_mode = parse_sync_mode(lookup_locked("sync_mode", "full"));
    config.included_folders = list_locked("included_folders");
    config.excluded_folders = list_locked("excluded_folders");
    config.auto_sync_enabled = parse_bool(lookup_locked("auto_sync_enabled"), false);
    config.interval_minutes = std::clamp(
        parse_int("sync_interval_minutes", lookup_locked("sync_interval_minutes"), 30),
        1, MAX_INTERVAL_MINUTES);
    config.dry_run_first_sync = parse_bool(lookup_locked("dry_run_first_sync"), true);
    config.confirm_large_sync = parse_bool(lookup_locked("confirm_large_sync"), true);
    config.large_sync_threshold_mb =
        std::max(0, parse_int("large_sync_threshold_mb", lookup_locked("large_sync_threshold_mb"), 1000));
    config.large_sync_confirm_timeout_seconds = std::max(
        0, parse_int("large_sync_confirm_timeout_seconds",
                     lookup_locked("large_sync_confirm_timeout_seconds"), 300));
    config.bandwidth_limit_kbps =
        std::max(0, parse_int("bandwidth_limit_kbps", lookup_locked("bandwidth_limit_kbps"), 0));
    config.notifications_enabled = parse_bool(lookup_locked("notifications_enabled"), true);
    config.log_level = lookup_locked("log_level", "INFO");
    config.rclone_path = lookup_locked("rclone_path");
    return config;
}

bool ConfigManager::is_configured() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !lookup_locked("rclone_remote").empty() && !lookup_locked("local_folder").empty();
}

std::string ConfigManager::lookup_locked(const std::string& key, const std::string& default_value) const {
    auto it = settings_.find(key);
    return it != settings_.end() ? it->second : default_value;
}

std::vector<std::string> ConfigManager::list_locked(const std::string& key) const {
    auto it = lists_.find(key);
    return it != lists_.end() ? it->second : std::vector<std::string>{};
}

void ConfigManager::add_included_folder(const std::string& folder) {
    add_to_list("included_folders", folder);
}

void ConfigManager::remove_included_folder(const std::string& folder) {
    remove_from_list("included_folders", folder);
}

void ConfigManager::add_excluded_folder(const std::string& folder) {
    add_to_list("excluded_folders", folder);
}

void ConfigManager::remove_excluded_folder(const std::string& folder) {
    remove_from_list("excluded_folders", folder);
}

void ConfigManager::add_to_list(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& values = lists_[key];
    if (std::find(values.begin(), values.end(), value) == values.end()) {
        values.push_back(value);
    }
}

void ConfigManager::remove_from_list(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& values = lists_[key];
    values.erase(std::remove(values.begin(), values.end(), value), values.end());
}

// Generic accessors
std::string ConfigManager::get_string(const std::string& key, const std::string& default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup_locked(key, default_value);
}

void ConfigManager::set_string(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_[key] = value;
}

int ConfigManager::get_int(const std::string& key, int default_value) const {
    return parse_int(key, get_string(key, ""), default_value);
}

void ConfigManager::set_int(const std::string& key, int value) {
    set_string(key, std::to_string(value));
}

bool ConfigManager::get_bool(const std::string& key, bool default_value) const {
    return parse_bool(get_string(key, ""), default_value);
}

void ConfigManager::set_bool(const std::string& key, bool value) {
    set_string(key, value ? "true" : "false");
}

std::vector<std::string> ConfigManager::get_list(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return list_locked(key);
}

} // namespace protonsync
