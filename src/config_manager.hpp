#pragma once

#include <string>
#include <map>
#include <mutex>
#include <vector>
#include "filter_compiler.hpp"

namespace protonsync {

/**
 * Read-only view of the sync settings, taken at the start of every sync
 * attempt so that edits apply to the next run without a restart.
 */
struct SyncConfiguration {
    std::string remote;
    std::string local_path;
    SyncMode sync_mode = SyncMode::FULL;
    std::vector<std::string> included_folders;
    std::vector<std::string> excluded_folders;

    bool auto_sync_enabled = false;
    int interval_minutes = 30;

    // Safety
    bool dry_run_first_sync = true;
    bool confirm_large_sync = true;
    long long large_sync_threshold_mb = 1000;
    int large_sync_confirm_timeout_seconds = 300;  // 0 = wait forever
    int bandwidth_limit_kbps = 0;                  // 0 = unlimited

    bool notifications_enabled = true;
    std::string log_level = "INFO";
    std::string rclone_path;                       // empty = auto-detect

    bool is_configured() const { return !remote.empty() && !local_path.empty(); }
};

/**
 * Configuration Manager
 *
 * Persists the sync settings as a flat JSON object in
 * <config_dir>/config.json (default ~/.config/protondrive-sync).
 * Keys missing from the file fall back to defaults; unknown keys are kept
 * so that a save round-trips them.
 */
class ConfigManager {
public:
    explicit ConfigManager(const std::string& config_dir = "");

    static std::string default_config_dir();

    // Load/save settings
    bool load();
    bool save();

    SyncConfiguration snapshot() const;
    bool is_configured() const;

    // Selective sync folder lists (kept free of duplicates)
    void add_included_folder(const std::string& folder);
    void remove_included_folder(const std::string& folder);
    void add_excluded_folder(const std::string& folder);
    void remove_excluded_folder(const std::string& folder);

    // Generic getters/setters
    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    void set_string(const std::string& key, const std::string& value);
    
    int get_int(const std::string& key, int default_value = 0) const;
    void set_int(const std::string& key, int value);
    
    bool get_bool(const std::string& key, bool default_value = false) const;
    void set_bool(const std::string& key, bool value);

    std::vector<std::string> get_list(const std::string& key) const;

    const std::string& config_dir() const { return config_dir_; }
    const std::string& config_path() const { return config_path_; }

private:
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    void ensure_defaults();
    // Callers hold mutex_
    std::string lookup_locked(const std::string& key, const std::string& default_value = "") const;
    std::vector<std::string> list_locked(const std::string& key) const;
    void add_to_list(const std::string& key, const std::string& value);
    void remove_from_list(const std::string& key, const std::string& value);
    
    mutable std::mutex mutex_;
    std::map<std::string, std::string> settings_;
    std::map<std::string, std::vector<std::string>> lists_;
    std::string config_dir_;
    std::string config_path_;
};

} // namespace protonsync
