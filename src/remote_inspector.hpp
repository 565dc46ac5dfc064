#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace protonsync {

struct RemoteFolder {
    std::string name;       // "Photos"
    std::string path;       // "Documents/Photos"
    std::string full_path;  // "proton:Documents/Photos"
};

struct RemoteFolderNode {
    RemoteFolder folder;
    std::vector<RemoteFolderNode> children;
};

struct RemoteTestResult {
    bool accessible = false;
    std::string message;
};

/**
 * Remote Inspector
 *
 * Short, synchronous rclone queries used to set up a sync:
 * version check, configured remotes, folder listing and a reachability test.
 * Failures are logged and reported as empty results. Every query runs under
 * a deadline and the rclone process is killed when it passes.
 */
class RemoteInspector {
public:
    explicit RemoteInspector(std::string rclone_path);

    bool is_installed() const;

    // "1.65.2" from "rclone v1.65.2"
    std::optional<std::string> version() const;

    // Remote names without the trailing ':'
    std::vector<std::string> list_remotes() const;
    bool remote_exists(const std::string& remote) const;

    // "protondrive", "s3", ... from `rclone config show REMOTE`
    std::optional<std::string> remote_type(const std::string& remote) const;
    // First remote whose type mentions "proton"
    std::optional<std::string> find_protondrive_remote() const;

    std::vector<RemoteFolder> list_folders(const std::string& remote,
                                           const std::string& path = "") const;

    // Recursive listing below path, max_depth levels deep (0 gives an empty tree)
    std::vector<RemoteFolderNode> folder_tree(const std::string& remote, int max_depth = 3,
                                              const std::string& path = "") const;

    RemoteTestResult test_remote(const std::string& remote) const;

    const std::string& rclone_path() const { return rclone_path_; }

    // Replaces every per-command deadline, for tests
    void set_timeout_override(std::optional<std::chrono::milliseconds> timeout) { timeout_override_ = timeout; }

private:
    struct CommandOutput {
        bool spawned = false;
        bool timed_out = false;
        int exit_code = -1;
        std::string out;
        std::string err;
    };

    CommandOutput run(const std::vector<std::string>& args, std::chrono::milliseconds timeout) const;
    void build_tree(const std::string& remote, const std::string& path, int depth, int max_depth,
                    std::vector<RemoteFolderNode>& out) const;

    std::string rclone_path_;
    std::optional<std::chrono::milliseconds> timeout_override_;
};

// Extracts the dotted version number following the first 'v' + digit
std::optional<std::string> parse_version_line(const std::string& line);

// Value of the "type = ..." line of `rclone config show` output
std::optional<std::string> parse_remote_type(const std::string& config_text);

} // namespace protonsync
