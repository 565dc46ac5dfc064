#include "remote_inspector.hpp"
#include "logger.hpp"
#include <gio/gio.h>
#include <cctype>
#include <condition_variable>
#include <mutex>
#include <sstream>
#include <thread>
#include <unistd.h>

namespace protonsync {

namespace {

using std::chrono::milliseconds;
using std::chrono::seconds;

const milliseconds VERSION_TIMEOUT = seconds(5);
const milliseconds CONFIG_TIMEOUT = seconds(10);
const milliseconds LISTING_TIMEOUT = seconds(30);

std::string trim_right(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ' || s.back() == '\t')) {
        s.pop_back();
    }
    return s;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        line = trim_right(line);
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

} // namespace

std::optional<std::string> parse_version_line(const std::string& line) {
    for (size_t i = 0; i + 1 < line.size(); ++i) {
        if (line[i] != 'v' || !isdigit(static_cast<unsigned char>(line[i + 1]))) {
            continue;
        }
        size_t end = i + 1;
        while (end < line.size() &&
               (isdigit(static_cast<unsigned char>(line[end])) || line[end] == '.')) {
            end++;
        }
        return line.substr(i + 1, end - i - 1);
    }
    return std::nullopt;
}

std::optional<std::string> parse_remote_type(const std::string& config_text) {
    for (const std::string& line : split_lines(config_text)) {
        size_t start = line.find_first_not_of(" \t");
        if (start == std::string::npos || line.compare(start, 4, "type") != 0) {
            continue;
        }
        size_t eq = line.find('=', start + 4);
        if (eq == std::string::npos || line.find_first_not_of(" \t", start + 4) != eq) {
            continue;
        }
        size_t value = line.find_first_not_of(" \t", eq + 1);
        if (value == std::string::npos) {
            return std::nullopt;
        }
        return line.substr(value);
    }
    return std::nullopt;
}

RemoteInspector::RemoteInspector(std::string rclone_path)
    : rclone_path_(std::move(rclone_path)) {
}

RemoteInspector::CommandOutput RemoteInspector::run(const std::vector<std::string>& args,
                                                    milliseconds timeout) const {
    if (timeout_override_) {
        timeout = *timeout_override_;
    }

    std::vector<const gchar*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(rclone_path_.c_str());
    for (const auto& arg : args) {
        argv.push_back(arg.c_str());
    }
    argv.push_back(nullptr);

    CommandOutput result;
    GError* error = nullptr;
    GSubprocess* process = g_subprocess_newv(
        argv.data(),
        static_cast<GSubprocessFlags>(G_SUBPROCESS_FLAGS_STDOUT_PIPE | G_SUBPROCESS_FLAGS_STDERR_PIPE),
        &error);
    if (!process) {
        result.err = error && error->message ? error->message : "Failed to start rclone";
        Logger::error("[Remotes] Failed to spawn " + rclone_path_ + ": " + result.err);
        if (error) g_error_free(error);
        return result;
    }
    result.spawned = true;

    // communicate blocks until rclone closes its pipes; the watchdog
    // cancels it once the deadline passes
    GCancellable* cancellable = g_cancellable_new();
    std::mutex done_mutex;
    std::condition_variable done_cv;
    bool done = false;
    std::thread watchdog([&]() {
        std::unique_lock<std::mutex> lock(done_mutex);
        if (!done_cv.wait_for(lock, timeout, [&done] { return done; })) {
            g_cancellable_cancel(cancellable);
        }
    });

    gchar* stdout_buf = nullptr;
    gchar* stderr_buf = nullptr;
    gboolean communicated = g_subprocess_communicate_utf8(process, nullptr, cancellable,
                                                          &stdout_buf, &stderr_buf, &error);
    {
        std::lock_guard<std::mutex> lock(done_mutex);
        done = true;
    }
    done_cv.notify_all();
    watchdog.join();

    if (stdout_buf) {
        result.out = stdout_buf;
        g_free(stdout_buf);
    }
    if (stderr_buf) {
        result.err = stderr_buf;
        g_free(stderr_buf);
    }

    if (!communicated) {
        if (g_error_matches(error, G_IO_ERROR, G_IO_ERROR_CANCELLED)) {
            result.timed_out = true;
            Logger::warn("[Remotes] rclone " + (args.empty() ? std::string() : args.front()) +
                         " timed out after " + std::to_string(timeout.count()) + "ms, killing it");
        } else {
            Logger::error("[Remotes] Reading rclone output failed: " +
                          std::string(error && error->message ? error->message : "unknown error"));
        }
        if (error) g_error_free(error);
        g_subprocess_force_exit(process);
    }

    GError* wait_error = nullptr;
    if (!g_subprocess_wait(process, nullptr, &wait_error)) {
        Logger::error("[Remotes] Failed waiting for rclone: " +
                      std::string(wait_error && wait_error->message ? wait_error->message : "unknown error"));
        if (wait_error) g_error_free(wait_error);
    } else if (g_subprocess_get_if_exited(process)) {
        result.exit_code = g_subprocess_get_exit_status(process);
    } else if (g_subprocess_get_if_signaled(process)) {
        result.exit_code = 128 + g_subprocess_get_term_sig(process);
    }
    if (!communicated && result.exit_code == 0) {
        result.exit_code = -1;
    }

    g_object_unref(cancellable);
    g_object_unref(process);
    return result;
}

bool RemoteInspector::is_installed() const {
    if (rclone_path_.find('/') != std::string::npos) {
        return access(rclone_path_.c_str(), X_OK) == 0;
    }
    gchar* found = g_find_program_in_path(rclone_path_.c_str());
    bool installed = found != nullptr;
    g_free(found);
    return installed;
}

std::optional<std::string> RemoteInspector::version() const {
    CommandOutput output = run({"version"}, VERSION_TIMEOUT);
    if (!output.spawned || output.exit_code != 0) {
        Logger::error("[Remotes] Error getting rclone version");
        return std::nullopt;
    }
    std::vector<std::string> lines = split_lines(output.out);
    if (lines.empty()) {
        return std::nullopt;
    }
    return parse_version_line(lines.front());
}

std::vector<std::string> RemoteInspector::list_remotes() const {
    std::vector<std::string> remotes;
    CommandOutput output = run({"listremotes"}, CONFIG_TIMEOUT);
    if (!output.spawned) {
        return remotes;
    }
    if (output.exit_code != 0) {
        Logger::error("[Remotes] Error listing remotes: " + trim_right(output.err));
        return remotes;
    }

    for (std::string line : split_lines(output.out)) {
        while (!line.empty() && line.back() == ':') {
            line.pop_back();
        }
        if (!line.empty()) {
            remotes.push_back(line);
        }
    }
    Logger::debug("[Remotes] Found " + std::to_string(remotes.size()) + " remotes");
    return remotes;
}

bool RemoteInspector::remote_exists(const std::string& remote) const {
    for (const auto& name : list_remotes()) {
        if (name == remote) {
            return true;
        }
    }
    return false;
}

std::optional<std::string> RemoteInspector::remote_type(const std::string& remote) const {
    CommandOutput output = run({"config", "show", remote}, CONFIG_TIMEOUT);
    if (!output.spawned || output.exit_code != 0) {
        Logger::error("[Remotes] Error getting type of remote " + remote + ": " + trim_right(output.err));
        return std::nullopt;
    }
    return parse_remote_type(output.out);
}

std::optional<std::string> RemoteInspector::find_protondrive_remote() const {
    for (const auto& remote : list_remotes()) {
        std::optional<std::string> type = remote_type(remote);
        if (!type) continue;

        std::string lower;
        for (char c : *type) {
            lower += static_cast<char>(tolower(static_cast<unsigned char>(c)));
        }
        if (lower.find("proton") != std::string::npos) {
            return remote;
        }
    }
    return std::nullopt;
}

std::vector<RemoteFolder> RemoteInspector::list_folders(const std::string& remote,
                                                        const std::string& path) const {
    std::vector<RemoteFolder> folders;
    CommandOutput output = run({"lsf", remote + ":" + path, "--dirs-only", "--format", "p"}, LISTING_TIMEOUT);
    if (!output.spawned) {
        return folders;
    }
    if (output.exit_code != 0) {
        Logger::error("[Remotes] Error listing folders in " + remote + ":" + path + ": " +
                      trim_right(output.err));
        return folders;
    }

    for (std::string line : split_lines(output.out)) {
        while (!line.empty() && line.back() == '/') {
            line.pop_back();
        }
        if (line.empty()) continue;

        RemoteFolder folder;
        folder.name = line;
        folder.path = path.empty() ? line : path + "/" + line;
        folder.full_path = remote + ":" + folder.path;
        folders.push_back(folder);
    }
    return folders;
}

std::vector<RemoteFolderNode> RemoteInspector::folder_tree(const std::string& remote, int max_depth,
                                                           const std::string& path) const {
    std::vector<RemoteFolderNode> tree;
    build_tree(remote, path, 0, max_depth, tree);
    return tree;
}

void RemoteInspector::build_tree(const std::string& remote, const std::string& path, int depth,
                                 int max_depth, std::vector<RemoteFolderNode>& out) const {
    if (depth >= max_depth) {
        return;
    }
    for (auto& folder : list_folders(remote, path)) {
        RemoteFolderNode node;
        node.folder = std::move(folder);
        build_tree(remote, node.folder.path, depth + 1, max_depth, node.children);
        out.push_back(std::move(node));
    }
}

RemoteTestResult RemoteInspector::test_remote(const std::string& remote) const {
    RemoteTestResult result;
    CommandOutput output = run({"lsd", remote + ":", "--max-depth", "1"}, LISTING_TIMEOUT);
    if (!output.spawned) {
        result.message = "Rclone not found";
        return result;
    }
    if (output.timed_out) {
        result.message = "Timeout while testing remote";
        return result;
    }
    if (output.exit_code != 0) {
        result.message = "Error: " + trim_right(output.err);
        Logger::warn("[Remotes] Remote " + remote + " is not accessible: " + trim_right(output.err));
        return result;
    }
    result.accessible = true;
    result.message = "Remote is accessible";
    return result;
}

} // namespace protonsync
