#include "transfer_executor.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace protonsync {

namespace {

bool is_executable_file(const std::string& path) {
    std::error_code ec;
    bool regular = fs::is_regular_file(path, ec);
    if (ec) {
        Logger::debug("[Executor] is_regular_file() I/O error for " + path + ": " + ec.message());
        return false;
    }
    return regular && access(path.c_str(), X_OK) == 0;
}

std::string find_in_path(const std::string& name) {
    gchar* found = g_find_program_in_path(name.c_str());
    if (!found) return "";
    std::string result(found);
    g_free(found);
    return result;
}

std::string trim(const std::string& text) {
    size_t start = 0;
    size_t end = text.size();
    while (start < end && std::isspace(static_cast<unsigned char>(text[start]))) start++;
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) end--;
    return text.substr(start, end - start);
}

std::string join_command(const std::string& binary, const std::vector<std::string>& args) {
    std::string cmd = binary;
    for (const auto& arg : args) {
        cmd += " " + arg;
    }
    return cmd;
}

// Reads the integer following "key": anywhere in the document
std::optional<long long> extract_number(const std::string& json, const std::string& key) {
    std::string needle = "\"" + key + "\"";
    size_t pos = json.find(needle);
    if (pos == std::string::npos) return std::nullopt;
    pos += needle.length();
    while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos]))) pos++;
    if (pos >= json.size() || json[pos] != ':') return std::nullopt;
    pos++;
    while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos]))) pos++;
    size_t end_pos = pos;
    while (end_pos < json.size() && (std::isdigit(static_cast<unsigned char>(json[end_pos])) || json[end_pos] == '-')) {
        end_pos++;
    }
    if (end_pos == pos) return std::nullopt;
    try {
        return std::stoll(json.substr(pos, end_pos - pos));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

std::optional<SizeEstimate> parse_size_json(const std::string& json) {
    auto bytes = extract_number(json, "bytes");
    if (!bytes || *bytes < 0) {
        return std::nullopt;
    }
    SizeEstimate estimate;
    estimate.bytes = *bytes;
    estimate.file_count = extract_number(json, "count").value_or(0);
    return estimate;
}

std::string locate_rclone(const std::string& configured_path) {
    if (!configured_path.empty()) {
        if (configured_path.find('/') == std::string::npos) {
            std::string found = find_in_path(configured_path);
            if (!found.empty()) return found;
        } else if (is_executable_file(configured_path)) {
            Logger::info("[rclone] Using configured rclone: " + configured_path);
            return configured_path;
        }
        throw ExecutableNotFound("Configured rclone binary not found: " + configured_path);
    }

    const char* appdir = std::getenv("APPDIR");
    if (appdir) {
        std::string bundled_path = std::string(appdir) + "/usr/bin/rclone";
        if (is_executable_file(bundled_path)) {
            Logger::info("[rclone] Using bundled rclone: " + bundled_path);
            return bundled_path;
        }
    }
    
    const std::vector<std::string> paths = {
        "/usr/bin/rclone",
        "/usr/local/bin/rclone",
        "/snap/bin/rclone",
    };
    for (const auto& p : paths) {
        if (is_executable_file(p)) {
            Logger::info("[rclone] Using system rclone: " + p);
            return p;
        }
    }

    std::string from_path = find_in_path("rclone");
    if (!from_path.empty()) {
        Logger::info("[rclone] Using rclone from PATH: " + from_path);
        return from_path;
    }
    
    throw ExecutableNotFound("Rclone not found. Please install rclone.");
}

// ============ TransferHandle ============

TransferHandle::TransferHandle(GSubprocess* process, std::string description)
    : process_(process), description_(std::move(description)) {
    GInputStream* stdout_pipe = g_subprocess_get_stdout_pipe(process_);
    output_ = g_data_input_stream_new(stdout_pipe);
    // rclone redraws its progress block with bare CRs
    g_data_input_stream_set_newline_type(output_, G_DATA_STREAM_NEWLINE_TYPE_ANY);

    const gchar* identifier = g_subprocess_get_identifier(process_);
    if (identifier) {
        pid_ = identifier;
    }
}

TransferHandle::~TransferHandle() {
    if (is_running()) {
        Logger::warn("[Executor] " + description_ + " (pid " + pid_ + ") still running on release, killing it");
        if (paused_.load()) {
            g_subprocess_send_signal(process_, SIGCONT);
        }
        g_subprocess_force_exit(process_);
    }
    g_object_unref(output_);
    g_object_unref(process_);
}

bool TransferHandle::is_running() const {
    return g_subprocess_get_identifier(process_) != nullptr;
}

std::string TransferHandle::pid() const {
    return pid_;
}

size_t TransferHandle::lines(const LineCallback& on_line) {
    std::lock_guard<std::mutex> lock(read_mutex_);
    if (exhausted_.load()) {
        return 0;
    }

    size_t delivered = 0;
    while (true) {
        GError* error = nullptr;
        gsize length = 0;
        gchar* raw = g_data_input_stream_read_line(output_, &length, nullptr, &error);
        if (!raw) {
            if (error) {
                Logger::warn("[Executor] Reading output of " + description_ + " failed: " + error->message);
                g_error_free(error);
            }
            break;
        }

        std::string line = trim(std::string(raw, length));
        g_free(raw);
        if (line.empty()) {
            continue;
        }

        delivered++;
        if (on_line) {
            on_line(line);
        }
    }

    exhausted_.store(true);
    return delivered;
}

TransferResult TransferHandle::wait() {
    if (!exhausted_.load()) {
        lines(nullptr);
    }

    TransferResult result;
    GError* error = nullptr;
    if (!g_subprocess_wait(process_, nullptr, &error)) {
        result.message = "Failed waiting for " + description_ + ": " +
                         (error && error->message ? error->message : "unknown error");
        g_clear_error(&error);
        Logger::error("[Executor] " + result.message);
        return result;
    }
    paused_.store(false);

    if (g_subprocess_get_if_exited(process_)) {
        result.exit_code = g_subprocess_get_exit_status(process_);
    } else if (g_subprocess_get_if_signaled(process_)) {
        result.exit_code = 128 + g_subprocess_get_term_sig(process_);
    }

    result.success = (result.exit_code == 0);
    if (result.success) {
        result.message = description_ + " completed successfully";
        Logger::info("[Executor] " + result.message);
    } else {
        result.message = description_ + " failed with return code " + std::to_string(result.exit_code);
        Logger::error("[Executor] " + result.message);
    }
    return result;
}

bool TransferHandle::cancel() {
    std::lock_guard<std::mutex> lock(signal_mutex_);
    if (!is_running()) {
        return false;
    }

    Logger::info("[Executor] Stopping " + description_ + " (pid " + pid_ + ")");
    g_subprocess_send_signal(process_, SIGTERM);
    // A stopped process only sees SIGTERM once it is continued
    if (paused_.exchange(false)) {
        g_subprocess_send_signal(process_, SIGCONT);
    }

    auto deadline = std::chrono::steady_clock::now() + CANCEL_GRACE_PERIOD;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!is_running()) {
            Logger::info("[Executor] " + description_ + " cancelled");
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    Logger::warn("[Executor] " + description_ + " still running after " +
                 std::to_string(CANCEL_GRACE_PERIOD.count()) + "s, force killing");
    g_subprocess_force_exit(process_);
    for (int i = 0; i < 20 && is_running(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return true;
}

void TransferHandle::kill() {
    std::lock_guard<std::mutex> lock(signal_mutex_);
    if (!is_running()) {
        return;
    }
    Logger::warn("[Executor] Killing " + description_ + " (pid " + pid_ + ")");
    if (paused_.exchange(false)) {
        g_subprocess_send_signal(process_, SIGCONT);
    }
    g_subprocess_force_exit(process_);
}

bool TransferHandle::pause() {
    std::lock_guard<std::mutex> lock(signal_mutex_);
    if (!is_running() || paused_.load()) {
        return false;
    }
    g_subprocess_send_signal(process_, SIGSTOP);
    paused_.store(true);
    Logger::info("[Executor] Paused " + description_ + " (pid " + pid_ + ")");
    return true;
}

bool TransferHandle::resume() {
    std::lock_guard<std::mutex> lock(signal_mutex_);
    if (!paused_.load()) {
        return false;
    }
    paused_.store(false);
    if (!is_running()) {
        return false;
    }
    g_subprocess_send_signal(process_, SIGCONT);
    Logger::info("[Executor] Resumed " + description_ + " (pid " + pid_ + ")");
    return true;
}

// ============ TransferExecutor ============

TransferExecutor::TransferExecutor(std::string rclone_path)
    : rclone_path_(std::move(rclone_path)) {
}

std::vector<std::string> TransferExecutor::build_sync_arguments(const std::string& source,
                                                                const std::string& destination,
                                                                const std::vector<FilterRule>& filters,
                                                                bool dry_run,
                                                                int bandwidth_limit_kbps) {
    std::vector<std::string> args = {
        "sync",
        source,
        destination,
        "--progress",
        "--stats", "1s",
        "-v"
    };
    if (dry_run) {
        args.push_back("--dry-run");
    }
    for (const auto& filter : filter_arguments(filters)) {
        args.push_back(filter);
    }
    if (bandwidth_limit_kbps > 0) {
        args.push_back("--bwlimit");
        args.push_back(std::to_string(bandwidth_limit_kbps) + "k");
    }
    return args;
}

std::vector<std::string> TransferExecutor::build_size_arguments(const std::string& source,
                                                                const std::vector<FilterRule>& filters) {
    std::vector<std::string> args = {"size", source, "--json"};
    for (const auto& filter : filter_arguments(filters)) {
        args.push_back(filter);
    }
    return args;
}

std::unique_ptr<TransferHandle> TransferExecutor::spawn(const std::vector<std::string>& args,
                                                        const std::string& description) {
    std::string binary = rclone_path_;
    if (binary.empty() || binary.find('/') == std::string::npos) {
        binary = find_in_path(binary.empty() ? "rclone" : binary);
        if (binary.empty()) {
            throw ExecutableNotFound("Rclone not found. Please install rclone.");
        }
    } else if (!is_executable_file(binary)) {
        throw ExecutableNotFound("Rclone not found at " + binary);
    }

    std::vector<const gchar*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(binary.c_str());
    for (const auto& arg : args) {
        argv.push_back(arg.c_str());
    }
    argv.push_back(nullptr);

    Logger::debug("[Executor] Executing: " + join_command(binary, args));

    GError* error = nullptr;
    GSubprocess* process = g_subprocess_newv(
        argv.data(),
        static_cast<GSubprocessFlags>(G_SUBPROCESS_FLAGS_STDOUT_PIPE | G_SUBPROCESS_FLAGS_STDERR_MERGE),
        &error);

    if (!process) {
        std::string message = error && error->message ? error->message : "unknown error";
        bool missing = error && g_error_matches(error, G_SPAWN_ERROR, G_SPAWN_ERROR_NOENT);
        g_clear_error(&error);
        Logger::error("[Executor] Failed to start " + description + ": " + message);
        if (missing) {
            throw ExecutableNotFound("Rclone not found: " + message);
        }
        throw SpawnFailed("Failed to start " + description + ": " + message);
    }

    std::unique_ptr<TransferHandle> handle(new TransferHandle(process, description));
    Logger::info("[Executor] Started " + description + " (pid " + handle->pid() + ")");
    return handle;
}

std::unique_ptr<TransferHandle> TransferExecutor::start(const std::string& source,
                                                        const std::string& destination,
                                                        const std::vector<FilterRule>& filters,
                                                        bool dry_run,
                                                        int bandwidth_limit_kbps) {
    Logger::info("[Executor] " + std::string(dry_run ? "Dry run" : "Sync") + ": " +
                 source + " -> " + destination);
    return spawn(build_sync_arguments(source, destination, filters, dry_run, bandwidth_limit_kbps),
                 dry_run ? "Dry run" : "Sync");
}

SizeEstimate TransferExecutor::estimate_size(const std::string& source,
                                             const std::vector<FilterRule>& filters,
                                             const std::atomic<bool>* abort_flag) {
    std::unique_ptr<TransferHandle> handle = spawn(build_size_arguments(source, filters), "Size estimate");

    std::mutex done_mutex;
    std::condition_variable done_cv;
    bool done = false;
    bool timed_out = false;
    bool aborted = false;
    const auto deadline = std::chrono::steady_clock::now() + estimate_timeout_;

    // rclone size has no progress output, so the deadline is enforced from
    // the side while this thread blocks on the pipe
    std::thread watchdog([&]() {
        std::unique_lock<std::mutex> lock(done_mutex);
        while (!done) {
            if (abort_flag && abort_flag->load()) {
                aborted = true;
                break;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                timed_out = true;
                break;
            }
            done_cv.wait_for(lock, std::chrono::milliseconds(100));
        }
        if (aborted || timed_out) {
            lock.unlock();
            handle->kill();
        }
    });

    auto stop_watchdog = [&]() {
        {
            std::lock_guard<std::mutex> lock(done_mutex);
            done = true;
        }
        done_cv.notify_all();
        watchdog.join();
    };

    std::string output;
    TransferResult result;
    try {
        handle->lines([&output](const std::string& line) {
            output += line;
            output += '\n';
        });
        result = handle->wait();
    } catch (...) {
        stop_watchdog();
        throw;
    }
    stop_watchdog();

    if (aborted) {
        throw EstimationFailed("Size estimate aborted");
    }
    if (timed_out) {
        throw EstimationFailed("Size estimate timed out after " +
                               std::to_string(estimate_timeout_.count()) + "ms");
    }
    if (!result.success) {
        throw EstimationFailed("rclone size failed with return code " + std::to_string(result.exit_code));
    }

    auto estimate = parse_size_json(output);
    if (!estimate) {
        throw EstimationFailed("Unexpected rclone size output: " + output.substr(0, 200));
    }

    Logger::debug("[Executor] Size estimate: " + std::to_string(estimate->bytes) + " bytes in " +
                  std::to_string(estimate->file_count) + " files");
    return *estimate;
}

} // namespace protonsync
