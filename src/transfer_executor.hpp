#pragma once

#include <gio/gio.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "filter_compiler.hpp"

namespace protonsync {

/**
 * Errors raised while driving the rclone binary
 */
class TransferError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The rclone binary could not be located or is not executable
class ExecutableNotFound : public TransferError {
public:
    using TransferError::TransferError;
};

// The binary exists but the process could not be started
class SpawnFailed : public TransferError {
public:
    using TransferError::TransferError;
};

// `rclone size` failed, timed out or printed something we cannot read
class EstimationFailed : public TransferError {
public:
    using TransferError::TransferError;
};

struct TransferResult {
    bool success = false;
    std::string message;
    int exit_code = -1;
};

struct SizeEstimate {
    long long bytes = 0;
    long long file_count = 0;

    double megabytes() const { return static_cast<double>(bytes) / (1024.0 * 1024.0); }
    double gigabytes() const { return static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0); }
};

/**
 * Parse the output of `rclone size --json`, e.g.
 *   {"count":42,"bytes":1048576,"sizeless":0}
 * Returns nothing when "bytes" is missing or not a number.
 */
std::optional<SizeEstimate> parse_size_json(const std::string& json);

/**
 * Resolve the rclone binary. A configured path must point at an executable
 * file. Otherwise the AppImage bundle ($APPDIR/usr/bin/rclone), the usual
 * system locations and finally $PATH are searched.
 * Throws ExecutableNotFound when nothing usable is found.
 */
std::string locate_rclone(const std::string& configured_path = "");

/**
 * One running rclone process.
 *
 * Output (stdout with stderr merged) is consumed exactly once through
 * lines(); the stream is bound to this process and cannot be rewound.
 * cancel(), pause() and resume() may be called from any thread while
 * another thread is blocked in lines() or wait().
 */
class TransferHandle {
public:
    using LineCallback = std::function<void(const std::string& line)>;

    static constexpr std::chrono::seconds CANCEL_GRACE_PERIOD{5};

    ~TransferHandle();

    TransferHandle(const TransferHandle&) = delete;
    TransferHandle& operator=(const TransferHandle&) = delete;

    // Blocks reading output until EOF, handing each non-empty line to
    // on_line as soon as it is read. Returns the number of lines delivered.
    // A second call returns 0 immediately.
    size_t lines(const LineCallback& on_line);

    // Drains any unread output, then blocks until the process exits
    TransferResult wait();

    // SIGTERM, then SIGKILL if the process is still alive after the grace
    // period. False if the process had already exited.
    bool cancel();

    // Immediate SIGKILL
    void kill();

    // SIGSTOP / SIGCONT
    bool pause();
    bool resume();

    bool is_paused() const { return paused_.load(); }
    bool is_running() const;
    std::string pid() const;

private:
    friend class TransferExecutor;
    TransferHandle(GSubprocess* process, std::string description);

    GSubprocess* process_ = nullptr;
    GDataInputStream* output_ = nullptr;
    std::string description_;
    std::string pid_;

    std::atomic<bool> exhausted_{false};
    std::atomic<bool> paused_{false};
    std::mutex signal_mutex_;
    std::mutex read_mutex_;
};

/**
 * Builds rclone command lines and starts them.
 *
 *   rclone sync <src> <dst> --progress --stats 1s -v [--dry-run] [filters] [--bwlimit Nk]
 *   rclone size <src> --json [filters]
 */
class TransferExecutor {
public:
    static constexpr std::chrono::seconds DEFAULT_ESTIMATE_TIMEOUT{60};

    explicit TransferExecutor(std::string rclone_path);

    const std::string& rclone_path() const { return rclone_path_; }

    void set_estimate_timeout(std::chrono::milliseconds timeout) { estimate_timeout_ = timeout; }

    static std::vector<std::string> build_sync_arguments(const std::string& source,
                                                         const std::string& destination,
                                                         const std::vector<FilterRule>& filters,
                                                         bool dry_run,
                                                         int bandwidth_limit_kbps);

    static std::vector<std::string> build_size_arguments(const std::string& source,
                                                         const std::vector<FilterRule>& filters);

    // Throws ExecutableNotFound or SpawnFailed
    std::unique_ptr<TransferHandle> start(const std::string& source,
                                          const std::string& destination,
                                          const std::vector<FilterRule>& filters,
                                          bool dry_run,
                                          int bandwidth_limit_kbps);

    // Throws ExecutableNotFound, SpawnFailed or EstimationFailed. When
    // abort_flag becomes true the size process is killed and the call fails.
    SizeEstimate estimate_size(const std::string& source,
                               const std::vector<FilterRule>& filters,
                               const std::atomic<bool>* abort_flag = nullptr);

private:
    std::unique_ptr<TransferHandle> spawn(const std::vector<std::string>& args,
                                          const std::string& description);

    std::string rclone_path_;
    std::chrono::milliseconds estimate_timeout_{DEFAULT_ESTIMATE_TIMEOUT};
};

} // namespace protonsync
