#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "config_manager.hpp"
#include "filter_compiler.hpp"
#include "sync_observer.hpp"
#include "transfer_executor.hpp"

namespace protonsync {

enum class SyncPhase {
    IDLE,
    PREFLIGHT_DRY_RUN,
    PREFLIGHT_SIZE_CHECK,
    TRANSFERRING,
    PAUSED,
    CANCELLING
};

const char* sync_phase_name(SyncPhase phase);

// UTC, second precision: 2024-05-01T13:45:10Z
std::string format_iso8601(std::chrono::system_clock::time_point time);

struct SyncStatus {
    bool auto_sync_running = false;
    bool transfer_in_progress = false;
    bool paused = false;
    std::optional<std::string> last_sync_time;
    bool configured = false;
    bool first_sync_completed = false;
    SyncPhase phase = SyncPhase::IDLE;
};

/**
 * Sync Orchestrator
 *
 * Decides when and how rclone runs:
 * - first sync: optional dry run, then a size check that can hold the
 *   transfer until the user confirms a large download
 * - every sync: one `rclone sync` with the compiled filters and bandwidth limit
 * - auto sync: a scheduler thread that triggers a sync every interval
 *
 * At most one sync episode exists at a time. It is claimed atomically by
 * sync_now() and released on every exit path. Configuration is re-read at
 * the start of each episode and before each scheduler wait.
 */
class SyncOrchestrator {
public:
    static constexpr std::chrono::seconds STOP_JOIN_TIMEOUT{5};

    SyncOrchestrator(ConfigManager& config, TransferExecutor& executor,
                     SyncObserver* observer = nullptr);
    ~SyncOrchestrator();

    SyncOrchestrator(const SyncOrchestrator&) = delete;
    SyncOrchestrator& operator=(const SyncOrchestrator&) = delete;

    // Triggers the first sync immediately, then one per interval.
    // False if already running or not configured.
    bool start_auto_sync();
    void stop_auto_sync();

    // False if a sync is already in progress or the configuration is
    // incomplete. Non-blocking runs on a worker thread.
    bool sync_now(bool blocking = false);

    // Stops the running episode (pre-flight included). False when idle.
    bool cancel();

    // Suspends / continues the rclone process of the real transfer
    bool pause();
    bool resume();

    // Answer to a pending "large_sync" warning. False if none is pending.
    bool confirm_large_sync(bool proceed);

    SyncStatus get_status() const;
    SyncPhase phase() const;

    // Stop auto sync, cancel the running episode and wait for the worker.
    // Further sync_now() calls are refused. Not to be called from an observer.
    void shutdown();

    // Replace the configured minute-based interval (tests, --interval)
    void set_interval_override(std::optional<std::chrono::milliseconds> interval);

private:
    struct SyncState {
        bool auto_sync_running = false;
        bool transfer_in_progress = false;
        bool paused = false;
        bool first_sync_completed = false;
        std::optional<std::chrono::system_clock::time_point> last_sync_time;
        SyncPhase phase = SyncPhase::IDLE;

        bool awaiting_confirmation = false;
        std::optional<bool> large_sync_decision;
    };

    class EpisodeGuard;

    void worker_main(SyncConfiguration config);
    void run_episode(const SyncConfiguration& config);
    TransferResult perform_sync(const SyncConfiguration& config);
    TransferResult run_transfer(const SyncConfiguration& config,
                                const std::vector<FilterRule>& filters,
                                bool dry_run);
    bool run_size_check(const SyncConfiguration& config, const std::vector<FilterRule>& filters);
    void release_episode(bool success);

    void enter_phase(SyncPhase phase);
    TransferResult cancelled_result() const;

    void scheduler_loop();
    std::chrono::milliseconds current_interval();

    void notify_start();
    void notify_progress(const std::string& line);
    void notify_complete(bool success, const std::string& message);
    void notify_warning(const std::string& kind, const SyncWarningData& data);

    ConfigManager& config_;
    TransferExecutor& executor_;
    SyncObserver* observer_;

    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    SyncState state_;
    std::shared_ptr<TransferHandle> active_handle_;
    std::atomic<bool> cancel_requested_{false};
    bool shutting_down_ = false;

    // Serialises start_auto_sync / stop_auto_sync
    std::mutex control_mutex_;

    std::mutex scheduler_mutex_;
    std::condition_variable scheduler_cv_;
    bool stop_requested_ = false;
    bool scheduler_exited_ = true;
    std::thread scheduler_thread_;
    std::optional<std::chrono::milliseconds> interval_override_;

    // Workers are detached; shutdown() waits for the count to drop to zero
    std::mutex worker_mutex_;
    std::condition_variable worker_cv_;
    size_t active_workers_ = 0;
};

} // namespace protonsync
