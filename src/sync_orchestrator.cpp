#include "sync_orchestrator.hpp"
#include "logger.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace protonsync {

namespace {

std::string format_megabytes(double megabytes) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << megabytes << " MB";
    return oss.str();
}

} // namespace

const char* sync_phase_name(SyncPhase phase) {
    switch (phase) {
        case SyncPhase::IDLE: return "idle";
        case SyncPhase::PREFLIGHT_DRY_RUN: return "preflight-dry-run";
        case SyncPhase::PREFLIGHT_SIZE_CHECK: return "preflight-size-check";
        case SyncPhase::TRANSFERRING: return "transferring";
        case SyncPhase::PAUSED: return "paused";
        case SyncPhase::CANCELLING: return "cancelling";
    }
    return "unknown";
}

std::string format_iso8601(std::chrono::system_clock::time_point time) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm utc{};
    gmtime_r(&t, &utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buf;
}

/**
 * Releases the claimed episode if run_episode() is left without reaching
 * its normal end, so transfer_in_progress can never stay set.
 */
class SyncOrchestrator::EpisodeGuard {
public:
    explicit EpisodeGuard(SyncOrchestrator& owner) : owner_(owner) {}
    ~EpisodeGuard() {
        if (!released_) {
            owner_.release_episode(false);
        }
    }

    void release(bool success) {
        released_ = true;
        owner_.release_episode(success);
    }

private:
    SyncOrchestrator& owner_;
    bool released_ = false;
};

SyncOrchestrator::SyncOrchestrator(ConfigManager& config, TransferExecutor& executor,
                                   SyncObserver* observer)
    : config_(config), executor_(executor), observer_(observer) {
}

SyncOrchestrator::~SyncOrchestrator() {
    shutdown();
}

// ============ Auto sync ============

bool SyncOrchestrator::start_auto_sync() {
    std::lock_guard<std::mutex> control(control_mutex_);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (shutting_down_) {
            return false;
        }
        if (state_.auto_sync_running) {
            Logger::warn("[Orchestrator] Auto sync already running");
            return false;
        }
        if (!config_.is_configured()) {
            Logger::error("[Orchestrator] Cannot start auto sync: not configured");
            return false;
        }
        state_.auto_sync_running = true;
    }
    {
        std::lock_guard<std::mutex> lock(scheduler_mutex_);
        stop_requested_ = false;
        scheduler_exited_ = false;
    }

    Logger::info("[Orchestrator] Auto sync started (interval " +
                 std::to_string(current_interval().count() / 1000) + "s)");

    // First tick is issued here rather than on the scheduler thread, so a
    // start immediately followed by a stop has always triggered one sync
    sync_now(false);

    try {
        scheduler_thread_ = std::thread(&SyncOrchestrator::scheduler_loop, this);
    } catch (const std::system_error& e) {
        Logger::error("[Orchestrator] Failed to create scheduler thread: " + std::string(e.what()));
        {
            std::lock_guard<std::mutex> lock(scheduler_mutex_);
            scheduler_exited_ = true;
        }
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_.auto_sync_running = false;
        return false;
    }
    return true;
}

void SyncOrchestrator::stop_auto_sync() {
    std::lock_guard<std::mutex> control(control_mutex_);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!state_.auto_sync_running) {
            return;
        }
        state_.auto_sync_running = false;
    }

    {
        std::unique_lock<std::mutex> lock(scheduler_mutex_);
        stop_requested_ = true;
        scheduler_cv_.notify_all();
        if (!scheduler_cv_.wait_for(lock, STOP_JOIN_TIMEOUT, [this] { return scheduler_exited_; })) {
            Logger::warn("[Orchestrator] Scheduler did not stop within " +
                         std::to_string(STOP_JOIN_TIMEOUT.count()) + "s");
        }
    }
    if (scheduler_thread_.joinable()) {
        scheduler_thread_.join();
    }

    Logger::info("[Orchestrator] Auto sync stopped");
}

void SyncOrchestrator::scheduler_loop() {
    while (true) {
        std::chrono::milliseconds interval = current_interval();
        {
            std::unique_lock<std::mutex> lock(scheduler_mutex_);
            if (scheduler_cv_.wait_for(lock, interval, [this] { return stop_requested_; })) {
                break;
            }
        }
        Logger::debug("[Orchestrator] Scheduled sync");
        sync_now(false);
    }

    std::lock_guard<std::mutex> lock(scheduler_mutex_);
    scheduler_exited_ = true;
    scheduler_cv_.notify_all();
}

std::chrono::milliseconds SyncOrchestrator::current_interval() {
    {
        std::lock_guard<std::mutex> lock(scheduler_mutex_);
        if (interval_override_) {
            return *interval_override_;
        }
    }
    return std::chrono::minutes(config_.snapshot().interval_minutes);
}

void SyncOrchestrator::set_interval_override(std::optional<std::chrono::milliseconds> interval) {
    std::lock_guard<std::mutex> lock(scheduler_mutex_);
    interval_override_ = interval;
}

// ============ Sync episodes ============

bool SyncOrchestrator::sync_now(bool blocking) {
    SyncConfiguration config = config_.snapshot();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (shutting_down_) {
            return false;
        }
        if (state_.transfer_in_progress) {
            Logger::warn("[Orchestrator] Sync already in progress");
            return false;
        }
        if (!config.is_configured()) {
            Logger::error("[Orchestrator] Cannot sync: not configured");
            return false;
        }
        state_.transfer_in_progress = true;
        state_.paused = false;
        state_.phase = SyncPhase::IDLE;
        cancel_requested_.store(false);
    }

    if (blocking) {
        run_episode(config);
        return true;
    }

    {
        std::lock_guard<std::mutex> lock(worker_mutex_);
        active_workers_++;
    }
    try {
        std::thread(&SyncOrchestrator::worker_main, this, config).detach();
    } catch (const std::system_error& e) {
        Logger::error("[Orchestrator] Failed to create sync thread: " + std::string(e.what()));
        {
            std::lock_guard<std::mutex> lock(worker_mutex_);
            active_workers_--;
            worker_cv_.notify_all();
        }
        release_episode(false);
        return false;
    }
    return true;
}

void SyncOrchestrator::worker_main(SyncConfiguration config) {
    run_episode(config);

    std::lock_guard<std::mutex> lock(worker_mutex_);
    active_workers_--;
    worker_cv_.notify_all();
}

void SyncOrchestrator::run_episode(const SyncConfiguration& config) {
    EpisodeGuard guard(*this);
    notify_start();

    TransferResult result;
    try {
        result = perform_sync(config);
    } catch (const std::exception& e) {
        result.success = false;
        result.message = e.what();
        Logger::error("[Orchestrator] Error during sync: " + result.message);
    }

    if (result.success) {
        Logger::info("[Orchestrator] Sync completed successfully");
    } else {
        Logger::error("[Orchestrator] Sync failed: " + result.message);
    }

    guard.release(result.success);
    notify_complete(result.success, result.message);
}

TransferResult SyncOrchestrator::perform_sync(const SyncConfiguration& config) {
    std::vector<FilterRule> filters =
        compile_filters(config.sync_mode, config.included_folders, config.excluded_folders);

    bool first_sync = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        first_sync = !state_.first_sync_completed;
    }

    Logger::info("[Orchestrator] Syncing " + config.remote + ": to " + config.local_path +
                 " (mode " + sync_mode_to_string(config.sync_mode) + ", " +
                 std::to_string(filters.size()) + " filter rules)");

    if (first_sync && config.dry_run_first_sync) {
        enter_phase(SyncPhase::PREFLIGHT_DRY_RUN);
        TransferResult dry_run = run_transfer(config, filters, true);
        if (cancel_requested_.load()) {
            return cancelled_result();
        }
        if (!dry_run.success) {
            dry_run.message = "Dry run failed: " + dry_run.message;
            return dry_run;
        }
    }

    if (first_sync) {
        enter_phase(SyncPhase::PREFLIGHT_SIZE_CHECK);
        bool proceed = run_size_check(config, filters);
        if (cancel_requested_.load()) {
            return cancelled_result();
        }
        if (!proceed) {
            TransferResult declined;
            declined.message = "Large sync was not confirmed";
            return declined;
        }
    }

    if (cancel_requested_.load()) {
        return cancelled_result();
    }

    enter_phase(SyncPhase::TRANSFERRING);
    TransferResult result = run_transfer(config, filters, false);
    if (!result.success && cancel_requested_.load()) {
        TransferResult cancelled = cancelled_result();
        cancelled.exit_code = result.exit_code;
        return cancelled;
    }
    return result;
}

TransferResult SyncOrchestrator::run_transfer(const SyncConfiguration& config,
                                              const std::vector<FilterRule>& filters,
                                              bool dry_run) {
    std::shared_ptr<TransferHandle> handle = executor_.start(
        config.remote + ":", config.local_path, filters, dry_run, config.bandwidth_limit_kbps);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        active_handle_ = handle;
    }
    // cancel() may have run before the handle was visible to it
    if (cancel_requested_.load()) {
        handle->cancel();
    }

    handle->lines([this](const std::string& line) {
        Logger::debug("[rclone] " + line);
        notify_progress(line);
    });
    TransferResult result = handle->wait();

    std::lock_guard<std::mutex> lock(state_mutex_);
    active_handle_.reset();
    state_.paused = false;
    if (state_.phase == SyncPhase::PAUSED) {
        state_.phase = SyncPhase::TRANSFERRING;
    }
    return result;
}

bool SyncOrchestrator::run_size_check(const SyncConfiguration& config,
                                      const std::vector<FilterRule>& filters) {
    SizeEstimate estimate;
    try {
        estimate = executor_.estimate_size(config.remote + ":", filters, &cancel_requested_);
    } catch (const ExecutableNotFound&) {
        throw;
    } catch (const TransferError& e) {
        Logger::warn("[Orchestrator] Size check skipped, size unknown: " + std::string(e.what()));
        return true;
    }

    Logger::info("[Orchestrator] Sync size: " + format_megabytes(estimate.megabytes()) + ", " +
                 std::to_string(estimate.file_count) + " files");

    if (!config.confirm_large_sync ||
        estimate.megabytes() <= static_cast<double>(config.large_sync_threshold_mb)) {
        return true;
    }

    SyncWarningData data;
    data.size_bytes = estimate.bytes;
    data.size_mb = estimate.megabytes();
    data.size_gb = estimate.gigabytes();
    data.file_count = estimate.file_count;

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_.large_sync_decision.reset();
        state_.awaiting_confirmation = true;
    }
    Logger::warn("[Orchestrator] Large sync detected (" + format_megabytes(data.size_mb) +
                 ", threshold " + std::to_string(config.large_sync_threshold_mb) +
                 " MB), waiting for confirmation");
    notify_warning("large_sync", data);

    std::unique_lock<std::mutex> lock(state_mutex_);
    auto answered = [this] {
        return state_.large_sync_decision.has_value() || cancel_requested_.load();
    };
    bool in_time = true;
    if (config.large_sync_confirm_timeout_seconds > 0) {
        in_time = state_cv_.wait_for(lock, std::chrono::seconds(config.large_sync_confirm_timeout_seconds),
                                     answered);
    } else {
        state_cv_.wait(lock, answered);
    }

    bool proceed = in_time && state_.large_sync_decision.value_or(false) && !cancel_requested_.load();
    state_.awaiting_confirmation = false;
    state_.large_sync_decision.reset();
    lock.unlock();

    if (!in_time) {
        Logger::warn("[Orchestrator] No confirmation within " +
                     std::to_string(config.large_sync_confirm_timeout_seconds) + "s, not syncing");
    } else if (!proceed) {
        Logger::info("[Orchestrator] Large sync declined");
    } else {
        Logger::info("[Orchestrator] Large sync confirmed");
    }
    return proceed;
}

void SyncOrchestrator::release_episode(bool success) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (success) {
        state_.last_sync_time = std::chrono::system_clock::now();
        state_.first_sync_completed = true;
    }
    state_.transfer_in_progress = false;
    state_.paused = false;
    state_.phase = SyncPhase::IDLE;
    state_.awaiting_confirmation = false;
    state_.large_sync_decision.reset();
    active_handle_.reset();
}

void SyncOrchestrator::enter_phase(SyncPhase phase) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (cancel_requested_.load()) {
        return;
    }
    Logger::debug(std::string("[Orchestrator] ") + sync_phase_name(state_.phase) + " -> " +
                  sync_phase_name(phase));
    state_.phase = phase;
}

TransferResult SyncOrchestrator::cancelled_result() const {
    TransferResult result;
    result.message = "Sync cancelled";
    return result;
}

// ============ Control ============

bool SyncOrchestrator::cancel() {
    std::shared_ptr<TransferHandle> handle;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!state_.transfer_in_progress) {
            return false;
        }
        cancel_requested_.store(true);
        state_.phase = SyncPhase::CANCELLING;
        state_.paused = false;
        handle = active_handle_;
    }
    state_cv_.notify_all();

    Logger::info("[Orchestrator] Cancelling sync");
    if (handle) {
        handle->cancel();
    }
    return true;
}

bool SyncOrchestrator::pause() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!state_.transfer_in_progress || state_.phase != SyncPhase::TRANSFERRING || !active_handle_) {
        return false;
    }
    if (!active_handle_->pause()) {
        return false;
    }
    state_.paused = true;
    state_.phase = SyncPhase::PAUSED;
    Logger::info("[Orchestrator] Sync paused");
    return true;
}

bool SyncOrchestrator::resume() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!state_.paused || !active_handle_) {
        return false;
    }
    bool resumed = active_handle_->resume();
    state_.paused = false;
    if (state_.phase == SyncPhase::PAUSED) {
        state_.phase = SyncPhase::TRANSFERRING;
    }
    if (resumed) {
        Logger::info("[Orchestrator] Sync resumed");
    }
    return resumed;
}

bool SyncOrchestrator::confirm_large_sync(bool proceed) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!state_.awaiting_confirmation) {
            return false;
        }
        state_.large_sync_decision = proceed;
    }
    state_cv_.notify_all();
    return true;
}

SyncStatus SyncOrchestrator::get_status() const {
    SyncStatus status;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        status.auto_sync_running = state_.auto_sync_running;
        status.transfer_in_progress = state_.transfer_in_progress;
        status.paused = state_.paused;
        status.first_sync_completed = state_.first_sync_completed;
        status.phase = state_.phase;
        if (state_.last_sync_time) {
            status.last_sync_time = format_iso8601(*state_.last_sync_time);
        }
    }
    status.configured = config_.is_configured();
    return status;
}

SyncPhase SyncOrchestrator::phase() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_.phase;
}

void SyncOrchestrator::shutdown() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        shutting_down_ = true;
    }
    stop_auto_sync();
    cancel();

    std::unique_lock<std::mutex> lock(worker_mutex_);
    worker_cv_.wait(lock, [this] { return active_workers_ == 0; });
}

// ============ Observer dispatch ============

void SyncOrchestrator::notify_start() {
    if (!observer_) return;
    try {
        observer_->on_sync_start();
    } catch (const std::exception& e) {
        Logger::error("[Orchestrator] on_sync_start handler failed: " + std::string(e.what()));
    }
}

void SyncOrchestrator::notify_progress(const std::string& line) {
    if (!observer_) return;
    try {
        observer_->on_sync_progress(line);
    } catch (const std::exception& e) {
        Logger::error("[Orchestrator] on_sync_progress handler failed: " + std::string(e.what()));
    }
}

void SyncOrchestrator::notify_complete(bool success, const std::string& message) {
    if (!observer_) return;
    try {
        observer_->on_sync_complete(success, message);
    } catch (const std::exception& e) {
        Logger::error("[Orchestrator] on_sync_complete handler failed: " + std::string(e.what()));
    }
}

void SyncOrchestrator::notify_warning(const std::string& kind, const SyncWarningData& data) {
    if (!observer_) return;
    try {
        observer_->on_sync_warning(kind, data);
    } catch (const std::exception& e) {
        Logger::error("[Orchestrator] on_sync_warning handler failed: " + std::string(e.what()));
    }
}

} // namespace protonsync
