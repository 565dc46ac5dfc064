#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <gio/gio.h>
#include "sync_observer.hpp"

namespace protonsync {

/**
 * Desktop notification types for user feedback
 */
enum class NotificationType {
    INFO,
    WARNING,
    SYNC_COMPLETE,
    SYNC_ERROR
};

using LargeSyncCallback = std::function<void(const SyncWarningData& data)>;

/**
 * Desktop Notifications Manager
 *
 * Turns sync events into desktop notifications:
 * - sync started / completed / failed
 * - transfer progress (one notification, updated in place)
 * - large first sync waiting for confirmation
 *
 * Uses GNotification (GIO). Observer callbacks arrive on the sync worker
 * thread, so every notification is posted to the main context with g_idle_add.
 */
class NotificationManager : public SyncObserver {
public:
    static constexpr const char* PROGRESS_ID = "protondrive-sync-progress";

    explicit NotificationManager(GApplication* app);
    ~NotificationManager() override;

    NotificationManager(const NotificationManager&) = delete;
    NotificationManager& operator=(const NotificationManager&) = delete;

    void notify(const std::string& title, const std::string& body,
                NotificationType type = NotificationType::INFO);

    void show_progress(const std::string& id, const std::string& title,
                       double progress, const std::string& status);
    void hide_progress(const std::string& id);

    void set_enabled(bool enabled) { enabled_ = enabled; }
    bool is_enabled() const { return enabled_; }

    // Called on the worker thread that waits for the answer, before the
    // warning notification is posted
    void set_large_sync_callback(LargeSyncCallback callback);

    // SyncObserver
    void on_sync_start() override;
    void on_sync_progress(const std::string& line) override;
    void on_sync_complete(bool success, const std::string& message) override;
    void on_sync_warning(const std::string& kind, const SyncWarningData& data) override;

private:
    void post(const std::string& id, GNotification* notification);
    void post_withdraw(const std::string& id);

    GApplication* app_ = nullptr;
    std::atomic<bool> enabled_{true};
    std::atomic<int> last_progress_percent_{-1};

    std::mutex callback_mutex_;
    LargeSyncCallback large_sync_callback_;
};

/**
 * Format bytes to human readable string
 */
std::string format_bytes(uint64_t bytes);

} // namespace protonsync
