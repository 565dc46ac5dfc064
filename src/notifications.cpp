#include "notifications.hpp"
#include "logger.hpp"
#include "progress_parser.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>

namespace protonsync {

namespace {

// Queued notification, owned by the idle callback
struct PendingNotification {
    GApplication* app;
    std::string id;
    GNotification* notification;  // nullptr = withdraw
};

gboolean deliver_notification(gpointer user_data) {
    auto* pending = static_cast<PendingNotification*>(user_data);
    if (pending->notification) {
        g_application_send_notification(pending->app, pending->id.c_str(), pending->notification);
        g_object_unref(pending->notification);
    } else {
        g_application_withdraw_notification(pending->app, pending->id.c_str());
    }
    g_object_unref(pending->app);
    delete pending;
    return G_SOURCE_REMOVE;
}

std::string icon_for_type(NotificationType type) {
    switch (type) {
        case NotificationType::SYNC_COMPLETE:
            return "emblem-ok-symbolic";
        case NotificationType::WARNING:
            return "dialog-warning-symbolic";
        case NotificationType::SYNC_ERROR:
            return "dialog-error-symbolic";
        case NotificationType::INFO:
        default:
            return "emblem-synchronizing-symbolic";
    }
}

GNotificationPriority priority_for_type(NotificationType type) {
    switch (type) {
        case NotificationType::SYNC_ERROR:
            return G_NOTIFICATION_PRIORITY_URGENT;
        case NotificationType::WARNING:
            return G_NOTIFICATION_PRIORITY_HIGH;
        default:
            return G_NOTIFICATION_PRIORITY_NORMAL;
    }
}

} // namespace

NotificationManager::NotificationManager(GApplication* app) : app_(app) {
    if (app_) {
        g_object_ref(app_);
        Logger::info("[Notifications] Notification manager initialized");
    }
}

NotificationManager::~NotificationManager() {
    if (app_) {
        g_object_unref(app_);
    }
}

void NotificationManager::set_large_sync_callback(LargeSyncCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    large_sync_callback_ = std::move(callback);
}

void NotificationManager::post(const std::string& id, GNotification* notification) {
    auto* pending = new PendingNotification{G_APPLICATION(g_object_ref(app_)), id, notification};
    g_idle_add(deliver_notification, pending);
}

void NotificationManager::post_withdraw(const std::string& id) {
    auto* pending = new PendingNotification{G_APPLICATION(g_object_ref(app_)), id, nullptr};
    g_idle_add(deliver_notification, pending);
}

void NotificationManager::notify(const std::string& title, const std::string& body,
                                 NotificationType type) {
    if (!enabled_ || !app_) {
        Logger::debug("[Notifications] Skipped: " + title);
        return;
    }

    GNotification* notification = g_notification_new(title.c_str());
    g_notification_set_body(notification, body.c_str());

    GIcon* icon = g_themed_icon_new(icon_for_type(type).c_str());
    g_notification_set_icon(notification, icon);
    g_object_unref(icon);

    g_notification_set_priority(notification, priority_for_type(type));

    std::string notification_id = "protondrive-sync-" + std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count());
    post(notification_id, notification);

    Logger::info("[Notifications] Sent: " + title);
}

void NotificationManager::show_progress(const std::string& id, const std::string& title,
                                        double progress, const std::string& status) {
    // GNotification has no progress bar; the body carries the percentage
    if (!enabled_ || !app_) return;

    std::ostringstream oss;
    oss << status << " (" << std::fixed << std::setprecision(0) << (progress * 100) << "%)";

    GNotification* notification = g_notification_new(title.c_str());
    g_notification_set_body(notification, oss.str().c_str());
    g_notification_set_priority(notification, G_NOTIFICATION_PRIORITY_LOW);

    GIcon* icon = g_themed_icon_new("emblem-synchronizing-symbolic");
    g_notification_set_icon(notification, icon);
    g_object_unref(icon);

    post(id, notification);
}

void NotificationManager::hide_progress(const std::string& id) {
    if (app_) {
        post_withdraw(id);
    }
}

void NotificationManager::on_sync_start() {
    last_progress_percent_ = -1;
    notify("Sync Started", "Syncing with Proton Drive", NotificationType::INFO);
}

void NotificationManager::on_sync_progress(const std::string& line) {
    std::optional<TransferProgress> progress = parse_progress_line(line);
    if (!progress) return;

    // Only repost when the percentage moves
    if (last_progress_percent_.exchange(progress->percent) == progress->percent) return;

    show_progress(PROGRESS_ID, "Syncing",
                  progress->fraction(), progress->transferred + " of " + progress->total +
                  (progress->speed.empty() ? "" : ", " + progress->speed));
}

void NotificationManager::on_sync_complete(bool success, const std::string& message) {
    hide_progress(PROGRESS_ID);
    if (success) {
        notify("Sync Complete", "Your files are up to date", NotificationType::SYNC_COMPLETE);
    } else {
        notify("Sync Error", message, NotificationType::SYNC_ERROR);
    }
}

void NotificationManager::on_sync_warning(const std::string& kind, const SyncWarningData& data) {
    if (kind != "large_sync") {
        Logger::warn("[Notifications] Unhandled sync warning: " + kind);
        return;
    }

    std::ostringstream body;
    body << "The first sync will download " << format_bytes(data.size_bytes)
         << " (" << data.file_count << " file" << (data.file_count == 1 ? "" : "s") << ")";
    notify("Large Sync", body.str(), NotificationType::WARNING);

    LargeSyncCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = large_sync_callback_;
    }
    if (callback) {
        callback(data);
    }
}

std::string format_bytes(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_index < 4) {
        size /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    if (unit_index == 0) {
        oss << bytes << " B";
    } else {
        oss << std::fixed << std::setprecision(1) << size << " " << units[unit_index];
    }
    return oss.str();
}

} // namespace protonsync
