#include <gtest/gtest.h>
#include "notifications.hpp"

namespace protonsync {
namespace {

TEST(NotificationsTest, FormatsBytes) {
    EXPECT_EQ(format_bytes(0), "0 B");
    EXPECT_EQ(format_bytes(1023), "1023 B");
    EXPECT_EQ(format_bytes(1536), "1.5 KB");
    EXPECT_EQ(format_bytes(2000ULL * 1024 * 1024), "2.0 GB");
    EXPECT_EQ(format_bytes(3ULL * 1024 * 1024 * 1024 * 1024), "3.0 TB");
}

TEST(NotificationsTest, LargeSyncWarningReachesCallbackWithoutDesktop) {
    NotificationManager notifications(nullptr);
    int calls = 0;
    long long seen_bytes = 0;
    notifications.set_large_sync_callback([&](const SyncWarningData& data) {
        calls++;
        seen_bytes = data.size_bytes;
    });

    SyncWarningData data;
    data.size_bytes = 5LL * 1024 * 1024 * 1024;
    data.file_count = 10;
    notifications.on_sync_warning("large_sync", data);
    notifications.on_sync_warning("something_else", data);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(seen_bytes, 5LL * 1024 * 1024 * 1024);
}

TEST(NotificationsTest, ObserverEventsWithoutApplicationAreHarmless) {
    NotificationManager notifications(nullptr);
    notifications.set_enabled(false);
    EXPECT_FALSE(notifications.is_enabled());

    notifications.on_sync_start();
    notifications.on_sync_progress("Transferred: 1 MiB / 2 MiB, 50%, 1 MiB/s, ETA 1s");
    notifications.on_sync_complete(false, "Sync failed with return code 1");
    notifications.on_sync_complete(true, "Sync completed successfully");
}

} // namespace
} // namespace protonsync
