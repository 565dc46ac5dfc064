#include <gtest/gtest.h>
#include "config_manager.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <filesystem>
#include <thread>

namespace protonsync {
namespace {

using test::TempDir;

TEST(ConfigManagerTest, DefaultsWhenNoFile) {
    TempDir dir;
    ConfigManager config(dir.path());
    EXPECT_FALSE(config.load());

    SyncConfiguration snapshot = config.snapshot();
    EXPECT_TRUE(snapshot.remote.empty());
    EXPECT_EQ(snapshot.sync_mode, SyncMode::FULL);
    EXPECT_FALSE(snapshot.auto_sync_enabled);
    EXPECT_EQ(snapshot.interval_minutes, 30);
    EXPECT_TRUE(snapshot.dry_run_first_sync);
    EXPECT_TRUE(snapshot.confirm_large_sync);
    EXPECT_EQ(snapshot.large_sync_threshold_mb, 1000);
    EXPECT_EQ(snapshot.large_sync_confirm_timeout_seconds, 300);
    EXPECT_EQ(snapshot.bandwidth_limit_kbps, 0);
    EXPECT_TRUE(snapshot.notifications_enabled);
    EXPECT_EQ(snapshot.log_level, "INFO");
    EXPECT_FALSE(snapshot.is_configured());
    EXPECT_FALSE(config.is_configured());
}

TEST(ConfigManagerTest, SaveAndLoadRoundTrip) {
    TempDir dir;
    {
        ConfigManager config(dir.path() + "/nested");
        config.set_string("rclone_remote", "proton");
        config.set_string("local_folder", "/home/user/Proton \"Drive\"");
        config.set_string("sync_mode", "include");
        config.set_int("sync_interval_minutes", 15);
        config.set_bool("dry_run_first_sync", false);
        config.set_int("bandwidth_limit_kbps", 512);
        config.add_included_folder("Photos");
        config.add_included_folder("Documents/Work");
        ASSERT_TRUE(config.save());
    }

    ConfigManager config(dir.path() + "/nested");
    ASSERT_TRUE(config.load());
    SyncConfiguration snapshot = config.snapshot();
    EXPECT_EQ(snapshot.remote, "proton");
    EXPECT_EQ(snapshot.local_path, "/home/user/Proton \"Drive\"");
    EXPECT_EQ(snapshot.sync_mode, SyncMode::INCLUDE);
    EXPECT_EQ(snapshot.interval_minutes, 15);
    EXPECT_FALSE(snapshot.dry_run_first_sync);
    EXPECT_EQ(snapshot.bandwidth_limit_kbps, 512);
    EXPECT_EQ(snapshot.included_folders, (std::vector<std::string>{"Photos", "Documents/Work"}));
    EXPECT_TRUE(snapshot.excluded_folders.empty());
    EXPECT_TRUE(config.is_configured());
}

TEST(ConfigManagerTest, LoadsHandWrittenFileOverDefaults) {
    TempDir dir;
    test::write_file(dir.file("config.json"),
        "{\n"
        "  \"rclone_remote\": \"proton\",\n"
        "  \"local_folder\": \"/data/proton\",\n"
        "  \"sync_mode\": \"selective_exclude\",\n"
        "  \"excluded_folders\": [\"Trash\", \"Old\"],\n"
        "  \"auto_sync_enabled\": true,\n"
        "  \"large_sync_threshold_mb\": 250,\n"
        "  \"rclone_path\": null\n"
        "}\n");

    ConfigManager config(dir.path());
    ASSERT_TRUE(config.load());
    SyncConfiguration snapshot = config.snapshot();
    EXPECT_EQ(snapshot.sync_mode, SyncMode::EXCLUDE);
    EXPECT_EQ(snapshot.excluded_folders, (std::vector<std::string>{"Trash", "Old"}));
    EXPECT_TRUE(snapshot.auto_sync_enabled);
    EXPECT_EQ(snapshot.large_sync_threshold_mb, 250);
    EXPECT_TRUE(snapshot.rclone_path.empty());
    EXPECT_EQ(snapshot.interval_minutes, 30);
}

TEST(ConfigManagerTest, MalformedFileFallsBackToDefaults) {
    TempDir dir;
    test::write_file(dir.file("config.json"), "{\"rclone_remote\": \"proton\", \"local_folder\": ");

    ConfigManager config(dir.path());
    EXPECT_FALSE(config.load());
    EXPECT_TRUE(config.snapshot().remote.empty());
    EXPECT_EQ(config.snapshot().interval_minutes, 30);
}

TEST(ConfigManagerTest, SnapshotClampsOutOfRangeValues) {
    TempDir dir;
    ConfigManager config(dir.path());
    config.set_int("sync_interval_minutes", 0);
    config.set_int("bandwidth_limit_kbps", -5);
    config.set_string("large_sync_threshold_mb", "lots");

    SyncConfiguration snapshot = config.snapshot();
    EXPECT_EQ(snapshot.interval_minutes, 1);
    EXPECT_EQ(snapshot.bandwidth_limit_kbps, 0);
    EXPECT_EQ(snapshot.large_sync_threshold_mb, 1000);
}

TEST(ConfigManagerTest, FolderHelpersDeduplicate) {
    TempDir dir;
    ConfigManager config(dir.path());
    config.add_excluded_folder("Trash");
    config.add_excluded_folder("Trash");
    config.add_excluded_folder("Old");
    EXPECT_EQ(config.snapshot().excluded_folders, (std::vector<std::string>{"Trash", "Old"}));

    config.remove_excluded_folder("Trash");
    config.remove_excluded_folder("Missing");
    EXPECT_EQ(config.snapshot().excluded_folders, (std::vector<std::string>{"Old"}));

    config.add_included_folder("Photos");
    config.remove_included_folder("Photos");
    EXPECT_TRUE(config.snapshot().included_folders.empty());
}

TEST(ConfigManagerTest, SnapshotIsDetachedFromLaterEdits) {
    TempDir dir;
    ConfigManager config(dir.path());
    config.set_string("rclone_remote", "proton");
    SyncConfiguration before = config.snapshot();
    config.set_string("rclone_remote", "other");
    EXPECT_EQ(before.remote, "proton");
    EXPECT_EQ(config.snapshot().remote, "other");
}

TEST(ConfigManagerTest, DecodesUnicodeEscapes) {
    TempDir dir;
    test::write_file(dir.file("config.json"),
        "{\"sync_mode\": \"selective_include\",\n"
        " \"included_folders\": [\"\\u00c4rger\", \"Fotos \\ud83d\\udcf7\", \"\\u65e5\\u672c\"]}\n");

    ConfigManager config(dir.path());
    ASSERT_TRUE(config.load());

    SyncConfiguration snapshot = config.snapshot();
    ASSERT_EQ(snapshot.included_folders.size(), 3u);
    EXPECT_EQ(snapshot.included_folders[0], "\xC3\x84rger");
    EXPECT_EQ(snapshot.included_folders[1], "Fotos \xF0\x9F\x93\xB7");
    EXPECT_EQ(snapshot.included_folders[2], "\xE6\x97\xA5\xE6\x9C\xAC");

    std::vector<std::string> args = filter_arguments(
        compile_filters(snapshot.sync_mode, snapshot.included_folders, snapshot.excluded_folders));
    ASSERT_FALSE(args.empty());
    EXPECT_EQ(args[0], "--include=\xC3\x84rger/**");
}

TEST(ConfigManagerTest, RejectsUnpairedSurrogate) {
    TempDir dir;
    test::write_file(dir.file("config.json"),
                     "{\"rclone_remote\": \"proton\", \"local_folder\": \"\\ud83d\"}\n");

    ConfigManager config(dir.path());
    EXPECT_FALSE(config.load());
    EXPECT_TRUE(config.snapshot().remote.empty());
}

TEST(ConfigManagerTest, ReloadResetsKeysRemovedFromFile) {
    TempDir dir;
    test::write_file(dir.file("config.json"),
        "{\"rclone_remote\": \"proton\", \"local_folder\": \"/tmp/x\",\n"
        " \"bandwidth_limit_kbps\": 512, \"excluded_folders\": [\"Trash\"]}\n");

    ConfigManager config(dir.path());
    ASSERT_TRUE(config.load());
    ASSERT_TRUE(config.is_configured());

    test::write_file(dir.file("config.json"), "{\"local_folder\": \"/tmp/x\"}\n");
    ASSERT_TRUE(config.load());

    SyncConfiguration snapshot = config.snapshot();
    EXPECT_TRUE(snapshot.remote.empty());
    EXPECT_EQ(snapshot.local_path, "/tmp/x");
    EXPECT_EQ(snapshot.bandwidth_limit_kbps, 0);
    EXPECT_TRUE(snapshot.excluded_folders.empty());
    EXPECT_FALSE(config.is_configured());
}

TEST(ConfigManagerTest, SnapshotNeverMixesTwoLoads) {
    TempDir dir;
    const std::string path = dir.file("config.json");
    const std::string staging = dir.file("config.json.new");
    const std::string first = "{\"rclone_remote\": \"alpha\", \"local_folder\": \"/data/alpha\"}\n";
    const std::string second = "{\"rclone_remote\": \"beta\", \"local_folder\": \"/data/beta\"}\n";
    test::write_file(path, first);

    ConfigManager config(dir.path());
    ASSERT_TRUE(config.load());

    std::atomic<bool> stop{false};
    std::thread reloader([&]() {
        for (int i = 0; i < 300; i++) {
            // rename keeps every load reading a complete file
            test::write_file(staging, (i % 2) ? first : second);
            std::filesystem::rename(staging, path);
            config.load();
        }
        stop = true;
    });

    int torn = 0;
    while (!stop) {
        SyncConfiguration snapshot = config.snapshot();
        if (snapshot.local_path != "/data/" + snapshot.remote) {
            torn++;
        }
    }
    reloader.join();
    EXPECT_EQ(torn, 0);
}

TEST(ConfigManagerTest, SnapshotCapsIntervalAtOneYear) {
    TempDir dir;
    ConfigManager config(dir.path());
    config.set_int("sync_interval_minutes", 200000000);
    EXPECT_EQ(config.snapshot().interval_minutes, 525600);
}

} // namespace
} // namespace protonsync
