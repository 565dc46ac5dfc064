/**
 * Proton Drive Sync daemon
 *
 * Keeps a local folder in step with a Proton Drive rclone remote:
 * - one-way sync from the remote, optionally restricted to folders
 * - automatic sync every interval, or on demand (SIGUSR1)
 * - desktop notifications for progress, completion and errors
 *
 * Settings live in ~/.config/protondrive-sync/config.json (SIGHUP reloads).
 */

#include "config_manager.hpp"
#include "logger.hpp"
#include "notifications.hpp"
#include "remote_inspector.hpp"
#include "sync_orchestrator.hpp"
#include "transfer_executor.hpp"
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <fcntl.h>
#include <gio/gio.h>
#include <glib-unix.h>
#include <signal.h>
#include <sys/file.h>
#include <unistd.h>

using namespace protonsync;
namespace fs = std::filesystem;

namespace {

struct Options {
    std::string config_dir;
    bool once = false;
    bool list_remotes = false;
    std::string list_folders;
    int folder_depth = 1;
    bool debug = false;
    bool assume_yes = false;
    int interval_seconds = 0;
};

/**
 * State the GLib signal handlers need
 */
struct Daemon {
    ConfigManager* config = nullptr;
    SyncOrchestrator* orchestrator = nullptr;
    NotificationManager* notifications = nullptr;
    GMainLoop* loop = nullptr;
    bool debug = false;
};

void print_usage() {
    std::cout << "Proton Drive Sync\n\n"
              << "Usage: protonsync [options]\n\n"
              << "Options:\n"
              << "  --config-dir DIR             Use DIR instead of ~/.config/protondrive-sync\n"
              << "  --once                       Run a single sync and exit\n"
              << "  --interval SECONDS           Override the configured sync interval\n"
              << "  --assume-yes                 Proceed with large first syncs without asking\n"
              << "  --list-remotes               Print configured rclone remotes\n"
              << "  --list-folders REMOTE[:PATH] Print the folders of a remote\n"
              << "  --depth N                    Folder levels shown by --list-folders (default 1)\n"
              << "  --debug                      Enable debug logging\n"
              << "  --help                       Show this help message\n";
}

// Returns 0 to continue, otherwise 1 + exit status
int parse_arguments(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; i++) {
        std::string arg(argv[i]);
        auto next_value = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << arg << " requires a value\n";
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 1;
        } else if (arg == "--debug") {
            options.debug = true;
        } else if (arg == "--once") {
            options.once = true;
        } else if (arg == "--assume-yes") {
            options.assume_yes = true;
        } else if (arg == "--list-remotes") {
            options.list_remotes = true;
        } else if (arg == "--config-dir") {
            if (!next_value(options.config_dir)) return 3;
        } else if (arg == "--list-folders") {
            if (!next_value(options.list_folders)) return 3;
        } else if (arg == "--depth") {
            std::string value;
            if (!next_value(value)) return 3;
            try {
                options.folder_depth = std::stoi(value);
            } catch (const std::exception&) {
                options.folder_depth = 0;
            }
            if (options.folder_depth <= 0) {
                std::cerr << "--depth expects a positive number\n";
                return 3;
            }
        } else if (arg == "--interval") {
            std::string value;
            if (!next_value(value)) return 3;
            try {
                options.interval_seconds = std::stoi(value);
            } catch (const std::exception&) {
                options.interval_seconds = 0;
            }
            if (options.interval_seconds <= 0) {
                std::cerr << "--interval expects a positive number of seconds\n";
                return 3;
            }
        } else {
            std::cerr << "Unknown option: " << arg << "\n\n";
            print_usage();
            return 3;
        }
    }
    return 0;
}

/**
 * Ensure only one daemon per user is syncing
 * Returns true if this is the only instance, false otherwise
 */
bool ensure_single_instance() {
    std::string runtime_dir = "/run/user/" + std::to_string(getuid());
    std::string lock_file = runtime_dir + "/protondrive-sync.lock";

    if (!fs::exists(runtime_dir)) {
        const char* xdg_runtime = std::getenv("XDG_RUNTIME_DIR");
        if (xdg_runtime) {
            lock_file = std::string(xdg_runtime) + "/protondrive-sync.lock";
        } else {
            lock_file = "/tmp/protondrive-sync-" + std::to_string(getuid()) + ".lock";
        }
    }

    int lock_fd = open(lock_file.c_str(), O_CREAT | O_RDWR, 0600);
    if (lock_fd < 0) {
        Logger::error("[SingleInstance] Failed to create lock file: " + lock_file);
        return true; // Fail open
    }

    if (flock(lock_fd, LOCK_EX | LOCK_NB) < 0) {
        close(lock_fd);

        std::ifstream lock_stream(lock_file);
        std::string pid_str;
        if (lock_stream >> pid_str) {
            Logger::info("[SingleInstance] Another instance is already running (PID: " + pid_str + ")");
            std::cerr << "protonsync is already running (PID: " << pid_str << ")\n";
        } else {
            Logger::info("[SingleInstance] Another instance is already running");
            std::cerr << "protonsync is already running\n";
        }
        return false;
    }

    if (ftruncate(lock_fd, 0) == 0) {
        std::string pid = std::to_string(getpid());
        if (write(lock_fd, pid.c_str(), pid.length()) < 0) {
            Logger::error("[SingleInstance] Failed to write PID to lock file");
        }
    }

    Logger::info("[SingleInstance] Acquired lock file: " + lock_file);

    // lock_fd stays open for the lifetime of the process
    return true;
}

int list_remotes(const RemoteInspector& inspector) {
    std::vector<std::string> remotes = inspector.list_remotes();
    for (const auto& remote : remotes) {
        std::optional<std::string> type = inspector.remote_type(remote);
        std::cout << remote;
        if (type) {
            std::cout << " (" << *type << ")";
        }
        std::cout << "\n";
    }
    return remotes.empty() ? 1 : 0;
}

void print_tree(const std::vector<RemoteFolderNode>& nodes, int indent) {
    for (const auto& node : nodes) {
        std::cout << std::string(indent * 2, ' ') << node.folder.path << "\n";
        print_tree(node.children, indent + 1);
    }
}

int list_folders(const RemoteInspector& inspector, const std::string& target, int depth) {
    std::string remote = target;
    std::string path;
    size_t colon = target.find(':');
    if (colon != std::string::npos) {
        remote = target.substr(0, colon);
        path = target.substr(colon + 1);
    }

    if (!inspector.remote_exists(remote)) {
        std::cerr << "Unknown remote: " << remote << "\n";
        return 1;
    }
    print_tree(inspector.folder_tree(remote, depth, path), 0);
    return 0;
}

void apply_settings(Daemon& daemon) {
    SyncConfiguration settings = daemon.config->snapshot();
    if (!daemon.debug) {
        Logger::set_level(Logger::parse_level(settings.log_level));
    }
    daemon.notifications->set_enabled(settings.notifications_enabled);
}

gboolean shutdown_handler(gpointer user_data) {
    auto* daemon = static_cast<Daemon*>(user_data);
    Logger::info("[Shutdown] Signal received, stopping...");

    daemon->orchestrator->stop_auto_sync();
    if (daemon->orchestrator->cancel()) {
        Logger::info("[Shutdown] Running sync cancelled");
    }
    g_main_loop_quit(daemon->loop);
    return G_SOURCE_REMOVE;
}

gboolean sync_now_handler(gpointer user_data) {
    auto* daemon = static_cast<Daemon*>(user_data);
    Logger::info("[Signal] SIGUSR1: sync requested");
    daemon->orchestrator->sync_now(false);
    return G_SOURCE_CONTINUE;
}

gboolean reload_handler(gpointer user_data) {
    auto* daemon = static_cast<Daemon*>(user_data);
    Logger::info("[Signal] SIGHUP: reloading configuration");

    daemon->config->load();
    apply_settings(*daemon);

    SyncConfiguration settings = daemon->config->snapshot();
    bool running = daemon->orchestrator->get_status().auto_sync_running;
    if (settings.auto_sync_enabled && !running) {
        daemon->orchestrator->start_auto_sync();
    } else if (!settings.auto_sync_enabled && running) {
        daemon->orchestrator->stop_auto_sync();
    }
    return G_SOURCE_CONTINUE;
}

// Notifications need a registered application; without a session bus they are skipped
GApplication* create_application() {
    GApplication* app = g_application_new("me.proton.drive.sync", G_APPLICATION_NON_UNIQUE);
    GError* error = nullptr;
    if (!g_application_register(app, nullptr, &error)) {
        Logger::warn("[Init] Desktop notifications unavailable: " +
                     std::string(error && error->message ? error->message : "registration failed"));
        if (error) g_error_free(error);
        g_object_unref(app);
        return nullptr;
    }
    return app;
}

} // namespace

int main(int argc, char* argv[]) {
    Options options;
    int parse_status = parse_arguments(argc, argv, options);
    if (parse_status != 0) {
        return parse_status - 1;
    }

    ConfigManager config(options.config_dir);
    Logger::init(options.debug ? LogLevel::DEBUG : LogLevel::INFO,
                 config.config_dir() + "/protondrive-sync.log");
    Logger::info("Proton Drive Sync - Starting...");
    if (options.debug) Logger::debug("Debug mode enabled");

    config.load();
    SyncConfiguration settings = config.snapshot();
    if (!options.debug) {
        Logger::set_level(Logger::parse_level(settings.log_level));
    }

    std::string rclone_path;
    try {
        rclone_path = locate_rclone(settings.rclone_path);
    } catch (const ExecutableNotFound& e) {
        Logger::error("[Init] CRITICAL: " + std::string(e.what()));
        std::cerr << "rclone not found - install rclone or set rclone_path in "
                  << config.config_path() << "\n";
        return 1;
    }
    Logger::info("[Init] Using rclone: " + rclone_path);

    RemoteInspector inspector(rclone_path);
    if (options.list_remotes) {
        return list_remotes(inspector);
    }
    if (!options.list_folders.empty()) {
        return list_folders(inspector, options.list_folders, options.folder_depth);
    }

    if (auto version = inspector.version()) {
        Logger::info("[Init] rclone version " + *version);
    }

    if (!config.is_configured()) {
        Logger::error("[Init] No remote or local folder configured in " + config.config_path());
        std::cerr << "Not configured: set rclone_remote and local_folder in "
                  << config.config_path() << "\n";
        if (config.snapshot().remote.empty()) {
            if (auto proton = inspector.find_protondrive_remote()) {
                std::cerr << "Found Proton Drive remote: " << *proton << "\n";
            }
        }
        return 1;
    }

    if (!ensure_single_instance()) {
        return 1;
    }

    GApplication* app = create_application();
    TransferExecutor executor(rclone_path);
    NotificationManager notifications(app);
    SyncOrchestrator orchestrator(config, executor, &notifications);

    bool assume_yes = options.assume_yes;
    notifications.set_large_sync_callback([&orchestrator, assume_yes](const SyncWarningData& data) {
        if (!assume_yes) {
            Logger::warn("[Daemon] Large first sync (" + format_bytes(data.size_bytes) +
                         ") declined; run with --assume-yes to proceed");
        }
        orchestrator.confirm_large_sync(assume_yes);
    });

    if (options.interval_seconds > 0) {
        orchestrator.set_interval_override(std::chrono::seconds(options.interval_seconds));
    }

    GMainLoop* loop = g_main_loop_new(nullptr, FALSE);
    Daemon daemon;
    daemon.config = &config;
    daemon.orchestrator = &orchestrator;
    daemon.notifications = &notifications;
    daemon.loop = loop;
    daemon.debug = options.debug;
    apply_settings(daemon);

    int status = 0;
    if (options.once) {
        orchestrator.sync_now(true);
        status = orchestrator.get_status().last_sync_time ? 0 : 1;
    } else {
        g_unix_signal_add(SIGTERM, shutdown_handler, &daemon);
        g_unix_signal_add(SIGINT, shutdown_handler, &daemon);
        g_unix_signal_add(SIGUSR1, sync_now_handler, &daemon);
        g_unix_signal_add(SIGHUP, reload_handler, &daemon);

        if (settings.auto_sync_enabled) {
            orchestrator.start_auto_sync();
        } else {
            orchestrator.sync_now(false);
        }

        g_main_loop_run(loop);
    }

    Logger::info("[Shutdown] Waiting for sync to finish...");
    orchestrator.shutdown();

    // Deliver queued notifications before exiting
    while (g_main_context_iteration(nullptr, FALSE)) {
    }

    g_main_loop_unref(loop);
    if (app) {
        g_object_unref(app);
    }

    Logger::info("Proton Drive Sync - Exiting.");
    return status;
}
