#pragma once

#include <string>

namespace protonsync {

/**
 * Payload of a "large_sync" warning
 */
struct SyncWarningData {
    long long size_bytes = 0;
    double size_mb = 0.0;
    double size_gb = 0.0;
    long long file_count = 0;
};

/**
 * Receives lifecycle events from the SyncOrchestrator.
 *
 * Calls arrive on the orchestrator's worker thread (or the caller's thread
 * for a blocking sync). Implementations that touch a UI must hand the work
 * over to their own main loop. Calling back into the orchestrator from
 * these methods is allowed.
 */
class SyncObserver {
public:
    virtual ~SyncObserver() = default;

    virtual void on_sync_start() = 0;
    virtual void on_sync_progress(const std::string& line) = 0;
    virtual void on_sync_complete(bool success, const std::string& message) = 0;

    // kind is "large_sync"; the orchestrator then waits for confirm_large_sync()
    virtual void on_sync_warning(const std::string& kind, const SyncWarningData& data) = 0;
};

} // namespace protonsync
