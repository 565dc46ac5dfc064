#pragma once

#include <optional>
#include <string>

namespace protonsync {

/**
 * One byte-stats line of `rclone --progress`:
 *   Transferred:   1.500 GiB / 3.000 GiB, 50%, 10.000 MiB/s, ETA 2m33s
 */
struct TransferProgress {
    std::string transferred;  // "1.500 GiB"
    std::string total;        // "3.000 GiB"
    int percent = 0;
    std::string speed;        // "10.000 MiB/s"
    std::string eta;          // "2m33s", "-" when unknown

    double fraction() const { return percent / 100.0; }
    std::string summary() const;
};

// nullopt for anything but the byte-stats line (file counts, checks, log lines)
std::optional<TransferProgress> parse_progress_line(const std::string& line);

} // namespace protonsync
