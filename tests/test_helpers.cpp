#include "test_helpers.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace protonsync {
namespace test {

TempDir::TempDir() {
    std::string pattern = (fs::temp_directory_path() / "protonsync-test-XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (!mkdtemp(buffer.data())) {
        throw std::runtime_error("mkdtemp failed for " + pattern);
    }
    path_ = buffer.data();
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

std::vector<std::string> read_lines(const std::string& path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

std::string write_script(const std::string& path, const std::string& body) {
    write_file(path, "#!/bin/sh\n" + body);
    chmod(path.c_str(), 0755);
    return path;
}

bool wait_until(const std::function<bool()>& predicate, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return predicate();
}

std::string FakeRclone::install(const TempDir& dir) const {
    std::ostringstream body;
    body << "echo \"$*\" >> '" << log_path(dir) << "'\n"
         << "case \"$1\" in\n"
         << "  size)\n"
         << "    echo '{\"count\":" << file_count << ",\"bytes\":" << size_bytes << ",\"sizeless\":0}'\n"
         << "    exit " << size_exit_code << "\n"
         << "    ;;\n"
         << "  sync)\n"
         << "    for arg in \"$@\"; do\n"
         << "      if [ \"$arg\" = \"--dry-run\" ]; then\n"
         << "        echo 'NOTICE: dry run'\n"
         << "        exit " << dry_run_exit_code << "\n"
         << "      fi\n"
         << "    done\n"
         << "    echo 'Transferred:   1.000 MiB / 2.000 MiB, 50%, 1.000 MiB/s, ETA 1s'\n";
    if (sync_sleep_seconds > 0) {
        // exec so that a signal reaches the process holding the pipe
        body << "    exec sleep " << sync_sleep_seconds << "\n";
    }
    body << "    echo 'Transferred:   2.000 MiB / 2.000 MiB, 100%, 1.000 MiB/s, ETA 0s'\n"
         << "    exit " << sync_exit_code << "\n"
         << "    ;;\n"
         << "esac\n"
         << "exit 0\n";
    return write_script(dir.file("rclone"), body.str());
}

std::vector<std::string> FakeRclone::calls(const TempDir& dir) {
    return read_lines(log_path(dir));
}

size_t FakeRclone::count_calls(const TempDir& dir, const std::string& prefix, bool dry_run) {
    size_t count = 0;
    for (const auto& call : calls(dir)) {
        if (call.compare(0, prefix.size(), prefix) != 0) continue;
        bool is_dry_run = call.find("--dry-run") != std::string::npos;
        if (is_dry_run == dry_run) count++;
    }
    return count;
}

} // namespace test
} // namespace protonsync
