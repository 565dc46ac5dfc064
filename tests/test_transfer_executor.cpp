#include <gtest/gtest.h>
#include <chrono>
#include <fstream>
#include "test_helpers.hpp"
#include "transfer_executor.hpp"

namespace protonsync {
namespace {

using test::TempDir;
using test::wait_until;
using test::write_script;

// Third field of /proc/<pid>/stat: R, S, T (stopped), ...
char process_state(const std::string& pid) {
    std::ifstream stat("/proc/" + pid + "/stat");
    std::string field;
    for (int i = 0; i < 3 && stat >> field; ++i) {
    }
    return field.empty() ? '?' : field[0];
}

std::vector<std::string> collect_lines(TransferHandle& handle) {
    std::vector<std::string> lines;
    handle.lines([&lines](const std::string& line) { lines.push_back(line); });
    return lines;
}

TEST(TransferExecutorTest, BuildsSyncArguments) {
    std::vector<FilterRule> filters = {{FilterAction::EXCLUDE, "Trash/**"}};
    auto args = TransferExecutor::build_sync_arguments("proton:", "/home/u/Proton", filters, true, 256);
    std::vector<std::string> expected = {
        "sync", "proton:", "/home/u/Proton", "--progress", "--stats", "1s", "-v",
        "--dry-run", "--exclude=Trash/**", "--bwlimit", "256k",
    };
    EXPECT_EQ(args, expected);

    auto plain = TransferExecutor::build_sync_arguments("proton:", "/dst", {}, false, 0);
    EXPECT_EQ(plain, (std::vector<std::string>{"sync", "proton:", "/dst", "--progress", "--stats", "1s", "-v"}));
}

TEST(TransferExecutorTest, BuildsSizeArguments) {
    std::vector<FilterRule> filters = {{FilterAction::INCLUDE, "Docs/**"}, {FilterAction::EXCLUDE, "*"}};
    EXPECT_EQ(TransferExecutor::build_size_arguments("proton:", filters),
              (std::vector<std::string>{"size", "proton:", "--json", "--include=Docs/**", "--exclude=*"}));
}

TEST(TransferExecutorTest, ParsesSizeJson) {
    auto estimate = parse_size_json("{\"count\":42,\"bytes\":1048576,\"sizeless\":0}\n");
    ASSERT_TRUE(estimate.has_value());
    EXPECT_EQ(estimate->bytes, 1048576);
    EXPECT_EQ(estimate->file_count, 42);
    EXPECT_DOUBLE_EQ(estimate->megabytes(), 1.0);

    auto no_count = parse_size_json("{ \"bytes\" : 2147483648 }");
    ASSERT_TRUE(no_count.has_value());
    EXPECT_EQ(no_count->file_count, 0);
    EXPECT_DOUBLE_EQ(no_count->gigabytes(), 2.0);

    EXPECT_FALSE(parse_size_json("{\"count\":3}").has_value());
    EXPECT_FALSE(parse_size_json("{\"bytes\":-1}").has_value());
    EXPECT_FALSE(parse_size_json("Failed to size: directory not found").has_value());
}

TEST(TransferExecutorTest, LocatesConfiguredBinary) {
    TempDir dir;
    std::string script = write_script(dir.file("rclone"), "exit 0\n");
    EXPECT_EQ(locate_rclone(script), script);

    EXPECT_THROW(locate_rclone(dir.file("missing")), ExecutableNotFound);

    std::string not_executable = dir.file("plain");
    test::write_file(not_executable, "data");
    EXPECT_THROW(locate_rclone(not_executable), ExecutableNotFound);
}

TEST(TransferExecutorTest, MissingBinaryThrowsExecutableNotFound) {
    TransferExecutor executor("/nonexistent/bin/rclone");
    EXPECT_THROW(executor.start("proton:", "/tmp/dst", {}, false, 0), ExecutableNotFound);
    EXPECT_THROW(executor.estimate_size("proton:", {}), ExecutableNotFound);
}

TEST(TransferExecutorTest, PassesArgumentsWithoutShellSplitting) {
    TempDir dir;
    std::string script = write_script(dir.file("rclone"), "for a in \"$@\"; do echo \"$a\"; done\n");
    TransferExecutor executor(script);

    std::vector<FilterRule> filters = {{FilterAction::INCLUDE, "My Photos/**"}};
    auto handle = executor.start("proton:", dir.file("local dir"), filters, false, 0);
    auto lines = collect_lines(*handle);
    EXPECT_EQ(lines, TransferExecutor::build_sync_arguments("proton:", dir.file("local dir"), filters, false, 0));
    EXPECT_TRUE(handle->wait().success);
}

TEST(TransferExecutorTest, StreamsTrimmedNonEmptyLines) {
    TempDir dir;
    std::string script = write_script(dir.file("rclone"),
        "printf 'one\\n\\n  two  \\r\\nthree\\n'\n"
        "echo 'from stderr' >&2\n"
        "exit 0\n");
    TransferExecutor executor(script);

    auto handle = executor.start("proton:", "/tmp/dst", {}, false, 0);
    auto lines = collect_lines(*handle);
    EXPECT_EQ(lines, (std::vector<std::string>{"one", "two", "three", "from stderr"}));

    // The stream is consumed once
    EXPECT_EQ(handle->lines([](const std::string&) {}), 0u);

    TransferResult result = handle->wait();
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.message, "Sync completed successfully");
    EXPECT_FALSE(handle->is_running());
}

TEST(TransferExecutorTest, NonZeroExitIsReportedNotThrown) {
    TempDir dir;
    std::string script = write_script(dir.file("rclone"), "echo 'ERROR : failed'\nexit 3\n");
    TransferExecutor executor(script);

    auto handle = executor.start("proton:", "/tmp/dst", {}, true, 0);
    TransferResult result = handle->wait();
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.message, "Dry run failed with return code 3");
}

TEST(TransferExecutorTest, CancelTerminatesProcess) {
    TempDir dir;
    std::string ready = dir.file("ready");
    std::string script = write_script(dir.file("rclone"), "touch '" + ready + "'\nexec sleep 30\n");
    TransferExecutor executor(script);

    auto handle = executor.start("proton:", "/tmp/dst", {}, false, 0);
    ASSERT_TRUE(wait_until([&] { return std::ifstream(ready).good(); }));

    auto started = std::chrono::steady_clock::now();
    EXPECT_TRUE(handle->cancel());
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));
    EXPECT_FALSE(handle->is_running());

    TransferResult result = handle->wait();
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 128 + 15);
}

TEST(TransferExecutorTest, CancelForceKillsProcessIgnoringSigterm) {
    TempDir dir;
    std::string ready = dir.file("ready");
    std::string script = write_script(dir.file("rclone"),
        "trap '' TERM\ntouch '" + ready + "'\nexec sleep 30\n");
    TransferExecutor executor(script);

    auto handle = executor.start("proton:", "/tmp/dst", {}, false, 0);
    ASSERT_TRUE(wait_until([&] { return std::ifstream(ready).good(); }));

    auto started = std::chrono::steady_clock::now();
    EXPECT_TRUE(handle->cancel());
    auto elapsed = std::chrono::steady_clock::now() - started;
    EXPECT_GE(elapsed, std::chrono::seconds(4));
    EXPECT_LE(elapsed, std::chrono::seconds(6));
    EXPECT_FALSE(handle->is_running());
    EXPECT_EQ(handle->wait().exit_code, 128 + 9);
}

TEST(TransferExecutorTest, CancelAfterExitReturnsFalse) {
    TempDir dir;
    std::string script = write_script(dir.file("rclone"), "exit 0\n");
    TransferExecutor executor(script);

    auto handle = executor.start("proton:", "/tmp/dst", {}, false, 0);
    EXPECT_TRUE(handle->wait().success);
    EXPECT_FALSE(handle->cancel());
}

TEST(TransferExecutorTest, PauseStopsAndResumeContinuesProcess) {
    TempDir dir;
    std::string ready = dir.file("ready");
    std::string script = write_script(dir.file("rclone"), "touch '" + ready + "'\nexec sleep 30\n");
    TransferExecutor executor(script);

    auto handle = executor.start("proton:", "/tmp/dst", {}, false, 0);
    ASSERT_TRUE(wait_until([&] { return std::ifstream(ready).good(); }));
    std::string pid = handle->pid();
    ASSERT_FALSE(pid.empty());

    EXPECT_FALSE(handle->resume());
    EXPECT_TRUE(handle->pause());
    EXPECT_TRUE(handle->is_paused());
    EXPECT_FALSE(handle->pause());
    EXPECT_TRUE(wait_until([&] { return process_state(pid) == 'T'; }));

    EXPECT_TRUE(handle->resume());
    EXPECT_FALSE(handle->is_paused());
    EXPECT_TRUE(wait_until([&] { return process_state(pid) != 'T'; }));

    EXPECT_TRUE(handle->cancel());
    EXPECT_EQ(handle->wait().exit_code, 128 + 15);
}

TEST(TransferExecutorTest, CancelWhilePausedDoesNotWaitForGracePeriod) {
    TempDir dir;
    std::string ready = dir.file("ready");
    std::string script = write_script(dir.file("rclone"), "touch '" + ready + "'\nexec sleep 30\n");
    TransferExecutor executor(script);

    auto handle = executor.start("proton:", "/tmp/dst", {}, false, 0);
    ASSERT_TRUE(wait_until([&] { return std::ifstream(ready).good(); }));
    ASSERT_TRUE(handle->pause());

    auto started = std::chrono::steady_clock::now();
    EXPECT_TRUE(handle->cancel());
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));
    EXPECT_FALSE(handle->is_paused());
    EXPECT_FALSE(handle->wait().success);
}

TEST(TransferExecutorTest, EstimatesSize) {
    TempDir dir;
    std::string script = write_script(dir.file("rclone"),
        "echo '{\"count\":7,\"bytes\":3145728,\"sizeless\":0}'\n");
    TransferExecutor executor(script);

    SizeEstimate estimate = executor.estimate_size("proton:", {});
    EXPECT_EQ(estimate.bytes, 3145728);
    EXPECT_EQ(estimate.file_count, 7);
    EXPECT_DOUBLE_EQ(estimate.megabytes(), 3.0);
}

TEST(TransferExecutorTest, EstimateFailsOnErrorExitOrBadOutput) {
    TempDir dir;
    TransferExecutor failing(write_script(dir.file("failing"), "echo 'Failed to size'\nexit 1\n"));
    EXPECT_THROW(failing.estimate_size("proton:", {}), EstimationFailed);

    TransferExecutor garbled(write_script(dir.file("garbled"), "echo 'not json'\n"));
    EXPECT_THROW(garbled.estimate_size("proton:", {}), EstimationFailed);
}

TEST(TransferExecutorTest, EstimateTimesOut) {
    TempDir dir;
    TransferExecutor executor(write_script(dir.file("rclone"), "exec sleep 30\n"));
    executor.set_estimate_timeout(std::chrono::milliseconds(300));

    auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(executor.estimate_size("proton:", {}), EstimationFailed);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
}

TEST(TransferExecutorTest, EstimateStopsWhenAborted) {
    TempDir dir;
    TransferExecutor executor(write_script(dir.file("rclone"), "exec sleep 30\n"));
    std::atomic<bool> abort_flag{true};

    auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(executor.estimate_size("proton:", {}, &abort_flag), EstimationFailed);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
}

} // namespace
} // namespace protonsync
