#include <gtest/gtest.h>
#include "progress_parser.hpp"

namespace protonsync {
namespace {

TEST(ProgressParserTest, ParsesByteStatsLine) {
    auto progress = parse_progress_line(
        "Transferred:   \t  1.500 GiB / 3.000 GiB, 50%, 10.000 MiB/s, ETA 2m33s");
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->transferred, "1.500 GiB");
    EXPECT_EQ(progress->total, "3.000 GiB");
    EXPECT_EQ(progress->percent, 50);
    EXPECT_DOUBLE_EQ(progress->fraction(), 0.5);
    EXPECT_EQ(progress->speed, "10.000 MiB/s");
    EXPECT_EQ(progress->eta, "2m33s");
    EXPECT_EQ(progress->summary(), "1.500 GiB of 3.000 GiB (50%), 10.000 MiB/s, ETA 2m33s");
}

TEST(ProgressParserTest, UnknownEtaIsLeftOutOfSummary) {
    auto progress = parse_progress_line("Transferred: 0 B / 0 B, -, 0 B/s, ETA -");
    EXPECT_FALSE(progress.has_value());

    progress = parse_progress_line("Transferred: 0 B / 10 MiB, 0%, 0 B/s, ETA -");
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->eta, "-");
    EXPECT_EQ(progress->summary(), "0 B of 10 MiB (0%), 0 B/s");
}

TEST(ProgressParserTest, IgnoresOtherLines) {
    EXPECT_FALSE(parse_progress_line("Transferred:            3 / 10, 30%").has_value());
    EXPECT_FALSE(parse_progress_line("Checks:                12 / 12, 100%").has_value());
    EXPECT_FALSE(parse_progress_line("Elapsed time:         4.5s").has_value());
    EXPECT_FALSE(parse_progress_line("2024/05/01 13:45:10 INFO  : Photos/a.jpg: Copied (new)").has_value());
    EXPECT_FALSE(parse_progress_line("").has_value());
}

TEST(ProgressParserTest, RejectsOverlongPercentages) {
    auto progress = parse_progress_line("Transferred: 1 GiB / 1 GiB, 100%, 5 MiB/s, ETA 0s");
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->percent, 100);

    EXPECT_FALSE(parse_progress_line(
        "Transferred: 1 GiB / 1 GiB, 99999999999999999999%, 5 MiB/s, ETA 0s").has_value());
    EXPECT_FALSE(parse_progress_line("Transferred: 1 GiB / 1 GiB, 1000%, 5 MiB/s, ETA 0s").has_value());
}

} // namespace
} // namespace protonsync
