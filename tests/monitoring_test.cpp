#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <algorithm>
#include <string>
#include <thread>
#include "infra/monitoring/monitoring.hpp"

using mtcopy::infra::ProgressMonitor;
using mtcopy::infra::ProgressSnapshot;
using mtcopy::infra::ProgressState;
using namespace std::chrono_literals;

namespace {

auto snapshot_at(std::chrono::steady_clock::time_point start) -> ProgressSnapshot {
    ProgressSnapshot s;
    s.started_at = start;
    return s;
}

} // namespace

TEST(ProgressMonitorTest, EstimateFollowsObservedThroughput)
{
    const auto start = std::chrono::steady_clock::now();
    auto s = snapshot_at(start);
    s.bytes_total = 1000;
    s.bytes_done = 250;

    // 10 с на 250 байт => ещё 750 байт за 30 с
    const auto eta = ProgressMonitor::estimate_remaining(s, start + 10s);
    EXPECT_NEAR(eta.count(), 30.0, 1e-6);
}

TEST(ProgressMonitorTest, EstimateUsesAtLeastOneByte)
{
    const auto start = std::chrono::steady_clock::now();
    auto s = snapshot_at(start);
    s.bytes_total = 5;
    s.bytes_done = 0;
    const auto eta = ProgressMonitor::estimate_remaining(s, start + 2s);
    EXPECT_NEAR(eta.count(), 10.0, 1e-6);
}

TEST(ProgressMonitorTest, EstimateIsZeroWhenDone)
{
    const auto start = std::chrono::steady_clock::now();
    auto s = snapshot_at(start);
    s.bytes_total = 100;
    s.bytes_done = 100;
    EXPECT_EQ(ProgressMonitor::estimate_remaining(s, start + 5s).count(), 0.0);
}

TEST(ProgressMonitorTest, FormatDuration)
{
    EXPECT_EQ(ProgressMonitor::format_duration(std::chrono::seconds(0)), "00:00");
    EXPECT_EQ(ProgressMonitor::format_duration(std::chrono::seconds(75)), "01:15");
    EXPECT_EQ(ProgressMonitor::format_duration(std::chrono::seconds(3700)), "01:01:40");
}

TEST(ProgressMonitorTest, FormatBytes)
{
    EXPECT_EQ(ProgressMonitor::format_bytes(512), "512 B");
    EXPECT_EQ(ProgressMonitor::format_bytes(1536), "1.5 KB");
    EXPECT_EQ(ProgressMonitor::format_bytes(3.0 * 1024 * 1024), "3.0 MB");
}

TEST(ProgressMonitorTest, LineShowsCountsAndBar)
{
    const auto start = std::chrono::steady_clock::now();
    auto s = snapshot_at(start);
    s.files_total = 4;
    s.files_done = 2;
    s.bytes_total = 400;
    s.bytes_done = 200;
    s.enumeration_complete = true;

    const auto line = ProgressMonitor::format_line(s, start + 4s, 10);
    EXPECT_NE(line.find("[#####>----]"), std::string::npos) << line;
    EXPECT_NE(line.find("50.0%"), std::string::npos) << line;
    EXPECT_NE(line.find("2/4 files"), std::string::npos) << line;
    EXPECT_NE(line.find("elapsed 00:04"), std::string::npos) << line;
    EXPECT_NE(line.find("ETA 00:04"), std::string::npos) << line;
    EXPECT_EQ(line.find("failed"), std::string::npos) << line;
}

TEST(ProgressMonitorTest, EstimateMarkedProvisionalDuringEnumeration)
{
    const auto start = std::chrono::steady_clock::now();
    auto s = snapshot_at(start);
    s.files_total = 10;
    s.files_done = 1;
    s.bytes_total = 100;
    s.bytes_done = 10;
    s.enumeration_complete = false;

    const auto line = ProgressMonitor::format_line(s, start + 1s, 10);
    EXPECT_NE(line.find("ETA ~"), std::string::npos) << line;
}

TEST(ProgressMonitorTest, NoEstimateBeforeFirstByte)
{
    const auto start = std::chrono::steady_clock::now();
    auto s = snapshot_at(start);
    s.files_total = 3;
    s.bytes_total = 300;
    s.enumeration_complete = true;

    const auto line = ProgressMonitor::format_line(s, start + 1s, 10);
    EXPECT_NE(line.find("ETA --:--"), std::string::npos) << line;
}

TEST(ProgressMonitorTest, EmptyTreeIsComplete)
{
    const auto start = std::chrono::steady_clock::now();
    auto s = snapshot_at(start);
    s.enumeration_complete = true;

    const auto line = ProgressMonitor::format_line(s, start, 10);
    EXPECT_NE(line.find("[##########]"), std::string::npos) << line;
    EXPECT_NE(line.find("100.0%"), std::string::npos) << line;
    EXPECT_NE(line.find("0/0 files"), std::string::npos) << line;
}

TEST(ProgressMonitorTest, FailuresAreShown)
{
    const auto start = std::chrono::steady_clock::now();
    auto s = snapshot_at(start);
    s.files_total = 2;
    s.files_done = 2;
    s.files_failed = 1;
    s.enumeration_complete = true;

    const auto line = ProgressMonitor::format_line(s, start + 1s, 10);
    EXPECT_NE(line.find("1 failed"), std::string::npos) << line;
}

TEST(ProgressMonitorTest, RendersToStreamAndFinishesOnce)
{
    std::FILE* out = std::tmpfile();
    ASSERT_NE(out, nullptr);

    ProgressState state;
    state.record_enumerated(true, 10);
    {
        ProgressMonitor monitor(state, ProgressMonitor::Options{
            .enabled = true,
            .refresh_interval = 10ms,
            .bar_width = 10,
            .out = out,
        });
        std::this_thread::sleep_for(30ms);
        state.record_completed(10);
        state.mark_enumeration_complete();
        monitor.finish();
        monitor.finish();
    }

    std::rewind(out);
    std::string text;
    char buffer[256];
    while (std::fgets(buffer, sizeof(buffer), out)) {
        text += buffer;
    }
    std::fclose(out);

    EXPECT_NE(text.find("1/1 files"), std::string::npos);
    EXPECT_EQ(text.back(), '\n');
    EXPECT_EQ(std::count(text.begin(), text.end(), '\n'), 1);
}

TEST(ProgressMonitorTest, DisabledMonitorWritesNothing)
{
    std::FILE* out = std::tmpfile();
    ASSERT_NE(out, nullptr);

    ProgressState state;
    {
        ProgressMonitor monitor(state, ProgressMonitor::Options{.enabled = false, .out = out});
        EXPECT_FALSE(monitor.is_enabled());
    }
    EXPECT_EQ(std::ftell(out), 0);
    std::fclose(out);
}

namespace {

// "[###>--]  42.0% | ..." -> 42.0
auto shown_percent(const std::string& line) -> double {
    const auto close = line.find(']');
    const auto percent = line.find('%');
    return std::stod(line.substr(close + 1, percent - close - 1));
}

} // namespace

TEST(ProgressMonitorTest, UnfinishedEnumerationNeverShowsComplete)
{
    const auto start = std::chrono::steady_clock::now();
    auto s = snapshot_at(start);
    s.files_total = 1;
    s.files_done = 1;
    s.bytes_total = 10;
    s.bytes_done = 10;
    s.enumeration_complete = false;

    const auto line = ProgressMonitor::format_line(s, start + 1s, 10);
    EXPECT_LT(shown_percent(line), 100.0) << line;
    EXPECT_EQ(line.find("[##########]"), std::string::npos) << line;
}

TEST(ProgressMonitorTest, GrowingTotalDoesNotMoveBarBackwards)
{
    ProgressState state;
    ProgressMonitor monitor(state, ProgressMonitor::Options{.enabled = false, .bar_width = 20});

    const auto start = std::chrono::steady_clock::now();
    auto s = snapshot_at(start);
    s.files_total = 1;
    s.files_done = 1;
    s.bytes_total = s.bytes_done = 100;
    const auto first = monitor.next_line(s, start + 1s);

    // Обход нашёл ещё 9 файлов
    s.files_total = 10;
    s.bytes_total = 1000;
    const auto second = monitor.next_line(s, start + 2s);
    EXPECT_GE(shown_percent(second), shown_percent(first)) << first << "\n" << second;
    EXPECT_NE(second.find("1/10 files"), std::string::npos) << second;

    s.files_done = 5;
    s.bytes_done = 500;
    const auto third = monitor.next_line(s, start + 3s);
    EXPECT_GE(shown_percent(third), shown_percent(second)) << third;

    s.files_done = 10;
    s.bytes_done = 1000;
    s.enumeration_complete = true;
    const auto last = monitor.next_line(s, start + 4s);
    EXPECT_NE(last.find("100.0%"), std::string::npos) << last;
    EXPECT_NE(last.find("[####################]"), std::string::npos) << last;
}
