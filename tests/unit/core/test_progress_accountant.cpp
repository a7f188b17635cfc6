/**
 * @file test_progress_accountant.cpp
 * @brief Unit tests for progress_accountant and progress line rendering
 */

#include <gtest/gtest.h>

#include <kcenon/serial_transfer/core/progress_accountant.h>
#include <kcenon/serial_transfer/core/progress_format.h>

#include <chrono>

namespace kcenon::serial_transfer::test {

using namespace std::chrono_literals;

class ProgressAccountantTest : public ::testing::Test {
protected:
    time_point t0_ = std::chrono::steady_clock::now();
};

TEST_F(ProgressAccountantTest, StartResetsCounters) {
    progress_accountant accountant;
    accountant.start(1000, t0_);
    accountant.record_confirmed(500, t0_ + 100ms);

    accountant.start(2000, t0_ + 200ms);
    EXPECT_EQ(accountant.bytes_confirmed(), 0u);
    EXPECT_EQ(accountant.total_bytes(), 2000u);
    EXPECT_FALSE(accountant.is_complete());
}

TEST_F(ProgressAccountantTest, AverageRateAndEta) {
    progress_accountant accountant;
    accountant.start(4000, t0_);

    auto s = accountant.record_confirmed(1000, t0_ + 1s);

    EXPECT_EQ(s.bytes_confirmed, 1000u);
    EXPECT_EQ(s.total_bytes, 4000u);
    EXPECT_EQ(s.elapsed, 1000ms);
    EXPECT_DOUBLE_EQ(s.average_rate, 1000.0);
    ASSERT_TRUE(s.eta.has_value());
    EXPECT_EQ(s.eta->count(), 3000);
}

TEST_F(ProgressAccountantTest, EtaUnknownBeforeAnyRate) {
    progress_accountant accountant;
    accountant.start(4000, t0_);

    auto s = accountant.snapshot(t0_);
    EXPECT_EQ(s.bytes_confirmed, 0u);
    EXPECT_DOUBLE_EQ(s.average_rate, 0.0);
    EXPECT_FALSE(s.eta.has_value());
}

TEST_F(ProgressAccountantTest, EtaZeroWhenComplete) {
    progress_accountant accountant;
    accountant.start(100, t0_);

    auto s = accountant.record_confirmed(100, t0_ + 10ms);
    EXPECT_TRUE(accountant.is_complete());
    ASSERT_TRUE(s.eta.has_value());
    EXPECT_EQ(s.eta->count(), 0);
}

TEST_F(ProgressAccountantTest, EmptyFileIsCompleteImmediately) {
    progress_accountant accountant;
    accountant.start(0, t0_);

    EXPECT_TRUE(accountant.is_complete());
    auto s = accountant.snapshot(t0_);
    ASSERT_TRUE(s.eta.has_value());
    EXPECT_EQ(s.eta->count(), 0);
}

TEST_F(ProgressAccountantTest, InstantaneousRateUsesRollingWindow) {
    progress_accountant accountant(progress_accountant::config{2});
    accountant.start(100000, t0_);

    // Slow start: 100 B/s
    accountant.record_confirmed(100, t0_ + 1s);
    accountant.record_confirmed(100, t0_ + 2s);

    // Fast tail: 1000 bytes per 100 ms
    accountant.record_confirmed(1000, t0_ + 2100ms);
    auto s = accountant.record_confirmed(1000, t0_ + 2200ms);

    // Window spans the last two confirmations only
    EXPECT_NEAR(s.instantaneous_rate, 10000.0, 1.0);
    EXPECT_NEAR(s.average_rate, 2200.0 / 2.2, 1.0);
}

TEST_F(ProgressAccountantTest, InstantaneousRateNeedsTwoSamples) {
    progress_accountant accountant;
    accountant.start(1000, t0_);

    auto s = accountant.snapshot(t0_ + 1s);
    EXPECT_DOUBLE_EQ(s.instantaneous_rate, 0.0);
}

TEST_F(ProgressAccountantTest, MoveKeepsState) {
    progress_accountant accountant;
    accountant.start(1000, t0_);
    accountant.record_confirmed(250, t0_ + 1s);

    progress_accountant moved(std::move(accountant));
    EXPECT_EQ(moved.bytes_confirmed(), 250u);
    EXPECT_EQ(moved.total_bytes(), 1000u);
}

TEST_F(ProgressAccountantTest, MakeProgressReport) {
    progress_accountant accountant;
    accountant.start(10, t0_);
    auto s = accountant.record_confirmed(4, t0_ + 1s);

    auto report = make_progress_report("a.bin", transfer_direction::receive, s);
    EXPECT_EQ(report.filename, "a.bin");
    EXPECT_EQ(report.direction, transfer_direction::receive);
    EXPECT_EQ(report.bytes_confirmed, 4u);
    EXPECT_EQ(report.total_bytes, 10u);
    EXPECT_DOUBLE_EQ(report.completion_percentage(), 40.0);
}

// =============================================================================
// Progress Format Tests
// =============================================================================

class ProgressFormatTest : public ::testing::Test {};

TEST_F(ProgressFormatTest, FormatEta) {
    EXPECT_EQ(format_eta(std::nullopt), "--:--");
    EXPECT_EQ(format_eta(duration{0}), "00:00");
    EXPECT_EQ(format_eta(duration{65000}), "01:05");
    EXPECT_EQ(format_eta(duration{7200000}), "120:00");
    EXPECT_EQ(format_eta(duration{-5}), "--:--");
}

TEST_F(ProgressFormatTest, FormatRate) {
    EXPECT_EQ(format_rate(0.0), "   0.00 KB/s");
    EXPECT_EQ(format_rate(2048.0), "   2.00 KB/s");
    EXPECT_EQ(format_rate(1536.0), "   1.50 KB/s");
}

TEST_F(ProgressFormatTest, ProgressLine) {
    progress_report report;
    report.bytes_confirmed = 2048;
    report.total_bytes = 4096;
    report.average_rate = 2048.0;
    report.eta = duration{1000};

    auto line = format_progress_line(report, 16);

    EXPECT_EQ(line,
              "[########--------]  50.00% 2048/4096 bytes     2.00 KB/s ETA 00:01");
}

TEST_F(ProgressFormatTest, ProgressLineForEmptyFileIsFull) {
    progress_report report;

    auto line = format_progress_line(report, 4);

    EXPECT_EQ(line.substr(0, 14), "[####] 100.00%");
    EXPECT_NE(line.find("0/0 bytes"), std::string::npos);
    EXPECT_NE(line.find("ETA --:--"), std::string::npos);
}

}  // namespace kcenon::serial_transfer::test
