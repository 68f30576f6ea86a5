#include <gtest/gtest.h>
#include <chrono>

#include "core/ProgressTracker.hpp"

using namespace std::chrono;

namespace
{
    ProgressTracker::Clock::time_point at(ProgressTracker::Clock::time_point start, double seconds)
    {
        return start + duration_cast<ProgressTracker::Clock::duration>(duration<double>(seconds));
    }
}

class ProgressTrackerTest : public ::testing::Test
{
protected:
    ProgressTracker::Clock::time_point start = ProgressTracker::Clock::now();
};

TEST_F(ProgressTrackerTest, PercentageIsIndeterminateWithoutTotal)
{
    ProgressTracker tracker(1, 0, start);
    ProgressSnapshot s = tracker.updateProgress(500, 0, at(start, 1.0));

    EXPECT_FALSE(s.percentKnown);
    EXPECT_DOUBLE_EQ(s.percentage, 0.0);
    EXPECT_DOUBLE_EQ(s.etaSeconds, 0.0);
    EXPECT_EQ(s.bytesDownloaded, 500u);
}

TEST_F(ProgressTrackerTest, PercentageTracksKnownTotal)
{
    ProgressTracker tracker(1, 1000, start);
    ProgressSnapshot s = tracker.updateProgress(250, 0, at(start, 1.0));

    EXPECT_TRUE(s.percentKnown);
    EXPECT_DOUBLE_EQ(s.percentage, 25.0);
}

TEST_F(ProgressTrackerTest, SamplesCloserThanMinimumIntervalAreIgnored)
{
    ProgressTracker tracker(1, 10000, start);
    tracker.updateProgress(1000, 0, at(start, 1.0));
    ProgressSnapshot first = tracker.snapshot();

    // 50ms later: no new speed sample
    ProgressSnapshot s = tracker.updateProgress(5000, 0, at(start, 1.05));
    EXPECT_DOUBLE_EQ(s.currentSpeed, first.currentSpeed);
    EXPECT_DOUBLE_EQ(s.peakSpeed, first.peakSpeed);
}

TEST_F(ProgressTrackerTest, CurrentSpeedIsLinearlyWeighted)
{
    ProgressTracker tracker(1, 100000, start);
    tracker.updateProgress(1000, 0, at(start, 1.0)); // 1000 B/s
    ProgressSnapshot s = tracker.updateProgress(4000, 0, at(start, 2.0)); // 3000 B/s

    // (1000 * 1 + 3000 * 2) / 3
    EXPECT_NEAR(s.currentSpeed, 7000.0 / 3.0, 1e-6);
    EXPECT_NEAR(s.peakSpeed, 3000.0, 1e-6);
    EXPECT_NEAR(s.averageSpeed, 2000.0, 1e-6);
}

TEST_F(ProgressTrackerTest, SpeedWindowIsBounded)
{
    ProgressTracker tracker(1, 0, start);
    std::uint64_t bytes = 0;

    // Forty slow samples followed by forty fast ones push every slow sample out
    for (int i = 1; i <= 40; ++i)
    {
        bytes += 100;
        tracker.updateProgress(bytes, 0, at(start, i * 1.0));
    }
    ProgressSnapshot s;
    for (int i = 41; i <= 80; ++i)
    {
        bytes += 1000;
        s = tracker.updateProgress(bytes, 0, at(start, i * 1.0));
    }
    EXPECT_NEAR(s.currentSpeed, 1000.0, 1e-6);
}

TEST_F(ProgressTrackerTest, EtaIsBlendedAndClamped)
{
    ProgressTracker tracker(1, 10000, start);
    ProgressSnapshot s;
    for (int i = 1; i <= 5; ++i)
    {
        s = tracker.updateProgress(static_cast<std::uint64_t>(i) * 1000, 0, at(start, i * 1.0));
    }

    // Steady 1000 B/s: every estimate agrees on 5 seconds
    EXPECT_NEAR(s.etaSeconds, 5.0, 1e-6);
    EXPECT_GE(s.etaSeconds, 1.0);
}

TEST_F(ProgressTrackerTest, EtaNeverExceedsFiveTimesElapsed)
{
    ProgressTracker tracker(1, 1000000000, start);
    ProgressSnapshot s = tracker.updateProgress(100, 0, at(start, 0.5));

    EXPECT_GT(s.etaSeconds, 0.0);
    EXPECT_LE(s.etaSeconds, 2.5 + 1e-9);
}

TEST_F(ProgressTrackerTest, EtaIsZeroWhenNothingRemains)
{
    ProgressTracker tracker(1, 1000, start);
    tracker.updateProgress(500, 0, at(start, 1.0));
    ProgressSnapshot s = tracker.updateProgress(1000, 0, at(start, 2.0));

    EXPECT_DOUBLE_EQ(s.etaSeconds, 0.0);
}

TEST_F(ProgressTrackerTest, EtaIsNeverNegative)
{
    ProgressTracker tracker(1, 1000, start);
    for (int i = 1; i <= 20; ++i)
    {
        ProgressSnapshot s = tracker.updateProgress(static_cast<std::uint64_t>(i * 37 % 900), 0, at(start, i * 0.3));
        EXPECT_GE(s.etaSeconds, 0.0);
    }
}

TEST_F(ProgressTrackerTest, RestartFromZeroResetsSpeedBaseline)
{
    ProgressTracker tracker(1, 10000, start);
    tracker.updateProgress(5000, 0, at(start, 1.0));
    ProgressSnapshot s = tracker.updateProgress(0, 0, at(start, 2.0));

    EXPECT_EQ(s.bytesDownloaded, 0u);
    EXPECT_GE(s.currentSpeed, 0.0);

    s = tracker.updateProgress(1000, 0, at(start, 3.0));
    EXPECT_GE(s.currentSpeed, 0.0);
    EXPECT_EQ(s.bytesDownloaded, 1000u);
}

TEST_F(ProgressTrackerTest, ResumeOffsetIsNotASpeedSample)
{
    ProgressTracker tracker(1, 0, start);
    ProgressSnapshot s = tracker.setResumeOffset(100000000, 200000000, start + milliseconds(200));

    EXPECT_EQ(s.bytesDownloaded, 100000000u);
    EXPECT_NEAR(s.percentage, 50.0, 1e-9);
    EXPECT_DOUBLE_EQ(s.currentSpeed, 0.0);
    EXPECT_DOUBLE_EQ(s.peakSpeed, 0.0);
    EXPECT_DOUBLE_EQ(s.averageSpeed, 0.0);

    // 10000 bytes in 100ms after the resume
    s = tracker.updateProgress(100010000, 200000000, start + milliseconds(300));
    EXPECT_NEAR(s.currentSpeed, 100000.0, 1e-3);
    EXPECT_NEAR(s.peakSpeed, 100000.0, 1e-3);
    EXPECT_LE(s.averageSpeed, 100000.0);
    EXPECT_GT(s.averageSpeed, 0.0);
    EXPECT_GE(s.etaSeconds, 1.0);
    EXPECT_LE(s.etaSeconds, 5 * 0.3 + 1e-9);
}

TEST_F(ProgressTrackerTest, ResumedSpeedTracksFetchedBytesOnly)
{
    ProgressTracker tracker(1, 0, start);
    tracker.setResumeOffset(50000, 100000, at(start, 1.0));

    ProgressSnapshot s;
    for (int i = 1; i <= 5; ++i)
    {
        s = tracker.updateProgress(50000 + static_cast<std::uint64_t>(i) * 1000, 0, at(start, 1.0 + i));
    }

    EXPECT_NEAR(s.currentSpeed, 1000.0, 1e-6);
    EXPECT_NEAR(s.peakSpeed, 1000.0, 1e-6);
    EXPECT_NEAR(s.averageSpeed, 5000.0 / 6.0, 1e-6);
}

TEST_F(ProgressTrackerTest, PhaseChangesRecordDurations)
{
    ProgressTracker tracker(1, 0, start);
    tracker.setPhase(TransferPhase::CONNECTING, at(start, 1.0));
    tracker.setPhase(TransferPhase::DOWNLOADING, at(start, 3.0));

    auto durations = tracker.phaseDurations();
    EXPECT_NEAR(durations[TransferPhase::INITIALIZING], 1.0, 1e-6);
    EXPECT_NEAR(durations[TransferPhase::CONNECTING], 2.0, 1e-6);
    EXPECT_EQ(tracker.phase(), TransferPhase::DOWNLOADING);
}

TEST_F(ProgressTrackerTest, TerminalPhaseIsFinal)
{
    ProgressTracker tracker(1, 0, start);
    tracker.setPhase(TransferPhase::DOWNLOADING);
    tracker.complete();
    tracker.fail();
    tracker.resume();
    tracker.cancel();

    EXPECT_EQ(tracker.phase(), TransferPhase::COMPLETED);
}

TEST_F(ProgressTrackerTest, PauseAndResumeToggleDownloading)
{
    ProgressTracker tracker(1, 0, start);
    tracker.setPhase(TransferPhase::DOWNLOADING);
    tracker.pause();
    EXPECT_EQ(tracker.phase(), TransferPhase::PAUSED);
    tracker.resume();
    EXPECT_EQ(tracker.phase(), TransferPhase::DOWNLOADING);
}

TEST_F(ProgressTrackerTest, FormattedStatsDescribeProgress)
{
    ProgressTracker tracker(1, 2048, start);
    tracker.updateProgress(1024, 0, at(start, 1.0));
    tracker.setQueueInfo(2, 3, 1, 4);

    FormattedStats stats = tracker.formattedStats();
    EXPECT_NE(stats.downloaded.find("50.0%"), std::string::npos);
    EXPECT_EQ(stats.phase, "Initializing");
    EXPECT_EQ(stats.queueInfo, "Position 2/3");
    EXPECT_EQ(stats.filesInfo, "Files 1/4");
}

TEST_F(ProgressTrackerTest, FormattedEtaIsUnknownWhenIndeterminate)
{
    ProgressTracker tracker(1, 0, start);
    tracker.updateProgress(100, 0, at(start, 1.0));

    FormattedStats stats = tracker.formattedStats();
    EXPECT_EQ(stats.eta, "Unknown");
    EXPECT_TRUE(stats.queueInfo.empty());
}
