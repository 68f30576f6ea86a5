#ifndef PROGRESSTRACKER_HPP
#define PROGRESSTRACKER_HPP

#include <string>
#include <deque>
#include <map>
#include <mutex>
#include <chrono>
#include <cstdint>

static constexpr size_t QDM_SPEED_WINDOW = 30;
static constexpr size_t QDM_TREND_WINDOW = 10;
static constexpr double QDM_MIN_SAMPLE_INTERVAL = 0.1; // seconds

enum class TransferPhase
{
    INITIALIZING,
    CONNECTING,
    DOWNLOADING,
    VERIFYING,
    COMPLETED,
    FAILED,
    PAUSED,
    CANCELLED
};

const char *phaseName(TransferPhase phase);
bool isTerminalPhase(TransferPhase phase);

struct ProgressSnapshot
{
    std::uint64_t bytesDownloaded{0};
    std::uint64_t totalSize{0};
    double percentage{0.0};
    bool percentKnown{false};

    double currentSpeed{0.0};
    double averageSpeed{0.0};
    double peakSpeed{0.0};

    double elapsedTime{0.0};
    double etaSeconds{0.0};
    double phaseElapsed{0.0};

    TransferPhase phase{TransferPhase::INITIALIZING};

    int queuePosition{0};
    int queueTotal{0};
    int filesCompleted{0};
    int filesTotal{0};
};

struct FormattedStats
{
    std::string downloaded;
    std::string currentSpeed;
    std::string averageSpeed;
    std::string peakSpeed;
    std::string elapsedTime;
    std::string eta;
    std::string phase;
    std::string queueInfo;
    std::string filesInfo;
};

class ProgressTracker
{
public:
    using Clock = std::chrono::steady_clock;

    explicit ProgressTracker(std::uint64_t taskId, std::uint64_t totalSize = 0);
    ProgressTracker(std::uint64_t taskId, std::uint64_t totalSize, Clock::time_point startTime);

    ProgressSnapshot updateProgress(std::uint64_t bytesDownloaded, std::uint64_t totalSize = 0);
    ProgressSnapshot updateProgress(std::uint64_t bytesDownloaded, std::uint64_t totalSize, Clock::time_point now);

    // Bytes already on disk before fetching starts; they set the speed baseline and are never a sample
    ProgressSnapshot setResumeOffset(std::uint64_t bytesOnDisk, std::uint64_t totalSize = 0);
    ProgressSnapshot setResumeOffset(std::uint64_t bytesOnDisk, std::uint64_t totalSize, Clock::time_point now);

    void setPhase(TransferPhase phase);
    void setPhase(TransferPhase phase, Clock::time_point now);
    void setQueueInfo(int position, int total, int filesCompleted, int filesTotal);

    void pause();
    void resume();
    void complete();
    void fail();
    void cancel();

    ProgressSnapshot snapshot() const;
    FormattedStats formattedStats() const;
    TransferPhase phase() const;
    std::map<TransferPhase, double> phaseDurations() const;

    std::uint64_t getTaskId() const { return _taskId; }

private:
    struct Sample
    {
        Clock::time_point timestamp;
        std::uint64_t bytesDownloaded;
    };

    const std::uint64_t _taskId;
    mutable std::mutex _mutex;

    ProgressSnapshot _stats;
    Clock::time_point _startTime;
    Clock::time_point _phaseStartTime;

    std::deque<double> _speedSamples;
    std::deque<Sample> _snapshots;
    std::uint64_t _lastBytes{0};
    std::uint64_t _resumedFrom{0};
    Clock::time_point _lastSpeedUpdate;

    std::map<TransferPhase, double> _phaseHistory;

    void applyPhase(TransferPhase phase, Clock::time_point now);
    void applyTotals(std::uint64_t bytesDownloaded, std::uint64_t totalSize, Clock::time_point now);
    void calcSpeeds(std::uint64_t bytesDownloaded, Clock::time_point now);
    void calcEstimatedTimeRemaining();
};

#endif
