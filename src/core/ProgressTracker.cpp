#include <algorithm>
#include <chrono>

#include "core/ProgressTracker.hpp"
#include "util/format.hpp"

namespace
{
    double secondsBetween(ProgressTracker::Clock::time_point from, ProgressTracker::Clock::time_point to)
    {
        return std::chrono::duration<double>(to - from).count();
    }
}

const char *phaseName(TransferPhase phase)
{
    switch (phase)
    {
    case TransferPhase::INITIALIZING:
        return "Initializing";
    case TransferPhase::CONNECTING:
        return "Connecting";
    case TransferPhase::DOWNLOADING:
        return "Downloading";
    case TransferPhase::VERIFYING:
        return "Verifying";
    case TransferPhase::COMPLETED:
        return "Completed";
    case TransferPhase::FAILED:
        return "Failed";
    case TransferPhase::PAUSED:
        return "Paused";
    case TransferPhase::CANCELLED:
        return "Cancelled";
    }
    return "Unknown";
}

bool isTerminalPhase(TransferPhase phase)
{
    return phase == TransferPhase::COMPLETED ||
           phase == TransferPhase::FAILED ||
           phase == TransferPhase::CANCELLED;
}

ProgressTracker::ProgressTracker(std::uint64_t taskId, std::uint64_t totalSize)
    : ProgressTracker(taskId, totalSize, Clock::now())
{
}

ProgressTracker::ProgressTracker(std::uint64_t taskId, std::uint64_t totalSize, Clock::time_point startTime)
    : _taskId(taskId),
      _startTime(startTime),
      _phaseStartTime(startTime),
      _lastSpeedUpdate(startTime)
{
    _stats.totalSize = totalSize;
}

ProgressSnapshot ProgressTracker::updateProgress(std::uint64_t bytesDownloaded, std::uint64_t totalSize)
{
    return updateProgress(bytesDownloaded, totalSize, Clock::now());
}

// Folds a new (bytes, total) sample into the rolling statistics and returns a copy of them
ProgressSnapshot ProgressTracker::updateProgress(std::uint64_t bytesDownloaded,
                                                 std::uint64_t totalSize,
                                                 Clock::time_point now)
{
    std::lock_guard<std::mutex> lock(_mutex);

    // A restart from zero invalidates the speed baseline and the trend history
    if (bytesDownloaded < _stats.bytesDownloaded)
    {
        _lastBytes = bytesDownloaded;
        _lastSpeedUpdate = now;
        _resumedFrom = std::min(_resumedFrom, bytesDownloaded);
        _snapshots.clear();
    }

    applyTotals(bytesDownloaded, totalSize, now);

    calcSpeeds(bytesDownloaded, now);
    calcEstimatedTimeRemaining();

    _snapshots.push_back({now, bytesDownloaded});
    while (_snapshots.size() > QDM_SPEED_WINDOW)
    {
        _snapshots.pop_front();
    }

    return _stats;
}

ProgressSnapshot ProgressTracker::setResumeOffset(std::uint64_t bytesOnDisk, std::uint64_t totalSize)
{
    return setResumeOffset(bytesOnDisk, totalSize, Clock::now());
}

ProgressSnapshot ProgressTracker::setResumeOffset(std::uint64_t bytesOnDisk,
                                                  std::uint64_t totalSize,
                                                  Clock::time_point now)
{
    std::lock_guard<std::mutex> lock(_mutex);

    _lastBytes = bytesOnDisk;
    _lastSpeedUpdate = now;
    _resumedFrom = bytesOnDisk;
    _snapshots.clear();

    applyTotals(bytesOnDisk, totalSize, now);
    calcEstimatedTimeRemaining();

    _snapshots.push_back({now, bytesOnDisk});
    return _stats;
}

void ProgressTracker::setPhase(TransferPhase phase)
{
    setPhase(phase, Clock::now());
}

void ProgressTracker::setPhase(TransferPhase phase, Clock::time_point now)
{
    std::lock_guard<std::mutex> lock(_mutex);
    applyPhase(phase, now);
}

void ProgressTracker::setQueueInfo(int position, int total, int filesCompleted, int filesTotal)
{
    std::lock_guard<std::mutex> lock(_mutex);
    _stats.queuePosition = position;
    _stats.queueTotal = total;
    _stats.filesCompleted = filesCompleted;
    _stats.filesTotal = filesTotal;
}

void ProgressTracker::pause()
{
    setPhase(TransferPhase::PAUSED);
}

void ProgressTracker::resume()
{
    setPhase(TransferPhase::DOWNLOADING);
}

void ProgressTracker::complete()
{
    setPhase(TransferPhase::COMPLETED);
}

void ProgressTracker::fail()
{
    setPhase(TransferPhase::FAILED);
}

void ProgressTracker::cancel()
{
    setPhase(TransferPhase::CANCELLED);
}

ProgressSnapshot ProgressTracker::snapshot() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _stats;
}

TransferPhase ProgressTracker::phase() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _stats.phase;
}

std::map<TransferPhase, double> ProgressTracker::phaseDurations() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _phaseHistory;
}

// Renders the current statistics as display strings
FormattedStats ProgressTracker::formattedStats() const
{
    ProgressSnapshot stats = snapshot();

    FormattedStats out;
    out.downloaded = formatBytes(static_cast<double>(stats.bytesDownloaded)) + " / " +
                     formatBytes(static_cast<double>(stats.totalSize)) + " (" +
                     formatPercent(stats.percentage) + ")";
    out.currentSpeed = formatSpeed(stats.currentSpeed);
    out.averageSpeed = formatSpeed(stats.averageSpeed);
    out.peakSpeed = formatSpeed(stats.peakSpeed);
    out.elapsedTime = formatDuration(stats.elapsedTime);
    out.eta = formatDuration(stats.etaSeconds);
    out.phase = phaseName(stats.phase);
    if (stats.queueTotal > 0)
    {
        out.queueInfo = "Position " + std::to_string(stats.queuePosition) + "/" + std::to_string(stats.queueTotal);
    }
    if (stats.filesTotal > 0)
    {
        out.filesInfo = "Files " + std::to_string(stats.filesCompleted) + "/" + std::to_string(stats.filesTotal);
    }
    return out;
}

//---------------------------------------------------------------------------------
// Private methods (caller holds _mutex)
//---------------------------------------------------------------------------------

void ProgressTracker::applyPhase(TransferPhase phase, Clock::time_point now)
{
    // Terminal phases are final
    if (isTerminalPhase(_stats.phase) || _stats.phase == phase)
    {
        return;
    }

    _phaseHistory[_stats.phase] = secondsBetween(_phaseStartTime, now);
    _stats.phase = phase;
    _phaseStartTime = now;
    _stats.phaseElapsed = 0.0;
}

void ProgressTracker::applyTotals(std::uint64_t bytesDownloaded, std::uint64_t totalSize, Clock::time_point now)
{
    if (totalSize > 0)
    {
        _stats.totalSize = totalSize;
    }

    _stats.elapsedTime = secondsBetween(_startTime, now);
    _stats.phaseElapsed = secondsBetween(_phaseStartTime, now);

    _stats.bytesDownloaded = bytesDownloaded;
    if (_stats.totalSize > 0)
    {
        _stats.percentage = std::min(100.0, (static_cast<double>(bytesDownloaded) / _stats.totalSize) * 100.0);
        _stats.percentKnown = true;
    }
    else
    {
        _stats.percentage = 0.0;
        _stats.percentKnown = false;
    }
}

void ProgressTracker::calcSpeeds(std::uint64_t bytesDownloaded, Clock::time_point now)
{
    double dt = secondsBetween(_lastSpeedUpdate, now);

    // Samples closer than 100ms apart are dominated by chunk arrival noise
    if (dt >= QDM_MIN_SAMPLE_INTERVAL)
    {
        double instantSpeed = static_cast<double>(bytesDownloaded - _lastBytes) / dt;

        _speedSamples.push_back(instantSpeed);
        while (_speedSamples.size() > QDM_SPEED_WINDOW)
        {
            _speedSamples.pop_front();
        }

        // Linear weights favour the newest samples
        double weightedSum = 0.0;
        double totalWeight = 0.0;
        for (size_t i = 0; i < _speedSamples.size(); ++i)
        {
            double weight = static_cast<double>(i + 1);
            weightedSum += _speedSamples[i] * weight;
            totalWeight += weight;
        }
        _stats.currentSpeed = weightedSum / totalWeight;
        _stats.peakSpeed = std::max(_stats.peakSpeed, instantSpeed);

        _lastBytes = bytesDownloaded;
        _lastSpeedUpdate = now;
    }

    if (_stats.elapsedTime > 0.0)
    {
        // Bytes that were on disk before this run were not fetched in its elapsed time
        _stats.averageSpeed = static_cast<double>(_stats.bytesDownloaded - _resumedFrom) / _stats.elapsedTime;
    }
}

void ProgressTracker::calcEstimatedTimeRemaining()
{
    if (_stats.totalSize == 0 || _stats.bytesDownloaded == 0 || _stats.bytesDownloaded >= _stats.totalSize)
    {
        _stats.etaSeconds = 0.0;
        return;
    }

    double remaining = static_cast<double>(_stats.totalSize - _stats.bytesDownloaded);

    double weightedEta = 0.0;
    double totalWeight = 0.0;
    auto contribute = [&](double speed, double weight)
    {
        if (speed > 0.0)
        {
            weightedEta += (remaining / speed) * weight;
            totalWeight += weight;
        }
    };

    contribute(_stats.currentSpeed, 0.4);
    contribute(_stats.averageSpeed, 0.3);

    // Trend from the oldest and newest of the last few stored samples
    if (_snapshots.size() >= 3)
    {
        size_t first = _snapshots.size() - std::min(QDM_TREND_WINDOW, _snapshots.size());
        const Sample &oldest = _snapshots[first];
        const Sample &newest = _snapshots.back();
        double span = secondsBetween(oldest.timestamp, newest.timestamp);
        if (span > 0.0 && newest.bytesDownloaded > oldest.bytesDownloaded)
        {
            contribute(static_cast<double>(newest.bytesDownloaded - oldest.bytesDownloaded) / span, 0.3);
        }
    }

    if (totalWeight <= 0.0)
    {
        _stats.etaSeconds = 0.0;
        return;
    }

    double eta = weightedEta / totalWeight;
    double maxReasonable = _stats.elapsedTime * 5.0;
    _stats.etaSeconds = std::max(1.0, std::min(eta, maxReasonable));
}
