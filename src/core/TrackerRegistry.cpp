#include "core/TrackerRegistry.hpp"

// Creates the tracker for a task; a task keeps the same tracker for its whole lifetime
std::shared_ptr<ProgressTracker> TrackerRegistry::create(std::uint64_t taskId, std::uint64_t totalSize)
{
    std::lock_guard<std::mutex> lock(_mutex);

    auto it = _trackers.find(taskId);
    if (it != _trackers.end())
    {
        return it->second;
    }

    auto tracker = std::make_shared<ProgressTracker>(taskId, totalSize);
    _trackers.emplace(taskId, tracker);
    return tracker;
}

std::shared_ptr<ProgressTracker> TrackerRegistry::get(std::uint64_t taskId) const
{
    std::lock_guard<std::mutex> lock(_mutex);

    auto it = _trackers.find(taskId);
    if (it == _trackers.end())
    {
        return nullptr;
    }
    return it->second;
}

void TrackerRegistry::remove(std::uint64_t taskId)
{
    std::lock_guard<std::mutex> lock(_mutex);
    _trackers.erase(taskId);
}

std::vector<std::shared_ptr<ProgressTracker>> TrackerRegistry::all() const
{
    std::lock_guard<std::mutex> lock(_mutex);

    std::vector<std::shared_ptr<ProgressTracker>> trackers;
    trackers.reserve(_trackers.size());
    for (const auto &entry : _trackers)
    {
        trackers.push_back(entry.second);
    }
    return trackers;
}

size_t TrackerRegistry::size() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _trackers.size();
}

// Ranks every tracker still in flight 1..N and refreshes the completed/total counters on all of them
void TrackerRegistry::updateQueuePositions()
{
    std::lock_guard<std::mutex> lock(_mutex);

    std::vector<ProgressTracker *> inFlight;
    int completed = 0;

    for (const auto &entry : _trackers)
    {
        TransferPhase phase = entry.second->phase();
        if (phase == TransferPhase::INITIALIZING ||
            phase == TransferPhase::CONNECTING ||
            phase == TransferPhase::DOWNLOADING)
        {
            inFlight.push_back(entry.second.get());
        }
        else if (phase == TransferPhase::COMPLETED)
        {
            ++completed;
        }
    }

    int total = static_cast<int>(inFlight.size());
    int filesTotal = static_cast<int>(_trackers.size());

    for (const auto &entry : _trackers)
    {
        entry.second->setQueueInfo(0, total, completed, filesTotal);
    }
    for (int i = 0; i < total; ++i)
    {
        inFlight[i]->setQueueInfo(i + 1, total, completed, filesTotal);
    }
}
