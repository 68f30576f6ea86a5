#ifndef TRACKERREGISTRY_HPP
#define TRACKERREGISTRY_HPP

#include <map>
#include <memory>
#include <mutex>
#include <vector>
#include <cstdint>

#include "core/ProgressTracker.hpp"

// Owns the task id -> tracker mapping and keeps queue rankings consistent across trackers
class TrackerRegistry
{
public:
    std::shared_ptr<ProgressTracker> create(std::uint64_t taskId, std::uint64_t totalSize = 0);
    std::shared_ptr<ProgressTracker> get(std::uint64_t taskId) const;
    void remove(std::uint64_t taskId);
    std::vector<std::shared_ptr<ProgressTracker>> all() const;
    size_t size() const;

    void updateQueuePositions();

private:
    mutable std::mutex _mutex;
    // Ids are issued in increasing order, so map order is registration order
    std::map<std::uint64_t, std::shared_ptr<ProgressTracker>> _trackers;
};

#endif
