#include "aux/TaskSignals.hpp"

void TaskSignals::requestCancel()
{
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _cancelled = true;
    }

    // Wake anyone parked on the pause gate or in a timed sleep
    _condition.notify_all();
}

void TaskSignals::requestPause()
{
    std::lock_guard<std::mutex> lock(_mutex);
    _paused = true;
}

void TaskSignals::clearPause()
{
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _paused = false;
    }
    _condition.notify_all();
}

bool TaskSignals::isCancelled() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _cancelled;
}

bool TaskSignals::isPaused() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _paused;
}

bool TaskSignals::waitWhilePaused()
{
    std::unique_lock<std::mutex> lock(_mutex);
    _condition.wait(lock, [this]
                    { return _cancelled || !_paused; });
    return !_cancelled;
}

bool TaskSignals::sleepFor(std::chrono::milliseconds duration)
{
    std::unique_lock<std::mutex> lock(_mutex);
    _condition.wait_for(lock, duration, [this]
                        { return _cancelled; });
    return !_cancelled;
}
