#ifndef TASKSIGNALS_HPP
#define TASKSIGNALS_HPP

#include <mutex>
#include <chrono>
#include <condition_variable>

// Cancel flag plus a clearable pause gate shared between a task's controller and its worker
class TaskSignals
{
public:
    void requestCancel();
    void requestPause();
    void clearPause();

    bool isCancelled() const;
    bool isPaused() const;

    // Blocks while the pause gate is set; returns false if cancelled
    bool waitWhilePaused();

    // Sleeps for the given duration unless cancelled first; returns false if cancelled
    bool sleepFor(std::chrono::milliseconds duration);

private:
    mutable std::mutex _mutex;
    std::condition_variable _condition;
    bool _cancelled{false};
    bool _paused{false};
};

#endif
