#include <algorithm>

#include "core/TaskQueue.hpp"

TaskQueue::TaskQueue(std::chrono::milliseconds waitSlice)
    : _waitSlice(waitSlice),
      _stop(false)
{
}

void TaskQueue::enqueue(QueueEntry entry)
{
    {
        std::unique_lock<std::mutex> lock(_queueMutex);
        _entries.push_back(std::move(entry));
    }

    // Wake one idle worker
    _condition.notify_one();
}

// Waits in bounded slices so a stop request is always noticed promptly
bool TaskQueue::dequeue(QueueEntry &entry)
{
    std::unique_lock<std::mutex> lock(_queueMutex);
    while (!_stop && _entries.empty())
    {
        _condition.wait_for(lock, _waitSlice);
    }

    if (_stop)
    {
        return false;
    }

    entry = std::move(_entries.front());
    _entries.pop_front();
    return true;
}

bool TaskQueue::move(TaskId taskId, int direction)
{
    if (direction != -1 && direction != 1)
    {
        return false;
    }

    std::unique_lock<std::mutex> lock(_queueMutex);
    auto it = std::find_if(_entries.begin(), _entries.end(), [taskId](const QueueEntry &e)
                           { return e.taskId == taskId; });
    if (it == _entries.end())
    {
        return false;
    }

    size_t index = static_cast<size_t>(it - _entries.begin());
    if ((direction < 0 && index == 0) || (direction > 0 && index + 1 >= _entries.size()))
    {
        return false;
    }

    std::swap(_entries[index], _entries[index + direction]);
    return true;
}

bool TaskQueue::remove(TaskId taskId)
{
    std::unique_lock<std::mutex> lock(_queueMutex);
    auto it = std::find_if(_entries.begin(), _entries.end(), [taskId](const QueueEntry &e)
                           { return e.taskId == taskId; });
    if (it == _entries.end())
    {
        return false;
    }
    _entries.erase(it);
    return true;
}

// One-based position, 0 when the task is not waiting
size_t TaskQueue::position(TaskId taskId) const
{
    std::unique_lock<std::mutex> lock(_queueMutex);
    for (size_t i = 0; i < _entries.size(); ++i)
    {
        if (_entries[i].taskId == taskId)
        {
            return i + 1;
        }
    }
    return 0;
}

std::vector<TaskId> TaskQueue::ids() const
{
    std::unique_lock<std::mutex> lock(_queueMutex);
    std::vector<TaskId> result;
    result.reserve(_entries.size());
    for (const auto &entry : _entries)
    {
        result.push_back(entry.taskId);
    }
    return result;
}

size_t TaskQueue::size() const
{
    std::unique_lock<std::mutex> lock(_queueMutex);
    return _entries.size();
}

bool TaskQueue::empty() const
{
    return size() == 0;
}

void TaskQueue::shutdown()
{
    {
        std::unique_lock<std::mutex> lock(_queueMutex);
        _stop = true;
    }

    // Wake every waiting worker so it can observe the stop flag
    _condition.notify_all();
}

bool TaskQueue::isShutdown() const
{
    std::unique_lock<std::mutex> lock(_queueMutex);
    return _stop;
}
