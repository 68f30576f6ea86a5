#include <algorithm>

#include "core/DownloadTask.hpp"

const char *taskStateName(TaskState state)
{
    switch (state)
    {
    case TaskState::QUEUED:
        return "queued";
    case TaskState::ACTIVE:
        return "active";
    case TaskState::PAUSED:
        return "paused";
    case TaskState::COMPLETED:
        return "completed";
    case TaskState::FAILED:
        return "failed";
    case TaskState::CANCELLED:
        return "cancelled";
    }
    return "unknown";
}

bool isTerminalState(TaskState state)
{
    return state == TaskState::COMPLETED ||
           state == TaskState::FAILED ||
           state == TaskState::CANCELLED;
}

std::chrono::milliseconds RetryPolicy::backoffFor(int attempt) const
{
    if (attempt <= 0)
    {
        return std::chrono::milliseconds(0);
    }

    // Double from the base, stopping once the cap is reached so the shift cannot overflow
    std::chrono::milliseconds delay = backoffBase;
    for (int i = 1; i < attempt && delay < backoffCap; ++i)
    {
        delay *= 2;
    }
    return std::min(delay, backoffCap);
}

DownloadTask::DownloadTask(TaskId id, TaskInput input, RetryPolicy policy, std::shared_ptr<ProgressTracker> tracker)
    : _id(id),
      _input(std::move(input)),
      _policy(policy),
      _tracker(std::move(tracker)),
      _addedAt(std::time(nullptr))
{
}

//---------------------------------------------------------------------------------
// Task State Control
//---------------------------------------------------------------------------------

bool DownloadTask::markActive()
{
    std::lock_guard<std::mutex> lock(_mutex);
    if (_status != TaskState::QUEUED)
    {
        return false;
    }
    _status = TaskState::ACTIVE;
    return true;
}

bool DownloadTask::markPaused()
{
    std::lock_guard<std::mutex> lock(_mutex);
    if (_status != TaskState::ACTIVE)
    {
        return false;
    }
    _status = TaskState::PAUSED;
    _detail = "Paused";
    return true;
}

bool DownloadTask::markResumed()
{
    std::lock_guard<std::mutex> lock(_mutex);
    if (_status != TaskState::PAUSED)
    {
        return false;
    }
    _status = TaskState::ACTIVE;
    _detail = "Resumed";
    return true;
}

bool DownloadTask::finish(TaskState terminalState, ErrorKind kind, const std::string &reason)
{
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (isTerminalState(_status) || !isTerminalState(terminalState))
        {
            return false;
        }
        _status = terminalState;
        _errorKind = kind;
        _detail = reason;
        _endedAt = std::time(nullptr);
    }

    switch (terminalState)
    {
    case TaskState::COMPLETED:
        _tracker->complete();
        break;
    case TaskState::FAILED:
        _tracker->fail();
        break;
    default:
        _tracker->cancel();
        break;
    }
    return true;
}

void DownloadTask::setResolved(const std::string &url, const std::string &destination)
{
    std::lock_guard<std::mutex> lock(_mutex);
    _resolvedUrl = url;
    _destination = destination;
}

void DownloadTask::setDetail(const std::string &detail)
{
    std::lock_guard<std::mutex> lock(_mutex);
    if (!isTerminalState(_status))
    {
        _detail = detail;
    }
}

// Counts a new attempt and returns its zero-based index
int DownloadTask::beginAttempt()
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _attempt++;
}

//---------------------------------------------------------------------------------
// Accessors
//---------------------------------------------------------------------------------

TaskState DownloadTask::getStatus() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _status;
}

std::string DownloadTask::getDetail() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _detail;
}

std::string DownloadTask::getResolvedUrl() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _resolvedUrl;
}

std::string DownloadTask::getDestination() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _destination;
}

ErrorKind DownloadTask::getErrorKind() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _errorKind;
}

int DownloadTask::getAttempt() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _attempt;
}

time_t DownloadTask::getEndedAt() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _endedAt;
}

bool DownloadTask::isTerminal() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return isTerminalState(_status);
}
