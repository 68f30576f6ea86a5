#ifndef DOWNLOADTASK_HPP
#define DOWNLOADTASK_HPP

#include <string>
#include <mutex>
#include <atomic>
#include <memory>
#include <chrono>
#include <cstdint>
#include <ctime>

#include "core/Collaborators.hpp"
#include "core/ProgressTracker.hpp"
#include "core/TransferError.hpp"
#include "aux/TaskSignals.hpp"

using TaskId = std::uint64_t;

enum class TaskState
{
    QUEUED,
    ACTIVE,
    PAUSED,
    COMPLETED,
    FAILED,
    CANCELLED
};

const char *taskStateName(TaskState state);
bool isTerminalState(TaskState state);

struct RetryPolicy
{
    int retryCount{2};
    std::chrono::milliseconds backoffBase{2000};
    std::chrono::milliseconds backoffCap{60000};

    // Delay before the given attempt (attempt 0 has none): min(base * 2^(attempt-1), cap)
    std::chrono::milliseconds backoffFor(int attempt) const;
};

// Per-task record shared by the engine, its worker and observers; state changes go through a per-task lock
class DownloadTask
{
public:
    DownloadTask(TaskId id, TaskInput input, RetryPolicy policy, std::shared_ptr<ProgressTracker> tracker);

    // QUEUED -> ACTIVE; fails if the task already reached a terminal state
    bool markActive();
    // ACTIVE <-> PAUSED; other states are left alone
    bool markPaused();
    bool markResumed();
    // Moves to a terminal state exactly once; later calls return false and change nothing
    bool finish(TaskState terminalState, ErrorKind kind, const std::string &reason);

    void setResolved(const std::string &url, const std::string &destination);
    void setDetail(const std::string &detail);
    int beginAttempt();

    void setBandwidthLimit(std::int64_t bytesPerSecond) { _bandwidthLimit.store(bytesPerSecond); }
    std::int64_t getBandwidthLimit() const { return _bandwidthLimit.load(); }

    TaskId getId() const { return _id; }
    const TaskInput &getInput() const { return _input; }
    const RetryPolicy &getRetryPolicy() const { return _policy; }
    TaskSignals &signals() { return _signals; }
    std::shared_ptr<ProgressTracker> tracker() const { return _tracker; }

    TaskState getStatus() const;
    std::string getDetail() const;
    std::string getResolvedUrl() const;
    std::string getDestination() const;
    ErrorKind getErrorKind() const;
    int getAttempt() const;
    time_t getAddedAt() const { return _addedAt; }
    time_t getEndedAt() const;

    bool isTerminal() const;

private:
    const TaskId _id;
    const TaskInput _input;
    const RetryPolicy _policy;
    const std::shared_ptr<ProgressTracker> _tracker;
    const time_t _addedAt;

    TaskSignals _signals;
    std::atomic<std::int64_t> _bandwidthLimit{0};

    mutable std::mutex _mutex;
    TaskState _status{TaskState::QUEUED};
    std::string _detail{"Queued"};
    std::string _resolvedUrl;
    std::string _destination;
    ErrorKind _errorKind{ErrorKind::NONE};
    int _attempt{0};
    time_t _endedAt{0};
};

#endif
