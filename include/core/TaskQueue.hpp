#ifndef TASKQUEUE_HPP
#define TASKQUEUE_HPP

#include <deque>
#include <mutex>
#include <chrono>
#include <vector>
#include <condition_variable>

#include "core/Collaborators.hpp"
#include "core/DownloadTask.hpp"

struct QueueEntry
{
    TaskId taskId{0};
    TaskInput input;
};

// Reorderable FIFO shared by the worker pool; every mutation happens under one lock
class TaskQueue
{
public:
    explicit TaskQueue(std::chrono::milliseconds waitSlice = std::chrono::milliseconds(500));

    void enqueue(QueueEntry entry);

    // Blocks until an entry is available or shutdown is requested; returns false on shutdown
    bool dequeue(QueueEntry &entry);

    // Swaps the entry with its neighbour (direction -1 towards the front, +1 towards the back)
    bool move(TaskId taskId, int direction);

    bool remove(TaskId taskId);
    size_t position(TaskId taskId) const;
    std::vector<TaskId> ids() const;
    size_t size() const;
    bool empty() const;

    void shutdown();
    bool isShutdown() const;

private:
    const std::chrono::milliseconds _waitSlice;
    std::deque<QueueEntry> _entries;
    mutable std::mutex _queueMutex;
    std::condition_variable _condition;
    bool _stop;
};

#endif
