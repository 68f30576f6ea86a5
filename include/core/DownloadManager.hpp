#ifndef DOWNLOADMANAGER_HPP
#define DOWNLOADMANAGER_HPP

#include <string>
#include <vector>
#include <memory>
#include <map>
#include <mutex>
#include <atomic>
#include <chrono>
#include <functional>
#include <condition_variable>

#include "core/DownloadTask.hpp"
#include "core/TaskQueue.hpp"
#include "core/TrackerRegistry.hpp"
#include "core/QueueProcessor.hpp"
#include "core/Collaborators.hpp"
#include "core/ByteSource.hpp"
#include "aux/BoundedChannel.hpp"
#include "util/config.hpp"

struct TaskSnapshot
{
    TaskId id{0};
    std::string label;
    std::string url;
    std::string destination;
    TaskState state{TaskState::QUEUED};
    std::string detail;
    ErrorKind errorKind{ErrorKind::NONE};
    int attempt{0};
    std::int64_t bandwidthLimit{0};
    time_t addedAt{0};
    time_t endedAt{0};
    ProgressSnapshot progress;
};

enum class EventType
{
    PROGRESS,
    STATE,
    FINISHED
};

struct TaskEvent
{
    TaskId taskId{0};
    EventType type{EventType::STATE};
    TaskState state{TaskState::QUEUED};
    ProgressSnapshot progress;
    std::string detail;
};

// Engine facade: owns the queue, the tracker registry, the worker pool and every task record
class DownloadManager
{
public:
    using FinishedListener = std::function<void(const TaskSnapshot &)>;

    DownloadManager(EngineConfig config,
                    std::shared_ptr<CatalogResolver> resolver,
                    std::shared_ptr<ArtifactCheck> artifactCheck,
                    std::shared_ptr<ByteSource> source);
    ~DownloadManager();

    DownloadManager(const DownloadManager &) = delete;
    DownloadManager &operator=(const DownloadManager &) = delete;

    void start();
    void stop();

    TaskId queueDownload(TaskInput input);

    bool pauseDownload(TaskId id);
    bool resumeDownload(TaskId id);
    bool cancelDownload(TaskId id);
    bool moveDownload(TaskId id, int direction);
    bool setBandwidthLimit(TaskId id, std::int64_t bytesPerSecond);
    // Replaces a failed or cancelled task with a fresh one for the same input; returns the new id, or 0
    TaskId retryDownload(TaskId id);

    void pauseAllDownloads();
    void resumeAllDownloads();
    void cancelAllDownloads();

    // Drops every terminal task and its tracker; returns how many were removed
    size_t clearFinished();

    std::vector<TaskSnapshot> snapshot();
    bool snapshot(TaskId id, TaskSnapshot &out);
    BoundedChannel<TaskEvent> &events() { return _events; }
    void setFinishedListener(FinishedListener listener);

    // Blocks until every task is terminal or the timeout passes; returns true if idle
    bool waitUntilIdle(std::chrono::milliseconds timeout);

    size_t queuedCount() const { return _queue.size(); }
    std::vector<TaskId> queueOrder() const { return _queue.ids(); }
    const EngineConfig &getConfig() const { return _config; }

private:
    const EngineConfig _config;
    std::shared_ptr<CatalogResolver> _resolver;
    std::shared_ptr<ArtifactCheck> _artifactCheck;
    std::shared_ptr<ByteSource> _source;

    TaskQueue _queue;
    TrackerRegistry _registry;
    BoundedChannel<TaskEvent> _events;

    mutable std::mutex _tasksMutex;
    std::condition_variable _idleCondition;
    std::map<TaskId, std::shared_ptr<DownloadTask>> _tasks;
    TaskId _nextId{1};

    std::mutex _listenerMutex;
    FinishedListener _finishedListener;

    QueueProcessor _processor;
    std::atomic<bool> _started{false};

    std::shared_ptr<DownloadTask> findTask(TaskId id) const;
    TaskSnapshot makeSnapshot(DownloadTask &task) const;

    void publish(DownloadTask &task, EventType type, const ProgressSnapshot &progress);
    void onFinished(DownloadTask &task);
};

#endif
