#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

#include "core/DownloadManager.hpp"

namespace
{
    template <typename T>
    T &require(const std::shared_ptr<T> &collaborator, const char *name)
    {
        if (!collaborator)
        {
            throw std::invalid_argument(std::string("DownloadManager requires a ") + name);
        }
        return *collaborator;
    }

    TransferSettings transferSettingsFrom(const EngineConfig &config)
    {
        TransferSettings settings;
        settings.chunkSize = config.chunkSize;
        settings.progressInterval = config.progressInterval;
        settings.connectTimeoutSeconds = config.connectTimeoutSeconds;
        settings.lowSpeedTimeSeconds = config.lowSpeedTimeSeconds;
        return settings;
    }
}

DownloadManager::DownloadManager(EngineConfig config,
                                 std::shared_ptr<CatalogResolver> resolver,
                                 std::shared_ptr<ArtifactCheck> artifactCheck,
                                 std::shared_ptr<ByteSource> source)
    : _config(std::move(config)),
      _resolver(std::move(resolver)),
      _artifactCheck(std::move(artifactCheck)),
      _source(std::move(source)),
      _events(_config.eventCapacity),
      _processor(_queue,
                 _registry,
                 require(_resolver, "catalog resolver"),
                 require(_artifactCheck, "artifact check"),
                 require(_source, "byte source"),
                 transferSettingsFrom(_config),
                 [this](TaskId id)
                 { return findTask(id); },
                 ProcessorCallbacks{
                     [this](DownloadTask &task, const ProgressSnapshot &progress)
                     { publish(task, EventType::PROGRESS, progress); },
                     [this](DownloadTask &task)
                     { publish(task, EventType::STATE, task.tracker()->snapshot()); },
                     [this](DownloadTask &task)
                     { onFinished(task); }})
{
}

// Cancels outstanding work and joins the workers
DownloadManager::~DownloadManager()
{
    stop();
}

void DownloadManager::start()
{
    if (_started.exchange(true))
    {
        return;
    }

    spdlog::info("starting {} worker(s), retry count {}, download directory {}",
                 _config.workerCount, _config.retryCount, _config.downloadDirectory);
    _processor.start(static_cast<size_t>(_config.workerCount));
}

void DownloadManager::stop()
{
    cancelAllDownloads();
    _processor.stop();
}

std::shared_ptr<DownloadTask> DownloadManager::findTask(TaskId id) const
{
    std::lock_guard<std::mutex> lock(_tasksMutex);
    auto it = _tasks.find(id);
    return it == _tasks.end() ? nullptr : it->second;
}

//---------------------------------------------------------------------------------
// Task control
//---------------------------------------------------------------------------------

// Creates a task record and its tracker, then hands the entry to the worker pool
TaskId DownloadManager::queueDownload(TaskInput input)
{
    if (input.destinationDirectory.empty())
    {
        input.destinationDirectory = _config.downloadDirectory;
    }

    RetryPolicy policy;
    policy.retryCount = _config.retryCount;
    policy.backoffBase = _config.backoffBase;
    policy.backoffCap = _config.backoffCap;

    std::shared_ptr<DownloadTask> task;
    {
        std::lock_guard<std::mutex> lock(_tasksMutex);
        TaskId id = _nextId++;
        task = std::make_shared<DownloadTask>(id, input, policy, _registry.create(id));
        task->setBandwidthLimit(_config.bandwidthLimitBps);
        _tasks.emplace(id, task);
    }

    spdlog::info("task {}: queued {}", task->getId(), input.url);
    _queue.enqueue(QueueEntry{task->getId(), std::move(input)});
    _registry.updateQueuePositions();
    publish(*task, EventType::STATE, task->tracker()->snapshot());
    return task->getId();
}

bool DownloadManager::pauseDownload(TaskId id)
{
    auto task = findTask(id);
    if (!task || task->isTerminal() || task->signals().isPaused())
    {
        return false;
    }

    task->signals().requestPause();
    if (!task->markPaused())
    {
        // Still queued; the worker holds it at the gate once dequeued
        task->setDetail("Paused");
    }

    spdlog::info("task {}: paused", id);
    publish(*task, EventType::STATE, task->tracker()->snapshot());
    return true;
}

bool DownloadManager::resumeDownload(TaskId id)
{
    auto task = findTask(id);
    if (!task || task->isTerminal() || !task->signals().isPaused())
    {
        return false;
    }

    task->signals().clearPause();
    if (!task->markResumed())
    {
        task->setDetail("Queued");
    }

    spdlog::info("task {}: resumed", id);
    publish(*task, EventType::STATE, task->tracker()->snapshot());
    return true;
}

bool DownloadManager::cancelDownload(TaskId id)
{
    auto task = findTask(id);
    if (!task || task->isTerminal())
    {
        return false;
    }

    task->signals().requestCancel();

    // A task still waiting in the queue never reaches a worker
    if (_queue.remove(id))
    {
        _processor.finishTask(*task, TaskState::CANCELLED, ErrorKind::USER_CANCELLED, "Cancelled");
    }
    return true;
}

bool DownloadManager::moveDownload(TaskId id, int direction)
{
    if (!_queue.move(id, direction))
    {
        return false;
    }

    auto task = findTask(id);
    if (task)
    {
        publish(*task, EventType::STATE, task->tracker()->snapshot());
    }
    return true;
}

bool DownloadManager::setBandwidthLimit(TaskId id, std::int64_t bytesPerSecond)
{
    auto task = findTask(id);
    if (!task || task->isTerminal())
    {
        return false;
    }

    task->setBandwidthLimit(std::max<std::int64_t>(bytesPerSecond, 0));
    spdlog::info("task {}: bandwidth limit {} B/s", id, task->getBandwidthLimit());
    return true;
}

TaskId DownloadManager::retryDownload(TaskId id)
{
    auto task = findTask(id);
    if (!task)
    {
        return 0;
    }

    TaskState state = task->getStatus();
    if (state != TaskState::FAILED && state != TaskState::CANCELLED)
    {
        return 0;
    }

    TaskId newId = queueDownload(task->getInput());

    // The new task supersedes the old record
    {
        std::lock_guard<std::mutex> lock(_tasksMutex);
        _tasks.erase(id);
    }
    _registry.remove(id);
    spdlog::info("task {}: retried as task {}", id, newId);
    return newId;
}

void DownloadManager::pauseAllDownloads()
{
    std::vector<TaskId> ids;
    {
        std::lock_guard<std::mutex> lock(_tasksMutex);
        for (const auto &entry : _tasks)
        {
            ids.push_back(entry.first);
        }
    }

    for (TaskId id : ids)
    {
        pauseDownload(id);
    }
}

void DownloadManager::resumeAllDownloads()
{
    std::vector<TaskId> ids;
    {
        std::lock_guard<std::mutex> lock(_tasksMutex);
        for (const auto &entry : _tasks)
        {
            ids.push_back(entry.first);
        }
    }

    for (TaskId id : ids)
    {
        resumeDownload(id);
    }
}

// Withdraws queued tasks first, then signals the ones already running
void DownloadManager::cancelAllDownloads()
{
    std::vector<TaskId> queued = _queue.ids();
    for (auto it = queued.rbegin(); it != queued.rend(); ++it)
    {
        cancelDownload(*it);
    }

    std::vector<TaskId> ids;
    {
        std::lock_guard<std::mutex> lock(_tasksMutex);
        for (const auto &entry : _tasks)
        {
            ids.push_back(entry.first);
        }
    }

    for (TaskId id : ids)
    {
        cancelDownload(id);
    }
}

size_t DownloadManager::clearFinished()
{
    std::vector<TaskId> removed;
    {
        std::lock_guard<std::mutex> lock(_tasksMutex);
        for (auto it = _tasks.begin(); it != _tasks.end();)
        {
            if (it->second->isTerminal())
            {
                removed.push_back(it->first);
                it = _tasks.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }

    for (TaskId id : removed)
    {
        _registry.remove(id);
    }
    _registry.updateQueuePositions();
    return removed.size();
}

//---------------------------------------------------------------------------------
// Observers
//---------------------------------------------------------------------------------

TaskSnapshot DownloadManager::makeSnapshot(DownloadTask &task) const
{
    TaskSnapshot snapshot;
    snapshot.id = task.getId();
    snapshot.label = task.getInput().label;
    snapshot.url = task.getInput().url;
    snapshot.destination = task.getDestination();
    snapshot.state = task.getStatus();
    snapshot.detail = task.getDetail();
    snapshot.errorKind = task.getErrorKind();
    snapshot.attempt = task.getAttempt();
    snapshot.bandwidthLimit = task.getBandwidthLimit();
    snapshot.addedAt = task.getAddedAt();
    snapshot.endedAt = task.getEndedAt();
    snapshot.progress = task.tracker()->snapshot();

    if (snapshot.label.empty())
    {
        snapshot.label = snapshot.destination.empty() ? snapshot.url : snapshot.destination;
    }
    return snapshot;
}

std::vector<TaskSnapshot> DownloadManager::snapshot()
{
    _registry.updateQueuePositions();

    std::vector<std::shared_ptr<DownloadTask>> tasks;
    {
        std::lock_guard<std::mutex> lock(_tasksMutex);
        for (const auto &entry : _tasks)
        {
            tasks.push_back(entry.second);
        }
    }

    std::vector<TaskSnapshot> snapshots;
    snapshots.reserve(tasks.size());
    for (const auto &task : tasks)
    {
        snapshots.push_back(makeSnapshot(*task));
    }
    return snapshots;
}

bool DownloadManager::snapshot(TaskId id, TaskSnapshot &out)
{
    auto task = findTask(id);
    if (!task)
    {
        return false;
    }
    out = makeSnapshot(*task);
    return true;
}

void DownloadManager::setFinishedListener(FinishedListener listener)
{
    std::lock_guard<std::mutex> lock(_listenerMutex);
    _finishedListener = std::move(listener);
}

bool DownloadManager::waitUntilIdle(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(_tasksMutex);
    return _idleCondition.wait_for(lock, timeout, [this]
                                   { return std::all_of(_tasks.begin(), _tasks.end(), [](const std::pair<const TaskId, std::shared_ptr<DownloadTask>> &entry)
                                                        { return entry.second->isTerminal(); }); });
}

// Offers the event to the channel; a full channel drops it rather than stalling the worker
void DownloadManager::publish(DownloadTask &task, EventType type, const ProgressSnapshot &progress)
{
    TaskEvent event;
    event.taskId = task.getId();
    event.type = type;
    event.state = task.getStatus();
    event.progress = progress;
    event.detail = task.getDetail();

    if (!_events.tryPush(std::move(event)))
    {
        if (type == EventType::PROGRESS)
        {
            spdlog::debug("task {}: progress event dropped", task.getId());
        }
        else
        {
            spdlog::warn("task {}: event channel full, {} event(s) dropped", task.getId(), _events.droppedCount());
        }
    }
}

void DownloadManager::onFinished(DownloadTask &task)
{
    publish(task, EventType::FINISHED, task.tracker()->snapshot());

    FinishedListener listener;
    {
        std::lock_guard<std::mutex> lock(_listenerMutex);
        listener = _finishedListener;
    }
    if (listener)
    {
        listener(makeSnapshot(task));
    }

    std::lock_guard<std::mutex> lock(_tasksMutex);
    _idleCondition.notify_all();
}
