#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>

#include "core/QueueProcessor.hpp"
#include "util/file.hpp"

QueueProcessor::QueueProcessor(TaskQueue &queue,
                               TrackerRegistry &registry,
                               CatalogResolver &resolver,
                               ArtifactCheck &artifactCheck,
                               ByteSource &source,
                               TransferSettings settings,
                               TaskLookup lookup,
                               ProcessorCallbacks callbacks)
    : _queue(queue),
      _registry(registry),
      _resolver(resolver),
      _artifactCheck(artifactCheck),
      _source(source),
      _settings(settings),
      _lookup(std::move(lookup)),
      _callbacks(std::move(callbacks))
{
}

QueueProcessor::~QueueProcessor()
{
    stop();
}

void QueueProcessor::start(size_t nThreads)
{
    if (!_workers.empty())
    {
        return;
    }

    // Create and launch worker threads
    for (size_t i = 0; i < std::max<size_t>(nThreads, 1); ++i)
    {
        _workers.emplace_back(&QueueProcessor::workerThread, this);
    }
}

// Signals the queue to stop and waits for every worker to return
void QueueProcessor::stop()
{
    _queue.shutdown();

    for (auto &worker : _workers)
    {
        if (worker.joinable())
        {
            worker.join();
        }
    }
    _workers.clear();
}

size_t QueueProcessor::size() const
{
    return _workers.size();
}

bool QueueProcessor::finishTask(DownloadTask &task, TaskState state, ErrorKind kind, const std::string &reason)
{
    // A finished task no longer writes its destination
    releaseDestination(task.getId());

    if (!task.finish(state, kind, reason))
    {
        return false;
    }

    _registry.updateQueuePositions();

    if (state == TaskState::FAILED)
    {
        spdlog::warn("task {}: failed ({}): {}", task.getId(), errorKindName(kind), reason);
    }
    else
    {
        spdlog::info("task {}: {}", task.getId(), taskStateName(state));
    }

    if (_callbacks.onFinished)
    {
        _callbacks.onFinished(task);
    }
    return true;
}

QueueProcessor::DestinationClaim::DestinationClaim(QueueProcessor &processor, const std::string &path, TaskId id)
    : _processor(processor),
      _id(id)
{
    std::lock_guard<std::mutex> lock(_processor._claimsMutex);
    auto claim = _processor._claims.emplace(path, _id);
    _holder = claim.first->second;
    _held = claim.second;
}

QueueProcessor::DestinationClaim::~DestinationClaim()
{
    if (_held)
    {
        _processor.releaseDestination(_id);
    }
}

void QueueProcessor::releaseDestination(TaskId id)
{
    std::lock_guard<std::mutex> lock(_claimsMutex);
    for (auto it = _claims.begin(); it != _claims.end();)
    {
        if (it->second == id)
        {
            it = _claims.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

void QueueProcessor::notifyState(DownloadTask &task)
{
    if (_callbacks.onStateChange)
    {
        _callbacks.onStateChange(task);
    }
}

// Executed by each worker thread
// Takes entries off the queue until it is shut down
void QueueProcessor::workerThread()
{
    QueueEntry entry;
    while (_queue.dequeue(entry))
    {
        std::shared_ptr<DownloadTask> task = _lookup(entry.taskId);

        // Cleared or cancelled while it was waiting
        if (!task || task->isTerminal())
        {
            continue;
        }

        try
        {
            process(*task);
        }
        catch (const std::exception &e)
        {
            spdlog::error("task {}: unexpected failure: {}", task->getId(), e.what());
            finishTask(*task, TaskState::FAILED, ErrorKind::IO_ERROR, e.what());
        }
    }
}

void QueueProcessor::process(DownloadTask &task)
{
    TaskSignals &signals = task.signals();
    std::shared_ptr<ProgressTracker> tracker = task.tracker();

    if (signals.isCancelled())
    {
        finishTask(task, TaskState::CANCELLED, ErrorKind::USER_CANCELLED, "Cancelled");
        return;
    }

    // A task paused while queued holds its worker until resumed
    if (signals.isPaused() && !signals.waitWhilePaused())
    {
        finishTask(task, TaskState::CANCELLED, ErrorKind::USER_CANCELLED, "Cancelled");
        return;
    }

    if (!task.markActive())
    {
        return;
    }

    const TaskInput &input = task.getInput();
    spdlog::info("task {}: started {}", task.getId(), input.url);
    task.setDetail("Fetching info");
    notifyState(task);

    Result<ResolvedArtifact> resolved = _resolver.resolve(input);
    if (!resolved)
    {
        finishTask(task, TaskState::FAILED, resolved.error().kind, resolved.error().message);
        return;
    }

    ResolvedArtifact artifact = resolved.value();
    if (!input.fileName.empty())
    {
        artifact.filename = input.fileName;
    }
    if (!input.expectedHash.empty())
    {
        artifact.expectedHash = input.expectedHash;
    }

    std::string destination = joinPath(input.destinationDirectory, sanitiseFilename(artifact.filename));
    task.setResolved(artifact.downloadUrl, destination);

    // Only one worker may append to a destination file
    DestinationClaim claim(*this, destination, task.getId());
    if (!claim.isHeld())
    {
        finishTask(task, TaskState::FAILED, ErrorKind::INVALID_INPUT,
                   "Destination " + destination + " in use by task " + std::to_string(claim.holder()));
        return;
    }

    if (signals.isCancelled())
    {
        finishTask(task, TaskState::CANCELLED, ErrorKind::USER_CANCELLED, "Cancelled");
        return;
    }

    if (_artifactCheck.alreadyPresent(artifact, destination))
    {
        // The check may hash the whole file, so a cancel can land while it runs
        if (signals.isCancelled())
        {
            finishTask(task, TaskState::CANCELLED, ErrorKind::USER_CANCELLED, "Cancelled");
            return;
        }
        if (artifact.size > 0)
        {
            auto size = static_cast<std::uint64_t>(artifact.size);
            tracker->updateProgress(size, size);
        }
        finishTask(task, TaskState::COMPLETED, ErrorKind::NONE, "Already downloaded");
        return;
    }

    TransferRequest request;
    request.url = artifact.downloadUrl;
    request.destination = destination;
    request.expectedHash = artifact.expectedHash;
    request.expectedSize = artifact.size;
    request.headers = artifact.headers;

    TransferHooks hooks;
    hooks.onPhase = [this, &task, tracker](TransferPhase phase)
    {
        tracker->setPhase(phase);
        _registry.updateQueuePositions();
        if (_callbacks.onProgress)
        {
            _callbacks.onProgress(task, tracker->snapshot());
        }
    };
    hooks.onProgress = [this, &task, tracker](std::uint64_t bytes, std::uint64_t total)
    {
        ProgressSnapshot snapshot = tracker->updateProgress(bytes, total);
        if (_callbacks.onProgress)
        {
            _callbacks.onProgress(task, snapshot);
        }
    };
    hooks.onResume = [this, &task, tracker](std::uint64_t bytesOnDisk, std::uint64_t total)
    {
        ProgressSnapshot snapshot = tracker->setResumeOffset(bytesOnDisk, total);
        if (_callbacks.onProgress)
        {
            _callbacks.onProgress(task, snapshot);
        }
    };
    hooks.bandwidthLimit = [&task]()
    {
        return task.getBandwidthLimit();
    };

    ResumableTransfer transfer(_source, _settings);
    const RetryPolicy &policy = task.getRetryPolicy();
    TransferError lastError(ErrorKind::TRANSIENT_NETWORK, "No attempt made");

    for (int attempt = 0; attempt <= policy.retryCount; ++attempt)
    {
        task.beginAttempt();

        if (attempt > 0 && !waitForRetry(task, attempt))
        {
            finishTask(task, TaskState::CANCELLED, ErrorKind::USER_CANCELLED, "Cancelled");
            return;
        }
        if (signals.isPaused() && !signals.waitWhilePaused())
        {
            finishTask(task, TaskState::CANCELLED, ErrorKind::USER_CANCELLED, "Cancelled");
            return;
        }

        task.setDetail("Downloading");
        notifyState(task);

        Result<TransferSummary> result = transfer.run(request, signals, hooks);

        // A cancel accepted after the last chunk still wins over completion
        if (signals.isCancelled())
        {
            finishTask(task, TaskState::CANCELLED, ErrorKind::USER_CANCELLED, "Cancelled");
            return;
        }
        if (result)
        {
            const TransferSummary &summary = result.value();
            spdlog::info("task {}: {} bytes written to {} (resumed from {}, {} restart(s))",
                         task.getId(), summary.finalSize, destination, summary.resumedFrom, summary.restarts);
            finishTask(task, TaskState::COMPLETED, ErrorKind::NONE, "Complete");
            return;
        }

        lastError = result.error();
        if (lastError.kind == ErrorKind::USER_CANCELLED)
        {
            finishTask(task, TaskState::CANCELLED, ErrorKind::USER_CANCELLED, "Cancelled");
            return;
        }
        if (!isRetryable(lastError.kind))
        {
            break;
        }
        if (attempt < policy.retryCount)
        {
            spdlog::info("task {}: attempt {} failed ({}): {}",
                         task.getId(), attempt + 1, errorKindName(lastError.kind), lastError.message);
        }
    }

    finishTask(task, TaskState::FAILED, lastError.kind, lastError.message);
}

// Sleeps out the backoff for this attempt in short slices; returns false if cancelled meanwhile
bool QueueProcessor::waitForRetry(DownloadTask &task, int attempt)
{
    const RetryPolicy &policy = task.getRetryPolicy();
    std::chrono::milliseconds remaining = policy.backoffFor(attempt);

    long shownSeconds = -1;
    while (remaining.count() > 0)
    {
        long seconds = static_cast<long>((remaining.count() + 999) / 1000);
        if (seconds != shownSeconds)
        {
            shownSeconds = seconds;
            task.setDetail("Retrying in " + std::to_string(seconds) + "s (" +
                           std::to_string(attempt) + "/" + std::to_string(policy.retryCount) + ")");
            notifyState(task);
        }

        std::chrono::milliseconds slice = std::min(remaining, QDM_RETRY_WAIT_SLICE);
        if (!task.signals().sleepFor(slice))
        {
            return false;
        }
        remaining -= slice;
    }

    spdlog::info("task {}: retry {}/{}", task.getId(), attempt, policy.retryCount);
    return !task.signals().isCancelled();
}
