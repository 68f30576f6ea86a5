#ifndef QUEUEPROCESSOR_HPP
#define QUEUEPROCESSOR_HPP

#include <vector>
#include <map>
#include <mutex>
#include <memory>
#include <thread>
#include <string>
#include <functional>

#include "core/TaskQueue.hpp"
#include "core/TrackerRegistry.hpp"
#include "core/DownloadTask.hpp"
#include "core/ResumableTransfer.hpp"
#include "core/Collaborators.hpp"
#include "core/ByteSource.hpp"

static constexpr std::chrono::milliseconds QDM_RETRY_WAIT_SLICE{200};

struct ProcessorCallbacks
{
    std::function<void(DownloadTask &, const ProgressSnapshot &)> onProgress;
    std::function<void(DownloadTask &)> onStateChange;
    std::function<void(DownloadTask &)> onFinished; // once per task, after its terminal transition
};

// Fixed pool of workers draining the task queue; each worker runs one task's full lifecycle at a time
class QueueProcessor
{
public:
    using TaskLookup = std::function<std::shared_ptr<DownloadTask>(TaskId)>;

    QueueProcessor(TaskQueue &queue,
                   TrackerRegistry &registry,
                   CatalogResolver &resolver,
                   ArtifactCheck &artifactCheck,
                   ByteSource &source,
                   TransferSettings settings,
                   TaskLookup lookup,
                   ProcessorCallbacks callbacks);
    ~QueueProcessor();

    QueueProcessor(const QueueProcessor &) = delete;
    QueueProcessor &operator=(const QueueProcessor &) = delete;

    void start(size_t nThreads);
    void stop();

    size_t size() const;

    // Finishes the task and notifies observers; returns false if it was already terminal
    bool finishTask(DownloadTask &task, TaskState state, ErrorKind kind, const std::string &reason);

private:
    TaskQueue &_queue;
    TrackerRegistry &_registry;
    CatalogResolver &_resolver;
    ArtifactCheck &_artifactCheck;
    ByteSource &_source;
    const TransferSettings _settings;
    const TaskLookup _lookup;
    const ProcessorCallbacks _callbacks;

    std::vector<std::thread> _workers;

    // Destination path -> task writing it
    std::mutex _claimsMutex;
    std::map<std::string, TaskId> _claims;

    // Holds a destination for one task until the worker leaves it
    class DestinationClaim
    {
    public:
        DestinationClaim(QueueProcessor &processor, const std::string &path, TaskId id);
        ~DestinationClaim();

        DestinationClaim(const DestinationClaim &) = delete;
        DestinationClaim &operator=(const DestinationClaim &) = delete;

        bool isHeld() const { return _held; }
        TaskId holder() const { return _holder; }

    private:
        QueueProcessor &_processor;
        const TaskId _id;
        TaskId _holder{0};
        bool _held{false};
    };

    void workerThread();
    void process(DownloadTask &task);
    void releaseDestination(TaskId id);
    bool waitForRetry(DownloadTask &task, int attempt);
    void notifyState(DownloadTask &task);
};

#endif
