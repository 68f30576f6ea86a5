#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <map>
#include <chrono>

#include "core/DownloadApplication.hpp"
#include "core/DownloadManager.hpp"
#include "ui/UI.hpp"
#include "util/http.hpp"
#include "util/format.hpp"
#include "util/args.hpp"

namespace
{
    void printEvent(const TaskEvent &event)
    {
        const ProgressSnapshot &p = event.progress;
        if (event.type == EventType::PROGRESS)
        {
            std::printf("[%llu] %s %s / %s (%s) %s ETA %s\n",
                        static_cast<unsigned long long>(event.taskId),
                        phaseName(p.phase),
                        formatBytes(static_cast<double>(p.bytesDownloaded)).c_str(),
                        p.totalSize > 0 ? formatBytes(static_cast<double>(p.totalSize)).c_str() : "?",
                        p.percentKnown ? formatPercent(p.percentage).c_str() : "--",
                        formatSpeed(p.currentSpeed).c_str(),
                        formatDuration(p.etaSeconds).c_str());
        }
        else
        {
            std::printf("[%llu] %s: %s\n",
                        static_cast<unsigned long long>(event.taskId),
                        taskStateName(event.state),
                        event.detail.c_str());
        }
        std::fflush(stdout);
    }
}

DownloadApplication::DownloadApplication(EngineConfig config)
    : _config(std::move(config))
{
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

DownloadApplication::~DownloadApplication()
{
    curl_global_cleanup();
}

int DownloadApplication::run(const std::vector<std::string> &urls)
{
    DownloadManager manager(_config,
                            std::make_shared<http::DirectUrlResolver>(_config.apiKey, _config.connectTimeoutSeconds),
                            std::make_shared<LocalArtifactCheck>(),
                            std::make_shared<http::CurlByteSource>());
    manager.start();

    int exitCode = urls.empty() ? runInteractive(manager) : runBatch(manager, urls);

    manager.stop();
    return exitCode;
}

int DownloadApplication::runInteractive(DownloadManager &manager)
{
    UI ui(manager);
    ui.run();
    return 0;
}

// Queues every URL, prints state changes and at most one progress line per task per second, and waits for all to finish
int DownloadApplication::runBatch(DownloadManager &manager, const std::vector<std::string> &urls)
{
    for (const auto &argument : urls)
    {
        TaskInput input;
        splitUrlAndHash(argument, input.url, input.expectedHash);
        manager.queueDownload(input);
    }

    std::map<TaskId, std::chrono::steady_clock::time_point> lastPrinted;
    size_t finished = 0;

    while (finished < urls.size())
    {
        TaskEvent event;
        if (!manager.events().popFor(event, std::chrono::milliseconds(500)))
        {
            // Terminal events may have been dropped by a full channel
            if (manager.waitUntilIdle(std::chrono::milliseconds(0)))
                break;
            continue;
        }

        if (event.type == EventType::PROGRESS)
        {
            auto now = std::chrono::steady_clock::now();
            auto it = lastPrinted.find(event.taskId);
            if (it != lastPrinted.end() && now - it->second < std::chrono::seconds(1))
                continue;
            lastPrinted[event.taskId] = now;
        }
        else if (event.type == EventType::FINISHED)
        {
            ++finished;
        }

        printEvent(event);
    }

    // Count from the records in case any terminal event was dropped
    size_t completed = 0;
    for (const auto &task : manager.snapshot())
    {
        if (task.state == TaskState::COMPLETED)
            ++completed;
    }

    spdlog::info("batch finished: {}/{} completed", completed, urls.size());
    return completed == urls.size() ? 0 : 1;
}
