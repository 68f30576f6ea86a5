#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>

#include "core/DownloadTask.hpp"

using std::chrono::milliseconds;

namespace
{
    std::shared_ptr<DownloadTask> makeTask(TaskId id = 1)
    {
        TaskInput input;
        input.url = "https://example.com/file.bin";
        return std::make_shared<DownloadTask>(id, input, RetryPolicy(), std::make_shared<ProgressTracker>(id));
    }
}

TEST(RetryPolicyTest, BackoffDoublesUpToCap)
{
    RetryPolicy policy;
    policy.backoffBase = milliseconds(2000);
    policy.backoffCap = milliseconds(60000);

    EXPECT_EQ(policy.backoffFor(0), milliseconds(0));
    EXPECT_EQ(policy.backoffFor(1), milliseconds(2000));
    EXPECT_EQ(policy.backoffFor(2), milliseconds(4000));
    EXPECT_EQ(policy.backoffFor(3), milliseconds(8000));
    EXPECT_EQ(policy.backoffFor(5), milliseconds(32000));
    EXPECT_EQ(policy.backoffFor(6), milliseconds(60000));
    EXPECT_EQ(policy.backoffFor(100), milliseconds(60000));
}

TEST(DownloadTaskTest, StartsQueued)
{
    auto task = makeTask();
    EXPECT_EQ(task->getStatus(), TaskState::QUEUED);
    EXPECT_EQ(task->getDetail(), "Queued");
    EXPECT_FALSE(task->isTerminal());
}

TEST(DownloadTaskTest, PauseOnlyFromActive)
{
    auto task = makeTask();
    EXPECT_FALSE(task->markPaused());
    EXPECT_TRUE(task->markActive());
    EXPECT_TRUE(task->markPaused());
    EXPECT_EQ(task->getStatus(), TaskState::PAUSED);
    EXPECT_TRUE(task->markResumed());
    EXPECT_EQ(task->getStatus(), TaskState::ACTIVE);
    EXPECT_FALSE(task->markResumed());
}

TEST(DownloadTaskTest, FinishIsAcceptedOnce)
{
    auto task = makeTask();
    ASSERT_TRUE(task->markActive());

    EXPECT_TRUE(task->finish(TaskState::FAILED, ErrorKind::NOT_FOUND, "Not found"));
    EXPECT_FALSE(task->finish(TaskState::COMPLETED, ErrorKind::NONE, "Complete"));

    EXPECT_EQ(task->getStatus(), TaskState::FAILED);
    EXPECT_EQ(task->getErrorKind(), ErrorKind::NOT_FOUND);
    EXPECT_EQ(task->getDetail(), "Not found");
    EXPECT_EQ(task->tracker()->phase(), TransferPhase::FAILED);
    EXPECT_NE(task->getEndedAt(), 0);
}

TEST(DownloadTaskTest, FinishRejectsNonTerminalState)
{
    auto task = makeTask();
    EXPECT_FALSE(task->finish(TaskState::ACTIVE, ErrorKind::NONE, ""));
    EXPECT_FALSE(task->isTerminal());
}

TEST(DownloadTaskTest, CancelledWhileQueuedNeverActivates)
{
    auto task = makeTask();
    ASSERT_TRUE(task->finish(TaskState::CANCELLED, ErrorKind::USER_CANCELLED, "Cancelled"));
    EXPECT_FALSE(task->markActive());
    EXPECT_EQ(task->tracker()->phase(), TransferPhase::CANCELLED);
}

TEST(DownloadTaskTest, ConcurrentFinishHasOneWinner)
{
    auto task = makeTask();
    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i)
    {
        threads.emplace_back([&task, &winners, i]
                             {
            TaskState state = i % 2 ? TaskState::COMPLETED : TaskState::CANCELLED;
            if (task->finish(state, ErrorKind::NONE, "done"))
            {
                ++winners;
            } });
    }
    for (auto &thread : threads)
    {
        thread.join();
    }

    EXPECT_EQ(winners.load(), 1);
}

TEST(DownloadTaskTest, DetailIsFrozenOnceTerminal)
{
    auto task = makeTask();
    task->finish(TaskState::COMPLETED, ErrorKind::NONE, "Complete");
    task->setDetail("Downloading");
    EXPECT_EQ(task->getDetail(), "Complete");
}

TEST(TaskSignalsTest, SleepIsCutShortByCancel)
{
    TaskSignals signals;
    std::thread canceller([&signals]
                          {
        std::this_thread::sleep_for(milliseconds(20));
        signals.requestCancel(); });

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(signals.sleepFor(std::chrono::seconds(10)));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    canceller.join();
}

TEST(TaskSignalsTest, PauseGateOpensOnClear)
{
    TaskSignals signals;
    signals.requestPause();

    std::thread resumer([&signals]
                        {
        std::this_thread::sleep_for(milliseconds(20));
        signals.clearPause(); });

    EXPECT_TRUE(signals.waitWhilePaused());
    EXPECT_FALSE(signals.isPaused());
    resumer.join();
}

TEST(TaskSignalsTest, CancelReleasesPauseGate)
{
    TaskSignals signals;
    signals.requestPause();

    std::thread canceller([&signals]
                          {
        std::this_thread::sleep_for(milliseconds(20));
        signals.requestCancel(); });

    EXPECT_FALSE(signals.waitWhilePaused());
    canceller.join();
}
