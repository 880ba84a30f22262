#include <gtest/gtest.h>
#include "attachsync/attachment_store.hpp"
#include "attachsync/attachment_store_transaction.hpp"
#include "attachsync/queue_status.hpp"
#include "attachsync/task_queue_loader.hpp"
#include "attachsync/transfer_queue_store.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

typedef std::function<TaskRecordResult(std::shared_ptr<QueuedTransfer>, TaskQueueLoader *)> TaskHandler;

class RecordingTaskRunner : public TaskRecordRunner {
public:
    TaskHandler handler;

    std::mutex mtx;
    std::vector<std::string> ran;
    std::vector<std::string> succeeded;
    std::vector<std::string> failedRetryable;
    std::vector<std::string> failedUnretryable;
    std::vector<std::string> cancelled;
    std::set<std::string> running;
    bool sawDuplicateKey = false;
    int maxConcurrent = 0;
    std::atomic<int> drainCount{0};

    TaskRecordResult runTask(std::shared_ptr<QueuedTransfer> record, TaskQueueLoader * loader) override {
        {
            std::lock_guard<std::mutex> lck(mtx);
            ran.push_back(record->id());
            if (running.count(record->id())) {
                sawDuplicateKey = true;
            }
            running.insert(record->id());
            maxConcurrent = std::max(maxConcurrent, (int)running.size());
        }
        TaskRecordResult result = TaskRecordResult::Success();
        try {
            if (handler) {
                result = handler(record, loader);
            }
        } catch (...) {
            std::lock_guard<std::mutex> lck(mtx);
            running.erase(record->id());
            throw;
        }
        std::lock_guard<std::mutex> lck(mtx);
        running.erase(record->id());
        return result;
    }

    void didSucceed(std::shared_ptr<QueuedTransfer> record, AttachmentStoreTransaction &) override {
        std::lock_guard<std::mutex> lck(mtx);
        succeeded.push_back(record->id());
    }

    void didFail(std::shared_ptr<QueuedTransfer> record, const TaskRecordResult &, bool isRetryable, AttachmentStoreTransaction &) override {
        std::lock_guard<std::mutex> lck(mtx);
        (isRetryable ? failedRetryable : failedUnretryable).push_back(record->id());
    }

    void didCancel(std::shared_ptr<QueuedTransfer> record, AttachmentStoreTransaction &) override {
        std::lock_guard<std::mutex> lck(mtx);
        cancelled.push_back(record->id());
    }

    void didDrainQueue() override {
        drainCount++;
    }

    int ranCount(std::string key) {
        std::lock_guard<std::mutex> lck(mtx);
        int n = 0;
        for (auto & k : ran) {
            if (k == key) {
                n++;
            }
        }
        return n;
    }
};

class TaskQueueLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = new AttachmentStore(":memory:");
        store->migrate();
        queue = new TransferQueueStore(TransferDirection::Upload);
    }

    void TearDown() override {
        delete queue;
        delete store;
    }

    TaskQueueLoader * makeLoader(int maxConcurrent) {
        return new TaskQueueLoader("test", maxConcurrent, queue, &runner, store, []() { return (time_t)1000; });
    }

    void enqueue(std::string attachmentId, int priority = TRANSFER_PRIORITY_DEFAULT) {
        AttachmentStoreTransaction tx(store, "test");
        QueuedTransfer record(queue->tableName(), attachmentId, true, priority, 100);
        queue->enqueue(record, tx);
        tx.commit();
    }

    int count() {
        AttachmentStoreTransaction tx(store, "test");
        int c = queue->count(tx);
        tx.commit();
        return c;
    }

    AttachmentStore * store;
    TransferQueueStore * queue;
    RecordingTaskRunner runner;
};

TEST_F(TaskQueueLoaderTest, DrainsEveryRecordAndReportsTheDrainOnce) {
    for (int i = 0; i < 5; i++) {
        enqueue("a" + std::to_string(i));
    }
    std::unique_ptr<TaskQueueLoader> loader(makeLoader(2));
    loader->loadAndRunTasks();

    EXPECT_EQ(count(), 0);
    EXPECT_EQ(runner.succeeded.size(), 5u);
    EXPECT_EQ(runner.drainCount.load(), 1);
    EXPECT_FALSE(loader->isRunning());
}

TEST_F(TaskQueueLoaderTest, NeverExceedsMaxConcurrencyOrRunsAKeyTwice) {
    for (int i = 0; i < 12; i++) {
        enqueue("a" + std::to_string(i));
    }
    runner.handler = [](std::shared_ptr<QueuedTransfer>, TaskQueueLoader *) {
        std::this_thread::sleep_for(std::chrono::milliseconds(15));
        return TaskRecordResult::Success();
    };
    std::unique_ptr<TaskQueueLoader> loader(makeLoader(3));
    loader->loadAndRunTasks();

    EXPECT_EQ(runner.ran.size(), 12u);
    EXPECT_LE(runner.maxConcurrent, 3);
    EXPECT_FALSE(runner.sawDuplicateKey);
    EXPECT_EQ(count(), 0);
}

TEST_F(TaskQueueLoaderTest, RunsHigherPriorityFirst) {
    enqueue("low", TRANSFER_PRIORITY_LOW);
    enqueue("high", TRANSFER_PRIORITY_HIGH);
    enqueue("mid", TRANSFER_PRIORITY_DEFAULT);

    std::unique_ptr<TaskQueueLoader> loader(makeLoader(1));
    loader->loadAndRunTasks();

    std::vector<std::string> expected{"high:f", "mid:f", "low:f"};
    EXPECT_EQ(runner.ran, expected);
}

TEST_F(TaskQueueLoaderTest, RetryableFailureKeepsTheRowAndIsNotRetriedInTheSameCycle) {
    enqueue("a1");
    enqueue("a2");
    runner.handler = [](std::shared_ptr<QueuedTransfer> record, TaskQueueLoader *) {
        if (record->attachmentId() == "a1") {
            return TaskRecordResult::Retryable(std::make_shared<TransferException>(TRANSFER_ERROR_UNKNOWN, "flaky", true));
        }
        return TaskRecordResult::Success();
    };
    std::unique_ptr<TaskQueueLoader> loader(makeLoader(1));
    loader->loadAndRunTasks();

    EXPECT_EQ(runner.ranCount("a1:f"), 1);
    EXPECT_EQ(runner.ranCount("a2:f"), 1);
    EXPECT_EQ(runner.failedRetryable, std::vector<std::string>{"a1:f"});
    EXPECT_EQ(count(), 1);
    EXPECT_EQ(runner.drainCount.load(), 0);
}

TEST_F(TaskQueueLoaderTest, UnretryableFailureAndCancellationRemoveTheRow) {
    enqueue("a1");
    enqueue("a2");
    runner.handler = [](std::shared_ptr<QueuedTransfer> record, TaskQueueLoader *) {
        if (record->attachmentId() == "a1") {
            return TaskRecordResult::Unretryable(std::make_shared<TransferException>(TRANSFER_ERROR_INVALID_RESPONSE, "bad", false));
        }
        return TaskRecordResult::Cancelled();
    };
    std::unique_ptr<TaskQueueLoader> loader(makeLoader(2));
    loader->loadAndRunTasks();

    EXPECT_EQ(runner.failedUnretryable, std::vector<std::string>{"a1:f"});
    EXPECT_EQ(runner.cancelled, std::vector<std::string>{"a2:f"});
    EXPECT_EQ(count(), 0);
    EXPECT_EQ(runner.drainCount.load(), 1);
}

TEST_F(TaskQueueLoaderTest, ThrowingTaskIsTreatedAsUnretryable) {
    enqueue("a1");
    runner.handler = [](std::shared_ptr<QueuedTransfer>, TaskQueueLoader *) -> TaskRecordResult {
        throw TransferException(TRANSFER_ERROR_UNKNOWN, "boom", true);
    };
    std::unique_ptr<TaskQueueLoader> loader(makeLoader(1));
    loader->loadAndRunTasks();

    EXPECT_EQ(runner.failedUnretryable, std::vector<std::string>{"a1:f"});
    EXPECT_EQ(count(), 0);
}

TEST_F(TaskQueueLoaderTest, StopWithReasonIsRethrownFromTheCycle) {
    enqueue("a1");
    enqueue("a2");
    runner.handler = [](std::shared_ptr<QueuedTransfer>, TaskQueueLoader * loader) {
        auto error = std::make_shared<TransferException>(TRANSFER_ERROR_FREE_TIER, "downgraded", false);
        loader->requestStop(error);
        return TaskRecordResult::Retryable(error);
    };
    std::unique_ptr<TaskQueueLoader> loader(makeLoader(1));

    try {
        loader->loadAndRunTasks();
        FAIL() << "expected the stop reason to be thrown";
    } catch (TransferException & ex) {
        EXPECT_EQ(ex.key, TRANSFER_ERROR_FREE_TIER);
    }

    EXPECT_EQ(runner.ran.size(), 1u);
    EXPECT_EQ(count(), 2);
    EXPECT_EQ(runner.drainCount.load(), 0);
    EXPECT_FALSE(loader->isRunning());
}

TEST_F(TaskQueueLoaderTest, StopWithoutReasonEndsTheCycleQuietly) {
    enqueue("a1");
    enqueue("a2");
    runner.handler = [](std::shared_ptr<QueuedTransfer>, TaskQueueLoader * loader) {
        loader->requestStop(nullptr);
        return TaskRecordResult::Retryable(QueueBlockedError(QueueStatus::LowBattery));
    };
    std::unique_ptr<TaskQueueLoader> loader(makeLoader(1));
    EXPECT_NO_THROW(loader->loadAndRunTasks());

    EXPECT_EQ(runner.ran.size(), 1u);
    EXPECT_EQ(count(), 2);
    EXPECT_EQ(runner.drainCount.load(), 0);
}

TEST_F(TaskQueueLoaderTest, RerunRequestedMidCyclePicksUpNewRows) {
    enqueue("a1");
    runner.handler = [this](std::shared_ptr<QueuedTransfer> record, TaskQueueLoader * loader) {
        if (record->attachmentId() == "a1") {
            enqueue("late");
            loader->loadAndRunTasks();
        }
        return TaskRecordResult::Success();
    };
    std::unique_ptr<TaskQueueLoader> loader(makeLoader(1));
    loader->loadAndRunTasks();

    EXPECT_EQ(runner.ranCount("late:f"), 1);
    EXPECT_EQ(count(), 0);
    EXPECT_EQ(runner.drainCount.load(), 1);
}

TEST_F(TaskQueueLoaderTest, EmptyQueueReportsTheDrainWithoutRunningAnything) {
    std::unique_ptr<TaskQueueLoader> loader(makeLoader(2));
    loader->loadAndRunTasks();
    EXPECT_TRUE(runner.ran.empty());
    EXPECT_EQ(runner.drainCount.load(), 1);
}
