/** TaskQueueLoader [AttachSync]
 */

/* LICENSE
* Copyright (C) 2017-2021 Foundry 376.
*
* This program is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef TaskQueueLoader_hpp
#define TaskQueueLoader_hpp

#include <stdio.h>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "spdlog/spdlog.h"

#include "attachsync/attachment_store.hpp"
#include "attachsync/attachment_store_transaction.hpp"
#include "attachsync/models/queued_transfer.hpp"
#include "attachsync/remote_config.hpp"
#include "attachsync/transfer_exception.hpp"

enum class TaskRecordResultType { Success, Cancelled, RetryableError, UnretryableError };

enum class RetryPolicy { None, ExponentialBackoff, RetryAfter };

class TaskRecordResult {
public:
    TaskRecordResultType type;
    std::shared_ptr<TransferException> error;
    RetryPolicy retryPolicy;
    long retryAfterSeconds;

    static TaskRecordResult Success();
    static TaskRecordResult Cancelled();
    static TaskRecordResult Retryable(std::shared_ptr<TransferException> error, RetryPolicy policy = RetryPolicy::None, long retryAfterSeconds = -1);
    static TaskRecordResult Unretryable(std::shared_ptr<TransferException> error);

    bool isRetryable() const;
};

// Persistence the loader drains from. TransferQueueStore is the production
// implementation.
class TaskRecordStore {
public:
    virtual ~TaskRecordStore() {}

    virtual std::vector<std::shared_ptr<QueuedTransfer>> peek(int count, time_t now, AttachmentStoreTransaction & tx) = 0;
    virtual void remove(std::string taskKey, AttachmentStoreTransaction & tx) = 0;
    virtual int count(AttachmentStoreTransaction & tx) = 0;
};

class TaskQueueLoader;

class TaskRecordRunner {
public:
    virtual ~TaskRecordRunner() {}

    // Runs on a worker thread, never inside a transaction.
    virtual TaskRecordResult runTask(std::shared_ptr<QueuedTransfer> record, TaskQueueLoader * loader) = 0;

    // Each of these runs inside the write transaction that records the outcome.
    virtual void didSucceed(std::shared_ptr<QueuedTransfer> record, AttachmentStoreTransaction & tx) = 0;
    virtual void didFail(std::shared_ptr<QueuedTransfer> record, const TaskRecordResult & result, bool isRetryable, AttachmentStoreTransaction & tx) = 0;
    virtual void didCancel(std::shared_ptr<QueuedTransfer> record, AttachmentStoreTransaction & tx) = 0;

    // The cycle ended without a stop and the table is empty.
    virtual void didDrainQueue() = 0;
};

/*
 Drains a TaskRecordStore with at most `maxConcurrentTasks` workers. A single
 call to loadAndRunTasks() is one cycle: it peeks, dispatches and backfills
 until nothing dispatchable remains or a stop is requested.
*/
class TaskQueueLoader {
    std::string _name;
    int _maxConcurrentTasks;
    TaskRecordStore * _store;
    TaskRecordRunner * _runner;
    AttachmentStore * _attachmentStore;
    DateProvider _dateProvider;
    std::shared_ptr<spdlog::logger> logger;

    std::mutex _mtx;
    std::condition_variable _cv;
    bool _running;
    bool _rerunRequested;
    bool _needsPeek;
    bool _stopped;
    std::shared_ptr<TransferException> _stopReason;
    std::set<std::string> _inFlight;
    std::set<std::string> _failedThisCycle;
    std::vector<std::thread::id> _finished;

    void reapFinishedWorkers(std::vector<std::thread> & workers);
    void runOne(std::shared_ptr<QueuedTransfer> record);
    void handleResult(std::shared_ptr<QueuedTransfer> record, const TaskRecordResult & result);

public:
    TaskQueueLoader(std::string name, int maxConcurrentTasks, TaskRecordStore * store, TaskRecordRunner * runner, AttachmentStore * attachmentStore, DateProvider dateProvider);
    ~TaskQueueLoader();

    void loadAndRunTasks();

    void requestStop(std::shared_ptr<TransferException> reason);
    void stop(std::shared_ptr<TransferException> reason = nullptr);

    bool isRunning();
    size_t inFlightCount();
};

#endif /* TaskQueueLoader_hpp */
