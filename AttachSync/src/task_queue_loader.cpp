#include "attachsync/task_queue_loader.hpp"
#include "attachsync/thread_utils.hpp"

#include <algorithm>

// TaskRecordResult

TaskRecordResult TaskRecordResult::Success() {
    return TaskRecordResult{TaskRecordResultType::Success, nullptr, RetryPolicy::None, -1};
}

TaskRecordResult TaskRecordResult::Cancelled() {
    return TaskRecordResult{TaskRecordResultType::Cancelled, nullptr, RetryPolicy::None, -1};
}

TaskRecordResult TaskRecordResult::Retryable(std::shared_ptr<TransferException> error, RetryPolicy policy, long retryAfterSeconds) {
    return TaskRecordResult{TaskRecordResultType::RetryableError, error, policy, retryAfterSeconds};
}

TaskRecordResult TaskRecordResult::Unretryable(std::shared_ptr<TransferException> error) {
    return TaskRecordResult{TaskRecordResultType::UnretryableError, error, RetryPolicy::None, -1};
}

bool TaskRecordResult::isRetryable() const {
    return type == TaskRecordResultType::RetryableError;
}

// TaskQueueLoader

TaskQueueLoader::TaskQueueLoader(std::string name, int maxConcurrentTasks, TaskRecordStore * store, TaskRecordRunner * runner, AttachmentStore * attachmentStore, DateProvider dateProvider) :
    _name(name),
    _maxConcurrentTasks(std::max(1, maxConcurrentTasks)),
    _store(store),
    _runner(runner),
    _attachmentStore(attachmentStore),
    _dateProvider(dateProvider),
    logger(spdlog::get("logger")),
    _running(false),
    _rerunRequested(false),
    _needsPeek(false),
    _stopped(false),
    _stopReason(nullptr)
{
}

TaskQueueLoader::~TaskQueueLoader() {
    stop();
    std::unique_lock<std::mutex> lck(_mtx);
    _cv.wait(lck, [this]() { return !_running; });
}

void TaskQueueLoader::loadAndRunTasks() {
    {
        std::lock_guard<std::mutex> lck(_mtx);
        if (_running) {
            // the cycle in progress will peek again before it finishes
            _rerunRequested = true;
            _cv.notify_all();
            return;
        }
        _running = true;
        _rerunRequested = false;
        _needsPeek = true;
        _stopped = false;
        _stopReason = nullptr;
        _failedThisCycle.clear();
        _finished.clear();
    }

    logger->info("[{}] Starting drain (max {} concurrent)", _name, _maxConcurrentTasks);

    std::vector<std::thread> workers;
    bool stopped = false;
    std::shared_ptr<TransferException> stopReason = nullptr;

    while (true) {
        reapFinishedWorkers(workers);

        std::unique_lock<std::mutex> lck(_mtx);

        if (_stopped) {
            _cv.wait(lck, [this]() { return _inFlight.empty(); });
            stopped = true;
            stopReason = _stopReason;
            _running = false;
            break;
        }
        if (!_needsPeek && !_rerunRequested) {
            if (_inFlight.empty()) {
                _running = false;
                break;
            }
            _cv.wait(lck);
            continue;
        }
        if ((int)_inFlight.size() >= _maxConcurrentTasks) {
            _cv.wait(lck);
            continue;
        }

        _needsPeek = false;
        _rerunRequested = false;

        // Keys running now, or that failed earlier in this cycle, can show up
        // in the peek. Ask for enough rows to fill every free slot anyway.
        std::set<std::string> exclude = _inFlight;
        exclude.insert(_failedThisCycle.begin(), _failedThisCycle.end());
        int available = _maxConcurrentTasks - (int)_inFlight.size();
        lck.unlock();

        std::vector<std::shared_ptr<QueuedTransfer>> records;
        try {
            AttachmentStoreTransaction tx(_attachmentStore, _name + "Peek");
            records = _store->peek(available + (int)exclude.size(), _dateProvider(), tx);
            tx.commit();
        } catch (SQLite::Exception & ex) {
            logger->error("[{}] Unable to peek queued transfers: {}", _name, ex.what());
            requestStop(std::make_shared<TransferException>("database", ex.what(), false));
            continue;
        }

        lck.lock();
        if (_stopped) {
            continue;
        }

        int dispatched = 0;
        for (auto & record : records) {
            if (dispatched >= available) {
                break;
            }
            std::string key = record->id();
            if (exclude.count(key) || _inFlight.count(key) || _failedThisCycle.count(key)) {
                continue;
            }
            _inFlight.insert(key);
            workers.push_back(std::thread(&TaskQueueLoader::runOne, this, record));
            dispatched++;
        }

        // A full batch means more rows may be waiting. Otherwise the next peek
        // happens once a task finishes.
        if (dispatched > 0 && dispatched == available) {
            _needsPeek = true;
        }
    }

    for (auto & worker : workers) {
        worker.join();
    }
    {
        std::lock_guard<std::mutex> lck(_mtx);
        _finished.clear();
        _cv.notify_all();
    }

    if (stopped) {
        logger->info("[{}] Drain stopped{}", _name, stopReason ? (": " + stopReason->key) : "");
        if (stopReason) {
            throw *stopReason;
        }
        return;
    }

    int remaining = 0;
    {
        AttachmentStoreTransaction tx(_attachmentStore, _name + "Count");
        remaining = _store->count(tx);
        tx.commit();
    }

    if (remaining == 0) {
        logger->info("[{}] Queue drained", _name);
        _runner->didDrainQueue();
    } else {
        logger->info("[{}] Drain finished with {} deferred tasks", _name, remaining);
    }
}

void TaskQueueLoader::reapFinishedWorkers(std::vector<std::thread> & workers) {
    std::vector<std::thread::id> finished;
    {
        std::lock_guard<std::mutex> lck(_mtx);
        finished.swap(_finished);
    }
    for (auto & id : finished) {
        for (auto it = workers.begin(); it != workers.end(); it++) {
            if (it->get_id() == id) {
                it->join();
                workers.erase(it);
                break;
            }
        }
    }
}

void TaskQueueLoader::runOne(std::shared_ptr<QueuedTransfer> record) {
    SetThreadName(_name.c_str());

    TaskRecordResult result = TaskRecordResult::Success();
    try {
        result = _runner->runTask(record, this);
    } catch (TransferException & ex) {
        logger->error("[{}] Task {} threw {}: {}", _name, record->id(), ex.key, ex.debuginfo);
        result = TaskRecordResult::Unretryable(std::make_shared<TransferException>(ex));
    } catch (std::exception & ex) {
        logger->error("[{}] Task {} threw: {}", _name, record->id(), ex.what());
        result = TaskRecordResult::Unretryable(std::make_shared<TransferException>(TRANSFER_ERROR_UNKNOWN, ex.what(), false));
    }

    bool recorded = true;
    try {
        handleResult(record, result);
    } catch (SQLite::Exception & ex) {
        logger->error("[{}] Unable to record the result of {}: {}", _name, record->id(), ex.what());
        recorded = false;
    }

    std::lock_guard<std::mutex> lck(_mtx);
    _inFlight.erase(record->id());
    if (result.isRetryable() || !recorded) {
        _failedThisCycle.insert(record->id());
    }
    _finished.push_back(std::this_thread::get_id());
    _needsPeek = true;
    _cv.notify_all();
}

void TaskQueueLoader::handleResult(std::shared_ptr<QueuedTransfer> record, const TaskRecordResult & result) {
    AttachmentStoreTransaction tx(_attachmentStore, _name + "Result");

    switch (result.type) {
        case TaskRecordResultType::Success:
            _store->remove(record->id(), tx);
            _runner->didSucceed(record, tx);
            break;
        case TaskRecordResultType::UnretryableError:
            logger->warn("[{}] Dropping {}: {}", _name, record->id(), result.error ? result.error->key : "unknown");
            _store->remove(record->id(), tx);
            _runner->didFail(record, result, false, tx);
            break;
        case TaskRecordResultType::RetryableError:
            logger->info("[{}] Will retry {}: {}", _name, record->id(), result.error ? result.error->key : "unknown");
            _runner->didFail(record, result, true, tx);
            break;
        case TaskRecordResultType::Cancelled:
            _store->remove(record->id(), tx);
            _runner->didCancel(record, tx);
            break;
    }

    tx.commit();
}

void TaskQueueLoader::requestStop(std::shared_ptr<TransferException> reason) {
    std::lock_guard<std::mutex> lck(_mtx);
    if (!_stopped) {
        _stopped = true;
        _stopReason = reason;
    } else if (!_stopReason && reason) {
        _stopReason = reason;
    }
    _cv.notify_all();
}

void TaskQueueLoader::stop(std::shared_ptr<TransferException> reason) {
    requestStop(reason);
    std::unique_lock<std::mutex> lck(_mtx);
    _cv.wait(lck, [this]() { return _inFlight.empty(); });
}

bool TaskQueueLoader::isRunning() {
    std::lock_guard<std::mutex> lck(_mtx);
    return _running;
}

size_t TaskQueueLoader::inFlightCount() {
    std::lock_guard<std::mutex> lck(_mtx);
    return _inFlight.size();
}
