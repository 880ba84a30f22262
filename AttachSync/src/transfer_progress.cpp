#include "attachsync/transfer_progress.hpp"

#include <algorithm>


TransferProgress::TransferProgress(std::string name) :
    _name(name), _total(0), _finished(0)
{
}

std::string TransferProgress::name() {
    return _name;
}

int64_t TransferProgress::completedLocked() {
    int64_t completed = _finished;
    for (const auto & it : _running) {
        completed += it.second;
    }
    return completed;
}

void TransferProgress::notify(std::unique_lock<std::mutex> & lck) {
    int64_t completed = completedLocked();
    int64_t total = std::max(_total, completed);
    std::vector<TransferProgressObserver> observers = _observers;
    lck.unlock();

    for (auto & observer : observers) {
        observer(completed, total);
    }
}

void TransferProgress::beginObserving(int64_t totalByteCount) {
    std::unique_lock<std::mutex> lck(_mtx);
    _total = std::max(totalByteCount, completedLocked());
    notify(lck);
}

TransferProgressCallback TransferProgress::willBeginTransfer(std::string key) {
    {
        std::lock_guard<std::mutex> lck(_mtx);
        _running[key] = 0;
    }
    return [this, key](int64_t bytes) {
        std::unique_lock<std::mutex> lck(_mtx);
        if (!_running.count(key)) {
            return;
        }
        _running[key] = bytes;
        notify(lck);
    };
}

void TransferProgress::didFinishTransfer(std::string key, int64_t byteCount) {
    std::unique_lock<std::mutex> lck(_mtx);
    _running.erase(key);
    _finished += byteCount;
    notify(lck);
}

void TransferProgress::didEmptyQueue() {
    std::unique_lock<std::mutex> lck(_mtx);
    _running.clear();
    _finished = 0;
    _total = 0;
    notify(lck);
}

int64_t TransferProgress::completedByteCount() {
    std::lock_guard<std::mutex> lck(_mtx);
    return completedLocked();
}

int64_t TransferProgress::totalByteCount() {
    std::lock_guard<std::mutex> lck(_mtx);
    return std::max(_total, completedLocked());
}

void TransferProgress::addObserver(TransferProgressObserver observer) {
    std::lock_guard<std::mutex> lck(_mtx);
    _observers.push_back(observer);
}
