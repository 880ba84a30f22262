#include "attachsync/attachment_store_transaction.hpp"

#include "spdlog/spdlog.h"

AttachmentStoreTransaction::AttachmentStoreTransaction(AttachmentStore * store, std::string nameHint) :
    mStore(store), mLock(store->mutex(), std::defer_lock), mCommited(false), mStart(std::chrono::system_clock::now()), mBegan(std::chrono::system_clock::now()), mNameHint(nameHint)
{
    mLock.lock();
    mStore->beginTransaction();
    mBegan = std::chrono::system_clock::now();
}

AttachmentStoreTransaction::~AttachmentStoreTransaction() noexcept // nothrow
{
    if (false == mCommited) {
        try {
            mStore->rollbackTransaction();
        } catch (SQLite::Exception & ex) {
            // Never throw an exception in a destructor: error if
            // already rollbacked, but no harm is caused by this.
            spdlog::get("logger")->debug("Rollback of {} failed: {}", mNameHint, ex.what());
        }
    }
}

void AttachmentStoreTransaction::commit()
{
    if (false == mCommited) {
        mStore->commitTransaction();
        mCommited = true;

        auto now = std::chrono::system_clock::now();
        auto elapsed = now - mStart;
        long long milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
        if (milliseconds > 80) { // 80ms
            long long waiting = std::chrono::duration_cast<std::chrono::milliseconds>(mBegan - mStart).count();
            spdlog::get("logger")->warn("[SLOW] Transaction={} > 80ms ({}ms, {} waiting to aquire)", mNameHint, milliseconds, waiting);
        }

        mLock.unlock();

        std::vector<std::function<void()>> callbacks;
        callbacks.swap(mCommitCallbacks);
        for (auto & callback : callbacks) {
            callback();
        }

    } else {
        throw SQLite::Exception("Transaction already commited.");
    }
}

void AttachmentStoreTransaction::addCommitCallback(std::function<void()> callback)
{
    mCommitCallbacks.push_back(callback);
}

AttachmentStore * AttachmentStoreTransaction::store()
{
    return mStore;
}
