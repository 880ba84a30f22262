#include "attachsync/backup_attachment_download_manager.hpp"
#include "attachsync/thread_utils.hpp"
#include "attachsync/transfer_eligibility.hpp"
#include "attachsync/transfer_exception.hpp"


BackupAttachmentDownloadManager::BackupAttachmentDownloadManager(AttachmentStore * store, std::shared_ptr<Account> account, BackupRequestManager * requests, AttachmentTransferClient * client, MediaIdDeriver * deriver, ListMediaReconciler * reconciler, RemoteConfig config, DateProvider dateProvider) :
    _store(store),
    _account(account),
    _reconciler(reconciler),
    _config(config),
    _dateProvider(dateProvider),
    _queue(TransferDirection::Download),
    _gate("download", true, false, config.lowBatteryPercent, config.minDiskHeadroomBytes),
    _progress("download"),
    _runner(store, account, requests, client, deriver, &_gate, &_progress, config, dateProvider),
    _loader("download", config.numParallelDownloads, &_queue, &_runner, store, dateProvider),
    _observing(false),
    _drainRequested(false),
    _exiting(false),
    _drainThread(nullptr),
    logger(spdlog::get("logger"))
{
}

BackupAttachmentDownloadManager::~BackupAttachmentDownloadManager() {
    {
        std::lock_guard<std::mutex> lck(_drainMtx);
        _exiting = true;
        _drainCv.notify_all();
    }
    _loader.stop();
    if (_drainThread) {
        _drainThread->join();
        delete _drainThread;
    }
}

QueueStatusGate * BackupAttachmentDownloadManager::gate() {
    return &_gate;
}

TransferProgress * BackupAttachmentDownloadManager::progress() {
    return &_progress;
}

TransferQueueStore * BackupAttachmentDownloadManager::queue() {
    return &_queue;
}

void BackupAttachmentDownloadManager::enqueueIfNeeded(Attachment & attachment, time_t timestamp, AttachmentStoreTransaction & tx) {
    bool optimizeLocalStorage = _settings.optimizeLocalStorage(tx);
    int64_t pending = _settings.totalPendingByteCount(TransferDirection::Download, tx);

    DownloadEligibility eligibility = DownloadEligibility::forAttachment(attachment, timestamp, _dateProvider(), _config, optimizeLocalStorage, pending);
    if (!eligibility.canBeDownloadedAtAll()) {
        return;
    }

    auto existing = _queue.find(QueuedTransfer::KeyFor(attachment.id(), true), tx);

    // Thumbnail-only restores are small enough to leave out of the budget.
    // A record first queued for its thumbnail is counted once fullsize
    // becomes eligible.
    bool needsAccounting = eligibility.canDownloadFullsize() && (existing == nullptr || existing->accountedByteCount() == 0);
    int64_t byteCount = needsAccounting ? attachment.fullsizeByteCount() : 0;

    QueuedTransfer record(_queue.tableName(), attachment.id(), true, eligibility.downloadPriority, timestamp);
    if (existing == nullptr) {
        record.setAccountedByteCount(byteCount);
    }
    auto stored = _queue.enqueue(record, tx);
    if (existing != nullptr && byteCount > 0) {
        stored->setAccountedByteCount(byteCount);
        tx.store()->save(stored.get());
    }
    if (byteCount > 0) {
        _settings.addTotalPendingByteCount(TransferDirection::Download, byteCount, tx);
    }

    tx.addCommitCallback([this]() {
        _gate.setQueueEmpty(false);
    });
}

void BackupAttachmentDownloadManager::restoreAttachmentsIfNeeded() {
    if (_account->aci() == "") {
        logger->info("Skipping attachment restore: account is not registered");
        return;
    }

    _reconciler->queryListMediaIfNeeded();

    int count = 0;
    int64_t pending = 0;
    {
        AttachmentStoreTransaction tx(_store, "downloadDrainCount");
        count = _queue.count(tx);
        pending = _settings.totalPendingByteCount(TransferDirection::Download, tx);
        tx.commit();
    }
    _gate.setQueueEmpty(count == 0);

    QueueStatus status = _gate.currentStatus();
    if (status == QueueStatus::Running) {
        _progress.beginObserving(pending);
        _loader.loadAndRunTasks();
    } else if (QueueStatusIsBlocking(status)) {
        logger->info("Not draining downloads: {}", QueueStatusToString(status));
        _loader.stop();
    }
}

void BackupAttachmentDownloadManager::cancelAll() {
    _loader.stop();
    {
        AttachmentStoreTransaction tx(_store, "downloadCancelAll");
        _queue.removeAll(tx);
        _settings.clearTotalPendingByteCount(TransferDirection::Download, tx);
        tx.commit();
    }
    _progress.didEmptyQueue();
    _gate.didEmptyQueue();
}

void BackupAttachmentDownloadManager::beginObservingIfNeeded() {
    {
        std::lock_guard<std::mutex> lck(_drainMtx);
        if (_observing) {
            return;
        }
        _observing = true;
        _drainThread = new std::thread(&BackupAttachmentDownloadManager::runDrainLoop, this);
    }

    _gate.addObserver([this](QueueStatus status) {
        if (status == QueueStatus::Running) {
            scheduleDrain();
        } else if (QueueStatusIsBlocking(status)) {
            _loader.requestStop(nullptr);
        }
    });

    if (_gate.currentStatus() == QueueStatus::Running) {
        scheduleDrain();
    }
}

void BackupAttachmentDownloadManager::scheduleDrain() {
    std::lock_guard<std::mutex> lck(_drainMtx);
    _drainRequested = true;
    _drainCv.notify_all();
}

void BackupAttachmentDownloadManager::runDrainLoop() {
    SetThreadName("downloadDrain");

    while (true) {
        {
            std::unique_lock<std::mutex> lck(_drainMtx);
            _drainCv.wait(lck, [this]() { return _drainRequested || _exiting; });
            if (_exiting) {
                return;
            }
            _drainRequested = false;
        }

        try {
            restoreAttachmentsIfNeeded();
        } catch (TransferException & ex) {
            logger->error("Attachment restore failed: {} ({})", ex.key, ex.debuginfo);
        } catch (SQLite::Exception & ex) {
            logger->error("Attachment restore failed: {}", ex.what());
        }
    }
}
