#include "attachsync/backup_attachment_upload_manager.hpp"
#include "attachsync/constants.hpp"
#include "attachsync/thread_utils.hpp"
#include "attachsync/transfer_eligibility.hpp"
#include "attachsync/transfer_exception.hpp"


BackupAttachmentUploadManager::BackupAttachmentUploadManager(AttachmentStore * store, std::shared_ptr<Account> account, BackupRequestManager * requests, AttachmentTransferClient * client, MediaIdDeriver * deriver, ListMediaReconciler * reconciler, RemoteConfig config, DateProvider dateProvider) :
    _store(store),
    _account(account),
    _requests(requests),
    _reconciler(reconciler),
    _config(config),
    _dateProvider(dateProvider),
    _queue(TransferDirection::Upload),
    _gate("upload", false, true, config.lowBatteryPercent, config.minDiskHeadroomBytes),
    _progress("upload"),
    _runner(store, &_queue, account, requests, client, deriver, &_gate, &_progress, config, dateProvider),
    _loader("upload", config.numParallelUploads, &_queue, &_runner, store, dateProvider),
    _observing(false),
    _drainRequested(false),
    _exiting(false),
    _drainThread(nullptr),
    logger(spdlog::get("logger"))
{
}

BackupAttachmentUploadManager::~BackupAttachmentUploadManager() {
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

QueueStatusGate * BackupAttachmentUploadManager::gate() {
    return &_gate;
}

TransferProgress * BackupAttachmentUploadManager::progress() {
    return &_progress;
}

TransferQueueStore * BackupAttachmentUploadManager::queue() {
    return &_queue;
}

void BackupAttachmentUploadManager::enqueueIfNeeded(Attachment & attachment, time_t timestamp, AttachmentStoreTransaction & tx) {
    if (!_account->isPrimaryDevice()) {
        return;
    }
    if (!BackupSettingsStore::IsPaidPlan(_settings.backupPlan(tx))) {
        return;
    }

    std::string uploadEra = _settings.uploadEra(tx);
    bool enqueued = false;

    if (IsEligibleToUpload(attachment, true, uploadEra)) {
        enqueueRecord(attachment.id(), true, attachment.fullsizeByteCount(), timestamp, tx);
        enqueued = true;
    }
    if (IsEligibleToUpload(attachment, false, uploadEra)) {
        int64_t thumbnailByteCount = 0;
        if (attachment.hasThumbnailStream()) {
            thumbnailByteCount = attachment.thumbnailStream().value("byteCount", (int64_t)0);
        }
        enqueueRecord(attachment.id(), false, thumbnailByteCount, timestamp, tx);
        enqueued = true;
    }

    if (enqueued) {
        tx.addCommitCallback([this]() {
            _gate.setQueueEmpty(false);
        });
    }
}

void BackupAttachmentUploadManager::enqueueRecord(std::string attachmentId, bool isFullsize, int64_t byteCount, time_t timestamp, AttachmentStoreTransaction & tx) {
    auto existing = _queue.find(QueuedTransfer::KeyFor(attachmentId, isFullsize), tx);

    QueuedTransfer record(_queue.tableName(), attachmentId, isFullsize, TRANSFER_PRIORITY_DEFAULT, timestamp);
    if (existing == nullptr) {
        // bytes already counted for an existing record are not counted again
        record.setAccountedByteCount(byteCount);
        _settings.addTotalPendingByteCount(TransferDirection::Upload, byteCount, tx);
    }
    _queue.enqueue(record, tx);
}

void BackupAttachmentUploadManager::backUpAllAttachments() {
    if (!_account->isPrimaryDevice()) {
        return;
    }
    std::string aci = _account->aci();
    if (aci == "" || _account->mediaRootKey() == "") {
        logger->info("Skipping attachment backup: account is not registered");
        return;
    }

    std::string plan;
    bool onCellular = false;
    int64_t pending = 0;
    int count = 0;
    {
        AttachmentStoreTransaction tx(_store, "uploadDrainRead");
        plan = _settings.backupPlan(tx);
        onCellular = _settings.backupsOnCellular(tx);
        tx.commit();
    }
    if (!BackupSettingsStore::IsPaidPlan(plan)) {
        logger->info("Skipping attachment backup: plan is {}", plan);
        return;
    }
    _gate.setWifiRequired(!onCellular);

    BackupServiceAuth auth;
    try {
        auth = _requests->fetchBackupServiceAuth(MEDIA_TIER_AUTH_KEY, aci, true);
    } catch (TransferException & ex) {
        if (ex.key == TRANSFER_ERROR_NO_BACKUP_ID) {
            logger->info("Skipping attachment backup: no backup id registered");
            return;
        }
        throw;
    }
    if (!auth.isPaid()) {
        logger->info("Stopping attachment backup: credential is {}", auth.level);
        _loader.stop();
        return;
    }

    _reconciler->queryListMediaIfNeeded();

    {
        AttachmentStoreTransaction tx(_store, "uploadDrainCount");
        count = _queue.count(tx);
        pending = _settings.totalPendingByteCount(TransferDirection::Upload, tx);
        tx.commit();
    }
    _gate.setQueueEmpty(count == 0);

    QueueStatus status = _gate.currentStatus();
    if (status == QueueStatus::Running) {
        _progress.beginObserving(pending);
        _loader.loadAndRunTasks();
    } else if (QueueStatusIsBlocking(status)) {
        logger->info("Not draining uploads: {}", QueueStatusToString(status));
        _loader.stop();
    }
}

void BackupAttachmentUploadManager::cancelAll() {
    _loader.stop();
    {
        AttachmentStoreTransaction tx(_store, "uploadCancelAll");
        _queue.removeAll(tx);
        _settings.clearTotalPendingByteCount(TransferDirection::Upload, tx);
        tx.commit();
    }
    _progress.didEmptyQueue();
    _gate.didEmptyQueue();
}

void BackupAttachmentUploadManager::beginObservingIfNeeded() {
    {
        std::lock_guard<std::mutex> lck(_drainMtx);
        if (_observing) {
            return;
        }
        _observing = true;
        _drainThread = new std::thread(&BackupAttachmentUploadManager::runDrainLoop, this);
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

void BackupAttachmentUploadManager::scheduleDrain() {
    std::lock_guard<std::mutex> lck(_drainMtx);
    _drainRequested = true;
    _drainCv.notify_all();
}

void BackupAttachmentUploadManager::runDrainLoop() {
    SetThreadName("uploadDrain");

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
            backUpAllAttachments();
        } catch (TransferException & ex) {
            logger->error("Attachment backup failed: {} ({})", ex.key, ex.debuginfo);
        } catch (SQLite::Exception & ex) {
            logger->error("Attachment backup failed: {}", ex.what());
        }
    }
}
