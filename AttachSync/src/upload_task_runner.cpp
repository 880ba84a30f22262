#include "attachsync/upload_task_runner.hpp"
#include "attachsync/constants.hpp"
#include "attachsync/transfer_eligibility.hpp"

#include <algorithm>

time_t uploadBackoffSeconds[] = {3, 3, 5, 10, 20, 30, 60, 120, 300, 300};


UploadTaskRunner::UploadTaskRunner(AttachmentStore * store, TransferQueueStore * queue, std::shared_ptr<Account> account, BackupRequestManager * requests, AttachmentTransferClient * client, MediaIdDeriver * deriver, QueueStatusGate * gate, TransferProgress * progress, RemoteConfig config, DateProvider dateProvider) :
    _store(store),
    _queue(queue),
    _account(account),
    _requests(requests),
    _client(client),
    _deriver(deriver),
    _gate(gate),
    _progress(progress),
    _config(config),
    _dateProvider(dateProvider),
    logger(spdlog::get("logger"))
{
}

TaskRecordResult UploadTaskRunner::runTask(std::shared_ptr<QueuedTransfer> record, TaskQueueLoader * loader) {
    QueueStatus status = _gate->currentStatus();
    if (QueueStatusIsBlocking(status)) {
        loader->requestStop(nullptr);
        return TaskRecordResult::Retryable(QueueBlockedError(status));
    }

    std::shared_ptr<Attachment> attachment = nullptr;
    std::string plan;
    std::string uploadEra;
    {
        AttachmentStoreTransaction tx(_store, "uploadRead");
        Query q = Query().equal("id", record->attachmentId());
        attachment = _store->find<Attachment>(q);
        plan = _settings.backupPlan(tx);
        uploadEra = _settings.uploadEra(tx);
        tx.commit();
    }

    if (attachment == nullptr) {
        return TaskRecordResult::Cancelled();
    }
    // We only back up attachments we've downloaded
    if (!attachment->hasStream() || !attachment->hasMediaName()) {
        return TaskRecordResult::Cancelled();
    }
    std::string mediaRootKey = _account->mediaRootKey();
    if (mediaRootKey == "") {
        logger->error("Missing media root key, unable to upload {}", record->id());
        return TaskRecordResult::Cancelled();
    }
    if (!IsEligibleToUpload(*attachment, record->isFullsize(), uploadEra)) {
        return TaskRecordResult::Success();
    }

    std::string mediaName = record->isFullsize() ? attachment->mediaName() : attachment->thumbnailMediaName();
    std::string mediaId = _deriver->mediaId(mediaName, mediaRootKey);

    // An upload and a delete of the same remote object must never race.
    {
        AttachmentStoreTransaction tx(_store, "uploadRemoveOrphan");
        _orphans.removeForMediaId(mediaId, tx);
        tx.commit();
    }

    if (!BackupSettingsStore::IsPaidPlan(plan)) {
        loader->requestStop(nullptr);
        return TaskRecordResult::Retryable(std::make_shared<TransferException>(TRANSFER_ERROR_FREE_TIER, "Backup plan is " + plan, true));
    }

    std::string aci = _account->aci();
    if (aci == "") {
        auto error = std::make_shared<TransferException>(TRANSFER_ERROR_NOT_REGISTERED, "No local aci", true);
        loader->requestStop(error);
        return TaskRecordResult::Retryable(error);
    }

    BackupServiceAuth auth;
    try {
        auth = _requests->fetchBackupServiceAuth(MEDIA_TIER_AUTH_KEY, aci, false);
    } catch (TransferException & ex) {
        auto error = std::make_shared<TransferException>(ex);
        loader->requestStop(error);
        return TaskRecordResult::Retryable(error);
    }
    if (!auth.isPaid()) {
        // every upload would fail with a free tier credential
        loader->requestStop(nullptr);
        return TaskRecordResult::Retryable(std::make_shared<TransferException>(TRANSFER_ERROR_FREE_TIER, "Credential is " + auth.level, true));
    }

    TransferDescriptor descriptor = descriptorFor(*attachment, record->isFullsize(), mediaId, auth);
    TransferProgressCallback progress = _progress->willBeginTransfer(record->id());

    TransferReceipt receipt;
    try {
        receipt = _client->upload(record->attachmentId(), record->priority(), descriptor, progress);
    } catch (TransferException & ex) {
        logger->warn("Upload of {} failed: {} ({})", record->id(), ex.key, ex.debuginfo);
        TaskRecordResult result = resultForError(record, ex, descriptor, loader);
        _progress->didFinishTransfer(record->id(), result.type == TaskRecordResultType::Success ? record->accountedByteCount() : 0);
        return result;
    }

    recordUpload(record, mediaId, uploadEra, receipt);
    _progress->didFinishTransfer(record->id(), record->accountedByteCount());
    return TaskRecordResult::Success();
}

TransferDescriptor UploadTaskRunner::descriptorFor(Attachment & attachment, bool fullsize, std::string mediaId, const BackupServiceAuth & auth) {
    TransferDescriptor descriptor;
    descriptor.tier = fullsize ? TransferTier::Media : TransferTier::MediaThumbnail;
    descriptor.mediaName = fullsize ? attachment.mediaName() : attachment.thumbnailMediaName();
    descriptor.mediaId = mediaId;
    descriptor.cdnKey = "";
    descriptor.cdnNumber = -1;
    descriptor.authorization = "Bearer " + auth.token;
    descriptor.copyFromTransitTier = false;

    if (fullsize) {
        descriptor.localPath = attachment.stream().value("localPath", "");
        descriptor.byteCount = attachment.fullsizeByteCount();
        descriptor.digest = attachment.fullsizeDigest();

        // A recent transit tier upload can be copied server-side instead of
        // sending the bytes again.
        if (attachment.hasTransitTier()) {
            time_t age = _dateProvider() - attachment.transitTierUploadTimestamp();
            if (age <= _config.transitTierRetentionSec) {
                descriptor.copyFromTransitTier = true;
                descriptor.cdnKey = attachment.transitTier().value("cdnKey", "");
                descriptor.cdnNumber = attachment.transitTier().value("cdnNumber", -1);
            }
        }
    } else {
        descriptor.localPath = attachment.hasThumbnailStream() ? attachment.thumbnailStream().value("localPath", "") : "";
        descriptor.byteCount = attachment.hasThumbnailStream() ? attachment.thumbnailStream().value("byteCount", (int64_t)0) : 0;
        descriptor.digest = "";
    }
    return descriptor;
}

TaskRecordResult UploadTaskRunner::resultForError(std::shared_ptr<QueuedTransfer> record, TransferException & ex, const TransferDescriptor & descriptor, TaskQueueLoader * loader) {
    auto error = std::make_shared<TransferException>(ex);

    if (descriptor.copyFromTransitTier && ex.isSourceNotFound()) {
        // The transit upload expired. Reupload the local bytes next time and
        // leave the retry count alone.
        AttachmentStoreTransaction tx(_store, "uploadClearTransitTier");
        Query q = Query().equal("id", record->attachmentId());
        auto attachment = _store->find<Attachment>(q);
        if (attachment != nullptr) {
            attachment->clearTransitTier();
            _store->save(attachment.get());
        }
        tx.commit();
        return TaskRecordResult::Retryable(error);
    }

    if (ex.isForbidden()) {
        // We may have lost write access to the media tier. Check once with a
        // fresh credential before treating this like any other error.
        bool paid = false;
        try {
            paid = _requests->fetchBackupServiceAuth(MEDIA_TIER_AUTH_KEY, _account->aci(), true).isPaid();
        } catch (TransferException & authEx) {
            logger->warn("Unable to re-verify backup credential: {}", authEx.key);
        }
        if (!paid) {
            loader->requestStop(nullptr);
            return TaskRecordResult::Retryable(std::make_shared<TransferException>(TRANSFER_ERROR_FREE_TIER, "Media tier upload forbidden", true));
        }
    }

    if (ex.isRateLimited()) {
        if (ex.retryAfter > 0) {
            return TaskRecordResult::Retryable(error, RetryPolicy::RetryAfter, ex.retryAfter);
        }
        return TaskRecordResult::Retryable(error, RetryPolicy::ExponentialBackoff);
    }

    if (ex.isOffline()) {
        // Only back off when we think we're connected. Otherwise the gate
        // stops the queue and the record should run again as soon as it resumes.
        if (_gate->currentStatus() == QueueStatus::Running) {
            return TaskRecordResult::Retryable(error, RetryPolicy::ExponentialBackoff);
        }
        return TaskRecordResult::Retryable(error);
    }

    if (record->isFullsize()) {
        if (ex.isMissingFile()) {
            logger->error("Missing attachment file for {}; skipping", record->id());
            return TaskRecordResult::Success();
        }
        // stop the queue to prevent a thundering herd; we'll retry on the next drain
        logger->error("Unknown error uploading {}; stopping the queue", record->id());
        loader->requestStop(nullptr);
        return TaskRecordResult::Retryable(error);
    }

    logger->error("Failed to upload thumbnail {}; proceeding", record->id());
    return TaskRecordResult::Success();
}

void UploadTaskRunner::recordUpload(std::shared_ptr<QueuedTransfer> record, std::string mediaId, std::string uploadEra, const TransferReceipt & receipt) {
    AttachmentStoreTransaction tx(_store, "uploadRecord");
    Query q = Query().equal("id", record->attachmentId());
    auto attachment = _store->find<Attachment>(q);
    if (attachment == nullptr) {
        tx.commit();
        return;
    }

    if (record->isFullsize()) {
        int previous = attachment->mediaTierCdnNumber();
        int64_t byteCount = attachment->fullsizeByteCount();
        std::string digest = receipt.digest != "" ? receipt.digest : attachment->fullsizeDigest();
        attachment->markUploadedToMediaTier(receipt.cdnNumber, byteCount, digest, uploadEra);

        if (previous >= 0 && previous != receipt.cdnNumber) {
            OrphanedAttachment orphan(mediaId, previous, attachment->mediaName(), ORPHAN_TYPE_FULLSIZE);
            _orphans.insert(orphan, tx);
        }
    } else {
        int previous = attachment->thumbnailMediaTierCdnNumber();
        attachment->markThumbnailUploadedToMediaTier(receipt.cdnNumber, uploadEra);

        if (previous >= 0 && previous != receipt.cdnNumber) {
            OrphanedAttachment orphan(mediaId, previous, attachment->thumbnailMediaName(), ORPHAN_TYPE_THUMBNAIL);
            _orphans.insert(orphan, tx);
        }
    }

    _store->save(attachment.get());
    tx.commit();
}

void UploadTaskRunner::didSucceed(std::shared_ptr<QueuedTransfer> record, AttachmentStoreTransaction & tx) {
    logger->info("Finished backing up attachment {}", record->id());
    _settings.addTotalPendingByteCount(TransferDirection::Upload, -record->accountedByteCount(), tx);
}

void UploadTaskRunner::didFail(std::shared_ptr<QueuedTransfer> record, const TaskRecordResult & result, bool isRetryable, AttachmentStoreTransaction & tx) {
    logger->warn("Failed backing up attachment {}, isRetryable: {}, error: {}", record->id(), isRetryable, result.error ? result.error->key : "unknown");

    if (!isRetryable) {
        _settings.addTotalPendingByteCount(TransferDirection::Upload, -record->accountedByteCount(), tx);
        return;
    }

    if (result.retryPolicy == RetryPolicy::ExponentialBackoff) {
        int numRetries = record->numRetries() + 1;
        time_t delay = uploadBackoffSeconds[std::min(numRetries - 1, 9)];
        _queue->updateRetryMetadata(record->id(), numRetries, _dateProvider() + delay, tx);

    } else if (result.retryPolicy == RetryPolicy::RetryAfter) {
        _queue->updateRetryMetadata(record->id(), record->numRetries(), _dateProvider() + (time_t)result.retryAfterSeconds, tx);
    }
}

void UploadTaskRunner::didCancel(std::shared_ptr<QueuedTransfer> record, AttachmentStoreTransaction & tx) {
    logger->warn("Cancelled backing up attachment {}", record->id());
    _settings.addTotalPendingByteCount(TransferDirection::Upload, -record->accountedByteCount(), tx);
}

void UploadTaskRunner::didDrainQueue() {
    {
        AttachmentStoreTransaction tx(_store, "uploadDrained");
        _settings.clearTotalPendingByteCount(TransferDirection::Upload, tx);
        tx.commit();
    }
    _progress->didEmptyQueue();
    _gate->didEmptyQueue();
}
