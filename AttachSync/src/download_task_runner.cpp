#include "attachsync/download_task_runner.hpp"
#include "attachsync/constants.hpp"
#include "attachsync/transfer_eligibility.hpp"

#include <math.h>
#include <algorithm>


int64_t PaddedByteCount(int64_t unpaddedByteCount) {
    if (unpaddedByteCount <= 0) {
        return 0;
    }
    double exponent = ceil(log((double)unpaddedByteCount) / log(1.05));
    return std::max((int64_t)541, (int64_t)floor(pow(1.05, exponent)));
}

DownloadTaskRunner::DownloadTaskRunner(AttachmentStore * store, std::shared_ptr<Account> account, BackupRequestManager * requests, AttachmentTransferClient * client, MediaIdDeriver * deriver, QueueStatusGate * gate, TransferProgress * progress, RemoteConfig config, DateProvider dateProvider) :
    _store(store),
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

TaskRecordResult DownloadTaskRunner::runTask(std::shared_ptr<QueuedTransfer> record, TaskQueueLoader * loader) {
    QueueStatus status = _gate->currentStatus();
    if (QueueStatusIsBlocking(status)) {
        loader->requestStop(nullptr);
        return TaskRecordResult::Retryable(QueueBlockedError(status));
    }

    std::shared_ptr<Attachment> attachment = nullptr;
    DownloadEligibility eligibility;
    std::string bandwidthPreference;
    {
        AttachmentStoreTransaction tx(_store, "downloadRead");
        Query q = Query().equal("id", record->attachmentId());
        attachment = _store->find<Attachment>(q);
        if (attachment != nullptr) {
            // This item's bytes were admitted to the budget when it was enqueued.
            eligibility = DownloadEligibility::forAttachment(*attachment, record->timestamp(), _dateProvider(), _config, _settings.optimizeLocalStorage(tx), 0);
        }
        bandwidthPreference = _settings.mediaBandwidthPreference(tx);
        tx.commit();
    }

    if (attachment == nullptr || !eligibility.canBeDownloadedAtAll()) {
        return TaskRecordResult::Cancelled();
    }

    // The transit tier is always permitted. The media tier needs wifi unless
    // the user allowed cellular.
    Connectivity connectivity = _gate->signals().connectivity;
    bool mediaTierPermitted = (connectivity == Connectivity::Wifi) || (connectivity == Connectivity::Cellular && bandwidthPreference == BANDWIDTH_WIFI_AND_CELLULAR);

    bool tryMediaTier = eligibility.canDownloadMediaTierFullsize && mediaTierPermitted;
    bool tryTransitTier = eligibility.canDownloadTransitTierFullsize;
    bool tryThumbnail = eligibility.canDownloadThumbnail && mediaTierPermitted;

    if (!tryMediaTier && !tryTransitTier && !tryThumbnail) {
        loader->requestStop(nullptr);
        return TaskRecordResult::Retryable(std::make_shared<TransferException>(TRANSFER_ERROR_BANDWIDTH, "No eligible source is permitted on " + ConnectivityToString(connectivity), true));
    }

    int64_t fullsizeByteCountForProgress = PaddedByteCount(attachment->fullsizeByteCount());
    bool didDownload = false;
    // The earliest error wins; later fallback errors are dropped.
    std::shared_ptr<TransferException> downloadError = nullptr;

    if (tryMediaTier) {
        try {
            TransferReceipt receipt = downloadFrom(TransferTier::Media, record, *attachment, eligibility.downloadPriority);
            recordDownload(record, TransferTier::Media, receipt);
            _progress->didFinishTransfer(record->id(), fullsizeByteCountForProgress);
            didDownload = true;
        } catch (TransferException & ex) {
            logger->warn("Media tier download of {} failed: {}", record->id(), ex.key);
            _progress->didFinishTransfer(record->id(), 0);
            recordMediaTierAttempt(record);
            downloadError = std::make_shared<TransferException>(ex);
        }
    }

    if (!didDownload && tryTransitTier) {
        try {
            TransferReceipt receipt = downloadFrom(TransferTier::Transit, record, *attachment, eligibility.downloadPriority);
            recordDownload(record, TransferTier::Transit, receipt);
            _progress->didFinishTransfer(record->id(), fullsizeByteCountForProgress);
            didDownload = true;
        } catch (TransferException & ex) {
            logger->warn("Transit tier download of {} failed: {}", record->id(), ex.key);
            _progress->didFinishTransfer(record->id(), 0);
            if (!downloadError) {
                downloadError = std::make_shared<TransferException>(ex);
            }
        }
    }

    if (!didDownload && tryThumbnail) {
        try {
            TransferReceipt receipt = downloadFrom(TransferTier::MediaThumbnail, record, *attachment, eligibility.downloadPriority);
            recordDownload(record, TransferTier::MediaThumbnail, receipt);
            _progress->didFinishTransfer(record->id(), 0);
            didDownload = true;
        } catch (TransferException & ex) {
            logger->warn("Thumbnail download of {} failed: {}", record->id(), ex.key);
            if (!downloadError) {
                downloadError = std::make_shared<TransferException>(ex);
            }
        }
    }

    if (!didDownload) {
        loader->requestStop(nullptr);
        return TaskRecordResult::Unretryable(downloadError);
    }
    return TaskRecordResult::Success();
}

TransferReceipt DownloadTaskRunner::downloadFrom(TransferTier tier, std::shared_ptr<QueuedTransfer> record, Attachment & attachment, int priority) {
    TransferDescriptor source;
    source.tier = tier;
    source.mediaName = "";
    source.mediaId = "";
    source.cdnKey = "";
    source.cdnNumber = -1;
    source.localPath = "";
    source.byteCount = attachment.fullsizeByteCount();
    source.digest = attachment.fullsizeDigest();
    source.copyFromTransitTier = false;
    source.authorization = "";

    if (tier == TransferTier::Transit) {
        source.cdnKey = attachment.transitTier().value("cdnKey", "");
        source.cdnNumber = attachment.transitTier().value("cdnNumber", -1);

    } else {
        std::string mediaRootKey = _account->mediaRootKey();
        if (mediaRootKey == "") {
            throw TransferException(TRANSFER_ERROR_UNKNOWN, "Missing media root key", false);
        }
        BackupServiceAuth auth = _requests->fetchBackupServiceAuth(MEDIA_TIER_AUTH_KEY, _account->aci(), false);
        source.authorization = "Bearer " + auth.token;

        if (tier == TransferTier::Media) {
            source.mediaName = attachment.mediaName();
            source.cdnNumber = attachment.mediaTierCdnNumber();
        } else {
            source.mediaName = attachment.thumbnailMediaName();
            source.cdnNumber = attachment.thumbnailMediaTierCdnNumber();
            source.byteCount = 0;
            source.digest = "";
        }
        source.mediaId = _deriver->mediaId(source.mediaName, mediaRootKey);
    }

    TransferProgressCallback progress = nullptr;
    if (tier != TransferTier::MediaThumbnail) {
        progress = _progress->willBeginTransfer(record->id());
    }
    return _client->download(record->attachmentId(), priority, source, progress);
}

void DownloadTaskRunner::recordDownload(std::shared_ptr<QueuedTransfer> record, TransferTier tier, const TransferReceipt & receipt) {
    AttachmentStoreTransaction tx(_store, "downloadRecord");
    Query q = Query().equal("id", record->attachmentId());
    auto attachment = _store->find<Attachment>(q);
    if (attachment == nullptr) {
        tx.commit();
        return;
    }

    if (tier == TransferTier::MediaThumbnail) {
        attachment->setThumbnailStream(receipt.byteCount, receipt.localPath);
    } else {
        int64_t byteCount = receipt.byteCount > 0 ? receipt.byteCount : attachment->fullsizeByteCount();
        std::string digest = receipt.digest != "" ? receipt.digest : attachment->fullsizeDigest();
        attachment->setStream(byteCount, digest, receipt.localPath);
        if (tier == TransferTier::Media) {
            attachment->setMediaTierLastDownloadAttempt(_dateProvider());
        }
    }

    _store->save(attachment.get());
    tx.commit();
}

void DownloadTaskRunner::recordMediaTierAttempt(std::shared_ptr<QueuedTransfer> record) {
    AttachmentStoreTransaction tx(_store, "downloadAttempt");
    Query q = Query().equal("id", record->attachmentId());
    auto attachment = _store->find<Attachment>(q);
    if (attachment != nullptr && attachment->hasMediaTier()) {
        attachment->setMediaTierLastDownloadAttempt(_dateProvider());
        _store->save(attachment.get());
    }
    tx.commit();
}

void DownloadTaskRunner::didSucceed(std::shared_ptr<QueuedTransfer> record, AttachmentStoreTransaction & tx) {
    logger->info("Finished restoring attachment {}", record->id());
    _settings.addTotalPendingByteCount(TransferDirection::Download, -record->accountedByteCount(), tx);
}

void DownloadTaskRunner::didFail(std::shared_ptr<QueuedTransfer> record, const TaskRecordResult & result, bool isRetryable, AttachmentStoreTransaction & tx) {
    logger->warn("Failed restoring attachment {}, isRetryable: {}, error: {}", record->id(), isRetryable, result.error ? result.error->key : "unknown");
    if (!isRetryable) {
        _settings.addTotalPendingByteCount(TransferDirection::Download, -record->accountedByteCount(), tx);
    }
}

void DownloadTaskRunner::didCancel(std::shared_ptr<QueuedTransfer> record, AttachmentStoreTransaction & tx) {
    logger->warn("Cancelled restoring attachment {}", record->id());
    _settings.addTotalPendingByteCount(TransferDirection::Download, -record->accountedByteCount(), tx);
}

void DownloadTaskRunner::didDrainQueue() {
    {
        AttachmentStoreTransaction tx(_store, "downloadDrained");
        _settings.clearTotalPendingByteCount(TransferDirection::Download, tx);
        tx.commit();
    }
    _progress->didEmptyQueue();
    _gate->didEmptyQueue();
}
