#include "attachsync/list_media_reconciler.hpp"
#include "attachsync/attach_utils.hpp"
#include "attachsync/constants.hpp"
#include "attachsync/transfer_eligibility.hpp"
#include "attachsync/transfer_exception.hpp"

#include <vector>


ListMediaReconciler::ListMediaReconciler(AttachmentStore * store, std::shared_ptr<Account> account, BackupRequestManager * requests, MediaIdDeriver * deriver, RemoteConfig config, DateProvider dateProvider) :
    _store(store),
    _account(account),
    _requests(requests),
    _deriver(deriver),
    _config(config),
    _dateProvider(dateProvider),
    _downloadQueue(TransferDirection::Download),
    _pageSize(config.listMediaPageSize),
    logger(spdlog::get("logger"))
{
}

void ListMediaReconciler::queryListMediaIfNeeded() {
    // only one walk of the listing at a time
    std::lock_guard<std::mutex> guard(_mtx);

    std::string uploadEra;
    std::string lastQueriedEra;
    {
        AttachmentStoreTransaction tx(_store, "listMediaRead");
        uploadEra = _settings.uploadEra(tx);
        lastQueriedEra = _settings.lastListMediaUploadEra(tx);
        tx.commit();
    }
    if (lastQueriedEra == uploadEra) {
        return;
    }

    bool isPrimaryDevice = _account->isPrimaryDevice();
    std::string aci = _account->aci();
    if (aci == "") {
        throw TransferException(TRANSFER_ERROR_NOT_REGISTERED, "Cannot list media without a local aci", false);
    }

    BackupServiceAuth auth;
    try {
        auth = _requests->fetchBackupServiceAuth(MEDIA_TIER_AUTH_KEY, aci, true);
    } catch (TransferException & ex) {
        if (ex.key == TRANSFER_ERROR_NO_BACKUP_ID) {
            // no backup means there's no media tier to compare against
            logger->info("Skipping list media: no backup id registered");
            return;
        }
        throw;
    }

    logger->info("Listing media for upload era {} (last listed {})", uploadEra, lastQueriedEra == "" ? "never" : lastQueriedEra);

    // Entries are removed as they're matched. Anything left afterwards was
    // not in the listing.
    std::map<std::string, LocalMediaEntry> mediaIdMap = buildMediaIdMap(_account->mediaRootKey());
    std::set<std::string> matchedMediaIds;

    std::string cursor = "";
    int listedCount = 0;
    while (true) {
        ListMediaPage page = _requests->listMediaObjects(cursor, _pageSize, auth);
        listedCount += page.items.size();

        auto chunks = AttachUtils::chunksOfVector(page.items, 100);
        for (auto & chunk : chunks) {
            AttachmentStoreTransaction tx(_store, "listMediaChunk");
            for (auto & item : chunk) {
                handleListedMedia(item, mediaIdMap, matchedMediaIds, uploadEra, isPrimaryDevice, tx);
            }
            tx.commit();
        }

        cursor = page.cursor;
        if (cursor == "") {
            break;
        }
    }

    std::vector<LocalMediaEntry> remaining;
    for (const auto & it : mediaIdMap) {
        const LocalMediaEntry & entry = it.second;
        if (matchedMediaIds.count(it.first)) {
            // listed at an older generation only; the local copy stands
            continue;
        }
        if (entry.cdnNumber >= 0) {
            // the exporting primary thought this was uploaded and won't retry
            remaining.push_back(entry);
        } else if (isPrimaryDevice) {
            // the old primary is gone; if it isn't uploaded by now it never will be
            remaining.push_back(entry);
        } else if (!auth.isPaid()) {
            // a free tier primary isn't uploading anything either
            remaining.push_back(entry);
        }
    }

    logger->info("Listed {} media objects, {} local entries missing from the server", listedCount, remaining.size());

    if (remaining.size() == 0) {
        AttachmentStoreTransaction tx(_store, "listMediaDone");
        _settings.setLastListMediaUploadEra(uploadEra, tx);
        tx.commit();
        return;
    }

    auto chunks = AttachUtils::chunksOfVector(remaining, 100);
    for (size_t ii = 0; ii < chunks.size(); ii++) {
        AttachmentStoreTransaction tx(_store, "listMediaSweep");
        for (auto & entry : chunks[ii]) {
            markMediaTierUploadExpired(entry, tx);
        }
        if (ii == chunks.size() - 1) {
            _settings.setLastListMediaUploadEra(uploadEra, tx);
        }
        tx.commit();
    }
}

std::map<std::string, LocalMediaEntry> ListMediaReconciler::buildMediaIdMap(std::string mediaRootKey) {
    std::map<std::string, LocalMediaEntry> map;

    std::vector<std::shared_ptr<Attachment>> attachments;
    {
        AttachmentStoreTransaction tx(_store, "listMediaMap");
        Query q = Query().notNull("mediaName");
        attachments = _store->findAll<Attachment>(q);
        tx.commit();
    }

    for (auto & attachment : attachments) {
        if (!attachment->hasMediaName()) {
            continue;
        }
        std::string fullsizeMediaId = _deriver->mediaId(attachment->mediaName(), mediaRootKey);
        map[fullsizeMediaId] = LocalMediaEntry{attachment->id(), false, attachment->mediaTierCdnNumber()};

        if (attachment->canBeThumbnailed() || attachment->hasThumbnailMediaTierInfo()) {
            std::string thumbnailMediaId = _deriver->mediaId(attachment->thumbnailMediaName(), mediaRootKey);
            map[thumbnailMediaId] = LocalMediaEntry{attachment->id(), true, attachment->thumbnailMediaTierCdnNumber()};
        }
    }
    return map;
}

void ListMediaReconciler::handleListedMedia(const ListMediaItem & item, std::map<std::string, LocalMediaEntry> & mediaIdMap, std::set<std::string> & matchedMediaIds, std::string uploadEra, bool isPrimaryDevice, AttachmentStoreTransaction & tx) {
    auto it = mediaIdMap.find(item.mediaId);
    if (it == mediaIdMap.end()) {
        // Linked devices don't upload and so don't delete either; the primary
        // may have uploaded media from a message we haven't received yet.
        if (isPrimaryDevice) {
            enqueueListedMediaForDeletion(item, tx);
        }
        return;
    }

    LocalMediaEntry entry = it->second;
    mediaIdMap.erase(it);
    matchedMediaIds.insert(item.mediaId);

    if (entry.cdnNumber < 0) {
        updateWithListedCdn(entry, item, uploadEra, tx);
        return;
    }

    if (entry.cdnNumber > item.cdnNumber) {
        // Outdated copy on an old cdn. We may still find the entry at the
        // newer cdn later in the listing.
        logger->info("Outdated media tier copy found. Old cdn: {} local: {}", item.cdnNumber, entry.cdnNumber);
        enqueueListedMediaForDeletion(item, tx);
        mediaIdMap[item.mediaId] = entry;

    } else if (entry.cdnNumber < item.cdnNumber) {
        updateWithListedCdn(entry, item, uploadEra, tx);
    }
}

void ListMediaReconciler::enqueueListedMediaForDeletion(const ListMediaItem & item, AttachmentStoreTransaction & tx) {
    OrphanedAttachment orphan(item.mediaId, item.cdnNumber, "", ORPHAN_TYPE_DISCOVERED_ON_SERVER);
    _orphans.insert(orphan, tx);
}

void ListMediaReconciler::updateWithListedCdn(const LocalMediaEntry & entry, const ListMediaItem & item, std::string uploadEra, AttachmentStoreTransaction & tx) {
    Query q = Query().equal("id", entry.attachmentId);
    auto attachment = tx.store()->find<Attachment>(q);
    if (attachment == nullptr) {
        return;
    }

    if (entry.isThumbnail) {
        attachment->markThumbnailUploadedToMediaTier(item.cdnNumber, uploadEra);
        tx.store()->save(attachment.get());

    } else {
        // To be downloadable we need the size and digest, either from a local
        // stream or from media tier info restored out of a backup.
        bool hasSizeAndDigest = (attachment->hasStream() || attachment->hasMediaTier()) && attachment->fullsizeDigest() != "";
        if (hasSizeAndDigest) {
            attachment->markUploadedToMediaTier(item.cdnNumber, attachment->fullsizeByteCount(), attachment->fullsizeDigest(), uploadEra);
            tx.store()->save(attachment.get());
        } else {
            logger->warn("Attachment {} matched listed media but has no size or digest; orphaning", entry.attachmentId);
            enqueueListedMediaForDeletion(item, tx);
        }
    }

    // A smaller local cdn is a duplicate on an old cdn
    if (entry.cdnNumber >= 0 && entry.cdnNumber < item.cdnNumber) {
        ListMediaItem old{item.mediaId, entry.cdnNumber};
        enqueueListedMediaForDeletion(old, tx);
    }
}

void ListMediaReconciler::markMediaTierUploadExpired(const LocalMediaEntry & entry, AttachmentStoreTransaction & tx) {
    Query q = Query().equal("id", entry.attachmentId);
    auto attachment = tx.store()->find<Attachment>(q);
    if (attachment != nullptr) {
        if (entry.isThumbnail) {
            attachment->markThumbnailMediaTierUploadExpired();
        } else {
            attachment->markMediaTierUploadExpired();
        }
        tx.store()->save(attachment.get());
    }
    reevaluateQueuedDownload(attachment, entry.attachmentId, tx);
}

// The download record covers every source for the attachment. Drop it only
// when none of them is left, and release its bytes once fullsize is gone.
void ListMediaReconciler::reevaluateQueuedDownload(std::shared_ptr<Attachment> attachment, std::string attachmentId, AttachmentStoreTransaction & tx) {
    auto queued = _downloadQueue.find(QueuedTransfer::KeyFor(attachmentId, true), tx);
    if (queued == nullptr) {
        return;
    }

    DownloadEligibility eligibility;
    if (attachment != nullptr) {
        bool optimizeLocalStorage = _settings.optimizeLocalStorage(tx);
        // the record's own bytes are already part of the pending count
        int64_t pending = _settings.totalPendingByteCount(TransferDirection::Download, tx) - queued->accountedByteCount();
        time_t timestamp = queued->hasTimestamp() ? queued->timestamp() : TIMESTAMP_NONE;
        eligibility = DownloadEligibility::forAttachment(*attachment, timestamp, _dateProvider(), _config, optimizeLocalStorage, pending);
    }

    if (!eligibility.canBeDownloadedAtAll()) {
        logger->info("Dropping queued download for {}: no source left", attachmentId);
        _settings.addTotalPendingByteCount(TransferDirection::Download, -queued->accountedByteCount(), tx);
        _downloadQueue.removeAllForAttachment(attachmentId, tx);
        return;
    }

    if (!eligibility.canDownloadFullsize() && queued->accountedByteCount() > 0) {
        _settings.addTotalPendingByteCount(TransferDirection::Download, -queued->accountedByteCount(), tx);
        queued->setAccountedByteCount(0);
        tx.store()->save(queued.get());
    }
}
