#include "attachsync/transfer_eligibility.hpp"
#include "attachsync/models/queued_transfer.hpp"


DownloadEligibility::DownloadEligibility() :
    canDownloadMediaTierFullsize(false),
    canDownloadTransitTierFullsize(false),
    canDownloadThumbnail(false),
    downloadPriority(TRANSFER_PRIORITY_DEFAULT)
{
}

bool DownloadEligibility::canBeDownloadedAtAll() const {
    return canDownloadMediaTierFullsize || canDownloadTransitTierFullsize || canDownloadThumbnail;
}

bool DownloadEligibility::canDownloadFullsize() const {
    return canDownloadMediaTierFullsize || canDownloadTransitTierFullsize;
}

DownloadEligibility DownloadEligibility::forAttachment(Attachment & attachment, time_t timestamp, time_t now, const RemoteConfig & config, bool optimizeLocalStorage, int64_t totalPendingDownloadByteCount) {
    DownloadEligibility result;

    bool isRecent = (timestamp == TIMESTAMP_NONE) || (now - timestamp <= config.maxOpportunisticDownloadAgeSec);
    int64_t byteCount = attachment.fullsizeByteCount();

    bool fullsizeAllowed = !attachment.hasStream();
    if (fullsizeAllowed && !isRecent && optimizeLocalStorage) {
        // old media stays offloaded when the user asked us to save space
        fullsizeAllowed = false;
    }
    if (fullsizeAllowed && config.maxFullsizeDownloadByteCount > 0 && byteCount > config.maxFullsizeDownloadByteCount) {
        fullsizeAllowed = false;
    }
    if (fullsizeAllowed && !isRecent && config.pendingDownloadByteBudget > 0) {
        if (totalPendingDownloadByteCount + byteCount > config.pendingDownloadByteBudget) {
            fullsizeAllowed = false;
        }
    }

    if (fullsizeAllowed) {
        result.canDownloadMediaTierFullsize = attachment.hasMediaTierCdnNumber();

        if (attachment.hasTransitTier()) {
            time_t uploaded = attachment.transitTierUploadTimestamp();
            result.canDownloadTransitTierFullsize = (now - uploaded <= config.transitTierRetentionSec);
        }
    }

    result.canDownloadThumbnail = !attachment.hasStream() && !attachment.hasThumbnailStream() && attachment.hasThumbnailMediaTierCdnNumber();
    result.downloadPriority = isRecent ? TRANSFER_PRIORITY_HIGH : TRANSFER_PRIORITY_DEFAULT;
    return result;
}

bool IsEligibleToUpload(Attachment & attachment, bool fullsize, std::string uploadEra) {
    if (!attachment.hasStream() || !attachment.hasMediaName()) {
        return false;
    }
    if (fullsize) {
        if (attachment.hasMediaTierCdnNumber() && attachment.mediaTierUploadEra() == uploadEra) {
            return false;
        }
        return true;
    }
    if (!attachment.canBeThumbnailed()) {
        return false;
    }
    if (attachment.hasThumbnailMediaTierCdnNumber() && attachment.thumbnailMediaTierUploadEra() == uploadEra) {
        return false;
    }
    return true;
}
