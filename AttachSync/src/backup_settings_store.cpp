#include "attachsync/backup_settings_store.hpp"
#include "attachsync/constants.hpp"


static std::string pendingKey(TransferDirection direction) {
    if (direction == TransferDirection::Upload) {
        return STATE_TOTAL_PENDING_UPLOAD_BYTE_COUNT;
    }
    return STATE_TOTAL_PENDING_DOWNLOAD_BYTE_COUNT;
}

bool BackupSettingsStore::IsPaidPlan(std::string plan) {
    return (plan == BACKUP_PLAN_PAID) || (plan == BACKUP_PLAN_PAID_EXPIRING_SOON) || (plan == BACKUP_PLAN_PAID_AS_TESTER);
}

std::string BackupSettingsStore::backupPlan(AttachmentStoreTransaction & tx) {
    std::string plan = tx.store()->getKeyValue(STATE_BACKUP_PLAN);
    return plan == "" ? BACKUP_PLAN_DISABLED : plan;
}

void BackupSettingsStore::setBackupPlan(std::string plan, AttachmentStoreTransaction & tx) {
    tx.store()->saveKeyValue(STATE_BACKUP_PLAN, plan);
}

std::string BackupSettingsStore::uploadEra(AttachmentStoreTransaction & tx) {
    std::string era = tx.store()->getKeyValue(STATE_UPLOAD_ERA);
    return era == "" ? UPLOAD_ERA_INITIAL : era;
}

void BackupSettingsStore::setUploadEra(std::string era, AttachmentStoreTransaction & tx) {
    tx.store()->saveKeyValue(STATE_UPLOAD_ERA, era);
}

std::string BackupSettingsStore::lastListMediaUploadEra(AttachmentStoreTransaction & tx) {
    return tx.store()->getKeyValue(STATE_LAST_LIST_MEDIA_UPLOAD_ERA);
}

void BackupSettingsStore::setLastListMediaUploadEra(std::string era, AttachmentStoreTransaction & tx) {
    tx.store()->saveKeyValue(STATE_LAST_LIST_MEDIA_UPLOAD_ERA, era);
}

std::string BackupSettingsStore::mediaBandwidthPreference(AttachmentStoreTransaction & tx) {
    std::string pref = tx.store()->getKeyValue(STATE_MEDIA_BANDWIDTH_PREFERENCE);
    return pref == "" ? BANDWIDTH_WIFI_ONLY : pref;
}

void BackupSettingsStore::setMediaBandwidthPreference(std::string preference, AttachmentStoreTransaction & tx) {
    tx.store()->saveKeyValue(STATE_MEDIA_BANDWIDTH_PREFERENCE, preference);
}

bool BackupSettingsStore::optimizeLocalStorage(AttachmentStoreTransaction & tx) {
    return tx.store()->getKeyValue(STATE_OPTIMIZE_LOCAL_STORAGE) == "true";
}

void BackupSettingsStore::setOptimizeLocalStorage(bool optimize, AttachmentStoreTransaction & tx) {
    tx.store()->saveKeyValue(STATE_OPTIMIZE_LOCAL_STORAGE, optimize ? "true" : "false");
}

bool BackupSettingsStore::backupsOnCellular(AttachmentStoreTransaction & tx) {
    return tx.store()->getKeyValue(STATE_BACKUPS_ON_CELLULAR) == "true";
}

void BackupSettingsStore::setBackupsOnCellular(bool allowed, AttachmentStoreTransaction & tx) {
    tx.store()->saveKeyValue(STATE_BACKUPS_ON_CELLULAR, allowed ? "true" : "false");
}

bool BackupSettingsStore::hasTotalPendingByteCount(TransferDirection direction, AttachmentStoreTransaction & tx) {
    return tx.store()->getKeyValue(pendingKey(direction)) != "";
}

int64_t BackupSettingsStore::totalPendingByteCount(TransferDirection direction, AttachmentStoreTransaction & tx) {
    std::string value = tx.store()->getKeyValue(pendingKey(direction));
    if (value == "") {
        return 0;
    }
    return std::stoll(value);
}

void BackupSettingsStore::addTotalPendingByteCount(TransferDirection direction, int64_t delta, AttachmentStoreTransaction & tx) {
    if (delta <= 0 && !hasTotalPendingByteCount(direction, tx)) {
        return;
    }
    int64_t next = totalPendingByteCount(direction, tx) + delta;
    if (next < 0) {
        next = 0;
    }
    tx.store()->saveKeyValue(pendingKey(direction), std::to_string(next));
}

void BackupSettingsStore::clearTotalPendingByteCount(TransferDirection direction, AttachmentStoreTransaction & tx) {
    tx.store()->removeKeyValue(pendingKey(direction));
}
