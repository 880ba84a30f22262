/** Constants [AttachSync]
 */

/* LICENSE
* Copyright (C) 2017-2021 Foundry 376.
*
* This program is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef constants_h
#define constants_h

#include <string>
#include <vector>

#ifdef _WIN32
#define FS_PATH_SEP "\\"
#else
#define FS_PATH_SEP "/"
#endif

#define DATABASE_FILENAME "attachsync.db"

#define UPLOAD_QUEUE_TABLE_NAME     "BackupAttachmentUpload"
#define DOWNLOAD_QUEUE_TABLE_NAME   "BackupAttachmentDownload"

#define MEDIA_TIER_AUTH_KEY         "media"
#define THUMBNAIL_MEDIA_NAME_SUFFIX "_thumbnail"

// Keys in the _State table
#define STATE_BACKUP_PLAN                       "backupPlan"
#define STATE_UPLOAD_ERA                        "uploadEra"
#define STATE_LAST_LIST_MEDIA_UPLOAD_ERA        "lastListMediaUploadEra"
#define STATE_MEDIA_BANDWIDTH_PREFERENCE        "mediaBandwidthPreference"
#define STATE_OPTIMIZE_LOCAL_STORAGE            "optimizeLocalStorage"
#define STATE_BACKUPS_ON_CELLULAR               "backupsOnCellular"
#define STATE_TOTAL_PENDING_DOWNLOAD_BYTE_COUNT "totalPendingDownloadByteCount"
#define STATE_TOTAL_PENDING_UPLOAD_BYTE_COUNT   "totalPendingUploadByteCount"

#define UPLOAD_ERA_INITIAL "initial"

static std::vector<std::string> SETUP_QUERIES = {
    "CREATE TABLE IF NOT EXISTS `_State` (id VARCHAR(40) PRIMARY KEY, value TEXT)",

    "CREATE TABLE IF NOT EXISTS `Attachment` ("
        "id VARCHAR(40) PRIMARY KEY,"
        "version INTEGER,"
        "data TEXT,"
        "mediaName VARCHAR(255))",
    "CREATE INDEX IF NOT EXISTS AttachmentMediaNameIndex ON `Attachment` (mediaName)",

    "CREATE TABLE IF NOT EXISTS `" UPLOAD_QUEUE_TABLE_NAME "` ("
        "id VARCHAR(50) PRIMARY KEY,"
        "version INTEGER,"
        "data TEXT,"
        "attachmentId VARCHAR(40),"
        "isFullsize INTEGER,"
        "priority INTEGER,"
        "timestamp INTEGER,"
        "minRetryTimestamp INTEGER)",
    "CREATE INDEX IF NOT EXISTS BackupAttachmentUploadOrderIndex ON `" UPLOAD_QUEUE_TABLE_NAME "` (priority DESC, timestamp ASC)",
    "CREATE INDEX IF NOT EXISTS BackupAttachmentUploadAttachmentIndex ON `" UPLOAD_QUEUE_TABLE_NAME "` (attachmentId)",

    "CREATE TABLE IF NOT EXISTS `" DOWNLOAD_QUEUE_TABLE_NAME "` ("
        "id VARCHAR(50) PRIMARY KEY,"
        "version INTEGER,"
        "data TEXT,"
        "attachmentId VARCHAR(40),"
        "isFullsize INTEGER,"
        "priority INTEGER,"
        "timestamp INTEGER,"
        "minRetryTimestamp INTEGER)",
    "CREATE INDEX IF NOT EXISTS BackupAttachmentDownloadOrderIndex ON `" DOWNLOAD_QUEUE_TABLE_NAME "` (priority DESC, timestamp ASC)",
    "CREATE INDEX IF NOT EXISTS BackupAttachmentDownloadAttachmentIndex ON `" DOWNLOAD_QUEUE_TABLE_NAME "` (attachmentId)",

    "CREATE TABLE IF NOT EXISTS `OrphanedBackupAttachment` ("
        "id VARCHAR(120) PRIMARY KEY,"
        "version INTEGER,"
        "data TEXT,"
        "mediaId VARCHAR(100),"
        "cdnNumber INTEGER,"
        "type VARCHAR(40))",
    "CREATE INDEX IF NOT EXISTS OrphanedBackupAttachmentMediaIdIndex ON `OrphanedBackupAttachment` (mediaId)",
};

#endif /* constants_h */
