/** ListMediaReconciler [AttachSync]
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

#ifndef ListMediaReconciler_hpp
#define ListMediaReconciler_hpp

#include <stdio.h>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include "spdlog/spdlog.h"

#include "attachsync/attachment_store.hpp"
#include "attachsync/backup_request_manager.hpp"
#include "attachsync/backup_settings_store.hpp"
#include "attachsync/media_id_deriver.hpp"
#include "attachsync/models/account.hpp"
#include "attachsync/orphaned_attachment_store.hpp"
#include "attachsync/remote_config.hpp"
#include "attachsync/transfer_queue_store.hpp"

struct LocalMediaEntry {
    std::string attachmentId;
    bool isThumbnail;
    int cdnNumber; // -1 = none
};

/*
 Compares local media tier metadata with the server's media listing, once per
 upload era. Listed objects we don't know about become orphans (primary only),
 newer server generations are adopted, and local entries the server no longer
 has are marked expired.
*/
class ListMediaReconciler {
    AttachmentStore * _store;
    std::shared_ptr<Account> _account;
    BackupRequestManager * _requests;
    MediaIdDeriver * _deriver;
    RemoteConfig _config;
    DateProvider _dateProvider;
    TransferQueueStore _downloadQueue;
    OrphanedAttachmentStore _orphans;
    BackupSettingsStore _settings;
    int _pageSize;
    std::mutex _mtx;
    std::shared_ptr<spdlog::logger> logger;

    std::map<std::string, LocalMediaEntry> buildMediaIdMap(std::string mediaRootKey);

    void handleListedMedia(const ListMediaItem & item, std::map<std::string, LocalMediaEntry> & mediaIdMap, std::set<std::string> & matchedMediaIds, std::string uploadEra, bool isPrimaryDevice, AttachmentStoreTransaction & tx);
    void enqueueListedMediaForDeletion(const ListMediaItem & item, AttachmentStoreTransaction & tx);
    void updateWithListedCdn(const LocalMediaEntry & entry, const ListMediaItem & item, std::string uploadEra, AttachmentStoreTransaction & tx);
    void markMediaTierUploadExpired(const LocalMediaEntry & entry, AttachmentStoreTransaction & tx);
    void reevaluateQueuedDownload(std::shared_ptr<Attachment> attachment, std::string attachmentId, AttachmentStoreTransaction & tx);

public:
    ListMediaReconciler(AttachmentStore * store, std::shared_ptr<Account> account, BackupRequestManager * requests, MediaIdDeriver * deriver, RemoteConfig config, DateProvider dateProvider);

    void queryListMediaIfNeeded();
};

#endif /* ListMediaReconciler_hpp */
