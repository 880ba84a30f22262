/** DownloadTaskRunner [AttachSync]
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

#ifndef DownloadTaskRunner_hpp
#define DownloadTaskRunner_hpp

#include <stdio.h>
#include <stdint.h>
#include <memory>
#include <string>

#include "spdlog/spdlog.h"

#include "attachsync/attachment_store.hpp"
#include "attachsync/attachment_transfer_client.hpp"
#include "attachsync/backup_request_manager.hpp"
#include "attachsync/backup_settings_store.hpp"
#include "attachsync/media_id_deriver.hpp"
#include "attachsync/models/account.hpp"
#include "attachsync/models/attachment.hpp"
#include "attachsync/queue_status.hpp"
#include "attachsync/remote_config.hpp"
#include "attachsync/task_queue_loader.hpp"
#include "attachsync/transfer_progress.hpp"
#include "attachsync/transfer_queue_store.hpp"

// Encrypted attachments are padded before upload; progress is reported in
// padded bytes so it matches what actually crosses the wire.
int64_t PaddedByteCount(int64_t unpaddedByteCount);

// Restores one queued attachment, trying the media tier, then the transit
// tier, then the thumbnail.
class DownloadTaskRunner : public TaskRecordRunner {
    AttachmentStore * _store;
    BackupSettingsStore _settings;
    std::shared_ptr<Account> _account;
    BackupRequestManager * _requests;
    AttachmentTransferClient * _client;
    MediaIdDeriver * _deriver;
    QueueStatusGate * _gate;
    TransferProgress * _progress;
    RemoteConfig _config;
    DateProvider _dateProvider;
    std::shared_ptr<spdlog::logger> logger;

    TransferReceipt downloadFrom(TransferTier tier, std::shared_ptr<QueuedTransfer> record, Attachment & attachment, int priority);
    void recordDownload(std::shared_ptr<QueuedTransfer> record, TransferTier tier, const TransferReceipt & receipt);
    void recordMediaTierAttempt(std::shared_ptr<QueuedTransfer> record);

public:
    DownloadTaskRunner(AttachmentStore * store, std::shared_ptr<Account> account, BackupRequestManager * requests, AttachmentTransferClient * client, MediaIdDeriver * deriver, QueueStatusGate * gate, TransferProgress * progress, RemoteConfig config, DateProvider dateProvider);

    TaskRecordResult runTask(std::shared_ptr<QueuedTransfer> record, TaskQueueLoader * loader);

    void didSucceed(std::shared_ptr<QueuedTransfer> record, AttachmentStoreTransaction & tx);
    void didFail(std::shared_ptr<QueuedTransfer> record, const TaskRecordResult & result, bool isRetryable, AttachmentStoreTransaction & tx);
    void didCancel(std::shared_ptr<QueuedTransfer> record, AttachmentStoreTransaction & tx);
    void didDrainQueue();
};

#endif /* DownloadTaskRunner_hpp */
