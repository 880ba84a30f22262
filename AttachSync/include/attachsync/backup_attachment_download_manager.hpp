/** BackupAttachmentDownloadManager [AttachSync]
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

#ifndef BackupAttachmentDownloadManager_hpp
#define BackupAttachmentDownloadManager_hpp

#include <stdio.h>
#include <stdint.h>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "spdlog/spdlog.h"

#include "attachsync/attachment_store.hpp"
#include "attachsync/attachment_store_transaction.hpp"
#include "attachsync/attachment_transfer_client.hpp"
#include "attachsync/backup_request_manager.hpp"
#include "attachsync/backup_settings_store.hpp"
#include "attachsync/download_task_runner.hpp"
#include "attachsync/list_media_reconciler.hpp"
#include "attachsync/media_id_deriver.hpp"
#include "attachsync/models/account.hpp"
#include "attachsync/models/attachment.hpp"
#include "attachsync/queue_status.hpp"
#include "attachsync/remote_config.hpp"
#include "attachsync/task_queue_loader.hpp"
#include "attachsync/transfer_progress.hpp"
#include "attachsync/transfer_queue_store.hpp"

/*
 Owns the restore queue. Attachments referenced by a restored backup are
 enqueued with their owner's timestamp and downloaded from whichever tier
 still holds them.
*/
class BackupAttachmentDownloadManager {
    AttachmentStore * _store;
    std::shared_ptr<Account> _account;
    ListMediaReconciler * _reconciler;
    RemoteConfig _config;
    DateProvider _dateProvider;
    BackupSettingsStore _settings;

    TransferQueueStore _queue;
    QueueStatusGate _gate;
    TransferProgress _progress;
    DownloadTaskRunner _runner;
    TaskQueueLoader _loader;

    std::mutex _drainMtx;
    std::condition_variable _drainCv;
    bool _observing;
    bool _drainRequested;
    bool _exiting;
    std::thread * _drainThread;

    std::shared_ptr<spdlog::logger> logger;

    void runDrainLoop();

public:
    BackupAttachmentDownloadManager(AttachmentStore * store, std::shared_ptr<Account> account, BackupRequestManager * requests, AttachmentTransferClient * client, MediaIdDeriver * deriver, ListMediaReconciler * reconciler, RemoteConfig config, DateProvider dateProvider);
    ~BackupAttachmentDownloadManager();

    QueueStatusGate * gate();
    TransferProgress * progress();
    TransferQueueStore * queue();

    void enqueueIfNeeded(Attachment & attachment, time_t timestamp, AttachmentStoreTransaction & tx);

    void restoreAttachmentsIfNeeded();
    void cancelAll();

    void beginObservingIfNeeded();
    void scheduleDrain();
};

#endif /* BackupAttachmentDownloadManager_hpp */
