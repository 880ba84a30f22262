/** BackupAttachmentUploadManager [AttachSync]
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

#ifndef BackupAttachmentUploadManager_hpp
#define BackupAttachmentUploadManager_hpp

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
#include "attachsync/list_media_reconciler.hpp"
#include "attachsync/media_id_deriver.hpp"
#include "attachsync/models/account.hpp"
#include "attachsync/models/attachment.hpp"
#include "attachsync/queue_status.hpp"
#include "attachsync/remote_config.hpp"
#include "attachsync/task_queue_loader.hpp"
#include "attachsync/transfer_progress.hpp"
#include "attachsync/transfer_queue_store.hpp"
#include "attachsync/upload_task_runner.hpp"

/*
 Owns the upload queue: the durable records, the status gate, progress and
 the loader that drains them. Only a primary device on a paid plan uploads.
*/
class BackupAttachmentUploadManager {
    AttachmentStore * _store;
    std::shared_ptr<Account> _account;
    BackupRequestManager * _requests;
    ListMediaReconciler * _reconciler;
    RemoteConfig _config;
    DateProvider _dateProvider;
    BackupSettingsStore _settings;

    TransferQueueStore _queue;
    QueueStatusGate _gate;
    TransferProgress _progress;
    UploadTaskRunner _runner;
    TaskQueueLoader _loader;

    std::mutex _drainMtx;
    std::condition_variable _drainCv;
    bool _observing;
    bool _drainRequested;
    bool _exiting;
    std::thread * _drainThread;

    std::shared_ptr<spdlog::logger> logger;

    void enqueueRecord(std::string attachmentId, bool isFullsize, int64_t byteCount, time_t timestamp, AttachmentStoreTransaction & tx);
    void runDrainLoop();

public:
    BackupAttachmentUploadManager(AttachmentStore * store, std::shared_ptr<Account> account, BackupRequestManager * requests, AttachmentTransferClient * client, MediaIdDeriver * deriver, ListMediaReconciler * reconciler, RemoteConfig config, DateProvider dateProvider);
    ~BackupAttachmentUploadManager();

    QueueStatusGate * gate();
    TransferProgress * progress();
    TransferQueueStore * queue();

    // Adds fullsize and thumbnail upload records for anything not yet on the
    // media tier for the current upload era. Runs inside the caller's
    // transaction so the byte accounting commits with the records.
    void enqueueIfNeeded(Attachment & attachment, time_t timestamp, AttachmentStoreTransaction & tx);

    void backUpAllAttachments();
    void cancelAll();

    // Drains automatically whenever the gate returns to running.
    void beginObservingIfNeeded();
    void scheduleDrain();
};

#endif /* BackupAttachmentUploadManager_hpp */
