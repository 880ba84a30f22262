#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "attachsync/attachment_store.hpp"
#include "attachsync/attachment_store_transaction.hpp"
#include "attachsync/backup_settings_store.hpp"
#include "attachsync/orphaned_attachment_store.hpp"
#include "attachsync/queue_status.hpp"
#include "attachsync/task_queue_loader.hpp"
#include "attachsync/transfer_progress.hpp"
#include "attachsync/transfer_queue_store.hpp"
#include "attachsync/upload_task_runner.hpp"
#include "attachsync/models/account.hpp"
#include "attachsync/models/attachment.hpp"
#include "FakeMediaIdDeriver.hpp"
#include "MockAttachmentTransferClient.hpp"
#include "MockBackupRequestManager.hpp"
#include <memory>
#include <string>

using ::testing::_;
using ::testing::AllOf;
using ::testing::Field;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

#define NOW 1700000000

class UploadTaskRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = new AttachmentStore(":memory:");
        store->migrate();
        queue = new TransferQueueStore(TransferDirection::Upload);
        account = std::make_shared<Account>(nlohmann::json{
            {"id", "acct"}, {"aci", "aci-1"}, {"isPrimaryDevice", true},
            {"backupToken", "token"}, {"mediaRootKey", "root-key"}});
        gate = new QueueStatusGate("upload", false, true, 10, 1000);
        progress = new TransferProgress("upload");

        DeviceSignals ready;
        ready.registeredAndReady = true;
        ready.connectivity = Connectivity::Wifi;
        gate->updateSignals(ready);

        {
            AttachmentStoreTransaction tx(store, "test");
            settings.setBackupPlan(BACKUP_PLAN_PAID, tx);
            settings.setUploadEra("era-1", tx);
            tx.commit();
        }

        ON_CALL(requests, fetchBackupServiceAuth(_, _, _)).WillByDefault(Return(PaidAuth()));

        runner = new UploadTaskRunner(store, queue, account, &requests, &client, &deriver, gate, progress, config, []() { return (time_t)NOW; });
        loader = new TaskQueueLoader("upload", 1, queue, runner, store, []() { return (time_t)NOW; });
    }

    void TearDown() override {
        delete loader;
        delete runner;
        delete progress;
        delete gate;
        delete queue;
        delete store;
    }

    std::shared_ptr<Attachment> saveAttachment(std::string id, std::string contentType = "image/jpeg") {
        auto attachment = std::make_shared<Attachment>(id, contentType);
        attachment->setMediaName("media-" + id);
        attachment->setStream(1000, "digest-" + id, "/tmp/" + id);
        attachment->setThumbnailStream(40, "/tmp/" + id + "-thumb");
        store->save(attachment.get());
        return attachment;
    }

    std::shared_ptr<Attachment> reload(std::string id) {
        Query q = Query().equal("id", id);
        return store->find<Attachment>(q);
    }

    void enqueue(std::string attachmentId, bool isFullsize, int64_t bytes = 1000) {
        AttachmentStoreTransaction tx(store, "test");
        QueuedTransfer record(queue->tableName(), attachmentId, isFullsize, TRANSFER_PRIORITY_DEFAULT);
        record.setAccountedByteCount(bytes);
        queue->enqueue(record, tx);
        settings.addTotalPendingByteCount(TransferDirection::Upload, bytes, tx);
        tx.commit();
    }

    std::shared_ptr<QueuedTransfer> find(std::string key) {
        AttachmentStoreTransaction tx(store, "test");
        auto record = queue->find(key, tx);
        tx.commit();
        return record;
    }

    int count() {
        AttachmentStoreTransaction tx(store, "test");
        int c = queue->count(tx);
        tx.commit();
        return c;
    }

    std::vector<std::shared_ptr<OrphanedAttachment>> orphans() {
        AttachmentStoreTransaction tx(store, "test");
        auto all = orphanStore.findAll(tx);
        tx.commit();
        return all;
    }

    AttachmentStore * store;
    TransferQueueStore * queue;
    std::shared_ptr<Account> account;
    QueueStatusGate * gate;
    TransferProgress * progress;
    NiceMock<MockBackupRequestManager> requests;
    MockAttachmentTransferClient client;
    FakeMediaIdDeriver deriver;
    RemoteConfig config;
    BackupSettingsStore settings;
    OrphanedAttachmentStore orphanStore;
    UploadTaskRunner * runner;
    TaskQueueLoader * loader;
};

TEST_F(UploadTaskRunnerTest, FullsizeUploadRecordsTheMediaTier) {
    saveAttachment("a1");
    enqueue("a1", true);

    EXPECT_CALL(client, upload("a1", _, AllOf(HasTier(TransferTier::Media),
                                              Field(&TransferDescriptor::mediaId, "mid:media-a1"),
                                              Field(&TransferDescriptor::localPath, "/tmp/a1"),
                                              Field(&TransferDescriptor::copyFromTransitTier, false)), _))
        .WillOnce(Return(MakeReceipt(2)));

    loader->loadAndRunTasks();

    auto attachment = reload("a1");
    EXPECT_EQ(attachment->mediaTierCdnNumber(), 2);
    EXPECT_EQ(attachment->mediaTierUploadEra(), "era-1");
    EXPECT_EQ(attachment->fullsizeDigest(), "digest-a1");
    EXPECT_EQ(count(), 0);
    EXPECT_EQ(gate->currentStatus(), QueueStatus::Empty);

    AttachmentStoreTransaction tx(store, "test");
    EXPECT_FALSE(settings.hasTotalPendingByteCount(TransferDirection::Upload, tx));
    tx.commit();
}

TEST_F(UploadTaskRunnerTest, ThumbnailUploadUsesTheThumbnailStream) {
    saveAttachment("a1");
    enqueue("a1", false, 40);

    EXPECT_CALL(client, upload("a1", _, AllOf(HasTier(TransferTier::MediaThumbnail),
                                              Field(&TransferDescriptor::mediaName, "media-a1_thumbnail"),
                                              Field(&TransferDescriptor::mediaId, "mid:media-a1_thumbnail"),
                                              Field(&TransferDescriptor::localPath, "/tmp/a1-thumb")), _))
        .WillOnce(Return(MakeReceipt(3)));

    loader->loadAndRunTasks();

    auto attachment = reload("a1");
    EXPECT_EQ(attachment->thumbnailMediaTierCdnNumber(), 3);
    EXPECT_FALSE(attachment->hasMediaTier());
}

TEST_F(UploadTaskRunnerTest, RecentTransitTierUploadIsCopiedServerSide) {
    auto attachment = saveAttachment("a1");
    attachment->setTransitTier("transit-key", 2, 1000, "digest-a1", NOW - 60);
    store->save(attachment.get());
    enqueue("a1", true);

    EXPECT_CALL(client, upload("a1", _, AllOf(Field(&TransferDescriptor::copyFromTransitTier, true),
                                              Field(&TransferDescriptor::cdnKey, "transit-key"),
                                              Field(&TransferDescriptor::cdnNumber, 2)), _))
        .WillOnce(Return(MakeReceipt(3)));

    loader->loadAndRunTasks();
    EXPECT_EQ(reload("a1")->mediaTierCdnNumber(), 3);
}

TEST_F(UploadTaskRunnerTest, ExpiredTransitCopyClearsTheTransitTierWithoutBackoff) {
    auto attachment = saveAttachment("a1");
    attachment->setTransitTier("transit-key", 2, 1000, "digest-a1", NOW - 60);
    store->save(attachment.get());
    enqueue("a1", true);

    EXPECT_CALL(client, upload("a1", _, _, _))
        .WillOnce(Throw(TransferException(TRANSFER_ERROR_SOURCE_NOT_FOUND, "gone", false)));

    loader->loadAndRunTasks();

    EXPECT_FALSE(reload("a1")->hasTransitTier());
    auto record = find("a1:f");
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->numRetries(), 0);
    EXPECT_FALSE(record->hasMinRetryTimestamp());
}

TEST_F(UploadTaskRunnerTest, MissingFullsizeFileDropsTheTaskWithoutRetrying) {
    saveAttachment("a1");
    enqueue("a1", true);

    EXPECT_CALL(client, upload("a1", _, _, _))
        .WillOnce(Throw(TransferException(TRANSFER_ERROR_MISSING_FILE, "no such file", false)));

    loader->loadAndRunTasks();

    EXPECT_EQ(count(), 0);
    EXPECT_FALSE(reload("a1")->hasMediaTier());
}

TEST_F(UploadTaskRunnerTest, UnknownFullsizeErrorStopsTheQueue) {
    saveAttachment("a1");
    saveAttachment("a2");
    enqueue("a1", true);
    enqueue("a2", true);

    EXPECT_CALL(client, upload(_, _, _, _))
        .WillOnce(Throw(TransferException(500L, "server error")));

    EXPECT_NO_THROW(loader->loadAndRunTasks());
    EXPECT_EQ(count(), 2);
}

TEST_F(UploadTaskRunnerTest, RateLimitHonorsRetryAfter) {
    saveAttachment("a1");
    enqueue("a1", true);

    EXPECT_CALL(client, upload("a1", _, _, _))
        .WillOnce(Throw(TransferException(429L, "slow down", 30L)));

    loader->loadAndRunTasks();

    auto record = find("a1:f");
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->numRetries(), 0);
    EXPECT_EQ(record->minRetryTimestamp(), NOW + 30);
}

TEST_F(UploadTaskRunnerTest, OfflineWhileRunningBacksOff) {
    saveAttachment("a1");
    enqueue("a1", true);

    EXPECT_CALL(client, upload("a1", _, _, _))
        .WillOnce(Throw(TransferException(CURLE_COULDNT_CONNECT, "offline")));

    loader->loadAndRunTasks();

    auto record = find("a1:f");
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->numRetries(), 1);
    EXPECT_EQ(record->minRetryTimestamp(), NOW + 3);
}

TEST_F(UploadTaskRunnerTest, OfflineWhileNotRunningLeavesRetryMetadataAlone) {
    saveAttachment("a1");
    enqueue("a1", true);
    gate->setQueueEmpty(true);

    EXPECT_CALL(client, upload("a1", _, _, _))
        .WillOnce(Throw(TransferException(CURLE_COULDNT_CONNECT, "offline")));

    loader->loadAndRunTasks();

    auto record = find("a1:f");
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->numRetries(), 0);
    EXPECT_FALSE(record->hasMinRetryTimestamp());
}

TEST_F(UploadTaskRunnerTest, ThumbnailFailureIsSwallowedAndTheQueueContinues) {
    saveAttachment("a1");
    saveAttachment("a2");
    enqueue("a1", false, 40);
    enqueue("a2", true);

    EXPECT_CALL(client, upload("a1", _, HasTier(TransferTier::MediaThumbnail), _))
        .WillOnce(Throw(TransferException(500L, "server error")));
    EXPECT_CALL(client, upload("a2", _, HasTier(TransferTier::Media), _))
        .WillOnce(Return(MakeReceipt(2)));

    loader->loadAndRunTasks();

    EXPECT_EQ(count(), 0);
    EXPECT_FALSE(reload("a1")->hasThumbnailMediaTierCdnNumber());
    EXPECT_EQ(reload("a2")->mediaTierCdnNumber(), 2);
}

TEST_F(UploadTaskRunnerTest, ForbiddenReverifiesTheCredentialOnce) {
    saveAttachment("a1");
    saveAttachment("a2");
    enqueue("a1", true);
    enqueue("a2", true);

    EXPECT_CALL(requests, fetchBackupServiceAuth(_, "aci-1", false)).WillRepeatedly(Return(PaidAuth()));
    EXPECT_CALL(requests, fetchBackupServiceAuth(_, "aci-1", true)).Times(1).WillOnce(Return(FreeAuth()));
    EXPECT_CALL(client, upload(_, _, _, _))
        .WillOnce(Throw(TransferException(403L, "forbidden")));

    loader->loadAndRunTasks();
    EXPECT_EQ(count(), 2);
}

TEST_F(UploadTaskRunnerTest, ForbiddenWithAPaidCredentialFallsThroughToTheGenericRules) {
    saveAttachment("a1");
    enqueue("a1", false, 40);

    EXPECT_CALL(requests, fetchBackupServiceAuth(_, "aci-1", false)).WillRepeatedly(Return(PaidAuth()));
    EXPECT_CALL(requests, fetchBackupServiceAuth(_, "aci-1", true)).Times(1).WillOnce(Return(PaidAuth()));
    EXPECT_CALL(client, upload("a1", _, HasTier(TransferTier::MediaThumbnail), _))
        .WillOnce(Throw(TransferException(403L, "forbidden")));

    loader->loadAndRunTasks();

    // still paid, so the thumbnail failure is swallowed like any other
    EXPECT_EQ(count(), 0);
    EXPECT_FALSE(reload("a1")->hasThumbnailMediaTierCdnNumber());
}

TEST_F(UploadTaskRunnerTest, FreePlanStopsBeforeUploading) {
    {
        AttachmentStoreTransaction tx(store, "test");
        settings.setBackupPlan(BACKUP_PLAN_FREE, tx);
        tx.commit();
    }
    saveAttachment("a1");
    enqueue("a1", true);

    EXPECT_CALL(client, upload(_, _, _, _)).Times(0);

    loader->loadAndRunTasks();
    EXPECT_EQ(count(), 1);
}

TEST_F(UploadTaskRunnerTest, BlockedQueueStopsWithoutTouchingTheRecord) {
    DeviceSignals cellular = gate->signals();
    cellular.connectivity = Connectivity::None;
    gate->updateSignals(cellular);

    saveAttachment("a1");
    enqueue("a1", true);

    EXPECT_CALL(client, upload(_, _, _, _)).Times(0);

    EXPECT_NO_THROW(loader->loadAndRunTasks());
    auto record = find("a1:f");
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->numRetries(), 0);
}

TEST_F(UploadTaskRunnerTest, AlreadyUploadedInThisEraIsSkipped) {
    auto attachment = saveAttachment("a1");
    attachment->markUploadedToMediaTier(5, 1000, "digest-a1", "era-1");
    store->save(attachment.get());
    enqueue("a1", true);

    EXPECT_CALL(client, upload(_, _, _, _)).Times(0);

    loader->loadAndRunTasks();
    EXPECT_EQ(count(), 0);
    EXPECT_EQ(reload("a1")->mediaTierCdnNumber(), 5);
}

TEST_F(UploadTaskRunnerTest, ReuploadOrphansThePreviousCdnCopy) {
    auto attachment = saveAttachment("a1");
    attachment->markUploadedToMediaTier(1, 1000, "digest-a1", "era-0");
    store->save(attachment.get());
    enqueue("a1", true);

    EXPECT_CALL(client, upload("a1", _, _, _)).WillOnce(Return(MakeReceipt(2)));

    loader->loadAndRunTasks();

    auto found = orphans();
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0]->mediaId(), "mid:media-a1");
    EXPECT_EQ(found[0]->cdnNumber(), 1);
    EXPECT_EQ(found[0]->type(), ORPHAN_TYPE_FULLSIZE);
}

TEST_F(UploadTaskRunnerTest, UploadClearsPendingOrphanForTheSameObject) {
    {
        AttachmentStoreTransaction tx(store, "test");
        OrphanedAttachment orphan("mid:media-a1", 3, "media-a1", ORPHAN_TYPE_DISCOVERED_ON_SERVER);
        orphanStore.insert(orphan, tx);
        tx.commit();
    }
    saveAttachment("a1");
    enqueue("a1", true);

    EXPECT_CALL(client, upload("a1", _, _, _)).WillOnce(Return(MakeReceipt(3)));

    loader->loadAndRunTasks();
    EXPECT_TRUE(orphans().empty());
}

TEST_F(UploadTaskRunnerTest, DeletedAttachmentIsCancelled) {
    enqueue("gone", true);
    EXPECT_CALL(client, upload(_, _, _, _)).Times(0);

    loader->loadAndRunTasks();
    EXPECT_EQ(count(), 0);
}
