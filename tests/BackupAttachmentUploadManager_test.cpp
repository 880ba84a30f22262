#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "attachsync/attachment_store.hpp"
#include "attachsync/attachment_store_transaction.hpp"
#include "attachsync/backup_attachment_upload_manager.hpp"
#include "attachsync/backup_settings_store.hpp"
#include "attachsync/constants.hpp"
#include "attachsync/list_media_reconciler.hpp"
#include "attachsync/models/account.hpp"
#include "attachsync/models/attachment.hpp"
#include "FakeMediaIdDeriver.hpp"
#include "MockAttachmentTransferClient.hpp"
#include "MockBackupRequestManager.hpp"
#include <memory>
#include <string>

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

#define NOW 1700000000

class BackupAttachmentUploadManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = new AttachmentStore(":memory:");
        store->migrate();
        account = std::make_shared<Account>(nlohmann::json{
            {"id", "acct"}, {"aci", "aci-1"}, {"isPrimaryDevice", true},
            {"backupToken", "token"}, {"mediaRootKey", "root-key"}});

        {
            AttachmentStoreTransaction tx(store, "test");
            settings.setBackupPlan(BACKUP_PLAN_PAID, tx);
            // the listing for this era already happened
            settings.setLastListMediaUploadEra(UPLOAD_ERA_INITIAL, tx);
            tx.commit();
        }

        ON_CALL(requests, fetchBackupServiceAuth(_, _, _)).WillByDefault(Return(PaidAuth()));

        config.numParallelUploads = 2;
        config.listMediaPageSize = 100;
        reconciler = new ListMediaReconciler(store, account, &requests, &deriver, config, []() { return (time_t)NOW; });
        manager = new BackupAttachmentUploadManager(store, account, &requests, &client, &deriver, reconciler, config, []() { return (time_t)NOW; });

        setConnectivity(Connectivity::Wifi);
    }

    void TearDown() override {
        delete manager;
        delete reconciler;
        delete store;
    }

    void setConnectivity(Connectivity connectivity) {
        DeviceSignals signals;
        signals.registeredAndReady = true;
        signals.connectivity = connectivity;
        manager->gate()->updateSignals(signals);
    }

    std::shared_ptr<Attachment> saveAttachment(std::string id, std::string contentType = "application/pdf") {
        auto attachment = std::make_shared<Attachment>(id, contentType);
        attachment->setMediaName("media-" + id);
        attachment->setStream(1000, "digest-" + id, "/tmp/" + id);
        attachment->setThumbnailStream(40, "/tmp/" + id + "-thumb");
        store->save(attachment.get());
        return attachment;
    }

    void enqueue(Attachment & attachment) {
        AttachmentStoreTransaction tx(store, "test");
        manager->enqueueIfNeeded(attachment, NOW, tx);
        tx.commit();
    }

    int count() {
        AttachmentStoreTransaction tx(store, "test");
        int c = manager->queue()->count(tx);
        tx.commit();
        return c;
    }

    int64_t pending() {
        AttachmentStoreTransaction tx(store, "test");
        int64_t p = settings.totalPendingByteCount(TransferDirection::Upload, tx);
        tx.commit();
        return p;
    }

    AttachmentStore * store;
    std::shared_ptr<Account> account;
    NiceMock<MockBackupRequestManager> requests;
    MockAttachmentTransferClient client;
    FakeMediaIdDeriver deriver;
    RemoteConfig config;
    BackupSettingsStore settings;
    ListMediaReconciler * reconciler;
    BackupAttachmentUploadManager * manager;
};

TEST_F(BackupAttachmentUploadManagerTest, EnqueueingTwiceKeepsOneRecordPerVariantAndCountsBytesOnce) {
    auto attachment = saveAttachment("a1", "image/jpeg");
    enqueue(*attachment);
    enqueue(*attachment);

    EXPECT_EQ(count(), 2);
    EXPECT_EQ(pending(), 1040);

    AttachmentStoreTransaction tx(store, "test");
    EXPECT_EQ(manager->queue()->find("a1:f", tx)->accountedByteCount(), 1000);
    EXPECT_EQ(manager->queue()->find("a1:t", tx)->accountedByteCount(), 40);
    tx.commit();
}

TEST_F(BackupAttachmentUploadManagerTest, DocumentsHaveNoThumbnailRecord) {
    auto attachment = saveAttachment("a1");
    enqueue(*attachment);
    EXPECT_EQ(count(), 1);
    EXPECT_EQ(pending(), 1000);
}

TEST_F(BackupAttachmentUploadManagerTest, LinkedDevicesDoNotUpload) {
    account = std::make_shared<Account>(nlohmann::json{
        {"id", "acct"}, {"aci", "aci-1"}, {"isPrimaryDevice", false},
        {"backupToken", "token"}, {"mediaRootKey", "root-key"}});
    delete manager;
    manager = new BackupAttachmentUploadManager(store, account, &requests, &client, &deriver, reconciler, config, []() { return (time_t)NOW; });

    auto attachment = saveAttachment("a1");
    enqueue(*attachment);
    EXPECT_EQ(count(), 0);
}

TEST_F(BackupAttachmentUploadManagerTest, FreePlanDoesNotEnqueue) {
    {
        AttachmentStoreTransaction tx(store, "test");
        settings.setBackupPlan(BACKUP_PLAN_FREE, tx);
        tx.commit();
    }
    auto attachment = saveAttachment("a1");
    enqueue(*attachment);
    EXPECT_EQ(count(), 0);
}

TEST_F(BackupAttachmentUploadManagerTest, AlreadyUploadedAttachmentIsNotEnqueued) {
    auto attachment = saveAttachment("a1");
    attachment->markUploadedToMediaTier(3, 1000, "digest-a1", UPLOAD_ERA_INITIAL);
    store->save(attachment.get());
    enqueue(*attachment);
    EXPECT_EQ(count(), 0);
}

TEST_F(BackupAttachmentUploadManagerTest, CommittedEnqueueWakesAnEmptyQueue) {
    manager->gate()->didEmptyQueue();
    EXPECT_EQ(manager->gate()->currentStatus(), QueueStatus::Empty);

    auto attachment = saveAttachment("a1");
    {
        AttachmentStoreTransaction tx(store, "test");
        manager->enqueueIfNeeded(*attachment, NOW, tx);
        EXPECT_EQ(manager->gate()->currentStatus(), QueueStatus::Empty);
        tx.commit();
    }
    EXPECT_EQ(manager->gate()->currentStatus(), QueueStatus::Running);
}

TEST_F(BackupAttachmentUploadManagerTest, BackUpAllAttachmentsDrainsTheQueue) {
    auto a1 = saveAttachment("a1");
    auto a2 = saveAttachment("a2");
    enqueue(*a1);
    enqueue(*a2);

    EXPECT_CALL(client, upload("a1", _, HasTier(TransferTier::Media), _)).WillOnce(Return(MakeReceipt(3)));
    EXPECT_CALL(client, upload("a2", _, HasTier(TransferTier::Media), _)).WillOnce(Return(MakeReceipt(3)));

    manager->backUpAllAttachments();

    EXPECT_EQ(count(), 0);
    EXPECT_EQ(pending(), 0);
    EXPECT_EQ(manager->gate()->currentStatus(), QueueStatus::Empty);

    Query q = Query().equal("id", "a1");
    EXPECT_EQ(store->find<Attachment>(q)->mediaTierCdnNumber(), 3);
}

TEST_F(BackupAttachmentUploadManagerTest, CellularDoesNotDrainUnlessAllowed) {
    setConnectivity(Connectivity::Cellular);
    auto attachment = saveAttachment("a1");
    enqueue(*attachment);

    EXPECT_CALL(client, upload(_, _, _, _)).Times(0);

    manager->backUpAllAttachments();

    EXPECT_EQ(count(), 1);
    EXPECT_EQ(manager->gate()->currentStatus(), QueueStatus::NoWifiReachability);
}

TEST_F(BackupAttachmentUploadManagerTest, CellularDrainsWhenAllowed) {
    {
        AttachmentStoreTransaction tx(store, "test");
        settings.setBackupsOnCellular(true, tx);
        tx.commit();
    }
    setConnectivity(Connectivity::Cellular);
    auto attachment = saveAttachment("a1");
    enqueue(*attachment);

    EXPECT_CALL(client, upload("a1", _, _, _)).WillOnce(Return(MakeReceipt(3)));

    manager->backUpAllAttachments();
    EXPECT_EQ(count(), 0);
}

TEST_F(BackupAttachmentUploadManagerTest, FreeCredentialStopsWithoutUploading) {
    auto attachment = saveAttachment("a1");
    enqueue(*attachment);

    EXPECT_CALL(requests, fetchBackupServiceAuth(_, "aci-1", true)).WillOnce(Return(FreeAuth()));
    EXPECT_CALL(client, upload(_, _, _, _)).Times(0);

    manager->backUpAllAttachments();
    EXPECT_EQ(count(), 1);
}

TEST_F(BackupAttachmentUploadManagerTest, MissingBackupIdSkipsQuietly) {
    auto attachment = saveAttachment("a1");
    enqueue(*attachment);

    EXPECT_CALL(requests, fetchBackupServiceAuth(_, "aci-1", true))
        .WillOnce(Throw(TransferException(TRANSFER_ERROR_NO_BACKUP_ID, "none", false)));
    EXPECT_CALL(client, upload(_, _, _, _)).Times(0);

    EXPECT_NO_THROW(manager->backUpAllAttachments());
    EXPECT_EQ(count(), 1);
}

TEST_F(BackupAttachmentUploadManagerTest, ListsMediaOnceForANewEraBeforeDraining) {
    {
        AttachmentStoreTransaction tx(store, "test");
        settings.setUploadEra("era-2", tx);
        tx.commit();
    }
    EXPECT_CALL(requests, listMediaObjects("", 100, _)).WillOnce(Return(ListMediaPage{{}, ""}));

    manager->backUpAllAttachments();
    manager->backUpAllAttachments();

    AttachmentStoreTransaction tx(store, "test");
    EXPECT_EQ(settings.lastListMediaUploadEra(tx), "era-2");
    tx.commit();
}

TEST_F(BackupAttachmentUploadManagerTest, CancelAllClearsTheQueueAndCounter) {
    auto a1 = saveAttachment("a1");
    auto a2 = saveAttachment("a2", "image/png");
    enqueue(*a1);
    enqueue(*a2);
    EXPECT_EQ(count(), 3);

    manager->cancelAll();

    EXPECT_EQ(count(), 0);
    AttachmentStoreTransaction tx(store, "test");
    EXPECT_FALSE(settings.hasTotalPendingByteCount(TransferDirection::Upload, tx));
    tx.commit();
    EXPECT_EQ(manager->gate()->currentStatus(), QueueStatus::Empty);
}
