#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "attachsync/attachment_store.hpp"
#include "attachsync/attachment_store_transaction.hpp"
#include "attachsync/backup_attachment_download_manager.hpp"
#include "attachsync/backup_settings_store.hpp"
#include "attachsync/constants.hpp"
#include "attachsync/list_media_reconciler.hpp"
#include "attachsync/models/account.hpp"
#include "attachsync/models/attachment.hpp"
#include "FakeMediaIdDeriver.hpp"
#include "MockAttachmentTransferClient.hpp"
#include "MockBackupRequestManager.hpp"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

#define NOW 1700000000
#define DAY (24 * 60 * 60)

class BackupAttachmentDownloadManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = new AttachmentStore(":memory:");
        store->migrate();
        account = std::make_shared<Account>(nlohmann::json{
            {"id", "acct"}, {"aci", "aci-1"}, {"isPrimaryDevice", false},
            {"backupToken", "token"}, {"mediaRootKey", "root-key"}});

        {
            AttachmentStoreTransaction tx(store, "test");
            settings.setLastListMediaUploadEra(UPLOAD_ERA_INITIAL, tx);
            tx.commit();
        }

        ON_CALL(requests, fetchBackupServiceAuth(_, _, _)).WillByDefault(Return(PaidAuth()));

        config.listMediaPageSize = 100;
        reconciler = new ListMediaReconciler(store, account, &requests, &deriver, config, []() { return (time_t)NOW; });
        manager = new BackupAttachmentDownloadManager(store, account, &requests, &client, &deriver, reconciler, config, []() { return (time_t)NOW; });

        signals.registeredAndReady = true;
        signals.connectivity = Connectivity::Wifi;
        manager->gate()->updateSignals(signals);
    }

    void TearDown() override {
        delete manager;
        delete reconciler;
        delete store;
    }

    std::shared_ptr<Attachment> saveMediaTierAttachment(std::string id) {
        auto attachment = std::make_shared<Attachment>(id, "application/pdf");
        attachment->setMediaName("media-" + id);
        attachment->markUploadedToMediaTier(3, 1000, "digest-" + id, UPLOAD_ERA_INITIAL);
        store->save(attachment.get());
        return attachment;
    }

    void enqueue(Attachment & attachment, time_t timestamp = NOW) {
        AttachmentStoreTransaction tx(store, "test");
        manager->enqueueIfNeeded(attachment, timestamp, tx);
        tx.commit();
    }

    std::shared_ptr<QueuedTransfer> find(std::string key) {
        AttachmentStoreTransaction tx(store, "test");
        auto record = manager->queue()->find(key, tx);
        tx.commit();
        return record;
    }

    int count() {
        AttachmentStoreTransaction tx(store, "test");
        int c = manager->queue()->count(tx);
        tx.commit();
        return c;
    }

    int64_t pending() {
        AttachmentStoreTransaction tx(store, "test");
        int64_t p = settings.totalPendingByteCount(TransferDirection::Download, tx);
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
    DeviceSignals signals;
    ListMediaReconciler * reconciler;
    BackupAttachmentDownloadManager * manager;
};

TEST_F(BackupAttachmentDownloadManagerTest, EnqueueUsesTheEligibilityPriorityAndCountsFullsizeBytes) {
    auto recent = saveMediaTierAttachment("recent");
    auto old = saveMediaTierAttachment("old");
    enqueue(*recent, NOW - DAY);
    enqueue(*old, NOW - 90 * DAY);

    EXPECT_EQ(find("recent:f")->priority(), TRANSFER_PRIORITY_HIGH);
    EXPECT_EQ(find("old:f")->priority(), TRANSFER_PRIORITY_DEFAULT);
    EXPECT_EQ(find("recent:f")->accountedByteCount(), 1000);
    EXPECT_EQ(pending(), 2000);
}

TEST_F(BackupAttachmentDownloadManagerTest, EnqueueingTwiceCountsBytesOnce) {
    auto attachment = saveMediaTierAttachment("a1");
    enqueue(*attachment, NOW - 90 * DAY);
    enqueue(*attachment, NOW - DAY);

    EXPECT_EQ(count(), 1);
    EXPECT_EQ(pending(), 1000);
    EXPECT_EQ(find("a1:f")->priority(), TRANSFER_PRIORITY_HIGH);
}

TEST_F(BackupAttachmentDownloadManagerTest, FullsizeBytesAreCountedWhenAThumbnailRecordGainsFullsize) {
    auto attachment = std::make_shared<Attachment>("a1", "image/jpeg");
    attachment->setMediaName("media-a1");
    attachment->markThumbnailUploadedToMediaTier(2, UPLOAD_ERA_INITIAL);
    store->save(attachment.get());
    enqueue(*attachment);
    EXPECT_EQ(find("a1:f")->accountedByteCount(), 0);
    EXPECT_EQ(pending(), 0);

    attachment->markUploadedToMediaTier(3, 1000, "digest-a1", UPLOAD_ERA_INITIAL);
    store->save(attachment.get());
    enqueue(*attachment);

    EXPECT_EQ(count(), 1);
    EXPECT_EQ(find("a1:f")->accountedByteCount(), 1000);
    EXPECT_EQ(pending(), 1000);

    // a further enqueue doesn't count it again
    enqueue(*attachment);
    EXPECT_EQ(pending(), 1000);
}

TEST_F(BackupAttachmentDownloadManagerTest, AttachmentWithNoSourceIsNotEnqueued) {
    auto attachment = std::make_shared<Attachment>("a1", "application/pdf");
    attachment->setMediaName("media-a1");
    store->save(attachment.get());
    enqueue(*attachment);

    EXPECT_EQ(count(), 0);
}

TEST_F(BackupAttachmentDownloadManagerTest, ThumbnailOnlyAttachmentRestoresEndToEnd) {
    auto attachment = std::make_shared<Attachment>("a1", "image/jpeg");
    attachment->setMediaName("media-a1");
    attachment->markThumbnailUploadedToMediaTier(2, UPLOAD_ERA_INITIAL);
    store->save(attachment.get());
    enqueue(*attachment);

    EXPECT_EQ(find("a1:f")->accountedByteCount(), 0);
    EXPECT_EQ(pending(), 0);

    EXPECT_CALL(client, download("a1", _, HasTier(TransferTier::MediaThumbnail), _))
        .Times(1)
        .WillOnce(Return(MakeReceipt(2, 40, "/tmp/a1-thumb")));
    EXPECT_CALL(client, download(_, _, HasTier(TransferTier::Media), _)).Times(0);
    EXPECT_CALL(client, download(_, _, HasTier(TransferTier::Transit), _)).Times(0);

    manager->restoreAttachmentsIfNeeded();

    Query q = Query().equal("id", "a1");
    auto restored = store->find<Attachment>(q);
    EXPECT_TRUE(restored->hasThumbnailStream());
    EXPECT_FALSE(restored->hasStream());
    EXPECT_EQ(count(), 0);
    EXPECT_EQ(pending(), 0);
    EXPECT_EQ(manager->gate()->currentStatus(), QueueStatus::Empty);
}

TEST_F(BackupAttachmentDownloadManagerTest, RestoreDrainsTheQueue) {
    auto a1 = saveMediaTierAttachment("a1");
    auto a2 = saveMediaTierAttachment("a2");
    enqueue(*a1);
    enqueue(*a2);

    EXPECT_CALL(client, download("a1", _, HasTier(TransferTier::Media), _)).WillOnce(Return(MakeReceipt(3, 1000, "/tmp/a1")));
    EXPECT_CALL(client, download("a2", _, HasTier(TransferTier::Media), _)).WillOnce(Return(MakeReceipt(3, 1000, "/tmp/a2")));

    manager->restoreAttachmentsIfNeeded();

    EXPECT_EQ(count(), 0);
    AttachmentStoreTransaction tx(store, "test");
    EXPECT_FALSE(settings.hasTotalPendingByteCount(TransferDirection::Download, tx));
    tx.commit();
}

TEST_F(BackupAttachmentDownloadManagerTest, LowDiskSpaceBlocksTheRestore) {
    signals.availableDiskBytes = 1024;
    manager->gate()->updateSignals(signals);

    auto attachment = saveMediaTierAttachment("a1");
    enqueue(*attachment);

    EXPECT_CALL(client, download(_, _, _, _)).Times(0);

    manager->restoreAttachmentsIfNeeded();

    EXPECT_EQ(count(), 1);
    EXPECT_EQ(manager->gate()->currentStatus(), QueueStatus::LowDiskSpace);
}

TEST_F(BackupAttachmentDownloadManagerTest, EmptyQueueReportsEmpty) {
    EXPECT_CALL(client, download(_, _, _, _)).Times(0);
    manager->restoreAttachmentsIfNeeded();
    EXPECT_EQ(manager->gate()->currentStatus(), QueueStatus::Empty);
}

TEST_F(BackupAttachmentDownloadManagerTest, CancelAllClearsTheQueueAndCounter) {
    auto a1 = saveMediaTierAttachment("a1");
    auto a2 = saveMediaTierAttachment("a2");
    enqueue(*a1);
    enqueue(*a2);

    manager->cancelAll();

    EXPECT_EQ(count(), 0);
    EXPECT_EQ(pending(), 0);
    EXPECT_EQ(manager->gate()->currentStatus(), QueueStatus::Empty);
}

TEST_F(BackupAttachmentDownloadManagerTest, ObservingDrainsWhenTheQueueBecomesRunnable) {
    manager->gate()->didEmptyQueue();
    manager->beginObservingIfNeeded();

    auto attachment = saveMediaTierAttachment("a1");

    std::mutex mtx;
    std::condition_variable cv;
    bool downloaded = false;
    EXPECT_CALL(client, download("a1", _, HasTier(TransferTier::Media), _))
        .WillOnce(::testing::Invoke([&](std::string, int, const TransferDescriptor &, TransferProgressCallback) {
            std::lock_guard<std::mutex> lck(mtx);
            downloaded = true;
            cv.notify_all();
            return MakeReceipt(3, 1000, "/tmp/a1");
        }));

    enqueue(*attachment);

    std::unique_lock<std::mutex> lck(mtx);
    EXPECT_TRUE(cv.wait_for(lck, std::chrono::seconds(5), [&]() { return downloaded; }));
}
