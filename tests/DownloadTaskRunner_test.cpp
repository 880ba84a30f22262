#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "attachsync/attachment_store.hpp"
#include "attachsync/attachment_store_transaction.hpp"
#include "attachsync/backup_settings_store.hpp"
#include "attachsync/download_task_runner.hpp"
#include "attachsync/queue_status.hpp"
#include "attachsync/task_queue_loader.hpp"
#include "attachsync/transfer_progress.hpp"
#include "attachsync/transfer_queue_store.hpp"
#include "attachsync/models/account.hpp"
#include "attachsync/models/attachment.hpp"
#include "FakeMediaIdDeriver.hpp"
#include "MockAttachmentTransferClient.hpp"
#include "MockBackupRequestManager.hpp"
#include <algorithm>
#include <memory>
#include <string>
#include <vector>

using ::testing::_;
using ::testing::AllOf;
using ::testing::Field;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

#define NOW 1700000000

class DownloadTaskRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = new AttachmentStore(":memory:");
        store->migrate();
        queue = new TransferQueueStore(TransferDirection::Download);
        account = std::make_shared<Account>(nlohmann::json{
            {"id", "acct"}, {"aci", "aci-1"}, {"isPrimaryDevice", false},
            {"backupToken", "token"}, {"mediaRootKey", "root-key"}});
        gate = new QueueStatusGate("download", true, false, 10, 1000);
        progress = new TransferProgress("download");

        setConnectivity(Connectivity::Wifi);

        ON_CALL(requests, fetchBackupServiceAuth(_, _, _)).WillByDefault(Return(PaidAuth()));

        runner = new DownloadTaskRunner(store, account, &requests, &client, &deriver, gate, progress, config, []() { return (time_t)NOW; });
        loader = new TaskQueueLoader("download", 1, queue, runner, store, []() { return (time_t)NOW; });
    }

    void TearDown() override {
        delete loader;
        delete runner;
        delete progress;
        delete gate;
        delete queue;
        delete store;
    }

    void setConnectivity(Connectivity connectivity) {
        DeviceSignals signals;
        signals.registeredAndReady = true;
        signals.connectivity = connectivity;
        gate->updateSignals(signals);
    }

    // Restorable from every source: media tier, a fresh transit copy and a
    // thumbnail.
    std::shared_ptr<Attachment> saveAttachment(std::string id) {
        auto attachment = std::make_shared<Attachment>(id, "image/png");
        attachment->setMediaName("media-" + id);
        attachment->markUploadedToMediaTier(3, 1000, "digest-" + id, "initial");
        attachment->markThumbnailUploadedToMediaTier(3, "initial");
        attachment->setTransitTier("transit-" + id, 2, 1000, "digest-" + id, NOW - 60);
        store->save(attachment.get());
        return attachment;
    }

    std::shared_ptr<Attachment> reload(std::string id) {
        Query q = Query().equal("id", id);
        return store->find<Attachment>(q);
    }

    void enqueue(std::string attachmentId, int64_t bytes = 1000) {
        AttachmentStoreTransaction tx(store, "test");
        QueuedTransfer record(queue->tableName(), attachmentId, true, TRANSFER_PRIORITY_HIGH, NOW);
        record.setAccountedByteCount(bytes);
        queue->enqueue(record, tx);
        settings.addTotalPendingByteCount(TransferDirection::Download, bytes, tx);
        tx.commit();
    }

    int count() {
        AttachmentStoreTransaction tx(store, "test");
        int c = queue->count(tx);
        tx.commit();
        return c;
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
    DownloadTaskRunner * runner;
    TaskQueueLoader * loader;
};

TEST_F(DownloadTaskRunnerTest, MediaTierSuccessSkipsTheOtherSources) {
    saveAttachment("a1");
    enqueue("a1");

    EXPECT_CALL(client, download("a1", TRANSFER_PRIORITY_HIGH, AllOf(HasTier(TransferTier::Media),
                                                                     Field(&TransferDescriptor::mediaId, "mid:media-a1"),
                                                                     Field(&TransferDescriptor::cdnNumber, 3),
                                                                     Field(&TransferDescriptor::authorization, "Bearer paid-token")), _))
        .WillOnce(Return(MakeReceipt(3, 1000, "/tmp/restored-a1")));
    EXPECT_CALL(client, download(_, _, HasTier(TransferTier::Transit), _)).Times(0);
    EXPECT_CALL(client, download(_, _, HasTier(TransferTier::MediaThumbnail), _)).Times(0);

    loader->loadAndRunTasks();

    auto attachment = reload("a1");
    ASSERT_TRUE(attachment->hasStream());
    EXPECT_EQ(attachment->stream()["localPath"].get<std::string>(), "/tmp/restored-a1");
    EXPECT_EQ(attachment->stream()["digest"].get<std::string>(), "digest-a1");
    EXPECT_EQ(count(), 0);
    EXPECT_EQ(gate->currentStatus(), QueueStatus::Empty);
}

TEST_F(DownloadTaskRunnerTest, FailedMediaTierFallsBackToTransitAndNeverThumbnail) {
    saveAttachment("a1");
    enqueue("a1");

    {
        InSequence seq;
        EXPECT_CALL(client, download("a1", _, HasTier(TransferTier::Media), _))
            .WillOnce(Throw(TransferException(404L, "not on the media tier")));
        EXPECT_CALL(client, download("a1", _, AllOf(HasTier(TransferTier::Transit),
                                                    Field(&TransferDescriptor::cdnKey, "transit-a1"),
                                                    Field(&TransferDescriptor::cdnNumber, 2)), _))
            .WillOnce(Return(MakeReceipt(2, 1000, "/tmp/restored-a1")));
    }
    EXPECT_CALL(client, download(_, _, HasTier(TransferTier::MediaThumbnail), _)).Times(0);

    loader->loadAndRunTasks();

    EXPECT_TRUE(reload("a1")->hasStream());
    EXPECT_EQ(count(), 0);
}

TEST_F(DownloadTaskRunnerTest, EveryFailedSourceDropsTheTaskAndStopsTheQueue) {
    saveAttachment("a1");
    saveAttachment("a2");
    enqueue("a1");
    enqueue("a2");

    EXPECT_CALL(client, download("a1", _, _, _))
        .Times(3)
        .WillRepeatedly(Throw(TransferException(500L, "server error")));
    EXPECT_CALL(client, download("a2", _, _, _)).Times(0);

    EXPECT_NO_THROW(loader->loadAndRunTasks());

    EXPECT_FALSE(reload("a1")->hasStream());
    EXPECT_EQ(count(), 1);

    AttachmentStoreTransaction tx(store, "test");
    EXPECT_EQ(settings.totalPendingByteCount(TransferDirection::Download, tx), 1000);
    tx.commit();
}

TEST_F(DownloadTaskRunnerTest, CellularWithWifiOnlyPreferenceUsesOnlyTheTransitTier) {
    setConnectivity(Connectivity::Cellular);
    saveAttachment("a1");
    enqueue("a1");

    EXPECT_CALL(client, download("a1", _, HasTier(TransferTier::Transit), _))
        .WillOnce(Return(MakeReceipt(2, 1000, "/tmp/restored-a1")));
    EXPECT_CALL(client, download(_, _, HasTier(TransferTier::Media), _)).Times(0);
    EXPECT_CALL(client, download(_, _, HasTier(TransferTier::MediaThumbnail), _)).Times(0);

    loader->loadAndRunTasks();
    EXPECT_EQ(count(), 0);
}

TEST_F(DownloadTaskRunnerTest, CellularPreferenceAllowsTheMediaTier) {
    {
        AttachmentStoreTransaction tx(store, "test");
        settings.setMediaBandwidthPreference(BANDWIDTH_WIFI_AND_CELLULAR, tx);
        tx.commit();
    }
    setConnectivity(Connectivity::Cellular);
    saveAttachment("a1");
    enqueue("a1");

    EXPECT_CALL(client, download("a1", _, HasTier(TransferTier::Media), _))
        .WillOnce(Return(MakeReceipt(3, 1000, "/tmp/restored-a1")));

    loader->loadAndRunTasks();
    EXPECT_EQ(count(), 0);
}

TEST_F(DownloadTaskRunnerTest, NoPermittedSourceStopsTheQueueAndKeepsTheRecord) {
    setConnectivity(Connectivity::Cellular);
    auto attachment = saveAttachment("a1");
    attachment->clearTransitTier();
    store->save(attachment.get());
    enqueue("a1");

    EXPECT_CALL(client, download(_, _, _, _)).Times(0);

    EXPECT_NO_THROW(loader->loadAndRunTasks());
    EXPECT_EQ(count(), 1);
}

TEST_F(DownloadTaskRunnerTest, ThumbnailOnlyAttachmentRestoresTheThumbnail) {
    auto attachment = std::make_shared<Attachment>("a1", "image/png");
    attachment->setMediaName("media-a1");
    attachment->markThumbnailUploadedToMediaTier(1, "initial");
    store->save(attachment.get());
    enqueue("a1", 0);

    EXPECT_CALL(client, download("a1", _, AllOf(HasTier(TransferTier::MediaThumbnail),
                                                Field(&TransferDescriptor::mediaName, "media-a1_thumbnail"),
                                                Field(&TransferDescriptor::cdnNumber, 1)), _))
        .WillOnce(Return(MakeReceipt(1, 40, "/tmp/restored-a1-thumb")));

    loader->loadAndRunTasks();

    auto restored = reload("a1");
    EXPECT_FALSE(restored->hasStream());
    ASSERT_TRUE(restored->hasThumbnailStream());
    EXPECT_EQ(restored->thumbnailStream()["localPath"].get<std::string>(), "/tmp/restored-a1-thumb");
    EXPECT_EQ(count(), 0);
}

TEST_F(DownloadTaskRunnerTest, AlreadyDownloadedAttachmentIsCancelled) {
    auto attachment = saveAttachment("a1");
    attachment->setStream(1000, "digest-a1", "/tmp/a1");
    store->save(attachment.get());
    enqueue("a1");

    EXPECT_CALL(client, download(_, _, _, _)).Times(0);

    loader->loadAndRunTasks();
    EXPECT_EQ(count(), 0);
}

TEST_F(DownloadTaskRunnerTest, ProgressIsReportedInPaddedBytes) {
    saveAttachment("a1");
    enqueue("a1");

    std::vector<int64_t> completed;
    progress->addObserver([&](int64_t done, int64_t) {
        completed.push_back(done);
    });

    EXPECT_CALL(client, download("a1", _, HasTier(TransferTier::Media), _))
        .WillOnce(Return(MakeReceipt(3, 1000, "/tmp/restored-a1")));

    loader->loadAndRunTasks();

    ASSERT_FALSE(completed.empty());
    EXPECT_NE(std::find(completed.begin(), completed.end(), PaddedByteCount(1000)), completed.end());
    // reset once the queue drains
    EXPECT_EQ(completed.back(), 0);
}

TEST(PaddedByteCountTest, PadsUpToTheBucketSize) {
    EXPECT_EQ(PaddedByteCount(0), 0);
    EXPECT_EQ(PaddedByteCount(1), 541);
    EXPECT_GE(PaddedByteCount(1000), 1000);
    EXPECT_LE(PaddedByteCount(1000), 1050);
    EXPECT_GE(PaddedByteCount(10 * 1024 * 1024), 10 * 1024 * 1024);
}
