#include "attachsync/transfer_queue_store.hpp"

#include <algorithm>


TransferQueueStore::TransferQueueStore(TransferDirection direction) :
    _direction(direction), _tableName(TableNameForDirection(direction))
{
}

TransferDirection TransferQueueStore::direction() {
    return _direction;
}

std::string TransferQueueStore::tableName() {
    return _tableName;
}

std::shared_ptr<QueuedTransfer> TransferQueueStore::enqueue(QueuedTransfer & record, AttachmentStoreTransaction & tx) {
    auto existing = find(record.id(), tx);

    if (existing == nullptr) {
        auto inserted = std::make_shared<QueuedTransfer>(record);
        tx.store()->save(inserted.get());
        return inserted;
    }

    // Merge into the existing row. Retry metadata and byte accounting belong
    // to the existing row, and the rowid (insertion order) is preserved.
    existing->setPriority(std::max(existing->priority(), record.priority()));
    if (record.hasTimestamp()) {
        if (!existing->hasTimestamp() || record.timestamp() > existing->timestamp()) {
            existing->setTimestamp(record.timestamp());
        }
    }
    tx.store()->save(existing.get());
    return existing;
}

std::vector<std::shared_ptr<QueuedTransfer>> TransferQueueStore::peek(int count, time_t now, AttachmentStoreTransaction & tx) {
    SQLite::Statement query(tx.store()->db(), "SELECT data FROM `" + _tableName + "` WHERE (minRetryTimestamp IS NULL OR minRetryTimestamp <= ?) ORDER BY priority DESC, timestamp IS NULL ASC, timestamp ASC, rowid ASC LIMIT ?");
    query.bind(1, (int64_t)now);
    query.bind(2, count);

    std::vector<std::shared_ptr<QueuedTransfer>> results;
    while (query.executeStep()) {
        results.push_back(std::make_shared<QueuedTransfer>(_tableName, query));
    }
    return results;
}

void TransferQueueStore::updateRetryMetadata(std::string taskKey, int numRetries, time_t minRetryTimestamp, AttachmentStoreTransaction & tx) {
    auto record = find(taskKey, tx);
    if (record == nullptr) {
        return;
    }
    record->setNumRetries(numRetries);
    record->setMinRetryTimestamp(minRetryTimestamp);
    tx.store()->save(record.get());
}

void TransferQueueStore::remove(std::string taskKey, AttachmentStoreTransaction & tx) {
    SQLite::Statement query(tx.store()->db(), "DELETE FROM `" + _tableName + "` WHERE id = ?");
    query.bind(1, taskKey);
    query.exec();
}

void TransferQueueStore::removeAll(AttachmentStoreTransaction & tx) {
    SQLite::Statement(tx.store()->db(), "DELETE FROM `" + _tableName + "`").exec();
}

void TransferQueueStore::removeAllForAttachment(std::string attachmentId, AttachmentStoreTransaction & tx) {
    SQLite::Statement query(tx.store()->db(), "DELETE FROM `" + _tableName + "` WHERE attachmentId = ?");
    query.bind(1, attachmentId);
    query.exec();
}

int TransferQueueStore::count(AttachmentStoreTransaction & tx) {
    SQLite::Statement query(tx.store()->db(), "SELECT COUNT(*) FROM `" + _tableName + "`");
    query.executeStep();
    return query.getColumn(0).getInt();
}

std::shared_ptr<QueuedTransfer> TransferQueueStore::find(std::string taskKey, AttachmentStoreTransaction & tx) {
    SQLite::Statement query(tx.store()->db(), "SELECT data FROM `" + _tableName + "` WHERE id = ? LIMIT 1");
    query.bind(1, taskKey);
    if (query.executeStep()) {
        return std::make_shared<QueuedTransfer>(_tableName, query);
    }
    return nullptr;
}
