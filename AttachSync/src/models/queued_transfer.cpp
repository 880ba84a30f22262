#include "attachsync/models/queued_transfer.hpp"
#include "attachsync/constants.hpp"


std::string TableNameForDirection(TransferDirection direction) {
    return direction == TransferDirection::Upload ? UPLOAD_QUEUE_TABLE_NAME : DOWNLOAD_QUEUE_TABLE_NAME;
}

std::string DirectionName(TransferDirection direction) {
    return direction == TransferDirection::Upload ? "upload" : "download";
}


std::string QueuedTransfer::KeyFor(std::string attachmentId, bool isFullsize) {
    return attachmentId + (isFullsize ? ":f" : ":t");
}

QueuedTransfer::QueuedTransfer(std::string tableName, std::string attachmentId, bool isFullsize, int priority, time_t timestamp) :
    StoreModel(KeyFor(attachmentId, isFullsize), 0), _tableName(tableName)
{
    _data["attachmentId"] = attachmentId;
    _data["isFullsize"] = isFullsize;
    _data["priority"] = priority;
    _data["numRetries"] = 0;
    _data["minRetryTimestamp"] = nullptr;
    _data["accountedByteCount"] = 0;
    setTimestamp(timestamp);
}

QueuedTransfer::QueuedTransfer(std::string tableName, SQLite::Statement & query) :
    StoreModel(query), _tableName(tableName)
{
}

std::string QueuedTransfer::tableName() {
    return _tableName;
}

std::string QueuedTransfer::attachmentId() {
    return _data["attachmentId"].get<std::string>();
}

bool QueuedTransfer::isFullsize() {
    return _data["isFullsize"].get<bool>();
}

int QueuedTransfer::priority() {
    return _data["priority"].get<int>();
}

void QueuedTransfer::setPriority(int p) {
    _data["priority"] = p;
}

bool QueuedTransfer::hasTimestamp() {
    return hasNumber(_data, "timestamp");
}

time_t QueuedTransfer::timestamp() {
    if (!hasTimestamp()) {
        return TIMESTAMP_NONE;
    }
    return (time_t)_data["timestamp"].get<int64_t>();
}

void QueuedTransfer::setTimestamp(time_t t) {
    if (t == TIMESTAMP_NONE) {
        _data["timestamp"] = nullptr;
    } else {
        _data["timestamp"] = (int64_t)t;
    }
}

int QueuedTransfer::numRetries() {
    return _data["numRetries"].get<int>();
}

void QueuedTransfer::setNumRetries(int n) {
    _data["numRetries"] = n;
}

bool QueuedTransfer::hasMinRetryTimestamp() {
    return hasNumber(_data, "minRetryTimestamp");
}

time_t QueuedTransfer::minRetryTimestamp() {
    if (!hasMinRetryTimestamp()) {
        return 0;
    }
    return (time_t)_data["minRetryTimestamp"].get<int64_t>();
}

void QueuedTransfer::setMinRetryTimestamp(time_t t) {
    _data["minRetryTimestamp"] = (int64_t)t;
}

int64_t QueuedTransfer::accountedByteCount() {
    if (!hasNumber(_data, "accountedByteCount")) {
        return 0;
    }
    return _data["accountedByteCount"].get<int64_t>();
}

void QueuedTransfer::setAccountedByteCount(int64_t count) {
    _data["accountedByteCount"] = count;
}

std::vector<std::string> QueuedTransfer::columnsForQuery() {
    return std::vector<std::string>{"id", "data", "version", "attachmentId", "isFullsize", "priority", "timestamp", "minRetryTimestamp"};
}

void QueuedTransfer::bindToQuery(SQLite::Statement * query) {
    StoreModel::bindToQuery(query);
    query->bind(":attachmentId", attachmentId());
    query->bind(":isFullsize", isFullsize() ? 1 : 0);
    query->bind(":priority", priority());
    bindNullableInt64(query, ":timestamp", _data["timestamp"]);
    bindNullableInt64(query, ":minRetryTimestamp", _data["minRetryTimestamp"]);
}
