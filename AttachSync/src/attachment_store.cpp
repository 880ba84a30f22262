#include "attachsync/attachment_store.hpp"
#include "attachsync/attach_utils.hpp"
#include "attachsync/constants.hpp"
#include "attachsync/transfer_exception.hpp"

#include "spdlog/spdlog.h"


static std::string DefaultDatabasePath() {
    std::string dir = AttachUtils::getEnvUTF8("CONFIG_DIR_PATH");
    if (dir == "") {
        throw TransferException("missing-config-dir", "CONFIG_DIR_PATH must be set to locate " DATABASE_FILENAME, false);
    }
    return dir + FS_PATH_SEP + DATABASE_FILENAME;
}

AttachmentStore::AttachmentStore() :
    AttachmentStore(DefaultDatabasePath())
{
}

AttachmentStore::AttachmentStore(std::string path) :
    _db(path, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE),
    _stmtBeginTransaction(_db, "BEGIN IMMEDIATE TRANSACTION"),
    _stmtRollbackTransaction(_db, "ROLLBACK"),
    _stmtCommitTransaction(_db, "COMMIT"),
    _transactionOpen(false)
{
    _db.setBusyTimeout(10 * 1000);

    // Note: These are properties of the connection, so they must be set regardless
    // of whether the database setup queries are run.
    SQLite::Statement(_db, "PRAGMA journal_mode = WAL").executeStep();
    SQLite::Statement(_db, "PRAGMA main.cache_size = 10000").exec();
    SQLite::Statement(_db, "PRAGMA main.synchronous = NORMAL").exec();
}

void AttachmentStore::migrate() {
    std::lock_guard<std::recursive_mutex> lock(_mtx);
    SQLite::Statement uv(_db, "PRAGMA user_version");
    uv.executeStep();
    int version = uv.getColumn(0).getInt();

    if (version == 0) {
        for (std::string sql : SETUP_QUERIES) {
            SQLite::Statement(_db, sql).exec();
        }
    }

    SQLite::Statement(_db, "PRAGMA user_version = 1").exec();
}

SQLite::Database & AttachmentStore::db()
{
    return this->_db;
}

std::recursive_mutex & AttachmentStore::mutex()
{
    return this->_mtx;
}

void AttachmentStore::resetQueues() {
    std::lock_guard<std::recursive_mutex> lock(_mtx);
    spdlog::get("logger")->info("Removing all queued transfers and orphan records");

    SQLite::Transaction transaction(_db);
    SQLite::Statement(_db, "DELETE FROM `" UPLOAD_QUEUE_TABLE_NAME "`").exec();
    SQLite::Statement(_db, "DELETE FROM `" DOWNLOAD_QUEUE_TABLE_NAME "`").exec();
    SQLite::Statement(_db, "DELETE FROM `OrphanedBackupAttachment`").exec();
    SQLite::Statement rm(_db, "DELETE FROM `_State` WHERE id IN (?, ?)");
    rm.bind(1, STATE_TOTAL_PENDING_DOWNLOAD_BYTE_COUNT);
    rm.bind(2, STATE_TOTAL_PENDING_UPLOAD_BYTE_COUNT);
    rm.exec();
    transaction.commit();

    SQLite::Statement(_db, "VACUUM").exec();
}

std::string AttachmentStore::getKeyValue(std::string key) {
    std::lock_guard<std::recursive_mutex> lock(_mtx);
    SQLite::Statement query(this->_db, "SELECT value FROM _State WHERE id = ?");
    query.bind(1, key);
    if (query.executeStep()) {
        return query.getColumn(0).getString();
    }
    return "";
}

void AttachmentStore::saveKeyValue(std::string key, std::string value) {
    std::lock_guard<std::recursive_mutex> lock(_mtx);
    SQLite::Statement query(this->_db, "REPLACE INTO _State (id, value) VALUES (?, ?)");
    query.bind(1, key);
    query.bind(2, value);
    query.exec();
}

void AttachmentStore::removeKeyValue(std::string key) {
    std::lock_guard<std::recursive_mutex> lock(_mtx);
    SQLite::Statement query(this->_db, "DELETE FROM _State WHERE id = ?");
    query.bind(1, key);
    query.exec();
}

void AttachmentStore::beginTransaction() {
    std::lock_guard<std::recursive_mutex> lock(_mtx);
    _stmtBeginTransaction.exec();
    _stmtBeginTransaction.reset();
    _transactionOpen = true;
}

void AttachmentStore::rollbackTransaction() {
    std::lock_guard<std::recursive_mutex> lock(_mtx);
    _transactionOpen = false;
    _stmtRollbackTransaction.exec();
    _stmtRollbackTransaction.reset();
}

void AttachmentStore::commitTransaction() {
    std::lock_guard<std::recursive_mutex> lock(_mtx);
    _stmtCommitTransaction.exec();
    _stmtCommitTransaction.reset();
    _transactionOpen = false;
}

bool AttachmentStore::transactionOpen() {
    return _transactionOpen;
}

void AttachmentStore::save(StoreModel * model) {
    std::lock_guard<std::recursive_mutex> lock(_mtx);
    model->incrementVersion();
    auto tableName = model->tableName();

    if (model->version() > 1) {
        if (!_saveUpdateQueries.count(tableName)) {
            std::string pairs{""};
            for (const auto col : model->columnsForQuery()) {
                if (col == "id") {
                    continue;
                }
                pairs += (col + " = :" + col + ",");
            }
            pairs.pop_back();

            auto stmt = std::make_shared<SQLite::Statement>(this->_db, "UPDATE `" + tableName + "` SET " + pairs + " WHERE id = :id");
            _saveUpdateQueries[tableName] = stmt;
        }
        auto query = _saveUpdateQueries[tableName];
        query->reset();
        query->clearBindings();
        model->bindToQuery(query.get());
        query->exec();

    } else {
        if (!_saveInsertQueries.count(tableName)) {
            std::string cols{""};
            std::string values{""};
            for (const auto col : model->columnsForQuery()) {
                cols += col + ",";
                values += ":" + col + ",";
            }
            cols.pop_back();
            values.pop_back();

            auto stmt = std::make_shared<SQLite::Statement>(this->_db, "INSERT INTO `" + tableName + "` (" + cols + ") VALUES (" + values + ")");
            _saveInsertQueries[tableName] = stmt;
        }

        auto query = _saveInsertQueries[tableName];
        query->reset();
        query->clearBindings();
        model->bindToQuery(query.get());
        query->exec();
    }
}

void AttachmentStore::remove(StoreModel * model) {
    std::lock_guard<std::recursive_mutex> lock(_mtx);
    auto tableName = model->tableName();
    if (!_removeQueries.count(tableName)) {
        _removeQueries[tableName] = std::make_shared<SQLite::Statement>(this->_db, "DELETE FROM `" + tableName + "` WHERE id = ?");
    }
    auto query = _removeQueries[tableName];
    query->reset();
    query->bind(1, model->id());
    query->exec();
}
