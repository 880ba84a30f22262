/** AttachmentStore [AttachSync]
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

#ifndef AttachmentStore_hpp
#define AttachmentStore_hpp

#include <stdint.h>
#include <stdio.h>
#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "SQLiteCpp/SQLiteCpp.h"
#include "nlohmann/json.hpp"

#include "attachsync/models/store_model.hpp"
#include "attachsync/query.hpp"


// One SQLite connection shared by every thread. Each public method takes the
// connection lock, and AttachmentStoreTransaction holds it for its lifetime,
// so a thread inside a transaction never interleaves with another thread.
class AttachmentStore {
    SQLite::Database _db;
    SQLite::Statement _stmtBeginTransaction;
    SQLite::Statement _stmtRollbackTransaction;
    SQLite::Statement _stmtCommitTransaction;

    std::recursive_mutex _mtx;
    bool _transactionOpen;

    std::map<std::string, std::shared_ptr<SQLite::Statement>> _saveUpdateQueries;
    std::map<std::string, std::shared_ptr<SQLite::Statement>> _saveInsertQueries;
    std::map<std::string, std::shared_ptr<SQLite::Statement>> _removeQueries;

public:
    AttachmentStore();
    AttachmentStore(std::string path);

    void migrate();

    SQLite::Database & db();
    std::recursive_mutex & mutex();

    void resetQueues();

    std::string getKeyValue(std::string key);
    void saveKeyValue(std::string key, std::string value);
    void removeKeyValue(std::string key);

    void beginTransaction();
    void rollbackTransaction();
    void commitTransaction();
    bool transactionOpen();

    void save(StoreModel * model);
    void remove(StoreModel * model);

    // Find - Template methods which must be defined in header file

    template<typename ModelClass>
    std::shared_ptr<ModelClass> find(Query & query) {
        std::lock_guard<std::recursive_mutex> lock(_mtx);
        SQLite::Statement statement(this->_db, "SELECT data FROM " + ModelClass::TABLE_NAME + query.getSQL() + " LIMIT 1");
        query.bind(statement);
        if (statement.executeStep()) {
            return std::make_shared<ModelClass>(statement);
        }
        return nullptr;
    }

    template<typename ModelClass>
    std::vector<std::shared_ptr<ModelClass>> findAll(Query & query) {
        std::lock_guard<std::recursive_mutex> lock(_mtx);
        SQLite::Statement statement(this->_db, "SELECT data FROM " + ModelClass::TABLE_NAME + query.getSQL());
        query.bind(statement);

        std::vector<std::shared_ptr<ModelClass>> results;
        while (statement.executeStep()) {
            results.push_back(std::make_shared<ModelClass>(statement));
        }

        return results;
    }

    template<typename ModelClass>
    void remove(Query & query) {
        std::lock_guard<std::recursive_mutex> lock(_mtx);
        SQLite::Statement statement(this->_db, "DELETE FROM " + ModelClass::TABLE_NAME + query.getSQL());
        query.bind(statement);
        statement.exec();
    }
};


#endif /* AttachmentStore_hpp */
