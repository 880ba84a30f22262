/** QueuedTransfer [AttachSync]
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

#ifndef QueuedTransfer_hpp
#define QueuedTransfer_hpp

#include <stdio.h>
#include <string>
#include "nlohmann/json.hpp"

#include "attachsync/models/store_model.hpp"

#define TRANSFER_PRIORITY_LOW       0
#define TRANSFER_PRIORITY_DEFAULT   50
#define TRANSFER_PRIORITY_HIGH      100

#define TIMESTAMP_NONE -1

enum class TransferDirection { Upload, Download };

std::string TableNameForDirection(TransferDirection direction);
std::string DirectionName(TransferDirection direction);

// One pending transfer in either the upload or the download table. The id is
// "<attachmentId>:f" for the fullsize record and "<attachmentId>:t" for the
// thumbnail record, so there is at most one row per variant per direction.
class QueuedTransfer : public StoreModel {
    std::string _tableName;

public:
    static std::string KeyFor(std::string attachmentId, bool isFullsize);

    QueuedTransfer(std::string tableName, std::string attachmentId, bool isFullsize, int priority, time_t timestamp = TIMESTAMP_NONE);
    QueuedTransfer(std::string tableName, SQLite::Statement & query);

    std::string tableName();

    std::string attachmentId();
    bool isFullsize();

    int priority();
    void setPriority(int p);

    bool hasTimestamp();
    time_t timestamp();
    void setTimestamp(time_t t);

    int numRetries();
    void setNumRetries(int n);

    bool hasMinRetryTimestamp();
    time_t minRetryTimestamp();
    void setMinRetryTimestamp(time_t t);

    // Bytes added to the pending byte counter when this record was enqueued
    int64_t accountedByteCount();
    void setAccountedByteCount(int64_t count);

    std::vector<std::string> columnsForQuery();
    void bindToQuery(SQLite::Statement * query);
};

#endif /* QueuedTransfer_hpp */
