/** TransferQueueStore [AttachSync]
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

#ifndef TransferQueueStore_hpp
#define TransferQueueStore_hpp

#include <stdio.h>
#include <memory>
#include <string>
#include <vector>

#include "attachsync/attachment_store_transaction.hpp"
#include "attachsync/models/queued_transfer.hpp"
#include "attachsync/task_queue_loader.hpp"

// The durable upload or download queue. Every method runs inside the caller's
// transaction so enqueueing can be combined with byte accounting.
class TransferQueueStore : public TaskRecordStore {
    TransferDirection _direction;
    std::string _tableName;

public:
    TransferQueueStore(TransferDirection direction);

    TransferDirection direction();
    std::string tableName();

    // Inserts the record or merges it into the existing row for the same key.
    // Returns the row as stored.
    std::shared_ptr<QueuedTransfer> enqueue(QueuedTransfer & record, AttachmentStoreTransaction & tx);

    std::vector<std::shared_ptr<QueuedTransfer>> peek(int count, time_t now, AttachmentStoreTransaction & tx);

    void updateRetryMetadata(std::string taskKey, int numRetries, time_t minRetryTimestamp, AttachmentStoreTransaction & tx);

    void remove(std::string taskKey, AttachmentStoreTransaction & tx);
    void removeAll(AttachmentStoreTransaction & tx);
    void removeAllForAttachment(std::string attachmentId, AttachmentStoreTransaction & tx);

    int count(AttachmentStoreTransaction & tx);
    std::shared_ptr<QueuedTransfer> find(std::string taskKey, AttachmentStoreTransaction & tx);
};

#endif /* TransferQueueStore_hpp */
