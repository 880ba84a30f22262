/** AttachmentStoreTransaction [AttachSync]
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

#ifndef AttachmentStoreTransaction_hpp
#define AttachmentStoreTransaction_hpp

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "attachsync/attachment_store.hpp"

class AttachmentStoreTransaction
{
public:
    /**
     * @brief Takes the store's connection lock and begins the SQLite transaction
     *
     * @param[in] store the AttachmentStore
     *
     * Exception is thrown in case of error, then the Transaction is NOT initiated.
     */
    explicit AttachmentStoreTransaction(AttachmentStore * store, std::string nameHint = "");

    /**
     * @brief Safely rollback the transaction if it has not been committed.
     */
    virtual ~AttachmentStoreTransaction() noexcept; // nothrow

    /**
     * @brief Commit the transaction, release the connection lock and run
     * any callbacks registered with addCommitCallback.
     */
    void commit();

    /**
     * @brief Run `callback` after a successful commit. Dropped on rollback.
     */
    void addCommitCallback(std::function<void()> callback);

    AttachmentStore * store();

private:
    // Transaction must be non-copyable
    AttachmentStoreTransaction(const AttachmentStoreTransaction&);
    AttachmentStoreTransaction& operator=(const AttachmentStoreTransaction&);

private:
    AttachmentStore* mStore;
    std::unique_lock<std::recursive_mutex> mLock;
    bool mCommited;  // < True when commit has been called
    std::chrono::system_clock::time_point mStart;
    std::chrono::system_clock::time_point mBegan;
    std::string mNameHint;
    std::vector<std::function<void()>> mCommitCallbacks;
};

#endif /* AttachmentStoreTransaction_hpp */
