/** BackupSettingsStore [AttachSync]
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

#ifndef BackupSettingsStore_hpp
#define BackupSettingsStore_hpp

#include <stdio.h>
#include <stdint.h>
#include <string>

#include "attachsync/attachment_store_transaction.hpp"
#include "attachsync/models/queued_transfer.hpp"

#define BACKUP_PLAN_DISABLED            "disabled"
#define BACKUP_PLAN_DISABLING           "disabling"
#define BACKUP_PLAN_FREE                "free"
#define BACKUP_PLAN_PAID                "paid"
#define BACKUP_PLAN_PAID_EXPIRING_SOON  "paidExpiringSoon"
#define BACKUP_PLAN_PAID_AS_TESTER      "paidAsTester"

#define BANDWIDTH_WIFI_ONLY             "wifiOnly"
#define BANDWIDTH_WIFI_AND_CELLULAR     "wifiAndCellular"

// Typed accessors for the backup settings kept in the _State table.
class BackupSettingsStore {
public:
    static bool IsPaidPlan(std::string plan);

    std::string backupPlan(AttachmentStoreTransaction & tx);
    void setBackupPlan(std::string plan, AttachmentStoreTransaction & tx);

    std::string uploadEra(AttachmentStoreTransaction & tx);
    void setUploadEra(std::string era, AttachmentStoreTransaction & tx);

    std::string lastListMediaUploadEra(AttachmentStoreTransaction & tx);
    void setLastListMediaUploadEra(std::string era, AttachmentStoreTransaction & tx);

    std::string mediaBandwidthPreference(AttachmentStoreTransaction & tx);
    void setMediaBandwidthPreference(std::string preference, AttachmentStoreTransaction & tx);

    bool optimizeLocalStorage(AttachmentStoreTransaction & tx);
    void setOptimizeLocalStorage(bool optimize, AttachmentStoreTransaction & tx);

    bool backupsOnCellular(AttachmentStoreTransaction & tx);
    void setBackupsOnCellular(bool allowed, AttachmentStoreTransaction & tx);

    // The pending byte counters are nullable: absent until something is
    // enqueued, and cleared again on a full drain or cancel.
    bool hasTotalPendingByteCount(TransferDirection direction, AttachmentStoreTransaction & tx);
    int64_t totalPendingByteCount(TransferDirection direction, AttachmentStoreTransaction & tx);
    void addTotalPendingByteCount(TransferDirection direction, int64_t delta, AttachmentStoreTransaction & tx);
    void clearTotalPendingByteCount(TransferDirection direction, AttachmentStoreTransaction & tx);
};

#endif /* BackupSettingsStore_hpp */
