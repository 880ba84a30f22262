/** BackupRequestManager [AttachSync]
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

#ifndef BackupRequestManager_hpp
#define BackupRequestManager_hpp

#include <stdio.h>
#include <time.h>
#include <string>
#include <vector>

#define BACKUP_LEVEL_FREE "free"
#define BACKUP_LEVEL_PAID "paid"

struct BackupServiceAuth {
    std::string token;
    std::string level;
    time_t expiryDate;

    bool isPaid() const {
        return level == BACKUP_LEVEL_PAID;
    }
};

struct ListMediaItem {
    std::string mediaId;
    int cdnNumber;
};

struct ListMediaPage {
    std::vector<ListMediaItem> items;
    std::string cursor; // empty on the last page
};

// Remote listing and credential service. Implementations throw
// TransferException on failure.
class BackupRequestManager {
public:
    virtual ~BackupRequestManager() {}

    virtual BackupServiceAuth fetchBackupServiceAuth(std::string tierKey, std::string localAci, bool forceRefreshUnlessCachedPaidCredential) = 0;

    virtual ListMediaPage listMediaObjects(std::string cursor, int limit, const BackupServiceAuth & auth) = 0;
};

#endif /* BackupRequestManager_hpp */
