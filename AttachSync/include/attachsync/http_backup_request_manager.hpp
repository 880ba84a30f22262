/** HttpBackupRequestManager [AttachSync]
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

#ifndef HttpBackupRequestManager_hpp
#define HttpBackupRequestManager_hpp

#include <stdio.h>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "attachsync/backup_request_manager.hpp"
#include "attachsync/models/account.hpp"
#include "attachsync/remote_config.hpp"

class HttpBackupRequestManager : public BackupRequestManager {
    std::string _server;
    std::shared_ptr<Account> _account;
    DateProvider _dateProvider;
    std::shared_ptr<spdlog::logger> logger;

    std::map<std::string, BackupServiceAuth> _cache;
    std::mutex _cacheLock;

public:
    HttpBackupRequestManager(std::string server, std::shared_ptr<Account> account, DateProvider dateProvider);

    BackupServiceAuth fetchBackupServiceAuth(std::string tierKey, std::string localAci, bool forceRefreshUnlessCachedPaidCredential);

    ListMediaPage listMediaObjects(std::string cursor, int limit, const BackupServiceAuth & auth);
};

#endif /* HttpBackupRequestManager_hpp */
