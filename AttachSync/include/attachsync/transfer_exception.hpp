/** TransferException [AttachSync]
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

#ifndef TransferException_hpp
#define TransferException_hpp

#include <stdio.h>
#include <string>
#include <curl/curl.h>
#include "nlohmann/json.hpp"
#include "attachsync/generic_exception.hpp"

#define TRANSFER_ERROR_SOURCE_NOT_FOUND  "source-object-not-found"
#define TRANSFER_ERROR_MISSING_FILE      "missing-file"
#define TRANSFER_ERROR_NO_BACKUP_ID      "no-existing-backup-id"
#define TRANSFER_ERROR_NOT_REGISTERED    "not-registered"
#define TRANSFER_ERROR_FREE_TIER         "free-tier"
#define TRANSFER_ERROR_QUEUE_BLOCKED     "queue-blocked"
#define TRANSFER_ERROR_BANDWIDTH         "bandwidth-not-permitted"
#define TRANSFER_ERROR_INVALID_RESPONSE  "invalid-response"
#define TRANSFER_ERROR_UNKNOWN           "unknown"


class TransferException : public GenericException {
    bool retryable = false;
    bool offline = false;

public:
    TransferException(std::string key, std::string di, bool retryable);
    TransferException(CURLcode c, std::string di);
    TransferException(long httpStatus, std::string di, long retryAfter = -1);

    std::string key;
    std::string debuginfo;
    long httpStatus;

    // seconds, -1 when the server did not send Retry-After
    long retryAfter;

    bool isRetryable();
    bool isOffline();
    bool isForbidden();
    bool isRateLimited();
    bool isSourceNotFound();
    bool isMissingFile();

    const char * what() const noexcept override;
    nlohmann::json toJSON();
};


#endif /* TransferException_hpp */
