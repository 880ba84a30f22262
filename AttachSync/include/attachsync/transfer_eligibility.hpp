/** TransferEligibility [AttachSync]
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

#ifndef TransferEligibility_hpp
#define TransferEligibility_hpp

#include <stdio.h>
#include <stdint.h>
#include <time.h>
#include <string>

#include "attachsync/models/attachment.hpp"
#include "attachsync/remote_config.hpp"

// Which sources an attachment could be restored from right now. Computed
// fresh at enqueue time and again when the download runs. Pure: callers read
// the settings and the pending byte count inside their own transaction.
class DownloadEligibility {
public:
    bool canDownloadMediaTierFullsize;
    bool canDownloadTransitTierFullsize;
    bool canDownloadThumbnail;
    int downloadPriority;

    DownloadEligibility();

    bool canBeDownloadedAtAll() const;
    bool canDownloadFullsize() const;

    static DownloadEligibility forAttachment(Attachment & attachment, time_t timestamp, time_t now, const RemoteConfig & config, bool optimizeLocalStorage, int64_t totalPendingDownloadByteCount);
};

// True if the fullsize (or thumbnail) variant still needs to be uploaded to
// the media tier for `uploadEra`.
bool IsEligibleToUpload(Attachment & attachment, bool fullsize, std::string uploadEra);

#endif /* TransferEligibility_hpp */
