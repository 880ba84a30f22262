/** AttachmentTransferClient [AttachSync]
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

#ifndef AttachmentTransferClient_hpp
#define AttachmentTransferClient_hpp

#include <stdio.h>
#include <stdint.h>
#include <string>

#include "attachsync/transfer_progress.hpp"

enum class TransferTier { Transit, Media, MediaThumbnail };

std::string TransferTierToString(TransferTier tier);

// Where a single transfer reads from or writes to.
struct TransferDescriptor {
    TransferTier tier;
    std::string mediaName;
    std::string mediaId;
    std::string cdnKey;             // transit tier only
    int cdnNumber;                  // -1 when the server picks one
    std::string localPath;
    int64_t byteCount;
    std::string digest;
    bool copyFromTransitTier;       // upload only
    std::string authorization;
};

struct TransferReceipt {
    int cdnNumber;
    int64_t byteCount;
    std::string digest;
    std::string localPath;
};

// The single-item transfer primitive. Both calls block until the transfer
// finishes and throw TransferException on failure.
class AttachmentTransferClient {
public:
    virtual ~AttachmentTransferClient() {}

    virtual TransferReceipt download(std::string attachmentId, int priority, const TransferDescriptor & source, TransferProgressCallback progress) = 0;

    virtual TransferReceipt upload(std::string attachmentId, int priority, const TransferDescriptor & destination, TransferProgressCallback progress) = 0;
};

#endif /* AttachmentTransferClient_hpp */
