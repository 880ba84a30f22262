/** CurlAttachmentTransferClient [AttachSync]
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

#ifndef CurlAttachmentTransferClient_hpp
#define CurlAttachmentTransferClient_hpp

#include <stdio.h>
#include <memory>
#include <string>

#include "spdlog/spdlog.h"

#include "attachsync/attachment_transfer_client.hpp"

class CurlAttachmentTransferClient : public AttachmentTransferClient {
    std::string _server;
    std::string _filesDir;
    std::shared_ptr<spdlog::logger> logger;

    std::string urlForSource(const TransferDescriptor & source);
    TransferReceipt copyFromTransitTier(const TransferDescriptor & destination);

public:
    CurlAttachmentTransferClient(std::string server, std::string filesDir);

    TransferReceipt download(std::string attachmentId, int priority, const TransferDescriptor & source, TransferProgressCallback progress);

    TransferReceipt upload(std::string attachmentId, int priority, const TransferDescriptor & destination, TransferProgressCallback progress);
};

#endif /* CurlAttachmentTransferClient_hpp */
