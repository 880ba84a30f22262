/** OrphanedAttachmentStore [AttachSync]
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

#ifndef OrphanedAttachmentStore_hpp
#define OrphanedAttachmentStore_hpp

#include <stdio.h>
#include <memory>
#include <string>
#include <vector>

#include "attachsync/attachment_store_transaction.hpp"
#include "attachsync/models/orphaned_attachment.hpp"

class OrphanedAttachmentStore {
public:
    // No-op if the same (mediaId, cdnNumber) is already recorded.
    void insert(OrphanedAttachment & orphan, AttachmentStoreTransaction & tx);

    void removeForMediaId(std::string mediaId, AttachmentStoreTransaction & tx);
    void remove(std::string id, AttachmentStoreTransaction & tx);

    std::vector<std::shared_ptr<OrphanedAttachment>> findAll(AttachmentStoreTransaction & tx);
    std::vector<std::shared_ptr<OrphanedAttachment>> findForMediaId(std::string mediaId, AttachmentStoreTransaction & tx);
};

#endif /* OrphanedAttachmentStore_hpp */
