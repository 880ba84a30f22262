#include "attachsync/orphaned_attachment_store.hpp"

#include "spdlog/spdlog.h"


void OrphanedAttachmentStore::insert(OrphanedAttachment & orphan, AttachmentStoreTransaction & tx) {
    Query q = Query().equal("id", orphan.id());
    if (tx.store()->find<OrphanedAttachment>(q) != nullptr) {
        return;
    }
    spdlog::get("logger")->info("Recording orphaned media {} ({})", orphan.id(), orphan.type());
    tx.store()->save(&orphan);
}

void OrphanedAttachmentStore::removeForMediaId(std::string mediaId, AttachmentStoreTransaction & tx) {
    Query q = Query().equal("mediaId", mediaId);
    tx.store()->remove<OrphanedAttachment>(q);
}

void OrphanedAttachmentStore::remove(std::string id, AttachmentStoreTransaction & tx) {
    Query q = Query().equal("id", id);
    tx.store()->remove<OrphanedAttachment>(q);
}

std::vector<std::shared_ptr<OrphanedAttachment>> OrphanedAttachmentStore::findAll(AttachmentStoreTransaction & tx) {
    Query q = Query().orderBy("rowid ASC");
    return tx.store()->findAll<OrphanedAttachment>(q);
}

std::vector<std::shared_ptr<OrphanedAttachment>> OrphanedAttachmentStore::findForMediaId(std::string mediaId, AttachmentStoreTransaction & tx) {
    Query q = Query().equal("mediaId", mediaId);
    return tx.store()->findAll<OrphanedAttachment>(q);
}
