#include "attachsync/models/orphaned_attachment.hpp"


std::string OrphanedAttachment::TABLE_NAME = "OrphanedBackupAttachment";

std::string OrphanedAttachment::IdFor(std::string mediaId, int cdnNumber) {
    return mediaId + "@" + (cdnNumber < 0 ? std::string("none") : std::to_string(cdnNumber));
}

OrphanedAttachment::OrphanedAttachment(std::string mediaId, int cdnNumber, std::string mediaName, std::string type) :
    StoreModel(IdFor(mediaId, cdnNumber), 0)
{
    _data["mediaId"] = mediaId;
    if (cdnNumber < 0) {
        _data["cdnNumber"] = nullptr;
    } else {
        _data["cdnNumber"] = cdnNumber;
    }
    if (mediaName == "") {
        _data["mediaName"] = nullptr;
    } else {
        _data["mediaName"] = mediaName;
    }
    _data["type"] = type;
}

OrphanedAttachment::OrphanedAttachment(nlohmann::json json) : StoreModel(json) {

}

OrphanedAttachment::OrphanedAttachment(SQLite::Statement & query) :
    StoreModel(query)
{
}

std::string OrphanedAttachment::tableName() {
    return OrphanedAttachment::TABLE_NAME;
}

std::string OrphanedAttachment::mediaId() {
    return _data["mediaId"].get<std::string>();
}

bool OrphanedAttachment::hasCdnNumber() {
    return hasNumber(_data, "cdnNumber");
}

int OrphanedAttachment::cdnNumber() {
    if (!hasCdnNumber()) {
        return -1;
    }
    return _data["cdnNumber"].get<int>();
}

std::string OrphanedAttachment::mediaName() {
    if (!_data.count("mediaName") || !_data["mediaName"].is_string()) {
        return "";
    }
    return _data["mediaName"].get<std::string>();
}

std::string OrphanedAttachment::type() {
    return _data["type"].get<std::string>();
}

std::vector<std::string> OrphanedAttachment::columnsForQuery() {
    return std::vector<std::string>{"id", "data", "version", "mediaId", "cdnNumber", "type"};
}

void OrphanedAttachment::bindToQuery(SQLite::Statement * query) {
    StoreModel::bindToQuery(query);
    query->bind(":mediaId", mediaId());
    bindNullableInt64(query, ":cdnNumber", _data["cdnNumber"]);
    query->bind(":type", type());
}
