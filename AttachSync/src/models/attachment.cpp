#include "attachsync/models/attachment.hpp"
#include "attachsync/constants.hpp"


std::string Attachment::TABLE_NAME = "Attachment";

Attachment::Attachment(std::string id, std::string contentType) :
    StoreModel(id, 0)
{
    _data["contentType"] = contentType;
}

Attachment::Attachment(nlohmann::json json) : StoreModel(json) {

}

Attachment::Attachment(SQLite::Statement & query) :
    StoreModel(query)
{
}

std::string Attachment::tableName() {
    return Attachment::TABLE_NAME;
}

bool Attachment::hasMediaName() {
    return _data.count("mediaName") && _data["mediaName"].is_string() && _data["mediaName"].get<std::string>() != "";
}

std::string Attachment::mediaName() {
    if (!hasMediaName()) {
        return "";
    }
    return _data["mediaName"].get<std::string>();
}

std::string Attachment::thumbnailMediaName() {
    if (!hasMediaName()) {
        return "";
    }
    return mediaName() + THUMBNAIL_MEDIA_NAME_SUFFIX;
}

void Attachment::setMediaName(std::string name) {
    _data["mediaName"] = name;
}

std::string Attachment::contentType() {
    if (!_data.count("contentType") || !_data["contentType"].is_string()) {
        return "";
    }
    return _data["contentType"].get<std::string>();
}

bool Attachment::canBeThumbnailed() {
    std::string type = contentType();
    return (type.find("image/") == 0) || (type.find("video/") == 0);
}

int64_t Attachment::declaredByteCount() {
    if (hasNumber(_data, "byteCount")) {
        return _data["byteCount"].get<int64_t>();
    }
    return 0;
}

int64_t Attachment::fullsizeByteCount() {
    if (hasStream() && hasNumber(stream(), "byteCount")) {
        return stream()["byteCount"].get<int64_t>();
    }
    if (hasMediaTier() && hasNumber(_data["mediaTier"], "byteCount")) {
        return _data["mediaTier"]["byteCount"].get<int64_t>();
    }
    if (hasTransitTier() && hasNumber(transitTier(), "byteCount")) {
        return transitTier()["byteCount"].get<int64_t>();
    }
    return declaredByteCount();
}

std::string Attachment::fullsizeDigest() {
    if (hasMediaTier() && _data["mediaTier"].count("digest") && _data["mediaTier"]["digest"].is_string()) {
        return _data["mediaTier"]["digest"].get<std::string>();
    }
    if (hasStream() && stream().count("digest") && stream()["digest"].is_string()) {
        return stream()["digest"].get<std::string>();
    }
    if (hasTransitTier() && transitTier().count("digest") && transitTier()["digest"].is_string()) {
        return transitTier()["digest"].get<std::string>();
    }
    return "";
}

// Stream

bool Attachment::hasStream() {
    return _data.count("stream") && _data["stream"].is_object();
}

nlohmann::json & Attachment::stream() {
    return _data["stream"];
}

void Attachment::setStream(int64_t byteCount, std::string digest, std::string localPath) {
    _data["stream"] = {
        {"byteCount", byteCount},
        {"digest", digest},
        {"localPath", localPath},
    };
}

bool Attachment::hasThumbnailStream() {
    return _data.count("thumbnailStream") && _data["thumbnailStream"].is_object();
}

nlohmann::json & Attachment::thumbnailStream() {
    return _data["thumbnailStream"];
}

void Attachment::setThumbnailStream(int64_t byteCount, std::string localPath) {
    _data["thumbnailStream"] = {
        {"byteCount", byteCount},
        {"localPath", localPath},
    };
}

// Transit tier

bool Attachment::hasTransitTier() {
    return _data.count("transitTier") && _data["transitTier"].is_object();
}

nlohmann::json & Attachment::transitTier() {
    return _data["transitTier"];
}

void Attachment::setTransitTier(std::string cdnKey, int cdnNumber, int64_t byteCount, std::string digest, time_t uploadTimestamp) {
    _data["transitTier"] = {
        {"cdnKey", cdnKey},
        {"cdnNumber", cdnNumber},
        {"byteCount", byteCount},
        {"digest", digest},
        {"uploadTimestamp", (int64_t)uploadTimestamp},
    };
}

time_t Attachment::transitTierUploadTimestamp() {
    if (!hasTransitTier() || !hasNumber(transitTier(), "uploadTimestamp")) {
        return 0;
    }
    return (time_t)transitTier()["uploadTimestamp"].get<int64_t>();
}

void Attachment::clearTransitTier() {
    _data.erase("transitTier");
}

// Media tier

bool Attachment::hasMediaTier() {
    return _data.count("mediaTier") && _data["mediaTier"].is_object();
}

bool Attachment::hasMediaTierCdnNumber() {
    return hasMediaTier() && hasNumber(_data["mediaTier"], "cdnNumber");
}

int Attachment::mediaTierCdnNumber() {
    if (!hasMediaTierCdnNumber()) {
        return -1;
    }
    return _data["mediaTier"]["cdnNumber"].get<int>();
}

std::string Attachment::mediaTierUploadEra() {
    if (!hasMediaTier() || !_data["mediaTier"].count("uploadEra") || !_data["mediaTier"]["uploadEra"].is_string()) {
        return "";
    }
    return _data["mediaTier"]["uploadEra"].get<std::string>();
}

void Attachment::markUploadedToMediaTier(int cdnNumber, int64_t byteCount, std::string digest, std::string uploadEra) {
    nlohmann::json lastAttempt = nullptr;
    if (hasMediaTier() && _data["mediaTier"].count("lastDownloadAttemptTimestamp")) {
        lastAttempt = _data["mediaTier"]["lastDownloadAttemptTimestamp"];
    }
    _data["mediaTier"] = {
        {"cdnNumber", cdnNumber},
        {"byteCount", byteCount},
        {"digest", digest},
        {"uploadEra", uploadEra},
        {"lastDownloadAttemptTimestamp", lastAttempt},
    };
}

void Attachment::markMediaTierUploadExpired() {
    if (!hasMediaTier()) {
        return;
    }
    _data["mediaTier"]["cdnNumber"] = nullptr;
}

void Attachment::setMediaTierLastDownloadAttempt(time_t timestamp) {
    if (!hasMediaTier()) {
        return;
    }
    _data["mediaTier"]["lastDownloadAttemptTimestamp"] = (int64_t)timestamp;
}

// Thumbnail media tier

bool Attachment::hasThumbnailMediaTierInfo() {
    return _data.count("thumbnailMediaTier") && _data["thumbnailMediaTier"].is_object();
}

bool Attachment::hasThumbnailMediaTierCdnNumber() {
    return hasThumbnailMediaTierInfo() && hasNumber(_data["thumbnailMediaTier"], "cdnNumber");
}

int Attachment::thumbnailMediaTierCdnNumber() {
    if (!hasThumbnailMediaTierCdnNumber()) {
        return -1;
    }
    return _data["thumbnailMediaTier"]["cdnNumber"].get<int>();
}

std::string Attachment::thumbnailMediaTierUploadEra() {
    if (!hasThumbnailMediaTierInfo() || !_data["thumbnailMediaTier"].count("uploadEra") || !_data["thumbnailMediaTier"]["uploadEra"].is_string()) {
        return "";
    }
    return _data["thumbnailMediaTier"]["uploadEra"].get<std::string>();
}

void Attachment::markThumbnailUploadedToMediaTier(int cdnNumber, std::string uploadEra) {
    _data["thumbnailMediaTier"] = {
        {"cdnNumber", cdnNumber},
        {"uploadEra", uploadEra},
    };
}

void Attachment::markThumbnailMediaTierUploadExpired() {
    if (!hasThumbnailMediaTierInfo()) {
        return;
    }
    _data["thumbnailMediaTier"]["cdnNumber"] = nullptr;
}

std::vector<std::string> Attachment::columnsForQuery() {
    return std::vector<std::string>{"id", "data", "version", "mediaName"};
}

void Attachment::bindToQuery(SQLite::Statement * query) {
    StoreModel::bindToQuery(query);
    if (hasMediaName()) {
        query->bind(":mediaName", mediaName());
    } else {
        query->bind(":mediaName");
    }
}
