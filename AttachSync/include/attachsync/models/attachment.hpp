/** Attachment [AttachSync]
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

#ifndef Attachment_hpp
#define Attachment_hpp

#include <stdio.h>
#include <string>
#include "nlohmann/json.hpp"

#include "attachsync/models/store_model.hpp"


/*
 An attachment row as the queue sees it. Every tier pointer is optional:

 stream              {byteCount, digest, localPath}
 thumbnailStream     {byteCount, localPath}
 transitTier         {cdnKey, cdnNumber, byteCount, digest, uploadTimestamp}
 mediaTier           {cdnNumber|null, byteCount, digest, uploadEra, lastDownloadAttemptTimestamp}
 thumbnailMediaTier  {cdnNumber|null, uploadEra}
*/
class Attachment : public StoreModel {

public:
    static std::string TABLE_NAME;

    Attachment(std::string id, std::string contentType);
    Attachment(nlohmann::json json);
    Attachment(SQLite::Statement & query);

    std::string tableName();

    bool hasMediaName();
    std::string mediaName();
    std::string thumbnailMediaName();
    void setMediaName(std::string name);

    std::string contentType();
    bool canBeThumbnailed();

    // Declared plaintext size, used when no tier carries one
    int64_t declaredByteCount();
    int64_t fullsizeByteCount();
    std::string fullsizeDigest();

    bool hasStream();
    nlohmann::json & stream();
    void setStream(int64_t byteCount, std::string digest, std::string localPath);

    bool hasThumbnailStream();
    nlohmann::json & thumbnailStream();
    void setThumbnailStream(int64_t byteCount, std::string localPath);

    bool hasTransitTier();
    nlohmann::json & transitTier();
    void setTransitTier(std::string cdnKey, int cdnNumber, int64_t byteCount, std::string digest, time_t uploadTimestamp);
    time_t transitTierUploadTimestamp();
    void clearTransitTier();

    bool hasMediaTier();
    bool hasMediaTierCdnNumber();
    int mediaTierCdnNumber();
    std::string mediaTierUploadEra();
    void markUploadedToMediaTier(int cdnNumber, int64_t byteCount, std::string digest, std::string uploadEra);
    void markMediaTierUploadExpired();
    void setMediaTierLastDownloadAttempt(time_t timestamp);

    bool hasThumbnailMediaTierInfo();
    bool hasThumbnailMediaTierCdnNumber();
    int thumbnailMediaTierCdnNumber();
    std::string thumbnailMediaTierUploadEra();
    void markThumbnailUploadedToMediaTier(int cdnNumber, std::string uploadEra);
    void markThumbnailMediaTierUploadExpired();

    std::vector<std::string> columnsForQuery();
    void bindToQuery(SQLite::Statement * query);
};

#endif /* Attachment_hpp */
