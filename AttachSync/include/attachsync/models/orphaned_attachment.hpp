/** OrphanedAttachment [AttachSync]
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

#ifndef OrphanedAttachment_hpp
#define OrphanedAttachment_hpp

#include <stdio.h>
#include <string>
#include "nlohmann/json.hpp"

#include "attachsync/models/store_model.hpp"

#define ORPHAN_TYPE_DISCOVERED_ON_SERVER "discovered-on-server"
#define ORPHAN_TYPE_FULLSIZE             "fullsize"
#define ORPHAN_TYPE_THUMBNAIL            "thumbnail"

// A remote media object that should be deleted by the server-side sweep.
class OrphanedAttachment : public StoreModel {

public:
    static std::string TABLE_NAME;

    static std::string IdFor(std::string mediaId, int cdnNumber);

    OrphanedAttachment(std::string mediaId, int cdnNumber, std::string mediaName, std::string type);
    OrphanedAttachment(nlohmann::json json);
    OrphanedAttachment(SQLite::Statement & query);

    std::string tableName();

    std::string mediaId();
    bool hasCdnNumber();
    int cdnNumber();
    std::string mediaName();
    std::string type();

    std::vector<std::string> columnsForQuery();
    void bindToQuery(SQLite::Statement * query);
};

#endif /* OrphanedAttachment_hpp */
