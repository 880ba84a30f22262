/** StoreModel [AttachSync]
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

#ifndef StoreModel_hpp
#define StoreModel_hpp

#include <stdio.h>
#include <vector>
#include <string>

#include "SQLiteCpp/SQLiteCpp.h"

#include "nlohmann/json.hpp"


class AttachmentStore;

class StoreModel {
public:
    nlohmann::json _data;

    static std::string TABLE_NAME;
    virtual std::string tableName();

    StoreModel(std::string id, int version = 0);
    StoreModel(SQLite::Statement & query);
    StoreModel(nlohmann::json json);
    virtual ~StoreModel() {}

    std::string id();
    int version();
    void incrementVersion();

    virtual void bindToQuery(SQLite::Statement * query);

    virtual std::vector<std::string> columnsForQuery() = 0;

    virtual nlohmann::json toJSON();

protected:
    // Nullable integer helpers. Several fields distinguish "unknown" from zero.
    static bool hasNumber(const nlohmann::json & parent, const char * key);
    static void bindNullableInt64(SQLite::Statement * query, const char * name, const nlohmann::json & value);
};

#endif /* StoreModel_hpp */
