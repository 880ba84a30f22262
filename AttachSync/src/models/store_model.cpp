#include "attachsync/models/store_model.hpp"
#include "attachsync/transfer_exception.hpp"


std::string StoreModel::TABLE_NAME = "StoreModel";

StoreModel::StoreModel(std::string id, int version) :
    _data(nlohmann::json::object())
{
    _data["id"] = id;
    _data["v"] = version;
}

StoreModel::StoreModel(SQLite::Statement & query) :
    _data(nlohmann::json::parse(query.getColumn("data").getString()))
{
}

StoreModel::StoreModel(nlohmann::json json) :
    _data(json)
{
    if (!_data.is_object() || !_data.count("id")) {
        throw TransferException("invalid-model", "Model JSON must be an object with an id: " + json.dump(), false);
    }
    if (!_data.count("v")) {
        _data["v"] = 0;
    }
}

std::string StoreModel::id()
{
    return _data["id"].get<std::string>();
}

int StoreModel::version()
{
    return _data["v"].get<int>();
}

void StoreModel::incrementVersion()
{
    _data["v"] = _data["v"].get<int>() + 1;
}

std::string StoreModel::tableName()
{
    return TABLE_NAME;
}

nlohmann::json StoreModel::toJSON()
{
    if (!_data.count("__cls")) {
        _data["__cls"] = this->tableName();
    }
    return _data;
}

void StoreModel::bindToQuery(SQLite::Statement * query) {
    query->bind(":id", id());
    query->bind(":data", this->toJSON().dump());
    query->bind(":version", version());
}

bool StoreModel::hasNumber(const nlohmann::json & parent, const char * key) {
    return parent.is_object() && parent.count(key) && parent[key].is_number();
}

void StoreModel::bindNullableInt64(SQLite::Statement * query, const char * name, const nlohmann::json & value) {
    if (value.is_number()) {
        query->bind(name, (int64_t)value.get<int64_t>());
    } else {
        query->bind(name);
    }
}
