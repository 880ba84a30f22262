#include "attachsync/query.hpp"
#include "SQLiteCpp/SQLiteCpp.h"

#include "nlohmann/json.hpp"
#include "attachsync/transfer_exception.hpp"


Query::Query() noexcept : _clauses({}), _orderBy("") {
}

Query & Query::equal(std::string col, std::string val) {
    _clauses[col] = {{"op","="}, {"rhs", val}};
    return *this;
}

Query & Query::notNull(std::string col) {
    _clauses[col] = {{"op","IS NOT NULL"}};
    return *this;
}

Query & Query::orderBy(std::string orderBy) {
    _orderBy = orderBy;
    return *this;
}

std::string Query::getSQL() {
    std::string result = "";

    if (_clauses.size() > 0) {
        result += " WHERE ";

        for (nlohmann::json::iterator it = _clauses.begin(); it != _clauses.end(); ++it) {
            if (it != _clauses.begin()) {
                result += " AND ";
            }
            std::string op = it.value()["op"].get<std::string>();
            if (!it.value().count("rhs")) {
                result += it.key() + " " + op;
            } else {
                result += it.key() + " " + op + " ?";
            }
        }
    }
    if (_orderBy != "") {
        result += " ORDER BY " + _orderBy;
    }
    return result;
}

void Query::bind(SQLite::Statement & query) {
    int ii = 1;
    for (nlohmann::json::iterator it = _clauses.begin(); it != _clauses.end(); ++it) {
        if (!it.value().count("rhs")) {
            continue;
        }
        nlohmann::json & rhs = it.value()["rhs"];
        if (!rhs.is_string()) {
            throw TransferException("query-builder", "Unsure of how to bind json to sqlite", false);
        }
        query.bind(ii++, rhs.get<std::string>());
    }
}
