#include "attachsync/models/account.hpp"


std::string Account::TABLE_NAME = "Account";

Account::Account(nlohmann::json json) : StoreModel(json) {

}

std::string Account::valid() {
    if (!_data.count("id")) {
        return "id";
    }
    if (!_data.count("aci") || !_data["aci"].is_string()) {
        return "aci";
    }
    if (!_data.count("isPrimaryDevice") || !_data["isPrimaryDevice"].is_boolean()) {
        return "isPrimaryDevice";
    }
    if (!_data.count("backupToken") || !_data["backupToken"].is_string()) {
        return "backupToken";
    }
    return ""; // true
}

std::string Account::aci() {
    if (!_data.count("aci") || !_data["aci"].is_string()) {
        return "";
    }
    return _data["aci"].get<std::string>();
}

bool Account::isPrimaryDevice() {
    return _data.count("isPrimaryDevice") && _data["isPrimaryDevice"].is_boolean() && _data["isPrimaryDevice"].get<bool>();
}

std::string Account::mediaRootKey() {
    if (!_data.count("mediaRootKey") || !_data["mediaRootKey"].is_string()) {
        return "";
    }
    return _data["mediaRootKey"].get<std::string>();
}

std::string Account::backupToken() {
    if (!_data.count("backupToken") || !_data["backupToken"].is_string()) {
        return "";
    }
    return _data["backupToken"].get<std::string>();
}

std::string Account::tableName() {
    return Account::TABLE_NAME;
}

std::vector<std::string> Account::columnsForQuery() {
    return std::vector<std::string>{"id", "data", "version"};
}
