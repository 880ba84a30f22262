#include "attachsync/http_backup_request_manager.hpp"
#include "attachsync/network_request_utils.hpp"
#include "attachsync/transfer_exception.hpp"


HttpBackupRequestManager::HttpBackupRequestManager(std::string server, std::shared_ptr<Account> account, DateProvider dateProvider) :
    _server(server), _account(account), _dateProvider(dateProvider), logger(spdlog::get("logger"))
{
}

BackupServiceAuth HttpBackupRequestManager::fetchBackupServiceAuth(std::string tierKey, std::string localAci, bool forceRefreshUnlessCachedPaidCredential) {
    std::string key = tierKey + ":" + localAci;

    // There's not much of a point to having two threads request the same credential
    // at once. Only allow one thread to access / update the cache.
    std::lock_guard<std::mutex> guard(_cacheLock);

    if (_cache.find(key) != _cache.end()) {
        BackupServiceAuth auth = _cache.at(key);
        // buffer of 60 sec since we actually need time to use the credential
        bool fresh = auth.expiryDate > _dateProvider() + 60;
        if (fresh && (!forceRefreshUnlessCachedPaidCredential || auth.isPaid())) {
            return auth;
        }
    }

    logger->info("Fetching {} tier backup credential for {}", tierKey, localAci);

    CURL * curl_handle = CreateJSONRequest(_server + "/v1/archives/auth?tier=" + tierKey, "GET", "Basic " + _account->backupToken());
    nlohmann::json resp = nullptr;
    try {
        resp = PerformJSONRequest(curl_handle);
    } catch (TransferException & ex) {
        if (ex.httpStatus == 404) {
            throw TransferException(TRANSFER_ERROR_NO_BACKUP_ID, ex.debuginfo, false);
        }
        throw;
    }

    if (!resp.is_object() || !resp.count("credential") || !resp["credential"].is_string()) {
        throw TransferException(TRANSFER_ERROR_INVALID_RESPONSE, "Backup auth response had no credential: " + resp.dump(), true);
    }

    BackupServiceAuth auth;
    auth.token = resp["credential"].get<std::string>();
    auth.level = resp.count("level") && resp["level"].is_string() ? resp["level"].get<std::string>() : BACKUP_LEVEL_FREE;
    int64_t expiresIn = resp.count("expiresIn") && resp["expiresIn"].is_number() ? resp["expiresIn"].get<int64_t>() : 0;
    auth.expiryDate = _dateProvider() + (time_t)expiresIn;
    _cache[key] = auth;
    return auth;
}

ListMediaPage HttpBackupRequestManager::listMediaObjects(std::string cursor, int limit, const BackupServiceAuth & auth) {
    std::string url = _server + "/v1/archives/media?";
    CURL * curl_handle = CreateJSONRequest(url, "GET", "Bearer " + auth.token);

    if (limit > 0) {
        url += "limit=" + std::to_string(limit) + "&";
    }
    if (cursor != "") {
        char * escaped = curl_easy_escape(curl_handle, cursor.c_str(), 0);
        url += "cursor=" + std::string(escaped);
        curl_free(escaped);
    }
    curl_easy_setopt(curl_handle, CURLOPT_URL, url.c_str());

    nlohmann::json resp = PerformJSONRequest(curl_handle);

    if (!resp.is_object() || !resp.count("storedMediaObjects") || !resp["storedMediaObjects"].is_array()) {
        throw TransferException(TRANSFER_ERROR_INVALID_RESPONSE, "List media response had no storedMediaObjects: " + resp.dump(), true);
    }

    ListMediaPage page;
    for (const auto & item : resp["storedMediaObjects"]) {
        if (!item.count("mediaId") || !item.count("cdn")) {
            continue;
        }
        page.items.push_back(ListMediaItem{item["mediaId"].get<std::string>(), item["cdn"].get<int>()});
    }
    if (resp.count("cursor") && resp["cursor"].is_string()) {
        page.cursor = resp["cursor"].get<std::string>();
    }
    return page;
}
