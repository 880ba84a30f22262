#include "attachsync/remote_config.hpp"

#define DAY_SEC (24 * 60 * 60)

DateProvider SystemDateProvider() {
    return []() {
        return time(0);
    };
}

RemoteConfig::RemoteConfig() :
    maxOpportunisticDownloadAgeSec(45 * DAY_SEC),
    maxFullsizeDownloadByteCount(0),
    pendingDownloadByteBudget(0),
    transitTierRetentionSec(45 * DAY_SEC),
    lowBatteryPercent(10),
    minDiskHeadroomBytes(100 * 1024 * 1024),
    numParallelUploads(8),
    numParallelDownloads(4),
    listMediaPageSize(0)
{
}

RemoteConfig::RemoteConfig(const nlohmann::json & json) : RemoteConfig()
{
    if (!json.is_object()) {
        return;
    }
    if (json.count("maxOpportunisticDownloadAgeSec")) {
        maxOpportunisticDownloadAgeSec = (time_t)json["maxOpportunisticDownloadAgeSec"].get<int64_t>();
    }
    if (json.count("maxFullsizeDownloadByteCount")) {
        maxFullsizeDownloadByteCount = json["maxFullsizeDownloadByteCount"].get<int64_t>();
    }
    if (json.count("pendingDownloadByteBudget")) {
        pendingDownloadByteBudget = json["pendingDownloadByteBudget"].get<int64_t>();
    }
    if (json.count("transitTierRetentionSec")) {
        transitTierRetentionSec = (time_t)json["transitTierRetentionSec"].get<int64_t>();
    }
    if (json.count("lowBatteryPercent")) {
        lowBatteryPercent = json["lowBatteryPercent"].get<int>();
    }
    if (json.count("minDiskHeadroomBytes")) {
        minDiskHeadroomBytes = json["minDiskHeadroomBytes"].get<int64_t>();
    }
    if (json.count("numParallelUploads")) {
        numParallelUploads = json["numParallelUploads"].get<int>();
    }
    if (json.count("numParallelDownloads")) {
        numParallelDownloads = json["numParallelDownloads"].get<int>();
    }
    if (json.count("listMediaPageSize")) {
        listMediaPageSize = json["listMediaPageSize"].get<int>();
    }
}

nlohmann::json RemoteConfig::toJSON() {
    return {
        {"maxOpportunisticDownloadAgeSec", (int64_t)maxOpportunisticDownloadAgeSec},
        {"maxFullsizeDownloadByteCount", maxFullsizeDownloadByteCount},
        {"pendingDownloadByteBudget", pendingDownloadByteBudget},
        {"transitTierRetentionSec", (int64_t)transitTierRetentionSec},
        {"lowBatteryPercent", lowBatteryPercent},
        {"minDiskHeadroomBytes", minDiskHeadroomBytes},
        {"numParallelUploads", numParallelUploads},
        {"numParallelDownloads", numParallelDownloads},
        {"listMediaPageSize", listMediaPageSize},
    };
}
