/** RemoteConfig [AttachSync]
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

#ifndef RemoteConfig_hpp
#define RemoteConfig_hpp

#include <stdio.h>
#include <stdint.h>
#include <time.h>
#include <functional>
#include <string>
#include "nlohmann/json.hpp"

// Returns the current time in seconds. Injected so tests can pin the clock.
typedef std::function<time_t()> DateProvider;

DateProvider SystemDateProvider();


// Server-provided tuning for the transfer queues. Every field has a default,
// so an empty JSON object is a valid configuration.
class RemoteConfig {
public:
    time_t maxOpportunisticDownloadAgeSec;
    int64_t maxFullsizeDownloadByteCount;   // 0 = unlimited
    int64_t pendingDownloadByteBudget;      // 0 = unlimited
    time_t transitTierRetentionSec;
    int lowBatteryPercent;
    int64_t minDiskHeadroomBytes;
    int numParallelUploads;
    int numParallelDownloads;
    int listMediaPageSize;                  // 0 = let the server decide

    RemoteConfig();
    RemoteConfig(const nlohmann::json & json);

    nlohmann::json toJSON();
};

#endif /* RemoteConfig_hpp */
