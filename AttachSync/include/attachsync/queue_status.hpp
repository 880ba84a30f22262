/** QueueStatus [AttachSync]
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

#ifndef QueueStatus_hpp
#define QueueStatus_hpp

#include <stdio.h>
#include <stdint.h>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "attachsync/transfer_exception.hpp"

enum class QueueStatus {
    Running,
    Empty,
    NotRegisteredAndReady,
    NoWifiReachability,
    NoReachability,
    LowBattery,
    LowDiskSpace,
    AppBackgrounded
};

std::string QueueStatusToString(QueueStatus status);

// Every status except Running and Empty pauses the queue.
bool QueueStatusIsBlocking(QueueStatus status);

// The retryable error a task returns when it finds its queue paused.
std::shared_ptr<TransferException> QueueBlockedError(QueueStatus status);

enum class Connectivity { None, Cellular, Wifi };

std::string ConnectivityToString(Connectivity connectivity);
Connectivity ConnectivityFromString(std::string value);

class DeviceSignals {
public:
    bool registeredAndReady;
    Connectivity connectivity;
    int batteryPercent;
    bool charging;
    int64_t availableDiskBytes; // -1 = unknown
    bool foregrounded;

    DeviceSignals();

    nlohmann::json toJSON() const;
};

// Applies the keys present in `json` on top of `current`.
DeviceSignals DeviceSignalsFromJSON(const nlohmann::json & json, const DeviceSignals & current);

typedef std::function<void(QueueStatus)> QueueStatusObserver;

/*
 Observable status for one queue. The status is recomputed whenever a signal
 or the empty flag changes; observers are called synchronously, outside of
 the gate's lock, only when the value actually changes.
*/
class QueueStatusGate {
    std::string _name;
    bool _checksDiskSpace;
    bool _requiresForeground;
    int _lowBatteryPercent;
    int64_t _minDiskHeadroomBytes;

    std::mutex _mtx;
    DeviceSignals _signals;
    bool _queueEmpty;
    bool _wifiRequired;
    QueueStatus _status;
    std::vector<QueueStatusObserver> _observers;
    std::shared_ptr<spdlog::logger> logger;

    QueueStatus computeStatus();
    void recompute(std::unique_lock<std::mutex> & lck);

public:
    QueueStatusGate(std::string name, bool checksDiskSpace, bool requiresForeground, int lowBatteryPercent, int64_t minDiskHeadroomBytes);

    std::string name();

    QueueStatus currentStatus();
    DeviceSignals signals();

    void updateSignals(DeviceSignals signals);
    void setQueueEmpty(bool empty);
    void didEmptyQueue();
    void setWifiRequired(bool required);

    void addObserver(QueueStatusObserver observer);
};

#endif /* QueueStatus_hpp */
