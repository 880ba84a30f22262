#include "attachsync/queue_status.hpp"


std::string QueueStatusToString(QueueStatus status) {
    switch (status) {
        case QueueStatus::Running: return "running";
        case QueueStatus::Empty: return "empty";
        case QueueStatus::NotRegisteredAndReady: return "notRegisteredAndReady";
        case QueueStatus::NoWifiReachability: return "noWifiReachability";
        case QueueStatus::NoReachability: return "noReachability";
        case QueueStatus::LowBattery: return "lowBattery";
        case QueueStatus::LowDiskSpace: return "lowDiskSpace";
        case QueueStatus::AppBackgrounded: return "appBackgrounded";
    }
    return "unknown";
}

bool QueueStatusIsBlocking(QueueStatus status) {
    return (status != QueueStatus::Running) && (status != QueueStatus::Empty);
}

std::shared_ptr<TransferException> QueueBlockedError(QueueStatus status) {
    return std::make_shared<TransferException>(TRANSFER_ERROR_QUEUE_BLOCKED, "Queue status is " + QueueStatusToString(status), true);
}

std::string ConnectivityToString(Connectivity connectivity) {
    switch (connectivity) {
        case Connectivity::None: return "none";
        case Connectivity::Cellular: return "cellular";
        case Connectivity::Wifi: return "wifi";
    }
    return "none";
}

Connectivity ConnectivityFromString(std::string value) {
    if (value == "wifi") {
        return Connectivity::Wifi;
    }
    if (value == "cellular") {
        return Connectivity::Cellular;
    }
    return Connectivity::None;
}

// DeviceSignals

DeviceSignals::DeviceSignals() :
    registeredAndReady(false),
    connectivity(Connectivity::None),
    batteryPercent(100),
    charging(false),
    availableDiskBytes(-1),
    foregrounded(true)
{
}

nlohmann::json DeviceSignals::toJSON() const {
    return {
        {"registeredAndReady", registeredAndReady},
        {"connectivity", ConnectivityToString(connectivity)},
        {"batteryPercent", batteryPercent},
        {"charging", charging},
        {"availableDiskBytes", availableDiskBytes},
        {"foregrounded", foregrounded},
    };
}

DeviceSignals DeviceSignalsFromJSON(const nlohmann::json & json, const DeviceSignals & current) {
    DeviceSignals next = current;
    if (!json.is_object()) {
        return next;
    }
    if (json.count("registeredAndReady") && json["registeredAndReady"].is_boolean()) {
        next.registeredAndReady = json["registeredAndReady"].get<bool>();
    }
    if (json.count("connectivity") && json["connectivity"].is_string()) {
        next.connectivity = ConnectivityFromString(json["connectivity"].get<std::string>());
    }
    if (json.count("batteryPercent") && json["batteryPercent"].is_number()) {
        next.batteryPercent = json["batteryPercent"].get<int>();
    }
    if (json.count("charging") && json["charging"].is_boolean()) {
        next.charging = json["charging"].get<bool>();
    }
    if (json.count("availableDiskBytes") && json["availableDiskBytes"].is_number()) {
        next.availableDiskBytes = json["availableDiskBytes"].get<int64_t>();
    }
    if (json.count("foregrounded") && json["foregrounded"].is_boolean()) {
        next.foregrounded = json["foregrounded"].get<bool>();
    }
    return next;
}

// QueueStatusGate

QueueStatusGate::QueueStatusGate(std::string name, bool checksDiskSpace, bool requiresForeground, int lowBatteryPercent, int64_t minDiskHeadroomBytes) :
    _name(name),
    _checksDiskSpace(checksDiskSpace),
    _requiresForeground(requiresForeground),
    _lowBatteryPercent(lowBatteryPercent),
    _minDiskHeadroomBytes(minDiskHeadroomBytes),
    _queueEmpty(false),
    _wifiRequired(false),
    logger(spdlog::get("logger"))
{
    _status = computeStatus();
}

std::string QueueStatusGate::name() {
    return _name;
}

QueueStatus QueueStatusGate::computeStatus() {
    if (!_signals.registeredAndReady) {
        return QueueStatus::NotRegisteredAndReady;
    }
    if (_queueEmpty) {
        return QueueStatus::Empty;
    }
    if (_checksDiskSpace && _signals.availableDiskBytes >= 0 && _signals.availableDiskBytes < _minDiskHeadroomBytes) {
        return QueueStatus::LowDiskSpace;
    }
    if (_signals.batteryPercent < _lowBatteryPercent && !_signals.charging) {
        return QueueStatus::LowBattery;
    }
    if (_wifiRequired && _signals.connectivity != Connectivity::Wifi) {
        return QueueStatus::NoWifiReachability;
    }
    if (_signals.connectivity == Connectivity::None) {
        return QueueStatus::NoReachability;
    }
    if (_requiresForeground && !_signals.foregrounded) {
        return QueueStatus::AppBackgrounded;
    }
    return QueueStatus::Running;
}

void QueueStatusGate::recompute(std::unique_lock<std::mutex> & lck) {
    QueueStatus next = computeStatus();
    if (next == _status) {
        return;
    }
    logger->info("[{}] Queue status {} => {}", _name, QueueStatusToString(_status), QueueStatusToString(next));
    _status = next;
    std::vector<QueueStatusObserver> observers = _observers;
    lck.unlock();

    for (auto & observer : observers) {
        observer(next);
    }
}

QueueStatus QueueStatusGate::currentStatus() {
    std::unique_lock<std::mutex> lck(_mtx);
    QueueStatus status = computeStatus();
    recompute(lck);
    return status;
}

DeviceSignals QueueStatusGate::signals() {
    std::lock_guard<std::mutex> lck(_mtx);
    return _signals;
}

void QueueStatusGate::updateSignals(DeviceSignals signals) {
    std::unique_lock<std::mutex> lck(_mtx);
    _signals = signals;
    recompute(lck);
}

void QueueStatusGate::setQueueEmpty(bool empty) {
    std::unique_lock<std::mutex> lck(_mtx);
    _queueEmpty = empty;
    recompute(lck);
}

void QueueStatusGate::didEmptyQueue() {
    setQueueEmpty(true);
}

void QueueStatusGate::setWifiRequired(bool required) {
    std::unique_lock<std::mutex> lck(_mtx);
    _wifiRequired = required;
    recompute(lck);
}

void QueueStatusGate::addObserver(QueueStatusObserver observer) {
    std::lock_guard<std::mutex> lck(_mtx);
    _observers.push_back(observer);
}
