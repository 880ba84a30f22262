#include "attachsync/delta_stream.hpp"
#include "attachsync/thread_utils.hpp"

#include <iostream>
#include <thread>

// Singleton Implementation

std::shared_ptr<DeltaStream> _globalStream = std::make_shared<DeltaStream>();

std::shared_ptr<DeltaStream> SharedDeltaStream() {
    return _globalStream;
}

// DeltaStreamItem

DeltaStreamItem::DeltaStreamItem(std::string type, std::string modelClass, std::vector<nlohmann::json> inJSONs) :
    type(type), modelClass(modelClass)
{
    for (const auto & itemJSON : inJSONs) {
        upsertModelJSON(itemJSON);
    }
}

bool DeltaStreamItem::concatenate(const DeltaStreamItem & other) {
    if (other.type != type || other.modelClass != modelClass) {
        return false;
    }
    for (const auto & modelJSON : other.modelJSONs) {
        upsertModelJSON(modelJSON);
    }
    return true;
}

void DeltaStreamItem::upsertModelJSON(const nlohmann::json & item) {
    // Replace any entry for the same queue, or append. Two updates for the
    // same queue inside one flush window deliver only the last.
    std::string id = item["id"].get<std::string>();

    if (idIndexes.count(id)) {
        modelJSONs[idIndexes[id]] = item;
    } else {
        idIndexes[id] = modelJSONs.size();
        modelJSONs.push_back(item);
    }
}

std::string DeltaStreamItem::dump() const {
    nlohmann::json j = {
        {"type", type},
        {"modelJSONs", modelJSONs},
        {"modelClass", modelClass}
    };
    return j.dump();
}

// Class

DeltaStream::DeltaStream() : output(&std::cout), scheduled(false) {
}

DeltaStream::~DeltaStream() {
}

void DeltaStream::setOutput(std::ostream * out) {
    std::lock_guard<std::mutex> lock(bufferMtx);
    output = out;
}

nlohmann::json DeltaStream::waitForJSON() {
    std::string buffer;
    std::cin.clear();
    getline(std::cin, buffer);
    if (buffer.size() == 0) {
        return {};
    }
    try {
        return nlohmann::json::parse(buffer);
    } catch (nlohmann::json::parse_error & e) {
        spdlog::get("logger")->error("Ignoring unparseable packet: {}", e.what());
    }
    return {};
}

void DeltaStream::flushBuffer() {
    std::lock_guard<std::mutex> lock(bufferMtx);
    for (const auto & it : buffer) {
        for (const auto & item : it.second) {
            (*output) << item.dump() + "\n";
            (*output) << std::flush;
        }
    }
    buffer = {};
    scheduled = false;
}

void DeltaStream::flushWithin(int ms) {
    std::chrono::system_clock::time_point desiredTime = std::chrono::system_clock::now();
    desiredTime += std::chrono::milliseconds(ms);
    std::lock_guard<std::mutex> lock(bufferMtx);

    if (!scheduled) {
        scheduledTime = desiredTime;
        scheduled = true;

        std::thread([this]() {
            SetThreadName("DeltaStreamFlush");
            std::unique_lock<std::mutex> lck(bufferFlushMtx);
            bufferFlushCv.wait_until(lck, this->scheduledTime);
            this->flushBuffer();
        }).detach();
    } else if (scheduled && (desiredTime < scheduledTime)) {
        std::unique_lock<std::mutex> lck(bufferFlushMtx);
        bufferFlushCv.notify_one();
    }
}

void DeltaStream::queueDeltaForDelivery(DeltaStreamItem item) {
    std::lock_guard<std::mutex> lock(bufferMtx);

    if (!buffer.count(item.modelClass)) {
        buffer[item.modelClass] = {};
    }
    if (buffer[item.modelClass].size() == 0 || !buffer[item.modelClass].back().concatenate(item)) {
        buffer[item.modelClass].push_back(item);
    }
}

void DeltaStream::emit(DeltaStreamItem item, int maxDeliveryDelay) {
    queueDeltaForDelivery(item);
    flushWithin(maxDeliveryDelay);
}

void DeltaStream::emit(std::vector<DeltaStreamItem> items, int maxDeliveryDelay) {
    for (const auto & item : items) {
        queueDeltaForDelivery(item);
    }
    flushWithin(maxDeliveryDelay);
}

void DeltaStream::emitQueueStatus(std::string queue, std::string status, int maxDeliveryDelay) {
    nlohmann::json j = {{"id", queue}, {"status", status}};
    emit(DeltaStreamItem(DELTA_TYPE_QUEUE_STATUS, "QueueStatus", std::vector<nlohmann::json>{j}), maxDeliveryDelay);
}

void DeltaStream::emitTransferProgress(std::string queue, int64_t completed, int64_t total, int maxDeliveryDelay) {
    nlohmann::json j = {{"id", queue}, {"completed", completed}, {"total", total}};
    emit(DeltaStreamItem(DELTA_TYPE_TRANSFER_PROGRESS, "TransferProgress", std::vector<nlohmann::json>{j}), maxDeliveryDelay);
}
