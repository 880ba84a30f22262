/** DeltaStream [AttachSync]
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

/*
 The DeltaStream broadcasts queue status and transfer progress on stdout as
 newline-delimited JSON. Deltas are buffered briefly, and repeated updates for
 the same queue collapse into the latest one, so a busy drain doesn't flood
 the parent process.
*/
#ifndef DeltaStream_hpp
#define DeltaStream_hpp

#include <stdio.h>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#define DELTA_TYPE_QUEUE_STATUS       "queue-status"
#define DELTA_TYPE_TRANSFER_PROGRESS  "transfer-progress"

class DeltaStreamItem {
public:
    std::string type;
    std::vector<nlohmann::json> modelJSONs;
    std::string modelClass;
    std::map<std::string, size_t> idIndexes;

    DeltaStreamItem(std::string type, std::string modelClass, std::vector<nlohmann::json> modelJSONs);

    bool concatenate(const DeltaStreamItem & other);
    void upsertModelJSON(const nlohmann::json & modelJSON);
    std::string dump() const;
};

class DeltaStream {
    std::mutex bufferMtx;
    std::map<std::string, std::vector<DeltaStreamItem>> buffer;
    std::ostream * output;

    bool scheduled;
    std::chrono::system_clock::time_point scheduledTime;
    std::mutex bufferFlushMtx;
    std::condition_variable bufferFlushCv;

public:
    DeltaStream();
    ~DeltaStream();

    // Tests redirect output away from stdout
    void setOutput(std::ostream * out);

    nlohmann::json waitForJSON();

    void flushBuffer();
    void flushWithin(int ms);

    void queueDeltaForDelivery(DeltaStreamItem item);

    void emit(DeltaStreamItem item, int maxDeliveryDelay);
    void emit(std::vector<DeltaStreamItem> items, int maxDeliveryDelay);

    void emitQueueStatus(std::string queue, std::string status, int maxDeliveryDelay);
    void emitTransferProgress(std::string queue, int64_t completed, int64_t total, int maxDeliveryDelay);
};


std::shared_ptr<DeltaStream> SharedDeltaStream();

#endif /* DeltaStream_hpp */
