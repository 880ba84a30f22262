/** TransferProgress [AttachSync]
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

#ifndef TransferProgress_hpp
#define TransferProgress_hpp

#include <stdio.h>
#include <stdint.h>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

// Cumulative bytes moved so far by one transfer.
typedef std::function<void(int64_t)> TransferProgressCallback;

typedef std::function<void(int64_t completed, int64_t total)> TransferProgressObserver;

/*
 Aggregates byte progress for one queue. The expected total is seeded from the
 persisted pending byte counter when a drain starts; completed bytes are the
 sum of finished transfers plus the partial progress of running ones.
*/
class TransferProgress {
    std::string _name;
    std::mutex _mtx;
    int64_t _total;
    int64_t _finished;
    std::map<std::string, int64_t> _running;
    std::vector<TransferProgressObserver> _observers;

    int64_t completedLocked();
    void notify(std::unique_lock<std::mutex> & lck);

public:
    TransferProgress(std::string name);

    std::string name();

    void beginObserving(int64_t totalByteCount);

    TransferProgressCallback willBeginTransfer(std::string key);
    void didFinishTransfer(std::string key, int64_t byteCount);

    void didEmptyQueue();

    int64_t completedByteCount();
    int64_t totalByteCount();

    void addObserver(TransferProgressObserver observer);
};

#endif /* TransferProgress_hpp */
