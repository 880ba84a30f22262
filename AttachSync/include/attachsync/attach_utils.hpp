/** AttachUtils [AttachSync]
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

#ifndef AttachUtils_hpp
#define AttachUtils_hpp

#include <stdio.h>
#include <string>
#include <vector>
#include <iterator>

class AttachUtils {
public:
    static std::string getEnvUTF8(std::string key);

    static bool fileExists(std::string path);

    static void sleepWorkerUntilWakeOrSec(int sec);
    static void wakeAllWorkers();

    template<typename T>
    static std::vector<std::vector<T>> chunksOfVector(std::vector<T> & v, size_t chunkSize) {
        std::vector<std::vector<T>> results{};

        while (v.size() > 0) {
            auto from = v.begin();
            auto to = v.size() > chunkSize ? from + chunkSize : v.end();

            results.push_back(std::vector<T>{std::make_move_iterator(from), std::make_move_iterator(to)});
            v.erase(from, to);
        }
        return results;
    }
};

#endif /* AttachUtils_hpp */
