/** MediaIdDeriver [AttachSync]
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

#ifndef MediaIdDeriver_hpp
#define MediaIdDeriver_hpp

#include <stdio.h>
#include <string>

// Derives the remote object id of a media name under the media root key.
class MediaIdDeriver {
public:
    virtual ~MediaIdDeriver() {}

    virtual std::string mediaId(std::string mediaName, std::string mediaRootKey) = 0;
};

#endif /* MediaIdDeriver_hpp */
