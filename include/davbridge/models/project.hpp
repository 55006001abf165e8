/** Project [DAVBridge]
 *
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

#ifndef Project_hpp
#define Project_hpp

#include <string>
#include "nlohmann/json.hpp"

#include "davbridge/models/bridge_model.hpp"

using namespace nlohmann;
using namespace std;

class Project : public BridgeModel {

public:
    Project(json json);
    Project(string id, string name);

    string name() const;
    void setName(string name);

    string description() const;
    void setDescription(string description);

    string owner() const;
    void setOwner(string owner);

    time_t createdAt() const;
    void setCreatedAt(time_t t);

    time_t modifiedAt() const;
    void setModifiedAt(time_t t);
};

#endif /* Project_hpp */
