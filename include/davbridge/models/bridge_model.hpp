/** BridgeModel [DAVBridge]
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

#ifndef BridgeModel_hpp
#define BridgeModel_hpp

#include <ctime>
#include <string>

#include "nlohmann/json.hpp"

// Models are thin accessors over a JSON document, so that a model can be
// logged, dumped by `--mode sync` and compared without extra code.
class BridgeModel {
public:
    nlohmann::json _data;

    BridgeModel(std::string id);
    BridgeModel(nlohmann::json json);
    virtual ~BridgeModel() {}

    std::string id() const;

    virtual nlohmann::json toJSON() const;

protected:
    std::string stringValue(const char * key) const;
    time_t timeValue(const char * key) const;
};

#endif /* BridgeModel_hpp */
