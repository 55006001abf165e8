/** DAVException [DAVBridge]
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

#ifndef DAVException_hpp
#define DAVException_hpp

#include <string>
#include "nlohmann/json.hpp"
#include "davbridge/generic_exception.hpp"

// A client-facing protocol error. `precondition` names a DAV:error child
// element (e.g. "valid-sync-token") and is rendered into the response body
// when present.
class DAVException : public GenericException {
public:
    DAVException(int status, std::string key, std::string di, std::string precondition = "", std::string preconditionNS = "DAV:");

    int status;
    std::string key;
    std::string debuginfo;
    std::string precondition;
    std::string preconditionNS;

    nlohmann::json toJSON() const override;
};

#endif /* DAVException_hpp */
