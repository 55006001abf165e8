/** BridgeConfig [DAVBridge]
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

#ifndef BridgeConfig_hpp
#define BridgeConfig_hpp

#include <functional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "davbridge/caldav_handler.hpp"
#include "davbridge/generic_exception.hpp"
#include "davbridge/http_server.hpp"
#include "davbridge/kodbox_client.hpp"
#include "davbridge/logging.hpp"
#include "davbridge/sync_engine.hpp"

class ConfigException : public GenericException {
public:
    explicit ConfigException(std::string what);
};

/*
 Effective configuration. Values are layered: built-in defaults, then the
 JSON config file, then environment variables, then command line options
 (applied by main). Every layer only overrides the keys it names.
 */
class BridgeConfig {
public:
    typedef std::function<std::string(const std::string &)> EnvLookup;

    KodBoxSettings kodbox;
    CalDAVSettings caldav;
    ServerSettings server;
    SyncSettings sync;
    size_t historyDepth = 64;
    LoggingSettings logging;

    std::string sourcePath;

    void applyJSON(const nlohmann::json & json);
    void applyFile(const std::string & path);
    void applyEnvironment(EnvLookup lookup);

    // `serving` also requires the CalDAV credentials.
    void validate(bool serving) const;

    nlohmann::json toJSON() const;

    static std::vector<std::string> candidatePaths(const std::string & explicitPath);
    static BridgeConfig load(const std::string & explicitPath, EnvLookup lookup);
    static std::string processEnvironment(const std::string & key);

private:
    bool upstreamTimeoutExplicit = false;

    void followUpstreamTimeout();
};

#endif /* BridgeConfig_hpp */
