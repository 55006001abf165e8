/** CalDAVHandler [DAVBridge]
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

#ifndef CalDAVHandler_hpp
#define CalDAVHandler_hpp

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"
#include "davbridge/cache_store.hpp"
#include "davbridge/dav_exception.hpp"
#include "davbridge/dav_xml.hpp"
#include "davbridge/multistatus_writer.hpp"
#include "davbridge/resource_tree.hpp"

struct DAVRequest {
    std::string method;
    std::string path;       // request target without the query string
    std::string query;
    std::map<std::string, std::string> headers;   // lowercase names
    std::string body;

    std::string header(const std::string & name) const;
};

struct DAVResponse {
    int status = 200;
    std::map<std::string, std::string> headers;
    std::string body;

    DAVResponse() {}
    DAVResponse(int status, std::string body = "", std::string contentType = "");
};

struct CalDAVSettings {
    std::string username;
    std::string password;
    std::string realm = "DAVBridge";
    std::vector<std::string> publicTokens;
};

// (namespace, local name)
typedef std::pair<std::string, std::string> PropertyName;

enum class PropfindMode {
    AllProp,
    PropName,
    Prop
};

struct PropertyRequest {
    PropfindMode mode = PropfindMode::AllProp;
    std::vector<PropertyName> names;
    bool specified = false;   // the body named allprop, propname or prop
};

/*
 Answers WebDAV/CalDAV requests from the published snapshot. handle() takes
 exactly one CacheStore::current() reference per request and never talks to
 the upstream, so it is safe to call from any number of threads.
 */
class CalDAVHandler {
    std::shared_ptr<CacheStore> _store;
    CalDAVSettings _settings;
    std::function<nlohmann::json()> _health;
    std::shared_ptr<spdlog::logger> logger;

public:
    CalDAVHandler(std::shared_ptr<CacheStore> store, CalDAVSettings settings, std::function<nlohmann::json()> health = nullptr);

    DAVResponse handle(const DAVRequest & request);

    bool authenticate(const DAVRequest & request) const;
    bool isPublicToken(const std::string & token) const;

    static int parseDepth(const DAVRequest & request);
    static PropertyRequest parsePropertyRequest(DavXML & xml, xmlNodePtr container);
    static std::string hrefToPath(const std::string & href);
    static bool etagMatches(const std::string & ifNoneMatch, const std::string & etag);

private:
    DAVResponse dispatch(const DAVRequest & request, const Snapshot & snapshot);
    DAVResponse handleOptions() const;
    DAVResponse handleHealth(const Snapshot & snapshot) const;
    DAVResponse handleGet(const DAVRequest & request, const Resource & resource, const Snapshot & snapshot) const;
    DAVResponse handleSubscription(const DAVRequest & request, const Snapshot & snapshot) const;
    DAVResponse handlePropfind(const DAVRequest & request, const Resource & resource, const Snapshot & snapshot) const;
    DAVResponse handleReport(const DAVRequest & request, const Resource & resource, const Snapshot & snapshot) const;

    DAVResponse calendarQuery(DavXML & xml, const Resource & calendar) const;
    DAVResponse calendarMultiget(DavXML & xml, const Resource & calendar, const Snapshot & snapshot) const;
    DAVResponse syncCollection(DavXML & xml, const Resource & calendar) const;

    DAVResponse calendarBody(const DAVRequest & request, const std::string & ics, const std::string & etag, time_t lastModified) const;
    DAVResponse errorResponse(const DAVException & ex) const;
    DAVResponse multistatusResponse(MultistatusWriter & writer) const;

    void writeResource(MultistatusWriter & writer, const Resource & resource, const PropertyRequest & request) const;
    bool resolveProperty(const Resource & resource, const PropertyName & name, DAVProperty & out) const;
    std::vector<PropertyName> allPropertyNames() const;
};

#endif /* CalDAVHandler_hpp */
