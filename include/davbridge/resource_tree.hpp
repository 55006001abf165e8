/** ResourceTree [DAVBridge]
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

#ifndef ResourceTree_hpp
#define ResourceTree_hpp

#include <string>
#include <vector>

#include "davbridge/snapshot.hpp"

enum class ResourceKind {
    NotFound,
    Root,
    PrincipalCollection,
    Principal,
    CalendarHome,
    Calendar,
    Event,
    CalendarFile,
    Subscription
};

/*
 A resolved URL. `calendar` and `event` point into the Snapshot that was
 passed to resolve() and are only valid while the caller holds it.
 For subscriptions an empty projectId means "all projects".
 */
struct Resource {
    ResourceKind kind = ResourceKind::NotFound;
    std::string principal;
    std::string projectId;
    std::string taskId;
    std::string token;
    const CalendarEntry * calendar = nullptr;
    const CalendarEvent * event = nullptr;

    bool exists() const;
    bool isCollection() const;
};

class ResourceTree {
public:
    static Resource resolve(const std::string & path, const Snapshot & snapshot);
    static std::vector<Resource> children(const Resource & resource, const Snapshot & snapshot);
    static std::string hrefFor(const Resource & resource);

    static Resource calendarResource(const CalendarEntry & calendar);
    static Resource eventResource(const CalendarEntry & calendar, const CalendarEvent & event);
    static Resource principalResource(const std::string & user);

    static bool isWellKnown(const std::string & path);
    static std::vector<std::string> pathSegments(const std::string & path);
};

#endif /* ResourceTree_hpp */
