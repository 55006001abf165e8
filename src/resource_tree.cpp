#include "davbridge/resource_tree.hpp"
#include "davbridge/bridge_utils.hpp"
#include "davbridge/constants.hpp"

using namespace std;

bool Resource::exists() const {
    return kind != ResourceKind::NotFound;
}

bool Resource::isCollection() const {
    return kind == ResourceKind::Root ||
        kind == ResourceKind::PrincipalCollection ||
        kind == ResourceKind::Principal ||
        kind == ResourceKind::CalendarHome ||
        kind == ResourceKind::Calendar;
}

// Splits a request path into decoded segments. Empty segments (duplicate
// or trailing slashes) are skipped, so "/calendars/p1" and
// "/calendars/p1/" resolve alike.
vector<string> ResourceTree::pathSegments(const string & path) {
    vector<string> segments;
    string stripped = path;
    size_t query = stripped.find('?');
    if (query != string::npos) {
        stripped = stripped.substr(0, query);
    }
    for (const auto & raw : BridgeUtils::split(stripped, '/')) {
        if (raw == "") {
            continue;
        }
        segments.push_back(BridgeUtils::urlDecode(raw));
    }
    return segments;
}

bool ResourceTree::isWellKnown(const string & path) {
    auto segments = pathSegments(path);
    return segments.size() == 2 && segments[0] == ".well-known" && segments[1] == "caldav";
}

Resource ResourceTree::calendarResource(const CalendarEntry & calendar) {
    Resource r;
    r.kind = ResourceKind::Calendar;
    r.projectId = calendar.project.id();
    r.calendar = &calendar;
    return r;
}

Resource ResourceTree::eventResource(const CalendarEntry & calendar, const CalendarEvent & event) {
    Resource r;
    r.kind = ResourceKind::Event;
    r.projectId = calendar.project.id();
    r.taskId = event.task.id();
    r.calendar = &calendar;
    r.event = &event;
    return r;
}

Resource ResourceTree::principalResource(const string & user) {
    Resource r;
    r.kind = ResourceKind::Principal;
    r.principal = user;
    return r;
}

Resource ResourceTree::resolve(const string & path, const Snapshot & snapshot) {
    Resource notFound;
    auto segments = pathSegments(path);

    if (segments.empty()) {
        Resource r;
        r.kind = ResourceKind::Root;
        return r;
    }

    if (segments[0] == "principals") {
        if (segments.size() == 1) {
            Resource r;
            r.kind = ResourceKind::PrincipalCollection;
            return r;
        }
        if (segments.size() == 2) {
            return principalResource(segments[1]);
        }
        return notFound;
    }

    if (segments[0] == "calendars") {
        if (segments.size() == 1) {
            Resource r;
            r.kind = ResourceKind::CalendarHome;
            return r;
        }
        const CalendarEntry * calendar = snapshot.find(segments[1]);
        if (calendar == nullptr) {
            return notFound;
        }
        if (segments.size() == 2) {
            return calendarResource(*calendar);
        }
        if (segments.size() != 3) {
            return notFound;
        }
        const string & name = segments[2];
        if (name == CALENDAR_FILE_NAME) {
            Resource r;
            r.kind = ResourceKind::CalendarFile;
            r.projectId = calendar->project.id();
            r.calendar = calendar;
            return r;
        }
        if (!BridgeUtils::endsWith(name, ".ics") || name.size() == 4) {
            return notFound;
        }
        const CalendarEvent * event = calendar->find(name.substr(0, name.size() - 4));
        if (event == nullptr) {
            return notFound;
        }
        return eventResource(*calendar, *event);
    }

    if (segments[0] == "subscribe" && segments.size() == 3) {
        const string & name = segments[2];
        if (!BridgeUtils::endsWith(name, ".ics") || name.size() == 4) {
            return notFound;
        }
        Resource r;
        r.kind = ResourceKind::Subscription;
        r.token = segments[1];
        if (name != SUBSCRIBE_ALL_NAME) {
            r.calendar = snapshot.find(name.substr(0, name.size() - 4));
            if (r.calendar == nullptr) {
                return notFound;
            }
            r.projectId = r.calendar->project.id();
        }
        return r;
    }

    return notFound;
}

vector<Resource> ResourceTree::children(const Resource & resource, const Snapshot & snapshot) {
    vector<Resource> result;
    switch (resource.kind) {
        case ResourceKind::Root: {
            Resource principals;
            principals.kind = ResourceKind::PrincipalCollection;
            result.push_back(principals);
            Resource home;
            home.kind = ResourceKind::CalendarHome;
            result.push_back(home);
            break;
        }
        case ResourceKind::CalendarHome:
            for (const auto & pair : snapshot.calendars) {
                result.push_back(calendarResource(pair.second));
            }
            break;
        case ResourceKind::Calendar:
            if (resource.calendar != nullptr) {
                for (const auto & event : resource.calendar->events) {
                    result.push_back(eventResource(*resource.calendar, event));
                }
            }
            break;
        default:
            break;
    }
    return result;
}

string ResourceTree::hrefFor(const Resource & resource) {
    switch (resource.kind) {
        case ResourceKind::Root:
            return "/";
        case ResourceKind::PrincipalCollection:
            return "/principals/";
        case ResourceKind::Principal:
            return "/principals/" + BridgeUtils::urlEncodeSegment(resource.principal) + "/";
        case ResourceKind::CalendarHome:
            return "/calendars/";
        case ResourceKind::Calendar:
            return "/calendars/" + BridgeUtils::urlEncodeSegment(resource.projectId) + "/";
        case ResourceKind::Event:
            return "/calendars/" + BridgeUtils::urlEncodeSegment(resource.projectId) + "/" + BridgeUtils::urlEncodeSegment(resource.taskId) + ".ics";
        case ResourceKind::CalendarFile:
            return "/calendars/" + BridgeUtils::urlEncodeSegment(resource.projectId) + "/" + CALENDAR_FILE_NAME;
        case ResourceKind::Subscription:
            return "/subscribe/" + BridgeUtils::urlEncodeSegment(resource.token) + "/" +
                (resource.projectId == "" ? string(SUBSCRIBE_ALL_NAME) : BridgeUtils::urlEncodeSegment(resource.projectId) + ".ics");
        default:
            return "";
    }
}
