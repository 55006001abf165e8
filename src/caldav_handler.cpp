#include "davbridge/caldav_handler.hpp"
#include "davbridge/bridge_utils.hpp"
#include "davbridge/constants.hpp"
#include "davbridge/ical_codec.hpp"
#include "davbridge/logging.hpp"

#include <limits>

using namespace std;
using nlohmann::json;

#define CONTENT_TYPE_XML        "application/xml; charset=utf-8"
#define CONTENT_TYPE_CALENDAR   "text/calendar; charset=utf-8"
#define ALLOWED_METHODS         "OPTIONS, GET, HEAD, PROPFIND, REPORT"

namespace {

struct TimeRange {
    time_t start = numeric_limits<time_t>::min();
    time_t end = numeric_limits<time_t>::max();
};

// A task's extent on the time line. All-day values cover the whole day;
// a single date-time is a point (start == end).
struct TaskExtent {
    bool unbounded = true;
    bool dueOnly = false;
    time_t start = 0;
    time_t end = 0;
};

TaskExtent extentFor(const Task & task) {
    TaskExtent extent;
    string s = task.start();
    string d = task.due();
    time_t ts = s == "" ? -1 : BridgeUtils::parseDateValue(s);
    time_t td = d == "" ? -1 : BridgeUtils::parseDateValue(d);
    bool hasStart = s != "" && (ts != -1 || BridgeUtils::isDateTimeUTC(s));
    bool hasDue = d != "" && (td != -1 || BridgeUtils::isDateTimeUTC(d));

    if (hasDue && BridgeUtils::isAllDayDate(d)) {
        td += 86400;
    }

    if (hasStart && hasDue) {
        extent.unbounded = false;
        extent.start = ts;
        extent.end = max(ts, td);
    } else if (hasStart) {
        extent.unbounded = false;
        extent.start = ts;
        extent.end = BridgeUtils::isAllDayDate(s) ? ts + 86400 : ts;
    } else if (hasDue) {
        extent.unbounded = false;
        extent.dueOnly = true;
        extent.start = BridgeUtils::isAllDayDate(d) ? td - 86400 : td;
        extent.end = td;
    }
    return extent;
}

// RFC 4791 section 9.9 overlap test.
bool overlaps(const Task & task, const TimeRange & range) {
    TaskExtent extent = extentFor(task);
    if (extent.unbounded) {
        return true;
    }
    if (extent.start == extent.end) {
        // a todo with only a DUE is matched at its due time, inclusive of the range end
        if (extent.dueOnly) {
            return range.start < extent.end && range.end >= extent.end;
        }
        return range.start <= extent.start && range.end > extent.start;
    }
    return range.start < extent.end && range.end > extent.start;
}

struct ComponentFilter {
    string name;
    bool isNotDefined = false;
    bool hasTimeRange = false;
    TimeRange range;
};

bool isElement(xmlNodePtr node, const char * ns, const char * name) {
    return DavXML::nodeNamespace(node) == ns && DavXML::nodeName(node) == name;
}

xmlNodePtr firstChild(xmlNodePtr node, const char * ns, const char * name) {
    for (auto child : DavXML::childElements(node)) {
        if (isElement(child, ns, name)) {
            return child;
        }
    }
    return nullptr;
}

string quoted(const string & etag) {
    return "\"" + etag + "\"";
}

}

string DAVRequest::header(const string & name) const {
    auto it = headers.find(BridgeUtils::toLowerCase(name));
    if (it == headers.end()) {
        return "";
    }
    return it->second;
}

DAVResponse::DAVResponse(int status, string body, string contentType) :
    status(status), body(body)
{
    if (contentType != "") {
        headers["Content-Type"] = contentType;
    }
}

CalDAVHandler::CalDAVHandler(shared_ptr<CacheStore> store, CalDAVSettings settings, function<json()> health) :
    _store(store),
    _settings(settings),
    _health(health),
    logger(Logging::get("caldav"))
{
}

bool CalDAVHandler::authenticate(const DAVRequest & request) const {
    if (_settings.username == "") {
        return false;
    }
    string header = BridgeUtils::trim(request.header("authorization"));
    if (!BridgeUtils::startsWith(BridgeUtils::toLowerCase(header), "basic ")) {
        return false;
    }
    string decoded = BridgeUtils::fromBase64(BridgeUtils::trim(header.substr(6)));
    size_t colon = decoded.find(':');
    if (colon == string::npos) {
        return false;
    }
    bool userOK = BridgeUtils::constantTimeEquals(decoded.substr(0, colon), _settings.username);
    bool passOK = BridgeUtils::constantTimeEquals(decoded.substr(colon + 1), _settings.password);
    return userOK && passOK;
}

bool CalDAVHandler::isPublicToken(const string & token) const {
    bool found = false;
    for (const auto & candidate : _settings.publicTokens) {
        if (candidate != "" && BridgeUtils::constantTimeEquals(candidate, token)) {
            found = true;
        }
    }
    return found;
}

int CalDAVHandler::parseDepth(const DAVRequest & request) {
    string depth = BridgeUtils::toLowerCase(BridgeUtils::trim(request.header("depth")));
    if (depth == "" || depth == "0") {
        return 0;
    }
    if (depth == "1") {
        return 1;
    }
    if (depth == "infinity") {
        throw DAVException(403, ERROR_PROTOCOL_REQUEST, "Depth: infinity is not supported", "propfind-finite-depth");
    }
    throw DAVException(400, ERROR_PROTOCOL_REQUEST, "Invalid Depth header: " + depth);
}

PropertyRequest CalDAVHandler::parsePropertyRequest(DavXML & xml, xmlNodePtr container) {
    PropertyRequest result;
    for (auto child : DavXML::childElements(container)) {
        if (DavXML::nodeNamespace(child) != NS_DAV) {
            continue;
        }
        string name = DavXML::nodeName(child);
        if (name == "allprop") {
            result.mode = PropfindMode::AllProp;
            result.specified = true;
        } else if (name == "propname") {
            result.mode = PropfindMode::PropName;
            result.specified = true;
        } else if (name == "prop") {
            result.mode = PropfindMode::Prop;
            result.specified = true;
            for (auto prop : DavXML::childElements(child)) {
                result.names.push_back({DavXML::nodeNamespace(prop), DavXML::nodeName(prop)});
            }
        } else if (name == "include") {
            for (auto prop : DavXML::childElements(child)) {
                result.names.push_back({DavXML::nodeNamespace(prop), DavXML::nodeName(prop)});
            }
        }
        if (result.specified && result.mode != PropfindMode::AllProp) {
            break;
        }
    }
    return result;
}

// Accepts "/calendars/p1/t1.ics" as well as absolute URLs.
string CalDAVHandler::hrefToPath(const string & href) {
    string path = BridgeUtils::trim(href);
    size_t scheme = path.find("://");
    if (scheme != string::npos && scheme < path.find('/')) {
        size_t slash = path.find('/', scheme + 3);
        path = slash == string::npos ? "/" : path.substr(slash);
    }
    size_t query = path.find('?');
    if (query != string::npos) {
        path = path.substr(0, query);
    }
    return path;
}

bool CalDAVHandler::etagMatches(const string & ifNoneMatch, const string & etag) {
    for (auto candidate : BridgeUtils::split(ifNoneMatch, ',')) {
        candidate = BridgeUtils::trim(candidate);
        if (candidate == "*") {
            return true;
        }
        if (BridgeUtils::startsWith(candidate, "W/")) {
            candidate = candidate.substr(2);
        }
        if (candidate == quoted(etag) || candidate == etag) {
            return true;
        }
    }
    return false;
}

DAVResponse CalDAVHandler::handle(const DAVRequest & request) {
    auto snapshot = _store->current();
    DAVResponse response;

    try {
        string method = BridgeUtils::toUpperCase(request.method);
        auto segments = ResourceTree::pathSegments(request.path);

        if (segments.size() == 1 && segments[0] == "health" && (method == "GET" || method == "HEAD")) {
            response = handleHealth(*snapshot);
        } else if (ResourceTree::isWellKnown(request.path)) {
            response = DAVResponse(301);
            response.headers["Location"] = "/calendars/";
        } else if (method == "OPTIONS") {
            response = handleOptions();
        } else if (segments.size() && segments[0] == "subscribe" && (method == "GET" || method == "HEAD")) {
            response = handleSubscription(request, *snapshot);
        } else if (!authenticate(request)) {
            throw DAVException(401, ERROR_AUTH_FAILURE, "Missing or invalid credentials for " + request.path);
        } else {
            response = dispatch(request, *snapshot);
        }
    } catch (DAVException & ex) {
        if (ex.status >= 500) {
            logger->error("{} {} failed: {}", request.method, request.path, ex.toJSON().dump());
        } else {
            logger->debug("{} {} rejected: {}", request.method, request.path, ex.toJSON().dump());
        }
        response = errorResponse(ex);
    } catch (std::exception & ex) {
        logger->error("{} {} failed with unexpected error: {}", request.method, request.path, ex.what());
        response = DAVResponse(500, "Internal Server Error\n", "text/plain; charset=utf-8");
    }

    logger->info("{} {} -> {}", request.method, request.path, response.status);
    return response;
}

DAVResponse CalDAVHandler::dispatch(const DAVRequest & request, const Snapshot & snapshot) {
    string method = BridgeUtils::toUpperCase(request.method);

    if (method != "GET" && method != "HEAD" && method != "PROPFIND" && method != "REPORT") {
        DAVResponse response(405, "This calendar is read-only\n", "text/plain; charset=utf-8");
        response.headers["Allow"] = ALLOWED_METHODS;
        return response;
    }

    Resource resource = ResourceTree::resolve(request.path, snapshot);
    if (resource.kind == ResourceKind::Principal && resource.principal != _settings.username) {
        resource = Resource();
    }
    if (!resource.exists()) {
        throw DAVException(404, ERROR_NOT_FOUND, "No resource at " + request.path);
    }
    if (resource.kind == ResourceKind::Subscription) {
        DAVResponse response(405, "", "");
        response.headers["Allow"] = "GET, HEAD";
        return response;
    }

    if (method == "PROPFIND") {
        return handlePropfind(request, resource, snapshot);
    }
    if (method == "REPORT") {
        return handleReport(request, resource, snapshot);
    }
    return handleGet(request, resource, snapshot);
}

DAVResponse CalDAVHandler::handleOptions() const {
    DAVResponse response(200);
    response.headers["DAV"] = "1, 3, calendar-access";
    response.headers["Allow"] = ALLOWED_METHODS;
    return response;
}

DAVResponse CalDAVHandler::handleHealth(const Snapshot & snapshot) const {
    size_t staleCount = 0;
    json stale = json::array();
    for (const auto & pair : snapshot.calendars) {
        if (pair.second.stale) {
            staleCount++;
            stale.push_back({
                {"projectId", pair.first},
                {"staleSince", BridgeUtils::formatDateTimeUTC(pair.second.staleSince)},
                {"reason", pair.second.failureReason},
            });
        }
    }

    string status = snapshot.generation == 0 ? "starting" : (staleCount ? "degraded" : "ok");
    json body = {
        {"status", status},
        {"snapshot", {
            {"generation", snapshot.generation},
            {"syncedAt", snapshot.syncedAt ? BridgeUtils::formatDateTimeUTC(snapshot.syncedAt) : ""},
            {"calendars", snapshot.calendars.size()},
            {"stale", stale},
        }},
    };
    if (_health) {
        body["sync"] = _health();
    }
    return DAVResponse(200, body.dump(), "application/json");
}

DAVResponse CalDAVHandler::errorResponse(const DAVException & ex) const {
    DAVResponse response;
    if (ex.precondition != "") {
        response = DAVResponse(ex.status, MultistatusWriter::errorBody(ex.precondition, ex.preconditionNS), CONTENT_TYPE_XML);
    } else {
        response = DAVResponse(ex.status, MultistatusWriter::reasonPhrase(ex.status) + "\n", "text/plain; charset=utf-8");
    }
    if (ex.status == 401) {
        response.headers["WWW-Authenticate"] = "Basic realm=\"" + _settings.realm + "\", charset=\"UTF-8\"";
    }
    return response;
}

DAVResponse CalDAVHandler::multistatusResponse(MultistatusWriter & writer) const {
    return DAVResponse(207, writer.finish(), CONTENT_TYPE_XML);
}

DAVResponse CalDAVHandler::calendarBody(const DAVRequest & request, const string & ics, const string & etag, time_t lastModified) const {
    DAVResponse response;
    response.headers["ETag"] = quoted(etag);
    if (lastModified) {
        response.headers["Last-Modified"] = BridgeUtils::httpDate(lastModified);
    }

    string ifNoneMatch = request.header("if-none-match");
    if (ifNoneMatch != "" && etagMatches(ifNoneMatch, etag)) {
        response.status = 304;
        return response;
    }

    response.status = 200;
    response.headers["Content-Type"] = CONTENT_TYPE_CALENDAR;
    if (BridgeUtils::toUpperCase(request.method) == "HEAD") {
        response.headers["Content-Length"] = to_string(ics.size());
    } else {
        response.body = ics;
    }
    return response;
}

DAVResponse CalDAVHandler::handleGet(const DAVRequest & request, const Resource & resource, const Snapshot & snapshot) const {
    switch (resource.kind) {
        case ResourceKind::Event:
            return calendarBody(request, resource.event->ics, resource.event->etag, resource.event->task.modifiedAt());

        case ResourceKind::Calendar:
        case ResourceKind::CalendarFile: {
            string ics = ICalCodec::encodeCalendar(resource.calendar->project, resource.calendar->tasks());
            return calendarBody(request, ics, BridgeUtils::sha256Hex(ics), resource.calendar->project.modifiedAt());
        }

        default: {
            string body = "DAVBridge CalDAV server\nCalendars are served under /calendars/\n";
            DAVResponse response(200, "", "text/plain; charset=utf-8");
            if (BridgeUtils::toUpperCase(request.method) == "HEAD") {
                response.headers["Content-Length"] = to_string(body.size());
            } else {
                response.body = body;
            }
            return response;
        }
    }
}

DAVResponse CalDAVHandler::handleSubscription(const DAVRequest & request, const Snapshot & snapshot) const {
    Resource resource = ResourceTree::resolve(request.path, snapshot);
    auto segments = ResourceTree::pathSegments(request.path);

    if (segments.size() != 3 || !isPublicToken(segments[1])) {
        throw DAVException(403, ERROR_AUTH_FAILURE, "Unknown subscription token");
    }
    if (resource.kind != ResourceKind::Subscription) {
        throw DAVException(404, ERROR_NOT_FOUND, "No subscription at " + request.path);
    }

    string ics;
    if (resource.calendar != nullptr) {
        ics = ICalCodec::encodeCalendar(resource.calendar->project, resource.calendar->tasks());
    } else {
        vector<pair<Project, vector<Task>>> calendars;
        for (const auto & pair : snapshot.calendars) {
            calendars.push_back({pair.second.project, pair.second.tasks()});
        }
        ics = ICalCodec::encodeCombined("KodBox", calendars);
    }
    return calendarBody(request, ics, BridgeUtils::sha256Hex(ics), 0);
}

vector<PropertyName> CalDAVHandler::allPropertyNames() const {
    return {
        {NS_DAV, "resourcetype"},
        {NS_DAV, "displayname"},
        {NS_CALSERVER, "getctag"},
        {NS_DAV, "sync-token"},
        {NS_DAV, "getetag"},
        {NS_DAV, "getcontenttype"},
        {NS_DAV, "getcontentlength"},
        {NS_DAV, "getlastmodified"},
        {NS_CALDAV, "calendar-description"},
        {NS_CALDAV, "supported-calendar-component-set"},
        {NS_DAV, "supported-report-set"},
        {NS_DAV, "current-user-principal"},
        {NS_DAV, "principal-URL"},
        {NS_DAV, "principal-collection-set"},
        {NS_CALDAV, "calendar-home-set"},
    };
}

bool CalDAVHandler::resolveProperty(const Resource & resource, const PropertyName & name, DAVProperty & out) const {
    const string & ns = name.first;
    const string & prop = name.second;
    out = DAVProperty(ns, prop);

    bool isCalendar = resource.kind == ResourceKind::Calendar;
    bool isEvent = resource.kind == ResourceKind::Event;
    bool isFile = resource.kind == ResourceKind::CalendarFile;

    if (ns == NS_DAV) {
        if (prop == "resourcetype") {
            if (resource.isCollection()) {
                out.children.push_back(DAVProperty(NS_DAV, "collection"));
            }
            if (isCalendar) {
                out.children.push_back(DAVProperty(NS_CALDAV, "calendar"));
            }
            if (resource.kind == ResourceKind::Principal) {
                out.children.push_back(DAVProperty(NS_DAV, "principal"));
            }
            return true;
        }
        if (prop == "displayname") {
            switch (resource.kind) {
                case ResourceKind::Root: out.text = "DAVBridge"; break;
                case ResourceKind::PrincipalCollection: out.text = "Principals"; break;
                case ResourceKind::Principal: out.text = resource.principal; break;
                case ResourceKind::CalendarHome: out.text = "Calendars"; break;
                case ResourceKind::Calendar: out.text = resource.calendar->project.name(); break;
                case ResourceKind::Event: out.text = resource.event->task.title(); break;
                case ResourceKind::CalendarFile: out.text = resource.calendar->project.name(); break;
                default: return false;
            }
            return true;
        }
        if (prop == "sync-token" && isCalendar) {
            out.text = CacheStore::syncTokenFor(resource.calendar->ctag);
            return true;
        }
        if (prop == "getetag" && isEvent) {
            out.text = quoted(resource.event->etag);
            return true;
        }
        if (prop == "getetag" && isFile) {
            out.text = quoted(BridgeUtils::sha256Hex(ICalCodec::encodeCalendar(resource.calendar->project, resource.calendar->tasks())));
            return true;
        }
        if (prop == "getcontenttype" && (isEvent || isFile)) {
            out.text = CONTENT_TYPE_CALENDAR;
            return true;
        }
        if (prop == "getcontentlength" && isEvent) {
            out.text = to_string(resource.event->ics.size());
            return true;
        }
        if (prop == "getlastmodified") {
            time_t t = isEvent ? resource.event->task.modifiedAt() : (isCalendar || isFile) ? resource.calendar->project.modifiedAt() : 0;
            if (!t) {
                return false;
            }
            out.text = BridgeUtils::httpDate(t);
            return true;
        }
        if (prop == "supported-report-set" && isCalendar) {
            for (auto report : vector<PropertyName>{{NS_CALDAV, "calendar-query"}, {NS_CALDAV, "calendar-multiget"}, {NS_DAV, "sync-collection"}}) {
                DAVProperty supported(NS_DAV, "supported-report");
                DAVProperty wrapper(NS_DAV, "report");
                wrapper.children.push_back(DAVProperty(report.first, report.second));
                supported.children.push_back(wrapper);
                out.children.push_back(supported);
            }
            return true;
        }
        if (prop == "current-user-principal") {
            out.hrefs.push_back(ResourceTree::hrefFor(ResourceTree::principalResource(_settings.username)));
            return true;
        }
        if (prop == "principal-URL" && resource.kind == ResourceKind::Principal) {
            out.hrefs.push_back(ResourceTree::hrefFor(resource));
            return true;
        }
        if (prop == "principal-collection-set") {
            Resource principals;
            principals.kind = ResourceKind::PrincipalCollection;
            out.hrefs.push_back(ResourceTree::hrefFor(principals));
            return true;
        }
        return false;
    }

    if (ns == NS_CALSERVER) {
        if (prop == "getctag" && isCalendar) {
            out.text = resource.calendar->ctag;
            return true;
        }
        return false;
    }

    if (ns == NS_CALDAV) {
        if (prop == "calendar-description" && isCalendar && resource.calendar->project.description() != "") {
            out.text = resource.calendar->project.description();
            return true;
        }
        if (prop == "supported-calendar-component-set" && isCalendar) {
            for (auto comp : {"VEVENT", "VTODO"}) {
                DAVProperty component(NS_CALDAV, "comp");
                component.attributes["name"] = comp;
                out.children.push_back(component);
            }
            return true;
        }
        if (prop == "calendar-home-set" && (resource.kind == ResourceKind::Principal || resource.kind == ResourceKind::Root)) {
            Resource home;
            home.kind = ResourceKind::CalendarHome;
            out.hrefs.push_back(ResourceTree::hrefFor(home));
            return true;
        }
        if (prop == "calendar-data" && isEvent) {
            out.text = resource.event->ics;
            return true;
        }
        return false;
    }

    return false;
}

void CalDAVHandler::writeResource(MultistatusWriter & writer, const Resource & resource, const PropertyRequest & request) const {
    vector<DAVProperty> found;
    vector<DAVProperty> missing;

    vector<PropertyName> names = request.names;
    if (request.mode != PropfindMode::Prop) {
        auto all = allPropertyNames();
        names.insert(names.begin(), all.begin(), all.end());
    }

    for (const auto & name : names) {
        DAVProperty prop;
        bool duplicate = false;
        for (const auto & existing : found) {
            duplicate = duplicate || (existing.ns == name.first && existing.name == name.second);
        }
        if (duplicate) {
            continue;
        }
        if (resolveProperty(resource, name, prop)) {
            found.push_back(prop);
        } else if (request.mode == PropfindMode::Prop) {
            missing.push_back(DAVProperty(name.first, name.second));
        }
    }

    writer.startResponse(ResourceTree::hrefFor(resource));
    writer.writePropstat(found, 200, request.mode == PropfindMode::PropName);
    writer.writePropstat(missing, 404);
    writer.endResponse();
}

DAVResponse CalDAVHandler::handlePropfind(const DAVRequest & request, const Resource & resource, const Snapshot & snapshot) const {
    int depth = parseDepth(request);

    PropertyRequest props;
    if (BridgeUtils::trim(request.body) != "") {
        DavXML xml(request.body, request.path);
        if (!isElement(xml.root(), NS_DAV, "propfind")) {
            throw DAVException(400, ERROR_PROTOCOL_REQUEST, "PROPFIND body must be a DAV:propfind element");
        }
        props = parsePropertyRequest(xml, xml.root());
        if (!props.specified) {
            throw DAVException(400, ERROR_PROTOCOL_REQUEST, "PROPFIND body names no allprop, propname or prop");
        }
    }

    MultistatusWriter writer;
    writeResource(writer, resource, props);
    if (depth == 1) {
        for (const auto & child : ResourceTree::children(resource, snapshot)) {
            writeResource(writer, child, props);
        }
    }
    return multistatusResponse(writer);
}

DAVResponse CalDAVHandler::handleReport(const DAVRequest & request, const Resource & resource, const Snapshot & snapshot) const {
    if (BridgeUtils::trim(request.body) == "") {
        throw DAVException(400, ERROR_PROTOCOL_REQUEST, "REPORT requires a body");
    }
    DavXML xml(request.body, request.path);
    xmlNodePtr root = xml.root();

    bool known = isElement(root, NS_CALDAV, "calendar-query") ||
        isElement(root, NS_CALDAV, "calendar-multiget") ||
        isElement(root, NS_DAV, "sync-collection");
    if (!known || resource.kind != ResourceKind::Calendar) {
        throw DAVException(403, ERROR_PROTOCOL_REQUEST, "Unsupported report " + DavXML::nodeName(root) + " on " + request.path, "supported-report");
    }

    if (isElement(root, NS_CALDAV, "calendar-query")) {
        return calendarQuery(xml, resource);
    }
    if (isElement(root, NS_CALDAV, "calendar-multiget")) {
        return calendarMultiget(xml, resource, snapshot);
    }
    return syncCollection(xml, resource);
}

static PropertyRequest reportProperties(DavXML & xml) {
    PropertyRequest props = CalDAVHandler::parsePropertyRequest(xml, xml.root());
    if (!props.specified) {
        props.mode = PropfindMode::Prop;
        props.names.push_back({NS_DAV, "getetag"});
    }
    return props;
}

static TimeRange parseTimeRange(xmlNodePtr node) {
    TimeRange range;
    string start = DavXML::nodeAttribute(node, "start");
    string end = DavXML::nodeAttribute(node, "end");
    if (start == "" && end == "") {
        throw DAVException(400, ERROR_PROTOCOL_REQUEST, "time-range needs a start or an end");
    }
    if (start != "") {
        range.start = BridgeUtils::parseICalDateTime(start);
        if (range.start == -1) {
            throw DAVException(400, ERROR_PROTOCOL_REQUEST, "Invalid time-range start " + start);
        }
    }
    if (end != "") {
        range.end = BridgeUtils::parseICalDateTime(end);
        if (range.end == -1) {
            throw DAVException(400, ERROR_PROTOCOL_REQUEST, "Invalid time-range end " + end);
        }
    }
    return range;
}

DAVResponse CalDAVHandler::calendarQuery(DavXML & xml, const Resource & calendar) const {
    PropertyRequest props = reportProperties(xml);

    vector<ComponentFilter> filters;
    bool hasFilter = false;
    xml.evaluateXPath("C:filter", [&](xmlNodePtr) { hasFilter = true; });
    if (hasFilter) {
        xmlNodePtr outer = nullptr;
        xml.evaluateXPath("C:filter[1]/C:comp-filter[1]", [&](xmlNodePtr node) { outer = node; });
        if (outer == nullptr || BridgeUtils::toUpperCase(DavXML::nodeAttribute(outer, "name")) != "VCALENDAR") {
            throw DAVException(403, ERROR_PROTOCOL_REQUEST, "calendar-query filter must start with a VCALENDAR comp-filter", "valid-filter", NS_CALDAV);
        }
        xml.evaluateXPath("C:comp-filter", [&](xmlNodePtr inner) {
            ComponentFilter f;
            f.name = BridgeUtils::toUpperCase(DavXML::nodeAttribute(inner, "name"));
            if (f.name == "") {
                throw DAVException(403, ERROR_PROTOCOL_REQUEST, "comp-filter without a name", "valid-filter", NS_CALDAV);
            }
            f.isNotDefined = firstChild(inner, NS_CALDAV, "is-not-defined") != nullptr;
            xmlNodePtr timeRange = firstChild(inner, NS_CALDAV, "time-range");
            if (timeRange != nullptr) {
                f.hasTimeRange = true;
                f.range = parseTimeRange(timeRange);
            }
            filters.push_back(f);
        }, outer);
    }

    MultistatusWriter writer;
    for (const auto & event : calendar.calendar->events) {
        string component = ICalCodec::componentFor(event.task);
        bool matches = true;
        for (const auto & f : filters) {
            bool present = component == f.name;
            if (f.isNotDefined) {
                matches = matches && !present;
            } else {
                matches = matches && present && (!f.hasTimeRange || overlaps(event.task, f.range));
            }
        }
        if (matches) {
            writeResource(writer, ResourceTree::eventResource(*calendar.calendar, event), props);
        }
    }
    return multistatusResponse(writer);
}

DAVResponse CalDAVHandler::calendarMultiget(DavXML & xml, const Resource & calendar, const Snapshot & snapshot) const {
    PropertyRequest props = reportProperties(xml);

    MultistatusWriter writer;
    xml.evaluateXPath("d:href", [&](xmlNodePtr node) {
        string href = BridgeUtils::trim(DavXML::nodeContent(node));
        Resource target = ResourceTree::resolve(hrefToPath(href), snapshot);
        if (target.kind != ResourceKind::Event || target.projectId != calendar.projectId) {
            writer.writeStatusResponse(href, 404);
            return;
        }
        writeResource(writer, target, props);
    });
    return multistatusResponse(writer);
}

DAVResponse CalDAVHandler::syncCollection(DavXML & xml, const Resource & calendar) const {
    PropertyRequest props = reportProperties(xml);

    string token = xml.nodeContentAtXPath("d:sync-token[1]");

    SyncChanges changes = CacheStore::changesSince(*calendar.calendar, token);

    MultistatusWriter writer;
    for (const auto & taskId : changes.changed) {
        const CalendarEvent * event = calendar.calendar->find(taskId);
        if (event != nullptr) {
            writeResource(writer, ResourceTree::eventResource(*calendar.calendar, *event), props);
        }
    }
    for (const auto & taskId : changes.removed) {
        Resource gone;
        gone.kind = ResourceKind::Event;
        gone.projectId = calendar.projectId;
        gone.taskId = taskId;
        writer.writeStatusResponse(ResourceTree::hrefFor(gone), 404);
    }
    writer.writeSyncToken(changes.syncToken);
    return multistatusResponse(writer);
}
