#include "davbridge/ical_codec.hpp"
#include "davbridge/bridge_utils.hpp"
#include "davbridge/constants.hpp"
#include "davbridge/sync_exception.hpp"

#include <cstdio>

using namespace std;

// Helpers

// libical escapes TEXT values on output; bare carriage returns would
// otherwise leak into the content line.
static string plainText(const string & text) {
    string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c != '\r') {
            out.push_back(c);
        }
    }
    return out;
}

static icalproperty * newXProperty(const char * name, const string & value) {
    icalproperty * prop = icalproperty_new_x(value.c_str());
    icalproperty_set_x_name(prop, name);
    return prop;
}

static struct icaltimetype utcTime(time_t t) {
    return icaltime_from_timet_with_zone(t, 0, icaltimezone_get_utc_timezone());
}

// All-day values become DATE, everything else a UTC DATE-TIME. Returns a
// null time for unparseable values.
static struct icaltimetype timeFor(const string & value, bool forceDateTime) {
    if (BridgeUtils::isAllDayDate(value) && !forceDateTime) {
        string compact = value.substr(0, 4) + value.substr(5, 2) + value.substr(8, 2);
        return icaltime_from_string(compact.c_str());
    }
    time_t t = BridgeUtils::parseDateValue(value);
    if (t == -1) {
        return icaltime_null_time();
    }
    return utcTime(t);
}

// floating and TZID-qualified times are read as UTC
static string stringForTime(struct icaltimetype t) {
    if (icaltime_is_null_time(t) || !icaltime_is_valid_time(t)) {
        return "";
    }
    if (t.is_date) {
        char buffer[16];
        snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", t.year, t.month, t.day);
        return string(buffer);
    }
    return BridgeUtils::formatDateTimeUTC(icaltime_as_timet(t));
}

static time_t timestampFor(struct icaltimetype t) {
    if (icaltime_is_null_time(t) || !icaltime_is_valid_time(t)) {
        return 0;
    }
    return icaltime_as_timet(t);
}

static icalproperty_status todoStatus(TaskStatus status) {
    switch (status) {
        case TaskStatus::InProgress:
            return ICAL_STATUS_INPROCESS;
        case TaskStatus::Done:
            return ICAL_STATUS_COMPLETED;
        case TaskStatus::Cancelled:
            return ICAL_STATUS_CANCELLED;
        default:
            return ICAL_STATUS_NEEDSACTION;
    }
}

static TaskStatus statusFromICal(icalproperty_status status) {
    switch (status) {
        case ICAL_STATUS_INPROCESS:
            return TaskStatus::InProgress;
        case ICAL_STATUS_COMPLETED:
            return TaskStatus::Done;
        case ICAL_STATUS_CANCELLED:
            return TaskStatus::Cancelled;
        default:
            return TaskStatus::Open;
    }
}

static int icalPriority(TaskPriority priority) {
    switch (priority) {
        case TaskPriority::VeryHigh:
            return 1;
        case TaskPriority::High:
            return 3;
        case TaskPriority::Normal:
            return 5;
        case TaskPriority::Low:
            return 7;
        case TaskPriority::VeryLow:
            return 9;
        default:
            return 0;
    }
}

static TaskPriority priorityFromICal(int value) {
    if (value <= 0 || value > 9) {
        return TaskPriority::None;
    }
    if (value <= 2) {
        return TaskPriority::VeryHigh;
    }
    if (value <= 4) {
        return TaskPriority::High;
    }
    if (value == 5) {
        return TaskPriority::Normal;
    }
    if (value <= 7) {
        return TaskPriority::Low;
    }
    return TaskPriority::VeryLow;
}

static bool hasMissingEnd(icalcomponent * component) {
    for (icalproperty * p = icalcomponent_get_first_property(component, ICAL_XLICERROR_PROPERTY); p != nullptr;
         p = icalcomponent_get_next_property(component, ICAL_XLICERROR_PROPERTY)) {
        icalparameter * type = icalproperty_get_first_parameter(p, ICAL_XLICERRORTYPE_PARAMETER);
        if (type != nullptr && icalparameter_get_xlicerrortype(type) == ICAL_XLICERRORTYPE_COMPONENTPARSEERROR) {
            return true;
        }
    }
    return false;
}

static icalcomponent * findTaskComponent(icalcomponent * root) {
    icalcomponent_kind kind = icalcomponent_isa(root);
    if (kind == ICAL_VEVENT_COMPONENT || kind == ICAL_VTODO_COMPONENT) {
        return root;
    }
    for (icalcomponent * c = icalcomponent_get_first_component(root, ICAL_ANY_COMPONENT); c != nullptr;
         c = icalcomponent_get_next_component(root, ICAL_ANY_COMPONENT)) {
        kind = icalcomponent_isa(c);
        if (kind == ICAL_VEVENT_COMPONENT || kind == ICAL_VTODO_COMPONENT) {
            return c;
        }
    }
    return nullptr;
}

// ICalCodec

string ICalCodec::uidFor(const Project & project, const Task & task) {
    return project.id() + "-" + task.id() + "@" + DAVBRIDGE_UID_DOMAIN;
}

string ICalCodec::componentFor(const Task & task) {
    return task.hasTimeRange() ? "VEVENT" : "VTODO";
}

ICalComponentPtr ICalCodec::newCalendar(const string & name, const string & description) {
    ICalComponentPtr calendar(icalcomponent_new_vcalendar());
    icalcomponent_add_property(calendar.get(), icalproperty_new_version("2.0"));
    icalcomponent_add_property(calendar.get(), icalproperty_new_prodid(DAVBRIDGE_PRODID));
    icalcomponent_add_property(calendar.get(), icalproperty_new_calscale("GREGORIAN"));
    icalcomponent_add_property(calendar.get(), icalproperty_new_method(ICAL_METHOD_PUBLISH));
    icalcomponent_add_property(calendar.get(), newXProperty("X-WR-CALNAME", plainText(name)));
    if (description != "") {
        icalcomponent_add_property(calendar.get(), newXProperty("X-WR-CALDESC", plainText(description)));
    }
    return calendar;
}

icalcomponent * ICalCodec::newComponent(const Project & project, const Task & task) {
    bool isEvent = task.hasTimeRange();
    icalcomponent * component = isEvent ? icalcomponent_new_vevent() : icalcomponent_new_vtodo();
    icalcomponent_add_property(component, icalproperty_new_uid(uidFor(project, task).c_str()));

    time_t stamp = task.modifiedAt() ? task.modifiedAt() : task.createdAt();
    if (stamp) {
        icalcomponent_add_property(component, icalproperty_new_dtstamp(utcTime(stamp)));
    }
    if (task.createdAt()) {
        icalcomponent_add_property(component, icalproperty_new_created(utcTime(task.createdAt())));
    }
    if (task.modifiedAt()) {
        icalcomponent_add_property(component, icalproperty_new_lastmodified(utcTime(task.modifiedAt())));
    }

    icalcomponent_add_property(component, icalproperty_new_summary(plainText(task.title()).c_str()));
    if (task.description() != "") {
        icalcomponent_add_property(component, icalproperty_new_description(plainText(task.description()).c_str()));
    }

    if (isEvent) {
        // DTSTART and DTEND must share a value type; an all-day DTEND is
        // exclusive so the last day of the task is included.
        bool allDay = BridgeUtils::isAllDayDate(task.start()) && BridgeUtils::isAllDayDate(task.due());
        struct icaltimetype start = timeFor(task.start(), !allDay);
        struct icaltimetype end = timeFor(allDay ? BridgeUtils::addDays(task.due(), 1) : task.due(), !allDay);
        if (!icaltime_is_null_time(start)) {
            icalcomponent_add_property(component, icalproperty_new_dtstart(start));
        }
        if (!icaltime_is_null_time(end)) {
            icalcomponent_add_property(component, icalproperty_new_dtend(end));
        }
        // VEVENT has no completed / in-process states, so the exact task
        // status travels in an extension property.
        icalcomponent_add_property(component, icalproperty_new_status(task.status() == TaskStatus::Cancelled ? ICAL_STATUS_CANCELLED : ICAL_STATUS_CONFIRMED));
        icalcomponent_add_property(component, newXProperty("X-DAVBRIDGE-TASK-STATUS", Task::statusToString(task.status())));
        icalcomponent_add_property(component, icalproperty_new_transp(allDay ? ICAL_TRANSP_TRANSPARENT : ICAL_TRANSP_OPAQUE));
    } else {
        struct icaltimetype start = timeFor(task.start(), false);
        struct icaltimetype due = timeFor(task.due(), false);
        if (task.start() != "" && !icaltime_is_null_time(start)) {
            icalcomponent_add_property(component, icalproperty_new_dtstart(start));
        }
        if (task.due() != "" && !icaltime_is_null_time(due)) {
            icalcomponent_add_property(component, icalproperty_new_due(due));
        }
        icalcomponent_add_property(component, icalproperty_new_status(todoStatus(task.status())));
        if (task.status() == TaskStatus::Done) {
            icalcomponent_add_property(component, icalproperty_new_percentcomplete(100));
            if (task.modifiedAt()) {
                icalcomponent_add_property(component, icalproperty_new_completed(utcTime(task.modifiedAt())));
            }
        }
    }

    int priority = icalPriority(task.priority());
    if (priority) {
        icalcomponent_add_property(component, icalproperty_new_priority(priority));
    }
    if (task.assignee() != "") {
        icalcomponent_add_property(component, newXProperty("X-DAVBRIDGE-ASSIGNEE", plainText(task.assignee())));
    }

    addAlarms(component, task);
    return component;
}

// Reminders relative to the start: urgent tasks get audible alarms up to a
// day ahead, everything else a single display notification or two.
void ICalCodec::addAlarms(icalcomponent * component, const Task & task) {
    if (task.start() == "") {
        return;
    }
    vector<int> minutes;
    bool audible = false;
    switch (task.priority()) {
        case TaskPriority::VeryHigh:
        case TaskPriority::High:
            minutes = {0, 15, 60, 1440};
            audible = true;
            break;
        case TaskPriority::Normal:
            minutes = {15, 60};
            break;
        case TaskPriority::Low:
        case TaskPriority::VeryLow:
            minutes = {60};
            break;
        default:
            minutes = {15};
    }
    for (int m : minutes) {
        struct icaltriggertype trigger;
        trigger.time = icaltime_null_time();
        trigger.duration = icaldurationtype_from_int(-m * 60);

        icalcomponent * alarm = icalcomponent_new_valarm();
        icalcomponent_add_property(alarm, icalproperty_new_action(audible ? ICAL_ACTION_AUDIO : ICAL_ACTION_DISPLAY));
        icalcomponent_add_property(alarm, icalproperty_new_trigger(trigger));
        icalcomponent_add_property(alarm, icalproperty_new_description(plainText("Reminder: " + task.title()).c_str()));
        icalcomponent_add_component(component, alarm);
    }
}

string ICalCodec::serialize(icalcomponent * calendar) {
    char * text = icalcomponent_as_ical_string_r(calendar);
    if (text == nullptr) {
        throw SyncException(ERROR_MALFORMED_ICALENDAR, "libical could not serialize the calendar", false);
    }
    string result(text);
    icalmemory_free_buffer(text);
    return result;
}

string ICalCodec::encode(const Project & project, const Task & task) {
    ICalComponentPtr calendar = newCalendar(project.name(), "");
    icalcomponent_add_component(calendar.get(), newComponent(project, task));
    return serialize(calendar.get());
}

string ICalCodec::encodeCalendar(const Project & project, const vector<Task> & tasks) {
    ICalComponentPtr calendar = newCalendar(project.name(), project.description());
    for (const auto & task : tasks) {
        icalcomponent_add_component(calendar.get(), newComponent(project, task));
    }
    return serialize(calendar.get());
}

string ICalCodec::encodeCombined(const string & name, const vector<pair<Project, vector<Task>>> & calendars) {
    ICalComponentPtr calendar = newCalendar(name, "");
    for (const auto & entry : calendars) {
        for (const auto & task : entry.second) {
            icalcomponent_add_component(calendar.get(), newComponent(entry.first, task));
        }
    }
    return serialize(calendar.get());
}

DecodedTask ICalCodec::decode(const string & ics) {
    ICalComponentPtr root(icalparser_parse_string(ics.c_str()));
    if (!root) {
        throw SyncException(ERROR_MALFORMED_ICALENDAR, "No iCalendar data found", false);
    }
    icalcomponent * component = findTaskComponent(root.get());
    if (component == nullptr || hasMissingEnd(component)) {
        throw SyncException(ERROR_MALFORMED_ICALENDAR, "No complete VEVENT or VTODO component", false);
    }

    DecodedTask result;
    result.component = icalcomponent_isa(component) == ICAL_VEVENT_COMPONENT ? "VEVENT" : "VTODO";

    const char * uid = icalcomponent_get_uid(component);
    result.uid = uid ? uid : "";
    const char * summary = icalcomponent_get_summary(component);
    result.title = summary ? summary : "";
    const char * description = icalcomponent_get_description(component);
    result.description = description ? description : "";

    icalproperty * p = icalcomponent_get_first_property(component, ICAL_DTSTART_PROPERTY);
    if (p) {
        result.start = stringForTime(icalproperty_get_dtstart(p));
    }
    p = icalcomponent_get_first_property(component, ICAL_DUE_PROPERTY);
    if (p) {
        result.due = stringForTime(icalproperty_get_due(p));
    }
    p = icalcomponent_get_first_property(component, ICAL_DTEND_PROPERTY);
    if (p) {
        string end = stringForTime(icalproperty_get_dtend(p));
        result.due = BridgeUtils::isAllDayDate(end) ? BridgeUtils::addDays(end, -1) : end;
    }
    p = icalcomponent_get_first_property(component, ICAL_PRIORITY_PROPERTY);
    if (p) {
        result.priority = priorityFromICal(icalproperty_get_priority(p));
    }
    p = icalcomponent_get_first_property(component, ICAL_CREATED_PROPERTY);
    if (p) {
        result.created = timestampFor(icalproperty_get_created(p));
    }
    p = icalcomponent_get_first_property(component, ICAL_LASTMODIFIED_PROPERTY);
    if (p) {
        result.lastModified = timestampFor(icalproperty_get_lastmodified(p));
    }

    string exactStatus;
    for (p = icalcomponent_get_first_property(component, ICAL_X_PROPERTY); p != nullptr;
         p = icalcomponent_get_next_property(component, ICAL_X_PROPERTY)) {
        const char * name = icalproperty_get_x_name(p);
        const char * value = icalproperty_get_x(p);
        if (name == nullptr || value == nullptr) {
            continue;
        }
        if (string(name) == "X-DAVBRIDGE-TASK-STATUS") {
            exactStatus = BridgeUtils::trim(value);
        } else if (string(name) == "X-DAVBRIDGE-ASSIGNEE") {
            result.assignee = value;
        }
    }

    result.status = exactStatus != "" ? Task::statusFromString(exactStatus) : statusFromICal(icalcomponent_get_status(component));
    return result;
}
