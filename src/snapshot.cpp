#include "davbridge/snapshot.hpp"
#include "davbridge/bridge_utils.hpp"
#include "davbridge/ical_codec.hpp"

#include <algorithm>

CalendarEvent CalendarEvent::make(const Project & project, const Task & task) {
    std::string ics = ICalCodec::encode(project, task);
    std::string etag = BridgeUtils::sha256Hex(ics);
    return CalendarEvent{task, ics, etag};
}

CalendarEntry::CalendarEntry(Project project) :
    project(project)
{
}

const CalendarEvent * CalendarEntry::find(const std::string & taskId) const {
    auto it = std::lower_bound(events.begin(), events.end(), taskId, [](const CalendarEvent & e, const std::string & id) {
        return e.task.id() < id;
    });
    if (it == events.end() || it->task.id() != taskId) {
        return nullptr;
    }
    return &(*it);
}

std::map<std::string, std::string> CalendarEntry::memberEtags() const {
    std::map<std::string, std::string> members;
    for (const auto & event : events) {
        members[event.task.id()] = event.etag;
    }
    return members;
}

std::vector<Task> CalendarEntry::tasks() const {
    std::vector<Task> result;
    for (const auto & event : events) {
        result.push_back(event.task);
    }
    return result;
}

nlohmann::json CalendarEntry::toJSON() const {
    nlohmann::json j = {
        {"project", project.toJSON()},
        {"ctag", ctag},
        {"events", events.size()},
        {"stale", stale},
        {"lastSuccessfulSync", lastSuccessfulSync},
    };
    if (stale) {
        j["staleSince"] = staleSince;
        j["failureReason"] = failureReason;
    }
    return j;
}

const CalendarEntry * Snapshot::find(const std::string & projectId) const {
    auto it = calendars.find(projectId);
    if (it == calendars.end()) {
        return nullptr;
    }
    return &it->second;
}

nlohmann::json Snapshot::toJSON() const {
    nlohmann::json list = nlohmann::json::array();
    for (const auto & pair : calendars) {
        list.push_back(pair.second.toJSON());
    }
    return {
        {"generation", generation},
        {"syncedAt", syncedAt},
        {"calendars", list},
    };
}
