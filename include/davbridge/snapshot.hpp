/** Snapshot [DAVBridge]
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

#ifndef Snapshot_hpp
#define Snapshot_hpp

#include <cstdint>
#include <ctime>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "davbridge/models/project.hpp"
#include "davbridge/models/task.hpp"

// One task rendered for serving. `ics` is the codec output, `etag` its SHA-256.
struct CalendarEvent {
    Task task;
    std::string ics;
    std::string etag;

    static CalendarEvent make(const Project & project, const Task & task);
};

// The member etags of a calendar as they were when it carried `ctag`.
struct CalendarVersion {
    std::string ctag;
    std::map<std::string, std::string> members;
};

typedef std::deque<CalendarVersion> CalendarHistory;

struct CalendarEntry {
    Project project;
    std::vector<CalendarEvent> events;  // ordered by task id
    std::string ctag;

    bool stale = false;
    time_t staleSince = 0;
    time_t lastSuccessfulSync = 0;
    std::string failureReason;

    // shared between consecutive snapshots while the calendar is unchanged
    std::shared_ptr<const CalendarHistory> history;

    CalendarEntry(Project project);

    const CalendarEvent * find(const std::string & taskId) const;
    std::map<std::string, std::string> memberEtags() const;
    std::vector<Task> tasks() const;
    nlohmann::json toJSON() const;
};

/*
 An immutable, complete view of every calendar produced by one sync cycle.
 Snapshots are only ever built by the sync engine and never modified once
 they have been handed to CacheStore::publish.
 */
struct Snapshot {
    std::map<std::string, CalendarEntry> calendars;  // ordered by project id
    time_t syncedAt = 0;
    uint64_t generation = 0;

    const CalendarEntry * find(const std::string & projectId) const;
    nlohmann::json toJSON() const;
};

#endif /* Snapshot_hpp */
