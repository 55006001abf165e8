#ifndef SNAPSHOTFIXTURES_HPP
#define SNAPSHOTFIXTURES_HPP

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include "davbridge/snapshot.hpp"

// Builds calendar entries the way the sync engine does: events encoded and
// ordered by task id.
inline CalendarEntry makeCalendar(const Project & project, std::vector<Task> tasks) {
    std::sort(tasks.begin(), tasks.end(), [](const Task & a, const Task & b) {
        return a.id() < b.id();
    });
    CalendarEntry entry(project);
    for (const auto & task : tasks) {
        entry.events.push_back(CalendarEvent::make(project, task));
    }
    return entry;
}

inline std::shared_ptr<Snapshot> makeSnapshot(std::vector<CalendarEntry> calendars) {
    auto snapshot = std::make_shared<Snapshot>();
    snapshot->syncedAt = 1717200000;
    for (const auto & calendar : calendars) {
        snapshot->calendars.emplace(calendar.project.id(), calendar);
    }
    return snapshot;
}

inline Task makeTask(std::string id, std::string projectId, std::string title, std::string due = "") {
    Task task(id, projectId, title);
    if (due != "") {
        task.setDue(due);
    }
    return task;
}

#endif
