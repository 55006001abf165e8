/** Task [DAVBridge]
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

#ifndef Task_hpp
#define Task_hpp

#include <string>
#include "nlohmann/json.hpp"

#include "davbridge/models/bridge_model.hpp"

using namespace nlohmann;
using namespace std;

enum class TaskStatus {
    Open,
    InProgress,
    Done,
    Cancelled
};

enum class TaskPriority {
    None,
    VeryLow,
    Low,
    Normal,
    High,
    VeryHigh
};

/*
 A task as served to calendar clients. `start` and `due` hold either an
 all-day date ("2024-06-01") or a UTC date-time ("2024-06-01T09:00:00Z"),
 or are empty. A task with both becomes a VEVENT, anything else a VTODO.
 */
class Task : public BridgeModel {

public:
    Task(json json);
    Task(string id, string projectId, string title);

    string projectId() const;
    void setProjectId(string projectId);

    string title() const;
    void setTitle(string title);

    string description() const;
    void setDescription(string description);

    TaskStatus status() const;
    void setStatus(TaskStatus status);

    TaskPriority priority() const;
    void setPriority(TaskPriority priority);

    string start() const;
    void setStart(string start);

    string due() const;
    void setDue(string due);

    string assignee() const;
    void setAssignee(string assignee);

    time_t createdAt() const;
    void setCreatedAt(time_t t);

    time_t modifiedAt() const;
    void setModifiedAt(time_t t);

    bool hasTimeRange() const;

    static string statusToString(TaskStatus status);
    static TaskStatus statusFromString(string value);
    static string priorityToString(TaskPriority priority);
    static TaskPriority priorityFromString(string value);
};

#endif /* Task_hpp */
