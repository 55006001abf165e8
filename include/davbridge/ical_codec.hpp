/** ICalCodec [DAVBridge]
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

#ifndef ICalCodec_hpp
#define ICalCodec_hpp

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <libical/ical.h>

#include "davbridge/models/project.hpp"
#include "davbridge/models/task.hpp"

struct ICalComponentDeleter {
    void operator()(icalcomponent * component) const {
        icalcomponent_free(component);
    }
};

typedef std::unique_ptr<icalcomponent, ICalComponentDeleter> ICalComponentPtr;

struct DecodedTask {
    std::string component;
    std::string uid;
    std::string title;
    std::string description;
    TaskStatus status = TaskStatus::Open;
    TaskPriority priority = TaskPriority::None;
    std::string start;
    std::string due;
    std::string assignee;
    time_t created = 0;
    time_t lastModified = 0;
};

/*
 Maps tasks onto RFC 5545 components built with libical. Every encode
 function is pure: the same project / task content always yields the same
 bytes, which is what makes the SHA-256 of the output usable as an etag.
 Nothing time-dependent (such as "now" for DTSTAMP) is ever written.
 */
class ICalCodec {
public:
    static std::string encode(const Project & project, const Task & task);
    static std::string encodeCalendar(const Project & project, const std::vector<Task> & tasks);
    static std::string encodeCombined(const std::string & name, const std::vector<std::pair<Project, std::vector<Task>>> & calendars);

    static DecodedTask decode(const std::string & ics);

    static std::string uidFor(const Project & project, const Task & task);
    static std::string componentFor(const Task & task);

private:
    static ICalComponentPtr newCalendar(const std::string & name, const std::string & description);
    static icalcomponent * newComponent(const Project & project, const Task & task);
    static void addAlarms(icalcomponent * component, const Task & task);
    static std::string serialize(icalcomponent * calendar);
};

#endif /* ICalCodec_hpp */
