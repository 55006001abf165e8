/** UpstreamClient [DAVBridge]
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

#ifndef UpstreamClient_hpp
#define UpstreamClient_hpp

#include <chrono>
#include <string>
#include <vector>

#include "davbridge/models/project.hpp"
#include "davbridge/models/task.hpp"

/*
 Source of projects and tasks. Implementations throw SyncException with one
 of these keys:

 listProjects: UpstreamUnavailable, AuthFailure, MalformedUpstreamData
 listTasks:    UpstreamUnavailable, AuthFailure, NotFound, MalformedUpstreamData

 Both calls must give up after `timeout`.
 */
class UpstreamClient {
public:
    virtual ~UpstreamClient() {}

    virtual std::vector<Project> listProjects(std::chrono::seconds timeout) = 0;
    virtual std::vector<Task> listTasks(const std::string & projectId, std::chrono::seconds timeout) = 0;
};

#endif /* UpstreamClient_hpp */
