/** KodBoxClient [DAVBridge]
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

#ifndef KodBoxClient_hpp
#define KodBoxClient_hpp

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"
#include "davbridge/upstream_client.hpp"

struct KodBoxSettings {
    std::string baseURL;
    std::string username;
    std::string password;
    long timeoutSeconds = 30;
    int utcOffsetMinutes = 480;   // used to pick the date of all-day tasks
};

// One parsed response of plugin/project/taskListSelf.
struct KodBoxListing {
    std::vector<Project> projects;
    std::map<std::string, std::vector<Task>> tasks;
};

/*
 KodBox exposes projects and their tasks through a single listing call. The
 listing fetched by listProjects() is kept and answers the listTasks() calls
 that follow in the same sync cycle, so one cycle costs one upstream request
 (plus a login when the access token is missing or rejected).
 */
class KodBoxClient : public UpstreamClient {
    KodBoxSettings _settings;
    std::mutex _mtx;
    std::string _accessToken;
    std::string _csrfToken;
    bool _hasListing = false;
    KodBoxListing _listing;
    std::shared_ptr<spdlog::logger> logger;

public:
    explicit KodBoxClient(KodBoxSettings settings);

    std::vector<Project> listProjects(std::chrono::seconds timeout) override;
    std::vector<Task> listTasks(const std::string & projectId, std::chrono::seconds timeout) override;

    // Logs in and fetches the listing once. Used by `--mode test`.
    nlohmann::json testConnection();

    static KodBoxListing parseListing(const nlohmann::json & response, int utcOffsetMinutes);
    static Task parseTask(const std::string & id, const nlohmann::json & data, int utcOffsetMinutes);
    static TaskStatus statusFromKodBox(const std::string & code);
    static TaskPriority priorityFromKodBox(const std::string & level);

private:
    void login(long timeoutSeconds);
    nlohmann::json fetchListing(long timeoutSeconds);
    void refreshListing(long timeoutSeconds);
    long effectiveTimeout(std::chrono::seconds timeout) const;
};

#endif /* KodBoxClient_hpp */
