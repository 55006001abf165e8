#include "davbridge/kodbox_client.hpp"
#include "davbridge/bridge_utils.hpp"
#include "davbridge/constants.hpp"
#include "davbridge/logging.hpp"
#include "davbridge/network_request_utils.hpp"
#include "davbridge/sync_exception.hpp"

#include <algorithm>
#include <cstdlib>

using namespace std;
using nlohmann::json;

// KodBox serializes ids and timestamps either as strings or as numbers.
static string scalarString(const json & v) {
    if (v.is_string()) {
        return v.get<string>();
    }
    if (v.is_number_integer()) {
        return to_string(v.get<long long>());
    }
    if (v.is_number()) {
        return to_string((long long)v.get<double>());
    }
    if (v.is_boolean()) {
        return v.get<bool>() ? "1" : "0";
    }
    return "";
}

static string scalarAt(const json & obj, const char * key) {
    if (!obj.is_object() || !obj.count(key)) {
        return "";
    }
    return scalarString(obj[key]);
}

// Returns 0 for missing, empty, zero or non-numeric timestamps.
static time_t timestampAt(const json & obj, const char * key) {
    string value = scalarAt(obj, key);
    if (value == "" || value.find_first_not_of("0123456789") != string::npos) {
        return 0;
    }
    return (time_t)strtoll(value.c_str(), nullptr, 10);
}

// PHP encodes empty maps as []. Both shapes are accepted; array entries
// carry their id in the "id" field.
static vector<pair<string, json>> keyedEntries(const json & container, const char * what) {
    vector<pair<string, json>> entries;
    if (container.is_null()) {
        return entries;
    }
    if (container.is_object()) {
        for (auto it = container.begin(); it != container.end(); ++it) {
            entries.push_back({it.key(), it.value()});
        }
        return entries;
    }
    if (container.is_array()) {
        for (const auto & item : container) {
            entries.push_back({scalarAt(item, "id"), item});
        }
        return entries;
    }
    throw SyncException(ERROR_MALFORMED_UPSTREAM_DATA, string("Unexpected type for ") + what + ": " + container.type_name(), false);
}

KodBoxClient::KodBoxClient(KodBoxSettings settings) :
    _settings(settings),
    logger(Logging::get("kodbox"))
{
    while (BridgeUtils::endsWith(_settings.baseURL, "/")) {
        _settings.baseURL.pop_back();
    }
}

long KodBoxClient::effectiveTimeout(chrono::seconds timeout) const {
    long requested = (long)timeout.count();
    if (requested <= 0) {
        return _settings.timeoutSeconds;
    }
    return min(requested, _settings.timeoutSeconds);
}

TaskStatus KodBoxClient::statusFromKodBox(const string & code) {
    if (code == "1") {
        return TaskStatus::Done;
    }
    if (code == "2") {
        return TaskStatus::InProgress;
    }
    if (code == "3") {
        return TaskStatus::Cancelled;
    }
    return TaskStatus::Open;
}

// KodBox spells the two highest levels "hight" and "very-hight".
TaskPriority KodBoxClient::priorityFromKodBox(const string & level) {
    if (level == "very-hight" || level == "very-high") {
        return TaskPriority::VeryHigh;
    }
    if (level == "hight" || level == "high") {
        return TaskPriority::High;
    }
    if (level == "normal") {
        return TaskPriority::Normal;
    }
    if (level == "low") {
        return TaskPriority::Low;
    }
    if (level == "very-low") {
        return TaskPriority::VeryLow;
    }
    return TaskPriority::None;
}

Task KodBoxClient::parseTask(const string & id, const json & data, int utcOffsetMinutes) {
    string projectId = scalarAt(data, "projectID");
    string title = scalarAt(data, "name");
    Task task(id, projectId, title == "" ? "Untitled Task" : title);

    json meta = (data.count("metaInfo") && data["metaInfo"].is_object()) ? data["metaInfo"] : json::object();

    string desc = scalarAt(data, "desc");
    if (desc != "") {
        string text = BridgeUtils::htmlToText(desc);
        if (text != "") {
            task.setDescription(text);
        }
    }

    task.setStatus(statusFromKodBox(scalarAt(data, "status")));
    task.setPriority(priorityFromKodBox(scalarAt(meta, "taskLevel")));

    string owner = scalarAt(data, "ownerUser");
    if (owner != "" && owner != "0") {
        task.setAssignee(owner);
    }

    time_t created = timestampAt(data, "createTime");
    time_t modified = timestampAt(data, "modifyTime");
    if (created) {
        task.setCreatedAt(created);
    }
    if (modified) {
        task.setModifiedAt(modified);
    }

    time_t from = timestampAt(meta, "timeFrom");
    time_t to = timestampAt(meta, "timeTo");
    if (from && to) {
        task.setStart(BridgeUtils::formatDateTimeUTC(from));
        task.setDue(BridgeUtils::formatDateTimeUTC(max(from, to)));
    } else if (from) {
        task.setStart(BridgeUtils::formatDate(from, utcOffsetMinutes));
    } else if (to) {
        task.setDue(BridgeUtils::formatDate(to, utcOffsetMinutes));
    } else if (created) {
        task.setStart(BridgeUtils::formatDate(created, utcOffsetMinutes));
    }
    return task;
}

KodBoxListing KodBoxClient::parseListing(const json & response, int utcOffsetMinutes) {
    if (!response.is_object()) {
        throw SyncException(ERROR_MALFORMED_UPSTREAM_DATA, "Listing response is not an object", false);
    }
    if (!response.count("code") || !response["code"].is_boolean() || !response["code"].get<bool>()) {
        string info = scalarAt(response, "info");
        if (info == "" && response.count("data")) {
            info = scalarString(response["data"]);
        }
        string lower = BridgeUtils::toLowerCase(info);
        if (lower.find("login") != string::npos || lower.find("token") != string::npos || lower.find("auth") != string::npos) {
            throw SyncException(ERROR_AUTH_FAILURE, "Listing rejected: " + info, false);
        }
        throw SyncException(ERROR_MALFORMED_UPSTREAM_DATA, "Listing failed: " + info, false);
    }
    if (!response.count("data") || !response["data"].is_object()) {
        throw SyncException(ERROR_MALFORMED_UPSTREAM_DATA, "Listing response has no data object", false);
    }

    const json & data = response["data"];
    KodBoxListing listing;
    map<string, size_t> projectIndex;

    for (const auto & entry : keyedEntries(data.count("project") ? data["project"] : json(), "data.project")) {
        if (entry.first == "" || !entry.second.is_object()) {
            continue;
        }
        string name = scalarAt(entry.second, "name");
        Project project(entry.first, name == "" ? "Project " + entry.first : name);
        string desc = scalarAt(entry.second, "desc");
        if (desc != "") {
            project.setDescription(BridgeUtils::htmlToText(desc));
        }
        string owner = scalarAt(entry.second, "createUser");
        if (owner != "" && owner != "0") {
            project.setOwner(owner);
        }
        if (time_t created = timestampAt(entry.second, "createTime")) {
            project.setCreatedAt(created);
        }
        if (time_t modified = timestampAt(entry.second, "modifyTime")) {
            project.setModifiedAt(modified);
        }
        projectIndex[entry.first] = listing.projects.size();
        listing.projects.push_back(project);
        listing.tasks[entry.first];
    }

    for (const auto & entry : keyedEntries(data.count("task") ? data["task"] : json(), "data.task")) {
        if (entry.first == "" || !entry.second.is_object()) {
            continue;
        }
        if (scalarAt(entry.second, "isList") == "1") {
            continue;
        }
        string projectId = scalarAt(entry.second, "projectID");
        if (projectId == "") {
            continue;
        }
        if (projectIndex.count(projectId) == 0) {
            // listing references a project it did not describe
            projectIndex[projectId] = listing.projects.size();
            listing.projects.push_back(Project(projectId, "Project " + projectId));
        }
        listing.tasks[projectId].push_back(parseTask(entry.first, entry.second, utcOffsetMinutes));
    }

    return listing;
}

void KodBoxClient::login(long timeoutSeconds) {
    if (_settings.username == "") {
        throw SyncException(ERROR_AUTH_FAILURE, "No KodBox username configured", false);
    }

    CURL * escaper = curl_easy_init();
    if (escaper == nullptr) {
        throw SyncException(ERROR_UPSTREAM_UNAVAILABLE, "curl_easy_init failed", true);
    }
    char * n = curl_easy_escape(escaper, _settings.username.c_str(), (int)_settings.username.size());
    char * p = curl_easy_escape(escaper, _settings.password.c_str(), (int)_settings.password.size());
    string query = "name=" + string(n ? n : "") + "&password=" + string(p ? p : "");
    curl_free(n);
    curl_free(p);
    curl_easy_cleanup(escaper);

    string url = _settings.baseURL + "/?user/index/loginSubmit&" + query;
    string cookies;
    json resp = PerformJSONRequest(CreateJSONRequest(url, "GET", timeoutSeconds), &cookies);

    if (!resp.is_object() || !resp.count("code") || !resp["code"].is_boolean() || !resp["code"].get<bool>()) {
        throw SyncException(ERROR_AUTH_FAILURE, "Login rejected: " + scalarAt(resp, "info"), false);
    }
    string token = scalarAt(resp, "info");
    if (token == "") {
        throw SyncException(ERROR_MALFORMED_UPSTREAM_DATA, "Login response carries no access token", false);
    }
    _accessToken = token;

    _csrfToken = "";
    for (const auto & cookie : BridgeUtils::split(cookies, ';')) {
        string c = BridgeUtils::trim(cookie);
        if (BridgeUtils::startsWith(c, "CSRF_TOKEN=")) {
            _csrfToken = c.substr(11);
        }
    }
    logger->info("Logged in to KodBox as {}{}", _settings.username, _csrfToken == "" ? "" : " (with CSRF token)");
}

json KodBoxClient::fetchListing(long timeoutSeconds) {
    map<string, string> fields = {
        {"API_ROUTE", "plugin/project/taskListSelf"},
        {"accessToken", _accessToken},
    };
    string cookie;
    if (_csrfToken != "") {
        fields["CSRF_TOKEN"] = _csrfToken;
        cookie = "CSRF_TOKEN=" + _csrfToken;
    }
    return PerformJSONRequest(CreateFormRequest(_settings.baseURL + "/index.php", fields, timeoutSeconds, cookie));
}

void KodBoxClient::refreshListing(long timeoutSeconds) {
    bool freshLogin = false;
    if (_accessToken == "") {
        login(timeoutSeconds);
        freshLogin = true;
    }

    KodBoxListing listing;
    try {
        listing = parseListing(fetchListing(timeoutSeconds), _settings.utcOffsetMinutes);
    } catch (SyncException & ex) {
        if (ex.key != ERROR_AUTH_FAILURE || freshLogin) {
            throw;
        }
        logger->info("KodBox rejected the access token, logging in again");
        _accessToken = "";
        login(timeoutSeconds);
        listing = parseListing(fetchListing(timeoutSeconds), _settings.utcOffsetMinutes);
    }

    size_t taskCount = 0;
    for (const auto & pair : listing.tasks) {
        taskCount += pair.second.size();
    }
    logger->debug("Fetched {} projects and {} tasks", listing.projects.size(), taskCount);

    _listing = listing;
    _hasListing = true;
}

vector<Project> KodBoxClient::listProjects(chrono::seconds timeout) {
    lock_guard<mutex> lock(_mtx);
    _hasListing = false;
    refreshListing(effectiveTimeout(timeout));
    return _listing.projects;
}

vector<Task> KodBoxClient::listTasks(const string & projectId, chrono::seconds timeout) {
    lock_guard<mutex> lock(_mtx);
    if (!_hasListing) {
        refreshListing(effectiveTimeout(timeout));
    }
    auto it = _listing.tasks.find(projectId);
    if (it == _listing.tasks.end()) {
        throw SyncException(ERROR_NOT_FOUND, "Project " + projectId + " is not in the listing", false);
    }
    return it->second;
}

json KodBoxClient::testConnection() {
    lock_guard<mutex> lock(_mtx);
    _accessToken = "";
    _hasListing = false;
    refreshListing(_settings.timeoutSeconds);

    size_t taskCount = 0;
    for (const auto & pair : _listing.tasks) {
        taskCount += pair.second.size();
    }
    return {
        {"ok", true},
        {"baseURL", _settings.baseURL},
        {"username", _settings.username},
        {"projects", _listing.projects.size()},
        {"tasks", taskCount},
    };
}
