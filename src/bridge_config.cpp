#include "davbridge/bridge_config.hpp"
#include "davbridge/bridge_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <sys/stat.h>

using namespace std;
using nlohmann::json;

ConfigException::ConfigException(string what) :
    GenericException(what)
{
}

static long long parseInteger(const string & key, const string & value) {
    string trimmed = BridgeUtils::trim(value);
    char * end = nullptr;
    errno = 0;
    long long result = strtoll(trimmed.c_str(), &end, 10);
    if (trimmed == "" || errno != 0 || end == nullptr || *end != '\0') {
        throw ConfigException(key + " must be an integer, got '" + value + "'");
    }
    return result;
}

static bool parseBoolean(const string & key, const string & value) {
    string v = BridgeUtils::toLowerCase(BridgeUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") {
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "off") {
        return false;
    }
    throw ConfigException(key + " must be a boolean, got '" + value + "'");
}

static vector<string> parseList(const string & value) {
    vector<string> result;
    for (const auto & item : BridgeUtils::split(value, ',')) {
        string trimmed = BridgeUtils::trim(item);
        if (trimmed != "") {
            result.push_back(trimmed);
        }
    }
    return result;
}

// Reads `section.key` if present. Numbers may also be given as strings.
static bool readString(const json & section, const string & path, const char * key, string & out) {
    if (!section.count(key) || section[key].is_null()) {
        return false;
    }
    const json & v = section[key];
    if (v.is_string()) {
        out = v.get<string>();
    } else if (v.is_number_integer()) {
        out = to_string(v.get<long long>());
    } else if (v.is_boolean()) {
        out = v.get<bool>() ? "true" : "false";
    } else {
        throw ConfigException(path + "." + key + " has an unsupported type (" + v.type_name() + ")");
    }
    return true;
}

static bool readInteger(const json & section, const string & path, const char * key, long long & out) {
    string value;
    if (!readString(section, path, key, value)) {
        return false;
    }
    out = parseInteger(path + "." + key, value);
    return true;
}

static const json & sectionOf(const json & root, const char * name) {
    static const json empty = json::object();
    if (!root.count(name)) {
        return empty;
    }
    if (!root[name].is_object()) {
        throw ConfigException(string("Config section '") + name + "' must be an object");
    }
    return root[name];
}

void BridgeConfig::applyJSON(const json & root) {
    if (!root.is_object()) {
        throw ConfigException("Config file must contain a JSON object");
    }
    string s;
    long long n;

    const json & k = sectionOf(root, "kodbox");
    if (readString(k, "kodbox", "base_url", s)) kodbox.baseURL = s;
    if (readString(k, "kodbox", "username", s)) kodbox.username = s;
    if (readString(k, "kodbox", "password", s)) kodbox.password = s;
    if (readInteger(k, "kodbox", "timeout", n)) kodbox.timeoutSeconds = (long)n;
    if (readInteger(k, "kodbox", "utc_offset_minutes", n)) kodbox.utcOffsetMinutes = (int)n;

    const json & c = sectionOf(root, "caldav");
    if (readString(c, "caldav", "username", s)) caldav.username = s;
    if (readString(c, "caldav", "password", s)) caldav.password = s;
    if (readString(c, "caldav", "realm", s)) caldav.realm = s;
    if (c.count("public_tokens")) {
        const json & tokens = c["public_tokens"];
        if (tokens.is_string()) {
            caldav.publicTokens = parseList(tokens.get<string>());
        } else if (tokens.is_array()) {
            caldav.publicTokens.clear();
            for (const auto & token : tokens) {
                if (!token.is_string()) {
                    throw ConfigException("caldav.public_tokens must contain strings");
                }
                caldav.publicTokens.push_back(token.get<string>());
            }
        } else if (!tokens.is_null()) {
            throw ConfigException("caldav.public_tokens must be a list");
        }
    }

    const json & srv = sectionOf(root, "server");
    if (readString(srv, "server", "host", s)) server.host = s;
    if (readInteger(srv, "server", "port", n)) {
        if (n < 0 || n > 65535) {
            throw ConfigException("server.port out of range: " + to_string(n));
        }
        server.port = (unsigned short)n;
    }
    if (readInteger(srv, "server", "idle_timeout_seconds", n)) server.idleTimeoutSeconds = (int)n;

    const json & sy = sectionOf(root, "sync");
    if (readInteger(sy, "sync", "interval_seconds", n)) sync.interval = chrono::milliseconds(n * 1000);
    if (readInteger(sy, "sync", "max_retries", n)) sync.maxAttempts = (int)n;
    if (readInteger(sy, "sync", "retry_base_seconds", n)) sync.backoffBase = chrono::milliseconds(n * 1000);
    if (readInteger(sy, "sync", "retry_cap_seconds", n)) sync.backoffCap = chrono::milliseconds(n * 1000);
    if (readString(sy, "sync", "eager", s)) sync.eager = parseBoolean("sync.eager", s);
    if (readInteger(sy, "sync", "history_depth", n)) historyDepth = (size_t)max(0LL, n);
    if (readInteger(sy, "sync", "upstream_timeout_seconds", n)) {
        sync.upstreamTimeout = chrono::seconds(n);
        upstreamTimeoutExplicit = true;
    }

    const json & l = sectionOf(root, "logging");
    if (readString(l, "logging", "level", s)) logging.level = s;
    if (readString(l, "logging", "file_path", s)) logging.filePath = s;
    if (readInteger(l, "logging", "max_bytes", n)) logging.maxBytes = (size_t)max(0LL, n);
    if (readInteger(l, "logging", "backup_count", n)) logging.backupCount = (size_t)max(0LL, n);

    followUpstreamTimeout();
}

void BridgeConfig::applyFile(const string & path) {
    ifstream in(path);
    if (!in.is_open()) {
        throw ConfigException("Unable to open config file " + path);
    }
    stringstream buffer;
    buffer << in.rdbuf();

    json root;
    try {
        root = json::parse(buffer.str());
    } catch (json::exception & ex) {
        throw ConfigException("Invalid JSON in " + path + ": " + ex.what());
    }
    applyJSON(root);
    sourcePath = path;
}

void BridgeConfig::applyEnvironment(EnvLookup lookup) {
    string v;
    if ((v = lookup("KODBOX_BASE_URL")) != "") kodbox.baseURL = v;
    if ((v = lookup("KODBOX_USERNAME")) != "") kodbox.username = v;
    if ((v = lookup("KODBOX_PASSWORD")) != "") kodbox.password = v;
    if ((v = lookup("KODBOX_TIMEOUT")) != "") kodbox.timeoutSeconds = (long)parseInteger("KODBOX_TIMEOUT", v);

    if ((v = lookup("CALDAV_USERNAME")) != "") caldav.username = v;
    if ((v = lookup("CALDAV_PASSWORD")) != "") caldav.password = v;
    if ((v = lookup("CALDAV_REALM")) != "") caldav.realm = v;
    if ((v = lookup("CALDAV_PUBLIC_TOKENS")) != "") caldav.publicTokens = parseList(v);

    if ((v = lookup("SERVER_HOST")) != "") server.host = v;
    if ((v = lookup("SERVER_PORT")) != "") {
        long long port = parseInteger("SERVER_PORT", v);
        if (port < 0 || port > 65535) {
            throw ConfigException("SERVER_PORT out of range: " + v);
        }
        server.port = (unsigned short)port;
    }

    if ((v = lookup("SYNC_INTERVAL")) != "") sync.interval = chrono::milliseconds(parseInteger("SYNC_INTERVAL", v) * 1000);
    if ((v = lookup("SYNC_MAX_RETRIES")) != "") sync.maxAttempts = (int)parseInteger("SYNC_MAX_RETRIES", v);
    if ((v = lookup("SYNC_RETRY_DELAY")) != "") sync.backoffBase = chrono::milliseconds(parseInteger("SYNC_RETRY_DELAY", v) * 1000);
    if ((v = lookup("SYNC_RETRY_CAP")) != "") sync.backoffCap = chrono::milliseconds(parseInteger("SYNC_RETRY_CAP", v) * 1000);
    if ((v = lookup("SYNC_UPSTREAM_TIMEOUT")) != "") {
        sync.upstreamTimeout = chrono::seconds(parseInteger("SYNC_UPSTREAM_TIMEOUT", v));
        upstreamTimeoutExplicit = true;
    }

    if ((v = lookup("LOG_LEVEL")) != "") logging.level = v;
    if ((v = lookup("LOG_FILE")) != "") logging.filePath = v;
    if ((v = lookup("LOG_MAX_BYTES")) != "") logging.maxBytes = (size_t)parseInteger("LOG_MAX_BYTES", v);
    if ((v = lookup("LOG_BACKUP_COUNT")) != "") logging.backupCount = (size_t)parseInteger("LOG_BACKUP_COUNT", v);

    followUpstreamTimeout();
}

// Without an explicit sync.upstream_timeout_seconds a cycle gives each
// upstream call as long as the KodBox client itself allows.
void BridgeConfig::followUpstreamTimeout() {
    if (!upstreamTimeoutExplicit) {
        sync.upstreamTimeout = chrono::seconds(kodbox.timeoutSeconds);
    }
}

void BridgeConfig::validate(bool serving) const {
    if (kodbox.baseURL == "") {
        throw ConfigException("kodbox.base_url is required");
    }
    if (!BridgeUtils::startsWith(kodbox.baseURL, "http://") && !BridgeUtils::startsWith(kodbox.baseURL, "https://")) {
        throw ConfigException("kodbox.base_url must be an http(s) URL: " + kodbox.baseURL);
    }
    if (kodbox.username == "") {
        throw ConfigException("kodbox.username is required");
    }
    if (kodbox.timeoutSeconds <= 0) {
        throw ConfigException("kodbox.timeout must be positive");
    }
    if (kodbox.utcOffsetMinutes < -14 * 60 || kodbox.utcOffsetMinutes > 14 * 60) {
        throw ConfigException("kodbox.utc_offset_minutes out of range");
    }

    if (serving) {
        if (caldav.username == "" || caldav.password == "") {
            throw ConfigException("caldav.username and caldav.password are required");
        }
        if (server.port == 0) {
            throw ConfigException("server.port must be between 1 and 65535");
        }
    }

    if (sync.interval < chrono::seconds(1)) {
        throw ConfigException("sync.interval_seconds must be at least 1");
    }
    if (sync.maxAttempts < 1) {
        throw ConfigException("sync.max_retries must be at least 1");
    }
    if (sync.backoffBase.count() <= 0 || sync.backoffCap < sync.backoffBase) {
        throw ConfigException("sync.retry_base_seconds must be positive and no larger than sync.retry_cap_seconds");
    }
    if (historyDepth < 1) {
        throw ConfigException("sync.history_depth must be at least 1");
    }
    if (sync.upstreamTimeout.count() <= 0) {
        throw ConfigException("sync.upstream_timeout_seconds must be positive");
    }

    static const vector<string> levels = {"trace", "debug", "info", "warn", "warning", "error", "critical", "off"};
    if (find(levels.begin(), levels.end(), BridgeUtils::toLowerCase(logging.level)) == levels.end()) {
        throw ConfigException("logging.level must be one of trace, debug, info, warning, error, critical");
    }
}

json BridgeConfig::toJSON() const {
    auto redact = [](const string & secret) {
        return secret == "" ? string("") : string("********");
    };
    return {
        {"source", sourcePath},
        {"kodbox", {
            {"base_url", kodbox.baseURL},
            {"username", kodbox.username},
            {"password", redact(kodbox.password)},
            {"timeout", kodbox.timeoutSeconds},
            {"utc_offset_minutes", kodbox.utcOffsetMinutes},
        }},
        {"caldav", {
            {"username", caldav.username},
            {"password", redact(caldav.password)},
            {"realm", caldav.realm},
            {"public_tokens", caldav.publicTokens.size()},
        }},
        {"server", {
            {"host", server.host},
            {"port", server.port},
            {"idle_timeout_seconds", server.idleTimeoutSeconds},
        }},
        {"sync", {
            {"interval_seconds", chrono::duration_cast<chrono::seconds>(sync.interval).count()},
            {"max_retries", sync.maxAttempts},
            {"retry_base_seconds", chrono::duration_cast<chrono::seconds>(sync.backoffBase).count()},
            {"retry_cap_seconds", chrono::duration_cast<chrono::seconds>(sync.backoffCap).count()},
            {"eager", sync.eager},
            {"history_depth", historyDepth},
            {"upstream_timeout_seconds", sync.upstreamTimeout.count()},
        }},
        {"logging", {
            {"level", logging.level},
            {"file_path", logging.filePath},
            {"max_bytes", logging.maxBytes},
            {"backup_count", logging.backupCount},
        }},
    };
}

vector<string> BridgeConfig::candidatePaths(const string & explicitPath) {
    if (explicitPath != "") {
        return {explicitPath};
    }
    return {"config.json", "config/config.json", "/etc/davbridge/config.json"};
}

string BridgeConfig::processEnvironment(const string & key) {
    return BridgeUtils::getEnvUTF8(key);
}

BridgeConfig BridgeConfig::load(const string & explicitPath, EnvLookup lookup) {
    BridgeConfig config;
    for (const auto & path : candidatePaths(explicitPath)) {
        struct stat buffer;
        if (stat(path.c_str(), &buffer) == 0) {
            config.applyFile(path);
            break;
        }
        if (explicitPath != "") {
            throw ConfigException("Config file " + explicitPath + " does not exist");
        }
    }
    config.applyEnvironment(lookup);
    return config;
}
