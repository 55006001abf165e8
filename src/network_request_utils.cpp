#include "davbridge/network_request_utils.hpp"
#include "davbridge/sync_exception.hpp"
#include "davbridge/constants.hpp"
#include "davbridge/bridge_utils.hpp"

#include <sys/stat.h>
#include <algorithm>

using namespace std;

string FindLinuxCertsBundle() {
#ifdef __linux__
    std::string certificatePaths[] = {
        // Debian, Ubuntu, Arch
        "/etc/ssl/certs/ca-certificates.crt",
        // Red Hat, Fedora, Centos
        "/etc/pki/tls/certs/ca-bundle.crt",
        "/usr/share/ssl/certs/ca-bundle.crt",
        // FreeBSD
        "/usr/local/share/certs/ca-root-nss.crt",
        // OpenBSD
        "/etc/ssl/cert.pem",
        // OpenSUSE
        "/etc/ssl/ca-bundle.pem",
    };
    for (const auto & path : certificatePaths) {
        struct stat buffer;
        if (stat(path.c_str(), &buffer) == 0) {
            return path;
        }
    }
#endif
    return "";
}

size_t _onAppendToString(void *contents, size_t length, size_t nmemb, void *userp) {
    string * buffer = (string *)userp;
    size_t real_size = length * nmemb;

    size_t oldLength = buffer->size();
    size_t newLength = oldLength + real_size;

    buffer->resize(newLength);
    std::copy((char*)contents, (char*)contents+real_size, buffer->begin() + oldLength);

    return real_size;
}

// Collects the name=value part of every Set-Cookie header, joined with "; ".
static size_t _onAppendSetCookie(char *contents, size_t length, size_t nmemb, void *userp) {
    string * cookies = (string *)userp;
    size_t real_size = length * nmemb;
    string line(contents, real_size);

    if (BridgeUtils::startsWith(BridgeUtils::toLowerCase(line), "set-cookie:")) {
        string value = BridgeUtils::trim(line.substr(11));
        size_t semi = value.find(';');
        if (semi != string::npos) {
            value = value.substr(0, semi);
        }
        if (value != "") {
            if (cookies->size()) {
                *cookies += "; ";
            }
            *cookies += value;
        }
    }
    return real_size;
}

static void ApplyCommonOptions(CURL * curl_handle, long timeoutSeconds, const string & cookie) {
    curl_easy_setopt(curl_handle, CURLOPT_CONNECTTIMEOUT, min(timeoutSeconds, 20L));
    curl_easy_setopt(curl_handle, CURLOPT_TIMEOUT, timeoutSeconds);
    curl_easy_setopt(curl_handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_handle, CURLOPT_MAXREDIRS, 5L);

    if (cookie != "") {
        curl_easy_setopt(curl_handle, CURLOPT_COOKIE, cookie.c_str());
    }

    // Ensure /all/ curl code paths run this code for RHEL and other linux distros
    string explicitCertsBundlePath = FindLinuxCertsBundle();
    if (explicitCertsBundlePath != "") {
        curl_easy_setopt(curl_handle, CURLOPT_CAINFO, explicitCertsBundlePath.c_str());
    }
}

string EncodeFormFields(CURL * curl_handle, const map<string, string> & fields) {
    string payload;
    for (const auto & pair : fields) {
        char * k = curl_easy_escape(curl_handle, pair.first.c_str(), (int)pair.first.size());
        char * v = curl_easy_escape(curl_handle, pair.second.c_str(), (int)pair.second.size());
        if (k == nullptr || v == nullptr) {
            curl_free(k);
            curl_free(v);
            throw SyncException(ERROR_UPSTREAM_UNAVAILABLE, "Unable to escape form field " + pair.first, false);
        }
        if (payload.size()) {
            payload += "&";
        }
        payload += string(k) + "=" + string(v);
        curl_free(k);
        curl_free(v);
    }
    return payload;
}

// The header list is kept in CURLINFO_PRIVATE so PerformRequest can free it
// along with the handle.
static void AttachHeaders(CURL * curl_handle, struct curl_slist * headers) {
    curl_easy_setopt(curl_handle, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl_handle, CURLOPT_PRIVATE, (void *)headers);
}

static void CleanupRequest(CURL * curl_handle) {
    struct curl_slist * headers = nullptr;
    curl_easy_getinfo(curl_handle, CURLINFO_PRIVATE, (char **)&headers);
    curl_easy_cleanup(curl_handle);
    if (headers != nullptr) {
        curl_slist_free_all(headers);
    }
}

CURL * CreateJSONRequest(string url, string method, long timeoutSeconds, string cookie) {
    CURL * curl_handle = curl_easy_init();
    if (curl_handle == nullptr) {
        throw SyncException(ERROR_UPSTREAM_UNAVAILABLE, "curl_easy_init failed", true);
    }
    curl_easy_setopt(curl_handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle, CURLOPT_CUSTOMREQUEST, method.c_str());
    ApplyCommonOptions(curl_handle, timeoutSeconds, cookie);

    struct curl_slist *headers = NULL;
    headers = curl_slist_append(headers, "Accept: application/json");
    AttachHeaders(curl_handle, headers);
    return curl_handle;
}

CURL * CreateFormRequest(string url, const map<string, string> & fields, long timeoutSeconds, string cookie) {
    CURL * curl_handle = CreateJSONRequest(url, "POST", timeoutSeconds, cookie);

    string payload;
    try {
        payload = EncodeFormFields(curl_handle, fields);
    } catch (SyncException &) {
        CleanupRequest(curl_handle);
        throw;
    }

    struct curl_slist * headers = nullptr;
    curl_easy_getinfo(curl_handle, CURLINFO_PRIVATE, (char **)&headers);
    headers = curl_slist_append(headers, "Content-Type: application/x-www-form-urlencoded");
    AttachHeaders(curl_handle, headers);

    curl_easy_setopt(curl_handle, CURLOPT_POSTFIELDSIZE, (long)payload.size());
    curl_easy_setopt(curl_handle, CURLOPT_COPYPOSTFIELDS, payload.c_str());
    return curl_handle;
}

const string PerformRequest(CURL * curl_handle, string * setCookies) {
    string result;
    string cookies;
    curl_easy_setopt(curl_handle, CURLOPT_WRITEFUNCTION, _onAppendToString);
    curl_easy_setopt(curl_handle, CURLOPT_WRITEDATA, (void *)&result);
    curl_easy_setopt(curl_handle, CURLOPT_HEADERFUNCTION, _onAppendSetCookie);
    curl_easy_setopt(curl_handle, CURLOPT_HEADERDATA, (void *)&cookies);

    CURLcode res = curl_easy_perform(curl_handle);
    try {
        ValidateRequestResp(res, curl_handle, result);
    } catch (SyncException &) {
        CleanupRequest(curl_handle);
        throw;
    }
    CleanupRequest(curl_handle);

    if (setCookies != nullptr) {
        *setCookies = cookies;
    }
    return result;
}

const nlohmann::json PerformJSONRequest(CURL * curl_handle, string * setCookies) {
    string result = PerformRequest(curl_handle, setCookies);
    try {
        return nlohmann::json::parse(result);
    } catch (nlohmann::json::exception & ex) {
        throw SyncException(ERROR_MALFORMED_UPSTREAM_DATA, string(ex.what()) + " in response: " + result.substr(0, 200), false);
    }
}

void ValidateRequestResp(CURLcode res, CURL * curl_handle, string resp) {
    char * _url = nullptr;
    string url = "(unknown url)";
    if (curl_easy_getinfo(curl_handle, CURLINFO_EFFECTIVE_URL, &_url) == CURLE_OK && _url != nullptr) {
        url = string(_url);
    }
    // never log credentials passed in the query string
    size_t query = url.find('?');
    if (query != string::npos) {
        url = url.substr(0, query);
    }

    if (res != CURLE_OK) {
        throw SyncException(res, url);
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle, CURLINFO_RESPONSE_CODE, &http_code);

    if (http_code < 200 || http_code > 209) {
        string debuginfo = url + " RETURNED " + to_string(http_code) + " " + resp.substr(0, 200);
        if (http_code == 401 || http_code == 403) {
            throw SyncException(ERROR_AUTH_FAILURE, debuginfo, false);
        }
        if (http_code == 404) {
            throw SyncException(ERROR_NOT_FOUND, debuginfo, false);
        }
        throw SyncException(ERROR_UPSTREAM_UNAVAILABLE, debuginfo, true);
    }
}
