#include "davbridge/bridge_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <picosha2.h>
#include <libxml/HTMLparser.h>

using namespace std;

static const char BASE64_CHARS[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

string BridgeUtils::getEnvUTF8(string key) {
    const char * val = getenv(key.c_str());
    if (val == nullptr) {
        return "";
    }
    return string(val);
}

// Returns an empty string when the input is not valid base64.
string BridgeUtils::fromBase64(const string & src) {
    string out;
    unsigned int buffer = 0;
    int bits = 0;
    size_t padding = 0;
    for (char c : src) {
        if (c == '=') {
            padding++;
            continue;
        }
        if (padding > 0) {
            return "";
        }
        const char * pos = strchr(BASE64_CHARS, c);
        if (c == '\0' || pos == nullptr) {
            return "";
        }
        buffer = (buffer << 6) | (unsigned int)(pos - BASE64_CHARS);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back((char)((buffer >> bits) & 0xFF));
        }
    }
    if (padding > 2) {
        return "";
    }
    return out;
}

string BridgeUtils::sha256Hex(const string & src) {
    vector<unsigned char> hash(picosha2::k_digest_size);
    picosha2::hash256(src.begin(), src.end(), hash.begin(), hash.end());
    return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

bool BridgeUtils::constantTimeEquals(const string & a, const string & b) {
    unsigned char diff = (a.size() == b.size()) ? 0 : 1;
    size_t n = max(a.size(), b.size());
    for (size_t i = 0; i < n; i++) {
        unsigned char ca = i < a.size() ? (unsigned char)a[i] : 0;
        unsigned char cb = i < b.size() ? (unsigned char)b[i] : 0;
        diff |= ca ^ cb;
    }
    return diff == 0;
}

string BridgeUtils::toUpperCase(string s) {
    transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)toupper(c); });
    return s;
}

string BridgeUtils::toLowerCase(string s) {
    transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)tolower(c); });
    return s;
}

string BridgeUtils::trim(const string & s) {
    const char * ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

vector<string> BridgeUtils::split(const string & s, char delimiter) {
    vector<string> parts;
    string current;
    istringstream stream(s);
    while (getline(stream, current, delimiter)) {
        parts.push_back(current);
    }
    return parts;
}

bool BridgeUtils::startsWith(const string & s, const string & prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool BridgeUtils::endsWith(const string & s, const string & suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static int hexValue(char h) {
    if (h >= '0' && h <= '9') return h - '0';
    if (h >= 'a' && h <= 'f') return 10 + (h - 'a');
    if (h >= 'A' && h <= 'F') return 10 + (h - 'A');
    return -1;
}

// Path decoding: "+" is left alone since it is literal in path segments.
string BridgeUtils::urlDecode(const string & s) {
    string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '%' && i + 2 < s.size()) {
            int hi = hexValue(s[i + 1]);
            int lo = hexValue(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back((char)((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(c);
    }
    return out;
}

string BridgeUtils::urlEncodeSegment(const string & s) {
    static const char * hex = "0123456789ABCDEF";
    string out;
    for (unsigned char c : s) {
        if (isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '@') {
            out.push_back((char)c);
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 15]);
        }
    }
    return out;
}

static bool isBlockElement(const string & name) {
    static const char * blocks[] = {"div", "li", "tr", "ul", "ol", "table", "blockquote", "h1", "h2", "h3", "h4", "h5", "h6", "pre"};
    for (const char * block : blocks) {
        if (name == block) {
            return true;
        }
    }
    return false;
}

// Returns false when the children of the node carry no readable text.
static bool openHTMLNode(xmlNodePtr node, string & text) {
    if (node->type == XML_TEXT_NODE || node->type == XML_CDATA_SECTION_NODE) {
        if (node->content != nullptr) {
            text += (const char *)node->content;
        }
        return false;
    }
    if (node->type != XML_ELEMENT_NODE) {
        return false;
    }
    string name = (const char *)node->name;
    if (name == "script" || name == "style" || name == "head") {
        return false;
    }
    if (name == "br") {
        text += "\n";
    } else if (name == "p") {
        text += "\n\n";
    } else if (isBlockElement(name)) {
        text += "\n";
    }
    return true;
}

static void closeHTMLNode(xmlNodePtr node, string & text) {
    if (node->type != XML_ELEMENT_NODE || !xmlStrEqual(node->name, (const xmlChar *)"a")) {
        return;
    }
    xmlChar * href = xmlGetProp(node, (const xmlChar *)"href");
    if (href != nullptr) {
        string target = BridgeUtils::trim((const char *)href);
        xmlFree(href);
        if (target != "" && !BridgeUtils::startsWith(target, "javascript:")) {
            text += " (" + target + ")";
        }
    }
}

string BridgeUtils::htmlToText(const string & html) {
    if (trim(html) == "") {
        return "";
    }
    htmlDocPtr doc = htmlReadMemory(html.c_str(), (int)html.size(), nullptr, "utf-8",
                                    HTML_PARSE_NONET | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING);
    if (doc == nullptr) {
        return trim(html);
    }

    // Walked without recursion so deeply nested markup cannot exhaust the stack.
    string text;
    xmlNodePtr root = xmlDocGetRootElement(doc);
    xmlNodePtr node = root;
    while (node != nullptr) {
        if (openHTMLNode(node, text) && node->children != nullptr) {
            node = node->children;
            continue;
        }
        while (node != nullptr) {
            closeHTMLNode(node, text);
            if (node == root) {
                node = nullptr;
            } else if (node->next != nullptr) {
                node = node->next;
                break;
            } else {
                node = node->parent;
            }
        }
    }
    xmlFreeDoc(doc);

    // non-breaking spaces read as plain spaces
    size_t nbsp = 0;
    while ((nbsp = text.find("\xC2\xA0", nbsp)) != string::npos) {
        text.replace(nbsp, 2, " ");
    }

    string joined;
    bool previousBlank = false;
    for (const auto & line : split(text, '\n')) {
        string trimmed = trim(line);
        if (trimmed == "" && previousBlank) {
            continue;
        }
        if (joined != "" || trimmed != "") {
            joined += trimmed + "\n";
        }
        previousBlank = trimmed == "";
    }
    return trim(joined);
}

static bool validDate(int y, int m, int d) {
    if (y < 1900 || y > 9999 || m < 1 || m > 12 || d < 1) {
        return false;
    }
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    int limit = days[m - 1];
    if (m == 2 && ((y % 4 == 0 && y % 100 != 0) || y % 400 == 0)) {
        limit = 29;
    }
    return d <= limit;
}

static time_t utcTime(int y, int mo, int d, int h, int mi, int s) {
    struct tm t = {};
    t.tm_year = y - 1900;
    t.tm_mon = mo - 1;
    t.tm_mday = d;
    t.tm_hour = h;
    t.tm_min = mi;
    t.tm_sec = s;
    return timegm(&t);
}

bool BridgeUtils::isAllDayDate(const string & value) {
    int y, m, d;
    char tail;
    if (value.size() != 10 || sscanf(value.c_str(), "%4d-%2d-%2d%c", &y, &m, &d, &tail) != 3) {
        return false;
    }
    return validDate(y, m, d);
}

bool BridgeUtils::isDateTimeUTC(const string & value) {
    int y, mo, d, h, mi, s;
    if (value.size() != 20 || value[10] != 'T' || value[19] != 'Z') {
        return false;
    }
    if (sscanf(value.c_str(), "%4d-%2d-%2dT%2d:%2d:%2dZ", &y, &mo, &d, &h, &mi, &s) != 6) {
        return false;
    }
    return validDate(y, mo, d) && h < 24 && mi < 60 && s < 61;
}

// Returns -1 for values that are neither form. All-day dates map to
// midnight UTC.
time_t BridgeUtils::parseDateValue(const string & value) {
    int y, mo, d, h = 0, mi = 0, s = 0;
    if (isAllDayDate(value)) {
        sscanf(value.c_str(), "%4d-%2d-%2d", &y, &mo, &d);
        return utcTime(y, mo, d, 0, 0, 0);
    }
    if (isDateTimeUTC(value)) {
        sscanf(value.c_str(), "%4d-%2d-%2dT%2d:%2d:%2dZ", &y, &mo, &d, &h, &mi, &s);
        return utcTime(y, mo, d, h, mi, s);
    }
    return -1;
}

string BridgeUtils::formatDate(time_t t, int utcOffsetMinutes) {
    time_t shifted = t + (time_t)utcOffsetMinutes * 60;
    struct tm parts = {};
    gmtime_r(&shifted, &parts);
    char buffer[16];
    strftime(buffer, sizeof(buffer), "%Y-%m-%d", &parts);
    return string(buffer);
}

string BridgeUtils::formatDateTimeUTC(time_t t) {
    struct tm parts = {};
    gmtime_r(&t, &parts);
    char buffer[32];
    strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &parts);
    return string(buffer);
}

string BridgeUtils::addDays(const string & date, int days) {
    time_t t = parseDateValue(date);
    if (t == -1 || !isAllDayDate(date)) {
        return "";
    }
    return formatDate(t + (time_t)days * 86400);
}

time_t BridgeUtils::parseICalDateTime(const string & value) {
    int y, mo, d, h = 0, mi = 0, s = 0;
    if (value.size() == 8) {
        if (sscanf(value.c_str(), "%4d%2d%2d", &y, &mo, &d) != 3 || !validDate(y, mo, d)) {
            return -1;
        }
        return utcTime(y, mo, d, 0, 0, 0);
    }
    if (value.size() == 16 && value[8] == 'T' && value[15] == 'Z') {
        if (sscanf(value.c_str(), "%4d%2d%2dT%2d%2d%2dZ", &y, &mo, &d, &h, &mi, &s) != 6 || !validDate(y, mo, d)) {
            return -1;
        }
        if (h > 23 || mi > 59 || s > 60) {
            return -1;
        }
        return utcTime(y, mo, d, h, mi, s);
    }
    return -1;
}

string BridgeUtils::httpDate(time_t t) {
    struct tm parts = {};
    gmtime_r(&t, &parts);
    static const char * days[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static const char * months[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    char buffer[40];
    snprintf(buffer, sizeof(buffer), "%s, %02d %s %04d %02d:%02d:%02d GMT",
             days[parts.tm_wday], parts.tm_mday, months[parts.tm_mon], parts.tm_year + 1900,
             parts.tm_hour, parts.tm_min, parts.tm_sec);
    return string(buffer);
}
