/** BridgeUtils [DAVBridge]
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

#ifndef BridgeUtils_hpp
#define BridgeUtils_hpp

#include <ctime>
#include <string>
#include <vector>

class BridgeUtils {
public:
    static std::string getEnvUTF8(std::string key);

    static std::string fromBase64(const std::string & src);
    static std::string sha256Hex(const std::string & src);
    static bool constantTimeEquals(const std::string & a, const std::string & b);

    static std::string toUpperCase(std::string s);
    static std::string toLowerCase(std::string s);
    static std::string trim(const std::string & s);
    static std::vector<std::string> split(const std::string & s, char delimiter);
    static bool startsWith(const std::string & s, const std::string & prefix);
    static bool endsWith(const std::string & s, const std::string & suffix);

    static std::string urlDecode(const std::string & s);
    static std::string urlEncodeSegment(const std::string & s);

    // Converts the HTML fragments upstream uses for task descriptions into
    // plain text. Links keep their target as "label (url)".
    static std::string htmlToText(const std::string & html);

    // Date values are either all-day dates ("2024-06-01") or UTC
    // date-times ("2024-06-01T09:30:00Z").
    static bool isAllDayDate(const std::string & value);
    static bool isDateTimeUTC(const std::string & value);
    static time_t parseDateValue(const std::string & value);
    static std::string formatDate(time_t t, int utcOffsetMinutes = 0);
    static std::string formatDateTimeUTC(time_t t);
    static std::string addDays(const std::string & date, int days);

    // iCalendar basic format: "20240601" and "20240601T093000Z".
    static time_t parseICalDateTime(const std::string & value);

    static std::string httpDate(time_t t);
};

#endif /* BridgeUtils_hpp */
