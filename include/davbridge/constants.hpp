/** Constants [DAVBridge]
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

#ifndef Constants_hpp
#define Constants_hpp

#include <string>

// Error keys carried by SyncException and DAVException
#define ERROR_UPSTREAM_UNAVAILABLE      "UpstreamUnavailable"
#define ERROR_AUTH_FAILURE              "AuthFailure"
#define ERROR_MALFORMED_UPSTREAM_DATA   "MalformedUpstreamData"
#define ERROR_PROTOCOL_REQUEST          "ProtocolRequestError"
#define ERROR_NOT_FOUND                 "NotFound"
#define ERROR_STALE_TOKEN               "StaleTokenError"
#define ERROR_MALFORMED_ICALENDAR       "MalformedICalendar"

// XML namespaces used by the CalDAV surface
#define NS_DAV          "DAV:"
#define NS_CALDAV       "urn:ietf:params:xml:ns:caldav"
#define NS_CALSERVER    "http://calendarserver.org/ns/"

#define DAVBRIDGE_PRODID        "-//DAVBridge//KodBox CalDAV Bridge//EN"
#define DAVBRIDGE_UID_DOMAIN    "davbridge"
#define DAVBRIDGE_SYNC_TOKEN_PREFIX "http://davbridge.local/ns/sync/"

#define CALENDAR_FILE_NAME      "calendar.ics"
#define SUBSCRIBE_ALL_NAME      "all.ics"

#endif /* Constants_hpp */
