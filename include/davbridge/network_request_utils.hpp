/** NetworkRequestUtils [DAVBridge]
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

#ifndef NetworkRequestUtils_hpp
#define NetworkRequestUtils_hpp

#include <map>
#include <string>
#include <curl/curl.h>
#include "nlohmann/json.hpp"

size_t _onAppendToString(void *contents, size_t length, size_t nmemb, void *userp);

std::string FindLinuxCertsBundle();

// Form fields are escaped with curl_easy_escape and joined with '&'.
std::string EncodeFormFields(CURL * curl_handle, const std::map<std::string, std::string> & fields);

CURL * CreateJSONRequest(std::string url, std::string method, long timeoutSeconds, std::string cookie = "");
CURL * CreateFormRequest(std::string url, const std::map<std::string, std::string> & fields, long timeoutSeconds, std::string cookie = "");

// Runs the request and returns the body. Throws SyncException for transport
// failures and non-2xx responses. Always cleans up the handle.
const std::string PerformRequest(CURL * curl_handle, std::string * setCookies = nullptr);
const nlohmann::json PerformJSONRequest(CURL * curl_handle, std::string * setCookies = nullptr);

void ValidateRequestResp(CURLcode res, CURL * curl_handle, std::string resp);

#endif /* NetworkRequestUtils_hpp */
