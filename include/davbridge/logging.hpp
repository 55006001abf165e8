/** Logging [DAVBridge]
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

#ifndef Logging_hpp
#define Logging_hpp

#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

struct LoggingSettings {
    std::string level = "info";
    std::string filePath = "";
    size_t maxBytes = 10 * 1024 * 1024;
    size_t backupCount = 5;
};

/*
 All components log through named spdlog loggers ("logger", "sync",
 "caldav", "http", "kodbox") that share one sink set. configure() builds the
 sinks once at startup; get() hands out the logger and falls back to a
 console logger when configure() was never called (unit tests, one-shot
 modes).
 */
class Logging {
public:
    static void configure(const LoggingSettings & settings);
    static std::shared_ptr<spdlog::logger> get(const std::string & name);
    static spdlog::level::level_enum levelFromString(const std::string & level);
    static void shutdown();
};

#endif /* Logging_hpp */
