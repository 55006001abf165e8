/** CacheStore [DAVBridge]
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

#ifndef CacheStore_hpp
#define CacheStore_hpp

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"
#include "davbridge/snapshot.hpp"

struct CalendarDelta {
    std::string projectId;
    std::string previousCtag;
    std::string ctag;
    std::vector<std::string> added;
    std::vector<std::string> changed;
    std::vector<std::string> removed;
};

struct PublishSummary {
    uint64_t generation = 0;
    std::vector<std::string> calendarsAdded;
    std::vector<std::string> calendarsRemoved;
    std::vector<CalendarDelta> calendarsChanged;

    bool unchanged() const;
    nlohmann::json toJSON() const;
};

// Result of a sync-collection query against one calendar.
struct SyncChanges {
    std::vector<std::string> changed;   // task ids added or modified since the token
    std::vector<std::string> removed;   // task ids gone since the token
    std::string syncToken;
};

/*
 Holds the currently published Snapshot. Readers call current() and keep
 the returned pointer for the duration of a request; publish() swaps the
 pointer atomically so a reader sees either the old or the new snapshot in
 full. publish() also stamps each calendar's ctag and extends its history
 so sync-collection can diff against earlier tokens.
 */
class CacheStore {
    std::shared_ptr<const Snapshot> _current;
    std::mutex _publishMtx;
    size_t _historyDepth;
    std::shared_ptr<spdlog::logger> logger;

public:
    explicit CacheStore(size_t historyDepth = 64);

    std::shared_ptr<const Snapshot> current() const;
    PublishSummary publish(std::shared_ptr<Snapshot> next);

    static std::string computeCtag(const CalendarEntry & calendar);
    static std::string syncTokenFor(const std::string & ctag);
    static SyncChanges changesSince(const CalendarEntry & calendar, const std::string & syncToken);
};

#endif /* CacheStore_hpp */
