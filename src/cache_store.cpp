#include "davbridge/cache_store.hpp"
#include "davbridge/bridge_utils.hpp"
#include "davbridge/constants.hpp"
#include "davbridge/dav_exception.hpp"
#include "davbridge/logging.hpp"

#include <algorithm>
#include <atomic>

using namespace std;

bool PublishSummary::unchanged() const {
    return calendarsAdded.empty() && calendarsRemoved.empty() && calendarsChanged.empty();
}

nlohmann::json PublishSummary::toJSON() const {
    nlohmann::json changed = nlohmann::json::array();
    for (const auto & delta : calendarsChanged) {
        changed.push_back({
            {"projectId", delta.projectId},
            {"ctag", delta.ctag},
            {"added", delta.added.size()},
            {"changed", delta.changed.size()},
            {"removed", delta.removed.size()},
        });
    }
    return {
        {"generation", generation},
        {"calendarsAdded", calendarsAdded},
        {"calendarsRemoved", calendarsRemoved},
        {"calendarsChanged", changed},
    };
}

CacheStore::CacheStore(size_t historyDepth) :
    _current(make_shared<const Snapshot>()),
    _historyDepth(max((size_t)1, historyDepth)),
    logger(Logging::get("sync"))
{
}

shared_ptr<const Snapshot> CacheStore::current() const {
    return atomic_load(&_current);
}

PublishSummary CacheStore::publish(shared_ptr<Snapshot> next) {
    lock_guard<mutex> lock(_publishMtx);

    auto previous = current();
    PublishSummary summary;
    next->generation = previous->generation + 1;
    summary.generation = next->generation;

    for (auto & pair : next->calendars) {
        CalendarEntry & calendar = pair.second;
        calendar.ctag = computeCtag(calendar);
        auto members = calendar.memberEtags();

        const CalendarEntry * prior = previous->find(pair.first);
        if (prior == nullptr || !prior->history) {
            auto history = make_shared<CalendarHistory>();
            history->push_back(CalendarVersion{calendar.ctag, members});
            calendar.history = history;
            summary.calendarsAdded.push_back(pair.first);
            continue;
        }

        if (prior->ctag == calendar.ctag) {
            calendar.history = prior->history;
            continue;
        }

        CalendarDelta delta;
        delta.projectId = pair.first;
        delta.previousCtag = prior->ctag;
        delta.ctag = calendar.ctag;
        auto priorMembers = prior->memberEtags();
        for (const auto & member : members) {
            auto existing = priorMembers.find(member.first);
            if (existing == priorMembers.end()) {
                delta.added.push_back(member.first);
            } else if (existing->second != member.second) {
                delta.changed.push_back(member.first);
            }
        }
        for (const auto & member : priorMembers) {
            if (members.count(member.first) == 0) {
                delta.removed.push_back(member.first);
            }
        }

        auto history = make_shared<CalendarHistory>(*prior->history);
        history->push_back(CalendarVersion{calendar.ctag, members});
        while (history->size() > _historyDepth) {
            history->pop_front();
        }
        calendar.history = history;
        summary.calendarsChanged.push_back(delta);
    }

    for (const auto & pair : previous->calendars) {
        if (next->calendars.count(pair.first) == 0) {
            summary.calendarsRemoved.push_back(pair.first);
        }
    }

    atomic_store(&_current, shared_ptr<const Snapshot>(next));

    if (summary.unchanged()) {
        logger->info("Published snapshot {} with no changes ({} calendars)", summary.generation, next->calendars.size());
    } else {
        logger->info("Published snapshot {}: {}", summary.generation, summary.toJSON().dump());
    }
    return summary;
}

// The ctag is a digest of the member (task id, etag) pairs in id order, so
// it only moves when membership or some member's content moves.
string CacheStore::computeCtag(const CalendarEntry & calendar) {
    string digest = calendar.project.id() + "\n";
    for (const auto & event : calendar.events) {
        digest += event.task.id() + ":" + event.etag + "\n";
    }
    return BridgeUtils::sha256Hex(digest).substr(0, 32);
}

string CacheStore::syncTokenFor(const string & ctag) {
    return string(DAVBRIDGE_SYNC_TOKEN_PREFIX) + ctag;
}

SyncChanges CacheStore::changesSince(const CalendarEntry & calendar, const string & syncToken) {
    SyncChanges result;
    result.syncToken = syncTokenFor(calendar.ctag);

    string token = BridgeUtils::trim(syncToken);
    if (token == "") {
        for (const auto & event : calendar.events) {
            result.changed.push_back(event.task.id());
        }
        return result;
    }

    if (!BridgeUtils::startsWith(token, DAVBRIDGE_SYNC_TOKEN_PREFIX) || !calendar.history) {
        throw DAVException(403, ERROR_STALE_TOKEN, "Unrecognized sync token " + token, "valid-sync-token");
    }
    string ctag = token.substr(string(DAVBRIDGE_SYNC_TOKEN_PREFIX).size());

    const CalendarVersion * version = nullptr;
    for (auto it = calendar.history->rbegin(); it != calendar.history->rend(); ++it) {
        if (it->ctag == ctag) {
            version = &(*it);
            break;
        }
    }
    if (version == nullptr) {
        throw DAVException(403, ERROR_STALE_TOKEN, "Sync token " + token + " is too old", "valid-sync-token");
    }

    auto members = calendar.memberEtags();
    for (const auto & member : members) {
        auto old = version->members.find(member.first);
        if (old == version->members.end() || old->second != member.second) {
            result.changed.push_back(member.first);
        }
    }
    for (const auto & member : version->members) {
        if (members.count(member.first) == 0) {
            result.removed.push_back(member.first);
        }
    }
    return result;
}
