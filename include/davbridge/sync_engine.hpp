/** SyncEngine [DAVBridge]
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

#ifndef SyncEngine_hpp
#define SyncEngine_hpp

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"
#include "davbridge/cache_store.hpp"
#include "davbridge/upstream_client.hpp"

struct SyncSettings {
    std::chrono::milliseconds interval = std::chrono::milliseconds(300 * 1000);
    std::chrono::milliseconds backoffBase = std::chrono::milliseconds(60 * 1000);
    std::chrono::milliseconds backoffCap = std::chrono::milliseconds(15 * 60 * 1000);
    int maxAttempts = 3;
    std::chrono::seconds upstreamTimeout = std::chrono::seconds(30);
    bool eager = true;
};

enum class SyncState {
    Idle,
    Running,
    Backoff,
    Publishing,
    Stopped
};

enum class CycleOutcome {
    Published,   // a new snapshot was handed to the store
    Abandoned,   // the project list could not be fetched; previous snapshot kept
    Dropped,     // another cycle was already running
    Cancelled    // stop() was called while the cycle ran
};

struct SyncStatus {
    SyncState state = SyncState::Idle;
    uint64_t cyclesRun = 0;
    uint64_t cyclesPublished = 0;
    uint64_t cyclesAbandoned = 0;
    uint64_t ticksDropped = 0;
    int consecutiveFailures = 0;
    time_t lastCycleAt = 0;
    time_t lastSuccessAt = 0;
    std::string lastError;
    PublishSummary lastPublish;
};

/*
 Pulls projects and tasks from the upstream client, builds a complete
 Snapshot and publishes it to the CacheStore.

 A failure fetching one project's tasks only affects that project: its
 previous calendar is carried into the new snapshot marked stale. A failure
 fetching the project list is retried with exponential backoff and then the
 cycle is abandoned, so clients keep seeing the last good snapshot.

 At most one cycle runs at a time; runCycle() returns Dropped instead of
 queueing. stop() interrupts backoff waits and the timer, and a running cycle
 notices it at the next project boundary and publishes nothing.
 */
class SyncEngine {
    std::shared_ptr<UpstreamClient> _upstream;
    std::shared_ptr<CacheStore> _store;
    SyncSettings _settings;
    std::shared_ptr<spdlog::logger> logger;

    std::atomic<bool> _running;
    std::atomic<bool> _stopRequested;
    std::mutex _waitMtx;
    std::condition_variable _waitCv;

    mutable std::mutex _statusMtx;
    SyncStatus _status;

    std::thread * _timerThread = nullptr;

public:
    SyncEngine(std::shared_ptr<UpstreamClient> upstream, std::shared_ptr<CacheStore> store, SyncSettings settings);
    ~SyncEngine();

    CycleOutcome runCycle();

    void start();
    void stop();

    SyncState state() const;
    SyncStatus status() const;
    nlohmann::json statusJSON() const;

    std::chrono::milliseconds backoffDelay(int attempt) const;

    static std::string stateToString(SyncState state);
    static std::string outcomeToString(CycleOutcome outcome);
    static bool isValidTaskId(const std::string & id);

private:
    CycleOutcome runCycleLocked();
    bool fetchProjects(std::vector<Project> & projects);
    bool waitFor(std::chrono::milliseconds duration);
    void setState(SyncState state);
    void runTimer();
};

#endif /* SyncEngine_hpp */
