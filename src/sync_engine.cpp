#include "davbridge/sync_engine.hpp"
#include "davbridge/bridge_utils.hpp"
#include "davbridge/constants.hpp"
#include "davbridge/logging.hpp"
#include "davbridge/sync_exception.hpp"
#include "davbridge/thread_utils.hpp"

#include <algorithm>
#include <set>

using namespace std;

// Clears the single-flight flag however runCycleLocked exits.
class RunningFlagGuard {
    std::atomic<bool> & _flag;
public:
    RunningFlagGuard(std::atomic<bool> & flag) : _flag(flag) {}
    ~RunningFlagGuard() {
        _flag = false;
    }
};

SyncEngine::SyncEngine(shared_ptr<UpstreamClient> upstream, shared_ptr<CacheStore> store, SyncSettings settings) :
    _upstream(upstream),
    _store(store),
    _settings(settings),
    logger(Logging::get("sync")),
    _running(false),
    _stopRequested(false)
{
    if (_settings.maxAttempts < 1) {
        _settings.maxAttempts = 1;
    }
}

SyncEngine::~SyncEngine() {
    stop();
}

string SyncEngine::stateToString(SyncState state) {
    switch (state) {
        case SyncState::Idle: return "idle";
        case SyncState::Running: return "running";
        case SyncState::Backoff: return "backoff";
        case SyncState::Publishing: return "publishing";
        case SyncState::Stopped: return "stopped";
    }
    return "unknown";
}

string SyncEngine::outcomeToString(CycleOutcome outcome) {
    switch (outcome) {
        case CycleOutcome::Published: return "published";
        case CycleOutcome::Abandoned: return "abandoned";
        case CycleOutcome::Dropped: return "dropped";
        case CycleOutcome::Cancelled: return "cancelled";
    }
    return "unknown";
}

// "calendar" is reserved: its href would collide with calendar.ics.
bool SyncEngine::isValidTaskId(const string & id) {
    return id != "" && id.find('/') == string::npos && id != "calendar";
}

chrono::milliseconds SyncEngine::backoffDelay(int attempt) const {
    chrono::milliseconds delay = _settings.backoffBase;
    for (int i = 1; i < attempt && delay < _settings.backoffCap; i++) {
        delay *= 2;
    }
    return min(delay, _settings.backoffCap);
}

void SyncEngine::setState(SyncState state) {
    lock_guard<mutex> lock(_statusMtx);
    if (_status.state == SyncState::Stopped) {
        return;
    }
    _status.state = state;
}

SyncState SyncEngine::state() const {
    lock_guard<mutex> lock(_statusMtx);
    return _status.state;
}

SyncStatus SyncEngine::status() const {
    lock_guard<mutex> lock(_statusMtx);
    return _status;
}

nlohmann::json SyncEngine::statusJSON() const {
    SyncStatus s = status();
    return {
        {"state", stateToString(s.state)},
        {"cyclesRun", s.cyclesRun},
        {"cyclesPublished", s.cyclesPublished},
        {"cyclesAbandoned", s.cyclesAbandoned},
        {"ticksDropped", s.ticksDropped},
        {"consecutiveFailures", s.consecutiveFailures},
        {"lastCycleAt", s.lastCycleAt ? BridgeUtils::formatDateTimeUTC(s.lastCycleAt) : ""},
        {"lastSuccessAt", s.lastSuccessAt ? BridgeUtils::formatDateTimeUTC(s.lastSuccessAt) : ""},
        {"lastError", s.lastError},
    };
}

// Returns false when stop() interrupted the wait.
bool SyncEngine::waitFor(chrono::milliseconds duration) {
    unique_lock<mutex> lock(_waitMtx);
    return !_waitCv.wait_for(lock, duration, [&]() {
        return _stopRequested.load();
    });
}

CycleOutcome SyncEngine::runCycle() {
    bool expected = false;
    if (!_running.compare_exchange_strong(expected, true)) {
        {
            lock_guard<mutex> lock(_statusMtx);
            _status.ticksDropped++;
        }
        logger->info("Sync cycle already running, dropping request");
        return CycleOutcome::Dropped;
    }
    RunningFlagGuard guard(_running);

    CycleOutcome outcome = runCycleLocked();
    setState(SyncState::Idle);
    logger->debug("Sync cycle finished: {}", outcomeToString(outcome));
    return outcome;
}

bool SyncEngine::fetchProjects(vector<Project> & projects) {
    for (int attempt = 1; ; attempt++) {
        string reason;
        bool retryable = false;

        try {
            projects = _upstream->listProjects(_settings.upstreamTimeout);
            return true;
        } catch (SyncException & ex) {
            reason = ex.toJSON().dump();
            retryable = (ex.key == ERROR_UPSTREAM_UNAVAILABLE || ex.key == ERROR_AUTH_FAILURE);
        } catch (std::exception & ex) {
            reason = string(ERROR_MALFORMED_UPSTREAM_DATA) + ": " + ex.what();
        }

        {
            lock_guard<mutex> lock(_statusMtx);
            _status.lastError = reason;
        }

        if (!retryable || attempt >= _settings.maxAttempts) {
            logger->error("Unable to fetch project list after {} attempt(s), keeping previous snapshot: {}", attempt, reason);
            return false;
        }

        auto delay = backoffDelay(attempt);
        logger->warn("Project list fetch failed (attempt {}/{}), retrying in {}ms: {}", attempt, _settings.maxAttempts, delay.count(), reason);
        setState(SyncState::Backoff);
        if (!waitFor(delay)) {
            return false;
        }
        setState(SyncState::Running);
    }
}

CycleOutcome SyncEngine::runCycleLocked() {
    if (_stopRequested) {
        return CycleOutcome::Cancelled;
    }

    setState(SyncState::Running);
    time_t now = time(nullptr);
    {
        lock_guard<mutex> lock(_statusMtx);
        _status.cyclesRun++;
        _status.lastCycleAt = now;
    }

    vector<Project> projects;
    if (!fetchProjects(projects)) {
        if (_stopRequested) {
            return CycleOutcome::Cancelled;
        }
        lock_guard<mutex> lock(_statusMtx);
        _status.cyclesAbandoned++;
        _status.consecutiveFailures++;
        return CycleOutcome::Abandoned;
    }

    auto previous = _store->current();
    auto next = make_shared<Snapshot>();
    next->syncedAt = now;
    size_t staleCount = 0;

    for (const auto & project : projects) {
        if (_stopRequested) {
            logger->info("Sync cycle cancelled before project {}", project.id());
            return CycleOutcome::Cancelled;
        }
        if (project.id() == "" || project.id().find('/') != string::npos) {
            logger->warn("Skipping project with unusable id '{}'", project.id());
            continue;
        }
        if (next->calendars.count(project.id())) {
            logger->warn("Duplicate project {} in upstream list, keeping the first", project.id());
            continue;
        }

        string failure;
        try {
            auto tasks = _upstream->listTasks(project.id(), _settings.upstreamTimeout);

            CalendarEntry entry(project);
            set<string> seen;
            for (auto & task : tasks) {
                if (!isValidTaskId(task.id())) {
                    logger->warn("Skipping task with unusable id '{}' in project {}", task.id(), project.id());
                    continue;
                }
                if (task.projectId() == "") {
                    task.setProjectId(project.id());
                } else if (task.projectId() != project.id()) {
                    logger->warn("Task {} claims project {} but was listed under {}, skipping", task.id(), task.projectId(), project.id());
                    continue;
                }
                if (!seen.insert(task.id()).second) {
                    logger->warn("Duplicate task {} in project {}, keeping the first", task.id(), project.id());
                    continue;
                }
                entry.events.push_back(CalendarEvent::make(project, task));
            }
            sort(entry.events.begin(), entry.events.end(), [](const CalendarEvent & a, const CalendarEvent & b) {
                return a.task.id() < b.task.id();
            });
            entry.lastSuccessfulSync = now;
            next->calendars.emplace(project.id(), std::move(entry));
            continue;

        } catch (SyncException & ex) {
            if (ex.key == ERROR_NOT_FOUND) {
                logger->info("Project {} no longer exists upstream, dropping it", project.id());
                continue;
            }
            failure = ex.toJSON().dump();
        } catch (std::exception & ex) {
            failure = string(ERROR_MALFORMED_UPSTREAM_DATA) + ": " + ex.what();
        }

        // carry the last good data forward, marked stale
        const CalendarEntry * prior = previous->find(project.id());
        CalendarEntry entry = prior ? *prior : CalendarEntry(project);
        if (!entry.stale) {
            entry.stale = true;
            entry.staleSince = now;
        }
        entry.failureReason = failure;
        logger->warn("Unable to refresh project {}, serving {} cached events: {}", project.id(), entry.events.size(), failure);
        next->calendars.emplace(project.id(), std::move(entry));
        staleCount++;
    }

    if (_stopRequested) {
        return CycleOutcome::Cancelled;
    }

    setState(SyncState::Publishing);
    PublishSummary summary = _store->publish(next);

    {
        lock_guard<mutex> lock(_statusMtx);
        _status.cyclesPublished++;
        _status.lastPublish = summary;
        _status.lastSuccessAt = now;
        _status.consecutiveFailures = 0;
        _status.lastError = staleCount ? to_string(staleCount) + " project(s) stale" : "";
    }
    return CycleOutcome::Published;
}

void SyncEngine::runTimer() {
    SetThreadName("sync");

    auto runGuarded = [&]() {
        try {
            runCycle();
        } catch (std::exception & ex) {
            logger->error("Sync cycle failed: {}", ex.what());
            lock_guard<mutex> lock(_statusMtx);
            _status.consecutiveFailures++;
            _status.lastError = ex.what();
        }
    };

    if (_settings.eager) {
        runGuarded();
    }

    auto nextTick = chrono::steady_clock::now() + _settings.interval;
    while (!_stopRequested) {
        auto wait = chrono::duration_cast<chrono::milliseconds>(nextTick - chrono::steady_clock::now());
        if (wait.count() > 0 && !waitFor(wait)) {
            break;
        }
        if (_stopRequested) {
            break;
        }
        runGuarded();

        // ticks that elapsed while the cycle ran are dropped, not queued
        auto now = chrono::steady_clock::now();
        nextTick += _settings.interval;
        uint64_t missed = 0;
        while (nextTick <= now) {
            nextTick += _settings.interval;
            missed++;
        }
        if (missed) {
            logger->warn("Sync cycle overran the interval, dropped {} tick(s)", missed);
            lock_guard<mutex> lock(_statusMtx);
            _status.ticksDropped += missed;
        }
    }
}

void SyncEngine::start() {
    if (_timerThread != nullptr || _stopRequested) {
        return;
    }
    logger->info("Starting sync engine (interval {}ms, eager {})", _settings.interval.count(), _settings.eager);
    _timerThread = new std::thread([this]() {
        runTimer();
    });
}

void SyncEngine::stop() {
    {
        lock_guard<mutex> lock(_waitMtx);
        _stopRequested = true;
    }
    _waitCv.notify_all();

    if (_timerThread != nullptr) {
        _timerThread->join();
        delete _timerThread;
        _timerThread = nullptr;
        logger->info("Sync engine stopped");
    }

    lock_guard<mutex> lock(_statusMtx);
    _status.state = SyncState::Stopped;
}
