#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <future>
#include <thread>

#include "davbridge/constants.hpp"
#include "davbridge/sync_engine.hpp"
#include "davbridge/sync_exception.hpp"
#include "MockUpstreamClient.hpp"
#include "SnapshotFixtures.hpp"

using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class SyncEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        upstream = std::make_shared<NiceMock<MockUpstreamClient>>();
        store = std::make_shared<CacheStore>(8);

        settings.interval = std::chrono::milliseconds(60 * 60 * 1000);
        settings.backoffBase = std::chrono::milliseconds(5);
        settings.backoffCap = std::chrono::milliseconds(20);
        settings.maxAttempts = 3;
        settings.upstreamTimeout = std::chrono::seconds(1);
        settings.eager = false;
    }

    std::vector<Project> twoProjects() {
        return {Project("p1", "Website"), Project("p2", "Mobile")};
    }

    std::shared_ptr<NiceMock<MockUpstreamClient>> upstream;
    std::shared_ptr<CacheStore> store;
    SyncSettings settings;
};

TEST_F(SyncEngineTest, PublishesSnapshotOfAllProjects) {
    EXPECT_CALL(*upstream, listProjects(_)).WillOnce(Return(twoProjects()));
    EXPECT_CALL(*upstream, listTasks("p1", _)).WillOnce(Return(std::vector<Task>{
        makeTask("t2", "p1", "Build"), makeTask("t1", "", "Design", "2024-06-01"),
    }));
    EXPECT_CALL(*upstream, listTasks("p2", _)).WillOnce(Return(std::vector<Task>{}));

    SyncEngine engine(upstream, store, settings);
    EXPECT_EQ(engine.runCycle(), CycleOutcome::Published);

    auto snapshot = store->current();
    EXPECT_EQ(snapshot->generation, 1u);
    ASSERT_EQ(snapshot->calendars.size(), 2u);

    const CalendarEntry * website = snapshot->find("p1");
    ASSERT_NE(website, nullptr);
    ASSERT_EQ(website->events.size(), 2u);
    EXPECT_EQ(website->events[0].task.id(), "t1");
    EXPECT_EQ(website->events[0].task.projectId(), "p1");
    EXPECT_EQ(website->events[1].task.id(), "t2");
    EXPECT_FALSE(website->stale);

    SyncStatus status = engine.status();
    EXPECT_EQ(status.cyclesRun, 1u);
    EXPECT_EQ(status.cyclesPublished, 1u);
    EXPECT_EQ(status.state, SyncState::Idle);
}

TEST_F(SyncEngineTest, IdenticalUpstreamDataRepublishesUnchanged) {
    Task dated = makeTask("t1", "p1", "Design", "2024-06-01");
    dated.setDescription("Wireframes, then review");
    EXPECT_CALL(*upstream, listProjects(_)).WillRepeatedly(Return(twoProjects()));
    EXPECT_CALL(*upstream, listTasks("p1", _)).WillRepeatedly(Return(std::vector<Task>{makeTask("t2", "", "Build"), dated}));
    EXPECT_CALL(*upstream, listTasks("p2", _)).WillRepeatedly(Return(std::vector<Task>{makeTask("t5", "p2", "Release")}));

    SyncEngine engine(upstream, store, settings);
    ASSERT_EQ(engine.runCycle(), CycleOutcome::Published);
    auto first = store->current();
    EXPECT_FALSE(engine.status().lastPublish.unchanged());

    ASSERT_EQ(engine.runCycle(), CycleOutcome::Published);
    auto second = store->current();
    PublishSummary summary = engine.status().lastPublish;
    EXPECT_EQ(summary.generation, 2u);
    EXPECT_TRUE(summary.unchanged());

    for (const std::string projectId : {"p1", "p2"}) {
        const CalendarEntry * before = first->find(projectId);
        const CalendarEntry * after = second->find(projectId);
        ASSERT_NE(before, nullptr);
        ASSERT_NE(after, nullptr);
        EXPECT_EQ(after->ctag, before->ctag);
        EXPECT_EQ(after->memberEtags(), before->memberEtags());
        EXPECT_EQ(after->history.get(), before->history.get());
        ASSERT_EQ(after->events.size(), before->events.size());
        for (size_t i = 0; i < after->events.size(); i++) {
            EXPECT_EQ(after->events[i].etag, before->events[i].etag);
            EXPECT_EQ(after->events[i].ics, before->events[i].ics);
        }
    }
    EXPECT_EQ(second->find("p1")->history->size(), 1u);
}

TEST_F(SyncEngineTest, FailingProjectKeepsPreviousEventsMarkedStale) {
    EXPECT_CALL(*upstream, listProjects(_)).WillRepeatedly(Return(twoProjects()));
    EXPECT_CALL(*upstream, listTasks("p1", _))
        .WillOnce(Return(std::vector<Task>{makeTask("t1", "p1", "Design")}))
        .WillOnce(Throw(SyncException(ERROR_UPSTREAM_UNAVAILABLE, "timed out", true)))
        .WillOnce(Throw(SyncException(ERROR_MALFORMED_UPSTREAM_DATA, "bad json", false)));
    EXPECT_CALL(*upstream, listTasks("p2", _))
        .WillOnce(Return(std::vector<Task>{makeTask("t5", "p2", "Release")}))
        .WillOnce(Return(std::vector<Task>{makeTask("t5", "p2", "Release"), makeTask("t6", "p2", "Notes")}))
        .WillOnce(Return(std::vector<Task>{}));

    SyncEngine engine(upstream, store, settings);
    ASSERT_EQ(engine.runCycle(), CycleOutcome::Published);
    ASSERT_EQ(engine.runCycle(), CycleOutcome::Published);

    auto snapshot = store->current();
    const CalendarEntry * website = snapshot->find("p1");
    ASSERT_NE(website, nullptr);
    EXPECT_TRUE(website->stale);
    ASSERT_EQ(website->events.size(), 1u);
    EXPECT_EQ(website->events[0].task.title(), "Design");
    time_t staleSince = website->staleSince;
    EXPECT_NE(staleSince, 0);

    // the healthy project still moved on
    EXPECT_EQ(snapshot->find("p2")->events.size(), 2u);
    EXPECT_FALSE(snapshot->find("p2")->stale);

    ASSERT_EQ(engine.runCycle(), CycleOutcome::Published);
    website = store->current()->find("p1");
    EXPECT_TRUE(website->stale);
    EXPECT_EQ(website->staleSince, staleSince);
    EXPECT_EQ(website->events.size(), 1u);
}

TEST_F(SyncEngineTest, FailingNewProjectIsPublishedEmpty) {
    EXPECT_CALL(*upstream, listProjects(_)).WillOnce(Return(std::vector<Project>{Project("p1", "Website")}));
    EXPECT_CALL(*upstream, listTasks("p1", _)).WillOnce(Throw(SyncException(ERROR_UPSTREAM_UNAVAILABLE, "timed out", true)));

    SyncEngine engine(upstream, store, settings);
    ASSERT_EQ(engine.runCycle(), CycleOutcome::Published);

    const CalendarEntry * website = store->current()->find("p1");
    ASSERT_NE(website, nullptr);
    EXPECT_TRUE(website->stale);
    EXPECT_TRUE(website->events.empty());
}

TEST_F(SyncEngineTest, ProjectGoneUpstreamIsDropped) {
    EXPECT_CALL(*upstream, listProjects(_)).WillRepeatedly(Return(twoProjects()));
    EXPECT_CALL(*upstream, listTasks("p1", _)).WillRepeatedly(Return(std::vector<Task>{}));
    EXPECT_CALL(*upstream, listTasks("p2", _))
        .WillOnce(Return(std::vector<Task>{}))
        .WillOnce(Throw(SyncException(ERROR_NOT_FOUND, "project deleted", false)));

    SyncEngine engine(upstream, store, settings);
    engine.runCycle();
    ASSERT_NE(store->current()->find("p2"), nullptr);

    engine.runCycle();
    EXPECT_EQ(store->current()->find("p2"), nullptr);
    EXPECT_NE(store->current()->find("p1"), nullptr);
}

TEST_F(SyncEngineTest, UnreachableUpstreamKeepsPreviousSnapshot) {
    EXPECT_CALL(*upstream, listProjects(_))
        .WillOnce(Return(std::vector<Project>{Project("p1", "Website")}))
        .WillRepeatedly(Throw(SyncException(ERROR_UPSTREAM_UNAVAILABLE, "connection refused", true)));
    EXPECT_CALL(*upstream, listTasks("p1", _)).WillOnce(Return(std::vector<Task>{makeTask("t1", "p1", "Design")}));

    SyncEngine engine(upstream, store, settings);
    ASSERT_EQ(engine.runCycle(), CycleOutcome::Published);
    auto published = store->current();

    EXPECT_EQ(engine.runCycle(), CycleOutcome::Abandoned);
    EXPECT_EQ(store->current(), published);

    SyncStatus status = engine.status();
    EXPECT_EQ(status.cyclesAbandoned, 1u);
    EXPECT_EQ(status.consecutiveFailures, 1);
    EXPECT_NE(status.lastError.find("connection refused"), std::string::npos);
}

TEST_F(SyncEngineTest, RetriesProjectListWithBackoff) {
    EXPECT_CALL(*upstream, listProjects(_))
        .Times(3)
        .WillRepeatedly(Throw(SyncException(ERROR_UPSTREAM_UNAVAILABLE, "503", true)));

    SyncEngine engine(upstream, store, settings);
    auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(engine.runCycle(), CycleOutcome::Abandoned);
    auto elapsed = std::chrono::steady_clock::now() - started;

    // waits of 5ms and 10ms between the three attempts
    EXPECT_GE(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 15);
    EXPECT_EQ(store->current()->generation, 0u);
}

TEST_F(SyncEngineTest, MalformedProjectListIsNotRetried) {
    EXPECT_CALL(*upstream, listProjects(_))
        .Times(1)
        .WillOnce(Throw(SyncException(ERROR_MALFORMED_UPSTREAM_DATA, "not json", false)));

    SyncEngine engine(upstream, store, settings);
    EXPECT_EQ(engine.runCycle(), CycleOutcome::Abandoned);
}

TEST_F(SyncEngineTest, BackoffDelayDoublesUpToCap) {
    SyncEngine engine(upstream, store, settings);
    EXPECT_EQ(engine.backoffDelay(1).count(), 5);
    EXPECT_EQ(engine.backoffDelay(2).count(), 10);
    EXPECT_EQ(engine.backoffDelay(3).count(), 20);
    EXPECT_EQ(engine.backoffDelay(10).count(), 20);
}

TEST_F(SyncEngineTest, OverlappingCycleIsDropped) {
    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> released(release.get_future());

    EXPECT_CALL(*upstream, listProjects(_)).WillOnce(Invoke([&](std::chrono::seconds) {
        entered.set_value();
        released.wait();
        return std::vector<Project>{};
    }));

    SyncEngine engine(upstream, store, settings);
    std::future<CycleOutcome> first = std::async(std::launch::async, [&]() {
        return engine.runCycle();
    });
    entered.get_future().wait();

    EXPECT_EQ(engine.runCycle(), CycleOutcome::Dropped);
    EXPECT_EQ(engine.state(), SyncState::Running);

    release.set_value();
    EXPECT_EQ(first.get(), CycleOutcome::Published);
    EXPECT_EQ(engine.status().ticksDropped, 1u);
    EXPECT_EQ(engine.status().cyclesRun, 1u);
}

TEST_F(SyncEngineTest, SkipsDuplicateAndUnusableIds) {
    Task foreign = makeTask("t9", "p2", "Elsewhere");
    EXPECT_CALL(*upstream, listProjects(_)).WillOnce(Return(std::vector<Project>{
        Project("p1", "Website"), Project("p1", "Website again"), Project("a/b", "Broken"),
    }));
    EXPECT_CALL(*upstream, listTasks("p1", _)).Times(1).WillOnce(Return(std::vector<Task>{
        makeTask("t1", "p1", "First"), makeTask("t1", "p1", "Second"),
        makeTask("", "p1", "No id"), makeTask("x/y", "p1", "Slash"), makeTask("calendar", "p1", "Reserved"),
        foreign,
    }));
    EXPECT_CALL(*upstream, listTasks("a/b", _)).Times(0);

    SyncEngine engine(upstream, store, settings);
    ASSERT_EQ(engine.runCycle(), CycleOutcome::Published);

    auto snapshot = store->current();
    ASSERT_EQ(snapshot->calendars.size(), 1u);
    const CalendarEntry * website = snapshot->find("p1");
    EXPECT_EQ(website->project.name(), "Website");
    ASSERT_EQ(website->events.size(), 1u);
    EXPECT_EQ(website->events[0].task.title(), "First");
}

TEST_F(SyncEngineTest, StopCancelsBackoffAndFreezesState) {
    settings.backoffBase = std::chrono::milliseconds(60 * 1000);
    settings.backoffCap = std::chrono::milliseconds(60 * 1000);
    EXPECT_CALL(*upstream, listProjects(_)).WillRepeatedly(Throw(SyncException(ERROR_UPSTREAM_UNAVAILABLE, "down", true)));

    SyncEngine engine(upstream, store, settings);
    std::future<CycleOutcome> cycle = std::async(std::launch::async, [&]() {
        return engine.runCycle();
    });
    for (int i = 0; i < 200 && engine.state() != SyncState::Backoff; i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_EQ(engine.state(), SyncState::Backoff);

    engine.stop();
    EXPECT_EQ(cycle.get(), CycleOutcome::Cancelled);
    EXPECT_EQ(engine.state(), SyncState::Stopped);
    EXPECT_EQ(engine.runCycle(), CycleOutcome::Cancelled);
}

TEST_F(SyncEngineTest, TimerRunsEagerCycleAndThenOnInterval) {
    settings.eager = true;
    settings.interval = std::chrono::milliseconds(20);
    EXPECT_CALL(*upstream, listProjects(_)).WillRepeatedly(Return(std::vector<Project>{}));

    SyncEngine engine(upstream, store, settings);
    engine.start();
    for (int i = 0; i < 400 && engine.status().cyclesPublished < 3; i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    engine.stop();

    EXPECT_GE(engine.status().cyclesPublished, 3u);
    EXPECT_EQ(engine.state(), SyncState::Stopped);
    EXPECT_EQ(engine.statusJSON()["state"].get<std::string>(), "stopped");
}
