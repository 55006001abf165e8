#include <gtest/gtest.h>
#include "davbridge/resource_tree.hpp"
#include "SnapshotFixtures.hpp"

class ResourceTreeTest : public ::testing::Test {
protected:
    void SetUp() override {
        Project website("p1", "Website");
        Project mobile("p 2", "Mobile");
        snapshot = makeSnapshot({
            makeCalendar(website, {makeTask("t2", "p1", "Build"), makeTask("t1", "p1", "Design", "2024-06-01")}),
            makeCalendar(mobile, {}),
        });
    }

    std::shared_ptr<Snapshot> snapshot;
};

TEST_F(ResourceTreeTest, ResolvesFixedCollections) {
    EXPECT_EQ(ResourceTree::resolve("/", *snapshot).kind, ResourceKind::Root);
    EXPECT_EQ(ResourceTree::resolve("", *snapshot).kind, ResourceKind::Root);
    EXPECT_EQ(ResourceTree::resolve("/principals/", *snapshot).kind, ResourceKind::PrincipalCollection);
    EXPECT_EQ(ResourceTree::resolve("/calendars", *snapshot).kind, ResourceKind::CalendarHome);

    Resource principal = ResourceTree::resolve("/principals/alice/", *snapshot);
    EXPECT_EQ(principal.kind, ResourceKind::Principal);
    EXPECT_EQ(principal.principal, "alice");
}

TEST_F(ResourceTreeTest, ResolvesCalendarsAndEvents) {
    Resource calendar = ResourceTree::resolve("/calendars/p1/", *snapshot);
    ASSERT_EQ(calendar.kind, ResourceKind::Calendar);
    EXPECT_EQ(calendar.projectId, "p1");
    ASSERT_NE(calendar.calendar, nullptr);
    EXPECT_EQ(calendar.calendar->project.name(), "Website");
    EXPECT_TRUE(calendar.isCollection());

    Resource event = ResourceTree::resolve("/calendars/p1/t1.ics", *snapshot);
    ASSERT_EQ(event.kind, ResourceKind::Event);
    EXPECT_EQ(event.taskId, "t1");
    ASSERT_NE(event.event, nullptr);
    EXPECT_EQ(event.event->task.title(), "Design");
    EXPECT_FALSE(event.isCollection());

    Resource file = ResourceTree::resolve("/calendars/p1/calendar.ics", *snapshot);
    EXPECT_EQ(file.kind, ResourceKind::CalendarFile);
    EXPECT_EQ(file.projectId, "p1");
}

TEST_F(ResourceTreeTest, TrailingSlashesAndQueryAreIgnored) {
    EXPECT_EQ(ResourceTree::resolve("/calendars/p1", *snapshot).kind, ResourceKind::Calendar);
    EXPECT_EQ(ResourceTree::resolve("//calendars//p1//", *snapshot).kind, ResourceKind::Calendar);
    EXPECT_EQ(ResourceTree::resolve("/calendars/p1/t1.ics?x=1", *snapshot).kind, ResourceKind::Event);
}

TEST_F(ResourceTreeTest, PercentEncodedSegmentsAreDecoded) {
    Resource calendar = ResourceTree::resolve("/calendars/p%202/", *snapshot);
    ASSERT_EQ(calendar.kind, ResourceKind::Calendar);
    EXPECT_EQ(calendar.projectId, "p 2");
    EXPECT_EQ(ResourceTree::hrefFor(calendar), "/calendars/p%202/");
}

TEST_F(ResourceTreeTest, UnknownPathsAreNotFound) {
    EXPECT_FALSE(ResourceTree::resolve("/calendars/nope/", *snapshot).exists());
    EXPECT_FALSE(ResourceTree::resolve("/calendars/p1/t9.ics", *snapshot).exists());
    EXPECT_FALSE(ResourceTree::resolve("/calendars/p1/t1", *snapshot).exists());
    EXPECT_FALSE(ResourceTree::resolve("/calendars/p1/.ics", *snapshot).exists());
    EXPECT_FALSE(ResourceTree::resolve("/calendars/p1/t1.ics/extra", *snapshot).exists());
    EXPECT_FALSE(ResourceTree::resolve("/principals/alice/more", *snapshot).exists());
    EXPECT_FALSE(ResourceTree::resolve("/elsewhere", *snapshot).exists());
}

TEST_F(ResourceTreeTest, ResolvesSubscriptions) {
    Resource all = ResourceTree::resolve("/subscribe/secret/all.ics", *snapshot);
    ASSERT_EQ(all.kind, ResourceKind::Subscription);
    EXPECT_EQ(all.token, "secret");
    EXPECT_EQ(all.projectId, "");
    EXPECT_EQ(ResourceTree::hrefFor(all), "/subscribe/secret/all.ics");

    Resource one = ResourceTree::resolve("/subscribe/secret/p1.ics", *snapshot);
    ASSERT_EQ(one.kind, ResourceKind::Subscription);
    EXPECT_EQ(one.projectId, "p1");

    EXPECT_FALSE(ResourceTree::resolve("/subscribe/secret/nope.ics", *snapshot).exists());
    EXPECT_FALSE(ResourceTree::resolve("/subscribe/secret", *snapshot).exists());
}

TEST_F(ResourceTreeTest, ChildrenFollowSnapshotOrder) {
    auto home = ResourceTree::children(ResourceTree::resolve("/calendars/", *snapshot), *snapshot);
    ASSERT_EQ(home.size(), 2u);
    EXPECT_EQ(home[0].projectId, "p 2");
    EXPECT_EQ(home[1].projectId, "p1");

    auto events = ResourceTree::children(ResourceTree::resolve("/calendars/p1/", *snapshot), *snapshot);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(ResourceTree::hrefFor(events[0]), "/calendars/p1/t1.ics");
    EXPECT_EQ(ResourceTree::hrefFor(events[1]), "/calendars/p1/t2.ics");

    auto root = ResourceTree::children(ResourceTree::resolve("/", *snapshot), *snapshot);
    ASSERT_EQ(root.size(), 2u);
    EXPECT_EQ(ResourceTree::hrefFor(root[0]), "/principals/");
    EXPECT_EQ(ResourceTree::hrefFor(root[1]), "/calendars/");

    EXPECT_TRUE(ResourceTree::children(ResourceTree::resolve("/calendars/p1/t1.ics", *snapshot), *snapshot).empty());
}

TEST_F(ResourceTreeTest, RecognizesWellKnown) {
    EXPECT_TRUE(ResourceTree::isWellKnown("/.well-known/caldav"));
    EXPECT_TRUE(ResourceTree::isWellKnown("/.well-known/caldav/"));
    EXPECT_FALSE(ResourceTree::isWellKnown("/.well-known/carddav"));
}
