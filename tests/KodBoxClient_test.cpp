#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "davbridge/constants.hpp"
#include "davbridge/kodbox_client.hpp"
#include "davbridge/sync_exception.hpp"

using ::testing::HasSubstr;
using ::testing::Not;

// 2024-06-01T16:00:00Z, which is already June 2nd at UTC+8
#define LATE_AFTERNOON_UTC 1717257600

class KodBoxClientTest : public ::testing::Test {
protected:
    json listingWith(json project, json task) {
        return {
            {"code", true},
            {"data", {{"project", project}, {"task", task}}},
        };
    }
};

TEST_F(KodBoxClientTest, ParsesProjectsAndTasks) {
    json response = listingWith({
        {"12", {{"name", "Website"}, {"desc", "<p>Relaunch</p>"}, {"createUser", "3"}, {"createTime", "1717200000"}}},
        {"15", {{"name", "Mobile"}}},
    }, {
        {"101", {{"projectID", "12"}, {"name", "Design"}, {"status", "2"}, {"metaInfo", {{"taskLevel", "hight"}}}}},
        {"102", {{"projectID", 12}, {"name", "Build"}, {"status", "1"}}},
        {"201", {{"projectID", "15"}, {"name", "Release"}}},
    });

    KodBoxListing listing = KodBoxClient::parseListing(response, 480);

    ASSERT_EQ(listing.projects.size(), 2u);
    EXPECT_EQ(listing.projects[0].id(), "12");
    EXPECT_EQ(listing.projects[0].name(), "Website");
    EXPECT_EQ(listing.projects[0].description(), "Relaunch");
    EXPECT_EQ(listing.projects[0].owner(), "3");
    EXPECT_EQ(listing.projects[0].createdAt(), 1717200000);
    EXPECT_EQ(listing.projects[1].id(), "15");

    ASSERT_EQ(listing.tasks["12"].size(), 2u);
    const Task & design = listing.tasks["12"][0];
    EXPECT_EQ(design.id(), "101");
    EXPECT_EQ(design.projectId(), "12");
    EXPECT_EQ(design.title(), "Design");
    EXPECT_EQ(design.status(), TaskStatus::InProgress);
    EXPECT_EQ(design.priority(), TaskPriority::High);
    EXPECT_EQ(listing.tasks["12"][1].status(), TaskStatus::Done);
    EXPECT_EQ(listing.tasks["12"][1].projectId(), "12");
    EXPECT_EQ(listing.tasks["15"].size(), 1u);
}

TEST_F(KodBoxClientTest, AcceptsPhpEmptyArrays) {
    KodBoxListing listing = KodBoxClient::parseListing(listingWith(json::array(), json::array()), 480);
    EXPECT_TRUE(listing.projects.empty());
    EXPECT_TRUE(listing.tasks.empty());

    json asList = listingWith(json::array({{{"id", "12"}, {"name", "Website"}}}), json::array());
    listing = KodBoxClient::parseListing(asList, 480);
    ASSERT_EQ(listing.projects.size(), 1u);
    EXPECT_EQ(listing.projects[0].id(), "12");
    EXPECT_TRUE(listing.tasks["12"].empty());
}

TEST_F(KodBoxClientTest, SkipsListsAndInventsMissingProjects) {
    json response = listingWith(json::object(), {
        {"7", {{"projectID", "99"}, {"name", "Column"}, {"isList", "1"}}},
        {"8", {{"projectID", "99"}, {"name", "Orphan"}}},
        {"9", {{"name", "No project"}}},
    });

    KodBoxListing listing = KodBoxClient::parseListing(response, 480);
    ASSERT_EQ(listing.projects.size(), 1u);
    EXPECT_EQ(listing.projects[0].name(), "Project 99");
    ASSERT_EQ(listing.tasks["99"].size(), 1u);
    EXPECT_EQ(listing.tasks["99"][0].title(), "Orphan");
}

TEST_F(KodBoxClientTest, RejectedListingMapsToErrorKind) {
    try {
        KodBoxClient::parseListing({{"code", false}, {"info", "Please login first"}}, 480);
        FAIL() << "expected an auth failure";
    } catch (SyncException & ex) {
        EXPECT_EQ(ex.key, ERROR_AUTH_FAILURE);
    }

    try {
        KodBoxClient::parseListing({{"code", false}, {"info", "plugin disabled"}}, 480);
        FAIL() << "expected malformed data";
    } catch (SyncException & ex) {
        EXPECT_EQ(ex.key, ERROR_MALFORMED_UPSTREAM_DATA);
    }

    EXPECT_THROW(KodBoxClient::parseListing(json::array(), 480), SyncException);
    EXPECT_THROW(KodBoxClient::parseListing({{"code", true}, {"data", "nope"}}, 480), SyncException);
    EXPECT_THROW(KodBoxClient::parseListing(listingWith("bad", json::array()), 480), SyncException);
}

TEST_F(KodBoxClientTest, TaskWithBothTimesGetsUTCRange) {
    json data = {{"projectID", "12"}, {"name", "Launch"}, {"metaInfo", {{"timeFrom", "1717232400"}, {"timeTo", "1717236000"}}}};
    Task task = KodBoxClient::parseTask("101", data, 480);
    EXPECT_EQ(task.start(), "2024-06-01T09:00:00Z");
    EXPECT_EQ(task.due(), "2024-06-01T10:00:00Z");
    EXPECT_TRUE(task.hasTimeRange());

    // an end before the start collapses onto the start
    data["metaInfo"]["timeTo"] = "1717200000";
    task = KodBoxClient::parseTask("101", data, 480);
    EXPECT_EQ(task.due(), "2024-06-01T09:00:00Z");
}

TEST_F(KodBoxClientTest, SingleTimesBecomeAllDayDatesInConfiguredOffset) {
    json from = {{"projectID", "12"}, {"name", "Start"}, {"metaInfo", {{"timeFrom", LATE_AFTERNOON_UTC}}}};
    EXPECT_EQ(KodBoxClient::parseTask("1", from, 480).start(), "2024-06-02");
    EXPECT_EQ(KodBoxClient::parseTask("1", from, 0).start(), "2024-06-01");
    EXPECT_EQ(KodBoxClient::parseTask("1", from, 480).due(), "");

    json to = {{"projectID", "12"}, {"name", "Due"}, {"metaInfo", {{"timeTo", std::to_string(LATE_AFTERNOON_UTC)}}}};
    Task due = KodBoxClient::parseTask("2", to, 480);
    EXPECT_EQ(due.start(), "");
    EXPECT_EQ(due.due(), "2024-06-02");

    json created = {{"projectID", "12"}, {"name", "Undated"}, {"createTime", LATE_AFTERNOON_UTC}, {"metaInfo", {{"timeFrom", "0"}}}};
    Task undated = KodBoxClient::parseTask("3", created, 480);
    EXPECT_EQ(undated.start(), "2024-06-02");
    EXPECT_EQ(undated.due(), "");
}

TEST_F(KodBoxClientTest, DescriptionAndAssignee) {
    json data = {
        {"projectID", "12"},
        {"name", ""},
        {"desc", "<p>Read <b>the</b> brief</p>"},
        {"ownerUser", "5"},
    };
    Task task = KodBoxClient::parseTask("1", data, 480);
    EXPECT_EQ(task.title(), "Untitled Task");
    EXPECT_THAT(task.description(), HasSubstr("brief"));
    EXPECT_THAT(task.description(), Not(HasSubstr("<")));
    EXPECT_EQ(task.assignee(), "5");

    data["ownerUser"] = "0";
    EXPECT_EQ(KodBoxClient::parseTask("1", data, 480).assignee(), "");
}

TEST_F(KodBoxClientTest, MapsStatusAndPriorityCodes) {
    EXPECT_EQ(KodBoxClient::statusFromKodBox("0"), TaskStatus::Open);
    EXPECT_EQ(KodBoxClient::statusFromKodBox("1"), TaskStatus::Done);
    EXPECT_EQ(KodBoxClient::statusFromKodBox("2"), TaskStatus::InProgress);
    EXPECT_EQ(KodBoxClient::statusFromKodBox("3"), TaskStatus::Cancelled);
    EXPECT_EQ(KodBoxClient::statusFromKodBox(""), TaskStatus::Open);

    EXPECT_EQ(KodBoxClient::priorityFromKodBox("very-hight"), TaskPriority::VeryHigh);
    EXPECT_EQ(KodBoxClient::priorityFromKodBox("hight"), TaskPriority::High);
    EXPECT_EQ(KodBoxClient::priorityFromKodBox("normal"), TaskPriority::Normal);
    EXPECT_EQ(KodBoxClient::priorityFromKodBox("low"), TaskPriority::Low);
    EXPECT_EQ(KodBoxClient::priorityFromKodBox("very-low"), TaskPriority::VeryLow);
    EXPECT_EQ(KodBoxClient::priorityFromKodBox("urgent"), TaskPriority::None);
}

TEST_F(KodBoxClientTest, ListTasksWithoutReachableServerFails) {
    KodBoxSettings settings;
    settings.baseURL = "http://127.0.0.1:1/";
    settings.username = "admin";
    settings.password = "pw";
    settings.timeoutSeconds = 2;
    KodBoxClient client(settings);

    try {
        client.listProjects(std::chrono::seconds(1));
        FAIL() << "expected the upstream to be unavailable";
    } catch (SyncException & ex) {
        EXPECT_EQ(ex.key, ERROR_UPSTREAM_UNAVAILABLE);
        EXPECT_TRUE(ex.isRetryable());
    }
}
