#ifndef MOCKUPSTREAMCLIENT_HPP
#define MOCKUPSTREAMCLIENT_HPP

#include <gmock/gmock.h>
#include <chrono>
#include <string>
#include <vector>

#include "davbridge/upstream_client.hpp"

class MockUpstreamClient : public UpstreamClient {
public:
    MOCK_METHOD(std::vector<Project>, listProjects, (std::chrono::seconds timeout), (override));

    MOCK_METHOD(std::vector<Task>, listTasks, (const std::string & projectId, std::chrono::seconds timeout), (override));
};

#endif
