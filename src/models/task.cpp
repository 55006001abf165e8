#include "davbridge/models/task.hpp"

Task::Task(nlohmann::json json) : BridgeModel(json) {

}

Task::Task(std::string id, std::string projectId, std::string title) :
    BridgeModel(id)
{
    _data["projectId"] = projectId;
    _data["title"] = title;
    _data["status"] = statusToString(TaskStatus::Open);
}

std::string Task::projectId() const {
    return stringValue("projectId");
}

void Task::setProjectId(std::string projectId) {
    _data["projectId"] = projectId;
}

std::string Task::title() const {
    return stringValue("title");
}

void Task::setTitle(std::string title) {
    _data["title"] = title;
}

std::string Task::description() const {
    return stringValue("description");
}

void Task::setDescription(std::string description) {
    _data["description"] = description;
}

TaskStatus Task::status() const {
    return statusFromString(stringValue("status"));
}

void Task::setStatus(TaskStatus status) {
    _data["status"] = statusToString(status);
}

TaskPriority Task::priority() const {
    return priorityFromString(stringValue("priority"));
}

void Task::setPriority(TaskPriority priority) {
    if (priority == TaskPriority::None) {
        _data.erase("priority");
        return;
    }
    _data["priority"] = priorityToString(priority);
}

std::string Task::start() const {
    return stringValue("start");
}

void Task::setStart(std::string start) {
    _data["start"] = start;
}

std::string Task::due() const {
    return stringValue("due");
}

void Task::setDue(std::string due) {
    _data["due"] = due;
}

std::string Task::assignee() const {
    return stringValue("assignee");
}

void Task::setAssignee(std::string assignee) {
    _data["assignee"] = assignee;
}

time_t Task::createdAt() const {
    return timeValue("createdAt");
}

void Task::setCreatedAt(time_t t) {
    _data["createdAt"] = t;
}

time_t Task::modifiedAt() const {
    return timeValue("modifiedAt");
}

void Task::setModifiedAt(time_t t) {
    _data["modifiedAt"] = t;
}

bool Task::hasTimeRange() const {
    return start() != "" && due() != "";
}

std::string Task::statusToString(TaskStatus status) {
    switch (status) {
        case TaskStatus::InProgress:
            return "in-progress";
        case TaskStatus::Done:
            return "done";
        case TaskStatus::Cancelled:
            return "cancelled";
        default:
            return "open";
    }
}

TaskStatus Task::statusFromString(std::string value) {
    if (value == "in-progress") {
        return TaskStatus::InProgress;
    }
    if (value == "done") {
        return TaskStatus::Done;
    }
    if (value == "cancelled") {
        return TaskStatus::Cancelled;
    }
    return TaskStatus::Open;
}

std::string Task::priorityToString(TaskPriority priority) {
    switch (priority) {
        case TaskPriority::VeryLow:
            return "very-low";
        case TaskPriority::Low:
            return "low";
        case TaskPriority::Normal:
            return "normal";
        case TaskPriority::High:
            return "high";
        case TaskPriority::VeryHigh:
            return "very-high";
        default:
            return "";
    }
}

TaskPriority Task::priorityFromString(std::string value) {
    if (value == "very-low") {
        return TaskPriority::VeryLow;
    }
    if (value == "low") {
        return TaskPriority::Low;
    }
    if (value == "normal") {
        return TaskPriority::Normal;
    }
    if (value == "high") {
        return TaskPriority::High;
    }
    if (value == "very-high") {
        return TaskPriority::VeryHigh;
    }
    return TaskPriority::None;
}
