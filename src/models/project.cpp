#include "davbridge/models/project.hpp"

Project::Project(nlohmann::json json) : BridgeModel(json) {

}

Project::Project(std::string id, std::string name) :
    BridgeModel(id)
{
    _data["name"] = name;
}

std::string Project::name() const {
    return stringValue("name");
}

void Project::setName(std::string name) {
    _data["name"] = name;
}

std::string Project::description() const {
    return stringValue("description");
}

void Project::setDescription(std::string description) {
    _data["description"] = description;
}

std::string Project::owner() const {
    return stringValue("owner");
}

void Project::setOwner(std::string owner) {
    _data["owner"] = owner;
}

time_t Project::createdAt() const {
    return timeValue("createdAt");
}

void Project::setCreatedAt(time_t t) {
    _data["createdAt"] = t;
}

time_t Project::modifiedAt() const {
    return timeValue("modifiedAt");
}

void Project::setModifiedAt(time_t t) {
    _data["modifiedAt"] = t;
}
