#include "davbridge/models/bridge_model.hpp"

BridgeModel::BridgeModel(std::string id) :
    _data(nlohmann::json::object())
{
    _data["id"] = id;
}

BridgeModel::BridgeModel(nlohmann::json json) :
    _data(json)
{
}

std::string BridgeModel::id() const {
    return stringValue("id");
}

nlohmann::json BridgeModel::toJSON() const {
    return _data;
}

std::string BridgeModel::stringValue(const char * key) const {
    auto it = _data.find(key);
    if (it == _data.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

time_t BridgeModel::timeValue(const char * key) const {
    auto it = _data.find(key);
    if (it == _data.end() || !it->is_number()) {
        return 0;
    }
    return it->get<time_t>();
}
