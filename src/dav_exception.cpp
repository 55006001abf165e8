#include "davbridge/dav_exception.hpp"

DAVException::DAVException(int status, std::string key, std::string di, std::string precondition, std::string preconditionNS) :
    GenericException(key + ": " + di),
    status(status), key(key), debuginfo(di), precondition(precondition), preconditionNS(preconditionNS)
{
}

nlohmann::json DAVException::toJSON() const {
    nlohmann::json j = {
        {"what", what()},
        {"status", status},
        {"key", key},
        {"debuginfo", debuginfo},
    };
    if (precondition != "") {
        j["precondition"] = precondition;
    }
    return j;
}
