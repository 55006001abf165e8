#include "davbridge/generic_exception.hpp"

GenericException::GenericException() :
    _what("GenericException")
{
}

GenericException::GenericException(std::string what) :
    _what(what)
{
}

const char * GenericException::what() const noexcept {
    return _what.c_str();
}

nlohmann::json GenericException::toJSON() const {
    return {
        {"what", what()},
    };
}
