#include "attachsync/generic_exception.hpp"

GenericException::GenericException()
{
}

nlohmann::json GenericException::toJSON() {
    return {
        {"what", what()},
    };
}
