#include "segstore/core/error.h"

namespace segstore {
namespace core {

ErrorClass Classify(Error::Code code) {
    switch (code) {
        case Error::Code::NOT_FOUND:
            return ErrorClass::NOT_FOUND;
        case Error::Code::TIMEOUT:
        case Error::Code::RESOURCE_EXHAUSTED:
        case Error::Code::UNAVAILABLE:
        case Error::Code::IO_ERROR:
            return ErrorClass::TRANSIENT;
        case Error::Code::CORRUPTION:
        case Error::Code::INTERNAL:
            return ErrorClass::FATAL;
        case Error::Code::UNKNOWN:
        case Error::Code::INVALID_ARGUMENT:
        case Error::Code::ALREADY_EXISTS:
            return ErrorClass::INVALID;
    }
    return ErrorClass::INVALID;
}

const char* CodeName(Error::Code code) {
    switch (code) {
        case Error::Code::UNKNOWN: return "UNKNOWN";
        case Error::Code::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case Error::Code::NOT_FOUND: return "NOT_FOUND";
        case Error::Code::ALREADY_EXISTS: return "ALREADY_EXISTS";
        case Error::Code::TIMEOUT: return "TIMEOUT";
        case Error::Code::RESOURCE_EXHAUSTED: return "RESOURCE_EXHAUSTED";
        case Error::Code::INTERNAL: return "INTERNAL";
        case Error::Code::UNAVAILABLE: return "UNAVAILABLE";
        case Error::Code::IO_ERROR: return "IO_ERROR";
        case Error::Code::CORRUPTION: return "CORRUPTION";
    }
    return "UNKNOWN";
}

} // namespace core
} // namespace segstore
