#include "RangeTypes.hpp"
#include <utility>

const char* toString(ReadStatus status) {
    switch (status) {
        case ReadStatus::Found: return "found";
        case ReadStatus::ObjectNotFound: return "object_not_found";
        case ReadStatus::InvalidRequest: return "invalid_request";
        case ReadStatus::TransientFailure: return "transient_failure";
    }
    return "unknown";
}

ReadResult ReadResult::found(std::string bytes) {
    ReadResult r;
    r.status = ReadStatus::Found;
    r.bytes = std::move(bytes);
    return r;
}

ReadResult ReadResult::notFound(const std::string& message) {
    ReadResult r;
    r.status = ReadStatus::ObjectNotFound;
    r.message = message;
    return r;
}

ReadResult ReadResult::invalid(const std::string& message) {
    ReadResult r;
    r.status = ReadStatus::InvalidRequest;
    r.message = message;
    return r;
}

ReadResult ReadResult::transient(const std::string& message) {
    ReadResult r;
    r.status = ReadStatus::TransientFailure;
    r.message = message;
    return r;
}
