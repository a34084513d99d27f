#pragma once
#include <cstdint>
#include <limits>
#include <string>

// Upper bound on any configured MAX_RANGE.
constexpr std::int64_t kMaxRangeCeiling = 10000000;
constexpr std::int64_t kDefaultMaxRange = 100000;
constexpr std::int64_t kDefaultReadLength = 1000;
constexpr std::int64_t kMaxOffset = std::numeric_limits<std::int64_t>::max();

enum class ReadStatus {
    Found,
    ObjectNotFound,
    InvalidRequest,
    TransientFailure
};

const char* toString(ReadStatus status);

// Outcome of one range read. Used by the server read path and by client fetch completions.
struct ReadResult {
    ReadStatus status = ReadStatus::Found;
    std::string bytes;
    std::string message;

    static ReadResult found(std::string bytes);
    static ReadResult notFound(const std::string& message);
    static ReadResult invalid(const std::string& message);
    static ReadResult transient(const std::string& message);

    bool ok() const { return status == ReadStatus::Found; }
    bool retryable() const { return status == ReadStatus::TransientFailure; }
};

struct RangeRequest {
    std::int64_t offset = 0;
    std::int64_t length = kDefaultReadLength;
};
