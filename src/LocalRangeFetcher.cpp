#include "RangeFetcher.hpp"
#include <string>
#include <utility>

LocalRangeFetcher::LocalRangeFetcher(std::shared_ptr<RangeService> service, std::string key, TaskScheduler& scheduler)
    : service_(std::move(service)), key_(std::move(key)), scheduler_(scheduler) {}

void LocalRangeFetcher::fetch(std::uint64_t offset, std::uint64_t length, double, Completion done) {
    // Same bounds as the HTTP endpoint: a clamped reply would read as end-of-stream
    ReadResult result;
    if (length > static_cast<std::uint64_t>(service_->maxRange())) {
        result = ReadResult::invalid("length exceeds " + std::to_string(service_->maxRange()));
    } else if (offset > static_cast<std::uint64_t>(kMaxOffset)) {
        result = ReadResult::invalid("start out of range");
    } else {
        result = service_->read(key_, static_cast<std::int64_t>(offset), static_cast<std::int64_t>(length));
    }
    scheduler_.post([done = std::move(done), result = std::move(result)]() mutable {
        done(std::move(result));
    });
}
