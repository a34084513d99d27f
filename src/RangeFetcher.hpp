#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include "RangeService.hpp"
#include "RangeTypes.hpp"
#include "TaskScheduler.hpp"

// Asynchronous source of range reads for the prefetch manager.
// 'done' is invoked exactly once, on the scheduler's thread, and never from
// inside fetch() itself.
class RangeFetcher {
public:
    using Completion = std::function<void(ReadResult)>;

    virtual ~RangeFetcher() = default;
    virtual void fetch(std::uint64_t offset, std::uint64_t length, double timeoutSeconds, Completion done) = 0;
};

// Serves fetches from an in-process RangeService. Lengths above the
// service's max range are rejected as InvalidRequest.
class LocalRangeFetcher : public RangeFetcher {
public:
    LocalRangeFetcher(std::shared_ptr<RangeService> service, std::string key, TaskScheduler& scheduler);

    void fetch(std::uint64_t offset, std::uint64_t length, double timeoutSeconds, Completion done) override;

private:
    std::shared_ptr<RangeService> service_;
    std::string key_;
    TaskScheduler& scheduler_;
};
