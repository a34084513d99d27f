#include "RangeService.hpp"
#include <algorithm>
#include <stdexcept>
#include <trantor/utils/Logger.h>

RangeService::RangeService(std::shared_ptr<ObjectStore> store, std::int64_t maxRange)
    : store_(std::move(store)), maxRange_(maxRange) {
    if (!store_) {
        throw std::invalid_argument("RangeService requires an object store");
    }
    if (maxRange_ <= 0 || maxRange_ > kMaxRangeCeiling) {
        throw std::invalid_argument("max_range must be in [1, " + std::to_string(kMaxRangeCeiling) + "]");
    }
}

ReadResult RangeService::read(const std::string& key, std::int64_t offset, std::int64_t length) const {
    if (offset < 0) {
        return ReadResult::invalid("offset must be non-negative");
    }
    if (length <= 0) {
        return ReadResult::invalid("length must be positive");
    }
    const std::int64_t clamped = std::min(length, maxRange_);

    try {
        auto bytes = store_->get(key, static_cast<std::uint64_t>(offset), static_cast<std::uint64_t>(clamped));
        if (!bytes) {
            LOG_ERROR << "Object not found: " << key;
            return ReadResult::notFound("pi file not found");
        }
        return ReadResult::found(std::move(*bytes));
    } catch (const ObjectStoreError& e) {
        LOG_WARN << "Store read failed for " << key << " [" << offset << ", +" << clamped << "): " << e.what();
        return ReadResult::transient(e.what());
    } catch (const std::exception& e) {
        LOG_ERROR << "Unexpected store error for " << key << ": " << e.what();
        return ReadResult::transient(e.what());
    }
}
