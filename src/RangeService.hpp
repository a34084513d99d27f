#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include "ObjectStore.hpp"
#include "RangeTypes.hpp"

// Bounded, stateless range reads against one object store.
class RangeService {
public:
    RangeService(std::shared_ptr<ObjectStore> store, std::int64_t maxRange = kDefaultMaxRange);

    // Rejects offset < 0 and length <= 0 before the store is touched and
    // clamps length to maxRange. Performs exactly one store read and never retries.
    ReadResult read(const std::string& key, std::int64_t offset, std::int64_t length) const;

    std::int64_t maxRange() const { return maxRange_; }

private:
    std::shared_ptr<ObjectStore> store_;
    std::int64_t maxRange_;
};
