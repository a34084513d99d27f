#include "PrefetchBuffer.hpp"
#include <algorithm>
#include <stdexcept>
#include "RangeTypes.hpp"

PrefetchBuffer::PrefetchBuffer(std::uint64_t startOffset)
    : consumed_(startOffset), readyEnd_(startOffset), nextFetch_(startOffset) {
    if (startOffset > static_cast<std::uint64_t>(kMaxOffset)) {
        throw std::invalid_argument("start offset exceeds the largest addressable position");
    }
}

std::uint64_t PrefetchBuffer::reserve(std::uint64_t length) {
    if (end_) {
        throw std::logic_error("cannot reserve past the end of the sequence");
    }
    if (length == 0) {
        throw std::invalid_argument("reservation length must be positive");
    }
    if (length > static_cast<std::uint64_t>(kMaxOffset) - nextFetch_) {
        throw std::overflow_error("reservation runs past the largest addressable position");
    }
    std::uint64_t offset = nextFetch_;
    nextFetch_ += length;
    return offset;
}

bool PrefetchBuffer::complete(std::uint64_t offset, std::string bytes) {
    if (offset < readyEnd_ || offset >= nextFetch_) {
        return false;
    }
    if (end_ && offset >= *end_) {
        return false;
    }
    if (pending_.count(offset) != 0) {
        return false;
    }
    if (end_ && offset + bytes.size() > *end_) {
        bytes.resize(static_cast<std::size_t>(*end_ - offset));
    }
    pending_.emplace(offset, std::move(bytes));
    promote();
    return true;
}

void PrefetchBuffer::promote() {
    auto it = pending_.begin();
    while (it != pending_.end() && it->first == readyEnd_) {
        ready_ += it->second;
        readyEnd_ += it->second.size();
        it = pending_.erase(it);
        // A short chunk leaves a hole only past the end, which freezeAt trims
        if (end_ && readyEnd_ >= *end_) {
            break;
        }
    }
}

void PrefetchBuffer::freezeAt(std::uint64_t sequenceLength) {
    std::uint64_t end = std::max(sequenceLength, readyEnd_);
    if (end_ && *end_ <= end) {
        return;
    }
    end_ = end;
    nextFetch_ = std::min(nextFetch_, end);
    pending_.erase(pending_.lower_bound(end), pending_.end());
}

std::string PrefetchBuffer::drain(std::uint64_t maxBytes) {
    std::size_t n = static_cast<std::size_t>(std::min<std::uint64_t>(maxBytes, ready_.size()));
    std::string out = ready_.substr(0, n);
    ready_.erase(0, n);
    consumed_ += n;
    return out;
}
