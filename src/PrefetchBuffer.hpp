#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>

// Client cursor plus reassembly of out-of-order fetch completions.
//
// Positions satisfy consumed <= readyEnd <= nextFetch. The drainable bytes are
// exactly sequence[consumed, readyEnd); [readyEnd, nextFetch) is covered by
// outstanding reservations, some of which may already be parked in 'pending'.
// None of the positions ever decreases, except nextFetch which is pulled back
// once to the observed sequence length.
class PrefetchBuffer {
public:
    explicit PrefetchBuffer(std::uint64_t startOffset = 0);

    // Reserves [nextFetch, nextFetch + length) for one fetch task and returns its
    // offset. Positions never exceed kMaxOffset; std::overflow_error otherwise.
    std::uint64_t reserve(std::uint64_t length);

    // Stores the result of the task reserved at 'offset'. Returns false for
    // stale or duplicate completions, which are dropped.
    bool complete(std::uint64_t offset, std::string bytes);

    // Records the sequence length observed from a short read. Parked results
    // past the end are discarded and no further reservations are possible.
    void freezeAt(std::uint64_t sequenceLength);

    // Removes up to maxBytes from the front of the drainable region.
    std::string drain(std::uint64_t maxBytes);

    std::uint64_t consumedPosition() const { return consumed_; }
    std::uint64_t readyEnd() const { return readyEnd_; }
    std::uint64_t nextFetchPosition() const { return nextFetch_; }
    std::uint64_t buffered() const { return readyEnd_ - consumed_; }
    std::size_t parked() const { return pending_.size(); }
    std::optional<std::uint64_t> sequenceLength() const { return end_; }

    // True once every byte of a known-length sequence has been drained.
    bool exhausted() const { return end_ && consumed_ >= *end_; }

private:
    void promote();

    std::uint64_t consumed_;
    std::uint64_t readyEnd_;
    std::uint64_t nextFetch_;
    std::optional<std::uint64_t> end_;
    std::string ready_;
    std::map<std::uint64_t, std::string> pending_;
};
