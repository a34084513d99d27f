#pragma once
#include <algorithm>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include "PrefetchBuffer.hpp"
#include "RangeFetcher.hpp"
#include "SessionState.hpp"
#include "StateBroadcaster.hpp"
#include "TaskScheduler.hpp"

struct PrefetchConfig {
    std::uint64_t chunkSize = 500;
    std::size_t concurrency = 4;
    std::uint64_t lookaheadFactor = 4;
    double retryDelaySeconds = 3.0;
    // Zero disables the per-task watchdog.
    double fetchTimeoutSeconds = 10.0;
    // Zero means retry transient failures for as long as the session lives.
    std::uint32_t maxRetries = 0;
    std::uint64_t startOffset = 0;

    std::uint64_t lookaheadTarget() const { return chunkSize * lookaheadFactor; }
    std::uint64_t lowWaterMark() const { return std::max<std::uint64_t>(lookaheadTarget() / 2, 1); }

    // Throws std::invalid_argument describing the first bad field.
    void validate() const;
};

enum class DemandKind {
    Chunk,
    NotReady,
    EndOfStream,
    Failed
};

struct DemandResult {
    DemandKind kind = DemandKind::NotReady;
    std::string bytes;
    std::string error;
};

struct PrefetchStatus {
    SessionState state = SessionState::Idle;
    std::uint64_t consumedPosition = 0;
    std::uint64_t nextFetchPosition = 0;
    std::uint64_t bufferedBytes = 0;
    std::size_t inFlight = 0;
    std::size_t retrying = 0;
    std::uint64_t fetchesIssued = 0;
    std::optional<std::uint64_t> sequenceLength;
};

/**
 * Client-side read-ahead over a range endpoint.
 *
 * Keeps up to 'concurrency' fetch tasks in flight at consecutive offsets,
 * reassembles their results in offset order and hands the contiguous prefix
 * to the presentation layer through requestMore(). All methods and all fetch
 * completions must run on the scheduler's thread.
 */
class PrefetchManager {
public:
    PrefetchManager(PrefetchConfig config, RangeFetcher& fetcher, TaskScheduler& scheduler);
    ~PrefetchManager();

    PrefetchManager(const PrefetchManager&) = delete;
    PrefetchManager& operator=(const PrefetchManager&) = delete;

    void start();

    // Demand signal. Never blocks: returns a chunk of at most chunkSize bytes,
    // NotReady while data is still in flight, EndOfStream once everything has
    // been delivered, or Failed exactly once after a fatal error.
    DemandResult requestMore();

    // Ends the session. Results that arrive afterwards are dropped.
    void close();

    SessionState state() const { return state_; }
    PrefetchStatus status() const;

    std::uint64_t subscribe(StateBroadcaster::Listener listener);
    void unsubscribe(std::uint64_t id);

private:
    struct FetchTask {
        std::uint64_t length = 0;
        std::uint32_t attempt = 0;
        bool waitingRetry = false;
    };

    void refill();
    void dispatch(std::uint64_t offset);
    void onFetchComplete(std::uint64_t offset, std::uint32_t attempt, ReadResult result);
    void onFound(std::uint64_t offset, std::string bytes);
    void scheduleRetry(std::uint64_t offset, const std::string& reason);
    void retry(std::uint64_t offset, std::uint32_t attempt);
    void fail(const std::string& message);
    void transition(SessionState next, const std::string& detail);
    bool acceptsResults() const;

    PrefetchConfig config_;
    RangeFetcher& fetcher_;
    TaskScheduler& scheduler_;
    PrefetchBuffer buffer_;
    std::map<std::uint64_t, FetchTask> tasks_;
    SessionState state_ = SessionState::Idle;
    std::string failure_;
    bool failureReported_ = false;
    std::uint64_t fetchesIssued_ = 0;
    StateBroadcaster broadcaster_;
    std::shared_ptr<bool> alive_;
};
