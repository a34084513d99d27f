#include "PrefetchManager.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>
#include <trantor/utils/Logger.h>

void PrefetchConfig::validate() const {
    if (chunkSize == 0) {
        throw std::invalid_argument("chunkSize must be positive");
    }
    if (chunkSize > static_cast<std::uint64_t>(kMaxRangeCeiling)) {
        throw std::invalid_argument("chunkSize exceeds the largest range a server accepts");
    }
    if (concurrency < 1 || concurrency > 10) {
        throw std::invalid_argument("concurrency must be in [1, 10]");
    }
    if (lookaheadFactor == 0) {
        throw std::invalid_argument("lookaheadFactor must be positive");
    }
    if (lookaheadFactor > static_cast<std::uint64_t>(kMaxOffset) / chunkSize) {
        throw std::invalid_argument("chunkSize * lookaheadFactor is too large");
    }
    if (startOffset > static_cast<std::uint64_t>(kMaxOffset)) {
        throw std::invalid_argument("startOffset must be at most " + std::to_string(kMaxOffset));
    }
    if (retryDelaySeconds < 0.0) {
        throw std::invalid_argument("retryDelaySeconds must be non-negative");
    }
    if (fetchTimeoutSeconds < 0.0) {
        throw std::invalid_argument("fetchTimeoutSeconds must be non-negative");
    }
}

namespace {

PrefetchConfig validated(PrefetchConfig config) {
    config.validate();
    return config;
}

}  // namespace

PrefetchManager::PrefetchManager(PrefetchConfig config, RangeFetcher& fetcher, TaskScheduler& scheduler)
    : config_(validated(std::move(config))),
      fetcher_(fetcher),
      scheduler_(scheduler),
      buffer_(config_.startOffset),
      alive_(std::make_shared<bool>(true)) {}

PrefetchManager::~PrefetchManager() {
    *alive_ = false;
}

void PrefetchManager::start() {
    if (state_ != SessionState::Idle) {
        return;
    }
    transition(SessionState::Prefetching, "started at " + std::to_string(config_.startOffset));
    refill();
}

void PrefetchManager::close() {
    if (state_ == SessionState::Closed) {
        return;
    }
    tasks_.clear();
    transition(SessionState::Closed, "closed");
}

DemandResult PrefetchManager::requestMore() {
    DemandResult out;
    if (state_ == SessionState::Idle) {
        start();
    }
    if (state_ == SessionState::Closed) {
        out.kind = DemandKind::EndOfStream;
        return out;
    }

    if (buffer_.buffered() > 0) {
        out.kind = DemandKind::Chunk;
        out.bytes = buffer_.drain(config_.chunkSize);
        refill();
        return out;
    }

    if (state_ == SessionState::Failed) {
        if (!failureReported_) {
            failureReported_ = true;
            out.kind = DemandKind::Failed;
            out.error = failure_;
            return out;
        }
        out.kind = DemandKind::EndOfStream;
        return out;
    }

    if (state_ == SessionState::EndOfStream && buffer_.exhausted()) {
        out.kind = DemandKind::EndOfStream;
        return out;
    }

    out.kind = DemandKind::NotReady;
    return out;
}

bool PrefetchManager::acceptsResults() const {
    return state_ == SessionState::Prefetching || state_ == SessionState::EndOfStream;
}

void PrefetchManager::refill() {
    if (state_ != SessionState::Prefetching) {
        return;
    }
    if (buffer_.buffered() >= config_.lowWaterMark()) {
        return;
    }
    // Parked out-of-order results and in-flight tasks both count toward the lookahead
    while (tasks_.size() < config_.concurrency &&
           buffer_.nextFetchPosition() - buffer_.consumedPosition() < config_.lookaheadTarget()) {
        const std::uint64_t room = static_cast<std::uint64_t>(kMaxOffset) - buffer_.nextFetchPosition();
        if (room == 0) {
            // Nothing can lie past the last addressable position
            if (tasks_.empty()) {
                buffer_.freezeAt(buffer_.nextFetchPosition());
                transition(SessionState::EndOfStream, "reached offset limit " + std::to_string(kMaxOffset));
            }
            return;
        }
        const std::uint64_t length = std::min(config_.chunkSize, room);
        std::uint64_t offset = buffer_.reserve(length);
        tasks_[offset].length = length;
        dispatch(offset);
    }
}

void PrefetchManager::dispatch(std::uint64_t offset) {
    FetchTask& task = tasks_.at(offset);
    task.attempt++;
    task.waitingRetry = false;
    fetchesIssued_++;

    const std::uint32_t attempt = task.attempt;
    std::weak_ptr<bool> alive = alive_;
    auto guard = [this, alive, offset, attempt](ReadResult result) {
        auto token = alive.lock();
        if (!token || !*token) {
            return;
        }
        onFetchComplete(offset, attempt, std::move(result));
    };

    LOG_TRACE << "Fetch [" << offset << ", +" << task.length << ") attempt " << attempt;
    try {
        fetcher_.fetch(offset, task.length, config_.fetchTimeoutSeconds, guard);
    } catch (const std::exception& e) {
        LOG_WARN << "Fetch dispatch failed at " << offset << ": " << e.what();
        std::string reason = e.what();
        scheduler_.post([guard, reason]() { guard(ReadResult::transient(reason)); });
        return;
    }

    if (config_.fetchTimeoutSeconds > 0.0) {
        scheduler_.runAfter(config_.fetchTimeoutSeconds, [guard]() {
            guard(ReadResult::transient("fetch timed out"));
        });
    }
}

void PrefetchManager::onFetchComplete(std::uint64_t offset, std::uint32_t attempt, ReadResult result) {
    if (!acceptsResults()) {
        return;
    }
    auto it = tasks_.find(offset);
    if (it == tasks_.end() || it->second.attempt != attempt || it->second.waitingRetry) {
        // Superseded by a timeout, a retry or the end of the sequence
        return;
    }

    switch (result.status) {
        case ReadStatus::Found:
            onFound(offset, std::move(result.bytes));
            break;
        case ReadStatus::ObjectNotFound:
        case ReadStatus::InvalidRequest:
            fail(std::string(toString(result.status)) + ": " + result.message);
            break;
        case ReadStatus::TransientFailure:
            scheduleRetry(offset, result.message);
            break;
    }
}

void PrefetchManager::onFound(std::uint64_t offset, std::string bytes) {
    auto it = tasks_.find(offset);
    const std::uint64_t requested = it->second.length;
    tasks_.erase(it);

    if (bytes.size() > requested) {
        LOG_WARN << "Range at " << offset << " returned " << bytes.size() << " bytes for " << requested << " requested";
        bytes.resize(static_cast<std::size_t>(requested));
    }

    if (bytes.size() < requested) {
        const std::uint64_t end = offset + bytes.size();
        buffer_.freezeAt(end);
        // Tasks past the end can only come back empty
        tasks_.erase(tasks_.lower_bound(end), tasks_.end());
        buffer_.complete(offset, std::move(bytes));
        LOG_INFO << "Sequence ends at " << *buffer_.sequenceLength();
        transition(SessionState::EndOfStream, "sequence length " + std::to_string(*buffer_.sequenceLength()));
        return;
    }

    buffer_.complete(offset, std::move(bytes));
    refill();
}

void PrefetchManager::scheduleRetry(std::uint64_t offset, const std::string& reason) {
    FetchTask& task = tasks_.at(offset);
    if (config_.maxRetries > 0 && task.attempt > config_.maxRetries) {
        fail("retries exhausted at offset " + std::to_string(offset) + ": " + reason);
        return;
    }
    task.waitingRetry = true;
    LOG_WARN << "Fetch at " << offset << " failed (" << reason << "), retry in " << config_.retryDelaySeconds << "s";
    broadcaster_.broadcast(state_, "retrying offset " + std::to_string(offset) + ": " + reason);

    const std::uint32_t attempt = task.attempt;
    std::weak_ptr<bool> alive = alive_;
    scheduler_.runAfter(config_.retryDelaySeconds, [this, alive, offset, attempt]() {
        auto token = alive.lock();
        if (!token || !*token) {
            return;
        }
        retry(offset, attempt);
    });
}

void PrefetchManager::retry(std::uint64_t offset, std::uint32_t attempt) {
    if (!acceptsResults()) {
        return;
    }
    auto it = tasks_.find(offset);
    if (it == tasks_.end() || it->second.attempt != attempt || !it->second.waitingRetry) {
        return;
    }
    dispatch(offset);
}

void PrefetchManager::fail(const std::string& message) {
    if (isTerminal(state_) && state_ != SessionState::EndOfStream) {
        return;
    }
    LOG_ERROR << "Prefetch session failed: " << message;
    failure_ = message;
    tasks_.clear();
    transition(SessionState::Failed, message);
}

void PrefetchManager::transition(SessionState next, const std::string& detail) {
    if (state_ == next) {
        return;
    }
    LOG_INFO << "Session " << toString(state_) << " -> " << toString(next) << " (" << detail << ")";
    state_ = next;
    broadcaster_.broadcast(next, detail);
}

PrefetchStatus PrefetchManager::status() const {
    PrefetchStatus s;
    s.state = state_;
    s.consumedPosition = buffer_.consumedPosition();
    s.nextFetchPosition = buffer_.nextFetchPosition();
    s.bufferedBytes = buffer_.buffered();
    s.inFlight = tasks_.size();
    for (const auto& entry : tasks_) {
        if (entry.second.waitingRetry) {
            s.retrying++;
        }
    }
    s.fetchesIssued = fetchesIssued_;
    s.sequenceLength = buffer_.sequenceLength();
    return s;
}

std::uint64_t PrefetchManager::subscribe(StateBroadcaster::Listener listener) {
    return broadcaster_.subscribe(std::move(listener));
}

void PrefetchManager::unsubscribe(std::uint64_t id) {
    broadcaster_.unsubscribe(id);
}
