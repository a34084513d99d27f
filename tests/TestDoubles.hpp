#pragma once
#include <cstdint>
#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>
#include "../src/ObjectStore.hpp"
#include "../src/RangeFetcher.hpp"
#include "../src/TaskScheduler.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

// Deterministic digit sequence: "3." followed by pseudo-random digits.
inline std::string makeSequence(std::size_t length, unsigned seed = 314159) {
    std::string s = "3.";
    std::mt19937 rng(seed);
    while (s.size() < length) {
        s.push_back(static_cast<char>('0' + rng() % 10));
    }
    s.resize(length);
    return s;
}

class InMemoryStore : public ObjectStore {
public:
    std::optional<std::string> get(const std::string& key, std::uint64_t offset, std::uint64_t length) override {
        calls++;
        lastLength = length;
        if (failuresLeft > 0) {
            failuresLeft--;
            if (plainErrors) {
                throw std::runtime_error("backend exploded");
            }
            throw ObjectStoreError("simulated I/O error");
        }
        auto it = objects.find(key);
        if (it == objects.end()) {
            return std::nullopt;
        }
        if (offset >= it->second.size()) {
            return std::string();
        }
        return it->second.substr(static_cast<std::size_t>(offset), static_cast<std::size_t>(length));
    }

    std::map<std::string, std::string> objects;
    int failuresLeft = 0;
    bool plainErrors = false;
    int calls = 0;
    std::uint64_t lastLength = 0;
};

// Virtual-time scheduler; nothing runs until the test pumps it.
class ManualScheduler : public TaskScheduler {
public:
    void post(Task task) override { runAfter(0.0, std::move(task)); }

    void runAfter(double delaySeconds, Task task) override {
        queue.emplace(std::make_tuple(now + delaySeconds, seq++), std::move(task));
    }

    // Runs every task due at or before the current time, including ones they schedule.
    std::size_t runReady() {
        std::size_t ran = 0;
        while (!queue.empty() && std::get<0>(queue.begin()->first) <= now) {
            Task task = std::move(queue.begin()->second);
            queue.erase(queue.begin());
            task();
            ran++;
        }
        return ran;
    }

    std::size_t advance(double seconds) {
        now += seconds;
        return runReady();
    }

    std::size_t pending() const { return queue.size(); }

    double now = 0.0;

private:
    std::map<std::tuple<double, std::uint64_t>, Task> queue;
    std::uint64_t seq = 0;
};

// Records fetches so the test decides when and in which order they complete.
class ScriptedFetcher : public RangeFetcher {
public:
    struct Call {
        std::uint64_t offset;
        std::uint64_t length;
        double timeout;
        Completion done;
        bool answered = false;
    };

    void fetch(std::uint64_t offset, std::uint64_t length, double timeoutSeconds, Completion done) override {
        calls.push_back(Call{offset, length, timeoutSeconds, std::move(done)});
    }

    std::vector<std::size_t> open() const {
        std::vector<std::size_t> idx;
        for (std::size_t i = 0; i < calls.size(); ++i) {
            if (!calls[i].answered) idx.push_back(i);
        }
        return idx;
    }

    void answer(std::size_t index, ReadResult result) {
        calls[index].answered = true;
        // The completion may issue new fetches and grow 'calls'
        Completion done = std::move(calls[index].done);
        done(std::move(result));
    }

    // Answers a call from 'sequence' as a correct server would.
    void serve(std::size_t index, const std::string& sequence) {
        const Call& c = calls[index];
        std::string bytes = c.offset >= sequence.size()
            ? std::string()
            : sequence.substr(static_cast<std::size_t>(c.offset), static_cast<std::size_t>(c.length));
        answer(index, ReadResult::found(std::move(bytes)));
    }

    std::vector<Call> calls;
};
