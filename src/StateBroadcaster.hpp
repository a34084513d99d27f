#pragma once
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "SessionState.hpp"

// Fan-out of session state changes to presentation-layer listeners.
class StateBroadcaster {
public:
    using Listener = std::function<void(SessionState, const std::string&)>;

    std::uint64_t subscribe(Listener listener);
    void unsubscribe(std::uint64_t id);
    void broadcast(SessionState state, const std::string& detail);
    std::size_t size() const;

private:
    std::vector<std::pair<std::uint64_t, Listener>> listeners;
    std::uint64_t nextId = 1;
    mutable std::mutex mtx;
};
