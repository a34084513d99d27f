#include "StateBroadcaster.hpp"
#include <algorithm>

std::uint64_t StateBroadcaster::subscribe(Listener listener) {
    std::lock_guard lock(mtx);
    std::uint64_t id = nextId++;
    listeners.emplace_back(id, std::move(listener));
    return id;
}

void StateBroadcaster::unsubscribe(std::uint64_t id) {
    std::lock_guard lock(mtx);
    listeners.erase(std::remove_if(listeners.begin(), listeners.end(),
                                   [id](const auto& entry) { return entry.first == id; }),
                    listeners.end());
}

void StateBroadcaster::broadcast(SessionState state, const std::string& detail) {
    // Listeners may unsubscribe from inside the callback
    std::vector<std::pair<std::uint64_t, Listener>> snapshot;
    {
        std::lock_guard lock(mtx);
        snapshot = listeners;
    }
    for (auto& entry : snapshot) {
        entry.second(state, detail);
    }
}

std::size_t StateBroadcaster::size() const {
    std::lock_guard lock(mtx);
    return listeners.size();
}
