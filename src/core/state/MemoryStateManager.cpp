#include "MemoryStateManager.hpp"

#include <spdlog/spdlog.h>

#include <mutex>

#include "Errors.hpp"

namespace flowgraph {

bool MatchesFilters(const State& state, const json::object& filters) {
    for (const auto& kv : filters) {
        const auto key = kv.key();
        const auto& expected = kv.value();

        if (key == "graph_id" || key == "user_id" || key == "session_id") {
            if (!expected.is_string()) return false;
            std::string actual = key == "graph_id"  ? state.graph_id()
                                 : key == "user_id" ? state.user_id()
                                                    : state.session_id();
            if (actual != std::string_view(expected.get_string())) return false;
            continue;
        }

        auto actual = state.Get(key);
        if (!actual || *actual != expected) return false;
    }
    return true;
}

void MemoryStateManager::SaveState(const State& state) {
    auto copy = state.Clone();

    std::unique_lock lock(mutex_);
    states_[state.id()] = std::move(copy);
    spdlog::trace("Checkpoint saved: state {} v{}", state.id(), state.version());
}

StatePtr MemoryStateManager::LoadState(const std::string& state_id) {
    std::shared_lock lock(mutex_);
    auto it = states_.find(state_id);
    if (it == states_.end()) {
        throw NotFoundError("state not found: " + state_id);
    }
    return it->second->Clone();
}

void MemoryStateManager::DeleteState(const std::string& state_id) {
    std::unique_lock lock(mutex_);
    if (states_.erase(state_id) > 0) {
        spdlog::debug("State {} deleted.", state_id);
    }
}

std::vector<StatePtr> MemoryStateManager::ListStates(const json::object& filters) {
    std::shared_lock lock(mutex_);
    std::vector<StatePtr> result;
    for (const auto& [id, state] : states_) {
        if (MatchesFilters(*state, filters)) {
            result.push_back(state->Clone());
        }
    }
    return result;
}

std::size_t MemoryStateManager::Size() const {
    std::shared_lock lock(mutex_);
    return states_.size();
}

}  // namespace flowgraph
