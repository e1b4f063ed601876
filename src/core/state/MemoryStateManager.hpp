#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "StateManager.hpp"

namespace flowgraph {

// Reference StateManager keeping clones in a map guarded by a shared mutex.
class MemoryStateManager : public StateManager {
public:
    MemoryStateManager() = default;

    MemoryStateManager(const MemoryStateManager&) = delete;
    MemoryStateManager& operator=(const MemoryStateManager&) = delete;

    void SaveState(const State& state) override;
    StatePtr LoadState(const std::string& state_id) override;
    void DeleteState(const std::string& state_id) override;
    std::vector<StatePtr> ListStates(const json::object& filters) override;

    std::size_t Size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, StatePtr> states_;
};

}  // namespace flowgraph
