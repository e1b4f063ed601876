#pragma once

#include <string>
#include <vector>

#include "State.hpp"

namespace flowgraph {

/**
 * @brief Persistence boundary for State checkpoints.
 *
 * @details
 * Implementations must hand out independent clones: mutating a State
 * returned by LoadState() or ListStates(), or the one passed to SaveState()
 * after the call, never changes what the store holds.
 *
 * ListStates filters: "graph_id", "user_id" and "session_id" match the
 * identity fields, any other key matches payload equality. An empty filter
 * lists everything.
 */
class StateManager {
public:
    virtual ~StateManager() = default;

    virtual void SaveState(const State& state) = 0;

    // @throws NotFoundError if nothing was saved under state_id.
    virtual StatePtr LoadState(const std::string& state_id) = 0;

    virtual void DeleteState(const std::string& state_id) = 0;

    virtual std::vector<StatePtr> ListStates(const json::object& filters) = 0;
};

// True when state satisfies every entry of filters.
bool MatchesFilters(const State& state, const json::object& filters);

}  // namespace flowgraph
