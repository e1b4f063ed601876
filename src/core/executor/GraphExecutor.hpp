#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "ExecutionContext.hpp"
#include "ExecutionResult.hpp"
#include "Graph.hpp"
#include "IoContextPool.hpp"
#include "StateManager.hpp"

namespace flowgraph {

struct AsyncExecution {
    std::string execution_id;
    std::future<ExecutionResult> result;
};

/**
 * @brief Runs graphs and keeps a ledger of every execution.
 *
 * @details
 * One execution walks the graph strictly sequentially:
 *
 *   visit node -> (exit point? stop) -> Execute -> checkpoint -> pick next edge
 *
 * The first outgoing edge whose condition is absent or true wins. No
 * matching edge ends the run as Completed. Every state produced is saved
 * through the StateManager under the execution's state id.
 *
 * Execute() never throws for a failed run: failures, cancellation and
 * timeouts all come back as an ExecutionResult carrying the status, the
 * error text and the nodes visited so far.
 *
 * Distinct executions may run concurrently, either from several caller
 * threads or through ExecuteAsync(), which queues the run on the
 * executor's worker pool. Destroying the executor cancels every running
 * execution and waits for the pool to drain.
 */
class GraphExecutor {
public:
    explicit GraphExecutor(std::shared_ptr<StateManager> state_manager,
                           unsigned int worker_threads = DEFAULT_WORKER_THREADS);
    ~GraphExecutor();

    GraphExecutor(const GraphExecutor&) = delete;
    GraphExecutor& operator=(const GraphExecutor&) = delete;

    // @throws ValidationError if graph is null.
    ExecutionResult Execute(const GraphPtr& graph, const json::object& input,
                            const ExecutionOptions& options = {});

    /**
     * @brief Queues an execution on the worker pool and returns immediately.
     *
     * The ledger entry exists (status Running) before this returns, so the id
     * can be passed to GetExecution() or CancelExecution() right away. The
     * future receives exactly one ExecutionResult.
     * @throws ValidationError if graph is null.
     */
    AsyncExecution ExecuteAsync(const GraphPtr& graph, const json::object& input,
                                const ExecutionOptions& options = {});

    // Snapshot of the ledger entry, or nullopt for an unknown id.
    std::optional<ExecutionResult> GetExecution(const std::string& execution_id) const;

    // Snapshots of all ledger entries, oldest first.
    std::vector<ExecutionResult> ListExecutions() const;

    /**
     * @brief Cancels a running execution.
     *
     * The entry becomes Cancelled immediately; the run itself stops at its
     * next suspension point.
     * @throws NotFoundError for an unknown id.
     * @throws InvalidStateError if the execution already finished.
     */
    void CancelExecution(const std::string& execution_id);

    // Evicts finished entries whose end time is at least max_age old.
    std::size_t CleanupExecutions(std::chrono::nanoseconds max_age);

    ExecutionStats GetExecutionStats() const;

private:
    struct Execution {
        std::mutex mutex;
        ExecutionResult result;
        std::shared_ptr<ExecutionContext> context;
    };
    using ExecutionPtr = std::shared_ptr<Execution>;

    ExecutionPtr Register(const Graph& graph, const ExecutionOptions& options);
    ExecutionResult Run(const Graph& graph, const json::object& input,
                        const ExecutionOptions& options, Execution& execution);

    StatePtr ExecuteNode(const Node& node, const ExecutionContext& ctx, const State& state);
    void Checkpoint(const ExecutionContext& ctx, const State& state);
    std::optional<std::string> NextNode(const Graph& graph, const std::string& current,
                                        const State& state) const;

    static void RecordVisit(Execution& execution, const std::string& node_id);
    // Performs the single terminal transition; false if it already happened.
    static bool Finish(Execution& execution, ExecutionStatus status, StatePtr final_state,
                       std::string error, std::optional<ErrorCode> code);
    static ExecutionResult Snapshot(Execution& execution);

    std::shared_ptr<StateManager> state_manager_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ExecutionPtr> executions_;
    std::vector<std::string> order_;

    std::unique_ptr<IoContextPool> pool_;
};

}  // namespace flowgraph
