#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "Condition.hpp"
#include "Nodes.hpp"
#include "types.hpp"

namespace flowgraph {

/**
 * @brief Directed transition between two nodes.
 *
 * An edge without a condition always matches. Weight is informational only.
 */
struct Edge {
    std::string from;
    std::string to;
    ConditionPtr condition;
    std::string label;
    double weight = 1.0;
    json::object metadata;

    // True when the edge has no condition or the condition holds for state.
    bool Matches(const State& state) const;

    json::object ToJson() const;
};

/**
 * @brief Node and edge container with an entry point and exit points.
 *
 * @details
 * Entry and exit ids are only recorded when set; Validate() resolves them,
 * so a graph may be assembled in any order. Outgoing edges of one source are
 * kept in registration order, which is the order the executor scans them in
 * ("first match wins").
 *
 * A Graph is mutable while being assembled and read-only once handed out by
 * GraphBuilder::Build() as a shared_ptr<const Graph>; concurrent reads need
 * no locking.
 */
class Graph {
public:
    Graph(std::string id, std::string name, std::string description = {});

    Graph(const Graph&) = delete;
    Graph& operator=(const Graph&) = delete;

    const std::string& id() const noexcept { return id_; }
    const std::string& name() const noexcept { return name_; }
    const std::string& description() const noexcept { return description_; }
    void SetId(std::string id) { id_ = std::move(id); }
    void SetDescription(std::string description) { description_ = std::move(description); }

    // @throws ValidationError on a null node or a duplicate id.
    void AddNode(NodePtr node);
    void AddEdge(Edge edge);
    void SetEntryPoint(std::string node_id) { entry_point_ = std::move(node_id); }
    void AddExitPoint(const std::string& node_id);

    /**
     * @brief Checks the graph is executable and throws on the first violation.
     *
     * Order: entry point, exit points, edge endpoints, then each node's own
     * configuration.
     * @throws ValidationError
     */
    void Validate() const;

    // nullptr when no node has this id.
    NodePtr GetNode(const std::string& node_id) const;

    // Outgoing edges of node_id in registration order; empty if none.
    const std::vector<Edge>& GetEdges(const std::string& node_id) const;

    bool IsExitPoint(const std::string& node_id) const { return exit_set_.contains(node_id); }

    const std::string& entry_point() const noexcept { return entry_point_; }
    const std::vector<std::string>& exit_points() const noexcept { return exit_points_; }

    // Nodes in insertion order.
    const std::vector<NodePtr>& nodes() const noexcept { return nodes_; }

    std::size_t NodeCount() const noexcept { return nodes_.size(); }
    std::size_t EdgeCount() const noexcept { return edge_count_; }

    // Ids of nodes not reachable from the entry point, in insertion order.
    std::vector<std::string> UnreachableNodes() const;

    json::object ToJson() const;

private:
    std::string id_;
    std::string name_;
    std::string description_;

    std::vector<NodePtr> nodes_;
    std::unordered_map<std::string, NodePtr> node_map_;
    std::unordered_map<std::string, std::vector<Edge>> edges_;
    std::size_t edge_count_ = 0;

    std::string entry_point_;
    std::vector<std::string> exit_points_;
    std::unordered_set<std::string> exit_set_;
};

using GraphPtr = std::shared_ptr<const Graph>;

}  // namespace flowgraph
