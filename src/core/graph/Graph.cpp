#include "Graph.hpp"

#include <deque>
#include <utility>

#include "Errors.hpp"

namespace flowgraph {

// =========================================================
//  Edge
// =========================================================

bool Edge::Matches(const State& state) const {
    return !condition || condition->Evaluate(state);
}

json::object Edge::ToJson() const {
    json::object out;
    out["from"] = from;
    out["to"] = to;
    if (!label.empty()) out["label"] = label;
    out["weight"] = weight;
    if (condition) out["condition"] = condition->description();
    if (!metadata.empty()) out["metadata"] = metadata;
    return out;
}

// =========================================================
//  Graph
// =========================================================

Graph::Graph(std::string id, std::string name, std::string description)
    : id_(std::move(id)), name_(std::move(name)), description_(std::move(description)) {}

void Graph::AddNode(NodePtr node) {
    if (!node) {
        throw ValidationError("cannot add a null node");
    }
    const std::string& node_id = node->id();
    if (node_map_.contains(node_id)) {
        throw ValidationError("node with ID " + node_id + " already exists");
    }
    node_map_.emplace(node_id, node);
    nodes_.push_back(std::move(node));
}

void Graph::AddEdge(Edge edge) {
    auto& list = edges_[edge.from];
    list.push_back(std::move(edge));
    ++edge_count_;
}

void Graph::AddExitPoint(const std::string& node_id) {
    if (exit_set_.insert(node_id).second) {
        exit_points_.push_back(node_id);
    }
}

void Graph::Validate() const {
    if (entry_point_.empty()) {
        throw ValidationError("entry point not set");
    }
    if (!node_map_.contains(entry_point_)) {
        throw ValidationError("entry point node " + entry_point_ + " does not exist");
    }

    if (exit_points_.empty()) {
        throw ValidationError("no exit points defined");
    }
    for (const auto& exit_id : exit_points_) {
        if (!node_map_.contains(exit_id)) {
            throw ValidationError("exit point node " + exit_id + " does not exist");
        }
    }

    // Walk sources in node order so the reported violation is deterministic
    for (const auto& node : nodes_) {
        auto it = edges_.find(node->id());
        if (it == edges_.end()) continue;
        for (const auto& edge : it->second) {
            if (!node_map_.contains(edge.to)) {
                throw ValidationError("edge target node " + edge.to + " does not exist");
            }
        }
    }
    for (const auto& [source, list] : edges_) {
        if (!node_map_.contains(source)) {
            throw ValidationError("edge source node " + source + " does not exist");
        }
    }

    for (const auto& node : nodes_) {
        node->Validate();
    }
}

NodePtr Graph::GetNode(const std::string& node_id) const {
    auto it = node_map_.find(node_id);
    return it == node_map_.end() ? nullptr : it->second;
}

const std::vector<Edge>& Graph::GetEdges(const std::string& node_id) const {
    static const std::vector<Edge> kNoEdges;
    auto it = edges_.find(node_id);
    return it == edges_.end() ? kNoEdges : it->second;
}

std::vector<std::string> Graph::UnreachableNodes() const {
    std::unordered_set<std::string> seen;
    if (node_map_.contains(entry_point_)) {
        std::deque<std::string> queue{entry_point_};
        seen.insert(entry_point_);
        while (!queue.empty()) {
            std::string current = std::move(queue.front());
            queue.pop_front();
            for (const auto& edge : GetEdges(current)) {
                if (node_map_.contains(edge.to) && seen.insert(edge.to).second) {
                    queue.push_back(edge.to);
                }
            }
        }
    }

    std::vector<std::string> unreachable;
    for (const auto& node : nodes_) {
        if (!seen.contains(node->id())) unreachable.push_back(node->id());
    }
    return unreachable;
}

json::object Graph::ToJson() const {
    json::object out;
    out["id"] = id_;
    out["name"] = name_;
    if (!description_.empty()) out["description"] = description_;
    out["entry_point"] = entry_point_;

    json::array exits;
    for (const auto& exit_id : exit_points_) exits.emplace_back(exit_id);
    out["exit_points"] = std::move(exits);

    json::array nodes;
    json::array edges;
    for (const auto& node : nodes_) {
        json::object n;
        n["id"] = node->id();
        n["name"] = node->name();
        n["type"] = node->type_name();
        nodes.emplace_back(std::move(n));

        for (const auto& edge : GetEdges(node->id())) {
            edges.emplace_back(edge.ToJson());
        }
    }
    out["nodes"] = std::move(nodes);
    out["edges"] = std::move(edges);
    return out;
}

}  // namespace flowgraph
