#include "Json2Graph.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <memory>
#include <sstream>
#include <string>

#include "Errors.hpp"
#include "GraphBuilder.hpp"

namespace flowgraph {

namespace {

// --- Helpers ---

template <class T>
T require(const json::object& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        throw ValidationError(std::string("missing required key: ") + key);
    }
    try {
        return json::value_to<T>(it->value());
    } catch (const std::exception& e) {
        throw ValidationError(std::string("failed to parse key '") + key + "': " + e.what());
    }
}

template <class T>
T get_or(const json::object& obj, const char* key, T default_val) {
    if (!obj.contains(key) || obj.at(key).is_null()) return default_val;
    return require<T>(obj, key);
}

const json::object& as_object(const json::value& v, const char* what) {
    if (!v.is_object()) {
        throw ValidationError(std::string(what) + " must be a JSON object");
    }
    return v.get_object();
}

std::vector<ConditionPtr> parse_children(const json::value& v, const char* combinator) {
    if (!v.is_array()) {
        throw ValidationError(std::string("'") + combinator + "' condition needs an array");
    }
    std::vector<ConditionPtr> children;
    for (const auto& child : v.get_array()) {
        children.push_back(ParseCondition(child));
    }
    return children;
}

Edge parse_edge(const json::object& edge_obj) {
    Edge edge;
    edge.from = require<std::string>(edge_obj, "from");
    edge.to = require<std::string>(edge_obj, "to");
    edge.weight = get_or<double>(edge_obj, "weight", 1.0);
    edge.metadata = get_or<json::object>(edge_obj, "metadata", {});

    if (auto it = edge_obj.find("condition"); it != edge_obj.end() && !it->value().is_null()) {
        edge.condition = ParseCondition(it->value());
    }

    std::string default_label =
        edge.condition ? edge.condition->description() : edge.from + " -> " + edge.to;
    edge.label = get_or<std::string>(edge_obj, "label", default_label);
    return edge;
}

}  // namespace

// =========================================================
//  Conditions
// =========================================================

ConditionPtr ParseCondition(const json::value& v) {
    const auto& obj = as_object(v, "condition");

    if (auto it = obj.find("and"); it != obj.end()) {
        return MakeAnd(parse_children(it->value(), "and"));
    }
    if (auto it = obj.find("or"); it != obj.end()) {
        return MakeOr(parse_children(it->value(), "or"));
    }
    if (auto it = obj.find("not"); it != obj.end()) {
        return MakeNot(ParseCondition(it->value()));
    }
    if (auto it = obj.find("always"); it != obj.end()) {
        if (!it->value().is_bool()) throw ValidationError("'always' must be a boolean");
        return MakeAlways(it->value().get_bool());
    }

    auto key = require<std::string>(obj, "key");
    auto op = ParseOperator(get_or<std::string>(obj, "operator", "exists"));
    json::value expected;
    if (auto it = obj.find("value"); it != obj.end()) {
        expected = it->value();
    } else if (op != ConditionOperator::Exists && op != ConditionOperator::NotExists) {
        throw ValidationError("condition on '" + key + "' with operator " + ToString(op) +
                              " needs a 'value'");
    }
    return MakeValueCondition(std::move(key), std::move(expected), op);
}

// =========================================================
//  Graph Parser
// =========================================================

GraphPtr ParseGraph(const json::object& o, const NodeBindings& bindings) {
    const json::object& graph_obj = require<json::object>(o, "graph");
    const json::array& nodes_arr = require<json::array>(graph_obj, "nodes");
    const json::array edges_arr = get_or<json::array>(graph_obj, "edges", {});

    GraphBuilder builder(require<std::string>(graph_obj, "name"), bindings.providers,
                         bindings.tools);
    if (auto id = get_or<std::string>(graph_obj, "id", ""); !id.empty()) {
        builder.SetId(std::move(id));
    }
    builder.SetDescription(get_or<std::string>(graph_obj, "description", ""));

    // --- Phase 1: Create Nodes ---
    auto& factory = NodeFactory::Instance();
    for (const auto& v : nodes_arr) {
        const auto& node_obj = as_object(v, "node");

        std::string id = require<std::string>(node_obj, "id");
        std::string type = require<std::string>(node_obj, "type");
        std::string name = get_or<std::string>(node_obj, "name", id);
        json::object data = get_or<json::object>(node_obj, "data", {});

        try {
            builder.AddNode(factory.Create(type, id, name, data, bindings));
        } catch (const ValidationError& e) {
            throw ValidationError("node " + id + ": " + e.what());
        }
    }

    // --- Phase 2: Entry & Exit Points ---
    builder.SetEntryPoint(require<std::string>(graph_obj, "entry_point"));
    for (const auto& exit_id : require<std::vector<std::string>>(graph_obj, "exit_points")) {
        builder.AddExitPoint(exit_id);
    }

    // --- Phase 3: Link Edges ---
    for (const auto& v : edges_arr) {
        builder.AddEdge(parse_edge(as_object(v, "edge")));
    }

    auto graph = builder.Build();
    spdlog::info("Parsed graph '{}' ({} nodes, {} edges)", graph->name(), graph->NodeCount(),
                 graph->EdgeCount());
    return graph;
}

json::value ReadJsonFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ValidationError("cannot open " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    boost::system::error_code ec;
    json::value doc = json::parse(buffer.str(), ec);
    if (ec) {
        throw ValidationError("invalid JSON in " + path + ": " + ec.message());
    }
    return doc;
}

}  // namespace flowgraph
