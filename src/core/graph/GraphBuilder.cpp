#include "GraphBuilder.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

#include "Errors.hpp"
#include "Ids.hpp"

namespace flowgraph {

GraphBuilder::GraphBuilder(std::string name, std::shared_ptr<ProviderRegistry> providers,
                           std::shared_ptr<ToolRegistry> tools)
    : graph_(std::make_shared<Graph>(util::NewId(), std::move(name))),
      providers_(std::move(providers)),
      tools_(std::move(tools)) {}

GraphBuilder& GraphBuilder::SetId(std::string id) {
    graph_->SetId(std::move(id));
    return *this;
}

GraphBuilder& GraphBuilder::SetDescription(std::string description) {
    graph_->SetDescription(std::move(description));
    return *this;
}

// =========================================================
//  Nodes
// =========================================================

GraphBuilder& GraphBuilder::AddStartNode(const std::string& id, const std::string& name,
                                         json::object initial_data) {
    AddNode(std::make_shared<StartNode>(id, name, std::move(initial_data)));
    graph_->SetEntryPoint(id);
    current_ = id;
    return *this;
}

GraphBuilder& GraphBuilder::AddEndNode(const std::string& id, const std::string& name,
                                       Finalizer finalizer) {
    AddNode(std::make_shared<EndNode>(id, name, std::move(finalizer)));
    graph_->AddExitPoint(id);
    return *this;
}

GraphBuilder& GraphBuilder::AddLlmNode(const std::string& id, const std::string& name,
                                       LlmNodeConfig config) {
    return AddNode(std::make_shared<LlmNode>(id, name, std::move(config), providers_));
}

GraphBuilder& GraphBuilder::AddToolNode(const std::string& id, const std::string& name,
                                        const std::string& tool_name,
                                        std::vector<std::string> input_keys,
                                        const std::string& output_key) {
    return AddNode(
        std::make_shared<ToolNode>(id, name, tool_name, std::move(input_keys), output_key, tools_));
}

GraphBuilder& GraphBuilder::AddFunctionNode(const std::string& id, const std::string& name,
                                            Transform fn) {
    return AddNode(std::make_shared<FunctionNode>(id, name, std::move(fn)));
}

GraphBuilder& GraphBuilder::AddConditionalNode(const std::string& id, const std::string& name,
                                               NodePredicate predicate) {
    return AddNode(std::make_shared<ConditionalNode>(id, name, std::move(predicate)));
}

GraphBuilder& GraphBuilder::AddConditionalNode(const std::string& id, const std::string& name,
                                               ConditionPtr condition) {
    return AddNode(std::make_shared<ConditionalNode>(id, name, std::move(condition)));
}

GraphBuilder& GraphBuilder::AddNode(NodePtr node) {
    try {
        graph_->AddNode(std::move(node));
    } catch (const ValidationError& e) {
        spdlog::debug("GraphBuilder [{}]: {}", graph_->name(), e.what());
        errors_.emplace_back(e.what());
    }
    return *this;
}

GraphBuilder& GraphBuilder::SetEntryPoint(const std::string& id) {
    graph_->SetEntryPoint(id);
    return *this;
}

GraphBuilder& GraphBuilder::AddExitPoint(const std::string& id) {
    graph_->AddExitPoint(id);
    return *this;
}

// =========================================================
//  Edges & Cursor
// =========================================================

void GraphBuilder::RequireCursor(const char* method) const {
    if (current_.empty()) {
        throw std::logic_error(std::string(method) + ": no current node set, use From() first");
    }
}

GraphBuilder& GraphBuilder::ConnectTo(const std::string& target_id) {
    RequireCursor("ConnectTo");

    Edge edge;
    edge.from = current_;
    edge.to = target_id;
    edge.label = current_ + " -> " + target_id;
    graph_->AddEdge(std::move(edge));

    current_ = target_id;
    return *this;
}

GraphBuilder& GraphBuilder::ConnectToIf(const std::string& target_id, ConditionPtr condition) {
    RequireCursor("ConnectToIf");
    if (!condition) {
        errors_.push_back("conditional edge " + current_ + " -> " + target_id +
                          " has no condition");
        return *this;
    }

    Edge edge;
    edge.from = current_;
    edge.to = target_id;
    edge.label = condition->description();
    edge.condition = std::move(condition);
    graph_->AddEdge(std::move(edge));
    return *this;
}

GraphBuilder& GraphBuilder::From(const std::string& node_id) {
    current_ = node_id;
    return *this;
}

GraphBuilder& GraphBuilder::AddEdge(Edge edge) {
    graph_->AddEdge(std::move(edge));
    return *this;
}

// =========================================================
//  Build
// =========================================================

GraphPtr GraphBuilder::Build() {
    try {
        if (!errors_.empty()) {
            throw ValidationError(errors_.front());
        }
        graph_->Validate();
    } catch (const ValidationError& e) {
        throw ValidationError(std::string("graph validation failed: ") + e.what());
    }

    if (auto unreachable = graph_->UnreachableNodes(); !unreachable.empty()) {
        for (const auto& id : unreachable) {
            spdlog::warn("Graph [{}]: node {} is unreachable from entry point {}", graph_->name(),
                         id, graph_->entry_point());
        }
    }

    spdlog::debug("Graph [{}] built: {} nodes, {} edges", graph_->id(), graph_->NodeCount(),
                  graph_->EdgeCount());
    return graph_;
}

}  // namespace flowgraph
