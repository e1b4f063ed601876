#pragma once

#include <memory>
#include <string>
#include <unordered_map>

#include "Collaborators.hpp"
#include "Errors.hpp"
#include "Nodes.hpp"
#include "types.hpp"

namespace flowgraph {

/**
 * @brief Native code a declarative graph definition can refer to by name.
 *
 * Provider and tool registries are shared with the nodes built from them;
 * functions, predicates and finalizers are copied into their nodes.
 */
struct NodeBindings {
    std::shared_ptr<ProviderRegistry> providers;
    std::shared_ptr<ToolRegistry> tools;
    std::unordered_map<std::string, Transform> functions;
    std::unordered_map<std::string, NodePredicate> predicates;
    std::unordered_map<std::string, Finalizer> finalizers;
};

// Function signature for creating a node
using NodeCreator = NodePtr (*)(const std::string& id, const std::string& name,
                                const json::object& data, const NodeBindings& bindings);

/**
 * @brief Singleton factory for creating Node instances by string type.
 * Used during graph parsing to instantiate specific node implementations.
 */
class NodeFactory {
public:
    static NodeFactory& Instance() {
        static NodeFactory instance;
        return instance;
    }

    // Register a new node type with its creator function
    void Register(const std::string& type, NodeCreator creator) { creators_[type] = creator; }

    bool Contains(const std::string& type) const { return creators_.contains(type); }

    // @throws ValidationError for an unregistered type.
    NodePtr Create(const std::string& type, const std::string& id, const std::string& name,
                   const json::object& data, const NodeBindings& bindings) const {
        auto it = creators_.find(type);
        if (it == creators_.end()) {
            throw ValidationError("unknown node type: " + type);
        }
        return (it->second)(id, name, data, bindings);
    }

private:
    std::unordered_map<std::string, NodeCreator> creators_;
    NodeFactory() = default;
};

}  // namespace flowgraph
