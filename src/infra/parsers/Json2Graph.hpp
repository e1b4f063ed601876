#pragma once

#include <string>

#include "Condition.hpp"
#include "Graph.hpp"
#include "NodeFactory.hpp"
#include "types.hpp"

namespace flowgraph {

/**
 * @brief Parses a graph definition into a validated Graph.
 * @param o        The root JSON object containing the "graph" definition.
 * @param bindings Native functions, predicates, finalizers and registries
 *                 the definition refers to by name.
 * @return         The built graph, exactly as GraphBuilder::Build() hands it out.
 * @throws         ValidationError on missing keys, unknown node types or names,
 *                 and on any Graph::Validate() failure.
 *
 * Node types must have been registered (see RegisterBuiltinNodes()).
 */
GraphPtr ParseGraph(const json::object& o, const NodeBindings& bindings);

/**
 * @brief Parses a JSON condition.
 *
 * Forms: {"key", "operator", "value"?}, {"and": [..]}, {"or": [..]},
 * {"not": {..}}, {"always": bool}. "operator" defaults to "exists".
 * @throws ValidationError
 */
ConditionPtr ParseCondition(const json::value& v);

// Reads and parses a JSON document from disk. @throws ValidationError
json::value ReadJsonFile(const std::string& path);

}  // namespace flowgraph
