#pragma once

namespace flowgraph {

/**
 * @brief Registers all built-in node types (start, end, llm, tool, function,
 * conditional) into the NodeFactory instance.
 * Must be called before parsing graph definitions; repeated calls are harmless.
 */
void RegisterBuiltinNodes();

}  // namespace flowgraph
