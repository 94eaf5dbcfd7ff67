#pragma once

#include <string>
#include "compiler.hpp"
#include "node.hpp"

namespace mutagen {

/// Serialize a node tree to JSON
/// Shared nodes are written out at every place they occur.
/// @param root The root node index
/// @param arena The arena containing all nodes
/// @return JSON string representing the tree structure
std::string serialize_nodes_json(NodeIndex root, const NodeArena& arena);

/// Serialize a compiled grammar to JSON
/// @return JSON object with statistics and the flat node table
std::string serialize_compiled_json(const CompiledGrammar& grammar);

} // namespace mutagen
