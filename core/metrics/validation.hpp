#pragma once

#include "graph/graph_adapter.hpp"

namespace holes {

/// Throws InvalidNodeError if `g` is empty, `i` is non-positive, or `i`
/// is not a vertex of `g`.
void validateNode(const GraphAdapter& g, NodeId i);

void validateNodes(const GraphAdapter& g, NodeId i, NodeId j);

/// Throws InvalidModeError for values outside the three enumerators
/// (only reachable through casts or foreign callers).
void validateMode(Mode mode);

} // namespace holes
