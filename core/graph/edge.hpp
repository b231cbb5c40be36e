#pragma once

#include "common/errors.hpp"

namespace holes {

/// A tie source → target. Undirected graphs report each edge once,
/// with source <= target.
struct Edge {
    NodeId source = 0;
    NodeId target = 0;
    double weight = 1.0;

    Edge() = default;
    Edge(NodeId source, NodeId target, double weight = 1.0)
        : source(source), target(target), weight(weight) {}

    bool isSelfLoop() const { return source == target; }
};

} // namespace holes
