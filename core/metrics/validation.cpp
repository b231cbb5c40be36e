#include "metrics/validation.hpp"
#include "common/errors.hpp"

#include <string>

namespace holes {

void validateNode(const GraphAdapter& g, NodeId i) {
    if (g.vertexCount() == 0) {
        throw InvalidNodeError(i, "Graph has no vertices, cannot look up node " + std::to_string(i));
    }
    if (i <= 0) {
        throw InvalidNodeError(i, "Node index must be positive, got " + std::to_string(i));
    }
    if (!g.hasVertex(i)) {
        throw InvalidNodeError(i, "Node " + std::to_string(i) + " is not in the graph");
    }
}

void validateNodes(const GraphAdapter& g, NodeId i, NodeId j) {
    validateNode(g, i);
    validateNode(g, j);
}

void validateMode(Mode mode) {
    switch (mode) {
        case Mode::Both:
        case Mode::Out:
        case Mode::In:
            return;
    }
    throw InvalidModeError("mode must be both, out, or in, got " +
                           std::to_string(static_cast<int>(mode)));
}

} // namespace holes
