#pragma once

#include "common/errors.hpp"
#include "graph/mode.hpp"

#include <cstddef>
#include <vector>

namespace holes {

// ─── GraphAdapter ──────────────────────────────────────────────
// Read-only view of a graph, the only thing the metric engines see.
// Implementations must be side-effect free on every query so that
// concurrent reads of an unmutated graph are safe.

class GraphAdapter {
public:
    virtual ~GraphAdapter() = default;

    /// All vertex ids, ascending.
    virtual std::vector<NodeId> vertices() const = 0;
    virtual bool hasVertex(NodeId id) const = 0;
    virtual size_t vertexCount() const = 0;

    /// Neighbors of `id` under `mode`, ascending and without duplicates.
    /// Both → union of in- and out-neighbors. A self-loop makes `id`
    /// appear in its own list; callers filter it.
    virtual std::vector<NodeId> neighbors(NodeId id, Mode mode) const = 0;

    /// Edge existence. For undirected graphs hasEdge(a, b) == hasEdge(b, a).
    virtual bool hasEdge(NodeId source, NodeId target) const = 0;

    virtual bool isWeighted() const = 0;
    virtual bool isDirected() const = 0;

    /// Raw stored weight of source→target, 0.0 when there is no such edge.
    /// The value is returned as stored; sign checks belong to the reader.
    virtual double weight(NodeId source, NodeId target) const = 0;
};

} // namespace holes
