#pragma once

#include "graph/edge.hpp"
#include "graph/graph_adapter.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <set>
#include <vector>

namespace holes {

// ─── GraphKind ─────────────────────────────────────────────────

struct GraphKind {
    bool directed = false;
    bool weighted = false;
};

// ─── Graph ─────────────────────────────────────────────────────
// In-memory simple graph: at most one edge per ordered pair
// (directed) or unordered pair (undirected). Self-loops allowed.
// Adjacency is kept in ordered maps so every query returns ids in
// ascending order, which keeps metric sums reproducible.
//
// Weights are stored exactly as given, negative ones included; the
// metric engines reject them when they read them.

class Graph : public GraphAdapter {
public:
    explicit Graph(GraphKind kind = {});

    /// Graph with vertices 1..n.
    Graph(size_t n, GraphKind kind);

    static Graph undirected(size_t n = 0) { return Graph(n, {false, false}); }
    static Graph directed(size_t n = 0) { return Graph(n, {true, false}); }
    static Graph weightedUndirected(size_t n = 0) { return Graph(n, {false, true}); }
    static Graph weightedDirected(size_t n = 0) { return Graph(n, {true, true}); }

    // ── Vertex operations ──
    NodeId addNode();
    NodeId addNodeWithId(NodeId id);
    bool removeNode(NodeId id);

    // ── Edge operations ──
    /// Returns false if the edge already exists (weight left unchanged).
    bool addEdge(NodeId source, NodeId target, double weight = 1.0);
    bool removeEdge(NodeId source, NodeId target);
    /// Overwrite the weight of an existing edge. Returns false if absent.
    bool setWeight(NodeId source, NodeId target, double weight);
    size_t edgeCount() const { return edge_count_; }
    std::vector<Edge> edges() const;

    // ── Adjacency queries ──
    std::vector<NodeId> outNeighbors(NodeId id) const;
    std::vector<NodeId> inNeighbors(NodeId id) const;
    std::vector<NodeId> allNeighbors(NodeId id) const;

    // ── GraphAdapter ──
    std::vector<NodeId> vertices() const override;
    bool hasVertex(NodeId id) const override { return vertices_.count(id) > 0; }
    size_t vertexCount() const override { return vertices_.size(); }
    std::vector<NodeId> neighbors(NodeId id, Mode mode) const override;
    bool hasEdge(NodeId source, NodeId target) const override;
    bool isWeighted() const override { return kind_.weighted; }
    bool isDirected() const override { return kind_.directed; }
    double weight(NodeId source, NodeId target) const override;

    /// Copy without any self-loop edges.
    Graph withoutSelfLoops() const;

    // ── Iteration ──
    void forEachEdge(const std::function<void(const Edge&)>& fn) const;

private:
    using Adjacency = std::map<NodeId, std::map<NodeId, double>>;

    void requireVertex(NodeId id, const char* role) const;

    GraphKind kind_;
    NodeId next_node_id_ = 1;
    size_t edge_count_ = 0;

    std::set<NodeId> vertices_;

    // node → (neighbor → weight). Undirected edges are mirrored into
    // both maps of both endpoints.
    Adjacency outgoing_;
    Adjacency incoming_;
};

} // namespace holes
