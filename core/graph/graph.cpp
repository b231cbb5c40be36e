#include "graph/graph.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <string>

namespace holes {

Graph::Graph(GraphKind kind) : kind_(kind) {}

Graph::Graph(size_t n, GraphKind kind) : kind_(kind) {
    for (size_t i = 0; i < n; i++) {
        addNode();
    }
}

void Graph::requireVertex(NodeId id, const char* role) const {
    if (!vertices_.count(id)) {
        throw std::runtime_error(std::string(role) + " node not found: " + std::to_string(id));
    }
}

// ─── Vertex operations ─────────────────────────────────────────

NodeId Graph::addNode() {
    NodeId id = next_node_id_;
    return addNodeWithId(id);
}

NodeId Graph::addNodeWithId(NodeId id) {
    if (id <= 0) {
        throw InvalidNodeError(id, "Node index must be positive, got " + std::to_string(id));
    }
    if (vertices_.count(id)) {
        throw std::runtime_error("Node ID already exists: " + std::to_string(id));
    }
    vertices_.insert(id);
    outgoing_[id];
    incoming_[id];
    if (id >= next_node_id_) {
        next_node_id_ = id + 1;
    }
    return id;
}

bool Graph::removeNode(NodeId id) {
    if (!vertices_.count(id)) return false;

    std::vector<std::pair<NodeId, NodeId>> edges_to_remove;
    for (const auto& [target, _] : outgoing_[id]) {
        edges_to_remove.emplace_back(id, target);
    }
    if (kind_.directed) {
        for (const auto& [source, _] : incoming_[id]) {
            if (source != id) edges_to_remove.emplace_back(source, id);
        }
    }
    for (const auto& [source, target] : edges_to_remove) {
        removeEdge(source, target);
    }

    outgoing_.erase(id);
    incoming_.erase(id);
    vertices_.erase(id);
    return true;
}

// ─── Edge operations ───────────────────────────────────────────

bool Graph::addEdge(NodeId source, NodeId target, double weight) {
    requireVertex(source, "Source");
    requireVertex(target, "Target");
    if (hasEdge(source, target)) return false;

    outgoing_[source][target] = weight;
    incoming_[target][source] = weight;
    if (!kind_.directed) {
        outgoing_[target][source] = weight;
        incoming_[source][target] = weight;
    }
    edge_count_++;
    return true;
}

bool Graph::removeEdge(NodeId source, NodeId target) {
    if (!hasEdge(source, target)) return false;

    outgoing_[source].erase(target);
    incoming_[target].erase(source);
    if (!kind_.directed) {
        outgoing_[target].erase(source);
        incoming_[source].erase(target);
    }
    edge_count_--;
    return true;
}

bool Graph::setWeight(NodeId source, NodeId target, double weight) {
    if (!hasEdge(source, target)) return false;

    outgoing_[source][target] = weight;
    incoming_[target][source] = weight;
    if (!kind_.directed) {
        outgoing_[target][source] = weight;
        incoming_[source][target] = weight;
    }
    return true;
}

std::vector<Edge> Graph::edges() const {
    std::vector<Edge> result;
    result.reserve(edge_count_);
    forEachEdge([&](const Edge& e) { result.push_back(e); });
    return result;
}

// ─── Adjacency queries ────────────────────────────────────────

namespace {

std::vector<NodeId> keysOf(const std::map<NodeId, std::map<NodeId, double>>& adj, NodeId id) {
    auto it = adj.find(id);
    if (it == adj.end()) return {};
    std::vector<NodeId> ids;
    ids.reserve(it->second.size());
    for (const auto& [nid, _] : it->second) {
        ids.push_back(nid);
    }
    return ids;
}

} // namespace

std::vector<NodeId> Graph::outNeighbors(NodeId id) const {
    return keysOf(outgoing_, id);
}

std::vector<NodeId> Graph::inNeighbors(NodeId id) const {
    return keysOf(incoming_, id);
}

std::vector<NodeId> Graph::allNeighbors(NodeId id) const {
    std::vector<NodeId> out = outNeighbors(id);
    if (!kind_.directed) return out;

    std::vector<NodeId> in = inNeighbors(id);
    std::vector<NodeId> merged;
    merged.reserve(out.size() + in.size());
    std::set_union(out.begin(), out.end(), in.begin(), in.end(),
                   std::back_inserter(merged));
    return merged;
}

std::vector<NodeId> Graph::vertices() const {
    return std::vector<NodeId>(vertices_.begin(), vertices_.end());
}

std::vector<NodeId> Graph::neighbors(NodeId id, Mode mode) const {
    switch (mode) {
        case Mode::Both: return allNeighbors(id);
        case Mode::Out:  return outNeighbors(id);
        case Mode::In:   return inNeighbors(id);
    }
    throw InvalidModeError("mode must be both, out, or in, got " +
                           std::to_string(static_cast<int>(mode)));
}

bool Graph::hasEdge(NodeId source, NodeId target) const {
    auto it = outgoing_.find(source);
    if (it == outgoing_.end()) return false;
    return it->second.count(target) > 0;
}

double Graph::weight(NodeId source, NodeId target) const {
    auto it = outgoing_.find(source);
    if (it == outgoing_.end()) return 0.0;
    auto wit = it->second.find(target);
    if (wit == it->second.end()) return 0.0;
    return kind_.weighted ? wit->second : 1.0;
}

Graph Graph::withoutSelfLoops() const {
    Graph copy = *this;
    for (NodeId v : vertices_) {
        copy.removeEdge(v, v);
    }
    return copy;
}

// ─── Iteration ─────────────────────────────────────────────────

void Graph::forEachEdge(const std::function<void(const Edge&)>& fn) const {
    for (const auto& [source, targets] : outgoing_) {
        for (const auto& [target, w] : targets) {
            if (!kind_.directed && target < source) continue;
            fn(Edge(source, target, kind_.weighted ? w : 1.0));
        }
    }
}

} // namespace holes
