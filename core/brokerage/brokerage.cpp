#include "brokerage/brokerage.hpp"

namespace holes {

std::string roleName(Role role) {
    switch (role) {
        case Role::Coordinator:    return "coordinator";
        case Role::Gatekeeper:     return "gatekeeper";
        case Role::Representative: return "representative";
        case Role::Liaison:        return "liaison";
        case Role::Cosmopolitan:   return "cosmopolitan";
    }
    return "unknown";
}

// ─── BrokerageProfile ──────────────────────────────────────────

size_t BrokerageProfile::count(Role role) const {
    switch (role) {
        case Role::Coordinator:    return coordinator;
        case Role::Gatekeeper:     return gatekeeper;
        case Role::Representative: return representative;
        case Role::Liaison:        return liaison;
        case Role::Cosmopolitan:   return cosmopolitan;
    }
    return 0;
}

void BrokerageProfile::add(Role role) {
    switch (role) {
        case Role::Coordinator:    coordinator++; break;
        case Role::Gatekeeper:     gatekeeper++; break;
        case Role::Representative: representative++; break;
        case Role::Liaison:        liaison++; break;
        case Role::Cosmopolitan:   cosmopolitan++; break;
    }
}

size_t BrokerageProfile::total() const {
    return coordinator + gatekeeper + representative + liaison + cosmopolitan;
}

// ─── Triad enumeration ─────────────────────────────────────────

void forEachBrokeragePair(const GraphAdapter& g, NodeId ego, const BrokerageConfig& config,
                          const std::function<void(NodeId, NodeId)>& fn) {
    std::vector<NodeId> outs = g.neighbors(ego, Mode::Out);
    for (NodeId in : g.neighbors(ego, Mode::In)) {
        if (in == ego) continue;
        for (NodeId out : outs) {
            if (out == ego || out == in) continue;
            if (config.open_triads_only && g.hasEdge(in, out)) continue;
            fn(in, out);
        }
    }
}

namespace detail {

std::unordered_map<NodeId, size_t> vertexPositions(const GraphAdapter& g) {
    std::unordered_map<NodeId, size_t> positions;
    size_t k = 0;
    for (NodeId v : g.vertices()) {
        positions[v] = k++;
    }
    return positions;
}

} // namespace detail

} // namespace holes
