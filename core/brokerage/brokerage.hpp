#pragma once

#include "common/errors.hpp"
#include "graph/graph_adapter.hpp"
#include "metrics/validation.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace holes {

// ─── Gould–Fernandez brokerage ─────────────────────────────────
// For a triad in → ego → out, the role ego plays depends only on
// which of the three group labels coincide. Labels may be any type
// with operator==; nothing else is required of them.

enum class Role {
    Coordinator,     // in, ego, out all in one group
    Gatekeeper,      // ego == out != in: admits outsiders' flow into its group
    Representative,  // ego == in != out: carries its group's flow outward
    Liaison,         // in == out != ego: mediates for another group
    Cosmopolitan     // three distinct groups
};

std::string roleName(Role role);

/// Role counts for one ego.
struct BrokerageProfile {
    size_t coordinator = 0;
    size_t gatekeeper = 0;
    size_t representative = 0;
    size_t liaison = 0;
    size_t cosmopolitan = 0;

    size_t count(Role role) const;
    void add(Role role);
    size_t total() const;
};

struct BrokerageConfig {
    /// Only count in → ego → out when there is no direct tie in → out.
    bool open_triads_only = true;
};

/// Coordinator is tested first, then gatekeeper, representative and
/// liaison; anything left is cosmopolitan.
template <class Label>
Role classifyRole(const Label& ego, const Label& in, const Label& out) {
    if (ego == in && in == out) return Role::Coordinator;
    if (ego == out && !(ego == in)) return Role::Gatekeeper;
    if (ego == in && !(ego == out)) return Role::Representative;
    if (in == out && !(in == ego)) return Role::Liaison;
    return Role::Cosmopolitan;
}

/// Calls fn(in, out) for each in-neighbor / out-neighbor pair of ego
/// that forms a brokerage triad: neither is ego, in != out, and with
/// open_triads_only set there is no edge in → out.
void forEachBrokeragePair(const GraphAdapter& g, NodeId ego, const BrokerageConfig& config,
                          const std::function<void(NodeId, NodeId)>& fn);

namespace detail {

/// Vertex id → its position in g.vertices().
std::unordered_map<NodeId, size_t> vertexPositions(const GraphAdapter& g);

template <class Lookup>
BrokerageProfile tallyRoles(const GraphAdapter& g, NodeId ego, const BrokerageConfig& config,
                            const Lookup& groupOf) {
    BrokerageProfile profile;
    // copy: lookups may yield a value (std::vector<bool>) rather than a reference
    auto ego_group = groupOf(ego);
    forEachBrokeragePair(g, ego, config, [&](NodeId in, NodeId out) {
        profile.add(classifyRole(ego_group, groupOf(in), groupOf(out)));
    });
    return profile;
}

} // namespace detail

// ─── Group assignments ─────────────────────────────────────────
// Either a vector aligned with g.vertices() (ascending ids) or a map
// keyed by vertex id. Malformed input throws InvalidGroupsError.

template <class Label>
void validateGroups(const GraphAdapter& g, const std::vector<Label>& groups) {
    if (groups.size() != g.vertexCount()) {
        throw InvalidGroupsError("Group vector length (" + std::to_string(groups.size()) +
                                 ") does not match number of vertices (" +
                                 std::to_string(g.vertexCount()) + ")");
    }
}

template <class Label>
void validateGroups(const GraphAdapter& g, const std::map<NodeId, Label>& groups) {
    for (NodeId v : g.vertices()) {
        if (!groups.count(v)) {
            throw InvalidGroupsError("Vertex " + std::to_string(v) +
                                     " is missing from groups map");
        }
    }
}

/// Map form → vector form, ordered like g.vertices().
template <class Label>
std::vector<Label> groupsToVector(const GraphAdapter& g, const std::map<NodeId, Label>& groups) {
    validateGroups(g, groups);
    std::vector<Label> result;
    result.reserve(g.vertexCount());
    for (NodeId v : g.vertices()) {
        result.push_back(groups.at(v));
    }
    return result;
}

/// Relabel to 0, 1, 2, ... in order of first occurrence.
/// Linear scan over the labels seen so far, O(n·k) for k distinct
/// labels; only operator== is required of Label.
template <class Label>
std::vector<int> groupsToIntegerLabels(const std::vector<Label>& groups) {
    std::vector<Label> seen;
    std::vector<int> result;
    result.reserve(groups.size());
    for (const Label& label : groups) {
        size_t k = 0;
        while (k < seen.size() && !(seen[k] == label)) k++;
        if (k == seen.size()) seen.push_back(label);
        result.push_back(static_cast<int>(k));
    }
    return result;
}

// ─── Role tallies ──────────────────────────────────────────────

template <class Label>
BrokerageProfile brokerage(const GraphAdapter& g, const std::vector<Label>& groups, NodeId ego,
                           const BrokerageConfig& config = {}) {
    validateGroups(g, groups);
    validateNode(g, ego);
    auto positions = detail::vertexPositions(g);
    return detail::tallyRoles(g, ego, config, [&](NodeId v) -> decltype(auto) {
        return groups[positions.at(v)];
    });
}

template <class Label>
BrokerageProfile brokerage(const GraphAdapter& g, const std::map<NodeId, Label>& groups, NodeId ego,
                           const BrokerageConfig& config = {}) {
    validateGroups(g, groups);
    validateNode(g, ego);
    return detail::tallyRoles(g, ego, config, [&](NodeId v) -> decltype(auto) {
        return groups.at(v);
    });
}

template <class Label>
std::map<NodeId, BrokerageProfile> classifyBrokerage(const GraphAdapter& g,
                                                     const std::vector<Label>& groups,
                                                     const BrokerageConfig& config = {}) {
    validateGroups(g, groups);
    auto positions = detail::vertexPositions(g);
    auto groupOf = [&](NodeId v) -> decltype(auto) { return groups[positions.at(v)]; };

    std::map<NodeId, BrokerageProfile> result;
    for (NodeId v : g.vertices()) {
        result[v] = detail::tallyRoles(g, v, config, groupOf);
    }
    return result;
}

template <class Label>
std::map<NodeId, BrokerageProfile> classifyBrokerage(const GraphAdapter& g,
                                                     const std::map<NodeId, Label>& groups,
                                                     const BrokerageConfig& config = {}) {
    validateGroups(g, groups);
    auto groupOf = [&](NodeId v) -> decltype(auto) { return groups.at(v); };

    std::map<NodeId, BrokerageProfile> result;
    for (NodeId v : g.vertices()) {
        result[v] = detail::tallyRoles(g, v, config, groupOf);
    }
    return result;
}

} // namespace holes
