#pragma once

#include "graph/edge.hpp"
#include "graph/graph_adapter.hpp"

#include <map>

namespace holes {

// ─── Burt's network constraint ─────────────────────────────────
//
//   c_ij = (p_ij + Σ_q p_iq · p_qj)²          dyadic constraint
//   C_i  = Σ_{j ∈ N(i)} c_ij                  constraint
//
// N(i) = neighbors(i, mode) minus i. High C_i means i's contacts are
// redundant (few structural holes); an isolated node scores 0.

/// Dyadic constraint of j on i. 0 when i and j are not tied under `mode`
/// and share no intermediary.
double dyadicConstraint(const GraphAdapter& g, NodeId i, NodeId j, Mode mode = Mode::Both);

/// Same as dyadicConstraint(g, e.source, e.target, mode).
double dyadicConstraint(const GraphAdapter& g, const Edge& e, Mode mode = Mode::Both);

/// Total constraint on i. Builds one investment cache per call so the
/// sum over all alter pairs costs O(d²) investment evaluations instead
/// of O(d³); the result equals Σ_j dyadicConstraint(g, i, j, mode).
double constraint(const GraphAdapter& g, NodeId i, Mode mode = Mode::Both);

/// constraint() for every vertex, keyed by vertex id.
std::map<NodeId, double> constraints(const GraphAdapter& g, Mode mode = Mode::Both);

} // namespace holes
