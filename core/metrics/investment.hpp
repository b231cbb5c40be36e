#pragma once

#include "graph/graph_adapter.hpp"

#include <unordered_map>
#include <vector>

namespace holes {

// ─── Proportional investment ───────────────────────────────────
// p_ij: the share of i's total tie strength (under `mode`) that goes
// to j. With t(a,b) the tie value of a→b (0 absent, 1 unweighted,
// w(a,b) weighted):
//
//   Both: p_ij = (t(i,j) + t(j,i)) / Σ_k (t(i,k) + t(k,i))
//   Out:  p_ij =  t(i,j)           / Σ_k  t(i,k)
//   In:   p_ij =  t(j,i)           / Σ_k  t(k,i)
//
// k ranges over neighbors(i, mode) minus i. A zero denominator gives 0.
// Throws NegativeWeightError as soon as a negative weight is read.

double investment(const GraphAdapter& g, NodeId i, NodeId j, Mode mode = Mode::Both);

/// Indirect investment Σ_q p_iq · p_qj over q ∈ neighbors(i, mode),
/// q ≠ i, q ≠ j: the strength of all 2-paths i → q → j.
double investmentSum(const GraphAdapter& g, NodeId i, NodeId j, Mode mode = Mode::Both);

namespace detail {

/// Tie value of source→target.
double tie(const GraphAdapter& g, NodeId source, NodeId target, bool weighted);

/// Mode-selected combination of t(i,k) and t(k,i).
double modeTie(const GraphAdapter& g, NodeId i, NodeId k, Mode mode, bool weighted);

double investmentDenominator(const GraphAdapter& g, NodeId i, Mode mode, bool weighted);

/// investment() without validation; inputs must already be checked.
double investmentUnchecked(const GraphAdapter& g, NodeId i, NodeId j, Mode mode, bool weighted);

/// Per-call memo for one constraint(ego, mode) evaluation. Holds
/// p_ego,j for every alter j and, filled lazily, the investment
/// denominator of every intermediary seen so far. Never shared.
struct InvestmentCache {
    NodeId ego = 0;
    Mode mode = Mode::Both;
    bool weighted = false;
    std::vector<NodeId> alters;                      // neighbors(ego, mode) \ {ego}
    std::unordered_map<NodeId, double> direct;       // j → p_ego,j
    std::unordered_map<NodeId, double> denominators; // q → Σ_k modeTie(q, k)

    double denominator(const GraphAdapter& g, NodeId q);
};

InvestmentCache buildInvestmentCache(const GraphAdapter& g, NodeId ego, Mode mode);

/// investmentSum(ego, j) reading p_ego,q from the cache.
double investmentSum(InvestmentCache& cache, const GraphAdapter& g, NodeId j);

} // namespace detail

} // namespace holes
