#include "metrics/investment.hpp"
#include "metrics/validation.hpp"
#include "common/errors.hpp"

namespace holes {

namespace detail {

double tie(const GraphAdapter& g, NodeId source, NodeId target, bool weighted) {
    if (!g.hasEdge(source, target)) return 0.0;
    if (!weighted) return 1.0;

    double w = g.weight(source, target);
    if (!(w >= 0.0)) {  // negative or NaN
        throw NegativeWeightError(source, target, w);
    }
    return w;
}

double modeTie(const GraphAdapter& g, NodeId i, NodeId k, Mode mode, bool weighted) {
    switch (mode) {
        case Mode::Both: return tie(g, i, k, weighted) + tie(g, k, i, weighted);
        case Mode::Out:  return tie(g, i, k, weighted);
        case Mode::In:   return tie(g, k, i, weighted);
    }
    validateMode(mode);
    return 0.0;
}

double investmentDenominator(const GraphAdapter& g, NodeId i, Mode mode, bool weighted) {
    double total = 0.0;
    for (NodeId k : g.neighbors(i, mode)) {
        if (k == i) continue;  // self-loop
        total += modeTie(g, i, k, mode, weighted);
    }
    return total;
}

double investmentUnchecked(const GraphAdapter& g, NodeId i, NodeId j, Mode mode, bool weighted) {
    if (i == j) return 0.0;

    double denom = investmentDenominator(g, i, mode, weighted);
    if (denom == 0.0) return 0.0;
    return modeTie(g, i, j, mode, weighted) / denom;
}

// ─── InvestmentCache ───────────────────────────────────────────

double InvestmentCache::denominator(const GraphAdapter& g, NodeId q) {
    auto it = denominators.find(q);
    if (it != denominators.end()) return it->second;

    double denom = investmentDenominator(g, q, mode, weighted);
    denominators.emplace(q, denom);
    return denom;
}

InvestmentCache buildInvestmentCache(const GraphAdapter& g, NodeId ego, Mode mode) {
    InvestmentCache cache;
    cache.ego = ego;
    cache.mode = mode;
    cache.weighted = g.isWeighted();

    for (NodeId j : g.neighbors(ego, mode)) {
        if (j != ego) cache.alters.push_back(j);
    }
    if (cache.alters.empty()) return cache;

    double denom = cache.denominator(g, ego);
    for (NodeId j : cache.alters) {
        cache.direct[j] = denom == 0.0 ? 0.0 : modeTie(g, ego, j, mode, cache.weighted) / denom;
    }
    return cache;
}

double investmentSum(InvestmentCache& cache, const GraphAdapter& g, NodeId j) {
    double c = 0.0;
    for (NodeId q : cache.alters) {
        if (q == j) continue;

        // p_qj, same arithmetic as investmentUnchecked(q, j)
        double denom = cache.denominator(g, q);
        double p_qj = denom == 0.0 ? 0.0 : modeTie(g, q, j, cache.mode, cache.weighted) / denom;
        c += cache.direct.at(q) * p_qj;
    }
    return c;
}

} // namespace detail

// ─── Public API ────────────────────────────────────────────────

double investment(const GraphAdapter& g, NodeId i, NodeId j, Mode mode) {
    validateNodes(g, i, j);
    validateMode(mode);
    return detail::investmentUnchecked(g, i, j, mode, g.isWeighted());
}

double investmentSum(const GraphAdapter& g, NodeId i, NodeId j, Mode mode) {
    validateNodes(g, i, j);
    validateMode(mode);

    std::vector<NodeId> intermediaries;
    for (NodeId q : g.neighbors(i, mode)) {
        if (q != i && q != j) intermediaries.push_back(q);
    }
    if (intermediaries.empty()) return 0.0;

    // p_iq shares i's denominator; same arithmetic as investmentUnchecked(i, q)
    bool weighted = g.isWeighted();
    double denom = detail::investmentDenominator(g, i, mode, weighted);
    double c = 0.0;
    for (NodeId q : intermediaries) {
        double p_iq = denom == 0.0 ? 0.0 : detail::modeTie(g, i, q, mode, weighted) / denom;
        c += p_iq * detail::investmentUnchecked(g, q, j, mode, weighted);
    }
    return c;
}

} // namespace holes
