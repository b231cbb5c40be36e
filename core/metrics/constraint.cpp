#include "metrics/constraint.hpp"
#include "metrics/investment.hpp"
#include "metrics/validation.hpp"

namespace holes {

double dyadicConstraint(const GraphAdapter& g, NodeId i, NodeId j, Mode mode) {
    validateNodes(g, i, j);
    validateMode(mode);

    double c = investment(g, i, j, mode) + investmentSum(g, i, j, mode);
    return c * c;
}

double dyadicConstraint(const GraphAdapter& g, const Edge& e, Mode mode) {
    return dyadicConstraint(g, e.source, e.target, mode);
}

double constraint(const GraphAdapter& g, NodeId i, Mode mode) {
    validateNode(g, i);
    validateMode(mode);

    detail::InvestmentCache cache = detail::buildInvestmentCache(g, i, mode);

    double total = 0.0;
    for (NodeId j : cache.alters) {
        double c = cache.direct.at(j) + detail::investmentSum(cache, g, j);
        total += c * c;
    }
    return total;
}

std::map<NodeId, double> constraints(const GraphAdapter& g, Mode mode) {
    validateMode(mode);

    std::map<NodeId, double> result;
    for (NodeId v : g.vertices()) {
        result[v] = constraint(g, v, mode);
    }
    return result;
}

} // namespace holes
