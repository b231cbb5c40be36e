#include "common/errors.hpp"
#include <sstream>

namespace holes {

namespace {

std::string negativeWeightMessage(NodeId source, NodeId target, double weight) {
    std::ostringstream ss;
    ss << "Edge weight must be non-negative, got weight=" << weight
       << " for edge (" << source << ", " << target << ")";
    return ss.str();
}

} // namespace

NegativeWeightError::NegativeWeightError(NodeId source, NodeId target, double weight)
    : std::domain_error(negativeWeightMessage(source, target, weight)),
      source_(source), target_(target), weight_(weight) {}

} // namespace holes
