#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace holes {

using NodeId = int64_t;

// ─── Error taxonomy ────────────────────────────────────────────
// Every metric entry point throws one of these at the point of
// detection. Nothing is clamped, defaulted or retried.

/// Node id non-positive, absent from the vertex set, or graph empty.
class InvalidNodeError : public std::invalid_argument {
public:
    InvalidNodeError(NodeId node, const std::string& what)
        : std::invalid_argument(what), node_(node) {}

    NodeId node() const { return node_; }

private:
    NodeId node_;
};

/// Mode value outside {both, out, in}.
class InvalidModeError : public std::invalid_argument {
public:
    explicit InvalidModeError(const std::string& what)
        : std::invalid_argument(what) {}
};

/// A negative edge weight was read while evaluating a formula.
class NegativeWeightError : public std::domain_error {
public:
    NegativeWeightError(NodeId source, NodeId target, double weight);

    NodeId source() const { return source_; }
    NodeId target() const { return target_; }
    double weight() const { return weight_; }

private:
    NodeId source_;
    NodeId target_;
    double weight_;
};

/// Malformed group assignment passed to the brokerage classifier.
class InvalidGroupsError : public std::invalid_argument {
public:
    explicit InvalidGroupsError(const std::string& what)
        : std::invalid_argument(what) {}
};

} // namespace holes
