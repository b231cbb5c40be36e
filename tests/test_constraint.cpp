#include <gtest/gtest.h>
#include "graph/graph.hpp"
#include "metrics/constraint.hpp"
#include "metrics/investment.hpp"
#include "common/errors.hpp"

using namespace holes;

static Graph starGraph(size_t n) {
    Graph g = Graph::undirected(n);
    for (NodeId leaf = 2; leaf <= static_cast<NodeId>(n); leaf++) {
        g.addEdge(1, leaf);
    }
    return g;
}

static Graph pathGraph(size_t n) {
    Graph g = Graph::undirected(n);
    for (NodeId v = 1; v < static_cast<NodeId>(n); v++) {
        g.addEdge(v, v + 1);
    }
    return g;
}

static Graph cycleGraph(size_t n) {
    Graph g = Graph::undirected(n);
    for (NodeId v = 1; v <= static_cast<NodeId>(n); v++) {
        g.addEdge(v, v % static_cast<NodeId>(n) + 1);
    }
    return g;
}

static Graph completeGraph(size_t n) {
    Graph g = Graph::undirected(n);
    for (NodeId a = 1; a <= static_cast<NodeId>(n); a++) {
        for (NodeId b = a + 1; b <= static_cast<NodeId>(n); b++) {
            g.addEdge(a, b);
        }
    }
    return g;
}

// A small irregular weighted digraph with reciprocated, one-way and
// zero-weight ties, used for the algebraic laws below.
static Graph mixedGraph() {
    Graph g = Graph::weightedDirected(6);
    g.addEdge(1, 2, 3.0);
    g.addEdge(2, 1, 1.0);
    g.addEdge(1, 3, 2.0);
    g.addEdge(3, 2, 0.5);
    g.addEdge(4, 1, 1.5);
    g.addEdge(2, 4, 2.5);
    g.addEdge(4, 5, 0.0);
    g.addEdge(5, 3, 4.0);
    g.addEdge(6, 6, 9.0);
    return g;
}

// ─── Basic scenarios ───────────────────────────────────────────

TEST(ConstraintTest, StarCenterLessConstrainedThanLeaves) {
    Graph g = starGraph(5);
    EXPECT_DOUBLE_EQ(investment(g, 1, 2), 0.25);
    EXPECT_DOUBLE_EQ(constraint(g, 2), 1.0);
    EXPECT_DOUBLE_EQ(constraint(g, 1), 0.25);
    EXPECT_LT(constraint(g, 1), constraint(g, 2));
}

TEST(ConstraintTest, WeightedTriangle) {
    Graph g = Graph::weightedUndirected(3);
    g.addEdge(1, 2, 1.0);
    g.addEdge(2, 3, 1.0);
    g.addEdge(1, 3, 1.0);
    for (NodeId i : g.vertices()) {
        EXPECT_NEAR(constraint(g, i), 1.125, 1e-10);
    }
}

TEST(ConstraintTest, CycleNodesEquallyConstrained) {
    Graph g = cycleGraph(5);
    double c1 = constraint(g, 1);
    EXPECT_GT(c1, 0.0);
    for (NodeId i = 2; i <= 5; i++) {
        EXPECT_NEAR(constraint(g, i), c1, 1e-10);
    }
}

TEST(ConstraintTest, CompleteGraph) {
    Graph g = completeGraph(4);
    // p = 1/3, indirect = 2 · 1/9, c_ij = (5/9)², three alters
    EXPECT_NEAR(constraint(g, 1), 3.0 * 25.0 / 81.0, 1e-10);
    EXPECT_NEAR(constraint(g, 2), constraint(g, 1), 1e-10);
}

TEST(ConstraintTest, PathEndsMoreConstrainedThanMiddle) {
    Graph g = pathGraph(5);
    double c_end = constraint(g, 1);
    double c_middle = constraint(g, 3);
    EXPECT_GT(c_end, c_middle);
    EXPECT_GT(c_middle, 0.0);
}

TEST(ConstraintTest, IsolatedNodeIsZero) {
    Graph g = Graph::undirected(5);
    g.addEdge(1, 2);
    g.addEdge(1, 3);
    EXPECT_DOUBLE_EQ(constraint(g, 5), 0.0);
}

TEST(ConstraintTest, NonContiguousVertexIds) {
    Graph g = Graph::undirected();
    g.addNodeWithId(10);
    g.addNodeWithId(20);
    g.addNodeWithId(35);
    g.addEdge(10, 20);
    g.addEdge(10, 35);
    EXPECT_DOUBLE_EQ(constraint(g, 20), 1.0);
    EXPECT_DOUBLE_EQ(constraint(g, 10), 0.5);
}

TEST(ConstraintTest, ConstraintsForAllVertices) {
    Graph g = starGraph(4);
    auto all = constraints(g);
    ASSERT_EQ(all.size(), 4u);
    EXPECT_NEAR(all.at(1), 1.0 / 3.0, 1e-10);
    EXPECT_DOUBLE_EQ(all.at(4), 1.0);
}

// ─── Dyadic constraint ─────────────────────────────────────────

TEST(DyadicConstraintTest, TriangleBounds) {
    Graph g = Graph::undirected(3);
    g.addEdge(1, 2);
    g.addEdge(2, 3);
    g.addEdge(1, 3);
    double dc = dyadicConstraint(g, 1, 2);
    EXPECT_DOUBLE_EQ(dc, 0.5625);  // (0.5 + 0.25)²
    EXPECT_LE(dc, 1.0);
}

TEST(DyadicConstraintTest, EdgeFormMatchesNodeForm) {
    Graph g = mixedGraph();
    for (const Edge& e : g.edges()) {
        for (Mode mode : {Mode::Both, Mode::Out, Mode::In}) {
            EXPECT_EQ(dyadicConstraint(g, e, mode),
                      dyadicConstraint(g, e.source, e.target, mode));
        }
    }
}

TEST(DyadicConstraintTest, IndirectOnlyPair) {
    Graph g = pathGraph(5);
    // 1 and 3 are not tied but share node 2: (0 + 1 · 0.5)²
    EXPECT_DOUBLE_EQ(dyadicConstraint(g, 1, 3), 0.25);
}

TEST(DyadicConstraintTest, UnconnectedPairIsZero) {
    Graph g = Graph::undirected(4);
    g.addEdge(1, 2);
    g.addEdge(3, 4);
    EXPECT_DOUBLE_EQ(dyadicConstraint(g, 1, 3), 0.0);
}

TEST(DyadicConstraintTest, SymmetricOnUndirectedCycle) {
    Graph g = cycleGraph(5);
    EXPECT_NEAR(dyadicConstraint(g, 1, 2), dyadicConstraint(g, 2, 1), 1e-10);
}

// ─── Laws ──────────────────────────────────────────────────────

TEST(ConstraintLawTest, DecomposesIntoDyadicConstraints) {
    Graph g = mixedGraph();
    for (Mode mode : {Mode::Both, Mode::Out, Mode::In}) {
        for (NodeId i : g.vertices()) {
            double sum = 0.0;
            for (NodeId j : g.neighbors(i, mode)) {
                if (j == i) continue;
                sum += dyadicConstraint(g, i, j, mode);
            }
            EXPECT_NEAR(constraint(g, i, mode), sum, 1e-10)
                << "node " << i << " mode " << modeName(mode);
        }
    }
}

TEST(ConstraintLawTest, DecomposesOnStar) {
    Graph g = starGraph(5);
    double sum = 0.0;
    for (NodeId j : g.neighbors(1, Mode::Both)) {
        sum += dyadicConstraint(g, 1, j);
    }
    EXPECT_NEAR(constraint(g, 1), sum, 1e-10);
}

TEST(ConstraintLawTest, RepeatedCallsAreBitIdentical) {
    Graph g = mixedGraph();
    for (Mode mode : {Mode::Both, Mode::Out, Mode::In}) {
        for (NodeId i : g.vertices()) {
            double first = constraint(g, i, mode);
            EXPECT_EQ(first, constraint(g, i, mode));
            for (NodeId j : g.vertices()) {
                EXPECT_EQ(investment(g, i, j, mode), investment(g, i, j, mode));
                EXPECT_EQ(investmentSum(g, i, j, mode), investmentSum(g, i, j, mode));
            }
        }
    }
}

TEST(ConstraintLawTest, DefaultModeIsBoth) {
    Graph g = Graph::directed(3);
    g.addEdge(1, 2);
    g.addEdge(2, 3);
    g.addEdge(3, 1);
    EXPECT_EQ(constraint(g, 1), constraint(g, 1, Mode::Both));
    EXPECT_EQ(investment(g, 1, 2), investment(g, 1, 2, Mode::Both));
    EXPECT_EQ(dyadicConstraint(g, 1, 2), dyadicConstraint(g, 1, 2, Mode::Both));
}

// ─── Validation ────────────────────────────────────────────────

TEST(ConstraintTest, RejectsInvalidInput) {
    Graph g = starGraph(3);
    EXPECT_THROW(constraint(g, 0), InvalidNodeError);
    EXPECT_THROW(constraint(g, 4), InvalidNodeError);
    EXPECT_THROW(dyadicConstraint(g, 1, 4), InvalidNodeError);
    EXPECT_THROW(dyadicConstraint(g, Edge(4, 1)), InvalidNodeError);
    EXPECT_THROW(constraint(g, 1, static_cast<Mode>(3)), InvalidModeError);
    EXPECT_THROW(constraints(g, static_cast<Mode>(3)), InvalidModeError);

    Graph empty = Graph::undirected();
    EXPECT_THROW(constraint(empty, 1), InvalidNodeError);
}
