// PyBind11 bindings for the holes C++ core.
// Exposes Graph, the constraint/investment metrics and brokerage to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DHOLES_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "common/errors.hpp"
#include "graph/graph.hpp"
#include "graph/mode.hpp"
#include "metrics/investment.hpp"
#include "metrics/constraint.hpp"
#include "brokerage/brokerage.hpp"

#include <map>
#include <string>
#include <vector>

namespace py = pybind11;

using Labels = std::vector<std::string>;
using LabelMap = std::map<holes::NodeId, std::string>;

PYBIND11_MODULE(holes_bindings, m) {
    m.doc() = "Structural-holes metrics: Burt constraint and Gould-Fernandez brokerage";

    py::register_exception<holes::InvalidNodeError>(m, "InvalidNodeError", PyExc_ValueError);
    py::register_exception<holes::InvalidModeError>(m, "InvalidModeError", PyExc_ValueError);
    py::register_exception<holes::NegativeWeightError>(m, "NegativeWeightError", PyExc_ValueError);
    py::register_exception<holes::InvalidGroupsError>(m, "InvalidGroupsError", PyExc_ValueError);

    // ── Mode ──
    py::enum_<holes::Mode>(m, "Mode")
        .value("BOTH", holes::Mode::Both)
        .value("OUT", holes::Mode::Out)
        .value("IN", holes::Mode::In);
    m.def("parse_mode", &holes::parseMode);

    // ── Edge ──
    py::class_<holes::Edge>(m, "Edge")
        .def(py::init<>())
        .def(py::init<holes::NodeId, holes::NodeId, double>(),
             py::arg("source"), py::arg("target"), py::arg("weight") = 1.0)
        .def_readwrite("source", &holes::Edge::source)
        .def_readwrite("target", &holes::Edge::target)
        .def_readwrite("weight", &holes::Edge::weight)
        .def("is_self_loop", &holes::Edge::isSelfLoop);

    // ── GraphKind ──
    py::class_<holes::GraphKind>(m, "GraphKind")
        .def(py::init<>())
        .def_readwrite("directed", &holes::GraphKind::directed)
        .def_readwrite("weighted", &holes::GraphKind::weighted);

    // ── Graph ──
    py::class_<holes::GraphAdapter>(m, "GraphAdapter");

    py::class_<holes::Graph, holes::GraphAdapter>(m, "Graph")
        .def(py::init<holes::GraphKind>(), py::arg("kind") = holes::GraphKind{})
        .def(py::init<size_t, holes::GraphKind>(), py::arg("n"), py::arg("kind"))
        .def("add_node", &holes::Graph::addNode)
        .def("add_node_with_id", &holes::Graph::addNodeWithId)
        .def("remove_node", &holes::Graph::removeNode)
        .def("add_edge", &holes::Graph::addEdge,
             py::arg("source"), py::arg("target"), py::arg("weight") = 1.0)
        .def("remove_edge", &holes::Graph::removeEdge)
        .def("set_weight", &holes::Graph::setWeight)
        .def("edges", &holes::Graph::edges)
        .def("edge_count", &holes::Graph::edgeCount)
        .def("vertices", &holes::Graph::vertices)
        .def("vertex_count", &holes::Graph::vertexCount)
        .def("has_vertex", &holes::Graph::hasVertex)
        .def("has_edge", &holes::Graph::hasEdge)
        .def("weight", &holes::Graph::weight)
        .def("neighbors", &holes::Graph::neighbors,
             py::arg("id"), py::arg("mode") = holes::Mode::Both)
        .def("is_directed", &holes::Graph::isDirected)
        .def("is_weighted", &holes::Graph::isWeighted);

    // ── Metrics ──
    m.def("investment",
          py::overload_cast<const holes::GraphAdapter&, holes::NodeId, holes::NodeId, holes::Mode>(
              &holes::investment),
          py::arg("graph"), py::arg("i"), py::arg("j"), py::arg("mode") = holes::Mode::Both);
    m.def("investment",
          [](const holes::Graph& g, holes::NodeId i, holes::NodeId j, const std::string& mode) {
              return holes::investment(g, i, j, holes::parseMode(mode));
          },
          py::arg("graph"), py::arg("i"), py::arg("j"), py::arg("mode"));

    m.def("investment_sum",
          py::overload_cast<const holes::GraphAdapter&, holes::NodeId, holes::NodeId, holes::Mode>(
              &holes::investmentSum),
          py::arg("graph"), py::arg("i"), py::arg("j"), py::arg("mode") = holes::Mode::Both);
    m.def("investment_sum",
          [](const holes::Graph& g, holes::NodeId i, holes::NodeId j, const std::string& mode) {
              return holes::investmentSum(g, i, j, holes::parseMode(mode));
          },
          py::arg("graph"), py::arg("i"), py::arg("j"), py::arg("mode"));

    m.def("dyadic_constraint",
          py::overload_cast<const holes::GraphAdapter&, holes::NodeId, holes::NodeId, holes::Mode>(
              &holes::dyadicConstraint),
          py::arg("graph"), py::arg("i"), py::arg("j"), py::arg("mode") = holes::Mode::Both);
    m.def("dyadic_constraint",
          py::overload_cast<const holes::GraphAdapter&, const holes::Edge&, holes::Mode>(
              &holes::dyadicConstraint),
          py::arg("graph"), py::arg("edge"), py::arg("mode") = holes::Mode::Both);
    m.def("dyadic_constraint",
          [](const holes::Graph& g, holes::NodeId i, holes::NodeId j, const std::string& mode) {
              return holes::dyadicConstraint(g, i, j, holes::parseMode(mode));
          },
          py::arg("graph"), py::arg("i"), py::arg("j"), py::arg("mode"));

    m.def("constraint", &holes::constraint,
          py::arg("graph"), py::arg("i"), py::arg("mode") = holes::Mode::Both);
    m.def("constraint",
          [](const holes::Graph& g, holes::NodeId i, const std::string& mode) {
              return holes::constraint(g, i, holes::parseMode(mode));
          },
          py::arg("graph"), py::arg("i"), py::arg("mode"));
    m.def("constraints", &holes::constraints,
          py::arg("graph"), py::arg("mode") = holes::Mode::Both);

    // ── Brokerage ──
    py::enum_<holes::Role>(m, "Role")
        .value("COORDINATOR", holes::Role::Coordinator)
        .value("GATEKEEPER", holes::Role::Gatekeeper)
        .value("REPRESENTATIVE", holes::Role::Representative)
        .value("LIAISON", holes::Role::Liaison)
        .value("COSMOPOLITAN", holes::Role::Cosmopolitan);
    m.def("role_name", &holes::roleName);

    py::class_<holes::BrokerageProfile>(m, "BrokerageProfile")
        .def(py::init<>())
        .def_readonly("coordinator", &holes::BrokerageProfile::coordinator)
        .def_readonly("gatekeeper", &holes::BrokerageProfile::gatekeeper)
        .def_readonly("representative", &holes::BrokerageProfile::representative)
        .def_readonly("liaison", &holes::BrokerageProfile::liaison)
        .def_readonly("cosmopolitan", &holes::BrokerageProfile::cosmopolitan)
        .def("count", &holes::BrokerageProfile::count)
        .def("total", &holes::BrokerageProfile::total);

    py::class_<holes::BrokerageConfig>(m, "BrokerageConfig")
        .def(py::init<>())
        .def_readwrite("open_triads_only", &holes::BrokerageConfig::open_triads_only);

    m.def("classify_role", &holes::classifyRole<std::string>,
          py::arg("group_ego"), py::arg("group_in"), py::arg("group_out"));
    m.def("groups_to_integer_labels", &holes::groupsToIntegerLabels<std::string>);

    m.def("brokerage",
          [](const holes::Graph& g, const Labels& groups, holes::NodeId ego,
             const holes::BrokerageConfig& config) {
              return holes::brokerage(g, groups, ego, config);
          },
          py::arg("graph"), py::arg("groups"), py::arg("ego"),
          py::arg("config") = holes::BrokerageConfig{});
    m.def("brokerage",
          [](const holes::Graph& g, const LabelMap& groups, holes::NodeId ego,
             const holes::BrokerageConfig& config) {
              return holes::brokerage(g, groups, ego, config);
          },
          py::arg("graph"), py::arg("groups"), py::arg("ego"),
          py::arg("config") = holes::BrokerageConfig{});

    m.def("classify_brokerage",
          [](const holes::Graph& g, const Labels& groups, const holes::BrokerageConfig& config) {
              return holes::classifyBrokerage(g, groups, config);
          },
          py::arg("graph"), py::arg("groups"), py::arg("config") = holes::BrokerageConfig{});
    m.def("classify_brokerage",
          [](const holes::Graph& g, const LabelMap& groups, const holes::BrokerageConfig& config) {
              return holes::classifyBrokerage(g, groups, config);
          },
          py::arg("graph"), py::arg("groups"), py::arg("config") = holes::BrokerageConfig{});
}
