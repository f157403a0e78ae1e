/*
  Pybind11 module exposing WeightGraph-Core C++ APIs to Python.

  Notes:
    - Backends are bound with float64 weights.
    - Update callbacks accept any Python callable; they run with the GIL held.
    - KeyError/ValueError/TypeError map to the Python built-ins of the same
      name, std::out_of_range to IndexError.
*/
#include <pybind11/pybind11.h>
#include <pybind11/functional.h>
#include <pybind11/stl.h>

#include <functional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "weightgraph/core/canonical_form.hpp"
#include "weightgraph/core/canonical_json.hpp"
#include "weightgraph/core/dense_graph.hpp"
#include "weightgraph/core/dot.hpp"
#include "weightgraph/core/error.hpp"
#include "weightgraph/core/path_cost.hpp"
#include "weightgraph/core/sparse_graph.hpp"
#include "weightgraph/core/types.hpp"

namespace py = pybind11;
using namespace weightgraph::core;

namespace {

using Weight = double;

// Canonical form as plain Python containers, same layout as the JSON text.
py::dict canonical_to_dict(const CanonicalForm<Weight>& form) {
  py::dict out;
  out["gtype"] = to_string(form.gtype);
  py::dict nodes;
  if (const auto* ext = std::get_if<ExtendedNodes<Weight>>(&form.nodes)) {
    nodes["Extended"] = py::cast(ext->weights);
  } else {
    const auto& c = std::get<CompactNodes<Weight>>(form.nodes);
    py::dict body;
    body["count"] = c.count;
    py::list weights;
    for (const auto& [i, w] : c.weights) weights.append(py::make_tuple(i, w));
    body["weights"] = weights;
    nodes["Compact"] = body;
  }
  out["nodes"] = nodes;
  py::dict arcs;
  if (const auto* simple = std::get_if<SimpleArcs>(&form.arcs)) {
    py::list pairs;
    for (const auto& [i, j] : simple->arcs) pairs.append(py::make_tuple(i, j));
    arcs["Simple"] = pairs;
  } else {
    py::list triples;
    for (const auto& a : std::get<WeightedArcs<Weight>>(form.arcs).arcs) {
      triples.append(py::make_tuple(a.src, a.dst, a.weight));
    }
    arcs["Weighted"] = triples;
  }
  out["arcs"] = arcs;
  return out;
}

py::list sub_path_cost_list(const ArcCost<Weight>& g, const std::vector<NodeId>& walk) {
  py::list out;
  SubPathCosts<Weight> costs(g, walk);
  for (const auto& c : costs) out.append(py::make_tuple(c.src, c.dst, c.cost));
  return out;
}

template <typename G>
py::class_<G> bind_backend(py::module_& m, const char* name) {
  py::class_<G> cls(m, name);
  cls.def(py::init<std::int32_t, GraphType>(), py::arg("node_count"), py::arg("gtype") = GraphType::Direct)
      .def_static("direct", &G::direct, py::arg("node_count"))
      .def_static("undirect", &G::undirect, py::arg("node_count"))
      .def("graph_type", &G::graph_type)
      .def("node_count", &G::node_count)
      .def("arc_count", &G::arc_count)
      .def("total_entries", &G::total_entries)
      .def("add_arc", &G::add_arc, py::arg("src"), py::arg("dst"), py::arg("weight"))
      .def("add_default_arc", &G::add_default_arc, py::arg("src"), py::arg("dst"))
      .def("cost", &G::cost, py::arg("src"), py::arg("dst"))
      .def("node_weight", &G::node_weight, py::arg("index"))
      .def("update_all_arcs_weight", [](G& g, const std::function<Weight(NodeId, NodeId, Weight)>& f){
        g.update_all_arcs_weight(f);
      }, py::arg("f"))
      .def("update_all_nodes_weight", [](G& g, const std::function<Weight(NodeId, Weight)>& f){
        g.update_all_nodes_weight(f);
      }, py::arg("f"))
      .def("assign_node_weights", [](G& g, const std::vector<Weight>& w){ g.assign_node_weights(w); },
           py::arg("weights"))
      .def("node_weights", [](const G& g){
        py::list out;
        g.node_visitor([&out](NodeId, const Weight& w){ out.append(w); });
        return out;
      })
      .def("arcs", [](const G& g){
        py::list out;
        g.arc_visitor([&out](NodeId i, NodeId j, const Weight& w){ out.append(py::make_tuple(i, j, w)); });
        return out;
      })
      .def("canonical", [](const G& g, ArcEncoding arcs){
        return canonical_to_dict(to_canonical(g, CanonicalOptions{arcs}));
      }, py::kw_only(), py::arg("arcs") = ArcEncoding::Weighted)
      .def("to_json", [](const G& g, ArcEncoding arcs, bool pretty){
        return graph_to_json(g, CanonicalOptions{arcs}, JsonOptions{pretty});
      }, py::kw_only(), py::arg("arcs") = ArcEncoding::Weighted, py::arg("pretty") = false)
      .def_static("from_json", [](const std::string& text){ return graph_from_json<G>(text); },
           py::arg("text"))
      .def("to_dot", [](const G& g){ return to_dot_source(g); })
      .def("__eq__", [](const G& a, const G& b){ return a == b; });
  return cls;
}

} // namespace

PYBIND11_MODULE(_weightgraph_core, m) {
  m.doc() = "WeightGraph-Core C++ bindings";

  py::register_exception<KeyError>(m, "ArcNotFoundError", PyExc_KeyError);
  py::register_exception<ValueError>(m, "CanonicalFormError", PyExc_ValueError);
  py::register_exception<TypeError>(m, "CanonicalTypeError", PyExc_TypeError);

  py::enum_<GraphType>(m, "GraphType")
      .value("DIRECT", GraphType::Direct)
      .value("UNDIRECT", GraphType::Undirect);

  py::enum_<ArcEncoding>(m, "ArcEncoding")
      .value("WEIGHTED", ArcEncoding::Weighted)
      .value("SIMPLE", ArcEncoding::Simple);

  bind_backend<SparseGraph<Weight>>(m, "SparseGraph")
      .def("successors", [](const SparseGraph<Weight>& g, NodeId node){
        py::list out;
        for (const auto& a : g.successors(node)) out.append(py::make_tuple(a.dst, a.weight));
        return out;
      }, py::arg("node"));

  bind_backend<DenseGraph<Weight>>(m, "DenseGraph")
      .def("has_arc", &DenseGraph<Weight>::has_arc, py::arg("src"), py::arg("dst"));

  // Eager for Python callers: the walk is copied and all triples are returned.
  m.def("sub_path_costs", [](const SparseGraph<Weight>& g, std::vector<NodeId> walk){
    return sub_path_cost_list(g, walk);
  }, py::arg("graph"), py::arg("walk"));
  m.def("sub_path_costs", [](const DenseGraph<Weight>& g, std::vector<NodeId> walk){
    return sub_path_cost_list(g, walk);
  }, py::arg("graph"), py::arg("walk"));
}
