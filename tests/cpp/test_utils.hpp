#pragma once

#include <gtest/gtest.h>
#include <cstdint>
#include <set>
#include <tuple>
#include <vector>
#include "weightgraph/core/dense_graph.hpp"
#include "weightgraph/core/sparse_graph.hpp"
#include "weightgraph/core/weighted_graph.hpp"

namespace weightgraph::core::test {

// Graph builders shared by the suites

// Line graph 0->1->...->n-1 with arc (i, i+1) weighted i+1.
template <typename G>
G make_line_graph(int n, GraphType gtype = GraphType::Direct) {
  G g(n, gtype);
  using N = typename G::weight_type;
  for (int i = 0; i + 1 < n; ++i) {
    g.add_arc(i, i + 1, static_cast<N>(i + 1));
  }
  return g;
}

// Four-node cycle 0->1->2->3->0 weighted 1, 2, 3, 4.
template <typename G>
G make_cycle4(GraphType gtype = GraphType::Direct) {
  G g(4, gtype);
  using N = typename G::weight_type;
  g.add_arc(0, 1, static_cast<N>(1));
  g.add_arc(1, 2, static_cast<N>(2));
  g.add_arc(2, 3, static_cast<N>(3));
  g.add_arc(3, 0, static_cast<N>(4));
  return g;
}

// Node weights 0..n-1 on a path with arcs (0,1,1), (1,2,2), (2,3,3).
template <typename G>
G make_weighted_path4(GraphType gtype) {
  G g(4, gtype);
  using N = typename G::weight_type;
  g.update_all_nodes_weight([](NodeId i, N) { return static_cast<N>(i); });
  g.add_arc(0, 1, static_cast<N>(1));
  g.add_arc(1, 2, static_cast<N>(2));
  g.add_arc(2, 3, static_cast<N>(3));
  return g;
}

// Inspection helpers

template <typename N>
std::vector<std::tuple<NodeId, NodeId, N>> arc_list(const GraphVisitor<N>& g) {
  std::vector<std::tuple<NodeId, NodeId, N>> out;
  g.arc_visitor([&out](NodeId i, NodeId j, const N& w) { out.emplace_back(i, j, w); });
  return out;
}

// Stored arcs with duplicate entries collapsed.
template <typename N>
std::set<std::tuple<NodeId, NodeId, N>> arc_set(const GraphVisitor<N>& g) {
  auto list = arc_list(g);
  return {list.begin(), list.end()};
}

template <typename N>
std::vector<N> node_list(const GraphVisitor<N>& g) {
  std::vector<N> out;
  g.node_visitor([&out](NodeId, const N& w) { out.push_back(w); });
  return out;
}

// Same type, node weights and arc set; multiplicity is ignored.
template <typename N>
void expect_same_graph(const GraphVisitor<N>& a, const GraphVisitor<N>& b) {
  EXPECT_EQ(a.graph_type(), b.graph_type());
  EXPECT_EQ(a.node_count(), b.node_count());
  EXPECT_EQ(node_list(a), node_list(b));
  EXPECT_EQ(arc_set(a), arc_set(b));
}

// Every stored arc of an Undirect graph has its mirror with the same weight.
template <typename N>
void expect_mirrored(const GraphVisitor<N>& g) {
  auto arcs = arc_set(g);
  for (const auto& [i, j, w] : arcs) {
    EXPECT_TRUE(arcs.count({j, i, w})) << "missing mirror of " << i << " -> " << j;
  }
}

} // namespace weightgraph::core::test
