#include <gtest/gtest.h>
#include <cstdint>
#include "weightgraph/core/sparse_graph.hpp"
#include "test_utils.hpp"

using namespace weightgraph::core;
using namespace weightgraph::core::test;

TEST(SparseGraph, DirectGraphOneArcPerList) {
  auto g = make_cycle4<SparseGraph<double>>();
  const double expect[4] = {1.0, 2.0, 3.0, 4.0};
  for (NodeId u = 0; u < 4; ++u) {
    auto succ = g.successors(u);
    ASSERT_EQ(succ.size(), 1u);
    EXPECT_EQ(succ[0].dst, (u + 1) % 4);
    EXPECT_EQ(succ[0].weight, expect[u]);
  }
}

TEST(SparseGraph, UndirectGraphTwoEntriesPerNode) {
  auto g = make_cycle4<SparseGraph<double>>(GraphType::Undirect);
  for (NodeId u = 0; u < 4; ++u) {
    EXPECT_EQ(g.successors(u).size(), 2u);
  }
}

TEST(SparseGraph, DuplicateInsertionKeepsBothEntries) {
  auto g = SparseGraph<double>::direct(3);
  g.add_arc(0, 1, 1.5);
  g.add_arc(0, 1, 9.0);
  EXPECT_EQ(g.arc_count(), 2);
  auto succ = g.successors(0);
  ASSERT_EQ(succ.size(), 2u);
  EXPECT_EQ(succ[0].weight, 1.5);
  EXPECT_EQ(succ[1].weight, 9.0);
  // First inserted entry wins the lookup.
  EXPECT_EQ(g.cost(0, 1), 1.5);
  EXPECT_EQ(arc_list(g).size(), 2u);
}

TEST(SparseGraph, UndirectDuplicateCountsEveryEntry) {
  auto g = SparseGraph<std::int64_t>::undirect(2);
  g.add_arc(0, 1, 3);
  g.add_arc(1, 0, 4);
  EXPECT_EQ(g.arc_count(), 4);
  EXPECT_EQ(g.cost(0, 1), 3);
  EXPECT_EQ(g.cost(1, 0), 3);
}

TEST(SparseGraph, ArcVisitorFollowsInsertionOrderPerSource) {
  auto g = SparseGraph<double>::direct(3);
  g.add_arc(1, 2, 1.0);
  g.add_arc(0, 2, 2.0);
  g.add_arc(1, 0, 3.0);
  g.add_arc(0, 1, 4.0);
  auto arcs = arc_list(g);
  std::vector<std::tuple<NodeId, NodeId, double>> expected{
      {0, 2, 2.0}, {0, 1, 4.0}, {1, 2, 1.0}, {1, 0, 3.0}};
  EXPECT_EQ(arcs, expected);
}

TEST(SparseGraph, UpdateArcsAfterDuplicates) {
  auto g = SparseGraph<double>::direct(2);
  g.add_arc(0, 1, 1.0);
  g.add_arc(0, 1, 2.0);
  g.update_all_arcs_weight([](NodeId, NodeId, double w) { return 2.0 * w; });
  auto succ = g.successors(0);
  EXPECT_EQ(succ[0].weight, 2.0);
  EXPECT_EQ(succ[1].weight, 4.0);
}

TEST(SparseGraph, SelfLoopUndirectStoresTwoEntries) {
  auto g = SparseGraph<double>::undirect(1);
  g.add_arc(0, 0, 1.0);
  EXPECT_EQ(g.arc_count(), 2);
  EXPECT_EQ(g.successors(0).size(), 2u);
}

TEST(SparseGraph, MissingArcLookupThrows) {
  auto g = make_line_graph<SparseGraph<double>>(3);
  EXPECT_THROW((void)g.cost(2, 0), KeyError);
  EXPECT_THROW((void)g.successors(3), std::out_of_range);
}

TEST(SparseGraph, Equality) {
  auto a = make_cycle4<SparseGraph<double>>();
  auto b = make_cycle4<SparseGraph<double>>();
  EXPECT_TRUE(a == b);
  b.add_arc(0, 2, 1.0);
  EXPECT_FALSE(a == b);
  auto c = make_cycle4<SparseGraph<double>>(GraphType::Undirect);
  EXPECT_FALSE(a == c);
}
