#include <gtest/gtest.h>
#include <cstdint>
#include <limits>
#include <string>
#include <variant>
#include "weightgraph/core/canonical_json.hpp"
#include "weightgraph/core/dense_graph.hpp"
#include "weightgraph/core/sparse_graph.hpp"
#include "test_utils.hpp"

using namespace weightgraph::core;
using namespace weightgraph::core::test;

namespace {

// Sparse -> json -> Dense -> json -> Sparse must give back the same graph.
void run_serialization(GraphType gtype) {
  auto orig = make_weighted_path4<SparseGraph<std::int64_t>>(gtype);
  auto text = graph_to_json(orig);
  auto tmp = graph_from_json<DenseGraph<std::int64_t>>(text);
  expect_same_graph(orig, tmp);
  auto back = graph_from_json<SparseGraph<std::int64_t>>(graph_to_json(tmp));
  EXPECT_TRUE(orig == back) << graph_to_json(back);
}

} // namespace

TEST(CanonicalJson, SerializationAcrossBackends) {
  run_serialization(GraphType::Direct);
  run_serialization(GraphType::Undirect);
}

TEST(CanonicalJson, ExtendedWeightedLayout) {
  auto g = make_weighted_path4<SparseGraph<std::int64_t>>(GraphType::Direct);
  EXPECT_EQ(graph_to_json(g),
            "{\"gtype\":\"Direct\",\"nodes\":{\"Extended\":[0,1,2,3]},"
            "\"arcs\":{\"Weighted\":[[0,1,1],[1,2,2],[2,3,3]]}}");
}

TEST(CanonicalJson, CompactSimpleLayout) {
  auto g = DenseGraph<std::int64_t>::undirect(5);
  g.update_all_nodes_weight([](NodeId i, std::int64_t) { return i == 3 ? 4 : 0; });
  g.add_arc(0, 1, 9);
  auto text = graph_to_json(g, CanonicalOptions{ArcEncoding::Simple});
  EXPECT_EQ(text,
            "{\"gtype\":\"Undirect\",\"nodes\":{\"Compact\":{\"count\":5,\"weights\":[[3,4]]}},"
            "\"arcs\":{\"Simple\":[[0,1],[1,0]]}}");

  auto back = graph_from_json<SparseGraph<std::int64_t>>(text);
  EXPECT_EQ(back.node_count(), 5);
  EXPECT_EQ(back.node_weight(3), 4);
  EXPECT_EQ(back.arc_count(), 2);
  EXPECT_EQ(back.cost(1, 0), 0);
}

TEST(CanonicalJson, DoubleWeightsRoundTrip) {
  auto g = DenseGraph<double>::direct(3);
  g.update_all_nodes_weight([](NodeId i, double) { return 0.25 * (i + 1); });
  g.add_arc(2, 0, -1.5);
  g.add_arc(0, 2, 1e-3);
  auto back = graph_from_json<DenseGraph<double>>(graph_to_json(g));
  EXPECT_TRUE(g == back);
}

TEST(CanonicalJson, IntegerLiteralsAcceptedForDoubleWeights) {
  auto form = canonical_from_json<double>(
      R"({"gtype":"Direct","nodes":{"Extended":[1,2]},"arcs":{"Weighted":[[0,1,3]]}})");
  auto g = from_canonical<SparseGraph<double>>(form);
  EXPECT_EQ(g.node_weight(1), 2.0);
  EXPECT_EQ(g.cost(0, 1), 3.0);
}

TEST(CanonicalJson, PrettyOutputParsesBack) {
  auto g = make_weighted_path4<SparseGraph<std::int64_t>>(GraphType::Undirect);
  auto pretty = graph_to_json(g, CanonicalOptions{}, JsonOptions{true});
  EXPECT_NE(pretty.find('\n'), std::string::npos);
  EXPECT_NE(pretty.find("  \"gtype\": \"Undirect\""), std::string::npos);
  auto back = graph_from_json<SparseGraph<std::int64_t>>(pretty);
  EXPECT_TRUE(g == back);
}

TEST(CanonicalJson, NonFiniteWeightsRejectedOnEncode) {
  constexpr double nan = std::numeric_limits<double>::quiet_NaN();
  constexpr double inf = std::numeric_limits<double>::infinity();

  // compact node list: three zeros out of four
  auto dense = DenseGraph<double>::direct(4);
  dense.update_all_nodes_weight([&](NodeId i, double) { return i == 2 ? nan : 0.0; });
  EXPECT_THROW((void)graph_to_json(dense), ValueError);

  auto sparse = SparseGraph<double>::undirect(2);
  sparse.update_all_nodes_weight([](NodeId i, double) { return 1.0 + i; });
  sparse.add_arc(0, 1, -inf);
  EXPECT_THROW((void)graph_to_json(sparse), ValueError);
  // simple encoding drops arc weights, so nothing non-finite is written
  auto back = graph_from_json<SparseGraph<double>>(graph_to_json(sparse, CanonicalOptions{ArcEncoding::Simple}));
  EXPECT_EQ(back.arc_count(), 2);
  EXPECT_EQ(back.node_weight(1), 2.0);
  EXPECT_EQ(back.cost(0, 1), 0.0);
}

TEST(CanonicalJson, SyntaxErrorIsValueError) {
  EXPECT_THROW((void)canonical_from_json<double>("{\"gtype\": "), ValueError);
}

TEST(CanonicalJson, StructuralErrors) {
  // missing key
  EXPECT_THROW((void)canonical_from_json<double>(
                   R"({"gtype":"Direct","nodes":{"Extended":[]}})"),
               ValueError);
  // unknown graph type
  EXPECT_THROW((void)canonical_from_json<double>(
                   R"({"gtype":"Mixed","nodes":{"Extended":[]},"arcs":{"Simple":[]}})"),
               ValueError);
  // unknown variant tag
  EXPECT_THROW((void)canonical_from_json<double>(
                   R"({"gtype":"Direct","nodes":{"Sparse":[]},"arcs":{"Simple":[]}})"),
               ValueError);
  // two tags
  EXPECT_THROW((void)canonical_from_json<double>(
                   R"({"gtype":"Direct","nodes":{"Extended":[],"Compact":{}},"arcs":{"Simple":[]}})"),
               ValueError);
  // wrong tuple arity
  EXPECT_THROW((void)canonical_from_json<double>(
                   R"({"gtype":"Direct","nodes":{"Extended":[0,0]},"arcs":{"Weighted":[[0,1]]}})"),
               ValueError);
}

TEST(CanonicalJson, KindErrorsAreTypeErrors) {
  EXPECT_THROW((void)canonical_from_json<double>("[]"), TypeError);
  EXPECT_THROW((void)canonical_from_json<double>(
                   R"({"gtype":1,"nodes":{"Extended":[]},"arcs":{"Simple":[]}})"),
               TypeError);
  EXPECT_THROW((void)canonical_from_json<double>(
                   R"({"gtype":"Direct","nodes":{"Extended":["a"]},"arcs":{"Simple":[]}})"),
               TypeError);
  EXPECT_THROW((void)canonical_from_json<std::int64_t>(
                   R"({"gtype":"Direct","nodes":{"Extended":[0.5]},"arcs":{"Simple":[]}})"),
               TypeError);
}

TEST(CanonicalJson, InconsistentIndicesRejected) {
  // compact count does not cover the listed index
  EXPECT_THROW((void)graph_from_json<DenseGraph<double>>(
                   R"({"gtype":"Direct","nodes":{"Compact":{"count":2,"weights":[[2,1.0]]}},"arcs":{"Simple":[]}})"),
               ValueError);
  // arc endpoint beyond node count
  EXPECT_THROW((void)graph_from_json<SparseGraph<double>>(
                   R"({"gtype":"Undirect","nodes":{"Extended":[0,0]},"arcs":{"Weighted":[[0,1,1.0],[1,5,1.0]]}})"),
               ValueError);
  EXPECT_THROW((void)graph_from_json<SparseGraph<double>>(
                   R"({"gtype":"Direct","nodes":{"Extended":[0]},"arcs":{"Simple":[[-1,0]]}})"),
               ValueError);
}
