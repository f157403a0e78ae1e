/* Adjacency-matrix graph backend: N x N presence and weight matrices. */
#pragma once

#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "weightgraph/core/error.hpp"
#include "weightgraph/core/node_weights.hpp"
#include "weightgraph/core/types.hpp"
#include "weightgraph/core/weighted_graph.hpp"

namespace weightgraph::core {

// DenseGraph stores at most one arc per ordered pair. Inserting an arc whose
// cell is already present leaves the stored weight and arc_count() unchanged,
// unlike SparseGraph which keeps duplicates.
template <typename N>
class DenseGraph final : public WeightedGraph<N> {
public:
  using typename WeightedGraph<N>::ArcUpdateFn;
  using typename WeightedGraph<N>::NodeUpdateFn;
  using typename GraphVisitor<N>::NodeFn;
  using typename GraphVisitor<N>::ArcFn;

  DenseGraph(std::int32_t node_count, GraphType gtype);

  [[nodiscard]] static DenseGraph direct(std::int32_t node_count) {
    return DenseGraph(node_count, GraphType::Direct);
  }
  [[nodiscard]] static DenseGraph undirect(std::int32_t node_count) {
    return DenseGraph(node_count, GraphType::Undirect);
  }

  [[nodiscard]] GraphType graph_type() const noexcept override { return gtype_; }
  [[nodiscard]] std::int32_t node_count() const noexcept override { return nodes_.size(); }
  [[nodiscard]] std::int64_t arc_count() const noexcept override { return arcs_; }

  void node_visitor(const NodeFn& f) const override { nodes_.visit(f); }
  // Row-major over present cells.
  void arc_visitor(const ArcFn& f) const override;

  void add_arc(NodeId src, NodeId dst, N weight) override;
  void update_all_arcs_weight(const ArcUpdateFn& f) override;
  void update_all_nodes_weight(const NodeUpdateFn& f) override { nodes_.update(f); }

  [[nodiscard]] N node_weight(NodeId i) const override {
    return nodes_.at(i, "DenseGraph::node_weight");
  }
  void assign_node_weights(std::span<const N> weights) override {
    nodes_.assign(weights, "DenseGraph::assign_node_weights");
  }
  void assign_indexed_node_weights(std::span<const std::pair<NodeId, N>> weights) override {
    nodes_.assign_indexed(weights, "DenseGraph::assign_indexed_node_weights");
  }

  [[nodiscard]] N cost(NodeId src, NodeId dst) const override;

  [[nodiscard]] bool has_arc(NodeId src, NodeId dst) const {
    check_index(src, node_count(), "DenseGraph::has_arc");
    check_index(dst, node_count(), "DenseGraph::has_arc");
    return present_[cell(src, dst)] != 0;
  }

  friend bool operator==(const DenseGraph& a, const DenseGraph& b) {
    if (a.gtype_ != b.gtype_ || !(a.nodes_ == b.nodes_) || a.present_ != b.present_) {
      return false;
    }
    // Weights of absent cells are not part of the graph.
    for (std::size_t c = 0; c < a.present_.size(); ++c) {
      if (a.present_[c] && !(a.weights_[c] == b.weights_[c])) return false;
    }
    return true;
  }

private:
  [[nodiscard]] std::size_t cell(NodeId src, NodeId dst) const noexcept {
    return static_cast<std::size_t>(src) * static_cast<std::size_t>(node_count()) +
           static_cast<std::size_t>(dst);
  }
  void make_arc(NodeId src, NodeId dst, const N& weight);

  GraphType gtype_ {GraphType::Direct};
  NodeWeights<N> nodes_ {};
  // char rather than bool keeps the matrix a plain contiguous array.
  std::vector<char> present_ {};
  std::vector<N> weights_ {};
  std::int64_t arcs_ {0};
};

template <typename N>
DenseGraph<N>::DenseGraph(std::int32_t node_count, GraphType gtype) : gtype_(gtype) {
  if (node_count < 0) {
    throw std::invalid_argument("DenseGraph: node_count must be >= 0");
  }
  nodes_ = NodeWeights<N>(node_count);
  const auto n = static_cast<std::size_t>(node_count);
  present_.assign(n * n, 0);
  weights_.assign(n * n, N{});
}

template <typename N>
void DenseGraph<N>::arc_visitor(const ArcFn& f) const {
  const NodeId n = node_count();
  for (NodeId i = 0; i < n; ++i) {
    for (NodeId j = 0; j < n; ++j) {
      auto c = cell(i, j);
      if (present_[c]) f(i, j, weights_[c]);
    }
  }
}

template <typename N>
void DenseGraph<N>::add_arc(NodeId src, NodeId dst, N weight) {
  check_index(src, node_count(), "DenseGraph::add_arc");
  check_index(dst, node_count(), "DenseGraph::add_arc");
  make_arc(src, dst, weight);
  if (gtype_ == GraphType::Undirect) {
    make_arc(dst, src, weight);
  }
}

template <typename N>
void DenseGraph<N>::make_arc(NodeId src, NodeId dst, const N& weight) {
  auto c = cell(src, dst);
  if (present_[c]) return;
  present_[c] = 1;
  weights_[c] = weight;
  ++arcs_;
}

template <typename N>
void DenseGraph<N>::update_all_arcs_weight(const ArcUpdateFn& f) {
  const NodeId n = node_count();
  for (NodeId i = 0; i < n; ++i) {
    for (NodeId j = 0; j < n; ++j) {
      auto c = cell(i, j);
      if (present_[c]) weights_[c] = f(i, j, weights_[c]);
    }
  }
}

template <typename N>
N DenseGraph<N>::cost(NodeId src, NodeId dst) const {
  check_index(src, node_count(), "DenseGraph::cost");
  check_index(dst, node_count(), "DenseGraph::cost");
  auto c = cell(src, dst);
  if (!present_[c]) {
    throw KeyError("DenseGraph::cost: no arc " + std::to_string(src) + " -> " + std::to_string(dst));
  }
  return weights_[c];
}

extern template class DenseGraph<double>;
extern template class DenseGraph<std::int64_t>;

} // namespace weightgraph::core
