/* Adjacency-list graph backend: per-node, insertion-ordered arc lists. */
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

// One outgoing entry of a node's list.
template <typename N>
struct SparseArc {
  N weight;
  NodeId dst;
  friend bool operator==(const SparseArc& a, const SparseArc& b) {
    return a.dst == b.dst && a.weight == b.weight;
  }
};

// SparseGraph appends on every add_arc: repeated insertions of the same
// (src, dst) pair are kept as parallel entries and each one counts toward
// arc_count(). cost() resolves to the first inserted entry.
template <typename N>
class SparseGraph final : public WeightedGraph<N> {
public:
  using typename WeightedGraph<N>::ArcUpdateFn;
  using typename WeightedGraph<N>::NodeUpdateFn;
  using typename GraphVisitor<N>::NodeFn;
  using typename GraphVisitor<N>::ArcFn;

  SparseGraph(std::int32_t node_count, GraphType gtype);

  [[nodiscard]] static SparseGraph direct(std::int32_t node_count) {
    return SparseGraph(node_count, GraphType::Direct);
  }
  [[nodiscard]] static SparseGraph undirect(std::int32_t node_count) {
    return SparseGraph(node_count, GraphType::Undirect);
  }

  [[nodiscard]] GraphType graph_type() const noexcept override { return gtype_; }
  [[nodiscard]] std::int32_t node_count() const noexcept override { return nodes_.size(); }
  [[nodiscard]] std::int64_t arc_count() const noexcept override { return arcs_; }

  void node_visitor(const NodeFn& f) const override { nodes_.visit(f); }
  void arc_visitor(const ArcFn& f) const override;

  void add_arc(NodeId src, NodeId dst, N weight) override;
  void update_all_arcs_weight(const ArcUpdateFn& f) override;
  void update_all_nodes_weight(const NodeUpdateFn& f) override { nodes_.update(f); }

  [[nodiscard]] N node_weight(NodeId i) const override {
    return nodes_.at(i, "SparseGraph::node_weight");
  }
  void assign_node_weights(std::span<const N> weights) override {
    nodes_.assign(weights, "SparseGraph::assign_node_weights");
  }
  void assign_indexed_node_weights(std::span<const std::pair<NodeId, N>> weights) override {
    nodes_.assign_indexed(weights, "SparseGraph::assign_indexed_node_weights");
  }

  [[nodiscard]] N cost(NodeId src, NodeId dst) const override;

  // Outgoing entries of `node` in insertion order.
  [[nodiscard]] std::span<const SparseArc<N>> successors(NodeId node) const;

  friend bool operator==(const SparseGraph& a, const SparseGraph& b) {
    return a.gtype_ == b.gtype_ && a.nodes_ == b.nodes_ && a.lists_ == b.lists_;
  }

private:
  void make_arc(NodeId src, NodeId dst, const N& weight);

  GraphType gtype_ {GraphType::Direct};
  NodeWeights<N> nodes_ {};
  std::vector<std::vector<SparseArc<N>>> lists_ {};
  std::int64_t arcs_ {0};
};

template <typename N>
SparseGraph<N>::SparseGraph(std::int32_t node_count, GraphType gtype) : gtype_(gtype) {
  if (node_count < 0) {
    throw std::invalid_argument("SparseGraph: node_count must be >= 0");
  }
  nodes_ = NodeWeights<N>(node_count);
  lists_.resize(static_cast<std::size_t>(node_count));
}

template <typename N>
void SparseGraph<N>::arc_visitor(const ArcFn& f) const {
  for (std::size_t u = 0; u < lists_.size(); ++u) {
    for (const auto& a : lists_[u]) {
      f(static_cast<NodeId>(u), a.dst, a.weight);
    }
  }
}

template <typename N>
void SparseGraph<N>::add_arc(NodeId src, NodeId dst, N weight) {
  check_index(src, node_count(), "SparseGraph::add_arc");
  check_index(dst, node_count(), "SparseGraph::add_arc");
  make_arc(src, dst, weight);
  if (gtype_ == GraphType::Undirect) {
    make_arc(dst, src, weight);
  }
}

template <typename N>
void SparseGraph<N>::make_arc(NodeId src, NodeId dst, const N& weight) {
  lists_[static_cast<std::size_t>(src)].push_back(SparseArc<N>{weight, dst});
  ++arcs_;
}

template <typename N>
void SparseGraph<N>::update_all_arcs_weight(const ArcUpdateFn& f) {
  for (std::size_t u = 0; u < lists_.size(); ++u) {
    for (auto& a : lists_[u]) {
      a.weight = f(static_cast<NodeId>(u), a.dst, a.weight);
    }
  }
}

template <typename N>
N SparseGraph<N>::cost(NodeId src, NodeId dst) const {
  check_index(src, node_count(), "SparseGraph::cost");
  check_index(dst, node_count(), "SparseGraph::cost");
  for (const auto& a : lists_[static_cast<std::size_t>(src)]) {
    if (a.dst == dst) return a.weight;
  }
  throw KeyError("SparseGraph::cost: no arc " + std::to_string(src) + " -> " + std::to_string(dst));
}

template <typename N>
std::span<const SparseArc<N>> SparseGraph<N>::successors(NodeId node) const {
  check_index(node, node_count(), "SparseGraph::successors");
  return lists_[static_cast<std::size_t>(node)];
}

extern template class SparseGraph<double>;
extern template class SparseGraph<std::int64_t>;

} // namespace weightgraph::core
