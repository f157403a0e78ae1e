/*
  Capability interfaces shared by the graph backends.

  GraphVisitor is the read-only view (counts, ordered node/arc callbacks),
  ArcCost is the single-arc lookup used by path costing, and WeightedGraph adds
  the mutators. None of them carry state; every backend owns its storage.

  For Python developers:
  - virtual ... = 0: pure virtual (like @abstractmethod)
  - std::function<...>: any callable (lambda, function pointer, functor)
*/
#pragma once

#include <cstdint>
#include <functional>
#include <span>
#include <utility>

#include "weightgraph/core/types.hpp"

namespace weightgraph::core {

template <typename N>
class GraphVisitor {
public:
  using NodeFn = std::function<void(NodeId, const N&)>;
  using ArcFn = std::function<void(NodeId, NodeId, const N&)>;

  virtual ~GraphVisitor() noexcept = default;

  [[nodiscard]] virtual GraphType graph_type() const noexcept = 0;

  // Calls f(index, weight) once per node, ascending index.
  virtual void node_visitor(const NodeFn& f) const = 0;

  // Calls f(src, dst, weight) once per stored arc entry. Undirect graphs
  // report both mirrored directions.
  virtual void arc_visitor(const ArcFn& f) const = 0;

  [[nodiscard]] virtual std::int32_t node_count() const noexcept = 0;
  [[nodiscard]] virtual std::int64_t arc_count() const noexcept = 0;

  [[nodiscard]] std::int64_t total_entries() const noexcept {
    return static_cast<std::int64_t>(node_count()) + arc_count();
  }
};

template <typename N>
class ArcCost {
public:
  virtual ~ArcCost() noexcept = default;

  // Weight of the stored arc src -> dst. Throws KeyError when absent and
  // std::out_of_range for a bad index.
  [[nodiscard]] virtual N cost(NodeId src, NodeId dst) const = 0;
};

template <typename N>
class WeightedGraph : public GraphVisitor<N>, public ArcCost<N> {
  static_assert(is_weight_v<N>, "graph weight type must support N{}, + and ==");

public:
  using weight_type = N;
  using ArcUpdateFn = std::function<N(NodeId, NodeId, N)>;
  using NodeUpdateFn = std::function<N(NodeId, N)>;

  // Inserts src -> dst (and dst -> src for Undirect graphs).
  virtual void add_arc(NodeId src, NodeId dst, N weight) = 0;

  void add_default_arc(NodeId src, NodeId dst) { add_arc(src, dst, N{}); }

  // Replaces every stored arc weight w(i, j) with f(i, j, w). Undirect graphs
  // invoke f once per stored direction.
  virtual void update_all_arcs_weight(const ArcUpdateFn& f) = 0;

  // Replaces every node weight w(i) with f(i, w).
  virtual void update_all_nodes_weight(const NodeUpdateFn& f) = 0;

  [[nodiscard]] virtual N node_weight(NodeId i) const = 0;

  // Zip assignment; weights.size() must equal node_count().
  virtual void assign_node_weights(std::span<const N> weights) = 0;

  // Sets only the listed indices, other nodes keep their weight.
  virtual void assign_indexed_node_weights(std::span<const std::pair<NodeId, N>> weights) = 0;
};

} // namespace weightgraph::core
