/*
  CanonicalForm — backend-neutral transcoding value for a weighted graph.

  A form records the graph type, the node weights (dense or compacted) and the
  stored arcs. It is built from any GraphVisitor and replayed into any
  WeightedGraph backend, which is how graphs move between SparseGraph and
  DenseGraph and across the JSON boundary (see canonical_json.hpp).

  For Python developers:
  - std::variant<A, B>: tagged union (like `A | B` with an isinstance check)
  - std::get_if<T>(&v): pointer to the alternative if v holds a T, else nullptr
*/
#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "weightgraph/core/error.hpp"
#include "weightgraph/core/types.hpp"
#include "weightgraph/core/weighted_graph.hpp"

namespace weightgraph::core {

// One weight per node index.
template <typename N>
struct ExtendedNodes {
  std::vector<N> weights;
  friend bool operator==(const ExtendedNodes&, const ExtendedNodes&) = default;
};

// Node count plus the non-zero weights, ascending by index. Omitted indices
// carry the additive identity N{}.
template <typename N>
struct CompactNodes {
  std::int64_t count {0};
  std::vector<std::pair<NodeId, N>> weights;
  friend bool operator==(const CompactNodes&, const CompactNodes&) = default;
};

template <typename N>
using Nodes = std::variant<ExtendedNodes<N>, CompactNodes<N>>;

// Index pairs only; replayed with weight N{}.
struct SimpleArcs {
  std::vector<std::pair<NodeId, NodeId>> arcs;
  friend bool operator==(const SimpleArcs&, const SimpleArcs&) = default;
};

template <typename N>
struct WeightedArcs {
  std::vector<Arc<N>> arcs;
  friend bool operator==(const WeightedArcs&, const WeightedArcs&) = default;
};

template <typename N>
using Arcs = std::variant<SimpleArcs, WeightedArcs<N>>;

template <typename N>
struct CanonicalForm {
  GraphType gtype {GraphType::Direct};
  Nodes<N> nodes {};
  Arcs<N> arcs {};
};

enum class ArcEncoding {
  Weighted = 1,  // (src, dst, weight) triples
  Simple = 2     // (src, dst) pairs, weights dropped
};

struct CanonicalOptions {
  ArcEncoding arcs { ArcEncoding::Weighted };
};

// Compaction heuristic: compact when strictly more than about half of the
// weights are zero, i.e. 2 * zeros > total + 1.
[[nodiscard]] bool should_compact(std::size_t total, std::size_t zeros) noexcept;

template <typename N>
[[nodiscard]] Nodes<N> make_nodes(std::vector<N> weights) {
  std::size_t zeros = 0;
  for (const auto& w : weights) {
    if (w == N{}) ++zeros;
  }
  if (!should_compact(weights.size(), zeros)) {
    return ExtendedNodes<N>{std::move(weights)};
  }
  CompactNodes<N> compact;
  compact.count = static_cast<std::int64_t>(weights.size());
  compact.weights.reserve(weights.size() - zeros);
  for (std::size_t i = 0; i < weights.size(); ++i) {
    if (!(weights[i] == N{})) compact.weights.emplace_back(static_cast<NodeId>(i), weights[i]);
  }
  return compact;
}

template <typename N>
[[nodiscard]] std::int64_t node_count(const Nodes<N>& nodes) noexcept {
  if (const auto* ext = std::get_if<ExtendedNodes<N>>(&nodes)) {
    return static_cast<std::int64_t>(ext->weights.size());
  }
  return std::get<CompactNodes<N>>(nodes).count;
}

template <typename N>
[[nodiscard]] std::int64_t node_count(const CanonicalForm<N>& form) noexcept {
  return node_count(form.nodes);
}

// Snapshot of g. Arcs are recorded exactly as the backend stores them, so an
// Undirect source contributes both directions of every edge.
template <typename N>
[[nodiscard]] CanonicalForm<N> to_canonical(const GraphVisitor<N>& g,
                                            const CanonicalOptions& opts = {}) {
  std::vector<N> weights;
  weights.reserve(static_cast<std::size_t>(g.node_count()));
  g.node_visitor([&weights](NodeId, const N& w) { weights.push_back(w); });

  CanonicalForm<N> form;
  form.gtype = g.graph_type();
  form.nodes = make_nodes(std::move(weights));
  if (opts.arcs == ArcEncoding::Simple) {
    SimpleArcs simple;
    simple.arcs.reserve(static_cast<std::size_t>(g.arc_count()));
    g.arc_visitor([&simple](NodeId i, NodeId j, const N&) { simple.arcs.emplace_back(i, j); });
    form.arcs = std::move(simple);
  } else {
    WeightedArcs<N> weighted;
    weighted.arcs.reserve(static_cast<std::size_t>(g.arc_count()));
    g.arc_visitor([&weighted](NodeId i, NodeId j, const N& w) {
      weighted.arcs.push_back(Arc<N>{i, j, w});
    });
    form.arcs = std::move(weighted);
  }
  return form;
}

namespace detail {
[[noreturn]] void throw_invalid_form(const std::string& what);
void check_form_index(std::int64_t i, std::int64_t n, const char* what);
} // namespace detail

// Throws ValueError if the form cannot describe a graph: a node count outside
// [0, INT32_MAX], compact indices that are out of range, unsorted or
// repeated, or an arc endpoint outside [0, node_count).
template <typename N>
void validate(const CanonicalForm<N>& form) {
  if (form.gtype != GraphType::Direct && form.gtype != GraphType::Undirect) {
    detail::throw_invalid_form("unknown graph type");
  }
  const std::int64_t n = node_count(form);
  if (n < 0 || n > std::numeric_limits<std::int32_t>::max()) {
    detail::throw_invalid_form("node count " + std::to_string(n) + " out of range");
  }
  if (const auto* compact = std::get_if<CompactNodes<N>>(&form.nodes)) {
    std::int64_t prev = -1;
    for (const auto& [i, w] : compact->weights) {
      (void)w;
      detail::check_form_index(i, n, "compact node");
      if (i <= prev) {
        detail::throw_invalid_form("compact node indices must be strictly ascending (index " +
                                   std::to_string(i) + " after " + std::to_string(prev) + ")");
      }
      prev = i;
    }
  }
  if (const auto* simple = std::get_if<SimpleArcs>(&form.arcs)) {
    for (const auto& [i, j] : simple->arcs) {
      detail::check_form_index(i, n, "arc source");
      detail::check_form_index(j, n, "arc destination");
    }
  } else {
    for (const auto& a : std::get<WeightedArcs<N>>(form.arcs).arcs) {
      detail::check_form_index(a.src, n, "arc source");
      detail::check_form_index(a.dst, n, "arc destination");
    }
  }
}

template <typename N>
void apply_nodes(WeightedGraph<N>& g, const Nodes<N>& nodes) {
  if (const auto* ext = std::get_if<ExtendedNodes<N>>(&nodes)) {
    g.assign_node_weights(ext->weights);
  } else {
    g.assign_indexed_node_weights(std::get<CompactNodes<N>>(nodes).weights);
  }
}

namespace detail {
// Undirect graphs replay only src <= dst and let the backend mirror the arc;
// the form already holds both directions.
template <typename N>
void conditional_insert_arc(WeightedGraph<N>& g, NodeId i, NodeId j, const N& w) {
  if (g.graph_type() == GraphType::Direct || i <= j) {
    g.add_arc(i, j, w);
  }
}
} // namespace detail

template <typename N>
void apply_arcs(WeightedGraph<N>& g, const Arcs<N>& arcs) {
  if (const auto* simple = std::get_if<SimpleArcs>(&arcs)) {
    for (const auto& [i, j] : simple->arcs) detail::conditional_insert_arc(g, i, j, N{});
  } else {
    for (const auto& a : std::get<WeightedArcs<N>>(arcs).arcs) {
      detail::conditional_insert_arc(g, a.src, a.dst, a.weight);
    }
  }
}

// Materializes a form into a fresh backend G. The form is validated before G
// is allocated, so a malformed form never yields a partially-built graph.
template <typename G, typename N = typename G::weight_type>
[[nodiscard]] G from_canonical(const CanonicalForm<N>& form) {
  static_assert(std::is_base_of_v<WeightedGraph<N>, G>, "G must be a WeightedGraph<N> backend");
  validate(form);
  G g(static_cast<std::int32_t>(node_count(form)), form.gtype);
  apply_nodes<N>(g, form.nodes);
  apply_arcs<N>(g, form.arcs);
  return g;
}

extern template CanonicalForm<double> to_canonical(const GraphVisitor<double>&, const CanonicalOptions&);
extern template CanonicalForm<std::int64_t> to_canonical(const GraphVisitor<std::int64_t>&, const CanonicalOptions&);
extern template void validate(const CanonicalForm<double>&);
extern template void validate(const CanonicalForm<std::int64_t>&);

} // namespace weightgraph::core
