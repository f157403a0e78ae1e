/*
  Sub-path costs along a fixed walk.

  Given a walk w[0..len) over a graph exposing ArcCost, SubPathCosts yields,
  for every start s ascending and every end e > s ascending, the triple
  (w[s], w[e], cost(w[s]..w[e])). The running cost restarts at each s and
  grows by one arc per step, so at most len*(len-1)/2 triples are produced
  and nothing is materialized up front.

  Example (arcs 0->1:1, 1->2:2, 2->3:3, walk {0,1,2,3}):
    (0,1,1) (0,2,3) (0,3,6) (1,2,2) (1,3,5) (2,3,3)
*/
#pragma once

#include <cstddef>
#include <iterator>
#include <optional>
#include <span>
#include <vector>

#include "weightgraph/core/types.hpp"
#include "weightgraph/core/weighted_graph.hpp"

namespace weightgraph::core {

template <typename N>
struct SubPathCost {
  NodeId src;
  NodeId dst;
  N cost;
  friend bool operator==(const SubPathCost& a, const SubPathCost& b) {
    return a.src == b.src && a.dst == b.dst && a.cost == b.cost;
  }
};

// Single-pass generator. The graph and the walk are borrowed and must outlive
// the generator. If a lookup throws (e.g. KeyError for a missing arc) the
// exception propagates and the generator is exhausted afterwards.
template <typename N>
class SubPathCosts {
public:
  using value_type = SubPathCost<N>;

  SubPathCosts(const ArcCost<N>& graph, std::span<const NodeId> walk) noexcept
    : graph_(&graph), walk_(walk), done_(walk.size() < 2) {}
  // Both the graph and the walk are borrowed; temporaries would dangle.
  SubPathCosts(const ArcCost<N>&&, std::span<const NodeId>) = delete;
  SubPathCosts(const ArcCost<N>&, std::vector<NodeId>&&) = delete;
  SubPathCosts(const ArcCost<N>&&, std::vector<NodeId>&&) = delete;

  [[nodiscard]] std::optional<value_type> next();

  // Input-iterator adapter so the generator works in range-for loops. Copies
  // of the iterator share the generator's position.
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = SubPathCost<N>;
    using difference_type = std::ptrdiff_t;
    using pointer = const value_type*;
    using reference = const value_type&;

    iterator() = default;
    explicit iterator(SubPathCosts* owner) : owner_(owner) { advance(); }

    reference operator*() const { return *current_; }
    pointer operator->() const { return &*current_; }
    iterator& operator++() { advance(); return *this; }
    void operator++(int) { advance(); }

    friend bool operator==(const iterator& a, const iterator& b) noexcept {
      return a.owner_ == b.owner_;
    }

  private:
    void advance() {
      current_ = owner_->next();
      if (!current_) owner_ = nullptr;
    }

    SubPathCosts* owner_ {nullptr};
    std::optional<value_type> current_ {};
  };

  [[nodiscard]] iterator begin() { return iterator(this); }
  [[nodiscard]] iterator end() noexcept { return iterator(); }

private:
  const ArcCost<N>* graph_;
  std::span<const NodeId> walk_;
  std::size_t start_ {0};
  std::size_t end_ {0};
  N acc_ {};
  bool done_ {false};
};

template <typename N>
std::optional<SubPathCost<N>> SubPathCosts<N>::next() {
  if (done_) return std::nullopt;
  // Step to the next (start_, end_) pair; end_ == start_ marks a fresh start.
  if (end_ + 1 >= walk_.size()) {
    ++start_;
    end_ = start_;
    acc_ = N{};
    if (start_ + 1 >= walk_.size()) {
      done_ = true;
      return std::nullopt;
    }
  }
  const NodeId u = walk_[end_];
  const NodeId v = walk_[end_ + 1];
  // Exhaust before the lookup so a throwing cost() ends the iteration.
  done_ = true;
  acc_ = acc_ + graph_->cost(u, v);
  done_ = false;
  ++end_;
  return SubPathCost<N>{walk_[start_], v, acc_};
}

} // namespace weightgraph::core
