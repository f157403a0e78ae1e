/* Per-node weight storage composed into both backends. */
#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "weightgraph/core/types.hpp"

namespace weightgraph::core {

template <typename N>
class NodeWeights {
public:
  NodeWeights() = default;
  explicit NodeWeights(std::int32_t node_count)
    : weights_(static_cast<std::size_t>(node_count), N{}) {}

  [[nodiscard]] std::int32_t size() const noexcept {
    return static_cast<std::int32_t>(weights_.size());
  }

  [[nodiscard]] const N& at(NodeId i, const char* where) const {
    check_index(i, size(), where);
    return weights_[static_cast<std::size_t>(i)];
  }

  template <typename F>
  void visit(F&& f) const {
    for (std::size_t i = 0; i < weights_.size(); ++i) {
      f(static_cast<NodeId>(i), weights_[i]);
    }
  }

  void update(const std::function<N(NodeId, N)>& f) {
    for (std::size_t i = 0; i < weights_.size(); ++i) {
      weights_[i] = f(static_cast<NodeId>(i), weights_[i]);
    }
  }

  void assign(std::span<const N> weights, const char* where) {
    if (weights.size() != weights_.size()) {
      throw std::invalid_argument(std::string(where) + ": expected " +
                                  std::to_string(weights_.size()) + " node weights, got " +
                                  std::to_string(weights.size()));
    }
    std::copy(weights.begin(), weights.end(), weights_.begin());
  }

  void assign_indexed(std::span<const std::pair<NodeId, N>> weights, const char* where) {
    // Check everything first so a bad index leaves the weights untouched.
    for (const auto& [i, w] : weights) {
      (void)w;
      check_index(i, size(), where);
    }
    for (const auto& [i, w] : weights) {
      weights_[static_cast<std::size_t>(i)] = w;
    }
  }

  [[nodiscard]] const std::vector<N>& values() const noexcept { return weights_; }

  friend bool operator==(const NodeWeights& a, const NodeWeights& b) {
    return a.weights_ == b.weights_;
  }

private:
  std::vector<N> weights_ {};
};

} // namespace weightgraph::core
