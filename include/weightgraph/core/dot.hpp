/* Graphviz DOT rendering over the GraphVisitor interface. */
#pragma once

#include <array>
#include <charconv>
#include <cmath>
#include <sstream>
#include <string>
#include <system_error>
#include <type_traits>

#include "weightgraph/core/types.hpp"
#include "weightgraph/core/weighted_graph.hpp"

namespace weightgraph::core {

namespace detail {
// Shortest decimal that reads back to w, in plain (never exponent) notation:
// 1234567, 0.30000000000000004, -1.5. Non-arithmetic weights use operator<<.
template <typename N>
std::string format_weight(const N& w) {
  if constexpr (std::is_floating_point_v<N>) {
    if (std::isnan(w)) return "NaN";
    // Fixed notation of the largest double needs 309 digits plus sign.
    std::array<char, 400> buf {};
    auto res = std::to_chars(buf.data(), buf.data() + buf.size(), w, std::chars_format::fixed);
    if (res.ec == std::errc{}) return std::string(buf.data(), res.ptr);
    // long double beyond the buffer
    std::ostringstream out;
    out << w;
    return out.str();
  } else if constexpr (std::is_integral_v<N>) {
    std::array<char, 24> buf {};
    auto res = std::to_chars(buf.data(), buf.data() + buf.size(), w);
    return std::string(buf.data(), res.ptr);
  } else {
    std::ostringstream out;
    out << w;
    return out.str();
  }
}
} // namespace detail

// Renders g as a DOT document: one node statement per node, then one arc
// statement per stored arc. Undirect graphs print each edge once, from the
// i <= j entry. Weights print as their shortest exact decimal ("0", "1.5").
template <typename N>
[[nodiscard]] std::string to_dot_source(const GraphVisitor<N>& g) {
  const bool direct = g.graph_type() == GraphType::Direct;
  const char* arrow = direct ? "->" : "--";
  std::ostringstream body;
  bool first = true;
  auto line = [&]() -> std::ostringstream& {
    if (!first) body << '\n';
    first = false;
    return body;
  };
  g.node_visitor([&](NodeId i, const N& w) {
    line() << "\tn" << i << " [label=\"" << detail::format_weight(w) << "\"];";
  });
  g.arc_visitor([&](NodeId i, NodeId j, const N& w) {
    if (direct || i <= j) {
      line() << "\tn" << i << ' ' << arrow << " n" << j << " [label=\"" << detail::format_weight(w) << "\"];";
    }
  });
  std::ostringstream out;
  out << (direct ? "digraph" : "graph") << " {\n" << body.str() << "\n}";
  return out.str();
}

} // namespace weightgraph::core
