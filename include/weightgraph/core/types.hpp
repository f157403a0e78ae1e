/* Core type aliases and helper structs.
 *
 * For Python developers:
 * - NodeId: int32 (matches np.int32)
 * - weights are a template parameter N; the bindings use double (np.float64)
 * - std::span<T>: lightweight view over contiguous arrays (like memoryview, no copy)
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace weightgraph::core {

// Node identifiers are signed 32-bit integers, dense in [0, node_count).
using NodeId = std::int32_t;

// Fixed at construction. Undirect graphs mirror every inserted arc.
enum class GraphType {
  Direct = 1,
  Undirect = 2
};

// A stored arc as seen by visitors and the canonical form.
template <typename N>
struct Arc {
  NodeId src;
  NodeId dst;
  N weight;
  friend bool operator==(const Arc& a, const Arc& b) {
    return a.src == b.src && a.dst == b.dst && a.weight == b.weight;
  }
};

// Weight requirements: N{} is the additive identity, N supports + and ==.
template <typename N>
inline constexpr bool is_weight_v =
    std::is_default_constructible_v<N> && std::is_copy_constructible_v<N> &&
    std::is_convertible_v<decltype(std::declval<N>() + std::declval<N>()), N> &&
    std::is_convertible_v<decltype(std::declval<N>() == std::declval<N>()), bool>;

[[nodiscard]] inline const char* to_string(GraphType t) noexcept {
  return t == GraphType::Direct ? "Direct" : "Undirect";
}

// Bounds check shared by the backends. Index errors are caller bugs and are
// never clamped.
inline void check_index(NodeId i, std::int32_t node_count, const char* where) {
  if (i < 0 || i >= node_count) {
    throw std::out_of_range(std::string(where) + ": node index " + std::to_string(i) +
                            " out of range of node_count " + std::to_string(node_count));
  }
}

} // namespace weightgraph::core
