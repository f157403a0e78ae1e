/*
  JSON encoding of CanonicalForm (Boost.JSON).

  Layout, externally tagged:
    {"gtype": "Direct" | "Undirect",
     "nodes": {"Extended": [w, ...]}
            | {"Compact": {"count": n, "weights": [[i, w], ...]}},
     "arcs":  {"Simple": [[src, dst], ...]}
            | {"Weighted": [[src, dst, w], ...]}}

  JSON has no spelling for NaN or infinity, so encoding a non-finite weight
  throws ValueError instead of writing null.

  Decoding reports malformed documents as ValueError (syntax, missing keys,
  unknown tags, wrong arity, inconsistent indices) and values of the wrong
  kind as TypeError. A decoded form is always validated.
*/
#pragma once

#include <cmath>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include <boost/json.hpp>

#include "weightgraph/core/canonical_form.hpp"
#include "weightgraph/core/error.hpp"
#include "weightgraph/core/types.hpp"

namespace weightgraph::core {

struct JsonOptions {
  // Newlines and two-space indentation; compact single line otherwise.
  bool pretty { false };
};

namespace detail {
[[nodiscard]] boost::json::value parse_document(std::string_view text);
[[nodiscard]] std::string serialize_document(const boost::json::value& jv, bool pretty);
[[nodiscard]] const boost::json::object& as_object(const boost::json::value& jv, const char* what);
[[nodiscard]] const boost::json::array& as_array(const boost::json::value& jv, const char* what);
[[nodiscard]] const boost::json::array& as_tuple(const boost::json::value& jv, std::size_t arity,
                                                 const char* what);
[[nodiscard]] const boost::json::value& require_key(const boost::json::object& obj,
                                                    std::string_view key, const char* what);
// Splits {"Tag": payload}; exactly one key is allowed.
[[nodiscard]] std::pair<std::string_view, const boost::json::value*>
tagged(const boost::json::value& jv, const char* what);
[[nodiscard]] std::int64_t as_int(const boost::json::value& jv, const char* what);
[[nodiscard]] NodeId as_node_id(const boost::json::value& jv, const char* what);
[[nodiscard]] GraphType as_graph_type(const boost::json::value& jv);
[[noreturn]] void throw_unknown_tag(std::string_view tag, const char* what);

template <typename N>
[[nodiscard]] N as_weight(const boost::json::value& jv, const char* what) {
  boost::json::error_code ec;
  N w = jv.to_number<N>(ec);
  if (ec) {
    throw TypeError(std::string("canonical json: ") + what + ": expected a number representable as weight");
  }
  return w;
}

template <typename N>
[[nodiscard]] boost::json::value weight_to_json(const N& w, const char* what) {
  if constexpr (std::is_floating_point_v<N>) {
    if (!std::isfinite(w)) {
      throw ValueError(std::string("canonical json: ") + what + ": non-finite weight cannot be encoded");
    }
  }
  return boost::json::value_from(w);
}

template <typename N>
[[nodiscard]] Nodes<N> nodes_from_json(const boost::json::value& jv) {
  auto [tag, payload] = tagged(jv, "nodes");
  if (tag == "Extended") {
    ExtendedNodes<N> ext;
    const auto& arr = as_array(*payload, "nodes.Extended");
    ext.weights.reserve(arr.size());
    for (const auto& w : arr) ext.weights.push_back(as_weight<N>(w, "nodes.Extended"));
    return ext;
  }
  if (tag == "Compact") {
    const auto& obj = as_object(*payload, "nodes.Compact");
    CompactNodes<N> compact;
    compact.count = as_int(require_key(obj, "count", "nodes.Compact"), "nodes.Compact.count");
    const auto& arr = as_array(require_key(obj, "weights", "nodes.Compact"), "nodes.Compact.weights");
    compact.weights.reserve(arr.size());
    for (const auto& entry : arr) {
      const auto& t = as_tuple(entry, 2, "nodes.Compact.weights");
      compact.weights.emplace_back(as_node_id(t[0], "nodes.Compact.weights"),
                                   as_weight<N>(t[1], "nodes.Compact.weights"));
    }
    return compact;
  }
  throw_unknown_tag(tag, "nodes");
}

template <typename N>
[[nodiscard]] Arcs<N> arcs_from_json(const boost::json::value& jv) {
  auto [tag, payload] = tagged(jv, "arcs");
  if (tag == "Simple") {
    SimpleArcs simple;
    const auto& arr = as_array(*payload, "arcs.Simple");
    simple.arcs.reserve(arr.size());
    for (const auto& entry : arr) {
      const auto& t = as_tuple(entry, 2, "arcs.Simple");
      simple.arcs.emplace_back(as_node_id(t[0], "arcs.Simple"), as_node_id(t[1], "arcs.Simple"));
    }
    return simple;
  }
  if (tag == "Weighted") {
    WeightedArcs<N> weighted;
    const auto& arr = as_array(*payload, "arcs.Weighted");
    weighted.arcs.reserve(arr.size());
    for (const auto& entry : arr) {
      const auto& t = as_tuple(entry, 3, "arcs.Weighted");
      weighted.arcs.push_back(Arc<N>{as_node_id(t[0], "arcs.Weighted"),
                                     as_node_id(t[1], "arcs.Weighted"),
                                     as_weight<N>(t[2], "arcs.Weighted")});
    }
    return weighted;
  }
  throw_unknown_tag(tag, "arcs");
}
} // namespace detail

template <typename N>
[[nodiscard]] boost::json::value to_json_value(const CanonicalForm<N>& form) {
  namespace json = boost::json;
  json::object root;
  root["gtype"] = to_string(form.gtype);

  json::object nodes;
  if (const auto* ext = std::get_if<ExtendedNodes<N>>(&form.nodes)) {
    json::array weights;
    weights.reserve(ext->weights.size());
    for (const auto& w : ext->weights) weights.push_back(detail::weight_to_json(w, "nodes.Extended"));
    nodes["Extended"] = std::move(weights);
  } else {
    const auto& compact = std::get<CompactNodes<N>>(form.nodes);
    json::array weights;
    weights.reserve(compact.weights.size());
    for (const auto& [i, w] : compact.weights) {
      json::array pair;
      pair.emplace_back(i);
      pair.emplace_back(detail::weight_to_json(w, "nodes.Compact.weights"));
      weights.emplace_back(std::move(pair));
    }
    json::object body;
    body["count"] = compact.count;
    body["weights"] = std::move(weights);
    nodes["Compact"] = std::move(body);
  }
  root["nodes"] = std::move(nodes);

  json::object arcs;
  if (const auto* simple = std::get_if<SimpleArcs>(&form.arcs)) {
    json::array pairs;
    pairs.reserve(simple->arcs.size());
    for (const auto& [i, j] : simple->arcs) {
      json::array pair;
      pair.emplace_back(i);
      pair.emplace_back(j);
      pairs.emplace_back(std::move(pair));
    }
    arcs["Simple"] = std::move(pairs);
  } else {
    const auto& weighted = std::get<WeightedArcs<N>>(form.arcs);
    json::array triples;
    triples.reserve(weighted.arcs.size());
    for (const auto& a : weighted.arcs) {
      json::array triple;
      triple.emplace_back(a.src);
      triple.emplace_back(a.dst);
      triple.emplace_back(detail::weight_to_json(a.weight, "arcs.Weighted"));
      triples.emplace_back(std::move(triple));
    }
    arcs["Weighted"] = std::move(triples);
  }
  root["arcs"] = std::move(arcs);
  return root;
}

template <typename N>
[[nodiscard]] std::string to_json(const CanonicalForm<N>& form, const JsonOptions& opts = {}) {
  return detail::serialize_document(to_json_value(form), opts.pretty);
}

template <typename N>
[[nodiscard]] CanonicalForm<N> canonical_from_json_value(const boost::json::value& jv) {
  const auto& root = detail::as_object(jv, "document");
  CanonicalForm<N> form;
  form.gtype = detail::as_graph_type(detail::require_key(root, "gtype", "document"));
  form.nodes = detail::nodes_from_json<N>(detail::require_key(root, "nodes", "document"));
  form.arcs = detail::arcs_from_json<N>(detail::require_key(root, "arcs", "document"));
  validate(form);
  return form;
}

template <typename N>
[[nodiscard]] CanonicalForm<N> canonical_from_json(std::string_view text) {
  return canonical_from_json_value<N>(detail::parse_document(text));
}

// Graph-level shortcuts: snapshot + encode, decode + materialize.
template <typename N>
[[nodiscard]] std::string graph_to_json(const GraphVisitor<N>& g, const CanonicalOptions& copts = {},
                                        const JsonOptions& jopts = {}) {
  return to_json(to_canonical(g, copts), jopts);
}

template <typename G>
[[nodiscard]] G graph_from_json(std::string_view text) {
  return from_canonical<G>(canonical_from_json<typename G::weight_type>(text));
}

} // namespace weightgraph::core
