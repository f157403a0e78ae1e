/*
  Canonical JSON — Boost.JSON parsing helpers and the document printer.

  Every accessor reports through the library's exception types so callers
  never see boost::system errors: malformed structure is a ValueError, a value
  of the wrong kind is a TypeError.
*/
#include "weightgraph/core/canonical_json.hpp"

#include <limits>
#include <string>

namespace weightgraph::core::detail {

namespace json = boost::json;

namespace {

std::string prefix(const char* what) {
  return std::string("canonical json: ") + what + ": ";
}

void print_indent(std::string& out, int depth) {
  out.append(static_cast<std::size_t>(depth) * 2, ' ');
}

void print_pretty(std::string& out, const json::value& jv, int depth) {
  if (const auto* obj = jv.if_object()) {
    if (obj->empty()) { out += "{}"; return; }
    out += "{\n";
    bool first = true;
    for (const auto& kv : *obj) {
      if (!first) out += ",\n";
      first = false;
      print_indent(out, depth + 1);
      out += json::serialize(json::value(json::string(kv.key())));
      out += ": ";
      print_pretty(out, kv.value(), depth + 1);
    }
    out += '\n';
    print_indent(out, depth);
    out += '}';
    return;
  }
  if (const auto* arr = jv.if_array()) {
    if (arr->empty()) { out += "[]"; return; }
    // Arrays of scalars (tuples, weight rows) stay on one line.
    bool flat = true;
    for (const auto& v : *arr) {
      if (v.is_object() || v.is_array()) { flat = false; break; }
    }
    if (flat) { out += json::serialize(jv); return; }
    out += "[\n";
    bool first = true;
    for (const auto& v : *arr) {
      if (!first) out += ",\n";
      first = false;
      print_indent(out, depth + 1);
      print_pretty(out, v, depth + 1);
    }
    out += '\n';
    print_indent(out, depth);
    out += ']';
    return;
  }
  out += json::serialize(jv);
}

} // namespace

json::value parse_document(std::string_view text) {
  json::error_code ec;
  json::value jv = json::parse(json::string_view(text.data(), text.size()), ec);
  if (ec) {
    throw ValueError(prefix("document") + ec.message());
  }
  return jv;
}

std::string serialize_document(const json::value& jv, bool pretty) {
  if (!pretty) return json::serialize(jv);
  std::string out;
  print_pretty(out, jv, 0);
  return out;
}

const json::object& as_object(const json::value& jv, const char* what) {
  if (const auto* obj = jv.if_object()) return *obj;
  throw TypeError(prefix(what) + "expected an object");
}

const json::array& as_array(const json::value& jv, const char* what) {
  if (const auto* arr = jv.if_array()) return *arr;
  throw TypeError(prefix(what) + "expected an array");
}

const json::array& as_tuple(const json::value& jv, std::size_t arity, const char* what) {
  const auto& arr = as_array(jv, what);
  if (arr.size() != arity) {
    throw ValueError(prefix(what) + "expected " + std::to_string(arity) + " elements, got " +
                     std::to_string(arr.size()));
  }
  return arr;
}

const json::value& require_key(const json::object& obj, std::string_view key, const char* what) {
  if (const auto* v = obj.if_contains(json::string_view(key.data(), key.size()))) return *v;
  throw ValueError(prefix(what) + "missing key \"" + std::string(key) + "\"");
}

std::pair<std::string_view, const json::value*> tagged(const json::value& jv, const char* what) {
  const auto& obj = as_object(jv, what);
  if (obj.size() != 1) {
    throw ValueError(prefix(what) + "expected exactly one variant tag, got " +
                     std::to_string(obj.size()) + " keys");
  }
  const auto& kv = *obj.begin();
  return {std::string_view(kv.key().data(), kv.key().size()), &kv.value()};
}

std::int64_t as_int(const json::value& jv, const char* what) {
  json::error_code ec;
  auto i = jv.to_number<std::int64_t>(ec);
  if (ec) {
    throw TypeError(prefix(what) + "expected an integer");
  }
  return i;
}

NodeId as_node_id(const json::value& jv, const char* what) {
  auto i = as_int(jv, what);
  if (i < 0 || i > std::numeric_limits<NodeId>::max()) {
    throw ValueError(prefix(what) + "node index " + std::to_string(i) + " out of range");
  }
  return static_cast<NodeId>(i);
}

GraphType as_graph_type(const json::value& jv) {
  const auto* s = jv.if_string();
  if (s == nullptr) {
    throw TypeError(prefix("gtype") + "expected a string");
  }
  if (*s == "Direct") return GraphType::Direct;
  if (*s == "Undirect") return GraphType::Undirect;
  throw_unknown_tag(std::string_view(s->data(), s->size()), "gtype");
}

void throw_unknown_tag(std::string_view tag, const char* what) {
  throw ValueError(prefix(what) + "unknown variant \"" + std::string(tag) + "\"");
}

} // namespace weightgraph::core::detail
