/*
  CanonicalForm — compaction heuristic, validation errors and the explicit
  instantiations of the snapshot/validate templates.
*/
#include "weightgraph/core/canonical_form.hpp"

#include <string>

namespace weightgraph::core {

bool should_compact(std::size_t total, std::size_t zeros) noexcept {
  return 2 * zeros > total + 1;
}

namespace detail {

void throw_invalid_form(const std::string& what) {
  throw ValueError("canonical form: " + what);
}

void check_form_index(std::int64_t i, std::int64_t n, const char* what) {
  if (i < 0 || i >= n) {
    throw_invalid_form(std::string(what) + " index " + std::to_string(i) +
                       " out of range of node count " + std::to_string(n));
  }
}

} // namespace detail

template CanonicalForm<double> to_canonical(const GraphVisitor<double>&, const CanonicalOptions&);
template CanonicalForm<std::int64_t> to_canonical(const GraphVisitor<std::int64_t>&, const CanonicalOptions&);
template void validate(const CanonicalForm<double>&);
template void validate(const CanonicalForm<std::int64_t>&);

} // namespace weightgraph::core
