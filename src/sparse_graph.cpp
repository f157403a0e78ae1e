/*
  SparseGraph — adjacency-list backend.

  Member templates live in the header; this unit instantiates the weight types
  used by the bindings and the tests so other units only reference them.
*/
#include "weightgraph/core/sparse_graph.hpp"

namespace weightgraph::core {

template class SparseGraph<double>;
template class SparseGraph<std::int64_t>;

} // namespace weightgraph::core
