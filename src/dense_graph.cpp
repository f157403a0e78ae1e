/*
  DenseGraph — adjacency-matrix backend.

  Explicit instantiations for the weight types used by the bindings and tests.
*/
#include "weightgraph/core/dense_graph.hpp"

namespace weightgraph::core {

template class DenseGraph<double>;
template class DenseGraph<std::int64_t>;

} // namespace weightgraph::core
