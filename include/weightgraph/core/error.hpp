#pragma once

#include <stdexcept>
#include <string>

namespace weightgraph::core {

struct TypeError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct ValueError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Raised when a lookup names an arc the graph does not store.
struct KeyError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

} // namespace weightgraph::core
