
#pragma once

#include <stdexcept>

namespace ruleval {

//
// exception classes

/// thrown when no type conversion rules are able to satisfy an operation's type requirements
struct type_error : std::runtime_error {
  using base = std::runtime_error;
  using base::base;
};

/// thrown when a rule names an operator that is not registered
struct unrecognized_operator : std::runtime_error {
  using base = std::runtime_error;
  using base::base;
};

/// thrown by the default date provider for strings it cannot parse
struct date_error : std::runtime_error {
  using base = std::runtime_error;
  using base::base;
};

/// thrown when rule nesting exceeds engine_config::max_depth
struct depth_limit_error : std::runtime_error {
  using base = std::runtime_error;
  using base::base;
};

} // namespace ruleval
